#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <platform/terminal.hpp>

static void print_session(const SessionInfo& info) {
    std::cout << theme::kv("Session", info.id);
    std::cout << theme::kv("Host", fmt::format("{}@{}:{}", info.username, info.host, info.port));
    std::cout << theme::kv("Since", info.connected_at);
    if (info.reconnects > 0) {
        std::cout << theme::kv("Reconnects", std::to_string(info.reconnects));
    }
}

// connect [user@]host[:port] [--key PATH] [--kbd]
static void do_connect(BaseCLI& cli, const std::string& arg) {
    RemoteCredentials creds = credentials_from_defaults(cli.config.connection());

    std::istringstream iss(arg);
    std::string tok;
    while (iss >> tok) {
        if (tok == "--key") {
            std::string path;
            if (!(iss >> path)) {
                std::cout << theme::fail("--key needs a path");
                return;
            }
            creds.key_path = path;
            creds.auth = AuthMethod::PublicKey;
        } else if (tok == "--kbd") {
            creds.auth = AuthMethod::KeyboardInteractive;
        } else if (!cli.report(apply_target_spec(tok, creds))) {
            return;
        }
    }

    if (creds.host.empty()) {
        std::cout << theme::fail("No host given and none configured.");
        std::cout << theme::step("Usage: connect [user@]host[:port] [--key PATH] [--kbd]");
        return;
    }
    if (creds.username.empty()) {
        std::cout << "    Username: " << std::flush;
        if (!std::getline(std::cin, creds.username)) return;
    }

    std::string prompt = creds.auth == AuthMethod::PublicKey
        ? "    Key passphrase (empty for none): "
        : fmt::format("    Password for {}@{}: ", creds.username, creds.host);
    if (!platform::read_secret(prompt, creds.secret)) return;

    std::cout << theme::step(fmt::format("Connecting to {}:{}...", creds.host, creds.port));
    auto r = cli.gateway->connect(creds);
    creds.secret.assign(creds.secret.size(), '\0');
    if (!cli.report(r)) return;

    std::cout << theme::ok("Connected");
    print_session(r.value);
    std::cout << "\n";
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    if (cli.gateway->session_info().id.empty()) {
        std::cout << theme::fail("Not connected.");
        return;
    }
    cli.gateway->disconnect();
    std::cout << theme::ok("Disconnected");
}

static void do_reconnect(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::step("Reconnecting...");
    auto r = cli.gateway->reconnect();
    if (!cli.report(r)) return;
    std::cout << theme::ok("Connected");
    print_session(r.value);
    std::cout << "\n";
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (config_exists()) {
        std::cout << theme::kv("Config", get_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults (no config file)");
    }

    auto info = cli.gateway->session_info();
    std::cout << theme::kv("Remote", session_status_name(info.status));
    if (!info.id.empty()) print_session(info);
    if (!info.last_error.empty()) std::cout << theme::kv("Error", info.last_error);

    auto server = cli.gateway->server_status();
    std::cout << theme::kv("Server", server_phase_name(server.phase));
    if (!server.url.empty()) std::cout << theme::kv("URL", server.url);

    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "Connect: [user@]host[:port] [--key PATH] [--kbd]");
    cli.add_command("disconnect", do_disconnect, "Close the remote session");
    cli.add_command("reconnect", do_reconnect, "Re-establish the session with the same login");
    cli.add_command("status", do_status, "Show session and server status");
}
