#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>
#include <core/utils.hpp>

static void print_state(const ServerProcessState& s) {
    std::cout << theme::kv("Phase", server_phase_name(s.phase));
    if (s.pid > 0) std::cout << theme::kv("PID", std::to_string(s.pid));
    if (s.port > 0) std::cout << theme::kv("Port", std::to_string(s.port));
    if (!s.url.empty()) std::cout << theme::kv("URL", theme::blue(s.url));
    if (s.exit_code) std::cout << theme::kv("Exit", std::to_string(*s.exit_code));
    if (!s.detail.empty()) std::cout << theme::kv("Detail", s.detail);
}

// server start [port] | stop | restart | status
static void do_server(BaseCLI& cli, const std::string& arg) {
    std::istringstream iss(arg);
    std::string action, port_arg;
    iss >> action >> port_arg;
    if (action.empty()) action = "status";

    Result<ServerProcessState> r;
    if (action == "start") {
        int port = port_arg.empty() ? 0 : safe_stoi(port_arg, -1);
        if (port < 0) {
            std::cout << theme::fail("Invalid port: " + port_arg);
            return;
        }
        if (!cli.gateway->is_connected()) {
            std::cout << theme::info("No remote session: the server will start unconnected.");
        }
        std::cout << theme::step("Starting server...");
        r = cli.gateway->start_server(port);
    } else if (action == "stop") {
        r = cli.gateway->stop_server();
    } else if (action == "restart") {
        std::cout << theme::step("Restarting server...");
        r = cli.gateway->restart_server();
    } else if (action == "status") {
        print_state(cli.gateway->server_status());
        return;
    } else {
        std::cout << "Usage: server start [port] | stop | restart | status\n";
        return;
    }

    if (!cli.report(r)) {
        if (r.kind == ErrorKind::ProcessLifecycle) print_state(r.value);
        return;
    }
    print_state(r.value);
}

void register_server_commands(BaseCLI& cli) {
    cli.add_command("server", do_server, "Embedded HTTP server: start [port] | stop | restart | status");
}
