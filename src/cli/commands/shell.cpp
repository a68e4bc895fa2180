#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <csignal>
#include <fmt/format.h>
#include <core/cancel_token.hpp>
#include <core/utils.hpp>

// Leading "--timeout N" is stripped into timeout_secs.
static std::string take_timeout(const std::string& arg, int& timeout_secs) {
    timeout_secs = 0;
    const std::string flag = "--timeout ";
    if (arg.compare(0, flag.size(), flag) != 0) return arg;
    std::string rest = arg.substr(flag.size());
    auto sp = rest.find(' ');
    timeout_secs = safe_stoi(rest.substr(0, sp), 0);
    if (sp == std::string::npos) return "";
    return rest.substr(sp + 1);
}

static void print_exit(const CommandResult& r) {
    std::string status = r.exit_signal.empty()
        ? fmt::format("exit {}", r.exit_code)
        : fmt::format("signal {}", r.exit_signal);
    std::string line = fmt::format("{}  {}ms", status, r.duration_ms());
    std::cout << (r.success() ? theme::dim("    " + line) : theme::red("    " + line)) << "\n";
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    int timeout = 0;
    std::string command = take_timeout(arg, timeout);
    if (command.empty()) {
        std::cout << "Usage: exec [--timeout N] <command>\n";
        return;
    }

    auto r = cli.gateway->execute_command(command, timeout);
    if (!cli.report(r)) return;
    std::cout << r.value.stdout_data;
    if (!r.value.stderr_data.empty()) {
        std::cerr << r.value.stderr_data;
    }
    print_exit(r.value);
}

// Ctrl-C during a stream cancels it instead of killing the REPL
static CancelToken* g_stream_cancel = nullptr;

static void on_stream_sigint(int) {
    if (g_stream_cancel) g_stream_cancel->cancel();
}

static void do_stream(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_connection()) return;
    int timeout = 0;
    std::string command = take_timeout(arg, timeout);
    if (command.empty()) {
        std::cout << "Usage: stream [--timeout N] <command>   (Ctrl-C stops)\n";
        return;
    }

    CancelToken cancel;
    g_stream_cancel = &cancel;
    struct sigaction sa {}, old {};
    sa.sa_handler = on_stream_sigint;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, &old);

    auto r = cli.gateway->execute_streaming(
        command, timeout,
        [](OutputStream stream, const std::string& chunk) {
            auto& out = stream == OutputStream::Stderr ? std::cerr : std::cout;
            out << chunk << std::flush;
        },
        &cancel);

    sigaction(SIGINT, &old, nullptr);
    g_stream_cancel = nullptr;

    std::cout << "\n";
    if (!cli.report(r)) return;
    print_exit(r.value);
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a remote command and show its output");
    cli.add_command("stream", do_stream, "Run a remote command, printing output live");
}
