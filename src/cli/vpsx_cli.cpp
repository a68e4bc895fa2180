#include "vpsx_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

VpsxCLI::VpsxCLI() : BaseCLI() {
    register_all_commands();
}

void VpsxCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Stop the server, disconnect and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Same as quit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_connection_commands(*this);
    register_file_commands(*this);
    register_shell_commands(*this);
    register_server_commands(*this);
}

void VpsxCLI::dispatch_line(const std::string& line) {
    if (line[0] == '!') {
        execute_command("exec", line.substr(1));
        return;
    }

    std::istringstream iss(line);
    std::string command;
    iss >> command;

    std::string args;
    std::getline(iss, args);
    if (!args.empty() && args[0] == ' ') {
        args = args.substr(1);
    }

    execute_command(command, args);
}

void VpsxCLI::run_repl(const std::string& target) {
    std::cout << theme::banner();

    if (!target.empty()) {
        execute_command("connect", target);
    }

    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        SessionStatus before = gateway->session_info().status;

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());
        dispatch_line(line);

        // Reconnection gave up during the command: the REPL stays usable
        auto info = gateway->session_info();
        if (before == SessionStatus::Connected && info.status == SessionStatus::Failed) {
            std::cout << "\n" << theme::divider();
            std::cout << theme::fail("Connection to " + info.host + " lost.");
            if (!info.last_error.empty()) {
                std::cout << theme::dim("    " + info.last_error) << "\n";
            }
            std::cout << theme::step("Run 'reconnect' to try again.");
            std::cout << "\n";
        }
    }

    std::cout << theme::dim("Disconnecting...") << "\n";
    gateway->shutdown();
}
