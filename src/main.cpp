#include <iostream>
#include <vector>
#include <string>
#include "cli/vpsx_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"
#include "core/utils.hpp"
#include "server/serve.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    vpsx"
              << theme::color::RESET << theme::color::DIM
              << "                              Enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    vpsx connect "
              << theme::color::RESET << theme::color::BROWN << "[user@]host[:port]"
              << theme::color::RESET << theme::color::DIM
              << "   Connect, then enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    vpsx serve "
              << theme::color::RESET << theme::color::BROWN << "--port N [--bind ADDR]"
              << theme::color::RESET << theme::color::DIM
              << "  Run the HTTP server" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    vpsx --version                    Show version\n"
              << "    vpsx --help                       Show this help"
              << theme::color::RESET << "\n\n";
}

// vpsx serve --port N [--bind ADDR]
static int serve_main(const std::vector<std::string>& args) {
    int port = -1;
    std::string bind = SERVER_DEFAULT_BIND;
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--port" && i + 1 < args.size()) {
            port = safe_stoi(args[++i], -1);
        } else if (args[i] == "--bind" && i + 1 < args.size()) {
            bind = args[++i];
        } else {
            std::cerr << "vpsx serve: unknown argument " << args[i] << "\n";
            return 2;
        }
    }
    if (port < 0 || port > 65535) {
        std::cerr << "vpsx serve: --port N is required (0-65535)\n";
        return 2;
    }
    return run_serve(port, bind);
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            VpsxCLI cli;
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> rest(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "vpsx"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << VPSX_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "serve") {
            return serve_main(rest);
        } else if (cmd == "connect") {
            VpsxCLI cli;
            cli.run_repl(rest.empty() ? "" : rest[0]);
            return 0;
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
