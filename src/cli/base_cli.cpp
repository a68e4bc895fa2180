#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto created = create_default_config();
    if (created.is_err()) {
        std::cout << theme::info("Could not write default config: " + created.error);
    }

    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        std::cout << theme::fail("Config: " + config_result.error);
        std::cout << theme::step("Using built-in defaults.");
    }
    gateway = std::make_unique<SessionGateway>(config);
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_connection() {
    if (!gateway->is_connected()) {
        std::cout << theme::fail("Not connected.");
        std::cout << theme::step("Use 'connect [user@]host[:port]' first.");
        return false;
    }
    return true;
}

void BaseCLI::print_failure(ErrorKind kind, const std::string& error) const {
    std::cout << theme::fail(fmt::format("{} {}", theme::dim(error_kind_name(kind)), error));
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"connect", "disconnect", "reconnect", "status"}},
        {"Files",      {"ls", "stat", "cat", "write", "put", "get", "zip",
                        "mkdir", "touch", "rm", "mv"}},
        {"Shell",      {"exec", "stream"}},
        {"Server",     {"server"}},
        {"General",    {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << theme::dim("\n    !<command> is shorthand for exec.") << "\n\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    auto info = gateway->session_info();
    if (info.status == SessionStatus::Connected) {
        return rl_esc(theme::color::BROWN) + "vpsx"
             + rl_esc(theme::color::RESET) + ":"
             + rl_esc(theme::color::BLUE) + info.username
             + rl_esc(theme::color::RESET) + "@"
             + rl_esc(theme::color::GREEN) + info.host
             + rl_esc(theme::color::RESET) + "> ";
    } else if (info.status == SessionStatus::Failed) {
        return rl_esc(theme::color::BROWN) + "vpsx"
             + rl_esc(theme::color::RESET) + ":"
             + rl_esc(theme::color::RED) + info.host
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::BROWN) + "vpsx"
         + rl_esc(theme::color::RESET) + "> ";
}
