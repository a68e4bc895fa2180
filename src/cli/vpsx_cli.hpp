#pragma once

#include "base_cli.hpp"
#include <string>

// Command registration, one file per group under cli/commands/
void register_connection_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);
void register_server_commands(BaseCLI& cli);

class VpsxCLI : public BaseCLI {
public:
    VpsxCLI();

    // Interactive REPL. A non-empty target ("[user@]host[:port]") connects first.
    void run_repl(const std::string& target = "");

private:
    void register_all_commands();
    void dispatch_line(const std::string& line);
};
