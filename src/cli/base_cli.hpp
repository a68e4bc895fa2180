#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/session_gateway.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_connection();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Print a failed result with its error kind. Returns true on success.
    template <typename T>
    bool report(const Result<T>& r) const;

    // Public state
    Config config;
    std::unique_ptr<SessionGateway> gateway;
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

private:
    void print_failure(ErrorKind kind, const std::string& error) const;
};

template <typename T>
bool BaseCLI::report(const Result<T>& r) const {
    if (r.is_ok()) return true;
    print_failure(r.kind, r.error);
    return false;
}
