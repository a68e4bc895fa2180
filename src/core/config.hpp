#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

enum class HostKeyPolicy {
    Off,         // never consult known_hosts
    AcceptNew,   // trust unknown hosts (and record them), reject mismatches
    Strict,      // only hosts already in known_hosts
};

const char* host_key_policy_name(HostKeyPolicy policy);

// Non-secret connection defaults. The password never lives here.
struct ConnectionDefaults {
    std::string host;
    int port = 22;
    std::string user;
    AuthMethod auth = AuthMethod::Password;
    std::optional<std::string> key_path;
    int connect_timeout = SSH_CONNECT_TIMEOUT_SECS;
    std::optional<std::string> known_hosts;     // default ~/.ssh/known_hosts
    HostKeyPolicy host_key_policy = HostKeyPolicy::AcceptNew;
};

struct TimeoutConfig {
    int command_timeout_secs = SSH_CMD_TIMEOUT_SECS;
    int io_timeout_secs = SSH_IO_TIMEOUT_SECS;
};

struct ReconnectPolicy {
    int max_attempts = RECONNECT_MAX_ATTEMPTS;
    int initial_delay_ms = RECONNECT_INITIAL_DELAY_MS;
    int max_delay_ms = RECONNECT_MAX_DELAY_MS;

    // Delay before attempt n (1-based): initial * 2^(n-1), capped.
    int delay_for_attempt(int attempt) const;
};

struct ServerConfig {
    int port = 0;                                   // 0 = random in [5000, 9999]
    std::string bind = SERVER_DEFAULT_BIND;
    int startup_timeout_ms = SERVER_STARTUP_TIMEOUT_MS;
    int grace_period_ms = SERVER_GRACE_PERIOD_MS;
};

class Config {
public:
    // Load ~/.vpsx/config.yaml (defaults when the file does not exist)
    static Result<Config> load();

    // Load a specific file (defaults when it does not exist)
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ConnectionDefaults& connection() const { return connection_; }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const ReconnectPolicy& reconnect() const { return reconnect_; }
    const ServerConfig& server() const { return server_; }

    ConnectionDefaults& connection() { return connection_; }
    TimeoutConfig& timeouts() { return timeouts_; }
    ReconnectPolicy& reconnect() { return reconnect_; }
    ServerConfig& server() { return server_; }

public:
    Config() = default;

private:
    ConnectionDefaults connection_;
    TimeoutConfig timeouts_;
    ReconnectPolicy reconnect_;
    ServerConfig server_;
};

// Helper to check if the config exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create default config (never overwrites)
Result<void> create_default_config();
