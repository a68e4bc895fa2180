#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

const char* host_key_policy_name(HostKeyPolicy policy) {
    switch (policy) {
    case HostKeyPolicy::Off:       return "off";
    case HostKeyPolicy::AcceptNew: return "accept-new";
    case HostKeyPolicy::Strict:    return "strict";
    }
    return "accept-new";
}

static std::optional<HostKeyPolicy> parse_host_key_policy(const std::string& s) {
    if (s == "off" || s == "no") return HostKeyPolicy::Off;
    if (s == "accept-new" || s == "tofu") return HostKeyPolicy::AcceptNew;
    if (s == "strict" || s == "yes") return HostKeyPolicy::Strict;
    return std::nullopt;
}

int ReconnectPolicy::delay_for_attempt(int attempt) const {
    long long delay = initial_delay_ms;
    for (int i = 1; i < attempt && delay < max_delay_ms; i++) {
        delay *= 2;
    }
    return static_cast<int>(std::min<long long>(delay, max_delay_ms));
}

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".vpsx";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::OperationFailed,
                                 "Cannot create " + config_path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# vpsx configuration
# Connection defaults. Passwords are never stored here.

connection:
  host: ""
  port: 22
  user: "root"
  auth: password                 # password | publickey | keyboard-interactive
  # key_path: ~/.ssh/id_ed25519
  connect_timeout: 10
  host_key_policy: accept-new    # off | accept-new | strict

timeouts:
  command_timeout_secs: 300
  io_timeout_secs: 30

reconnect:
  max_attempts: 4
  initial_delay_ms: 500
  max_delay_ms: 8000

server:
  port: 0                        # 0 = random port in 5000-9999
  bind: "0.0.0.0"
  startup_timeout_ms: 10000
  grace_period_ms: 3000
)";

    std::ofstream file(config_path);
    if (!file) {
        return Result<void>::Err(ErrorKind::OperationFailed,
                                 "Cannot write " + config_path.string());
    }
    file << default_config;
    return Result<void>::Ok();
}

static std::string expand_home(const std::string& p) {
    if (p.size() >= 1 && p[0] == '~') {
        return (platform::home_dir() / p.substr(p.size() > 1 && p[1] == '/' ? 2 : 1)).string();
    }
    return p;
}

static Result<Config> from_node(const YAML::Node& root) {
    Config config;

    if (auto conn = root["connection"]) {
        auto& c = config.connection();
        if (conn["host"]) c.host = conn["host"].as<std::string>();
        if (conn["port"]) c.port = conn["port"].as<int>(22);
        if (conn["user"]) c.user = conn["user"].as<std::string>();
        if (conn["auth"]) {
            auto method = parse_auth_method(conn["auth"].as<std::string>());
            if (!method) {
                return Result<Config>::Err(ErrorKind::InvalidArgument,
                    "Unknown auth method: " + conn["auth"].as<std::string>());
            }
            c.auth = *method;
        }
        if (conn["key_path"] && !conn["key_path"].as<std::string>().empty()) {
            c.key_path = expand_home(conn["key_path"].as<std::string>());
        }
        if (conn["connect_timeout"]) c.connect_timeout = conn["connect_timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
        if (conn["known_hosts"]) c.known_hosts = expand_home(conn["known_hosts"].as<std::string>());
        if (conn["host_key_policy"]) {
            auto policy = parse_host_key_policy(conn["host_key_policy"].as<std::string>());
            if (!policy) {
                return Result<Config>::Err(ErrorKind::InvalidArgument,
                    "Unknown host_key_policy: " + conn["host_key_policy"].as<std::string>());
            }
            c.host_key_policy = *policy;
        }
    }

    if (auto t = root["timeouts"]) {
        auto& to = config.timeouts();
        if (t["command_timeout_secs"]) to.command_timeout_secs = t["command_timeout_secs"].as<int>(SSH_CMD_TIMEOUT_SECS);
        if (t["io_timeout_secs"]) to.io_timeout_secs = t["io_timeout_secs"].as<int>(SSH_IO_TIMEOUT_SECS);
    }

    if (auto r = root["reconnect"]) {
        auto& rp = config.reconnect();
        if (r["max_attempts"]) rp.max_attempts = r["max_attempts"].as<int>(RECONNECT_MAX_ATTEMPTS);
        if (r["initial_delay_ms"]) rp.initial_delay_ms = r["initial_delay_ms"].as<int>(RECONNECT_INITIAL_DELAY_MS);
        if (r["max_delay_ms"]) rp.max_delay_ms = r["max_delay_ms"].as<int>(RECONNECT_MAX_DELAY_MS);
    }

    if (auto s = root["server"]) {
        auto& sc = config.server();
        if (s["port"]) sc.port = s["port"].as<int>(0);
        if (s["bind"]) sc.bind = s["bind"].as<std::string>();
        if (s["startup_timeout_ms"]) sc.startup_timeout_ms = s["startup_timeout_ms"].as<int>(SERVER_STARTUP_TIMEOUT_MS);
        if (s["grace_period_ms"]) sc.grace_period_ms = s["grace_period_ms"].as<int>(SERVER_GRACE_PERIOD_MS);
    }

    if (config.server().port < 0 || config.server().port > 65535) {
        return Result<Config>::Err(ErrorKind::InvalidArgument,
            fmt::format("server.port out of range: {}", config.server().port));
    }
    if (config.reconnect().max_attempts < 0) {
        return Result<Config>::Err(ErrorKind::InvalidArgument, "reconnect.max_attempts must be >= 0");
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) return Result<Config>::Ok(Config{});
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::InvalidArgument, "Config root must be a mapping");
        }
        return from_node(root);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::InvalidArgument,
                                   std::string("Invalid config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::PermissionDenied, "Cannot read " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}
