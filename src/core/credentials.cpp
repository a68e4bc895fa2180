#include "credentials.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>

RemoteCredentials credentials_from_defaults(const ConnectionDefaults& defaults) {
    RemoteCredentials creds;
    creds.host = defaults.host;
    creds.port = defaults.port;
    creds.username = defaults.user;
    creds.auth = defaults.auth;
    creds.key_path = defaults.key_path;
    return creds;
}

Result<void> validate_credentials(const RemoteCredentials& creds) {
    if (creds.host.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Host is required");
    }
    if (creds.username.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Username is required");
    }
    if (creds.port <= 0 || creds.port > 65535) {
        return Result<void>::Err(ErrorKind::InvalidArgument,
                                 "Port out of range: " + std::to_string(creds.port));
    }
    if (creds.auth == AuthMethod::PublicKey) {
        if (!creds.key_path && creds.secret.empty()) {
            return Result<void>::Err(ErrorKind::InvalidArgument,
                                     "Public key auth needs a key file or key material");
        }
    } else if (creds.secret.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Password is required");
    }
    return Result<void>::Ok();
}

std::string encode_credentials(const RemoteCredentials& creds) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << creds.host;
    out << YAML::Key << "port" << YAML::Value << creds.port;
    out << YAML::Key << "user" << YAML::Value << creds.username;
    out << YAML::Key << "auth" << YAML::Value << auth_method_name(creds.auth);
    out << YAML::Key << "secret" << YAML::Value << YAML::DoubleQuoted << creds.secret;
    if (creds.key_path) {
        out << YAML::Key << "key_path" << YAML::Value << *creds.key_path;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<RemoteCredentials> decode_credentials(const std::string& yaml_text) {
    try {
        YAML::Node node = YAML::Load(yaml_text);
        if (!node.IsMap()) {
            return Result<RemoteCredentials>::Err(ErrorKind::InvalidArgument,
                                                  "Credentials must be a mapping");
        }

        RemoteCredentials creds;
        creds.host = node["host"].as<std::string>("");
        creds.port = node["port"].as<int>(22);
        creds.username = node["user"].as<std::string>("");
        creds.secret = node["secret"].as<std::string>("");
        if (node["key_path"]) creds.key_path = node["key_path"].as<std::string>();

        auto method = parse_auth_method(node["auth"].as<std::string>("password"));
        if (!method) {
            return Result<RemoteCredentials>::Err(ErrorKind::InvalidArgument, "Unknown auth method");
        }
        creds.auth = *method;

        auto valid = validate_credentials(creds);
        if (valid.is_err()) return Result<RemoteCredentials>::Err(valid);
        return Result<RemoteCredentials>::Ok(creds);
    } catch (const YAML::Exception& e) {
        return Result<RemoteCredentials>::Err(ErrorKind::InvalidArgument,
                                              std::string("Invalid credentials document: ") + e.what());
    }
}

Result<void> apply_target_spec(const std::string& spec, RemoteCredentials& creds) {
    std::string rest = spec;
    trim(rest);
    if (rest.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Empty target");
    }

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        creds.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos && rest.find(':') == colon) {
        int port = safe_stoi(rest.substr(colon + 1), -1);
        if (port <= 0 || port > 65535) {
            return Result<void>::Err(ErrorKind::InvalidArgument, "Invalid port in " + spec);
        }
        creds.port = port;
        rest = rest.substr(0, colon);
    }

    if (rest.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Missing host in " + spec);
    }
    creds.host = rest;
    return Result<void>::Ok();
}
