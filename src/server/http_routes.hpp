#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>

class SessionGateway;

using json = nlohmann::json;

// A request as the routing layer sees it: decoded path and query string.
struct ApiRequest {
    std::string method;                          // "GET", "POST"
    std::string path;                            // "/api/list"
    std::map<std::string, std::string> params;   // query string, URL-decoded
    std::string body;

    std::string param(const std::string& key, const std::string& fallback = "") const;
};

struct ApiReply {
    int status = 200;
    json body;
};

// Split "/api/list?path=%2Fhome" into path and decoded params.
ApiRequest parse_target(const std::string& method, const std::string& target);

// HTTP status for an error kind (400/401/403/404/409/500/503/504).
int http_status_for(ErrorKind kind);

ApiReply error_reply(ErrorKind kind, const std::string& message);
ApiReply error_reply(int status, const std::string& kind, const std::string& message);

template <typename T>
ApiReply error_reply(const Result<T>& r) {
    return error_reply(r.kind, r.error);
}

json entry_json(const FileEntry& entry);
json session_json(const SessionInfo& info);
json command_json(const CommandResult& result);
json server_json(const ServerProcessState& state);

// Serialized reply body; invalid UTF-8 in strings becomes U+FFFD.
std::string dump_reply(const ApiReply& reply);

// JSON endpoints. nullopt when the path is not one of them (streamed
// endpoints and unknown paths are handled by the HTTP layer).
std::optional<ApiReply> handle_api(SessionGateway& gateway, const ApiRequest& req);
