#include "http_routes.hpp"
#include <managers/session_gateway.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <util/remote_path.hpp>
#include <functional>

std::string ApiRequest::param(const std::string& key, const std::string& fallback) const {
    auto it = params.find(key);
    return it == params.end() ? fallback : it->second;
}

ApiRequest parse_target(const std::string& method, const std::string& target) {
    ApiRequest req;
    req.method = method;

    auto q = target.find('?');
    req.path = StringUtils::url_decode(target.substr(0, q), false);
    if (req.path.size() > 1 && req.path.back() == '/') req.path.pop_back();
    if (q == std::string::npos) return req;

    for (const auto& pair : StringUtils::split(target.substr(q + 1), '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        std::string key = StringUtils::url_decode(pair.substr(0, eq));
        std::string value = eq == std::string::npos ? "" : StringUtils::url_decode(pair.substr(eq + 1));
        req.params[key] = value;
    }
    return req;
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument:  return 400;
        case ErrorKind::Authentication:   return 401;
        case ErrorKind::HostKeyMismatch:  return 401;
        case ErrorKind::PermissionDenied: return 403;
        case ErrorKind::PathNotFound:     return 404;
        case ErrorKind::IsADirectory:     return 409;
        case ErrorKind::OperationFailed:  return 409;
        case ErrorKind::PortInUse:        return 409;
        case ErrorKind::Connection:       return 503;
        case ErrorKind::ConnectionLost:   return 503;
        case ErrorKind::CommandTimeout:   return 504;
        default:                          return 500;
    }
}

ApiReply error_reply(int status, const std::string& kind, const std::string& message) {
    ApiReply reply;
    reply.status = status;
    reply.body = {{"status", "error"}, {"kind", kind}, {"message", message}};
    return reply;
}

ApiReply error_reply(ErrorKind kind, const std::string& message) {
    return error_reply(http_status_for(kind), error_kind_name(kind), message);
}

static ApiReply ok_reply(json extra = json::object()) {
    ApiReply reply;
    reply.body = {{"status", "ok"}};
    reply.body.update(extra);
    return reply;
}

std::string dump_reply(const ApiReply& reply) {
    return reply.body.dump(-1, ' ', false, json::error_handler_t::replace);
}

json entry_json(const FileEntry& entry) {
    return {
        {"name", entry.name},
        {"path", entry.path},
        {"kind", file_kind_name(entry.kind)},
        {"size", entry.size},
        {"size_text", StringUtils::format_size(entry.size)},
        {"mtime", entry.mtime},
        {"permissions", entry.permissions},
    };
}

json session_json(const SessionInfo& info) {
    json j = {
        {"connected", info.status == SessionStatus::Connected},
        {"status", session_status_name(info.status)},
    };
    if (!info.id.empty()) {
        j["id"] = info.id;
        j["host"] = info.host;
        j["port"] = info.port;
        j["user"] = info.username;
        j["connected_at"] = info.connected_at;
        j["reconnects"] = info.reconnects;
    }
    if (!info.last_error.empty()) j["last_error"] = info.last_error;
    return j;
}

json command_json(const CommandResult& result) {
    json j = {
        {"command", result.command},
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"exit_code", result.exit_code},
        {"started_at", to_iso(result.started_at)},
        {"finished_at", to_iso(result.finished_at)},
        {"duration_ms", result.duration_ms()},
    };
    if (!result.exit_signal.empty()) j["exit_signal"] = result.exit_signal;
    return j;
}

json server_json(const ServerProcessState& state) {
    json j = {
        {"phase", server_phase_name(state.phase)},
        {"pid", state.pid},
        {"port", state.port},
        {"url", state.url},
        {"detail", state.detail},
    };
    if (state.exit_code) j["exit_code"] = *state.exit_code;
    else j["exit_code"] = nullptr;
    return j;
}

// ── Handlers ────────────────────────────────────────────────

namespace {

using Handler = std::function<ApiReply(SessionGateway&, const ApiRequest&)>;

struct Route {
    const char* method;
    const char* path;
    Handler handler;
};

ApiReply require_param(const ApiRequest& req, const std::string& key, std::string& out) {
    out = req.param(key);
    if (out.empty()) return error_reply(ErrorKind::InvalidArgument, "Missing parameter: " + key);
    return ok_reply();
}

ApiReply from_void(const Result<void>& r, const std::string& message) {
    if (r.is_err()) return error_reply(r);
    return ok_reply({{"message", message}});
}

ApiReply list_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path = req.param("path", "/");
    auto r = gw.list_directory(path);
    if (r.is_err()) return error_reply(r);

    json dirs = json::array();
    json files = json::array();
    for (const auto& e : r.value) {
        (e.is_dir() ? dirs : files).push_back(entry_json(e));
    }
    return ok_reply({{"path", RemotePath::normalize(path)},
                     {"directories", dirs}, {"files", files}});
}

ApiReply stat_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path;
    auto missing = require_param(req, "path", path);
    if (missing.status != 200) return missing;
    auto r = gw.stat(path);
    if (r.is_err()) return error_reply(r);
    return ok_reply({{"entry", entry_json(r.value)}});
}

ApiReply file_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path;
    auto missing = require_param(req, "path", path);
    if (missing.status != 200) return missing;
    auto r = gw.read_file(path);
    if (r.is_err()) return error_reply(r);
    // Invalid UTF-8 is replaced when the reply is serialized
    return ok_reply({{"content", r.value}});
}

ApiReply save_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path;
    auto missing = require_param(req, "path", path);
    if (missing.status != 200) return missing;
    return from_void(gw.write_file(path, req.body), "File saved");
}

ApiReply mkdir_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path;
    auto missing = require_param(req, "path", path);
    if (missing.status != 200) return missing;
    return from_void(gw.create_directory(path), "Folder created");
}

ApiReply touch_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path;
    auto missing = require_param(req, "path", path);
    if (missing.status != 200) return missing;
    return from_void(gw.create_file(path), "File created");
}

ApiReply delete_route(SessionGateway& gw, const ApiRequest& req) {
    std::string path;
    auto missing = require_param(req, "path", path);
    if (missing.status != 200) return missing;
    return from_void(gw.remove(path), "Deleted");
}

ApiReply rename_route(SessionGateway& gw, const ApiRequest& req) {
    std::string from, to;
    auto missing = require_param(req, "from", from);
    if (missing.status != 200) return missing;
    missing = require_param(req, "to", to);
    if (missing.status != 200) return missing;
    return from_void(gw.rename(from, to), "Renamed");
}

ApiReply exec_route(SessionGateway& gw, const ApiRequest& req) {
    std::string command = StringUtils::trim(req.body);
    if (command.empty()) return error_reply(ErrorKind::InvalidArgument, "No command provided");
    int timeout = safe_stoi(req.param("timeout"), 0);
    auto r = gw.execute_command(command, timeout);
    if (r.is_err()) {
        auto reply = error_reply(r);
        if (r.kind == ErrorKind::CommandTimeout) reply.body["result"] = command_json(r.value);
        return reply;
    }
    return ok_reply({{"result", command_json(r.value)}});
}

const std::vector<Route>& routes() {
    static const std::vector<Route> table = {
        {"GET", "/health", [](SessionGateway&, const ApiRequest&) { return ok_reply(); }},
        {"GET", "/api/session", [](SessionGateway& gw, const ApiRequest&) {
            return ok_reply({{"session", session_json(gw.session_info())}});
        }},
        {"GET", "/api/server", [](SessionGateway& gw, const ApiRequest&) {
            return ok_reply({{"server", server_json(gw.server_status())}});
        }},
        {"GET", "/api/list", list_route},
        {"GET", "/api/stat", stat_route},
        {"GET", "/api/file", file_route},
        {"POST", "/api/save", save_route},
        {"POST", "/api/mkdir", mkdir_route},
        {"POST", "/api/touch", touch_route},
        {"POST", "/api/delete", delete_route},
        {"POST", "/api/rename", rename_route},
        {"POST", "/api/exec", exec_route},
    };
    return table;
}

} // namespace

std::optional<ApiReply> handle_api(SessionGateway& gateway, const ApiRequest& req) {
    bool path_known = false;
    for (const auto& route : routes()) {
        if (req.path != route.path) continue;
        path_known = true;
        if (req.method == route.method) return route.handler(gateway, req);
    }
    if (path_known) {
        return error_reply(405, error_kind_name(ErrorKind::InvalidArgument),
                           "Method not allowed: " + req.method + " " + req.path);
    }
    return std::nullopt;
}
