#include "session_gateway.hpp"
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <ssh/session.hpp>
#include <fmt/format.h>

static TransportOptions transport_options(const Config& config) {
    TransportOptions opts;
    opts.connect_timeout_secs = config.connection().connect_timeout;
    opts.io_timeout_secs = config.timeouts().io_timeout_secs;
    opts.known_hosts = config.connection().known_hosts;
    opts.host_key_policy = config.connection().host_key_policy;
    return opts;
}

SessionGateway::SessionGateway(const Config& config, TransportFactory transports,
                               ServerController::LaunchSpecFactory launch,
                               SupervisorFactory supervisors)
    : config_(config) {
    if (!transports) transports = libssh2_transport_factory();
    if (!launch) {
        launch = [this](int port, const std::string& bind) { return default_launch(port, bind); };
    }

    connection_ = std::make_unique<ConnectionManager>(
        std::move(transports), transport_options(config_), config_.reconnect());
    files_ = std::make_unique<FileService>(*connection_);
    commands_ = std::make_unique<CommandService>(*connection_,
                                                 config_.timeouts().command_timeout_secs);
    server_ = std::make_unique<ServerController>(config_.server(), std::move(launch),
                                                 std::move(supervisors));
}

SessionGateway::~SessionGateway() {
    shutdown();
}

void SessionGateway::shutdown() {
    if (server_) {
        auto r = server_->stop();
        if (r.is_err()) gateway_log_error("SessionGateway: server stop", r);
    }
    if (connection_) connection_->disconnect();
}

Result<void> SessionGateway::require_session() const {
    if (!connection_->is_connected()) {
        auto info = connection_->info();
        if (info.status == SessionStatus::Failed && !info.last_error.empty()) {
            return Result<void>::Err(ErrorKind::ConnectionLost,
                                     "No active session: " + info.last_error);
        }
        return Result<void>::Err(ErrorKind::ConnectionLost, "No active session");
    }
    return Result<void>::Ok();
}

LaunchSpec SessionGateway::default_launch(int port, const std::string& bind) const {
    LaunchSpec spec;
    auto exe = platform::self_exe_path();
    spec.program = exe.empty() ? "vpsx" : exe.string();
    spec.args = {"serve", "--port", std::to_string(port), "--bind", bind};
    if (auto creds = connection_->credentials()) {
        spec.stdin_payload = encode_credentials(*creds);
    }
    spec.stderr_log = (platform::temp_dir() / "vpsx_server.log").string();
    return spec;
}

// ── Session ─────────────────────────────────────────────────

Result<SessionInfo> SessionGateway::connect(const RemoteCredentials& creds) {
    return connection_->connect(creds);
}

void SessionGateway::disconnect() {
    connection_->disconnect();
}

Result<SessionInfo> SessionGateway::reconnect() {
    return connection_->reconnect();
}

SessionInfo SessionGateway::session_info() const {
    return connection_->info();
}

bool SessionGateway::is_connected() const {
    return connection_->is_connected();
}

bool SessionGateway::check_alive() {
    return connection_->check_alive();
}

void SessionGateway::set_session_listener(ConnectionManager::StatusListener listener) {
    connection_->set_listener(std::move(listener));
}

// ── Files ───────────────────────────────────────────────────

Result<std::vector<FileEntry>> SessionGateway::list_directory(const std::string& path) {
    auto ok = require_session();
    if (ok.is_err()) return Result<std::vector<FileEntry>>::Err(ok);
    return files_->list(path);
}

Result<FileEntry> SessionGateway::stat(const std::string& path, bool follow_links) {
    auto ok = require_session();
    if (ok.is_err()) return Result<FileEntry>::Err(ok);
    return files_->stat(path, follow_links);
}

Result<std::string> SessionGateway::read_file(const std::string& path) {
    auto ok = require_session();
    if (ok.is_err()) return Result<std::string>::Err(ok);
    return files_->read(path);
}

Result<void> SessionGateway::write_file(const std::string& path, const std::string& content) {
    auto ok = require_session();
    if (ok.is_err()) return ok;
    return files_->write(path, content);
}

Result<void> SessionGateway::create_directory(const std::string& path) {
    auto ok = require_session();
    if (ok.is_err()) return ok;
    return files_->create_directory(path);
}

Result<void> SessionGateway::create_file(const std::string& path) {
    auto ok = require_session();
    if (ok.is_err()) return ok;
    return files_->create_file(path);
}

Result<void> SessionGateway::remove(const std::string& path) {
    auto ok = require_session();
    if (ok.is_err()) return ok;
    return files_->remove(path);
}

Result<void> SessionGateway::rename(const std::string& from, const std::string& to) {
    auto ok = require_session();
    if (ok.is_err()) return ok;
    return files_->rename(from, to);
}

Result<TransferReport> SessionGateway::upload_file(std::istream& in, const std::string& remote_path,
                                                   const CancelToken* cancel) {
    auto ok = require_session();
    if (ok.is_err()) return Result<TransferReport>::Err(ok);
    return files_->upload(in, remote_path, cancel);
}

Result<TransferReport> SessionGateway::download_file(const std::string& remote_path,
                                                     const ByteSink& sink,
                                                     const CancelToken* cancel) {
    auto ok = require_session();
    if (ok.is_err()) return Result<TransferReport>::Err(ok);
    return files_->download(remote_path, sink, cancel);
}

Result<ArchiveReport> SessionGateway::download_directory_archive(const std::string& remote_path,
                                                                const ByteSink& sink,
                                                                const CancelToken* cancel) {
    auto ok = require_session();
    if (ok.is_err()) return Result<ArchiveReport>::Err(ok);
    return files_->archive_directory(remote_path, sink, cancel);
}

StreamTaskPtr<TransferReport> SessionGateway::start_upload(std::shared_ptr<std::istream> in,
                                                           const std::string& remote_path) {
    return std::make_unique<StreamTask<TransferReport>>(
        [this, in, remote_path](const CancelToken* cancel) {
            return upload_file(*in, remote_path, cancel);
        });
}

StreamTaskPtr<TransferReport> SessionGateway::start_download(const std::string& remote_path,
                                                             ByteSink sink) {
    return std::make_unique<StreamTask<TransferReport>>(
        [this, remote_path, sink = std::move(sink)](const CancelToken* cancel) {
            return download_file(remote_path, sink, cancel);
        });
}

StreamTaskPtr<ArchiveReport> SessionGateway::start_archive(const std::string& remote_path,
                                                           ByteSink sink) {
    return std::make_unique<StreamTask<ArchiveReport>>(
        [this, remote_path, sink = std::move(sink)](const CancelToken* cancel) {
            return download_directory_archive(remote_path, sink, cancel);
        });
}

// ── Commands ────────────────────────────────────────────────

Result<CommandResult> SessionGateway::execute_command(const std::string& command, int timeout_secs) {
    auto ok = require_session();
    if (ok.is_err()) return Result<CommandResult>::Err(ok);
    return commands_->execute(command, timeout_secs);
}

Result<CommandResult> SessionGateway::execute_streaming(const std::string& command, int timeout_secs,
                                                        const OutputCallback& on_chunk,
                                                        const CancelToken* cancel) {
    auto ok = require_session();
    if (ok.is_err()) return Result<CommandResult>::Err(ok);
    return commands_->execute_streaming(command, timeout_secs, on_chunk, cancel);
}

// ── Embedded server ─────────────────────────────────────────

Result<ServerProcessState> SessionGateway::start_server(int port) {
    return server_->start(port);
}

Result<ServerProcessState> SessionGateway::stop_server() {
    return server_->stop();
}

Result<ServerProcessState> SessionGateway::restart_server() {
    return server_->restart();
}

ServerProcessState SessionGateway::server_status() const {
    return server_->state();
}

void SessionGateway::set_server_listener(ServerController::StateListener listener) {
    server_->set_listener(std::move(listener));
}
