#pragma once

#include <istream>
#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "connection_manager.hpp"
#include "file_service.hpp"
#include "command_service.hpp"
#include "server_controller.hpp"
#include "stream_task.hpp"

// Headless façade: the only surface front ends (REPL, HTTP server) use.
//
// Owns the ConnectionManager, the file and command services, and the
// embedded server controller. File and command operations are rejected
// up front with ConnectionLost "No active session" unless the session is
// Connected; server operations never depend on the remote session.
class SessionGateway {
public:
    // Defaults: libssh2 transport, self-launching `vpsx serve` child.
    explicit SessionGateway(const Config& config,
                            TransportFactory transports = nullptr,
                            ServerController::LaunchSpecFactory launch = nullptr,
                            SupervisorFactory supervisors = posix_supervisor_factory());
    ~SessionGateway();

    SessionGateway(const SessionGateway&) = delete;
    SessionGateway& operator=(const SessionGateway&) = delete;

    // ── Session ───────────────────────────────────────────────

    Result<SessionInfo> connect(const RemoteCredentials& creds);
    void disconnect();
    Result<SessionInfo> reconnect();
    SessionInfo session_info() const;
    bool is_connected() const;
    bool check_alive();

    void set_session_listener(ConnectionManager::StatusListener listener);

    // ── Files ─────────────────────────────────────────────────

    Result<std::vector<FileEntry>> list_directory(const std::string& path);
    Result<FileEntry> stat(const std::string& path, bool follow_links = false);
    Result<std::string> read_file(const std::string& path);
    Result<void> write_file(const std::string& path, const std::string& content);
    Result<void> create_directory(const std::string& path);
    Result<void> create_file(const std::string& path);
    Result<void> remove(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);

    Result<TransferReport> upload_file(std::istream& in, const std::string& remote_path,
                                       const CancelToken* cancel = nullptr);
    Result<TransferReport> download_file(const std::string& remote_path, const ByteSink& sink,
                                         const CancelToken* cancel = nullptr);
    Result<ArchiveReport> download_directory_archive(const std::string& remote_path,
                                                     const ByteSink& sink,
                                                     const CancelToken* cancel = nullptr);

    // Same transfers on a background thread. `in` and `sink` must outlive the task.
    StreamTaskPtr<TransferReport> start_upload(std::shared_ptr<std::istream> in,
                                               const std::string& remote_path);
    StreamTaskPtr<TransferReport> start_download(const std::string& remote_path, ByteSink sink);
    StreamTaskPtr<ArchiveReport> start_archive(const std::string& remote_path, ByteSink sink);

    // ── Commands ──────────────────────────────────────────────

    Result<CommandResult> execute_command(const std::string& command, int timeout_secs = 0);
    Result<CommandResult> execute_streaming(const std::string& command, int timeout_secs,
                                            const OutputCallback& on_chunk,
                                            const CancelToken* cancel = nullptr);

    // ── Embedded server ───────────────────────────────────────

    Result<ServerProcessState> start_server(int port = 0);
    Result<ServerProcessState> stop_server();
    Result<ServerProcessState> restart_server();
    ServerProcessState server_status() const;

    void set_server_listener(ServerController::StateListener listener);

    // Stop the server, then disconnect. Idempotent.
    void shutdown();

private:
    Result<void> require_session() const;
    LaunchSpec default_launch(int port, const std::string& bind) const;

    Config config_;
    std::unique_ptr<ConnectionManager> connection_;
    std::unique_ptr<FileService> files_;
    std::unique_ptr<CommandService> commands_;
    std::unique_ptr<ServerController> server_;
};
