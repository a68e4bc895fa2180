#include "connection_manager.hpp"
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <chrono>

ConnectionManager::ConnectionManager(TransportFactory factory, TransportOptions options,
                                     ReconnectPolicy policy)
    : factory_(std::move(factory)), options_(std::move(options)), policy_(policy) {
}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

void ConnectionManager::set_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

SessionInfo ConnectionManager::snapshot_locked() const {
    SessionInfo info;
    if (!session_) return info;
    info.id = session_->id;
    info.host = session_->creds.host;
    info.port = session_->creds.port;
    info.username = session_->creds.username;
    info.status = session_->status;
    info.connected_at = session_->connected_at;
    info.reconnects = session_->reconnects;
    info.last_error = session_->last_error;
    return info;
}

SessionInfo ConnectionManager::info() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return snapshot_locked();
}

std::optional<RemoteCredentials> ConnectionManager::credentials() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!session_) return std::nullopt;
    return session_->creds;
}

bool ConnectionManager::is_connected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_ && session_->status == SessionStatus::Connected;
}

void ConnectionManager::notify() {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener(info());
}

void ConnectionManager::set_status(SessionStatus status, const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!session_) return;
        session_->status = status;
        if (status == SessionStatus::Connected) {
            session_->connected_at = now_iso();
            session_->last_error.clear();
        } else if (!error.empty()) {
            session_->last_error = error;
        }
    }
    gateway_log(fmt::format("ConnectionManager: status -> {}{}", session_status_name(status),
                            error.empty() ? "" : " (" + error + ")"));
    notify();
}

void ConnectionManager::drop_transport() {
    if (session_ && session_->transport) {
        session_->transport->disconnect();
        session_->transport.reset();
    }
}

// ── Control plane ────────────────────────────────────────────

Result<void> ConnectionManager::establish() {
    drop_transport();
    set_status(SessionStatus::Connecting);

    auto transport = factory_();
    if (!transport) {
        set_status(SessionStatus::Failed, "No transport available");
        return Result<void>::Err(ErrorKind::Connection, "No transport available");
    }

    auto result = transport->connect(session_->creds, options_);
    if (result.is_err()) {
        set_status(SessionStatus::Failed, result.error);
        return result;
    }

    session_->transport = std::move(transport);
    faulted_ = false;
    set_status(SessionStatus::Connected);
    return Result<void>::Ok();
}

Result<SessionInfo> ConnectionManager::connect(const RemoteCredentials& creds) {
    auto valid = validate_credentials(creds);
    if (valid.is_err()) return Result<SessionInfo>::Err(valid);

    std::lock_guard<std::mutex> lock(control_mutex_);

    // Exactly one session: a new connect replaces the old one
    drop_transport();
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        session_ = std::make_unique<Session>();
        session_->id = random_hex(12);
        session_->creds = creds;
    }

    gateway_log(fmt::format("ConnectionManager: connect {}@{}:{} session={}",
                            creds.username, creds.host, creds.port, session_->id));

    auto result = establish();
    if (result.is_err()) {
        gateway_log_error("ConnectionManager: connect failed", result);
        return Result<SessionInfo>::Err(result);
    }
    return Result<SessionInfo>::Ok(info());
}

void ConnectionManager::disconnect() {
    // Wake any backoff sleep before waiting for the control lock
    {
        std::lock_guard<std::mutex> lock(backoff_mutex_);
        generation_++;
    }
    backoff_cv_.notify_all();

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!session_) return;

    gateway_log("ConnectionManager: disconnect session=" + session_->id);
    drop_transport();
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        session_->status = SessionStatus::Disconnected;
    }
    notify();
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        session_.reset();
    }
    faulted_ = false;
}

Result<SessionInfo> ConnectionManager::reconnect() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!session_) {
        return Result<SessionInfo>::Err(ErrorKind::ConnectionLost, "No active session");
    }

    gateway_log("ConnectionManager: explicit reconnect session=" + session_->id);
    auto result = establish();
    if (result.is_err()) return Result<SessionInfo>::Err(result);
    {
        std::lock_guard<std::mutex> slock(state_mutex_);
        session_->reconnects++;
    }
    return Result<SessionInfo>::Ok(info());
}

bool ConnectionManager::backoff_sleep(int delay_ms, uint64_t generation) {
    std::unique_lock<std::mutex> lock(backoff_mutex_);
    backoff_cv_.wait_for(lock, std::chrono::milliseconds(delay_ms),
                         [&]() { return generation_ != generation; });
    return generation_ == generation;
}

Result<void> ConnectionManager::recover(const std::string& reason) {
    uint64_t generation = generation_;
    gateway_log("ConnectionManager: transport dropped (" + reason + "), reconnecting");
    drop_transport();

    Result<void> last = Result<void>::Err(ErrorKind::ConnectionLost, reason);
    for (int attempt = 1; attempt <= policy_.max_attempts; attempt++) {
        int delay = policy_.delay_for_attempt(attempt);
        set_status(SessionStatus::Connecting);
        if (!backoff_sleep(delay, generation)) {
            return Result<void>::Err(ErrorKind::ConnectionLost, "Session closed during reconnect");
        }

        gateway_log(fmt::format("ConnectionManager: reconnect attempt {}/{} after {}ms",
                                attempt, policy_.max_attempts, delay));
        last = establish();
        if (last.is_ok()) {
            std::lock_guard<std::mutex> slock(state_mutex_);
            session_->reconnects++;
            return last;
        }

        // Credentials or host identity rejected: retrying cannot help
        if (last.kind == ErrorKind::Authentication || last.kind == ErrorKind::HostKeyMismatch) {
            break;
        }
    }

    std::string detail = fmt::format("Reconnection failed after {} attempt(s): {}",
                                     policy_.max_attempts, last.error);
    set_status(SessionStatus::Failed, detail);
    return Result<void>::Err(ErrorKind::ConnectionLost, detail);
}

bool ConnectionManager::check_alive() {
    std::lock_guard<std::mutex> lock(control_mutex_);
    if (!session_ || session_->status != SessionStatus::Connected || !session_->transport) {
        return false;
    }
    if (!session_->transport->alive()) {
        faulted_ = true;
        gateway_log("ConnectionManager: keepalive probe failed");
        return false;
    }
    return true;
}

void ConnectionManager::report_fault(const std::string& detail) {
    gateway_log("ConnectionManager: fault reported: " + detail);
    faulted_ = true;
}

// ── Channels ─────────────────────────────────────────────────

Result<std::unique_ptr<Channel>> ConnectionManager::open_channel(ChannelPurpose purpose) {
    using R = Result<std::unique_ptr<Channel>>;
    std::lock_guard<std::mutex> lock(control_mutex_);

    if (!session_) {
        return R::Err(ErrorKind::ConnectionLost, "No active session");
    }
    if (session_->status != SessionStatus::Connected) {
        std::lock_guard<std::mutex> slock(state_mutex_);
        return R::Err(ErrorKind::ConnectionLost,
                      "Session is " + std::string(session_status_name(session_->status)) +
                      (session_->last_error.empty() ? "" : ": " + session_->last_error));
    }

    if (faulted_ || !session_->transport || !session_->transport->alive()) {
        auto recovered = recover("transport dropped");
        if (recovered.is_err()) return R::Err(recovered);
    }

    auto channel = session_->transport->open_channel(purpose);
    if (channel.is_ok() || channel.kind != ErrorKind::ConnectionLost) {
        return channel;
    }

    // Transport died between the probe and the open
    auto recovered = recover(channel.error);
    if (recovered.is_err()) return R::Err(recovered);
    return session_->transport->open_channel(purpose);
}

Result<std::unique_ptr<SftpChannel>> ConnectionManager::open_sftp() {
    using R = Result<std::unique_ptr<SftpChannel>>;
    auto channel = open_channel(ChannelPurpose::FileTransfer);
    if (channel.is_err()) return R::Err(channel);

    std::unique_ptr<SftpChannel> sftp(dynamic_cast<SftpChannel*>(channel.value.get()));
    if (!sftp) return R::Err(ErrorKind::OperationFailed, "Transport returned a non-SFTP channel");
    channel.value.release();
    return R::Ok(std::move(sftp));
}

Result<std::unique_ptr<ExecChannel>> ConnectionManager::open_exec() {
    using R = Result<std::unique_ptr<ExecChannel>>;
    auto channel = open_channel(ChannelPurpose::Exec);
    if (channel.is_err()) return R::Err(channel);

    std::unique_ptr<ExecChannel> exec(dynamic_cast<ExecChannel*>(channel.value.get()));
    if (!exec) return R::Err(ErrorKind::OperationFailed, "Transport returned a non-exec channel");
    channel.value.release();
    return R::Ok(std::move(exec));
}
