#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <core/config.hpp>
#include <ssh/transport.hpp>

// Owns the single authenticated remote session.
//
// Services never see the Session; they ask for channels. A transport fault
// (reported by a service, or seen when opening a channel) triggers
// reconnection with the last-known credentials and exponential backoff.
// When the budget is exhausted the session is Failed and every channel
// request fails with ConnectionLost until reconnect() or a fresh connect().
class ConnectionManager {
public:
    // Called on every status change. Runs on the thread that caused the
    // change, possibly with the control lock held: it may read info() but
    // must not call connect/disconnect/reconnect/open_channel.
    using StatusListener = std::function<void(const SessionInfo&)>;

    ConnectionManager(TransportFactory factory, TransportOptions options, ReconnectPolicy policy);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Replaces any existing session.
    Result<SessionInfo> connect(const RemoteCredentials& creds);

    // Idempotent; cancels a reconnect backoff in progress.
    void disconnect();

    // Re-establish with the last-known credentials (also resets a Failed session).
    Result<SessionInfo> reconnect();

    SessionInfo info() const;
    bool is_connected() const;

    // Credentials of the current session, if any (for the embedded server hand-off).
    std::optional<RemoteCredentials> credentials() const;

    // Keepalive probe; a failed probe marks the transport dropped.
    bool check_alive();

    // A service saw a transport-level failure on one of its channels.
    void report_fault(const std::string& detail);

    Result<std::unique_ptr<Channel>> open_channel(ChannelPurpose purpose);
    Result<std::unique_ptr<SftpChannel>> open_sftp();
    Result<std::unique_ptr<ExecChannel>> open_exec();

    void set_listener(StatusListener listener);

private:
    struct Session {
        std::string id;
        RemoteCredentials creds;
        std::unique_ptr<Transport> transport;
        SessionStatus status = SessionStatus::Disconnected;
        std::string connected_at;
        int reconnects = 0;
        std::string last_error;
    };

    // All private helpers expect control_mutex_ to be held.
    Result<void> establish();
    Result<void> recover(const std::string& reason);
    bool backoff_sleep(int delay_ms, uint64_t generation);
    void set_status(SessionStatus status, const std::string& error = "");
    void drop_transport();
    SessionInfo snapshot_locked() const;
    void notify();

    TransportFactory factory_;
    TransportOptions options_;
    ReconnectPolicy policy_;

    std::mutex control_mutex_;           // connect / reconnect / disconnect / open_channel
    mutable std::mutex state_mutex_;     // session fields read by info()
    std::unique_ptr<Session> session_;
    std::atomic<bool> faulted_{false};

    // Backoff cancellation: disconnect() bumps the generation and wakes sleepers
    std::mutex backoff_mutex_;
    std::condition_variable backoff_cv_;
    std::atomic<uint64_t> generation_{0};

    std::mutex listener_mutex_;
    StatusListener listener_;
};
