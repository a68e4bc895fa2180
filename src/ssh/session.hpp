#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Shared state of one libssh2 session. Channels hold a reference, so the
// session is freed only after the last channel is gone.
//
// libssh2 runs in non-blocking mode: every call is made under io_mutex and
// retried on EAGAIN after waiting on the socket outside the lock, so
// independent channels interleave on one transport.
struct SshContext {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = VPSX_INVALID_SOCKET;
    std::mutex io_mutex;
    std::atomic<bool> lost{false};
    int io_timeout_ms = SSH_IO_TIMEOUT_SECS * 1000;

    SshContext() = default;
    ~SshContext();
    SshContext(const SshContext&) = delete;
    SshContext& operator=(const SshContext&) = delete;

    // Wait until the socket is ready in the direction libssh2 is blocked on.
    void wait_socket(int timeout_ms);

    // Run fn under the I/O lock, retrying while it returns LIBSSH2_ERROR_EAGAIN.
    // Returns LIBSSH2_ERROR_TIMEOUT after io_timeout_ms with no completion.
    // Socket-level failures mark the context lost.
    int call(const std::function<int()>& fn);

    // Same for libssh2 functions that return a pointer (nullptr + EAGAIN).
    void* call_ptr(const std::function<void*()>& fn);

    // libssh2's last error message (takes the I/O lock).
    std::string last_error();

    // True when rc is a socket/transport failure rather than a protocol refusal.
    static bool is_transport_error(int rc);
};

using SshContextPtr = std::shared_ptr<SshContext>;

class Libssh2Transport : public Transport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    Result<void> connect(const RemoteCredentials& creds, const TransportOptions& opts) override;
    void disconnect() override;
    bool alive() override;
    Result<std::unique_ptr<Channel>> open_channel(ChannelPurpose purpose) override;

private:
    Result<void> verify_host_key(const RemoteCredentials& creds, const TransportOptions& opts);
    Result<std::unique_ptr<Channel>> open_sftp();
    Result<std::unique_ptr<Channel>> open_exec();

    SshContextPtr ctx_;
};

// TransportFactory producing libssh2 transports.
TransportFactory libssh2_transport_factory();
