#include "session.hpp"
#include "auth.hpp"
#include "sftp_channel.hpp"
#include "exec_channel.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#ifndef _WIN32
#  include <sys/socket.h>
#endif
#include <chrono>
#include <cstdlib>

// ── SshContext ───────────────────────────────────────────────

SshContext::~SshContext() {
    if (session) {
        // Socket may already be shut down; blocking mode keeps free from spinning on EAGAIN
        libssh2_session_set_blocking(session, 1);
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != VPSX_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = VPSX_INVALID_SOCKET;
    }
}

bool SshContext::is_transport_error(int rc) {
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_NONE:
    case LIBSSH2_ERROR_BANNER_RECV:
    case LIBSSH2_ERROR_BANNER_SEND:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
    case LIBSSH2_ERROR_BAD_SOCKET:
    case LIBSSH2_ERROR_SOCKET_RECV:
        return true;
    default:
        return false;
    }
}

void SshContext::wait_socket(int timeout_ms) {
    int dir;
    {
        std::lock_guard<std::mutex> lock(io_mutex);
        dir = session ? libssh2_session_block_directions(session) : 0;
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    int revents = platform::poll_socket(sock, events, timeout_ms);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        lost = true;
    }
}

int SshContext::call(const std::function<int()>& fn) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            if (is_transport_error(rc)) lost = true;
            return rc;
        }
        if (lost) return LIBSSH2_ERROR_SOCKET_DISCONNECT;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > io_timeout_ms) {
            gateway_log(fmt::format("SshContext: no progress for {}ms, treating transport as lost", elapsed));
            lost = true;
            return LIBSSH2_ERROR_TIMEOUT;
        }
        wait_socket(EAGAIN_WAIT_MS);
    }
}

void* SshContext::call_ptr(const std::function<void*()>& fn) {
    void* result = nullptr;
    call([&]() -> int {
        result = fn();
        if (result) return 0;
        int err = libssh2_session_last_errno(session);
        return err == 0 ? -1 : err;
    });
    return result;
}

std::string SshContext::last_error() {
    std::lock_guard<std::mutex> lock(io_mutex);
    if (!session) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string();
}

// ── Libssh2Transport ─────────────────────────────────────────

static void init_libssh2_once() {
    static std::once_flag flag;
    std::call_once(flag, []() {
        libssh2_init(0);
        std::atexit([]() { libssh2_exit(); });
    });
}

Libssh2Transport::Libssh2Transport() {
    init_libssh2_once();
}

Libssh2Transport::~Libssh2Transport() {
    disconnect();
}

Result<void> Libssh2Transport::connect(const RemoteCredentials& creds, const TransportOptions& opts) {
    disconnect();

    auto ctx = std::make_shared<SshContext>();
    ctx->io_timeout_ms = opts.connect_timeout_secs * 1000;

    gateway_log(fmt::format("Libssh2Transport: connecting to {}:{}", creds.host, creds.port));

    std::string err;
    ctx->sock = platform::connect_tcp(creds.host, creds.port, opts.connect_timeout_secs * 1000, err);
    if (ctx->sock == VPSX_INVALID_SOCKET) {
        return Result<void>::Err(ErrorKind::Connection, err);
    }

    // Create SSH session
    ctx->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!ctx->session) {
        return Result<void>::Err(ErrorKind::Connection, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(ctx->session, 0);

    // SSH handshake (key exchange)
    socket_t sock = ctx->sock;
    LIBSSH2_SESSION* session = ctx->session;
    int rc = ctx->call([&]() { return libssh2_session_handshake(session, sock); });
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Connection,
                                 "SSH handshake failed with " + creds.host + ": " + ctx->last_error());
    }

    platform::enable_tcp_keepalive(ctx->sock);
    libssh2_keepalive_config(ctx->session, 1, SSH_KEEPALIVE_SECS);

    ctx_ = ctx;
    auto host_ok = verify_host_key(creds, opts);
    if (host_ok.is_err()) {
        ctx_.reset();
        return host_ok;
    }

    auto auth = authenticate(*ctx, creds);
    if (auth.is_err()) {
        ctx_.reset();
        return auth;
    }

    ctx->io_timeout_ms = opts.io_timeout_secs * 1000;
    gateway_log(fmt::format("Libssh2Transport: authenticated as {}@{}", creds.username, creds.host));
    return Result<void>::Ok();
}

Result<void> Libssh2Transport::verify_host_key(const RemoteCredentials& creds, const TransportOptions& opts) {
    if (opts.host_key_policy == HostKeyPolicy::Off) {
        return Result<void>::Ok();
    }

    std::lock_guard<std::mutex> lock(ctx_->io_mutex);
    LIBSSH2_SESSION* session = ctx_->session;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session);
    if (!nh) {
        return Result<void>::Err(ErrorKind::Connection, "Cannot initialize known_hosts");
    }

    std::string kh_path = opts.known_hosts
        ? *opts.known_hosts
        : (platform::home_dir() / ".ssh" / "known_hosts").string();
    bool loaded = libssh2_knownhost_readfile(nh, kh_path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!loaded && opts.host_key_policy == HostKeyPolicy::Strict) {
        libssh2_knownhost_free(nh);
        return Result<void>::Err(ErrorKind::HostKeyMismatch,
                                 "known_hosts unreadable under strict policy: " + kh_path);
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        return Result<void>::Err(ErrorKind::Connection, "Server sent no host key");
    }

    int alg = 0;
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:       alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; break;
    case LIBSSH2_HOSTKEY_TYPE_DSS:       alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:   alg = LIBSSH2_KNOWNHOST_KEY_ED25519; break;
#endif
    default: break;
    }

    int mask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    int mask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, creds.host.c_str(), creds.port,
                                         hostkey, keylen, mask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, creds.host.c_str(), creds.port,
                                         hostkey, keylen, mask_hash, &host);
    }

    Result<void> result = Result<void>::Ok();
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        result = Result<void>::Err(ErrorKind::HostKeyMismatch,
                                   "Host key for " + creds.host + " does not match " + kh_path);
    } else if (check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        if (opts.host_key_policy == HostKeyPolicy::Strict) {
            result = Result<void>::Err(ErrorKind::HostKeyMismatch,
                                       "Host " + creds.host + " is not in " + kh_path);
        } else {
            // Trust on first use: record the key (non-default ports use [host]:port)
            std::string entry_host = creds.port == 22
                ? creds.host
                : "[" + creds.host + "]:" + std::to_string(creds.port);
            int addrc = libssh2_knownhost_addc(nh, entry_host.c_str(), nullptr, hostkey, keylen,
                                               nullptr, 0, mask_plain, nullptr);
            if (addrc != 0 ||
                libssh2_knownhost_writefile(nh, kh_path.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
                gateway_log("Libssh2Transport: could not record host key in " + kh_path);
            } else {
                gateway_log("Libssh2Transport: recorded new host key for " + entry_host);
            }
        }
    } else if (check == LIBSSH2_KNOWNHOST_CHECK_FAILURE) {
        result = Result<void>::Err(ErrorKind::HostKeyMismatch, "Host key check failed for " + creds.host);
    }

    libssh2_knownhost_free(nh);
    return result;
}

void Libssh2Transport::disconnect() {
    if (!ctx_) return;
    auto ctx = std::move(ctx_);
    ctx_.reset();

    // Mark lost first so channels still in use bail out early
    bool was_lost = ctx->lost.exchange(true);
    if (!was_lost && ctx->session) {
        std::lock_guard<std::mutex> lock(ctx->io_mutex);
        libssh2_session_disconnect(ctx->session, "Normal disconnection");
    }
    if (ctx->sock != VPSX_INVALID_SOCKET) {
#ifdef _WIN32
        shutdown(ctx->sock, SD_BOTH);
#else
        shutdown(ctx->sock, SHUT_RDWR);
#endif
    }
    // Session is freed when the last channel releases the context
}

bool Libssh2Transport::alive() {
    if (!ctx_ || ctx_->lost) return false;

    {
        std::lock_guard<std::mutex> lock(ctx_->io_mutex);
        int seconds_to_next = 0;
        int ret = libssh2_keepalive_send(ctx_->session, &seconds_to_next);
        if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
            ctx_->lost = true;
            return false;
        }
    }

    // Also check if the socket is still valid
    int revents = platform::poll_socket(ctx_->sock, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        ctx_->lost = true;
        return false;
    }
    return true;
}

Result<std::unique_ptr<Channel>> Libssh2Transport::open_channel(ChannelPurpose purpose) {
    if (!ctx_ || ctx_->lost) {
        return Result<std::unique_ptr<Channel>>::Err(ErrorKind::ConnectionLost, "Transport is not connected");
    }
    return purpose == ChannelPurpose::FileTransfer ? open_sftp() : open_exec();
}

Result<std::unique_ptr<Channel>> Libssh2Transport::open_sftp() {
    SshContextPtr ctx = ctx_;
    auto* sftp = static_cast<LIBSSH2_SFTP*>(ctx->call_ptr([&]() -> void* {
        return libssh2_sftp_init(ctx->session);
    }));
    if (!sftp) {
        ErrorKind kind = ctx->lost ? ErrorKind::ConnectionLost : ErrorKind::OperationFailed;
        return Result<std::unique_ptr<Channel>>::Err(kind, "Failed to start SFTP subsystem: " + ctx->last_error());
    }
    return Result<std::unique_ptr<Channel>>::Ok(std::make_unique<Libssh2SftpChannel>(ctx, sftp));
}

Result<std::unique_ptr<Channel>> Libssh2Transport::open_exec() {
    SshContextPtr ctx = ctx_;
    auto* channel = static_cast<LIBSSH2_CHANNEL*>(ctx->call_ptr([&]() -> void* {
        return libssh2_channel_open_session(ctx->session);
    }));
    if (!channel) {
        ErrorKind kind = ctx->lost ? ErrorKind::ConnectionLost : ErrorKind::OperationFailed;
        return Result<std::unique_ptr<Channel>>::Err(kind, "Failed to open exec channel: " + ctx->last_error());
    }
    return Result<std::unique_ptr<Channel>>::Ok(std::make_unique<Libssh2ExecChannel>(ctx, channel));
}

TransportFactory libssh2_transport_factory() {
    return []() -> std::unique_ptr<Transport> { return std::make_unique<Libssh2Transport>(); };
}
