#include "exec_channel.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <cstdlib>

Libssh2ExecChannel::Libssh2ExecChannel(SshContextPtr ctx, LIBSSH2_CHANNEL* channel)
    : ctx_(std::move(ctx)), channel_(channel) {
}

Libssh2ExecChannel::~Libssh2ExecChannel() {
    release();
}

void Libssh2ExecChannel::release() {
    if (!channel_) return;
    if (ctx_->lost) {
        std::lock_guard<std::mutex> lock(ctx_->io_mutex);
        libssh2_channel_free(channel_);
    } else {
        ctx_->call([&]() { return libssh2_channel_free(channel_); });
    }
    channel_ = nullptr;
}

Result<void> Libssh2ExecChannel::exec(const std::string& command) {
    if (!channel_) return Result<void>::Err(ErrorKind::OperationFailed, "Channel already closed");

    int rc = ctx_->call([&]() { return libssh2_channel_exec(channel_, command.c_str()); });
    if (rc != 0) {
        ErrorKind kind = ctx_->lost ? ErrorKind::ConnectionLost : ErrorKind::OperationFailed;
        return Result<void>::Err(kind, "Failed to exec command on channel: " + ctx_->last_error());
    }

    // No stdin for gateway commands
    ctx_->call([&]() { return libssh2_channel_send_eof(channel_); });
    return Result<void>::Ok();
}

Result<size_t> Libssh2ExecChannel::read(OutputStream stream, char* buf, size_t len) {
    if (!channel_) return Result<size_t>::Ok(0);

    ssize_t n;
    {
        std::lock_guard<std::mutex> lock(ctx_->io_mutex);
        int stream_id = stream == OutputStream::Stdout ? 0 : SSH_EXTENDED_DATA_STDERR;
        n = libssh2_channel_read_ex(channel_, stream_id, buf, len);
    }
    if (n >= 0) return Result<size_t>::Ok(static_cast<size_t>(n));
    if (n == LIBSSH2_ERROR_EAGAIN) {
        if (ctx_->lost) {
            return Result<size_t>::Err(ErrorKind::ConnectionLost, "Transport lost while reading command output");
        }
        return Result<size_t>::Ok(0);
    }

    int rc = static_cast<int>(n);
    if (SshContext::is_transport_error(rc)) ctx_->lost = true;
    ErrorKind kind = ctx_->lost ? ErrorKind::ConnectionLost : ErrorKind::OperationFailed;
    return Result<size_t>::Err(kind, "SSH channel read error: " + ctx_->last_error());
}

bool Libssh2ExecChannel::eof() {
    if (!channel_) return true;
    std::lock_guard<std::mutex> lock(ctx_->io_mutex);
    return libssh2_channel_eof(channel_) != 0;
}

void Libssh2ExecChannel::wait(int timeout_ms) {
    ctx_->wait_socket(timeout_ms);
}

Result<void> Libssh2ExecChannel::close() {
    if (!channel_) return Result<void>::Ok();

    int rc = ctx_->call([&]() { return libssh2_channel_close(channel_); });
    if (rc == 0) {
        rc = ctx_->call([&]() { return libssh2_channel_wait_closed(channel_); });
    }
    if (rc != 0) {
        ErrorKind kind = ctx_->lost ? ErrorKind::ConnectionLost : ErrorKind::OperationFailed;
        std::string err = ctx_->last_error();
        release();
        return Result<void>::Err(kind, "Failed to close exec channel: " + err);
    }

    {
        std::lock_guard<std::mutex> lock(ctx_->io_mutex);
        exit_status_ = libssh2_channel_get_exit_status(channel_);

        char* sig = nullptr;
        size_t sig_len = 0;
        if (libssh2_channel_get_exit_signal(channel_, &sig, &sig_len,
                                            nullptr, nullptr, nullptr, nullptr) == 0 && sig) {
            exit_signal_.assign(sig, sig_len);
            libssh2_free(ctx_->session, sig);
        }
    }

    release();
    return Result<void>::Ok();
}

void Libssh2ExecChannel::abort() {
    if (!channel_) return;
    {
        // Single attempt; the remote end may never answer
        std::lock_guard<std::mutex> lock(ctx_->io_mutex);
        libssh2_channel_close(channel_);
    }
    release();
}
