#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/config.hpp>

// Seam between the gateway services and the SSH library. The production
// implementation is Libssh2Transport; tests substitute an in-memory fake.

enum class ChannelPurpose {
    FileTransfer,   // SFTP subsystem
    Exec,           // session channel running one command
};

struct RemoteAttrs {
    FileKind kind = FileKind::File;
    uint64_t size = 0;
    int64_t mtime = 0;
    uint32_t permissions = 0;
};

struct RemoteDirEntry {
    std::string name;
    RemoteAttrs attrs;
};

class Channel {
public:
    virtual ~Channel() = default;
    virtual ChannelPurpose purpose() const = 0;
};

// An open remote file. Reads and writes block until done or failed.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns bytes read, 0 at end of file.
    virtual Result<size_t> read(char* buf, size_t len) = 0;

    // Writes all of buf.
    virtual Result<void> write(const char* buf, size_t len) = 0;

    // Releases the handle. A failure means written data may not have been
    // committed. Called once; destruction closes an unclosed file.
    virtual Result<void> close() = 0;
};

// Failures carry PathNotFound / PermissionDenied / OperationFailed for
// server-side refusals and ConnectionLost for transport faults.
class SftpChannel : public Channel {
public:
    ChannelPurpose purpose() const override { return ChannelPurpose::FileTransfer; }

    virtual Result<RemoteAttrs> stat(const std::string& path) = 0;
    virtual Result<RemoteAttrs> lstat(const std::string& path) = 0;
    virtual Result<std::vector<RemoteDirEntry>> list(const std::string& path) = 0;

    virtual Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) = 0;
    // Create or truncate.
    virtual Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path) = 0;

    virtual Result<void> mkdir(const std::string& path, int mode) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;
    virtual Result<void> unlink(const std::string& path) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to, bool overwrite) = 0;
};

class ExecChannel : public Channel {
public:
    ChannelPurpose purpose() const override { return ChannelPurpose::Exec; }

    virtual Result<void> exec(const std::string& command) = 0;

    // Non-blocking read from one stream. 0 means nothing available right now.
    virtual Result<size_t> read(OutputStream stream, char* buf, size_t len) = 0;

    // Remote side has sent EOF.
    virtual bool eof() = 0;

    // Block up to timeout_ms for the transport to have something to read.
    virtual void wait(int timeout_ms) = 0;

    // Orderly close after EOF; exit status is available afterwards.
    virtual Result<void> close() = 0;

    // Drop the channel without waiting for the remote side (timeout, cancel).
    virtual void abort() = 0;

    virtual int exit_status() = 0;
    virtual std::string exit_signal() = 0;
};

struct TransportOptions {
    int connect_timeout_secs = SSH_CONNECT_TIMEOUT_SECS;
    int io_timeout_secs = SSH_IO_TIMEOUT_SECS;
    std::optional<std::string> known_hosts;
    HostKeyPolicy host_key_policy = HostKeyPolicy::AcceptNew;
};

class Transport {
public:
    virtual ~Transport() = default;

    // Failures: Authentication, HostKeyMismatch, Connection.
    virtual Result<void> connect(const RemoteCredentials& creds, const TransportOptions& opts) = 0;

    // Idempotent. Channels still held by callers fail with ConnectionLost afterwards.
    virtual void disconnect() = 0;

    // Keepalive probe; false once the transport is gone.
    virtual bool alive() = 0;

    virtual Result<std::unique_ptr<Channel>> open_channel(ChannelPurpose purpose) = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
