#include "sftp_channel.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <cstring>

// Map a failed libssh2 SFTP call onto the gateway taxonomy.
// fx is the SFTP status code, valid when rc == LIBSSH2_ERROR_SFTP_PROTOCOL.
static ErrorKind sftp_error_kind(SshContext& ctx, int rc, unsigned long fx) {
    if (SshContext::is_transport_error(rc) || ctx.lost) return ErrorKind::ConnectionLost;
    if (rc != LIBSSH2_ERROR_SFTP_PROTOCOL) return ErrorKind::OperationFailed;

    switch (fx) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return ErrorKind::PathNotFound;
    case LIBSSH2_FX_PERMISSION_DENIED:
    case LIBSSH2_FX_WRITE_PROTECT:
        return ErrorKind::PermissionDenied;
#ifdef LIBSSH2_FX_FILE_IS_A_DIRECTORY
    case LIBSSH2_FX_FILE_IS_A_DIRECTORY:
        return ErrorKind::IsADirectory;
#endif
    case LIBSSH2_FX_CONNECTION_LOST:
    case LIBSSH2_FX_NO_CONNECTION:
        return ErrorKind::ConnectionLost;
    default:
        return ErrorKind::OperationFailed;
    }
}

static const char* sftp_status_text(unsigned long fx) {
    switch (fx) {
    case LIBSSH2_FX_NO_SUCH_FILE:         return "no such file";
    case LIBSSH2_FX_NO_SUCH_PATH:         return "no such path";
    case LIBSSH2_FX_PERMISSION_DENIED:    return "permission denied";
    case LIBSSH2_FX_WRITE_PROTECT:        return "write protected";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:  return "already exists";
    case LIBSSH2_FX_DIR_NOT_EMPTY:        return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:      return "not a directory";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left";
    case LIBSSH2_FX_QUOTA_EXCEEDED:       return "quota exceeded";
    case LIBSSH2_FX_OP_UNSUPPORTED:       return "operation unsupported";
    default:                              return "failure";
    }
}

template <typename T>
static Result<T> sftp_failure(SshContext& ctx, const std::string& what, const std::string& path,
                              int rc, unsigned long fx) {
    ErrorKind kind = sftp_error_kind(ctx, rc, fx);
    std::string detail = (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
        ? std::string(sftp_status_text(fx))
        : ctx.last_error();
    return Result<T>::Err(kind, what + " " + path + ": " + detail);
}

static RemoteAttrs to_attrs(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    RemoteAttrs out;
    if (a.flags & LIBSSH2_SFTP_ATTR_SIZE) out.size = a.filesize;
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) out.mtime = static_cast<int64_t>(a.mtime);
    if (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        out.permissions = static_cast<uint32_t>(a.permissions & 0777);
        switch (a.permissions & LIBSSH2_SFTP_S_IFMT) {
        case LIBSSH2_SFTP_S_IFDIR: out.kind = FileKind::Directory; break;
        case LIBSSH2_SFTP_S_IFLNK: out.kind = FileKind::Symlink; break;
        case LIBSSH2_SFTP_S_IFREG: out.kind = FileKind::File; break;
        default:                   out.kind = FileKind::Other; break;
        }
    }
    return out;
}

// ── SftpSession ──────────────────────────────────────────────

SftpSession::~SftpSession() {
    if (!sftp) return;
    if (ctx->lost) {
        // No round trip possible; local state is released with the session
        std::lock_guard<std::mutex> lock(ctx->io_mutex);
        libssh2_sftp_shutdown(sftp);
    } else {
        ctx->call([&]() { return libssh2_sftp_shutdown(sftp); });
    }
    sftp = nullptr;
}

// ── Libssh2SftpChannel ───────────────────────────────────────

Libssh2SftpChannel::Libssh2SftpChannel(SshContextPtr ctx, LIBSSH2_SFTP* sftp)
    : sftp_(std::make_shared<SftpSession>(std::move(ctx), sftp)) {
}

Result<RemoteAttrs> Libssh2SftpChannel::stat_impl(const std::string& path, int stat_type) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::memset(&attrs, 0, sizeof(attrs));
    unsigned long fx = 0;
    LIBSSH2_SFTP* sftp = sftp_->sftp;

    int rc = sftp_->ctx->call([&]() {
        int r = libssh2_sftp_stat_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                     stat_type, &attrs);
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    if (rc != 0) return sftp_failure<RemoteAttrs>(*sftp_->ctx, "stat", path, rc, fx);
    return Result<RemoteAttrs>::Ok(to_attrs(attrs));
}

Result<RemoteAttrs> Libssh2SftpChannel::stat(const std::string& path) {
    return stat_impl(path, LIBSSH2_SFTP_STAT);
}

Result<RemoteAttrs> Libssh2SftpChannel::lstat(const std::string& path) {
    return stat_impl(path, LIBSSH2_SFTP_LSTAT);
}

Result<std::vector<RemoteDirEntry>> Libssh2SftpChannel::list(const std::string& path) {
    using R = Result<std::vector<RemoteDirEntry>>;
    SshContext& ctx = *sftp_->ctx;
    LIBSSH2_SFTP* sftp = sftp_->sftp;

    LIBSSH2_SFTP_HANDLE* dir = nullptr;
    unsigned long fx = 0;
    int rc = ctx.call([&]() {
        dir = libssh2_sftp_open_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                   0, 0, LIBSSH2_SFTP_OPENDIR);
        if (dir) return 0;
        int err = libssh2_session_last_errno(ctx.session);
        if (err == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return err == 0 ? -1 : err;
    });
    if (rc != 0 || !dir) return sftp_failure<std::vector<RemoteDirEntry>>(ctx, "list", path, rc, fx);

    std::vector<RemoteDirEntry> out;
    char filename[4096];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    R result = R::Ok({});

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int n = ctx.call([&]() {
            int r = libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), nullptr, 0, &attrs);
            if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
            return r;
        });
        if (n > 0) {
            std::string name(filename, static_cast<size_t>(n));
            if (name == "." || name == "..") continue;
            out.push_back(RemoteDirEntry{std::move(name), to_attrs(attrs)});
        } else if (n == 0) {
            break;  // end of directory
        } else {
            result = sftp_failure<std::vector<RemoteDirEntry>>(ctx, "list", path, n, fx);
            break;
        }
    }

    if (ctx.lost) {
        std::lock_guard<std::mutex> lock(ctx.io_mutex);
        libssh2_sftp_close_handle(dir);
    } else {
        ctx.call([&]() { return libssh2_sftp_close_handle(dir); });
    }

    if (result.is_err()) return result;
    return R::Ok(std::move(out));
}

Result<std::unique_ptr<RemoteFile>> Libssh2SftpChannel::open_impl(const std::string& path,
                                                                  unsigned long flags, long mode) {
    SshContext& ctx = *sftp_->ctx;
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    LIBSSH2_SFTP_HANDLE* handle = nullptr;
    unsigned long fx = 0;

    int rc = ctx.call([&]() {
        handle = libssh2_sftp_open_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()),
                                      flags, mode, LIBSSH2_SFTP_OPENFILE);
        if (handle) return 0;
        int err = libssh2_session_last_errno(ctx.session);
        if (err == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return err == 0 ? -1 : err;
    });
    if (rc != 0 || !handle) {
        return sftp_failure<std::unique_ptr<RemoteFile>>(ctx, "open", path, rc, fx);
    }
    return Result<std::unique_ptr<RemoteFile>>::Ok(
        std::make_unique<Libssh2RemoteFile>(sftp_, handle, path));
}

Result<std::unique_ptr<RemoteFile>> Libssh2SftpChannel::open_read(const std::string& path) {
    return open_impl(path, LIBSSH2_FXF_READ, 0);
}

Result<std::unique_ptr<RemoteFile>> Libssh2SftpChannel::open_write(const std::string& path) {
    return open_impl(path, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                     LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                     LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
}

Result<void> Libssh2SftpChannel::mkdir(const std::string& path, int mode) {
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    unsigned long fx = 0;
    int rc = sftp_->ctx->call([&]() {
        int r = libssh2_sftp_mkdir_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()), mode);
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    if (rc != 0) return sftp_failure<void>(*sftp_->ctx, "mkdir", path, rc, fx);
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::rmdir(const std::string& path) {
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    unsigned long fx = 0;
    int rc = sftp_->ctx->call([&]() {
        int r = libssh2_sftp_rmdir_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()));
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    if (rc != 0) return sftp_failure<void>(*sftp_->ctx, "rmdir", path, rc, fx);
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::unlink(const std::string& path) {
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    unsigned long fx = 0;
    int rc = sftp_->ctx->call([&]() {
        int r = libssh2_sftp_unlink_ex(sftp, path.c_str(), static_cast<unsigned int>(path.size()));
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    if (rc != 0) return sftp_failure<void>(*sftp_->ctx, "unlink", path, rc, fx);
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::rename(const std::string& from, const std::string& to, bool overwrite) {
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;

    unsigned long fx = 0;
    int rc = sftp_->ctx->call([&]() {
        int r = libssh2_sftp_rename_ex(sftp,
                                       from.c_str(), static_cast<unsigned int>(from.size()),
                                       to.c_str(), static_cast<unsigned int>(to.size()),
                                       flags);
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    if (rc != 0) return sftp_failure<void>(*sftp_->ctx, "rename", from + " ->", rc, fx);
    return Result<void>::Ok();
}

// ── Libssh2RemoteFile ────────────────────────────────────────

Libssh2RemoteFile::Libssh2RemoteFile(std::shared_ptr<SftpSession> sftp, LIBSSH2_SFTP_HANDLE* handle,
                                     std::string path)
    : sftp_(std::move(sftp)), handle_(handle), path_(std::move(path)) {
}

Libssh2RemoteFile::~Libssh2RemoteFile() {
    if (!handle_) return;
    SshContext& ctx = *sftp_->ctx;
    if (ctx.lost) {
        std::lock_guard<std::mutex> lock(ctx.io_mutex);
        libssh2_sftp_close_handle(handle_);
        handle_ = nullptr;
        return;
    }
    auto r = close();
    if (r.is_err()) gateway_log_error("sftp: close " + path_, r);
}

Result<void> Libssh2RemoteFile::close() {
    if (!handle_) return Result<void>::Ok();
    SshContext& ctx = *sftp_->ctx;
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    unsigned long fx = 0;
    int rc = ctx.call([&]() {
        int r = libssh2_sftp_close_handle(handle_);
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    // The handle is gone either way; a retry would double-free it
    handle_ = nullptr;
    if (rc != 0) return sftp_failure<void>(ctx, "close", path_, rc, fx);
    return Result<void>::Ok();
}

Result<size_t> Libssh2RemoteFile::read(char* buf, size_t len) {
    SshContext& ctx = *sftp_->ctx;
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    unsigned long fx = 0;
    ssize_t got = 0;

    int rc = ctx.call([&]() {
        got = libssh2_sftp_read(handle_, buf, len);
        if (got >= 0) return 0;
        int r = static_cast<int>(got);
        if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
        return r;
    });
    if (rc != 0) return sftp_failure<size_t>(ctx, "read", path_, rc, fx);
    return Result<size_t>::Ok(static_cast<size_t>(got));
}

Result<void> Libssh2RemoteFile::write(const char* buf, size_t len) {
    SshContext& ctx = *sftp_->ctx;
    LIBSSH2_SFTP* sftp = sftp_->sftp;
    size_t off = 0;

    while (off < len) {
        unsigned long fx = 0;
        ssize_t wrote = 0;
        int rc = ctx.call([&]() {
            wrote = libssh2_sftp_write(handle_, buf + off, len - off);
            if (wrote >= 0) return 0;
            int r = static_cast<int>(wrote);
            if (r == LIBSSH2_ERROR_SFTP_PROTOCOL) fx = libssh2_sftp_last_error(sftp);
            return r;
        });
        if (rc != 0) return sftp_failure<void>(ctx, "write", path_, rc, fx);
        off += static_cast<size_t>(wrote);
    }
    return Result<void>::Ok();
}
