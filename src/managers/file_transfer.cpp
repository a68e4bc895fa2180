#include "file_service.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/remote_path.hpp>
#include <algorithm>
#include <cstring>
#include <vector>

static std::string temp_name_for(const std::string& target) {
    return RemotePath::join(RemotePath::parent(target),
                            "." + RemotePath::basename(target) + TEMP_UPLOAD_TAG + "-" + random_hex(6));
}

// Move temp over target. Servers that refuse overwrite-rename get the
// unlink-then-rename fallback; a crash in between leaves no target, never a
// half-written one.
Result<void> FileService::replace(SftpChannel& sftp, const std::string& temp, const std::string& target) {
    auto renamed = track(sftp.rename(temp, target, true));
    if (renamed.is_ok() || renamed.kind == ErrorKind::ConnectionLost) return renamed;

    auto existing = track(sftp.lstat(target));
    if (existing.is_err()) {
        if (existing.kind != ErrorKind::PathNotFound) return Result<void>::Err(existing);
        return renamed;
    }
    if (existing.value.kind == FileKind::Directory) {
        return Result<void>::Err(ErrorKind::IsADirectory, target + " is a directory");
    }

    gateway_log("FileService: overwrite rename refused, falling back to unlink+rename for " + target);
    auto unlinked = track(sftp.unlink(target));
    if (unlinked.is_err()) return unlinked;
    return track(sftp.rename(temp, target, false));
}

Result<uint64_t> FileService::store(SftpChannel& sftp, const std::string& target,
                                    const ChunkSource& source, const CancelToken* cancel) {
    using R = Result<uint64_t>;

    // The target must not be a directory; anything else is replaced
    auto existing = track(sftp.stat(target));
    if (existing.is_ok() && existing.value.kind == FileKind::Directory) {
        return R::Err(ErrorKind::IsADirectory, target + " is a directory");
    }
    if (existing.is_err() && existing.kind != ErrorKind::PathNotFound) {
        return R::Err(existing);
    }

    std::string temp = temp_name_for(target);
    auto file = track(sftp.open_write(temp));
    if (file.is_err()) return R::Err(file);

    uint64_t total = 0;
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    R failure = R::Ok(0);

    while (true) {
        if (is_cancelled(cancel)) {
            failure = R::Err(ErrorKind::Cancelled, "Upload to " + target + " cancelled");
            break;
        }
        auto n = source(buf.data(), buf.size());
        if (n.is_err()) {
            failure = R::Err(n);
            break;
        }
        if (n.value == 0) break;

        auto w = track(file.value->write(buf.data(), n.value));
        if (w.is_err()) {
            failure = R::Err(w);
            break;
        }
        total += n.value;
    }

    // Close before rename; a failed close means the data may not be on disk
    auto closed = track(file.value->close());
    file.value.reset();
    if (failure.is_ok() && closed.is_err()) failure = R::Err(closed);

    if (failure.is_ok()) {
        auto moved = replace(sftp, temp, target);
        if (moved.is_ok()) return R::Ok(total);
        failure = R::Err(moved);
    }

    if (failure.kind == ErrorKind::ConnectionLost) {
        gateway_log("FileService: transport lost, temp left behind: " + temp);
    } else {
        auto cleaned = sftp.unlink(temp);
        if (cleaned.is_err() && cleaned.kind != ErrorKind::PathNotFound) {
            gateway_log_error("FileService: could not remove temp " + temp, cleaned);
        }
    }
    return failure;
}

// ── Whole-file read / write ──────────────────────────────────

Result<std::string> FileService::read(const std::string& path) {
    using R = Result<std::string>;
    auto p = checked_path(path);
    if (p.is_err()) return R::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return R::Err(sftp);

    auto attrs = track(sftp.value->stat(p.value));
    if (attrs.is_err()) return R::Err(attrs);
    if (attrs.value.kind == FileKind::Directory) {
        return R::Err(ErrorKind::IsADirectory, p.value + " is a directory");
    }

    auto file = track(sftp.value->open_read(p.value));
    if (file.is_err()) return R::Err(file);

    std::string content;
    content.reserve(static_cast<size_t>(attrs.value.size));
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    while (true) {
        auto n = track(file.value->read(buf.data(), buf.size()));
        if (n.is_err()) return R::Err(n);
        if (n.value == 0) break;
        content.append(buf.data(), n.value);
    }
    return R::Ok(std::move(content));
}

Result<void> FileService::write(const std::string& path, const std::string& content) {
    auto p = checked_path(path);
    if (p.is_err()) return Result<void>::Err(p);
    if (p.value == "/") return Result<void>::Err(ErrorKind::IsADirectory, "/ is a directory");
    auto sftp = channel();
    if (sftp.is_err()) return Result<void>::Err(sftp);

    size_t offset = 0;
    ChunkSource source = [&](char* buf, size_t len) {
        size_t n = std::min(len, content.size() - offset);
        std::memcpy(buf, content.data() + offset, n);
        offset += n;
        return Result<size_t>::Ok(n);
    };

    auto stored = store(*sftp.value, p.value, source, nullptr);
    if (stored.is_err()) return Result<void>::Err(stored);
    gateway_log(fmt::format("FileService: wrote {} ({} bytes)", p.value, stored.value));
    return Result<void>::Ok();
}

// ── Streaming transfers ──────────────────────────────────────

Result<TransferReport> FileService::upload(std::istream& in, const std::string& remote_path,
                                           const CancelToken* cancel) {
    using R = Result<TransferReport>;
    auto p = checked_path(remote_path);
    if (p.is_err()) return R::Err(p);
    if (p.value == "/") return R::Err(ErrorKind::IsADirectory, "/ is a directory");
    auto sftp = channel();
    if (sftp.is_err()) return R::Err(sftp);

    ChunkSource source = [&](char* buf, size_t len) {
        in.read(buf, static_cast<std::streamsize>(len));
        if (in.bad()) {
            return Result<size_t>::Err(ErrorKind::OperationFailed, "Failed reading upload source");
        }
        return Result<size_t>::Ok(static_cast<size_t>(in.gcount()));
    };

    auto stored = store(*sftp.value, p.value, source, cancel);
    if (stored.is_err()) {
        gateway_log_error("FileService: upload " + p.value, stored);
        return R::Err(stored);
    }
    gateway_log(fmt::format("FileService: uploaded {} ({} bytes)", p.value, stored.value));
    TransferReport report;
    report.bytes = stored.value;
    return R::Ok(report);
}

Result<TransferReport> FileService::download(const std::string& remote_path, const ByteSink& sink,
                                             const CancelToken* cancel) {
    using R = Result<TransferReport>;
    auto p = checked_path(remote_path);
    if (p.is_err()) return R::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return R::Err(sftp);

    auto attrs = track(sftp.value->stat(p.value));
    if (attrs.is_err()) return R::Err(attrs);
    if (attrs.value.kind == FileKind::Directory) {
        return R::Err(ErrorKind::IsADirectory, p.value + " is a directory");
    }

    auto file = track(sftp.value->open_read(p.value));
    if (file.is_err()) return R::Err(file);

    TransferReport report;
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    while (true) {
        if (is_cancelled(cancel)) {
            return R::Err(ErrorKind::Cancelled, "Download of " + p.value + " cancelled");
        }
        auto n = track(file.value->read(buf.data(), buf.size()));
        if (n.is_err()) return R::Err(n);
        if (n.value == 0) break;
        if (!sink(buf.data(), n.value)) {
            return R::Err(ErrorKind::Cancelled, "Download of " + p.value + " aborted by receiver");
        }
        report.bytes += n.value;
    }

    gateway_log(fmt::format("FileService: downloaded {} ({} bytes)", p.value, report.bytes));
    return R::Ok(report);
}
