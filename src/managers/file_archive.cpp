#include "file_service.hpp"
#include <core/log.hpp>
#include <platform/archive.hpp>
#include <util/remote_path.hpp>
#include <algorithm>
#include <vector>

namespace {

// Depth-first walk of one remote tree into a zip stream.
class ArchiveWalk {
public:
    ArchiveWalk(SftpChannel& sftp, platform::ZipStreamWriter& zip, ArchiveReport& report,
                const CancelToken* cancel)
        : sftp_(sftp), zip_(zip), report_(report), cancel_(cancel), buf_(SFTP_CHUNK_SIZE) {}

    // Fatal errors only (transport lost, sink gone, cancelled, zip writer broken).
    Result<void> walk(const std::string& dir, const std::string& rel_prefix,
                      std::vector<RemoteDirEntry> entries) {
        std::sort(entries.begin(), entries.end(), [](const RemoteDirEntry& a, const RemoteDirEntry& b) {
            return a.name < b.name;
        });

        for (const auto& entry : entries) {
            if (is_cancelled(cancel_)) {
                return Result<void>::Err(ErrorKind::Cancelled, "Archive cancelled");
            }

            std::string path = RemotePath::join(dir, entry.name);
            std::string rel = rel_prefix + entry.name;
            RemoteAttrs attrs = entry.attrs;

            if (attrs.kind == FileKind::Symlink) {
                auto target = sftp_.stat(path);
                if (target.is_err()) {
                    if (target.kind == ErrorKind::ConnectionLost) return Result<void>::Err(target);
                    warn(rel, "dangling symlink skipped");
                    continue;
                }
                if (target.value.kind == FileKind::Directory) {
                    warn(rel, "symlinked directory skipped");
                    continue;
                }
                attrs = target.value;
            }

            if (attrs.kind == FileKind::Directory) {
                auto children = sftp_.list(path);
                if (children.is_err()) {
                    if (children.kind == ErrorKind::ConnectionLost) return Result<void>::Err(children);
                    warn(rel + "/", children.error);
                    continue;
                }
                auto added = zip_.add_directory(rel + "/", attrs.mtime, attrs.permissions);
                if (added.is_err()) return added;
                report_.entries++;

                auto r = walk(path, rel + "/", std::move(children.value));
                if (r.is_err()) return r;
            } else if (attrs.kind == FileKind::File) {
                auto r = add_file(path, rel, attrs);
                if (r.is_err()) return r;
            } else {
                warn(rel, "special file skipped");
            }
        }
        return Result<void>::Ok();
    }

private:
    Result<void> add_file(const std::string& path, const std::string& rel, const RemoteAttrs& attrs) {
        auto file = sftp_.open_read(path);
        if (file.is_err()) {
            if (file.kind == ErrorKind::ConnectionLost) return Result<void>::Err(file);
            warn(rel, file.error);
            return Result<void>::Ok();
        }

        auto begun = zip_.begin_file(rel, attrs.mtime, attrs.permissions);
        if (begun.is_err()) return begun;
        report_.entries++;

        while (true) {
            if (is_cancelled(cancel_)) {
                return Result<void>::Err(ErrorKind::Cancelled, "Archive cancelled");
            }
            auto n = file.value->read(buf_.data(), buf_.size());
            if (n.is_err()) {
                if (n.kind == ErrorKind::ConnectionLost) return Result<void>::Err(n);
                // Entry already started; it stays in the archive truncated
                warn(rel, "read failed mid-file, entry truncated: " + n.error);
                break;
            }
            if (n.value == 0) break;
            auto w = zip_.write(buf_.data(), n.value);
            if (w.is_err()) return w;
        }
        return zip_.end_file();
    }

    void warn(const std::string& rel, const std::string& why) {
        report_.warnings.push_back(rel + ": " + why);
        gateway_log("FileService: archive warning " + rel + ": " + why);
    }

    SftpChannel& sftp_;
    platform::ZipStreamWriter& zip_;
    ArchiveReport& report_;
    const CancelToken* cancel_;
    std::vector<char> buf_;
};

} // namespace

Result<ArchiveReport> FileService::archive_directory(const std::string& remote_path, const ByteSink& sink,
                                                     const CancelToken* cancel) {
    using R = Result<ArchiveReport>;
    auto p = checked_path(remote_path);
    if (p.is_err()) return R::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return R::Err(sftp);

    // Root checks: missing → PathNotFound, anything else wrong → Archive
    auto root = track(sftp.value->stat(p.value));
    if (root.is_err()) {
        if (root.kind == ErrorKind::PathNotFound || root.kind == ErrorKind::ConnectionLost) {
            return R::Err(root);
        }
        return R::Err(ErrorKind::Archive, "Cannot archive " + p.value + ": " + root.error);
    }
    if (root.value.kind != FileKind::Directory) {
        return R::Err(ErrorKind::Archive, p.value + " is not a directory");
    }
    auto top = track(sftp.value->list(p.value));
    if (top.is_err()) {
        if (top.kind == ErrorKind::ConnectionLost) return R::Err(top);
        return R::Err(ErrorKind::Archive, "Cannot read " + p.value + ": " + top.error);
    }

    ArchiveReport report;
    report.root = p.value;

    platform::ZipStreamWriter zip([&](const char* data, size_t len) {
        if (is_cancelled(cancel)) return false;
        return sink(data, len);
    });
    auto opened = zip.open();
    if (opened.is_err()) return R::Err(opened);

    ArchiveWalk walker(*sftp.value, zip, report, cancel);
    auto walked = track(walker.walk(p.value, "", std::move(top.value)));
    if (walked.is_err()) {
        gateway_log_error("FileService: archive of " + p.value + " aborted", walked);
        return R::Err(walked);
    }

    auto closed = zip.close();
    if (closed.is_err()) return R::Err(closed);

    report.bytes = zip.bytes_written();
    gateway_log(fmt::format("FileService: archived {} ({} entries, {} bytes, {} warnings)",
                            p.value, report.entries, report.bytes, report.warnings.size()));
    return R::Ok(std::move(report));
}
