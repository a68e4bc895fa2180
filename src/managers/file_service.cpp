#include "file_service.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/remote_path.hpp>
#include <algorithm>

FileEntry make_entry(const std::string& path, const RemoteAttrs& attrs) {
    FileEntry entry;
    entry.path = path;
    entry.name = RemotePath::basename(path);
    if (entry.name.empty()) entry.name = "/";
    entry.kind = attrs.kind;
    entry.size = attrs.size;
    entry.mtime = attrs.mtime;
    entry.permissions = attrs.permissions;
    return entry;
}

void sort_entries(std::vector<FileEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.is_dir() != b.is_dir()) return a.is_dir();
        std::string la = to_lower(a.name);
        std::string lb = to_lower(b.name);
        if (la != lb) return la < lb;
        return a.name < b.name;
    });
}

FileService::FileService(ConnectionManager& connection) : connection_(connection) {}

Result<std::unique_ptr<SftpChannel>> FileService::channel() {
    return connection_.open_sftp();
}

Result<std::string> FileService::checked_path(const std::string& path) {
    if (path.empty()) {
        return Result<std::string>::Err(ErrorKind::InvalidArgument, "Path must not be empty");
    }
    return Result<std::string>::Ok(RemotePath::normalize(path));
}

// ── Browsing ─────────────────────────────────────────────────

Result<std::vector<FileEntry>> FileService::list(const std::string& path) {
    using R = Result<std::vector<FileEntry>>;
    auto p = checked_path(path);
    if (p.is_err()) return R::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return R::Err(sftp);

    auto raw = track(sftp.value->list(p.value));
    if (raw.is_err()) return R::Err(raw);

    std::vector<FileEntry> entries;
    entries.reserve(raw.value.size());
    for (const auto& e : raw.value) {
        entries.push_back(make_entry(RemotePath::join(p.value, e.name), e.attrs));
    }
    sort_entries(entries);
    return R::Ok(std::move(entries));
}

Result<FileEntry> FileService::stat(const std::string& path, bool follow_links) {
    auto p = checked_path(path);
    if (p.is_err()) return Result<FileEntry>::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return Result<FileEntry>::Err(sftp);

    auto attrs = track(follow_links ? sftp.value->stat(p.value) : sftp.value->lstat(p.value));
    if (attrs.is_err()) return Result<FileEntry>::Err(attrs);
    return Result<FileEntry>::Ok(make_entry(p.value, attrs.value));
}

// ── Mutations ────────────────────────────────────────────────

Result<void> FileService::create_directory(const std::string& path) {
    auto p = checked_path(path);
    if (p.is_err()) return Result<void>::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return Result<void>::Err(sftp);

    auto existing = track(sftp.value->lstat(p.value));
    if (existing.is_ok()) {
        return Result<void>::Err(ErrorKind::OperationFailed, p.value + " already exists");
    }
    if (existing.kind != ErrorKind::PathNotFound) return Result<void>::Err(existing);

    auto r = track(sftp.value->mkdir(p.value, 0755));
    if (r.is_ok()) gateway_log("FileService: mkdir " + p.value);
    return r;
}

Result<void> FileService::create_file(const std::string& path) {
    auto p = checked_path(path);
    if (p.is_err()) return Result<void>::Err(p);
    auto sftp = channel();
    if (sftp.is_err()) return Result<void>::Err(sftp);

    auto existing = track(sftp.value->lstat(p.value));
    if (existing.is_ok()) {
        return Result<void>::Err(ErrorKind::OperationFailed, p.value + " already exists");
    }
    if (existing.kind != ErrorKind::PathNotFound) return Result<void>::Err(existing);

    auto file = track(sftp.value->open_write(p.value));
    if (file.is_err()) return Result<void>::Err(file);
    gateway_log("FileService: touch " + p.value);
    return Result<void>::Ok();
}

Result<void> FileService::remove_tree(SftpChannel& sftp, const std::string& path, const RemoteAttrs& attrs) {
    if (attrs.kind != FileKind::Directory) {
        return track(sftp.unlink(path));
    }

    auto children = track(sftp.list(path));
    if (children.is_err()) return Result<void>::Err(children);

    for (const auto& child : children.value) {
        auto r = remove_tree(sftp, RemotePath::join(path, child.name), child.attrs);
        if (r.is_err()) return r;
    }
    return track(sftp.rmdir(path));
}

Result<void> FileService::remove(const std::string& path) {
    auto p = checked_path(path);
    if (p.is_err()) return Result<void>::Err(p);
    if (p.value == "/") {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Refusing to remove /");
    }
    auto sftp = channel();
    if (sftp.is_err()) return Result<void>::Err(sftp);

    auto attrs = track(sftp.value->lstat(p.value));
    if (attrs.is_err()) return Result<void>::Err(attrs);

    auto r = remove_tree(*sftp.value, p.value, attrs.value);
    if (r.is_ok()) gateway_log("FileService: removed " + p.value);
    return r;
}

Result<void> FileService::rename(const std::string& from, const std::string& to) {
    auto src = checked_path(from);
    if (src.is_err()) return Result<void>::Err(src);
    auto dst = checked_path(to);
    if (dst.is_err()) return Result<void>::Err(dst);
    if (src.value == "/" || dst.value == "/") {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Cannot rename /");
    }
    if (src.value == dst.value) return Result<void>::Ok();

    auto sftp = channel();
    if (sftp.is_err()) return Result<void>::Err(sftp);

    auto existing = track(sftp.value->lstat(dst.value));
    if (existing.is_ok()) {
        return Result<void>::Err(ErrorKind::OperationFailed, dst.value + " already exists");
    }
    if (existing.kind != ErrorKind::PathNotFound) return Result<void>::Err(existing);

    auto r = track(sftp.value->rename(src.value, dst.value, false));
    if (r.is_ok()) gateway_log("FileService: renamed " + src.value + " -> " + dst.value);
    return r;
}
