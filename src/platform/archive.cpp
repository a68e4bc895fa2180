#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <cerrno>

namespace platform {

ZipStreamWriter::ZipStreamWriter(ByteSink sink) : sink_(std::move(sink)) {}

ZipStreamWriter::~ZipStreamWriter() {
    if (archive_) {
        // Abandoned mid-stream: drop the writer without finishing the archive
        archive_write_free(archive_);
        archive_ = nullptr;
    }
}

bool ZipStreamWriter::deliver(const void* buf, size_t len) {
    if (sink_aborted_) return false;
    if (!sink_(static_cast<const char*>(buf), len)) {
        sink_aborted_ = true;
        return false;
    }
    bytes_written_ += len;
    return true;
}

static la_ssize_t zip_write_cb(struct archive* a, void* client, const void* buf, size_t len) {
    auto* writer = static_cast<ZipStreamWriter*>(client);
    if (!writer->deliver(buf, len)) {
        archive_set_error(a, ECANCELED, "archive sink closed");
        return -1;
    }
    return static_cast<la_ssize_t>(len);
}

Result<void> ZipStreamWriter::fail(const std::string& what) {
    std::string err = what;
    if (archive_ && archive_error_string(archive_)) {
        err += ": ";
        err += archive_error_string(archive_);
    }
    if (sink_aborted_) return Result<void>::Err(ErrorKind::Cancelled, err);
    return Result<void>::Err(ErrorKind::Archive, err);
}

Result<void> ZipStreamWriter::open() {
    archive_ = archive_write_new();
    if (!archive_) return Result<void>::Err(ErrorKind::Archive, "Failed to create archive writer");

    archive_write_set_format_zip(archive_);
    archive_write_zip_set_compression_deflate(archive_);
    // No blocking: every write goes straight to the sink and nothing pads the tail
    archive_write_set_bytes_per_block(archive_, 0);
    archive_write_set_bytes_in_last_block(archive_, 1);

    if (archive_write_open(archive_, this, nullptr, zip_write_cb, nullptr) != ARCHIVE_OK) {
        return fail("Failed to open zip stream");
    }
    open_ = true;
    return Result<void>::Ok();
}

Result<void> ZipStreamWriter::add_directory(const std::string& name, int64_t mtime, uint32_t perm) {
    if (!open_) return Result<void>::Err(ErrorKind::Archive, "Zip stream is not open");
    if (in_entry_) {
        auto r = end_file();
        if (r.is_err()) return r;
    }

    std::string dir_name = name;
    if (dir_name.empty() || dir_name.back() != '/') dir_name += '/';

    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, dir_name.c_str());
    archive_entry_set_filetype(entry, AE_IFDIR);
    archive_entry_set_perm(entry, perm ? perm : 0755);
    archive_entry_set_mtime(entry, mtime, 0);
    archive_entry_set_size(entry, 0);

    int rc = archive_write_header(archive_, entry);
    archive_entry_free(entry);
    if (rc < ARCHIVE_WARN) return fail("Failed to add " + dir_name);
    return Result<void>::Ok();
}

Result<void> ZipStreamWriter::begin_file(const std::string& name, int64_t mtime, uint32_t perm) {
    if (!open_) return Result<void>::Err(ErrorKind::Archive, "Zip stream is not open");
    if (in_entry_) {
        auto r = end_file();
        if (r.is_err()) return r;
    }

    struct archive_entry* entry = archive_entry_new();
    archive_entry_set_pathname(entry, name.c_str());
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, perm ? perm : 0644);
    archive_entry_set_mtime(entry, mtime, 0);
    // Size left unset: length goes in the data descriptor after the data

    int rc = archive_write_header(archive_, entry);
    archive_entry_free(entry);
    if (rc < ARCHIVE_WARN) return fail("Failed to add " + name);
    in_entry_ = true;
    return Result<void>::Ok();
}

Result<void> ZipStreamWriter::write(const char* data, size_t len) {
    if (!in_entry_) return Result<void>::Err(ErrorKind::Archive, "No open zip entry");
    size_t off = 0;
    while (off < len) {
        la_ssize_t n = archive_write_data(archive_, data + off, len - off);
        if (n < 0) return fail("Failed to write zip data");
        if (n == 0) return fail("Zip writer made no progress");
        off += static_cast<size_t>(n);
    }
    return Result<void>::Ok();
}

Result<void> ZipStreamWriter::end_file() {
    if (!in_entry_) return Result<void>::Ok();
    in_entry_ = false;
    if (archive_write_finish_entry(archive_) < ARCHIVE_WARN) {
        return fail("Failed to finish zip entry");
    }
    return Result<void>::Ok();
}

Result<void> ZipStreamWriter::close() {
    if (!archive_) return Result<void>::Ok();

    Result<void> result = Result<void>::Ok();
    if (in_entry_) result = end_file();
    if (result.is_ok() && open_ && archive_write_close(archive_) != ARCHIVE_OK) {
        result = fail("Failed to finish zip archive");
    }
    archive_write_free(archive_);
    archive_ = nullptr;
    open_ = false;
    return result;
}

} // namespace platform
