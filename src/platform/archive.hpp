#pragma once

#include <cstdint>
#include <string>
#include <core/types.hpp>

struct archive;

namespace platform {

// Streams a zip archive (deflate) into a ByteSink as entries are added.
// Entry sizes are not known up front, so every file entry is written with a
// trailing data descriptor and nothing has to be buffered.
class ZipStreamWriter {
public:
    explicit ZipStreamWriter(ByteSink sink);
    ~ZipStreamWriter();

    ZipStreamWriter(const ZipStreamWriter&) = delete;
    ZipStreamWriter& operator=(const ZipStreamWriter&) = delete;

    Result<void> open();

    // name must already be relative; a trailing "/" is added if missing.
    Result<void> add_directory(const std::string& name, int64_t mtime, uint32_t perm);

    Result<void> begin_file(const std::string& name, int64_t mtime, uint32_t perm);
    Result<void> write(const char* data, size_t len);
    Result<void> end_file();

    // Writes the central directory. Safe to call more than once.
    Result<void> close();

    uint64_t bytes_written() const { return bytes_written_; }

    // True once the sink has refused data.
    bool sink_aborted() const { return sink_aborted_; }

    // Hands encoded bytes to the sink (libarchive write callback target).
    bool deliver(const void* buf, size_t len);

private:
    Result<void> fail(const std::string& what);

    ByteSink sink_;
    struct archive* archive_ = nullptr;
    uint64_t bytes_written_ = 0;
    bool sink_aborted_ = false;
    bool open_ = false;
    bool in_entry_ = false;
};

} // namespace platform
