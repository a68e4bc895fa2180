#pragma once

#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <ssh/transport.hpp>
#include "connection_manager.hpp"

// File operations over SFTP channels obtained from the ConnectionManager.
// Each call opens its own channel, so file operations run independently of
// each other and of command execution. Paths are normalized on entry; every
// FileEntry carries the absolute normalized path.
//
// Nothing here retries: transport faults are reported to the
// ConnectionManager and surfaced as ConnectionLost.
class FileService {
public:
    explicit FileService(ConnectionManager& connection);

    // Directories first, then everything else; case-insensitive by name.
    Result<std::vector<FileEntry>> list(const std::string& path);
    // Reports a symlink as a symlink unless follow_links is set.
    Result<FileEntry> stat(const std::string& path, bool follow_links = false);

    Result<std::string> read(const std::string& path);

    // Temp-and-rename: the target is either the old or the new content.
    Result<void> write(const std::string& path, const std::string& content);

    Result<void> create_directory(const std::string& path);
    Result<void> create_file(const std::string& path);

    // Recursive for directories; symlinks are removed, never followed.
    Result<void> remove(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);

    // Streams `in` to remote_path in bounded chunks (temp-and-rename).
    Result<TransferReport> upload(std::istream& in, const std::string& remote_path,
                                  const CancelToken* cancel = nullptr);

    // Streams remote_path into sink. IsADirectory for directories.
    Result<TransferReport> download(const std::string& remote_path, const ByteSink& sink,
                                    const CancelToken* cancel = nullptr);

    // Zip stream of a directory tree, entries relative to remote_path.
    // Unreadable entries become warnings; the root must be a readable directory.
    Result<ArchiveReport> archive_directory(const std::string& remote_path, const ByteSink& sink,
                                            const CancelToken* cancel = nullptr);

private:
    // Fills buf, returns bytes produced (0 = end of input).
    using ChunkSource = std::function<Result<size_t>(char* buf, size_t len)>;

    Result<std::unique_ptr<SftpChannel>> channel();
    Result<std::string> checked_path(const std::string& path);

    // Report transport faults to the ConnectionManager and pass the result through.
    template <typename T>
    Result<T> track(Result<T> result);

    Result<uint64_t> store(SftpChannel& sftp, const std::string& target,
                           const ChunkSource& source, const CancelToken* cancel);
    Result<void> replace(SftpChannel& sftp, const std::string& temp, const std::string& target);
    Result<void> remove_tree(SftpChannel& sftp, const std::string& path, const RemoteAttrs& attrs);

    ConnectionManager& connection_;
};

FileEntry make_entry(const std::string& path, const RemoteAttrs& attrs);

// Directories first, then case-insensitive by name.
void sort_entries(std::vector<FileEntry>& entries);

template <typename T>
Result<T> FileService::track(Result<T> result) {
    if (result.is_err() && result.kind == ErrorKind::ConnectionLost) {
        connection_.report_fault(result.error);
    }
    return result;
}
