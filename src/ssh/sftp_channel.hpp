#pragma once

#include <memory>
#include <string>
#include "session.hpp"
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

// One SFTP subsystem instance; shut down when the channel and every file
// opened through it are gone.
struct SftpSession {
    SshContextPtr ctx;
    LIBSSH2_SFTP* sftp = nullptr;

    SftpSession(SshContextPtr c, LIBSSH2_SFTP* s) : ctx(std::move(c)), sftp(s) {}
    ~SftpSession();
    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;
};

class Libssh2SftpChannel : public SftpChannel {
public:
    Libssh2SftpChannel(SshContextPtr ctx, LIBSSH2_SFTP* sftp);

    Result<RemoteAttrs> stat(const std::string& path) override;
    Result<RemoteAttrs> lstat(const std::string& path) override;
    Result<std::vector<RemoteDirEntry>> list(const std::string& path) override;

    Result<std::unique_ptr<RemoteFile>> open_read(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open_write(const std::string& path) override;

    Result<void> mkdir(const std::string& path, int mode) override;
    Result<void> rmdir(const std::string& path) override;
    Result<void> unlink(const std::string& path) override;
    Result<void> rename(const std::string& from, const std::string& to, bool overwrite) override;

private:
    Result<RemoteAttrs> stat_impl(const std::string& path, int stat_type);
    Result<std::unique_ptr<RemoteFile>> open_impl(const std::string& path, unsigned long flags, long mode);

    std::shared_ptr<SftpSession> sftp_;
};

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(std::shared_ptr<SftpSession> sftp, LIBSSH2_SFTP_HANDLE* handle, std::string path);
    ~Libssh2RemoteFile() override;

    Result<size_t> read(char* buf, size_t len) override;
    Result<void> write(const char* buf, size_t len) override;
    Result<void> close() override;

private:
    std::shared_ptr<SftpSession> sftp_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};
