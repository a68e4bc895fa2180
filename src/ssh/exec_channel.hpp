#pragma once

#include <string>
#include "session.hpp"
#include "transport.hpp"

typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Session channel running a single command (no PTY, binary-clean).
class Libssh2ExecChannel : public ExecChannel {
public:
    Libssh2ExecChannel(SshContextPtr ctx, LIBSSH2_CHANNEL* channel);
    ~Libssh2ExecChannel() override;

    Result<void> exec(const std::string& command) override;
    Result<size_t> read(OutputStream stream, char* buf, size_t len) override;
    bool eof() override;
    void wait(int timeout_ms) override;
    Result<void> close() override;
    void abort() override;
    int exit_status() override { return exit_status_; }
    std::string exit_signal() override { return exit_signal_; }

private:
    void release();

    SshContextPtr ctx_;
    LIBSSH2_CHANNEL* channel_;
    int exit_status_ = 0;
    std::string exit_signal_;
};
