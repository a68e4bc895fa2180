#pragma once

#include <optional>
#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process (POSIX).
// The exit status is cached once the child has been reaped, so poll_exit()
// and wait() can be called repeatedly.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    // Terminates and reaps a child still owned by this handle first.
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running.
    bool running();

    // Non-blocking reap. Returns the exit code once the child has exited
    // (128 + signal number when killed by a signal).
    std::optional<int> poll_exit();

    // Wait for the process to exit. timeout_ms = -1 means indefinite wait.
    // Returns nullopt if it is still running when the timeout expires.
    std::optional<int> wait(int timeout_ms = -1);

    // Deliver a signal. False if the process is gone or invalid.
    bool signal(int sig);

    // SIGTERM, wait up to grace_ms, then SIGKILL and reap.
    void terminate(int grace_ms = 2000);

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    std::optional<int> exit_code_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stderr_log,
                               const std::string& stdin_payload);
};

// Spawn a child process.
// stderr_log: if non-empty, redirect child's stderr to this file (append mode).
// stdin_payload: written to the child's stdin through a pipe, which is then
// closed. When empty the child's stdin is /dev/null.
// The child inherits only stdin, stdout and stderr.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log = "",
                    const std::string& stdin_payload = "");

} // namespace platform
