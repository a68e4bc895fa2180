#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/process.hpp>

// What to run for the embedded server.
struct LaunchSpec {
    std::string program;
    std::vector<std::string> args;
    std::string stdin_payload;      // handed to the child on stdin, then closed
    std::string stderr_log;         // child's stderr is appended here when set
};

// Process lifecycle capability used by the ServerController.
// Implementations must be safe to call from the controller and its watcher
// thread at the same time.
class ProcessSupervisor {
public:
    virtual ~ProcessSupervisor() = default;

    // Spawn the child; returns its pid.
    virtual Result<int> start(const LaunchSpec& spec) = 0;

    // False if the child is gone.
    virtual bool signal(int sig) = 0;

    // Exit code once exited, nullopt if still running after timeout_ms (-1 = forever).
    virtual std::optional<int> wait(int timeout_ms) = 0;

    // Non-blocking exit check; the code is cached after the first reap.
    virtual std::optional<int> poll_exit() = 0;

    virtual int pid() const = 0;
};

using SupervisorFactory = std::function<std::unique_ptr<ProcessSupervisor>()>;

// fork/exec supervisor built on platform::ProcessHandle.
class PosixProcessSupervisor : public ProcessSupervisor {
public:
    PosixProcessSupervisor() = default;
    ~PosixProcessSupervisor() override;

    Result<int> start(const LaunchSpec& spec) override;
    bool signal(int sig) override;
    std::optional<int> wait(int timeout_ms) override;
    std::optional<int> poll_exit() override;
    int pid() const override;

private:
    mutable std::mutex mutex_;
    platform::ProcessHandle handle_;
};

SupervisorFactory posix_supervisor_factory();
