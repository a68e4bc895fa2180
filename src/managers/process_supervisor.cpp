#include "process_supervisor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <csignal>
#include <chrono>

PosixProcessSupervisor::~PosixProcessSupervisor() {
    // Never leave an orphan behind
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_.valid() && !handle_.poll_exit()) {
        gateway_log(fmt::format("ProcessSupervisor: terminating leftover pid {}", handle_.native_handle()));
        handle_.terminate(SERVER_GRACE_PERIOD_MS);
    }
}

Result<int> PosixProcessSupervisor::start(const LaunchSpec& spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_.valid() && !handle_.poll_exit()) {
        return Result<int>::Err(ErrorKind::ProcessLifecycle, "Process already running");
    }
    if (spec.program.empty()) {
        return Result<int>::Err(ErrorKind::ProcessLifecycle, "No program to launch");
    }

    handle_ = platform::spawn(spec.program, spec.args, spec.stderr_log, spec.stdin_payload);
    if (!handle_.valid()) {
        return Result<int>::Err(ErrorKind::ProcessLifecycle, "Failed to spawn " + spec.program);
    }
    return Result<int>::Ok(handle_.native_handle());
}

bool PosixProcessSupervisor::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.signal(sig);
}

std::optional<int> PosixProcessSupervisor::poll_exit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.poll_exit();
}

std::optional<int> PosixProcessSupervisor::wait(int timeout_ms) {
    // Poll in slices so the watcher thread is never locked out for long
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (auto code = poll_exit()) return code;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!handle_.valid()) return std::nullopt;
        }
        if (timeout_ms >= 0 && std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        platform::sleep_ms(20);
    }
}

int PosixProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.native_handle();
}

SupervisorFactory posix_supervisor_factory() {
    return []() -> std::unique_ptr<ProcessSupervisor> { return std::make_unique<PosixProcessSupervisor>(); };
}
