#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Reap if already finished so no zombie is left behind
    if (pid_ > 0 && !exit_code_) poll_exit();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_) {
    other.pid_ = -1;
    other.exit_code_.reset();
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        // The child this handle owned is stopped and reaped, never orphaned
        terminate();
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        other.pid_ = -1;
        other.exit_code_.reset();
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::running() {
    if (pid_ <= 0) return false;
    return !poll_exit().has_value();
}

std::optional<int> ProcessHandle::poll_exit() {
    if (exit_code_) return exit_code_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exit_code_ = decode_status(status);
    } else if (ret < 0 && errno == ECHILD) {
        // Reaped elsewhere; status is unknown
        exit_code_ = -1;
    }
    return exit_code_;
}

std::optional<int> ProcessHandle::wait(int timeout_ms) {
    if (exit_code_) return exit_code_;
    if (pid_ <= 0) return std::nullopt;

    if (timeout_ms < 0) {
        int status = 0;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        exit_code_ = (ret == pid_) ? decode_status(status) : -1;
        return exit_code_;
    }

    // Poll with timeout
    int elapsed = 0;
    while (true) {
        if (poll_exit()) return exit_code_;
        if (elapsed >= timeout_ms) break;
        sleep_ms(20);
        elapsed += 20;
    }
    return std::nullopt;  // timed out
}

bool ProcessHandle::signal(int sig) {
    if (pid_ <= 0 || exit_code_) return false;
    return kill(pid_, sig) == 0;
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || poll_exit()) return;
    kill(pid_, SIGTERM);
    if (wait(grace_ms)) return;
    kill(pid_, SIGKILL);
    wait(-1);
}

// ── spawn ────────────────────────────────────────────────────

static void write_all(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t w = write(fd, data.data() + off, data.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return;  // child closed stdin early; exit status reports the rest
        }
        off += static_cast<size_t>(w);
    }
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stderr_log,
                    const std::string& stdin_payload) {
    ProcessHandle handle;

    int in_pipe[2] = {-1, -1};
    if (!stdin_payload.empty() && pipe(in_pipe) != 0) return handle;

    long max_fd = sysconf(_SC_OPEN_MAX);
    if (max_fd < 0 || max_fd > 65536) max_fd = 65536;

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        if (in_pipe[0] >= 0) { close(in_pipe[0]); close(in_pipe[1]); }
        return handle;
    }

    if (pid == 0) {
        // Child process
        if (in_pipe[0] >= 0) {
            close(in_pipe[1]);
            dup2(in_pipe[0], STDIN_FILENO);
            close(in_pipe[0]);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                if (devnull != STDIN_FILENO) close(devnull);
            }
        }

        if (!stderr_log.empty()) {
            int fd = open(stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }

        // Sockets and files of the parent (listeners, SSH sessions) stay with the parent
        for (int fd = STDERR_FILENO + 1; fd < max_fd; fd++) close(fd);

        // Own process group so terminal signals aimed at the parent don't hit it
        setpgid(0, 0);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    handle.pid_ = pid;
    if (in_pipe[1] >= 0) {
        close(in_pipe[0]);
        // A dead reader must not take this process down with SIGPIPE
        struct sigaction ign{}, old{};
        ign.sa_handler = SIG_IGN;
        sigemptyset(&ign.sa_mask);
        sigaction(SIGPIPE, &ign, &old);
        write_all(in_pipe[1], stdin_payload);
        close(in_pipe[1]);
        sigaction(SIGPIPE, &old, nullptr);
    }
    return handle;
}

} // namespace platform
