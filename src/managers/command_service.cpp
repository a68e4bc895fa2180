#include "command_service.hpp"
#include <core/log.hpp>
#include <chrono>
#include <vector>

CommandService::CommandService(ConnectionManager& connection, int default_timeout_secs)
    : connection_(connection),
      default_timeout_secs_(default_timeout_secs > 0 ? default_timeout_secs : SSH_CMD_TIMEOUT_SECS) {
}

// ── FIFO queue ───────────────────────────────────────────────

CommandService::Turn::Turn(CommandService& service) : service_(service) {
    std::unique_lock<std::mutex> lock(service_.queue_mutex_);
    uint64_t ticket = service_.next_ticket_++;
    service_.queue_cv_.wait(lock, [&]() { return service_.now_serving_ == ticket; });
}

CommandService::Turn::~Turn() {
    {
        std::lock_guard<std::mutex> lock(service_.queue_mutex_);
        service_.now_serving_++;
    }
    service_.queue_cv_.notify_all();
}

int CommandService::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return static_cast<int>(next_ticket_ - now_serving_);
}

// ── Execution ────────────────────────────────────────────────

Result<CommandResult> CommandService::execute(const std::string& command, int timeout_secs) {
    return run(command, timeout_secs, nullptr, nullptr);
}

Result<CommandResult> CommandService::execute_streaming(const std::string& command, int timeout_secs,
                                                        const OutputCallback& on_chunk,
                                                        const CancelToken* cancel) {
    return run(command, timeout_secs, &on_chunk, cancel);
}

Result<CommandResult> CommandService::run(const std::string& command, int timeout_secs,
                                          const OutputCallback* on_chunk, const CancelToken* cancel) {
    using R = Result<CommandResult>;

    if (command.empty()) {
        return R::Err(ErrorKind::InvalidArgument, "Command must not be empty");
    }
    // Fail fast instead of queueing behind others when there is no session
    if (!connection_.is_connected()) {
        return R::Err(ErrorKind::ConnectionLost, "No active session");
    }

    Turn turn(*this);

    int effective_timeout = timeout_secs > 0 ? timeout_secs : default_timeout_secs_;
    CommandResult result;
    result.command = command;
    result.started_at = std::chrono::system_clock::now();

    auto channel = connection_.open_exec();
    if (channel.is_err()) return R::Err(channel);
    ExecChannel& ch = *channel.value;

    auto fault = [&](const std::string& what, ErrorKind kind, const std::string& err) {
        if (kind == ErrorKind::ConnectionLost) connection_.report_fault(err);
        ch.abort();
        gateway_log("CommandService: " + what + ": " + err);
        return R::Err(kind, err);
    };

    auto started = ch.exec(command);
    if (started.is_err()) return fault("exec failed", started.kind, started.error);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(effective_timeout);
    std::vector<char> buf(SSH_READ_BUF_SIZE);

    while (true) {
        bool progressed = false;

        for (OutputStream stream : {OutputStream::Stdout, OutputStream::Stderr}) {
            auto n = ch.read(stream, buf.data(), buf.size());
            if (n.is_err()) return fault("read failed", n.kind, n.error);
            if (n.value == 0) continue;

            progressed = true;
            if (on_chunk) {
                (*on_chunk)(stream, std::string(buf.data(), n.value));
            } else if (stream == OutputStream::Stdout) {
                result.stdout_data.append(buf.data(), n.value);
            } else {
                result.stderr_data.append(buf.data(), n.value);
            }
        }

        // Checked on every pass, with or without output
        if (is_cancelled(cancel)) {
            ch.abort();
            gateway_log("CommandService: cancelled: " + command);
            return R::Err(ErrorKind::Cancelled, "Command cancelled");
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            // Partial output is discarded; the sentinel is never a real exit status
            ch.abort();
            result.stdout_data.clear();
            result.stderr_data.clear();
            result.exit_code = EXIT_CODE_TIMED_OUT;
            result.finished_at = std::chrono::system_clock::now();
            gateway_log_result("CommandService: timed out", result);
            return R::Err(ErrorKind::CommandTimeout,
                          "Command timed out after " + std::to_string(effective_timeout) + "s",
                          result);
        }

        if (progressed) continue;
        if (ch.eof()) break;

        ch.wait(EAGAIN_WAIT_MS);
    }

    auto closed = ch.close();
    if (closed.is_err()) return fault("close failed", closed.kind, closed.error);

    result.exit_code = ch.exit_status();
    result.exit_signal = ch.exit_signal();
    result.finished_at = std::chrono::system_clock::now();
    gateway_log_result("CommandService:", result);
    return R::Ok(std::move(result));
}
