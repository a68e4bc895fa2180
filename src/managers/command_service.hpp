#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "connection_manager.hpp"

// Runs shell commands on dedicated exec channels.
//
// One execution is in flight per session. Callers queue in arrival order
// (ticket lock) and are never rejected, so outputs never interleave.
class CommandService {
public:
    CommandService(ConnectionManager& connection, int default_timeout_secs);

    // Captures stdout and stderr. timeout_secs = 0 uses the default.
    // On timeout the result carries exit_code EXIT_CODE_TIMED_OUT and no output.
    Result<CommandResult> execute(const std::string& command, int timeout_secs = 0);

    // Forwards output chunks as they arrive; the returned result has empty
    // buffers. Cancellation closes the channel.
    Result<CommandResult> execute_streaming(const std::string& command, int timeout_secs,
                                            const OutputCallback& on_chunk,
                                            const CancelToken* cancel = nullptr);

    // Number of callers waiting or running.
    int queued() const;

private:
    // RAII turn in the FIFO queue.
    class Turn {
    public:
        explicit Turn(CommandService& service);
        ~Turn();
        Turn(const Turn&) = delete;
        Turn& operator=(const Turn&) = delete;

    private:
        CommandService& service_;
    };

    Result<CommandResult> run(const std::string& command, int timeout_secs,
                              const OutputCallback* on_chunk, const CancelToken* cancel);

    ConnectionManager& connection_;
    int default_timeout_secs_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    uint64_t next_ticket_ = 0;
    uint64_t now_serving_ = 0;
};
