#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <core/config.hpp>
#include "process_supervisor.hpp"

// Supervises the locally embedded HTTP server process.
//
//   NotStarted → Starting → Running → Stopping → Stopped → Starting
//   Running → Crashed → Starting | Stopped
//
// Independent of the remote connection. A background watcher turns an
// unexpected exit while Running into Crashed; it is state, never an error.
class ServerController {
public:
    using StateListener = std::function<void(const ServerProcessState&)>;
    using LaunchSpecFactory = std::function<LaunchSpec(int port, const std::string& bind)>;
    using ReadinessProbe = std::function<bool(int port)>;
    using PortCheck = std::function<bool(int port, const std::string& bind)>;

    ServerController(ServerConfig config, LaunchSpecFactory launch,
                     SupervisorFactory supervisors = posix_supervisor_factory(),
                     ReadinessProbe probe = nullptr,
                     PortCheck port_available = nullptr);
    ~ServerController();

    ServerController(const ServerController&) = delete;
    ServerController& operator=(const ServerController&) = delete;

    // port 0 = configured port, or a free random port in [5000, 9999] when
    // that is 0 too. No-op when already Running.
    Result<ServerProcessState> start(int port = 0);

    // Idempotent when Stopped or NotStarted.
    Result<ServerProcessState> stop();

    // Stop, reap, then start again on the same port.
    Result<ServerProcessState> restart();

    ServerProcessState state() const;

    // Every transition is pushed here, outside the controller's state lock.
    void set_listener(StateListener listener);

private:
    Result<ServerProcessState> start_locked(int port);
    Result<ServerProcessState> stop_locked();
    Result<int> choose_port(int requested);

    void transition(ServerPhase phase, const std::string& detail = "");
    void update(const std::function<void(ServerProcessState&)>& fn);
    void notify(const ServerProcessState& snapshot);

    void start_watcher();
    void stop_watcher();
    void watch_loop();

    ServerConfig config_;
    LaunchSpecFactory launch_;
    SupervisorFactory supervisors_;
    ReadinessProbe probe_;
    PortCheck port_available_;

    std::mutex lifecycle_mutex_;              // start / stop / restart
    mutable std::mutex state_mutex_;
    ServerProcessState state_;
    std::unique_ptr<ProcessSupervisor> process_;

    std::thread watcher_;
    std::mutex watch_mutex_;
    std::condition_variable watch_cv_;
    bool watch_stop_ = false;

    std::mutex listener_mutex_;
    StateListener listener_;
};
