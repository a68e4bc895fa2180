#include "server_controller.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <chrono>
#include <csignal>

static constexpr int PORT_PICK_ATTEMPTS = 50;
static constexpr int READY_POLL_MS = 50;

ServerController::ServerController(ServerConfig config, LaunchSpecFactory launch,
                                   SupervisorFactory supervisors,
                                   ReadinessProbe probe,
                                   PortCheck port_available)
    : config_(std::move(config)), launch_(std::move(launch)),
      supervisors_(std::move(supervisors)), probe_(std::move(probe)),
      port_available_(std::move(port_available)) {
    if (!probe_) {
        // A wildcard listener answers on loopback; a specific one only on its own address
        std::string host = (config_.bind.empty() || config_.bind == "0.0.0.0") ? "127.0.0.1" : config_.bind;
        probe_ = [host](int port) { return platform::is_port_open(port, host); };
    }
    if (!port_available_) {
        port_available_ = [](int port, const std::string& bind) {
            return platform::is_port_available(port, bind);
        };
    }
}

ServerController::~ServerController() {
    auto r = stop();
    if (r.is_err()) gateway_log_error("ServerProcessController: shutdown", r);
}

ServerProcessState ServerController::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

void ServerController::set_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

Result<ServerProcessState> ServerController::start(int port) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return start_locked(port);
}

Result<ServerProcessState> ServerController::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return stop_locked();
}

Result<ServerProcessState> ServerController::restart() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    int port = state().port;
    auto stopped = stop_locked();
    if (stopped.is_err()) return stopped;
    return start_locked(port);
}

// ── State ───────────────────────────────────────────────────

void ServerController::update(const std::function<void(ServerProcessState&)>& fn) {
    ServerProcessState snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        fn(state_);
        snapshot = state_;
    }
    gateway_log(fmt::format("ServerProcessController: {} pid={} port={} {}",
                            server_phase_name(snapshot.phase), snapshot.pid,
                            snapshot.port, snapshot.detail));
    notify(snapshot);
}

void ServerController::transition(ServerPhase phase, const std::string& detail) {
    update([&](ServerProcessState& s) {
        s.phase = phase;
        s.detail = detail;
    });
}

void ServerController::notify(const ServerProcessState& snapshot) {
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    if (listener) listener(snapshot);
}

// ── Start ───────────────────────────────────────────────────

Result<int> ServerController::choose_port(int requested) {
    int port = requested > 0 ? requested : config_.port;
    if (port > 65535 || port < 0) {
        return Result<int>::Err(ErrorKind::InvalidArgument,
                                fmt::format("Port out of range: {}", port));
    }

    if (port == 0) {
        for (int i = 0; i < PORT_PICK_ATTEMPTS; i++) {
            int candidate = random_int(SERVER_RANDOM_PORT_MIN, SERVER_RANDOM_PORT_MAX);
            if (port_available_(candidate, config_.bind)) return Result<int>::Ok(candidate);
        }
        return Result<int>::Err(ErrorKind::PortInUse,
                                fmt::format("No free port found in [{}, {}]",
                                            SERVER_RANDOM_PORT_MIN, SERVER_RANDOM_PORT_MAX));
    }

    if (!port_available_(port, config_.bind)) {
        return Result<int>::Err(ErrorKind::PortInUse,
                                fmt::format("Port {} is already in use", port));
    }
    return Result<int>::Ok(port);
}

Result<ServerProcessState> ServerController::start_locked(int requested) {
    auto current = state();
    if (current.phase == ServerPhase::Running) {
        return Result<ServerProcessState>::Ok(current);
    }

    // A crashed child has already exited; drop its handle before respawning.
    stop_watcher();
    process_.reset();

    auto port = choose_port(requested);
    if (port.is_err()) {
        gateway_log_error("ServerProcessController: start", port);
        return Result<ServerProcessState>::Err(port);
    }

    update([&](ServerProcessState& s) {
        s.phase = ServerPhase::Starting;
        s.pid = -1;
        s.port = port.value;
        s.url.clear();
        s.exit_code.reset();
        s.detail = "launching";
    });

    auto proc = supervisors_();
    auto pid = proc->start(launch_(port.value, config_.bind));
    if (pid.is_err()) {
        transition(ServerPhase::Crashed, pid.error);
        return Result<ServerProcessState>::Err(ErrorKind::ProcessLifecycle,
                                               "Failed to launch server: " + pid.error,
                                               state());
    }
    update([&](ServerProcessState& s) { s.pid = pid.value; });

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.startup_timeout_ms);
    bool ready = false;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto code = proc->poll_exit()) {
            std::string msg = fmt::format("Server exited with code {} before becoming ready", *code);
            update([&](ServerProcessState& s) {
                s.phase = ServerPhase::Crashed;
                s.exit_code = *code;
                s.detail = msg;
            });
            return Result<ServerProcessState>::Err(ErrorKind::ProcessLifecycle, msg, state());
        }
        if (probe_(port.value)) {
            ready = true;
            break;
        }
        platform::sleep_ms(READY_POLL_MS);
    }

    if (!ready) {
        proc->signal(SIGTERM);
        auto code = proc->wait(config_.grace_period_ms);
        if (!code) {
            proc->signal(SIGKILL);
            code = proc->wait(-1);
        }
        std::string msg = fmt::format("Server not ready on port {} within {}ms",
                                      port.value, config_.startup_timeout_ms);
        update([&](ServerProcessState& s) {
            s.phase = ServerPhase::Crashed;
            s.exit_code = code;
            s.detail = msg;
        });
        return Result<ServerProcessState>::Err(ErrorKind::ProcessLifecycle, msg, state());
    }

    std::string host = (config_.bind.empty() || config_.bind == "0.0.0.0")
                           ? platform::local_ipv4() : config_.bind;
    process_ = std::move(proc);
    update([&](ServerProcessState& s) {
        s.phase = ServerPhase::Running;
        s.url = fmt::format("http://{}:{}/", host, port.value);
        s.detail = "listening";
    });
    start_watcher();
    return Result<ServerProcessState>::Ok(state());
}

// ── Stop ────────────────────────────────────────────────────

Result<ServerProcessState> ServerController::stop_locked() {
    auto current = state();
    if (current.phase == ServerPhase::NotStarted || current.phase == ServerPhase::Stopped) {
        return Result<ServerProcessState>::Ok(current);
    }

    transition(ServerPhase::Stopping, "stopping");
    stop_watcher();

    std::optional<int> code = current.exit_code;
    if (process_) {
        code = process_->poll_exit();
        if (!code) {
            process_->signal(SIGTERM);
            code = process_->wait(config_.grace_period_ms);
        }
        if (!code) {
            gateway_log(fmt::format("ServerProcessController: pid {} ignored SIGTERM, killing",
                                    process_->pid()));
            process_->signal(SIGKILL);
            code = process_->wait(-1);
        }
        process_.reset();
    }

    update([&](ServerProcessState& s) {
        s.phase = ServerPhase::Stopped;
        s.pid = -1;
        s.url.clear();
        s.exit_code = code;
        s.detail = "stopped";
    });
    return Result<ServerProcessState>::Ok(state());
}

// ── Watcher ─────────────────────────────────────────────────

void ServerController::start_watcher() {
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watch_stop_ = false;
    }
    watcher_ = std::thread(&ServerController::watch_loop, this);
}

void ServerController::stop_watcher() {
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watch_stop_ = true;
    }
    watch_cv_.notify_all();
    if (watcher_.joinable()) watcher_.join();
}

void ServerController::watch_loop() {
    // process_ is only replaced after this thread has been joined.
    ProcessSupervisor* proc = process_.get();
    if (!proc) return;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(watch_mutex_);
            if (watch_cv_.wait_for(lock, std::chrono::milliseconds(SERVER_WATCH_INTERVAL_MS),
                                   [this] { return watch_stop_; })) {
                return;
            }
        }

        auto code = proc->poll_exit();
        if (!code) continue;

        ServerProcessState snapshot;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_.phase != ServerPhase::Running) return;
            state_.phase = ServerPhase::Crashed;
            state_.exit_code = code;
            state_.url.clear();
            state_.detail = fmt::format("Server exited unexpectedly with code {}", *code);
            snapshot = state_;
        }
        gateway_log(fmt::format("ServerProcessController: pid {} crashed ({})",
                                snapshot.pid, *code));
        notify(snapshot);
        return;
    }
}
