#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string gateway_log_path() {
    static std::string path = (platform::temp_dir() / "vpsx_debug.log").string();
    return path;
}

inline std::mutex& gateway_log_mutex() {
    static std::mutex m;
    return m;
}

inline void gateway_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(gateway_log_mutex());
    std::ofstream out(gateway_log_path(), std::ios::app);
    if (!out) return;
    out << line;
}

inline void gateway_log_result(const std::string& label, const CommandResult& r) {
    gateway_log(fmt::format("{} CMD: {}", label, r.command));
    gateway_log(fmt::format("{} exit={} {}ms stdout({})={}", label, r.exit_code, r.duration_ms(),
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        gateway_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}

template <typename T>
inline void gateway_log_error(const std::string& label, const Result<T>& r) {
    gateway_log(fmt::format("{}: {} {}", label, error_kind_name(r.kind), r.error));
}
