#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <random>

std::string now_iso() {
    return to_iso(std::chrono::system_clock::now());
}

std::string to_iso(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::mt19937_64& rng() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

static std::mutex rng_mutex;

std::string random_hex(std::size_t len) {
    static const char HEX[] = "0123456789abcdef";
    std::lock_guard<std::mutex> lock(rng_mutex);
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(len);
    for (std::size_t i = 0; i < len; i++) out += HEX[dist(rng())];
    return out;
}

int random_int(int lo, int hi) {
    std::lock_guard<std::mutex> lock(rng_mutex);
    std::uniform_int_distribution<int> dist(lo, hi);
    return dist(rng());
}
