#pragma once

#include <string>
#include <chrono>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Format a time point as an ISO 8601 local timestamp.
std::string to_iso(std::chrono::system_clock::time_point tp);

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Lowercase copy (ASCII only).
std::string to_lower(std::string s);

// Random lowercase hex string of the given length.
std::string random_hex(std::size_t len);

// Random integer in [lo, hi].
int random_int(int lo, int hi);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
