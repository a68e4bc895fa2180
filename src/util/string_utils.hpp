#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Human-readable byte count: "512 B", "1.5 KB", "3.2 GB".
std::string format_size(uint64_t bytes);

// Decode %XX escapes (and '+' as space when form is true).
std::string url_decode(const std::string& str, bool form = true);
}
