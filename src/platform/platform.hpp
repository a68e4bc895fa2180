#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a fresh path in the temp directory with the given prefix.
// The file is not created.
std::filesystem::path temp_file(const std::string& prefix);

// Absolute path of the running executable, empty if it cannot be determined.
std::filesystem::path self_exe_path();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
