#pragma once

#include <string>

namespace platform {

// True if stdin is attached to a terminal.
bool stdin_is_tty();

// RAII guard that turns terminal echo off for secret input.
// Constructor saves the current mode; destructor restores it.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
#ifdef _WIN32
    unsigned long old_mode_ = 0;
#else
    struct Impl;
    Impl* impl_ = nullptr;
#endif
};

// Print prompt and read one line without echo. False on EOF.
bool read_secret(const std::string& prompt, std::string& out);

} // namespace platform
