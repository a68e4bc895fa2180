#pragma once

#include <string>

// Entry point of `vpsx serve`: optional credentials document on stdin,
// connect, then serve HTTP on bind:port until SIGINT / SIGTERM.
// Returns the process exit code.
int run_serve(int port, const std::string& bind);
