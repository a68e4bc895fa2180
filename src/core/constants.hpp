#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 10;    // TCP connect + handshake
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Default per-command timeout
constexpr int SSH_IO_TIMEOUT_SECS        = 30;    // No progress on a channel for this long = fault
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int SERVER_STARTUP_TIMEOUT_MS  = 10000; // Readiness probe window
constexpr int SERVER_GRACE_PERIOD_MS     = 3000;  // SIGTERM → SIGKILL escalation
constexpr int SERVER_WATCH_INTERVAL_MS   = 100;   // Exit polling interval
constexpr int EAGAIN_WAIT_MS             = 50;    // Socket wait slice while libssh2 says EAGAIN

// ── Reconnect policy ────────────────────────────────────────
constexpr int RECONNECT_MAX_ATTEMPTS     = 4;
constexpr int RECONNECT_INITIAL_DELAY_MS = 500;
constexpr int RECONNECT_MAX_DELAY_MS     = 8000;

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t SSH_READ_BUF_SIZE  = 4096;
constexpr std::size_t SFTP_CHUNK_SIZE    = 32768;  // One SFTP read/write request
constexpr std::size_t HTTP_CHUNK_SIZE    = 16384;

// ── Embedded server ─────────────────────────────────────────
constexpr int SERVER_RANDOM_PORT_MIN     = 5000;
constexpr int SERVER_RANDOM_PORT_MAX     = 9999;
constexpr const char* SERVER_DEFAULT_BIND = "0.0.0.0";

// ── Naming ──────────────────────────────────────────────────
constexpr const char* VPSX_VERSION       = "0.4.0";
constexpr const char* TEMP_UPLOAD_TAG    = ".vpsx-part";   // temp-and-rename suffix
