#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Stable error taxonomy shared by every gateway operation and front end.
enum class ErrorKind {
    None,
    Authentication,
    HostKeyMismatch,
    Connection,
    ConnectionLost,
    PathNotFound,
    PermissionDenied,
    IsADirectory,
    CommandTimeout,
    PortInUse,
    ProcessLifecycle,
    Archive,
    Cancelled,
    InvalidArgument,
    OperationFailed,
};

// Stable name for an error kind ("PathNotFoundError", ...).
const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Failure that still carries a value (e.g. a timed-out CommandResult).
    static Result<T> Err(ErrorKind kind, const std::string& err, T val) {
        return {false, std::move(val), err, kind};
    }

    // Forward another result's failure unchanged.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Credentials & session ───────────────────────────────────

enum class AuthMethod {
    Password,
    PublicKey,
    KeyboardInteractive,
};

const char* auth_method_name(AuthMethod method);
std::optional<AuthMethod> parse_auth_method(const std::string& name);

// One-shot login value built by a front end. Held in memory only.
struct RemoteCredentials {
    std::string host;
    int port = 22;
    std::string username;
    std::string secret;                      // password, key passphrase, or PEM key material
    std::optional<std::string> key_path;     // private key file for PublicKey auth
    AuthMethod auth = AuthMethod::Password;
};

enum class SessionStatus {
    Disconnected,
    Connecting,
    Connected,
    Failed,
};

const char* session_status_name(SessionStatus status);

// Snapshot of the session as seen by callers (no secrets).
struct SessionInfo {
    std::string id;
    std::string host;
    int port = 0;
    std::string username;
    SessionStatus status = SessionStatus::Disconnected;
    std::string connected_at;    // ISO timestamp, empty until connected
    int reconnects = 0;
    std::string last_error;
};

// ── Files ───────────────────────────────────────────────────

enum class FileKind {
    File,
    Directory,
    Symlink,
    Other,
};

const char* file_kind_name(FileKind kind);

struct FileEntry {
    std::string path;            // absolute, normalized
    std::string name;
    FileKind kind = FileKind::File;
    uint64_t size = 0;
    int64_t mtime = 0;           // seconds since epoch
    uint32_t permissions = 0;    // st_mode permission bits (0777 mask applied)

    bool is_dir() const { return kind == FileKind::Directory; }
};

struct TransferReport {
    uint64_t bytes = 0;
};

struct ArchiveReport {
    std::string root;
    uint64_t bytes = 0;          // archive bytes handed to the sink
    int entries = 0;
    std::vector<std::string> warnings;
};

// Receives streamed bytes. Returning false aborts the transfer.
using ByteSink = std::function<bool(const char* data, size_t len)>;

// ── Commands ────────────────────────────────────────────────

// Reported instead of an exit status when a command times out.
constexpr int EXIT_CODE_TIMED_OUT = -1;

struct CommandResult {
    std::string command;
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    std::string exit_signal;     // e.g. "KILL" when terminated by a signal
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    bool success() const { return exit_code == 0 && exit_signal.empty(); }
    bool timed_out() const { return exit_code == EXIT_CODE_TIMED_OUT; }

    long long duration_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            finished_at - started_at).count();
    }
};

enum class OutputStream { Stdout, Stderr };

using OutputCallback = std::function<void(OutputStream stream, const std::string& chunk)>;

// ── Embedded server ─────────────────────────────────────────

enum class ServerPhase {
    NotStarted,
    Starting,
    Running,
    Stopping,
    Stopped,
    Crashed,
};

const char* server_phase_name(ServerPhase phase);

struct ServerProcessState {
    ServerPhase phase = ServerPhase::NotStarted;
    int pid = -1;
    int port = 0;
    std::string url;
    std::optional<int> exit_code;    // set once the child has been reaped
    std::string detail;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
