#include "types.hpp"
#include "utils.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:             return "None";
    case ErrorKind::Authentication:   return "AuthenticationError";
    case ErrorKind::HostKeyMismatch:  return "HostKeyMismatch";
    case ErrorKind::Connection:       return "ConnectionError";
    case ErrorKind::ConnectionLost:   return "ConnectionLostError";
    case ErrorKind::PathNotFound:     return "PathNotFoundError";
    case ErrorKind::PermissionDenied: return "PermissionDeniedError";
    case ErrorKind::IsADirectory:     return "IsADirectoryError";
    case ErrorKind::CommandTimeout:   return "CommandTimeoutError";
    case ErrorKind::PortInUse:        return "PortInUseError";
    case ErrorKind::ProcessLifecycle: return "ProcessLifecycleError";
    case ErrorKind::Archive:          return "ArchiveError";
    case ErrorKind::Cancelled:        return "CancelledError";
    case ErrorKind::InvalidArgument:  return "InvalidArgument";
    case ErrorKind::OperationFailed:  return "OperationFailed";
    }
    return "Unknown";
}

const char* auth_method_name(AuthMethod method) {
    switch (method) {
    case AuthMethod::Password:            return "password";
    case AuthMethod::PublicKey:           return "publickey";
    case AuthMethod::KeyboardInteractive: return "keyboard-interactive";
    }
    return "password";
}

std::optional<AuthMethod> parse_auth_method(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "password") return AuthMethod::Password;
    if (n == "publickey" || n == "key") return AuthMethod::PublicKey;
    if (n == "keyboard-interactive" || n == "kbd") return AuthMethod::KeyboardInteractive;
    return std::nullopt;
}

const char* session_status_name(SessionStatus status) {
    switch (status) {
    case SessionStatus::Disconnected: return "Disconnected";
    case SessionStatus::Connecting:   return "Connecting";
    case SessionStatus::Connected:    return "Connected";
    case SessionStatus::Failed:       return "Failed";
    }
    return "Unknown";
}

const char* file_kind_name(FileKind kind) {
    switch (kind) {
    case FileKind::File:      return "file";
    case FileKind::Directory: return "directory";
    case FileKind::Symlink:   return "symlink";
    case FileKind::Other:     return "other";
    }
    return "other";
}

const char* server_phase_name(ServerPhase phase) {
    switch (phase) {
    case ServerPhase::NotStarted: return "NotStarted";
    case ServerPhase::Starting:   return "Starting";
    case ServerPhase::Running:    return "Running";
    case ServerPhase::Stopping:   return "Stopping";
    case ServerPhase::Stopped:    return "Stopped";
    case ServerPhase::Crashed:    return "Crashed";
    }
    return "Unknown";
}
