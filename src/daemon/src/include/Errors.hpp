/*
 * Valheim Server Manager — Error taxonomy (header)
 * - One exception type carrying a machine-readable code
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <stdexcept>
#include <string>

namespace vsm {

enum class ErrorCode {
    Disconnected,
    AuthFailed,
    Timeout,
    ConnectionRefused,
    ProtocolError,
    InvalidBody,
    BufferTooSmall,
    InvalidPacketSize,
    ProcessSpawnFailed,
    ProcessExited,
    MaxRestartsExceeded,
    InvalidConfig,
    Io
};

/* Stable upper-case name, used in logs and RPC payloads. */
inline const char* errorCodeName(ErrorCode c) noexcept {
    switch (c) {
        case ErrorCode::Disconnected:        return "DISCONNECTED";
        case ErrorCode::AuthFailed:          return "AUTH_FAILED";
        case ErrorCode::Timeout:             return "TIMEOUT";
        case ErrorCode::ConnectionRefused:   return "CONNECTION_REFUSED";
        case ErrorCode::ProtocolError:       return "PROTOCOL_ERROR";
        case ErrorCode::InvalidBody:         return "INVALID_BODY";
        case ErrorCode::BufferTooSmall:      return "BUFFER_TOO_SMALL";
        case ErrorCode::InvalidPacketSize:   return "INVALID_PACKET_SIZE";
        case ErrorCode::ProcessSpawnFailed:  return "PROCESS_SPAWN_FAILED";
        case ErrorCode::ProcessExited:       return "PROCESS_EXITED";
        case ErrorCode::MaxRestartsExceeded: return "MAX_RESTARTS_EXCEEDED";
        case ErrorCode::InvalidConfig:       return "INVALID_CONFIG";
        case ErrorCode::Io:                  return "IO";
    }
    return "UNKNOWN";
}

/*
 * Error: thrown by the codec, the RCON client and the process launcher.
 * Supervising components (manager, watchdog, tailer) catch it at their
 * boundary and turn it into a state change plus a notification.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }
    const char* codeName() const noexcept { return errorCodeName(code_); }

private:
    ErrorCode code_;
};

} // namespace vsm
