/*
 * Valheim Server Manager — Server log parsing (header)
 * - Level/timestamp extraction for dedicated server output
 * - Event recognition (player joins, saves, startup phases, readiness)
 * - Bounded buffer of recent entries
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "Signal.hpp"

namespace vsm {

enum class ServerLogLevel { Debug, Info, Warn, Error };
const char* serverLogLevelName(ServerLogLevel l) noexcept;

struct ServerLogEntry {
    long long      timestampMs{0};   // receive time
    ServerLogLevel level{ServerLogLevel::Info};
    std::string    message;          // line without the leading server timestamp
    std::string    raw;
};

enum class StartupPhase {
    Idle,
    Initializing,
    LoadingWorld,
    GeneratingWorld,
    CreatingLocations,
    StartingServer,
    RegisteringLobby,
    Ready
};
const char* startupPhaseName(StartupPhase p) noexcept;

enum class LogEventType {
    PlayerJoin,
    PlayerLeave,
    WorldSaved,
    WorldGenerated,
    ServerReady,
    ServerShutdown,
    Error,
    StartupPhase
};
const char* logEventTypeName(LogEventType t) noexcept;

/* Structured event recognised in a log line. */
struct LogEvent {
    LogEventType type{LogEventType::Error};
    std::string  name;      // PlayerJoin / PlayerLeave
    std::string  message;   // Error
    StartupPhase phase{StartupPhase::Idle};
};

ServerLogEntry parseLogLine(const std::string& line);

/* Returns nullopt when the line carries no recognised event. */
std::optional<LogEvent> parseServerEvent(const std::string& line);

/* LogBuffer: most recent entries, oldest dropped first. */
class LogBuffer {
public:
    explicit LogBuffer(size_t maxSize = 1000) : maxSize_(maxSize ? maxSize : 1) {}

    const ServerLogEntry& add(const std::string& line);
    std::vector<ServerLogEntry> all() const;
    std::vector<ServerLogEntry> recent(size_t count) const;
    std::vector<ServerLogEntry> filtered(ServerLogLevel level) const;
    void clear() { entries_.clear(); }
    size_t size() const noexcept { return entries_.size(); }

    Signal<const ServerLogEntry&>& onEntry() { return onEntry_; }

private:
    size_t maxSize_;
    std::deque<ServerLogEntry> entries_;
    Signal<const ServerLogEntry&> onEntry_;
};

} // namespace vsm
