/*
 * Valheim Server Manager — Server log parsing (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/ServerLog.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <regex>

namespace vsm {

using util::contains;

const char* serverLogLevelName(ServerLogLevel l) noexcept {
    switch (l) {
        case ServerLogLevel::Debug: return "debug";
        case ServerLogLevel::Info:  return "info";
        case ServerLogLevel::Warn:  return "warn";
        case ServerLogLevel::Error: return "error";
    }
    return "info";
}

const char* startupPhaseName(StartupPhase p) noexcept {
    switch (p) {
        case StartupPhase::Idle:              return "idle";
        case StartupPhase::Initializing:      return "initializing";
        case StartupPhase::LoadingWorld:      return "loading_world";
        case StartupPhase::GeneratingWorld:   return "generating_world";
        case StartupPhase::CreatingLocations: return "creating_locations";
        case StartupPhase::StartingServer:    return "starting_server";
        case StartupPhase::RegisteringLobby:  return "registering_lobby";
        case StartupPhase::Ready:             return "ready";
    }
    return "idle";
}

const char* logEventTypeName(LogEventType t) noexcept {
    switch (t) {
        case LogEventType::PlayerJoin:     return "player_join";
        case LogEventType::PlayerLeave:    return "player_leave";
        case LogEventType::WorldSaved:     return "world_saved";
        case LogEventType::WorldGenerated: return "world_generated";
        case LogEventType::ServerReady:    return "server_ready";
        case LogEventType::ServerShutdown: return "server_shutdown";
        case LogEventType::Error:          return "error";
        case LogEventType::StartupPhase:   return "startup_phase";
    }
    return "error";
}

ServerLogEntry parseLogLine(const std::string& line) {
    // "02/15/2024 12:34:56: Message"
    static const std::regex kStamp(R"(^(\d{2}/\d{2}/\d{4} \d{2}:\d{2}:\d{2}): (.+)$)");

    ServerLogEntry e;
    e.timestampMs = util::now_ms();
    e.raw = line;
    e.message = util::trim(line);

    if (contains(line, "Error") || contains(line, "Exception")) {
        e.level = ServerLogLevel::Error;
    } else if (contains(line, "Warning") || contains(line, "WARN")) {
        e.level = ServerLogLevel::Warn;
    } else if (contains(line, "DEBUG") || contains(line, "[Debug]")) {
        e.level = ServerLogLevel::Debug;
    }

    std::smatch m;
    if (std::regex_match(line, m, kStamp)) {
        e.message = m[2].str();
    }
    return e;
}

static inline LogEvent phaseEvent(StartupPhase p) {
    LogEvent ev;
    ev.type = LogEventType::StartupPhase;
    ev.phase = p;
    return ev;
}

static inline LogEvent simpleEvent(LogEventType t) {
    LogEvent ev;
    ev.type = t;
    return ev;
}

std::optional<LogEvent> parseServerEvent(const std::string& line) {
    static const std::regex kJoin(R"(Got character ZDOID from (\S+))");

    if (contains(line, "Got character ZDOID from")) {
        std::smatch m;
        if (std::regex_search(line, m, kJoin)) {
            LogEvent ev;
            ev.type = LogEventType::PlayerJoin;
            ev.name = m[1].str();
            return ev;
        }
    }

    // Socket closes carry an address, not a player name.
    if (contains(line, "Closing socket")) return std::nullopt;

    if (contains(line, "World saved")) return simpleEvent(LogEventType::WorldSaved);
    if (contains(line, "Done generating locations")) return simpleEvent(LogEventType::WorldGenerated);

    if (contains(line, "DungeonDB Start")) return phaseEvent(StartupPhase::Initializing);
    if (contains(line, "Load world") || contains(line, "Loading world")) {
        return phaseEvent(StartupPhase::LoadingWorld);
    }
    if (contains(line, "Generating locations") && !contains(line, "Done")) {
        return phaseEvent(StartupPhase::GeneratingWorld);
    }
    if (contains(line, "Failed to place all") || contains(line, "Placing locations")) {
        return phaseEvent(StartupPhase::CreatingLocations);
    }
    if (contains(line, "ZDOMan") || contains(line, "Zonesystem Start")) {
        return phaseEvent(StartupPhase::StartingServer);
    }
    if (contains(line, "Registering lobby")) return phaseEvent(StartupPhase::RegisteringLobby);

    if (contains(line, "Game server connected")) return simpleEvent(LogEventType::ServerReady);
    if (contains(line, "OnApplicationQuit")) return simpleEvent(LogEventType::ServerShutdown);

    if (contains(line, "Error!") || contains(line, "FAILED") || contains(line, "Exception:")) {
        LogEvent ev;
        ev.type = LogEventType::Error;
        ev.message = util::trim(line);
        return ev;
    }
    return std::nullopt;
}

/* ----------------------------------------------------------------------------
 * LogBuffer
 * ----------------------------------------------------------------------------*/

const ServerLogEntry& LogBuffer::add(const std::string& line) {
    entries_.push_back(parseLogLine(line));
    while (entries_.size() > maxSize_) entries_.pop_front();
    const ServerLogEntry& e = entries_.back();
    onEntry_.emit(e);
    return entries_.back();
}

std::vector<ServerLogEntry> LogBuffer::all() const {
    return std::vector<ServerLogEntry>(entries_.begin(), entries_.end());
}

std::vector<ServerLogEntry> LogBuffer::recent(size_t count) const {
    const size_t n = std::min(count, entries_.size());
    return std::vector<ServerLogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(n), entries_.end());
}

std::vector<ServerLogEntry> LogBuffer::filtered(ServerLogLevel level) const {
    std::vector<ServerLogEntry> out;
    for (const auto& e : entries_) {
        if (e.level == level) out.push_back(e);
    }
    return out;
}

} // namespace vsm
