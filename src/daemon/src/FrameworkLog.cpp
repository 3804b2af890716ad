/*
 * Valheim Server Manager — Plugin framework (BepInEx) log monitor (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/FrameworkLog.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <filesystem>
#include <regex>

namespace vsm {

const char* frameworkLogLevelName(FrameworkLogLevel l) noexcept {
    switch (l) {
        case FrameworkLogLevel::Debug: return "debug";
        case FrameworkLogLevel::Info:  return "info";
        case FrameworkLogLevel::Warn:  return "warn";
        case FrameworkLogLevel::Error: return "error";
        case FrameworkLogLevel::Fatal: return "fatal";
    }
    return "info";
}

FrameworkLogEntry parseFrameworkLogLine(const std::string& line) {
    // [Info   :   BepInEx] BepInEx 5.4.22.0 - valheim
    // [Error  :Unity Log] NullReferenceException: ...
    static const std::regex kLine(R"(^\[(\w+)\s*:\s*([^\]]+)\]\s*(.*)$)");

    FrameworkLogEntry e;
    e.timestampMs = util::now_ms();
    e.raw = line;
    e.message = util::trim(line);

    std::smatch m;
    if (std::regex_match(line, m, kLine)) {
        const std::string lvl = util::to_lower(m[1].str());
        e.source  = util::trim(m[2].str());
        e.message = m[3].str();
        if (lvl == "debug")                          e.level = FrameworkLogLevel::Debug;
        else if (lvl == "warning" || lvl == "warn")  e.level = FrameworkLogLevel::Warn;
        else if (lvl == "error")                     e.level = FrameworkLogLevel::Error;
        else if (lvl == "fatal")                     e.level = FrameworkLogLevel::Fatal;
        else                                         e.level = FrameworkLogLevel::Info;
        return e;
    }

    const std::string lower = util::to_lower(line);
    if (util::contains(lower, "error") || util::contains(lower, "exception")) {
        e.level = FrameworkLogLevel::Error;
    } else if (util::contains(lower, "warn")) {
        e.level = FrameworkLogLevel::Warn;
    } else if (util::contains(lower, "debug")) {
        e.level = FrameworkLogLevel::Debug;
    }
    return e;
}

std::string frameworkLogPath(const std::string& installDir) {
    return (std::filesystem::path(installDir) / "BepInEx" / "LogOutput.log").string();
}

FrameworkLogMonitor::FrameworkLogMonitor(Scheduler& sched)
: sched_(sched) {}

FrameworkLogMonitor::~FrameworkLogMonitor() {
    stop();
}

void FrameworkLogMonitor::start(const std::string& logPath, bool fromEnd) {
    if (tailer_ && tailer_->running()) {
        if (tailer_->path() == logPath) {
            LOG_DEBUG("framework-log: already tailing %s", logPath.c_str());
            return;
        }
        stop();
    }

    LOG_INFO("framework-log: tailing %s", logPath.c_str());
    if (!tailer_ || tailer_->path() != logPath) {
        tailer_ = std::make_unique<LogTailer>(sched_, logPath);
        tailer_->onLine().subscribe([this](const std::string& line) { handleLine_(line); });
    }
    tailer_->start(fromEnd);
}

void FrameworkLogMonitor::stop() {
    // The tailer object stays alive: stop() may run inside one of its callbacks.
    if (tailer_) tailer_->stop();
}

std::vector<FrameworkLogEntry> FrameworkLogMonitor::recentEntries() const {
    return std::vector<FrameworkLogEntry>(recent_.begin(), recent_.end());
}

std::vector<std::string> FrameworkLogMonitor::readLastLines(size_t n) const {
    if (!tailer_) return {};
    return tailer_->readLastLines(n);
}

void FrameworkLogMonitor::handleLine_(const std::string& line) {
    recent_.push_back(parseFrameworkLogLine(line));
    while (recent_.size() > kMaxRecentEntries) recent_.pop_front();
    onEntry_.emit(recent_.back());
}

} // namespace vsm
