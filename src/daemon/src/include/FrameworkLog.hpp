/*
 * Valheim Server Manager — Plugin framework (BepInEx) log monitor (header)
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "LogTailer.hpp"
#include "Scheduler.hpp"
#include "Signal.hpp"

namespace vsm {

enum class FrameworkLogLevel { Debug, Info, Warn, Error, Fatal };
const char* frameworkLogLevelName(FrameworkLogLevel l) noexcept;

struct FrameworkLogEntry {
    long long         timestampMs{0};
    FrameworkLogLevel level{FrameworkLogLevel::Info};
    std::string       source{"BepInEx"};
    std::string       message;
    std::string       raw;
};

/* "[Level   : Source] Message"; other lines get a level guessed from content. */
FrameworkLogEntry parseFrameworkLogLine(const std::string& line);

/* <installDir>/BepInEx/LogOutput.log */
std::string frameworkLogPath(const std::string& installDir);

/*
 * FrameworkLogMonitor: tails the framework log and keeps the most recent
 * entries so late subscribers can catch up.
 */
class FrameworkLogMonitor {
public:
    static constexpr size_t kMaxRecentEntries = 200;

    explicit FrameworkLogMonitor(Scheduler& sched);
    ~FrameworkLogMonitor();

    /* Same path while running: no-op. Different path: restart on it. */
    void start(const std::string& logPath, bool fromEnd = true);
    void stop();

    bool running() const noexcept { return tailer_ && tailer_->running(); }
    std::string logPath() const { return tailer_ ? tailer_->path() : std::string(); }

    std::vector<FrameworkLogEntry> recentEntries() const;
    std::vector<std::string> readLastLines(size_t n) const;

    Signal<const FrameworkLogEntry&>& onEntry() { return onEntry_; }

private:
    void handleLine_(const std::string& line);

    Scheduler& sched_;
    std::unique_ptr<LogTailer> tailer_;
    std::deque<FrameworkLogEntry> recent_;
    Signal<const FrameworkLogEntry&> onEntry_;
};

} // namespace vsm
