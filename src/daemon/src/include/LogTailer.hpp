/*
 * Valheim Server Manager — Log tailer (header)
 * Polling "tail -f" over one file path; survives late creation, truncation
 * and rotation of the file.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "Scheduler.hpp"
#include "ServerLog.hpp"
#include "Signal.hpp"

namespace vsm {

struct TailCursor {
    std::string   filePath;
    std::uint64_t byteOffset{0};
    bool          running{false};
};

class LogTailer {
public:
    using EventParser = std::function<std::optional<LogEvent>(const std::string&)>;

    static constexpr int    kDefaultPollIntervalMs = 500;
    static constexpr size_t kReadChunkBytes        = 16 * 1024;

    LogTailer(Scheduler& sched,
              std::string path,
              EventParser parser = {},
              Scheduler::Duration pollInterval = Scheduler::Duration(kDefaultPollIntervalMs));
    ~LogTailer();

    LogTailer(const LogTailer&) = delete;
    LogTailer& operator=(const LogTailer&) = delete;

    /*
     * Begin tailing. fromEnd skips content present right now; a file that
     * does not exist yet is picked up from offset 0 once it appears.
     * No-op while already running.
     */
    void start(bool fromEnd);

    /* Idempotent. Subscribers are kept for a later start(). */
    void stop();

    /* One polling step; normally driven by the scheduler. */
    void poll();

    bool running() const noexcept { return running_; }
    bool hasHandle() const noexcept { return fd_ >= 0; }
    TailCursor cursor() const;
    const std::string& path() const noexcept { return path_; }

    /* Changing the path restarts a running tailer from the end of the new file. */
    void setPath(const std::string& path);

    Signal<const std::string&>& onLine() { return onLine_; }
    Signal<const LogEvent&>& onEvent() { return onEvent_; }

    /* Last n non-blank lines; does not touch the live cursor. */
    std::vector<std::string> readLastLines(size_t n) const;
    static std::vector<std::string> readLastLines(const std::string& path, size_t n);

private:
    bool open_();
    void close_();
    bool rotated_() const;
    void consume_(const char* data, size_t len);

    Scheduler&          sched_;
    std::string         path_;
    EventParser         parser_;
    Scheduler::Duration interval_;

    int           fd_{-1};
    dev_t         dev_{0};
    ino_t         ino_{0};
    std::uint64_t offset_{0};
    std::string   partial_;
    bool          running_{false};
    Scheduler::TaskId task_{Scheduler::kInvalidTask};

    Signal<const std::string&> onLine_;
    Signal<const LogEvent&>    onEvent_;
};

} // namespace vsm
