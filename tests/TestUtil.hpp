/*
 * Valheim Server Manager — shared test helpers
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "include/Log.hpp"
#include "include/Scheduler.hpp"

namespace vsm { namespace test {

/* Fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "vsm-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (::mkdtemp(buf.data())) path_ = buf.data();
    }
    ~TempDir() {
        std::error_code ec;
        if (!path_.empty()) std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline void writeFile(const std::string& path, const std::string& content) {
    std::ofstream os(path, std::ios::binary | std::ios::trunc);
    os << content;
}

inline void appendFile(const std::string& path, const std::string& content) {
    std::ofstream os(path, std::ios::binary | std::ios::app);
    os << content;
}

/* Scheduler driven by hand: advance() moves time in steps, running due tasks. */
class ManualClock {
public:
    ManualClock() : sched_([this] { return now_; }) {}

    Scheduler& sched() { return sched_; }
    Scheduler::TimePoint now() const { return now_; }

    void advance(long long ms, long long step = 50) {
        sched_.runDue();
        while (ms > 0) {
            const long long d = ms < step ? ms : step;
            now_ += std::chrono::milliseconds(d);
            ms -= d;
            sched_.runDue();
        }
    }

    /* Run tasks due now, including ones they post, without moving time. */
    void settle(int rounds = 64) {
        while (rounds-- > 0 && sched_.runDue() > 0) {
        }
    }

private:
    Scheduler::TimePoint now_{Scheduler::Clock::now()};
    Scheduler sched_;
};

/* Captures log records while alive. */
class LogCapture {
public:
    LogCapture() {
        prevLevel_ = Logger::instance().level();
        Logger::instance().setLevel(LogLevel::Debug);
        Logger::instance().setHook([this](LogLevel lvl, const std::string& text) {
            records_.emplace_back(lvl, text);
        });
    }
    ~LogCapture() {
        Logger::instance().setHook(nullptr);
        Logger::instance().setLevel(prevLevel_);
    }

    bool contains(LogLevel lvl, const std::string& needle) const {
        for (const auto& r : records_) {
            if (r.first == lvl && r.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    std::vector<std::pair<LogLevel, std::string>> records_;
    LogLevel prevLevel_{LogLevel::Info};
};

}} // namespace vsm::test
