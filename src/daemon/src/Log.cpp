/*
 * Valheim Server Manager — Logging (implementation)
 * (c) 2025 ValheimServerManager contributors
 */

#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <array>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace vsm {

static inline size_t fileSizeOrZero(const std::string& path) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    return ec ? 0u : static_cast<size_t>(sz);
}

static inline std::string makeTimestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        return "1970-01-01 00:00:00";
    }
    return std::string(buf.data());
}

const char* logLevelName(LogLevel lvl) noexcept {
    switch (lvl) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "?";
}

std::optional<LogLevel> parseLogLevel(const std::string& s) {
    const std::string v = util::to_lower(util::trim(s));
    if (v == "error") return LogLevel::Error;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "info") return LogLevel::Info;
    if (v == "debug") return LogLevel::Debug;
    if (v == "trace") return LogLevel::Trace;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio) {
    std::lock_guard<std::mutex> lock(mtx_);
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
    mirror_ = mirrorToStdio;
    closeFileUnlocked();
    filePath_ = logFilePath;
    currentSize_ = 0;
    if (!filePath_.empty()) {
        util::ensure_parent_dirs(filePath_);
        openFileIfNeeded();
    }
}

void Logger::setLevel(LogLevel lvl) {
    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::setHook(Hook hook) {
    std::lock_guard<std::mutex> lock(mtx_);
    hook_ = std::move(hook);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::closeFileUnlocked() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

void Logger::openFileIfNeeded() {
    if (file_ || filePath_.empty()) return;
    file_ = std::fopen(filePath_.c_str(), "a");
    if (!file_) {
        mirror_ = true; // no file: keep the records visible on stdio
        return;
    }
    currentSize_ = fileSizeOrZero(filePath_);
}

void Logger::checkRotateBeforeWrite(size_t incomingBytes) {
    if (maxBytes_ == 0 || maxFiles_ <= 0 || filePath_.empty()) return;
    if (currentSize_ + incomingBytes > maxBytes_) {
        rotateFilesUnlocked();
        openFileIfNeeded();
        currentSize_ = 0;
    }
}

void Logger::rotateFilesUnlocked() {
    closeFileUnlocked();
    namespace fs = std::filesystem;
    std::error_code ec;
    for (int i = maxFiles_ - 1; i >= 1; --i) {
        const fs::path src = filePath_ + "." + std::to_string(i);
        const fs::path dst = filePath_ + "." + std::to_string(i + 1);
        if (fs::exists(src, ec)) {
            fs::remove(dst, ec);
            fs::rename(src, dst, ec);
        }
    }
    if (fs::exists(filePath_, ec)) {
        const fs::path dst = filePath_ + ".1";
        fs::remove(dst, ec);
        fs::rename(filePath_, dst, ec);
    }
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;
    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    char msgBuf[2048];
    std::vsnprintf(msgBuf, sizeof(msgBuf), fmt, ap);
    std::string msg(msgBuf);
    while (!msg.empty() && msg.back() == '\n') msg.pop_back();

    // Example: "2025-09-20 14:22:11 [INFO] rcon: connected"
    std::string line = makeTimestamp();
    line += " [";
    line += logLevelName(lvl);
    line += "] ";
    line += msg;
    line.push_back('\n');

    Hook hook;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!file_ && !filePath_.empty()) openFileIfNeeded();
        checkRotateBeforeWrite(line.size());
        if (file_) {
            std::fwrite(line.data(), 1, line.size(), file_);
            std::fflush(file_);
            currentSize_ += line.size();
        }
        if (mirror_) {
            FILE* out = (lvl == LogLevel::Error || lvl == LogLevel::Warn) ? stderr : stdout;
            std::fwrite(line.data(), 1, line.size(), out);
            std::fflush(out);
        }
        hook = hook_;
    }
    // Outside the lock: the hook may log again.
    if (hook) hook(lvl, msg);
}

} // namespace vsm
