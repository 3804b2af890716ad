/*
 * Valheim Server Manager — Logging (header)
 * - Thread-safe logger with optional file output and size-based rotation
 * - printf-style API; every record can also be observed through a hook
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace vsm {

/* Severity levels (ascending verbosity). */
enum class LogLevel {
    Error = 0,  // supervised component failed
    Warn  = 1,  // recoverable anomaly (dropped link, rejected config value)
    Info  = 2,  // lifecycle transitions
    Debug = 3,  // protocol and scheduling diagnostics
    Trace = 4   // per-poll noise
};

const char* logLevelName(LogLevel lvl) noexcept;

/* "error|warn|info|debug|trace", case-insensitive. */
std::optional<LogLevel> parseLogLevel(const std::string& s);

/*
 * Logger: singleton, safe for concurrent writers.
 * - Files are opened lazily; the parent directory is created if needed.
 * - Rotation is size-based: 5 MiB per file, 5 files kept.
 * - Mirror mode copies records to stdout (warnings and errors to stderr).
 * - An optional hook receives (level, formatted message without prefix).
 */
class Logger {
public:
    using Hook = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance();

    ~Logger();

    /*
     *  - logFilePath: destination file (empty = no file).
     *  - lvl: minimum severity to emit.
     *  - mirrorToStdio: also print to stdout/stderr.
     */
    void init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio);

    void setLevel(LogLevel lvl);
    LogLevel level() const;

    /* Install/remove the observation hook (nullptr removes). */
    void setHook(Hook hook);

    /* Close file (idempotent). */
    void shutdown();

    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openFileIfNeeded();
    void closeFileUnlocked();
    void checkRotateBeforeWrite(size_t incomingBytes);
    void rotateFilesUnlocked();

private:
    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};

    std::string filePath_;
    FILE* file_{nullptr};
    bool mirror_{false};
    Hook hook_;

    size_t maxBytes_{5 * 1024 * 1024};
    int    maxFiles_{5};
    size_t currentSize_{0};
};

#define LOG_ERROR(fmt, ...) ::vsm::Logger::instance().write(::vsm::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::vsm::Logger::instance().write(::vsm::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::vsm::Logger::instance().write(::vsm::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::vsm::Logger::instance().write(::vsm::LogLevel::Debug, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) ::vsm::Logger::instance().write(::vsm::LogLevel::Trace, fmt, ##__VA_ARGS__)

} // namespace vsm
