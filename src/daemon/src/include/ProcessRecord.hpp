/*
 * Valheim Server Manager — Persisted process record (header)
 * Lets a later invocation find, reattach to or stop a server it did not
 * start itself.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <optional>
#include <string>

#include <sys/types.h>
#include <nlohmann/json.hpp>

namespace vsm {

struct ProcessRecord {
    int         pid{0};
    std::string world;
    int         port{0};
    std::string startedAt;   // UTC ISO-8601
    bool        detached{false};
    std::string logFile;
};

void to_json(nlohmann::json& j, const ProcessRecord& r);
void from_json(const nlohmann::json& j, ProcessRecord& r);

/* Signal 0 probe; EPERM counts as alive. */
bool isProcessRunning(pid_t pid);

/* SIGTERM, or SIGKILL when force. False if the signal was not delivered. */
bool signalProcess(pid_t pid, bool force);

class ProcessRecordStore {
public:
    explicit ProcessRecordStore(std::string path) : path_(std::move(path)) {}

    const std::string& path() const noexcept { return path_; }

    /* Throws Error(Io) on failure. */
    void write(const ProcessRecord& r) const;
    bool write(const ProcessRecord& r, std::string* err) const;

    /* nullopt if missing or unreadable. */
    std::optional<ProcessRecord> read() const;

    /* Missing file is fine. */
    void remove() const;

    /* Record of a live process; a stale record is removed. */
    std::optional<ProcessRecord> findRunning() const;

private:
    std::string path_;
};

} // namespace vsm
