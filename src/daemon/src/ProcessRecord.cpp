/*
 * Valheim Server Manager — Persisted process record (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/ProcessRecord.hpp"
#include "include/Errors.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using nlohmann::json;

namespace vsm {

void to_json(json& j, const ProcessRecord& r) {
    j = json{
        {"pid",       r.pid},
        {"world",     r.world},
        {"port",      r.port},
        {"startedAt", r.startedAt},
        {"detached",  r.detached},
        {"logFile",   r.logFile}
    };
}

void from_json(const json& j, ProcessRecord& r) {
    j.at("pid").get_to(r.pid);
    if (j.contains("world"))     j.at("world").get_to(r.world);
    if (j.contains("port"))      j.at("port").get_to(r.port);
    if (j.contains("startedAt")) j.at("startedAt").get_to(r.startedAt);
    if (j.contains("detached"))  j.at("detached").get_to(r.detached);
    if (j.contains("logFile"))   j.at("logFile").get_to(r.logFile);
}

bool isProcessRunning(pid_t pid) {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

bool signalProcess(pid_t pid, bool force) {
    if (pid <= 0) return false;
    return ::kill(pid, force ? SIGKILL : SIGTERM) == 0;
}

void ProcessRecordStore::write(const ProcessRecord& r) const {
    std::error_code ec;
    util::ensure_parent_dirs(path_, &ec);
    if (ec) {
        throw Error(ErrorCode::Io, "record: cannot create parent dirs for " + path_ + " (" + ec.message() + ")");
    }
    // Write-then-rename so a reader never sees a half-written record.
    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream os(tmp, std::ios::trunc);
        if (!os) throw Error(ErrorCode::Io, "record: cannot open " + tmp);
        os << json(r).dump(2) << "\n";
        if (!os.good()) throw Error(ErrorCode::Io, "record: write failed for " + tmp);
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw Error(ErrorCode::Io, "record: cannot replace " + path_);
    }
}

bool ProcessRecordStore::write(const ProcessRecord& r, std::string* err) const {
    if (err) err->clear();
    try {
        write(r);
        return true;
    } catch (const std::exception& ex) {
        if (err) *err = ex.what();
        return false;
    }
}

std::optional<ProcessRecord> ProcessRecordStore::read() const {
    std::string text;
    if (!util::readFile(path_, text)) return std::nullopt;
    const json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_WARN("record: %s is not valid JSON", path_.c_str());
        return std::nullopt;
    }
    try {
        return j.get<ProcessRecord>();
    } catch (const json::exception& ex) {
        LOG_WARN("record: %s malformed: %s", path_.c_str(), ex.what());
        return std::nullopt;
    }
}

void ProcessRecordStore::remove() const {
    std::error_code ec;
    fs::remove(path_, ec);
}

std::optional<ProcessRecord> ProcessRecordStore::findRunning() const {
    auto rec = read();
    if (!rec) return std::nullopt;
    if (!isProcessRunning(static_cast<pid_t>(rec->pid))) {
        LOG_INFO("record: pid %d is gone, removing stale record", rec->pid);
        remove();
        return std::nullopt;
    }
    return rec;
}

} // namespace vsm
