/*
 * Valheim Server Manager — Configuration (implementation)
 * (c) 2025 ValheimServerManager contributors
 *
 * Goals:
 *  - Defaults  ->  ENV (VSMD_*)  ->  config.json
 *  - Every field validated on its own; a bad value never discards its
 *    neighbours.
 *  - XDG-aware defaults for config, logs and the process record.
 */

#include "include/Config.hpp"
#include "include/Errors.hpp"
#include "include/FrameworkLog.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace vsm {

/* ----------------------------------------------------------------------------
 * helpers (env / fs)
 * ----------------------------------------------------------------------------*/

namespace {

using Warnings = std::vector<std::string>;

void warn_(Warnings& w, std::string msg) {
    LOG_WARN("config: %s", msg.c_str());
    w.push_back(std::move(msg));
}

std::string env_(const char* key) {
    auto v = util::getenv_str(key);
    return v ? *v : std::string();
}

bool parseInt_(const std::string& s, long long& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    out = v;
    return true;
}

void envInt_(const char* key, int& field, long long lo, long long hi, Warnings& w) {
    const std::string s = env_(key);
    if (s.empty()) return;
    long long v = 0;
    if (!parseInt_(s, v)) {
        warn_(w, std::string(key) + ": not an integer: '" + s + "'");
        return;
    }
    if (v < lo || v > hi) {
        warn_(w, std::string(key) + ": " + s + " outside [" + std::to_string(lo) + ", " +
                 std::to_string(hi) + "]");
        return;
    }
    field = static_cast<int>(v);
}

void envBool_(const char* key, bool& field, Warnings& w) {
    const std::string s = util::to_lower(env_(key));
    if (s.empty()) return;
    if (s == "1" || s == "true" || s == "yes" || s == "on")        field = true;
    else if (s == "0" || s == "false" || s == "no" || s == "off")  field = false;
    else warn_(w, std::string(key) + ": not a boolean: '" + s + "'");
}

void envStr_(const char* key, std::string& field) {
    const std::string s = env_(key);
    if (!s.empty()) field = s;
}

std::string xdg_home_fallback(const char* var, const char* defSuffix) {
    const std::string v = env_(var);
    if (!v.empty()) return v;
    const std::string home = env_("HOME");
    if (!home.empty()) return (fs::path(home) / defSuffix).string();
    return {};
}

std::string xdg_config_home() { return xdg_home_fallback("XDG_CONFIG_HOME", ".config"); }
std::string xdg_state_home()  { return xdg_home_fallback("XDG_STATE_HOME",  ".local/state"); }
std::string xdg_data_home()   { return xdg_home_fallback("XDG_DATA_HOME",   ".local/share"); }

std::string under_(const std::string& base, const std::string& rel) {
    if (base.empty()) return (fs::temp_directory_path() / "vsm" / rel).string();
    return (fs::path(base) / "vsm" / rel).string();
}

/* ----------------------------------------------------------------------------
 * json field readers
 * ----------------------------------------------------------------------------*/

std::string key_(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

void jsonInt_(const json& o, const char* section, const char* key, int& field,
              long long lo, long long hi, Warnings& w) {
    if (!o.contains(key)) return;
    const json& v = o.at(key);
    if (!v.is_number_integer()) {
        warn_(w, key_(section, key) + ": expected an integer, got " + v.dump());
        return;
    }
    const long long n = v.get<long long>();
    if (n < lo || n > hi) {
        warn_(w, key_(section, key) + ": " + std::to_string(n) + " outside [" +
                 std::to_string(lo) + ", " + std::to_string(hi) + "]");
        return;
    }
    field = static_cast<int>(n);
}

void jsonDouble_(const json& o, const char* section, const char* key, double& field,
                 double lo, double hi, Warnings& w) {
    if (!o.contains(key)) return;
    const json& v = o.at(key);
    if (!v.is_number()) {
        warn_(w, key_(section, key) + ": expected a number, got " + v.dump());
        return;
    }
    const double d = v.get<double>();
    if (d < lo || d > hi) {
        warn_(w, key_(section, key) + ": " + v.dump() + " out of range");
        return;
    }
    field = d;
}

void jsonBool_(const json& o, const char* section, const char* key, bool& field, Warnings& w) {
    if (!o.contains(key)) return;
    const json& v = o.at(key);
    if (!v.is_boolean()) {
        warn_(w, key_(section, key) + ": expected a boolean, got " + v.dump());
        return;
    }
    field = v.get<bool>();
}

void jsonStr_(const json& o, const char* section, const char* key, std::string& field,
              size_t minLen, size_t maxLen, Warnings& w) {
    if (!o.contains(key)) return;
    const json& v = o.at(key);
    if (!v.is_string()) {
        warn_(w, key_(section, key) + ": expected a string, got " + v.dump());
        return;
    }
    std::string s = v.get<std::string>();
    if (s.size() < minLen || s.size() > maxLen) {
        warn_(w, key_(section, key) + ": length " + std::to_string(s.size()) + " outside [" +
                 std::to_string(minLen) + ", " + std::to_string(maxLen) + "]");
        return;
    }
    field = std::move(s);
}

void jsonStr_(const json& o, const char* section, const char* key, std::string& field, Warnings& w) {
    jsonStr_(o, section, key, field, 0, std::string::npos, w);
}

const json* section_(const json& j, const char* name, Warnings& w) {
    if (!j.contains(name)) return nullptr;
    const json& s = j.at(name);
    if (!s.is_object()) {
        warn_(w, std::string(name) + ": expected an object");
        return nullptr;
    }
    return &s;
}

constexpr long long kPortMin = 1024;
constexpr long long kPortMax = 65535;

} // namespace

/* ----------------------------------------------------------------------------
 * Defaults
 * ----------------------------------------------------------------------------*/

std::string defaultConfigPath() {
    return under_(xdg_config_home(), "config.json");
}

std::string defaultInstallDir() {
    const std::string data = xdg_data_home();
    const fs::path base = data.empty() ? fs::temp_directory_path() : fs::path(data);
    return (base / "steamcmd" / "steamapps" / "common" / "Valheim dedicated server").string();
}

AppConfig defaultConfig() {
    AppConfig c;

    c.server.installDir = defaultInstallDir();
    c.server.logDir     = under_(xdg_state_home(), "logs");

    // The daemon only talks RCON when asked to.
    c.rcon.enabled       = false;
    c.rcon.autoReconnect = false;

    c.daemon.logfile    = under_(xdg_state_home(), "vsmd.log");
    c.daemon.recordFile = under_(xdg_config_home(), "server.pid");

    c.configFile = defaultConfigPath();
    return c;
}

/* ----------------------------------------------------------------------------
 * ENV overlay
 *  - Applies AFTER defaultConfig() and BEFORE reading config.json
 * ----------------------------------------------------------------------------*/

std::vector<std::string> applyEnvOverrides(AppConfig& c) {
    Warnings w;

    // Server
    {
        std::string name = env_("VSMD_SERVER_NAME");
        if (!name.empty()) {
            if (name.size() > 64) warn_(w, "VSMD_SERVER_NAME: longer than 64 characters");
            else c.server.name = name;
        }
        envInt_("VSMD_SERVER_PORT", c.server.port, kPortMin, kPortMax, w);
        envStr_("VSMD_WORLD", c.server.world);
        envStr_("VSMD_SERVER_PASSWORD", c.server.password);
        envStr_("VSMD_INSTALL_DIR", c.server.installDir);
        envStr_("VSMD_SAVEDIR", c.server.savedir);
        envStr_("VSMD_SERVER_LOG_DIR", c.server.logDir);
    }

    // Watchdog
    envBool_("VSMD_WATCHDOG_ENABLED", c.watchdog.enabled, w);
    envInt_("VSMD_WATCHDOG_MAX_RESTARTS", c.watchdog.maxRestarts, 0, 100, w);

    // RCON
    envBool_("VSMD_RCON_ENABLED", c.rcon.enabled, w);
    envStr_("VSMD_RCON_HOST", c.rcon.host);
    envInt_("VSMD_RCON_PORT", c.rcon.port, kPortMin, kPortMax, w);
    envStr_("VSMD_RCON_PASSWORD", c.rcon.password);

    // RPC / files
    envStr_("VSMD_HOST", c.daemon.host);
    envInt_("VSMD_PORT", c.daemon.port, 1, kPortMax, w);
    envStr_("VSMD_LOGFILE", c.daemon.logfile);
    envStr_("VSMD_RECORD_FILE", c.daemon.recordFile);
    envBool_("VSMD_DEBUG", c.daemon.debug, w);

    // Only used when no explicit path is given
    envStr_("VSMD_CONFIG_PATH", c.configFile);

    return w;
}

/* ----------------------------------------------------------------------------
 * JSON overlay
 * ----------------------------------------------------------------------------*/

std::vector<std::string> applyConfigJson(const json& j, AppConfig& c) {
    Warnings w;
    if (!j.is_object()) {
        warn_(w, "top level: expected an object");
        return w;
    }

    if (const json* s = section_(j, "server", w)) {
        jsonStr_(*s, "server", "name", c.server.name, 1, 64, w);
        jsonInt_(*s, "server", "port", c.server.port, kPortMin, kPortMax, w);
        jsonStr_(*s, "server", "world", c.server.world, 1, 256, w);
        jsonStr_(*s, "server", "password", c.server.password, w);
        jsonBool_(*s, "server", "public", c.server.isPublic, w);
        jsonBool_(*s, "server", "crossplay", c.server.crossplay, w);
        jsonStr_(*s, "server", "savedir", c.server.savedir, w);
        jsonInt_(*s, "server", "saveinterval", c.server.saveinterval, 0, 86400, w);
        jsonInt_(*s, "server", "backups", c.server.backups, 0, 100, w);
        jsonStr_(*s, "server", "installDir", c.server.installDir, w);
        jsonStr_(*s, "server", "executable", c.server.executable, w);
        jsonStr_(*s, "server", "logDir", c.server.logDir, w);
        jsonStr_(*s, "server", "logFile", c.server.logFile, w);
    }

    if (const json* s = section_(j, "watchdog", w)) {
        jsonBool_(*s, "watchdog", "enabled", c.watchdog.enabled, w);
        jsonInt_(*s, "watchdog", "maxRestarts", c.watchdog.maxRestarts, 0, 100, w);
        jsonInt_(*s, "watchdog", "restartDelay", c.watchdog.restartDelayMs, 1000, 300000, w);
        jsonInt_(*s, "watchdog", "cooldownPeriod", c.watchdog.cooldownPeriodMs, 60000, 3600000, w);
        jsonDouble_(*s, "watchdog", "backoffMultiplier", c.watchdog.backoffMultiplier, 1.0, 10.0, w);
        jsonInt_(*s, "watchdog", "maxRestartDelay", c.watchdog.maxRestartDelayMs, 1000, 3600000, w);
        jsonInt_(*s, "watchdog", "startupTimeout", c.watchdog.startupTimeoutMs, 1000, 3600000, w);
        jsonInt_(*s, "watchdog", "exitPollInterval", c.watchdog.exitPollIntervalMs, 10, 10000, w);
    }

    if (const json* s = section_(j, "rcon", w)) {
        jsonBool_(*s, "rcon", "enabled", c.rcon.enabled, w);
        jsonStr_(*s, "rcon", "host", c.rcon.host, 1, 255, w);
        jsonInt_(*s, "rcon", "port", c.rcon.port, kPortMin, kPortMax, w);
        jsonStr_(*s, "rcon", "password", c.rcon.password, w);
        jsonInt_(*s, "rcon", "timeout", c.rcon.timeoutMs, 1000, 60000, w);
        jsonBool_(*s, "rcon", "autoReconnect", c.rcon.autoReconnect, w);
        jsonInt_(*s, "rcon", "pollInterval", c.rcon.pollIntervalMs, 1000, 3600000, w);
    }

    if (const json* s = section_(j, "framework", w)) {
        jsonBool_(*s, "framework", "enabled", c.framework.enabled, w);
        jsonStr_(*s, "framework", "logFile", c.framework.logFile, w);
    }

    if (const json* s = section_(j, "daemon", w)) {
        jsonStr_(*s, "daemon", "host", c.daemon.host, 1, 255, w);
        jsonInt_(*s, "daemon", "port", c.daemon.port, 1, kPortMax, w);
        jsonStr_(*s, "daemon", "logfile", c.daemon.logfile, w);
        jsonStr_(*s, "daemon", "recordFile", c.daemon.recordFile, w);
        jsonBool_(*s, "daemon", "detachOnExit", c.daemon.detachOnExit, w);
        jsonBool_(*s, "daemon", "debug", c.daemon.debug, w);
    }

    return w;
}

/* Normalize paths (non-persistent) */
void finalizeConfig(AppConfig& c) {
    c.server.installDir = util::expandUserPath(c.server.installDir);
    c.server.savedir    = util::expandUserPath(c.server.savedir);
    c.server.logDir     = util::expandUserPath(c.server.logDir);
    c.server.logFile    = util::expandUserPath(c.server.logFile);
    c.server.executable = util::expandUserPath(c.server.executable);
    if (c.server.executable.empty()) c.server.executable = resolveExecutable(c.server);

    c.framework.logFile = util::expandUserPath(c.framework.logFile);
    if (c.framework.logFile.empty()) {
        c.framework.logFile = frameworkLogPath(c.server.installDir);
    }

    c.daemon.logfile    = util::expandUserPath(c.daemon.logfile);
    c.daemon.recordFile = util::expandUserPath(c.daemon.recordFile);
    c.configFile        = util::expandUserPath(c.configFile);
}

/* ----------------------------------------------------------------------------
 * File API
 * ----------------------------------------------------------------------------*/

void loadAppConfig(const std::string& path, AppConfig& out, std::vector<std::string>* warnings) {
    out = defaultConfig();
    Warnings all = applyEnvOverrides(out);

    // Explicit path wins over VSMD_CONFIG_PATH and the default location
    const std::string p = util::expandUserPath(!path.empty() ? path : out.configFile);
    out.configFile = p;

    std::error_code ec;
    if (p.empty() || !fs::exists(p, ec)) {
        LOG_INFO("config: %s not found, using defaults", p.empty() ? "(none)" : p.c_str());
        finalizeConfig(out);
        if (warnings) *warnings = std::move(all);
        return;
    }

    std::string text;
    if (!util::readFile(p, text)) {
        throw Error(ErrorCode::InvalidConfig, "cannot read config file: " + p);
    }
    json j = json::parse(text, nullptr, /*allow_exceptions*/ false);
    if (j.is_discarded()) {
        throw Error(ErrorCode::InvalidConfig, "malformed JSON in " + p);
    }

    Warnings fromFile = applyConfigJson(j, out);
    all.insert(all.end(), fromFile.begin(), fromFile.end());
    finalizeConfig(out);
    LOG_INFO("config: loaded %s (%zu warnings)", p.c_str(), all.size());
    if (warnings) *warnings = std::move(all);
}

AppConfig loadAppConfig(const std::string& path, std::string* err) {
    AppConfig cfg;
    if (err) err->clear();
    try {
        loadAppConfig(path, cfg);
    } catch (const Error& ex) {
        if (err) *err = ex.what();
        cfg = defaultConfig();
        applyEnvOverrides(cfg);
        if (!path.empty()) cfg.configFile = path;
        finalizeConfig(cfg);
    }
    return cfg;
}

} // namespace vsm
