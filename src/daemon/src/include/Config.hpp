/*
 * Valheim Server Manager — Configuration (public interface)
 * (c) 2025 ValheimServerManager contributors
 *
 * NOTE:
 *  - Layering: defaults -> environment (VSMD_*) -> JSON file.
 *  - Out-of-range or mistyped fields are rejected one by one with a warning;
 *    the previous layer's value stays in effect.
 *  - Read-only: the daemon never writes its configuration.
 */
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "RconManager.hpp"
#include "Watchdog.hpp"

namespace vsm {

struct FrameworkConfig {
    bool        enabled{false};
    std::string logFile;        // empty = <installDir>/BepInEx/LogOutput.log
};

struct DaemonSettings {
    // RPC server
    std::string host{"127.0.0.1"};
    int         port{8787};

    // Files / paths
    std::string logfile;
    std::string recordFile;

    // Leave the server running when the daemon exits
    bool        detachOnExit{false};
    bool        debug{false};
};

struct AppConfig {
    ServerLaunchConfig server;
    WatchdogConfig     watchdog;
    RconManagerConfig  rcon;
    FrameworkConfig    framework;
    DaemonSettings     daemon;

    std::string        configFile;   // file the values were read from (may not exist)
};

/* ----------------------------------------------------------------------------
 * Defaults (XDG-aware)
 * ----------------------------------------------------------------------------*/
AppConfig defaultConfig();
std::string defaultConfigPath();
std::string defaultInstallDir();

/* ----------------------------------------------------------------------------
 * Layers. Both return the warnings they produced (also logged).
 * ----------------------------------------------------------------------------*/
std::vector<std::string> applyEnvOverrides(AppConfig& c);
std::vector<std::string> applyConfigJson(const nlohmann::json& j, AppConfig& c);

/* Fill derived paths (executable, framework log) and expand '~' / $VAR. */
void finalizeConfig(AppConfig& c);

/* ----------------------------------------------------------------------------
 * File API
 * ----------------------------------------------------------------------------*/

// Throws Error(InvalidConfig) on unreadable or malformed JSON. A missing file
// is not an error. Empty path = VSMD_CONFIG_PATH or the default location.
void loadAppConfig(const std::string& path, AppConfig& out,
                   std::vector<std::string>* warnings = nullptr);

// Returns defaults + environment on failure and sets err.
AppConfig loadAppConfig(const std::string& path, std::string* err);

} // namespace vsm
