/*
 * Valheim Server Manager — Server watchdog (header)
 * - Launches the dedicated server and follows its log
 * - Detects readiness and exits, restarts with capped exponential backoff
 * - Stop / kill / detach / re-attach
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "Errors.hpp"
#include "LogTailer.hpp"
#include "Process.hpp"
#include "ProcessRecord.hpp"
#include "RconManager.hpp"
#include "Scheduler.hpp"
#include "ServerLog.hpp"
#include "Signal.hpp"

namespace vsm {

enum class ProcessState { Offline, Starting, Online, Crashed, Stopping };
const char* processStateName(ProcessState s) noexcept;

struct ServerLaunchConfig {
    std::string name{"Land of OZ Valheim"};
    int         port{2456};
    std::string world{"Dedicated"};
    std::string password;
    bool        isPublic{false};
    bool        crossplay{false};
    std::string savedir;
    int         saveinterval{1800};   // seconds, 0 = server default
    int         backups{4};           // 0 = server default
    std::string installDir;
    std::string executable;           // empty = <installDir>/valheim_server.x86_64
    std::string logDir;               // per-launch logs; empty = <installDir>/logs
    std::string logFile;              // fixed log path; overrides logDir
};

struct WatchdogConfig {
    bool   enabled{true};
    int    maxRestarts{5};
    int    restartDelayMs{5000};
    int    cooldownPeriodMs{300000};
    double backoffMultiplier{2.0};
    int    maxRestartDelayMs{300000};
    int    startupTimeoutMs{120000};
    int    exitPollIntervalMs{250};
};

constexpr const char* kSteamAppId = "892970";

std::string resolveExecutable(const ServerLaunchConfig& cfg);
std::vector<std::string> buildLaunchArgs(const ServerLaunchConfig& cfg, const std::string& logFile);
std::map<std::string, std::string> buildLaunchEnv(const ServerLaunchConfig& cfg);
LaunchSpec buildLaunchSpec(const ServerLaunchConfig& cfg, const std::string& logFile);

/* Delay before restart number attempt+1: restartDelay * mult^attempt, capped. */
long long restartDelayFor(const WatchdogConfig& cfg, int attempt);

/*
 * Watchdog: supervises at most one server process.
 * Everything runs on the scheduler thread. The RCON manager and the record
 * store are optional and not owned.
 */
class Watchdog {
public:
    static constexpr int kDefaultStopTimeoutMs = 30000;
    static constexpr int kStopCheckIntervalMs  = 100;

    Watchdog(Scheduler& sched,
             ServerLaunchConfig server,
             WatchdogConfig cfg,
             ProcessLauncher& launcher,
             ProcessRecordStore* records = nullptr,
             RconManager* rcon = nullptr);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    /* Only from offline/crashed. False when refused or the spawn failed. */
    bool start();

    /* Graceful stop; SIGKILL once timeout elapsed. onStopped runs when offline. */
    void stop(Scheduler::Duration timeout = Scheduler::Duration(kDefaultStopTimeoutMs),
              std::function<void()> onStopped = {});

    void kill();

    /* Leave the server running unsupervised. False without a process. */
    bool detach();

    /* Supervise a process started by another invocation. */
    bool attach(const ProcessRecord& record);

    void updateConfig(const WatchdogConfig& cfg);
    void updateServerConfig(const ServerLaunchConfig& server);
    void resetRestartCount();

    ProcessState state() const noexcept { return state_; }
    std::optional<pid_t> pid() const;
    int restartCount() const noexcept { return attempts_; }
    bool restartPending() const;
    const std::string& logPath() const noexcept { return logPath_; }
    StartupPhase startupPhase() const noexcept { return phase_; }
    const std::set<std::string>& players() const noexcept { return players_; }
    const WatchdogConfig& config() const noexcept { return cfg_; }
    const ServerLaunchConfig& serverConfig() const noexcept { return server_; }

    /* Milliseconds since the current process was started or adopted; 0 when none. */
    long long uptimeMs() const;

    Signal<ProcessState>&       onStateChange() { return stateChanged_; }
    Signal<const std::string&>& onLog() { return log_; }
    Signal<const std::string&>& onPlayerJoin() { return playerJoin_; }
    Signal<const std::string&>& onPlayerLeave() { return playerLeave_; }
    Signal<const LogEvent&>&    onEvent() { return event_; }
    Signal<const Error&>&       onError() { return error_; }
    Signal<int, int>&           onWatchdogRestart() { return restart_; }
    Signal<>&                   onWatchdogMaxRestarts() { return maxRestarts_; }

private:
    bool spawn_();
    std::string nextLogFile_() const;
    void follow_(const std::string& logFile, bool fromEnd);
    void setState_(ProcessState s);
    void checkExit_();
    void handleExit_(int status);
    void applyRestartPolicy_();
    void markOnline_(bool timedOut);
    void checkStop_();
    void finishStop_();
    void teardownRun_();
    void cancel_(Scheduler::TaskId& id);
    void onLine_(const std::string& line);
    void onServerEvent_(const LogEvent& ev);
    void onPlayerList_(const std::vector<std::string>& names);

    Scheduler&          sched_;
    ServerLaunchConfig  server_;
    WatchdogConfig      cfg_;
    ProcessLauncher&    launcher_;
    ProcessRecordStore* records_;
    RconManager*        rcon_;

    std::unique_ptr<ServerProcess> proc_;
    std::shared_ptr<LogTailer>     tailer_;
    ProcessState                   state_{ProcessState::Offline};
    StartupPhase                   phase_{StartupPhase::Idle};
    std::string                    logPath_;
    std::set<std::string>          players_;
    Scheduler::TimePoint           startedAt_{};
    int                            attempts_{0};

    Scheduler::TaskId exitTask_{Scheduler::kInvalidTask};
    Scheduler::TaskId startupTask_{Scheduler::kInvalidTask};
    Scheduler::TaskId cooldownTask_{Scheduler::kInvalidTask};
    Scheduler::TaskId restartTask_{Scheduler::kInvalidTask};
    Scheduler::TaskId stopTask_{Scheduler::kInvalidTask};
    Scheduler::TimePoint stopDeadline_{};
    std::vector<std::function<void()>> stopWaiters_;

    SubscriptionToken rconPlayersToken_{0};

    Signal<ProcessState>       stateChanged_;
    Signal<const std::string&> log_;
    Signal<const std::string&> playerJoin_;
    Signal<const std::string&> playerLeave_;
    Signal<const LogEvent&>    event_;
    Signal<const Error&>       error_;
    Signal<int, int>           restart_;
    Signal<>                   maxRestarts_;
};

} // namespace vsm
