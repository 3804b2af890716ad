/*
 * Valheim Server Manager — Daemon (header)
 * - Owns the scheduler and every component driven by it
 * - Reattaches to a server left running by an earlier invocation
 * - Serves the control RPC
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "CommandRegistry.hpp"
#include "Config.hpp"
#include "FrameworkLog.hpp"
#include "Process.hpp"
#include "ProcessRecord.hpp"
#include "RconManager.hpp"
#include "RpcTcpServer.hpp"
#include "Scheduler.hpp"
#include "ServerLog.hpp"
#include "Watchdog.hpp"

namespace vsm {

class Daemon {
public:
    static constexpr int kRpcPollIntervalMs    = 20;
    static constexpr int kShutdownStopTimeoutMs = 30000;

    /* nullptr launcher = fork/exec on this host. */
    explicit Daemon(std::unique_ptr<ProcessLauncher> launcher = nullptr);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /* Build components, reattach to a recorded server, open the RPC port. */
    bool init(const AppConfig& cfg, bool debugCli = false);

    /* Blocks until requestStop(). */
    void runLoop();

    /* Safe from any thread. */
    void requestStop() { sched_.requestStop(); }
    bool stopRequested() const { return sched_.stopRequested(); }

    /* Stop (or detach) the server within a bounded wait, then tear down.
     * Call with the run loop no longer running. */
    void shutdown();

    bool initialized() const noexcept { return initialized_; }
    const AppConfig& config() const noexcept { return cfg_; }
    const std::string& configPath() const noexcept { return cfg_.configFile; }

    Scheduler&           scheduler()   noexcept { return sched_; }
    RconManager&         rcon()        noexcept { return *rcon_; }
    Watchdog&            watchdog()    noexcept { return *watchdog_; }
    FrameworkLogMonitor& framework()   noexcept { return *framework_; }
    LogBuffer&           serverLog()   noexcept { return serverLog_; }
    ProcessRecordStore&  records()     noexcept { return *records_; }
    CommandRegistry&     rpcRegistry() noexcept { return rpcRegistry_; }
    RpcTcpServer*        rpcServer()   noexcept { return rpcServer_.get(); }

    /* Snapshot for server.status */
    nlohmann::json serverStatus() const;
    nlohmann::json rconStatus() const;

    long long uptimeMs() const;

private:
    void wireEvents_();

private:
    AppConfig cfg_{};
    bool      debug_{false};
    bool      initialized_{false};

    Scheduler                            sched_;
    Scheduler::TimePoint                 startedAt_{};
    std::unique_ptr<ProcessLauncher>     launcher_;
    std::unique_ptr<ProcessRecordStore>  records_;
    std::unique_ptr<RconManager>         rcon_;
    std::unique_ptr<Watchdog>            watchdog_;
    std::unique_ptr<FrameworkLogMonitor> framework_;
    LogBuffer                            serverLog_;
    CommandRegistry                      rpcRegistry_;
    std::unique_ptr<RpcTcpServer>        rpcServer_;
    Scheduler::TaskId                    rpcTask_{Scheduler::kInvalidTask};
};

} // namespace vsm
