/*
 * Valheim Server Manager — Daemon (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/Daemon.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <chrono>

namespace vsm {

using nlohmann::json;

Daemon::Daemon(std::unique_ptr<ProcessLauncher> launcher)
: launcher_(std::move(launcher))
{
    if (!launcher_) launcher_ = std::make_unique<PosixProcessLauncher>();
    LOG_TRACE("daemon: ctor");
}

Daemon::~Daemon() {
    LOG_TRACE("daemon: dtor");
    shutdown();
}

bool Daemon::init(const AppConfig& cfg, bool debugCli) {
    LOG_INFO("daemon: init start");
    cfg_   = cfg;
    debug_ = debugCli || cfg.daemon.debug;
    startedAt_ = sched_.now();

    records_ = std::make_unique<ProcessRecordStore>(cfg_.daemon.recordFile);
    LOG_DEBUG("daemon: process record at %s", cfg_.daemon.recordFile.c_str());

    // RCON: configured always, connected by the watchdog once the server is online
    rcon_ = std::make_unique<RconManager>(sched_);
    rcon_->initialize(cfg_.rcon);

    watchdog_ = std::make_unique<Watchdog>(sched_, cfg_.server, cfg_.watchdog,
                                           *launcher_, records_.get(), rcon_.get());
    framework_ = std::make_unique<FrameworkLogMonitor>(sched_);
    wireEvents_();

    if (cfg_.framework.enabled) {
        framework_->start(cfg_.framework.logFile);
        LOG_INFO("daemon: following framework log %s", cfg_.framework.logFile.c_str());
    }

    // A server left running by an earlier invocation (detached or not)
    if (auto rec = records_->findRunning()) {
        LOG_INFO("daemon: found running server pid %d (detached=%d), reattaching",
                 rec->pid, rec->detached ? 1 : 0);
        if (!watchdog_->attach(*rec)) {
            LOG_WARN("daemon: reattach to pid %d failed", rec->pid);
        }
    }

    // RPC
    rpcServer_ = std::make_unique<RpcTcpServer>(
        cfg_.daemon.host.empty() ? std::string("127.0.0.1") : cfg_.daemon.host,
        static_cast<unsigned short>(cfg_.daemon.port >= 0 ? cfg_.daemon.port : 8787),
        debug_);
    if (!rpcServer_->start(&rpcRegistry_)) {
        LOG_ERROR("daemon: rpc server start failed");
        rpcServer_.reset();
        return false;
    }
    rpcTask_ = sched_.runEvery(Scheduler::Duration(kRpcPollIntervalMs), [this] {
        if (rpcServer_) rpcServer_->pollOnce(0);
    });

    LOG_INFO("daemon: init done (rpc on %s:%u)", cfg_.daemon.host.c_str(),
             static_cast<unsigned>(rpcServer_->boundPort()));
    initialized_ = true;
    return true;
}

void Daemon::wireEvents_() {
    watchdog_->onLog().subscribe([this](const std::string& line) {
        serverLog_.add(line);
    });
    watchdog_->onError().subscribe([](const Error& e) {
        LOG_WARN("daemon: server error [%s]: %s", e.codeName(), e.what());
    });
    watchdog_->onWatchdogRestart().subscribe([](int attempt, int max) {
        LOG_INFO("daemon: watchdog restart %d of %d scheduled", attempt, max);
    });
    watchdog_->onWatchdogMaxRestarts().subscribe([] {
        LOG_ERROR("daemon: watchdog gave up; use server.start to try again");
    });
    watchdog_->onPlayerJoin().subscribe([](const std::string& name) {
        LOG_INFO("daemon: %s joined", name.c_str());
    });
    watchdog_->onPlayerLeave().subscribe([](const std::string& name) {
        LOG_INFO("daemon: %s left", name.c_str());
    });
    rcon_->onConnectionStateChange().subscribe([](ConnectionState s) {
        LOG_DEBUG("daemon: rcon %s", connectionStateName(s));
    });
    framework_->onEntry().subscribe([](const FrameworkLogEntry& e) {
        if (e.level == FrameworkLogLevel::Error || e.level == FrameworkLogLevel::Fatal) {
            LOG_WARN("daemon: framework %s: %s", e.source.c_str(), e.message.c_str());
        }
    });
}

void Daemon::runLoop() {
    LOG_INFO("daemon: runLoop enter");
    sched_.run();
    LOG_INFO("daemon: run loop end");
}

void Daemon::shutdown() {
    if (!initialized_) return;
    initialized_ = false;
    LOG_INFO("daemon: shutdown");

    sched_.cancel(rpcTask_);
    rpcTask_ = Scheduler::kInvalidTask;
    if (rpcServer_) {
        LOG_DEBUG("daemon: stopping rpc");
        rpcServer_->stop();
        rpcServer_.reset();
    }

    if (framework_) framework_->stop();

    if (watchdog_ && watchdog_->pid()) {
        if (cfg_.daemon.detachOnExit) {
            watchdog_->detach();
        } else {
            bool stopped = false;
            watchdog_->stop(Scheduler::Duration(kShutdownStopTimeoutMs), [&stopped] { stopped = true; });
            // The run loop has exited; drive the scheduler here until the server is gone.
            sched_.resetStop();
            if (!sched_.runUntil([&stopped] { return stopped; },
                                 Scheduler::Duration(kShutdownStopTimeoutMs + 1000))) {
                LOG_WARN("daemon: server did not stop in time, killing");
                watchdog_->kill();
            }
        }
    } else if (watchdog_) {
        watchdog_->stop(); // cancels a pending restart
    }

    if (rcon_) rcon_->disconnect();

    watchdog_.reset();
    framework_.reset();
    rcon_.reset();
    records_.reset();
    LOG_INFO("daemon: shutdown complete");
}

long long Daemon::uptimeMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(sched_.now() - startedAt_).count();
}

json Daemon::serverStatus() const {
    const Watchdog& wd = *watchdog_;
    json players = json::array();
    for (const auto& p : wd.players()) players.push_back(p);

    json j{
        {"state",          processStateName(wd.state())},
        {"pid",            wd.pid() ? json(static_cast<int>(*wd.pid())) : json()},
        {"name",           wd.serverConfig().name},
        {"world",          wd.serverConfig().world},
        {"port",           wd.serverConfig().port},
        {"uptimeMs",       wd.uptimeMs()},
        {"startupPhase",   startupPhaseName(wd.startupPhase())},
        {"logFile",        wd.logPath()},
        {"players",        players},
        {"watchdog", {
            {"enabled",        wd.config().enabled},
            {"restartCount",   wd.restartCount()},
            {"maxRestarts",    wd.config().maxRestarts},
            {"restartPending", wd.restartPending()}
        }}
    };
    return j;
}

json Daemon::rconStatus() const {
    const RconManager& m = *rcon_;
    json j{
        {"state",            connectionStateName(m.state())},
        {"enabled",          m.config() ? m.config()->enabled : false},
        {"reconnectPending", m.reconnectPending()},
        {"polling",          m.pollingActive()},
        {"players",          m.lastPlayers()}
    };
    if (m.config()) {
        j["host"] = m.config()->host;
        j["port"] = m.config()->port;
    }
    return j;
}

} // namespace vsm
