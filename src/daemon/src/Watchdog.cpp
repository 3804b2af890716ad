/*
 * Valheim Server Manager — Server watchdog (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/Watchdog.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

namespace vsm {

const char* processStateName(ProcessState s) noexcept {
    switch (s) {
        case ProcessState::Offline:  return "offline";
        case ProcessState::Starting: return "starting";
        case ProcessState::Online:   return "online";
        case ProcessState::Crashed:  return "crashed";
        case ProcessState::Stopping: return "stopping";
    }
    return "?";
}

// ----------------------------------------------------------------------------
// Launch description
// ----------------------------------------------------------------------------

std::string resolveExecutable(const ServerLaunchConfig& cfg) {
    if (!cfg.executable.empty()) return cfg.executable;
    return (fs::path(cfg.installDir) / "valheim_server.x86_64").string();
}

std::vector<std::string> buildLaunchArgs(const ServerLaunchConfig& cfg, const std::string& logFile) {
    std::vector<std::string> a{
        "-nographics", "-batchmode",
        "-name", cfg.name,
        "-port", std::to_string(cfg.port),
        "-world", cfg.world,
        "-password", cfg.password,
        "-public", cfg.isPublic ? "1" : "0"
    };
    if (cfg.crossplay) a.emplace_back("-crossplay");
    if (!cfg.savedir.empty()) {
        a.emplace_back("-savedir");
        a.push_back(cfg.savedir);
    }
    if (!logFile.empty()) {
        a.emplace_back("-logFile");
        a.push_back(logFile);
    }
    if (cfg.saveinterval > 0) {
        a.emplace_back("-saveinterval");
        a.push_back(std::to_string(cfg.saveinterval));
    }
    if (cfg.backups > 0) {
        a.emplace_back("-backups");
        a.push_back(std::to_string(cfg.backups));
    }
    return a;
}

std::map<std::string, std::string> buildLaunchEnv(const ServerLaunchConfig& cfg) {
    std::map<std::string, std::string> env;
    std::string ld = (fs::path(cfg.installDir) / "linux64").string();
    if (auto old = util::getenv_str("LD_LIBRARY_PATH"); old && !old->empty()) {
        ld += ":" + *old;
    }
    env["LD_LIBRARY_PATH"] = ld;
    env["SteamAppId"] = kSteamAppId;
    return env;
}

LaunchSpec buildLaunchSpec(const ServerLaunchConfig& cfg, const std::string& logFile) {
    LaunchSpec spec;
    spec.executable = resolveExecutable(cfg);
    spec.args       = buildLaunchArgs(cfg, logFile);
    spec.env        = buildLaunchEnv(cfg);
    spec.workDir    = cfg.installDir;
    return spec;
}

long long restartDelayFor(const WatchdogConfig& cfg, int attempt) {
    const double mult  = std::max(1.0, cfg.backoffMultiplier);
    const double cap   = static_cast<double>(std::max(cfg.maxRestartDelayMs, 0));
    const double delay = static_cast<double>(cfg.restartDelayMs) * std::pow(mult, std::max(attempt, 0));
    return static_cast<long long>(std::min(delay, cap));
}

// ----------------------------------------------------------------------------
// Watchdog
// ----------------------------------------------------------------------------

Watchdog::Watchdog(Scheduler& sched,
                   ServerLaunchConfig server,
                   WatchdogConfig cfg,
                   ProcessLauncher& launcher,
                   ProcessRecordStore* records,
                   RconManager* rcon)
: sched_(sched),
  server_(std::move(server)),
  cfg_(cfg),
  launcher_(launcher),
  records_(records),
  rcon_(rcon) {
    if (rcon_) {
        rconPlayersToken_ = rcon_->onPlayerListUpdate().subscribe(
            [this](const std::vector<std::string>& names) { onPlayerList_(names); });
    }
}

Watchdog::~Watchdog() {
    if (rcon_ && rconPlayersToken_) rcon_->onPlayerListUpdate().unsubscribe(rconPlayersToken_);
    cancel_(exitTask_);
    cancel_(startupTask_);
    cancel_(cooldownTask_);
    cancel_(restartTask_);
    cancel_(stopTask_);
    if (tailer_) tailer_->stop();
    if (proc_ && !proc_->pollExit()) {
        LOG_WARN("watchdog: destroyed while server pid %d is still running", static_cast<int>(proc_->pid()));
    }
}

void Watchdog::cancel_(Scheduler::TaskId& id) {
    if (id != Scheduler::kInvalidTask) {
        sched_.cancel(id);
        id = Scheduler::kInvalidTask;
    }
}

std::optional<pid_t> Watchdog::pid() const {
    if (!proc_) return std::nullopt;
    return proc_->pid();
}

bool Watchdog::restartPending() const {
    return restartTask_ != Scheduler::kInvalidTask && sched_.pending(restartTask_);
}

long long Watchdog::uptimeMs() const {
    if (!proc_) return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(sched_.now() - startedAt_).count();
}

void Watchdog::updateConfig(const WatchdogConfig& cfg) {
    cfg_ = cfg;
    LOG_DEBUG("watchdog: config updated (enabled=%d maxRestarts=%d restartDelay=%d)",
              cfg_.enabled ? 1 : 0, cfg_.maxRestarts, cfg_.restartDelayMs);
}

void Watchdog::updateServerConfig(const ServerLaunchConfig& server) {
    server_ = server;
}

void Watchdog::resetRestartCount() {
    attempts_ = 0;
    LOG_DEBUG("watchdog: restart count reset");
}

void Watchdog::setState_(ProcessState s) {
    if (s == state_) return;
    LOG_INFO("watchdog: %s -> %s", processStateName(state_), processStateName(s));
    state_ = s;
    stateChanged_.emit(s);
}

// ----------------------------------------------------------------------------
// Starting
// ----------------------------------------------------------------------------

bool Watchdog::start() {
    if (state_ != ProcessState::Offline && state_ != ProcessState::Crashed) {
        LOG_WARN("watchdog: start refused while %s", processStateName(state_));
        return false;
    }
    cancel_(restartTask_);
    return spawn_();
}

std::string Watchdog::nextLogFile_() const {
    if (!server_.logFile.empty()) return server_.logFile;
    fs::path dir = server_.logDir.empty() ? fs::path(server_.installDir) / "logs" : fs::path(server_.logDir);
    return (dir / ("server-" + util::file_stamp_ms() + ".log")).string();
}

bool Watchdog::spawn_() {
    restartTask_ = Scheduler::kInvalidTask;

    const std::string logFile = nextLogFile_();
    std::error_code ec;
    util::ensure_parent_dirs(logFile, &ec);
    if (ec) LOG_WARN("watchdog: cannot create log directory for %s: %s", logFile.c_str(), ec.message().c_str());
    // A fixed log file keeps content of earlier runs; skip it.
    const bool fromEnd = fs::exists(logFile, ec);

    const LaunchSpec spec = buildLaunchSpec(server_, logFile);
    LOG_INFO("watchdog: launching %s (world=%s port=%d)", spec.executable.c_str(),
             server_.world.c_str(), server_.port);

    setState_(ProcessState::Starting);
    if (state_ != ProcessState::Starting) return false; // a subscriber intervened

    try {
        proc_ = launcher_.launch(spec);
    } catch (const Error& e) {
        LOG_ERROR("watchdog: spawn failed: %s", e.what());
        proc_.reset();
        setState_(ProcessState::Crashed);
        error_.emit(e);
        return false;
    }

    startedAt_ = sched_.now();
    phase_ = StartupPhase::Idle;
    players_.clear();
    LOG_INFO("watchdog: server started with pid %d, log %s", static_cast<int>(proc_->pid()), logFile.c_str());

    if (records_) {
        ProcessRecord rec;
        rec.pid       = static_cast<int>(proc_->pid());
        rec.world     = server_.world;
        rec.port      = server_.port;
        rec.startedAt = util::utc_iso8601();
        rec.detached  = false;
        rec.logFile   = logFile;
        std::string err;
        if (!records_->write(rec, &err)) LOG_WARN("watchdog: %s", err.c_str());
    }

    follow_(logFile, fromEnd);

    exitTask_ = sched_.runEvery(Scheduler::Duration(std::max(cfg_.exitPollIntervalMs, 1)),
                                [this] { checkExit_(); });
    startupTask_ = sched_.runAfter(Scheduler::Duration(cfg_.startupTimeoutMs), [this] {
        startupTask_ = Scheduler::kInvalidTask;
        if (state_ == ProcessState::Starting) markOnline_(true);
    });
    return true;
}

void Watchdog::follow_(const std::string& logFile, bool fromEnd) {
    if (tailer_) {
        // The previous tailer may be on the stack (a log handler restarted
        // us); release it on a later scheduler pass.
        auto old = std::move(tailer_);
        old->stop();
        sched_.runAfter(Scheduler::Duration(0), [old] {});
    }
    logPath_ = logFile;
    tailer_ = std::make_shared<LogTailer>(sched_, logFile, parseServerEvent);
    tailer_->onLine().subscribe([this](const std::string& line) { onLine_(line); });
    tailer_->onEvent().subscribe([this](const LogEvent& ev) { onServerEvent_(ev); });
    tailer_->start(fromEnd);
}

void Watchdog::markOnline_(bool timedOut) {
    cancel_(startupTask_);
    if (timedOut) {
        LOG_WARN("watchdog: no readiness line after %d ms, assuming online", cfg_.startupTimeoutMs);
    }
    setState_(ProcessState::Online);
    if (state_ != ProcessState::Online) return;

    cancel_(cooldownTask_);
    cooldownTask_ = sched_.runAfter(Scheduler::Duration(cfg_.cooldownPeriodMs), [this] {
        cooldownTask_ = Scheduler::kInvalidTask;
        if (attempts_ != 0) {
            LOG_INFO("watchdog: stable for %d ms, restart count reset", cfg_.cooldownPeriodMs);
            attempts_ = 0;
        }
    });

    if (rcon_) rcon_->connect();
}

// ----------------------------------------------------------------------------
// Log and RCON input
// ----------------------------------------------------------------------------

void Watchdog::onLine_(const std::string& line) {
    log_.emit(line);
}

void Watchdog::onServerEvent_(const LogEvent& ev) {
    switch (ev.type) {
        case LogEventType::StartupPhase:
            phase_ = ev.phase;
            LOG_DEBUG("watchdog: startup phase %s", startupPhaseName(ev.phase));
            break;
        case LogEventType::ServerReady:
            phase_ = StartupPhase::Ready;
            break;
        case LogEventType::PlayerJoin:
            if (players_.insert(ev.name).second) {
                LOG_INFO("watchdog: player joined: %s", ev.name.c_str());
                playerJoin_.emit(ev.name);
            }
            break;
        case LogEventType::PlayerLeave:
            if (players_.erase(ev.name)) {
                LOG_INFO("watchdog: player left: %s", ev.name.c_str());
                playerLeave_.emit(ev.name);
            }
            break;
        default:
            break;
    }

    event_.emit(ev);

    if (ev.type == LogEventType::ServerReady && state_ == ProcessState::Starting) {
        markOnline_(false);
    }
}

void Watchdog::onPlayerList_(const std::vector<std::string>& names) {
    if (!proc_) return;
    const std::set<std::string> current(names.begin(), names.end());

    std::vector<std::string> left;
    for (const auto& p : players_) {
        if (!current.count(p)) left.push_back(p);
    }
    std::vector<std::string> joined;
    for (const auto& p : current) {
        if (!players_.count(p)) joined.push_back(p);
    }
    players_ = current;

    for (const auto& p : left) {
        LOG_INFO("watchdog: player left: %s", p.c_str());
        playerLeave_.emit(p);
    }
    for (const auto& p : joined) {
        LOG_INFO("watchdog: player joined: %s", p.c_str());
        playerJoin_.emit(p);
    }
}

// ----------------------------------------------------------------------------
// Exit handling
// ----------------------------------------------------------------------------

void Watchdog::checkExit_() {
    if (!proc_) return;
    if (auto status = proc_->pollExit()) handleExit_(*status);
}

void Watchdog::teardownRun_() {
    cancel_(exitTask_);
    cancel_(startupTask_);
    cancel_(cooldownTask_);
    cancel_(stopTask_);
    if (tailer_) tailer_->stop();
    if (rcon_) rcon_->disconnect();
    players_.clear();
    phase_ = StartupPhase::Idle;
}

void Watchdog::handleExit_(int status) {
    if (state_ == ProcessState::Stopping) {
        finishStop_();
        return;
    }

    const int pid = proc_ ? static_cast<int>(proc_->pid()) : 0;
    LOG_WARN("watchdog: server pid %d exited unexpectedly (status %d)", pid, status);
    teardownRun_();
    proc_.reset();
    if (records_) records_->remove();

    setState_(ProcessState::Crashed);
    error_.emit(Error(ErrorCode::ProcessExited,
                      "server exited unexpectedly with status " + std::to_string(status)));
    applyRestartPolicy_();
}

void Watchdog::applyRestartPolicy_() {
    if (state_ != ProcessState::Crashed) return; // handled from a callback
    if (!cfg_.enabled) {
        LOG_INFO("watchdog: automatic restart disabled");
        return;
    }
    if (attempts_ >= cfg_.maxRestarts) {
        LOG_ERROR("watchdog: giving up after %d restart attempts", attempts_);
        if (records_) records_->remove();
        maxRestarts_.emit();
        error_.emit(Error(ErrorCode::MaxRestartsExceeded,
                          "server crashed " + std::to_string(attempts_ + 1) +
                          " times in a row, not restarting"));
        return;
    }

    const long long delay = restartDelayFor(cfg_, attempts_);
    ++attempts_;
    LOG_INFO("watchdog: restart %d/%d in %lld ms", attempts_, cfg_.maxRestarts, delay);
    restart_.emit(attempts_, cfg_.maxRestarts);
    if (state_ != ProcessState::Crashed || restartTask_ != Scheduler::kInvalidTask) return;

    restartTask_ = sched_.runAfter(Scheduler::Duration(delay), [this] {
        restartTask_ = Scheduler::kInvalidTask;
        if (state_ != ProcessState::Crashed) return;
        if (!spawn_()) applyRestartPolicy_();
    });
}

// ----------------------------------------------------------------------------
// Stop / kill / detach / attach
// ----------------------------------------------------------------------------

void Watchdog::stop(Scheduler::Duration timeout, std::function<void()> onStopped) {
    cancel_(restartTask_);

    if (state_ == ProcessState::Stopping) {
        if (onStopped) stopWaiters_.push_back(std::move(onStopped));
        return;
    }
    if (!proc_) {
        if (state_ != ProcessState::Offline) {
            teardownRun_();
            setState_(ProcessState::Offline);
        }
        if (onStopped) onStopped();
        return;
    }

    if (onStopped) stopWaiters_.push_back(std::move(onStopped));
    LOG_INFO("watchdog: stopping server pid %d", static_cast<int>(proc_->pid()));
    cancel_(startupTask_);
    cancel_(cooldownTask_);
    if (rcon_) rcon_->disconnect();
    setState_(ProcessState::Stopping);
    if (state_ != ProcessState::Stopping || !proc_) return;

    if (!proc_->terminate()) LOG_WARN("watchdog: SIGTERM to pid %d failed", static_cast<int>(proc_->pid()));
    stopDeadline_ = sched_.now() + timeout;
    cancel_(stopTask_);
    stopTask_ = sched_.runEvery(Scheduler::Duration(kStopCheckIntervalMs), [this] { checkStop_(); });
    checkStop_();
}

void Watchdog::checkStop_() {
    if (state_ != ProcessState::Stopping || !proc_) return;
    if (proc_->pollExit()) {
        finishStop_();
        return;
    }
    if (sched_.now() >= stopDeadline_) {
        LOG_WARN("watchdog: pid %d ignored SIGTERM, sending SIGKILL", static_cast<int>(proc_->pid()));
        proc_->kill();
        finishStop_();
    }
}

void Watchdog::finishStop_() {
    teardownRun_();
    proc_.reset();
    if (records_) records_->remove();
    setState_(ProcessState::Offline);

    auto waiters = std::move(stopWaiters_);
    stopWaiters_.clear();
    for (auto& fn : waiters) {
        try {
            fn();
        } catch (const std::exception& ex) {
            LOG_WARN("watchdog: stop callback threw: %s", ex.what());
        }
    }
}

void Watchdog::kill() {
    cancel_(restartTask_);
    if (!proc_) {
        if (state_ != ProcessState::Offline) {
            teardownRun_();
            setState_(ProcessState::Offline);
        }
        return;
    }
    LOG_WARN("watchdog: killing server pid %d", static_cast<int>(proc_->pid()));
    if (!proc_->pollExit() && !proc_->kill()) {
        LOG_WARN("watchdog: SIGKILL to pid %d failed", static_cast<int>(proc_->pid()));
    }
    finishStop_();
}

bool Watchdog::detach() {
    if (!proc_) return false;
    cancel_(restartTask_);
    const int pid = static_cast<int>(proc_->pid());
    teardownRun_();

    if (records_) {
        ProcessRecord rec;
        if (auto old = records_->read(); old && old->pid == pid) rec = *old;
        rec.pid      = pid;
        rec.world    = rec.world.empty() ? server_.world : rec.world;
        rec.port     = rec.port ? rec.port : server_.port;
        if (rec.startedAt.empty()) rec.startedAt = util::utc_iso8601();
        rec.detached = true;
        rec.logFile  = logPath_;
        std::string err;
        if (!records_->write(rec, &err)) LOG_WARN("watchdog: %s", err.c_str());
    }

    proc_->release();
    proc_.reset();
    // Detaching is not a lifecycle change the server sees; no notification.
    state_ = ProcessState::Offline;
    LOG_INFO("watchdog: detached from server pid %d", pid);
    return true;
}

bool Watchdog::attach(const ProcessRecord& record) {
    if (state_ != ProcessState::Offline && state_ != ProcessState::Crashed) {
        LOG_WARN("watchdog: attach refused while %s", processStateName(state_));
        return false;
    }
    auto proc = launcher_.adopt(static_cast<pid_t>(record.pid));
    if (!proc) {
        LOG_WARN("watchdog: pid %d from record is not running", record.pid);
        return false;
    }
    cancel_(restartTask_);
    proc_ = std::move(proc);
    startedAt_ = sched_.now();
    players_.clear();
    phase_ = StartupPhase::Ready;

    if (records_) {
        ProcessRecord rec = record;
        rec.detached = false;
        std::string err;
        if (!records_->write(rec, &err)) LOG_WARN("watchdog: %s", err.c_str());
    }

    LOG_INFO("watchdog: attached to server pid %d (world=%s)", record.pid, record.world.c_str());
    if (!record.logFile.empty()) {
        follow_(record.logFile, true);
    } else {
        logPath_.clear();
    }
    exitTask_ = sched_.runEvery(Scheduler::Duration(std::max(cfg_.exitPollIntervalMs, 1)),
                                [this] { checkExit_(); });
    markOnline_(false);
    return true;
}

} // namespace vsm
