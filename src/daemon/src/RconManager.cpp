/*
 * Valheim Server Manager — RCON connection manager (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/RconManager.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

namespace vsm {

const char* connectionStateName(ConnectionState s) noexcept {
    switch (s) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
        case ConnectionState::Error:        return "error";
    }
    return "?";
}

RconManager::RconManager(Scheduler& sched, ConnectionFactory factory)
: sched_(sched), factory_(std::move(factory)) {}

RconManager::~RconManager() {
    // Quiet teardown: subscribers may already be gone.
    stopPolling_();
    clearReconnect_();
    if (client_) {
        client_->disconnect();
        client_.reset();
    }
}

std::unique_ptr<RconConnection> RconManager::makeConnection_() {
    if (factory_) return factory_(sched_, *cfg_);
    RconClientConfig cc;
    cc.host      = cfg_->host;
    cc.port      = cfg_->port;
    cc.password  = cfg_->password;
    cc.timeoutMs = cfg_->timeoutMs;
    return std::make_unique<RconClient>(sched_, cc);
}

void RconManager::initialize(const RconManagerConfig& cfg, RconManagerCallbacks callbacks) {
    const bool sameTarget = cfg_ && cfg_->host == cfg.host && cfg_->port == cfg.port &&
                            cfg_->password == cfg.password && isConnected();

    if (cbStateToken_)   stateChanged_.unsubscribe(cbStateToken_);
    if (cbPlayersToken_) playersUpdated_.unsubscribe(cbPlayersToken_);
    cbStateToken_ = cbPlayersToken_ = 0;
    if (callbacks.onConnectionStateChange) {
        cbStateToken_ = stateChanged_.subscribe(std::move(callbacks.onConnectionStateChange));
    }
    if (callbacks.onPlayerListUpdate) {
        cbPlayersToken_ = playersUpdated_.subscribe(std::move(callbacks.onPlayerListUpdate));
    }

    if (sameTarget) {
        // Keep the link; non-identity settings still apply from here on.
        const int oldPoll = cfg_->pollIntervalMs;
        cfg_ = cfg;
        if (oldPoll != cfg.pollIntervalMs) startPolling_();
        LOG_DEBUG("rcon: initialize with unchanged target, keeping connection");
        return;
    }

    disconnect();
    cfg_ = cfg;
    LOG_DEBUG("rcon: configured for %s:%d (enabled=%d autoReconnect=%d)",
              cfg.host.c_str(), cfg.port, cfg.enabled ? 1 : 0, cfg.autoReconnect ? 1 : 0);
}

bool RconManager::isConnected() const {
    return client_ && client_->isConnected();
}

bool RconManager::reconnectPending() const {
    return reconnectTask_ != Scheduler::kInvalidTask && sched_.pending(reconnectTask_);
}

bool RconManager::pollingActive() const {
    return pollTask_ != Scheduler::kInvalidTask && sched_.pending(pollTask_);
}

void RconManager::connect() {
    if (!cfg_) {
        LOG_WARN("rcon: cannot connect, not initialized");
        return;
    }
    if (!cfg_->enabled) {
        LOG_INFO("rcon: disabled, not connecting");
        return;
    }
    if (isConnected() || state_ == ConnectionState::Connecting) return;

    clearReconnect_();
    const unsigned long epoch = ++epoch_;
    setState_(ConnectionState::Connecting);
    if (epoch != epoch_) return; // disconnected from a state callback

    client_ = makeConnection_();
    std::weak_ptr<char> alive = alive_;
    try {
        client_->connect([this, alive, epoch](RconResult r) {
            if (alive.expired()) return;
            onConnected_(epoch, std::move(r));
        });
    } catch (const Error& ex) {
        RconResult r;
        r.error = ex;
        onConnected_(epoch, std::move(r));
    }
}

void RconManager::onConnected_(unsigned long epoch, RconResult result) {
    if (epoch != epoch_) return; // disconnect() or initialize() got there first

    if (!result.ok()) {
        LOG_ERROR("rcon: connection to %s:%d failed: %s",
                  cfg_->host.c_str(), cfg_->port, result.error->what());
        if (client_) {
            client_->disconnect();
            client_.reset();
        }
        setState_(ConnectionState::Error);
        if (epoch != epoch_) return;
        if (cfg_->autoReconnect) scheduleReconnect_();
        return;
    }

    LOG_INFO("rcon: connected to %s:%d", cfg_->host.c_str(), cfg_->port);
    setState_(ConnectionState::Connected);
    if (epoch != epoch_ || !isConnected()) return;
    startPolling_();
}

void RconManager::disconnect() {
    ++epoch_;
    stopPolling_();
    clearReconnect_();
    pollInFlight_ = false;
    if (client_) {
        client_->disconnect();
        client_.reset();
        LOG_INFO("rcon: disconnected");
    }
    lastPlayers_.clear();
    setState_(ConnectionState::Disconnected);
}

void RconManager::setState_(ConnectionState s) {
    if (state_ == s) return;
    LOG_DEBUG("rcon: state %s -> %s", connectionStateName(state_), connectionStateName(s));
    state_ = s;
    stateChanged_.emit(s);
}

void RconManager::startPolling_() {
    stopPolling_();
    const int interval = (cfg_ && cfg_->pollIntervalMs > 0) ? cfg_->pollIntervalMs : 10000;
    pollTask_ = sched_.runEvery(Scheduler::Duration(interval), [this] { pollPlayers_(); });
}

void RconManager::stopPolling_() {
    if (pollTask_ != Scheduler::kInvalidTask) {
        sched_.cancel(pollTask_);
        pollTask_ = Scheduler::kInvalidTask;
    }
}

void RconManager::pollPlayers_() {
    // A poll still waiting for its reply covers this tick too.
    if (!isConnected() || pollInFlight_) return;
    pollInFlight_ = true;
    const unsigned long epoch = epoch_;
    sendCommand("players", [this, epoch](std::optional<std::string> response) {
        if (epoch != epoch_) return;
        pollInFlight_ = false;
        if (!response) return;
        lastPlayers_ = parsePlayers(*response);
        playersUpdated_.emit(lastPlayers_);
    });
}

void RconManager::scheduleReconnect_() {
    clearReconnect_();
    reconnectTask_ = sched_.runAfter(Scheduler::Duration(kReconnectDelayMs), [this] {
        reconnectTask_ = Scheduler::kInvalidTask;
        LOG_INFO("rcon: attempting reconnect");
        connect();
    });
}

void RconManager::clearReconnect_() {
    if (reconnectTask_ != Scheduler::kInvalidTask) {
        sched_.cancel(reconnectTask_);
        reconnectTask_ = Scheduler::kInvalidTask;
    }
}

void RconManager::handleLinkLost_() {
    LOG_WARN("rcon: connection lost");
    stopPolling_();
    pollInFlight_ = false;
    if (client_) {
        client_->disconnect();
        client_.reset();
    }
    const unsigned long epoch = ++epoch_;
    setState_(ConnectionState::Disconnected);
    if (epoch != epoch_) return;
    if (cfg_ && cfg_->enabled && cfg_->autoReconnect) scheduleReconnect_();
}

void RconManager::post_(CommandHandler done, std::optional<std::string> response) {
    if (!done) return;
    std::weak_ptr<char> alive = alive_;
    sched_.runAfter(Scheduler::Duration(0), [alive, done = std::move(done), response = std::move(response)] {
        if (!alive.expired()) done(response);
    });
}

void RconManager::sendCommand(const std::string& command, CommandHandler done) {
    if (!isConnected()) {
        LOG_WARN("rcon: cannot send \"%s\": not connected", command.c_str());
        post_(std::move(done), std::nullopt);
        return;
    }

    const unsigned long epoch = epoch_;
    std::weak_ptr<char> alive = alive_;
    auto onReply = [this, alive, epoch, command, done](RconResult r) {
        if (alive.expired()) return;
        if (r.ok()) {
            if (done) done(std::move(r.body));
            return;
        }
        LOG_ERROR("rcon: command \"%s\" failed: %s", command.c_str(), r.error->what());
        // Only the link this command went out on can be declared lost.
        if (epoch == epoch_ && !isConnected()) handleLinkLost_();
        if (done) done(std::nullopt);
    };
    try {
        client_->send(command, std::move(onReply));
    } catch (const Error& ex) {
        LOG_ERROR("rcon: command \"%s\" rejected: %s", command.c_str(), ex.what());
        if (!isConnected()) handleLinkLost_();
        post_(std::move(done), std::nullopt);
    }
}

std::vector<std::string> RconManager::parsePlayers(const std::string& response) {
    std::vector<std::string> out;
    for (auto& line : util::nonEmptyLines(response)) {
        if (line == "Players:") continue;
        out.push_back(std::move(line));
    }
    return out;
}

/* ----------------------------------------------------------------------------
 * Command wrappers
 * ----------------------------------------------------------------------------*/

void RconManager::kickPlayer(const std::string& name, CommandHandler done) {
    sendCommand("kick " + name, std::move(done));
}

void RconManager::banPlayer(const std::string& name, CommandHandler done) {
    sendCommand("ban " + name, std::move(done));
}

void RconManager::unbanPlayer(const std::string& identifier, CommandHandler done) {
    sendCommand("unban " + identifier, std::move(done));
}

void RconManager::getBannedPlayers(ListHandler done) {
    sendCommand("banned", [done](std::optional<std::string> r) {
        if (done) done(r ? util::nonEmptyLines(*r) : std::vector<std::string>{});
    });
}

void RconManager::getPlayers(PlayersHandler done) {
    sendCommand("players", [this, done](std::optional<std::string> r) {
        if (!r) {
            if (done) done(std::nullopt);
            return;
        }
        lastPlayers_ = parsePlayers(*r);
        if (done) done(lastPlayers_);
    });
}

void RconManager::triggerEvent(const std::string& eventKey, CommandHandler done) {
    sendCommand("randomevent " + eventKey, std::move(done));
}

void RconManager::triggerRandomEvent(CommandHandler done) {
    sendCommand("randomevent", std::move(done));
}

void RconManager::stopEvent(CommandHandler done) {
    sendCommand("stopevent", std::move(done));
}

void RconManager::listGlobalKeys(ListHandler done) {
    sendCommand("listkeys", [done](std::optional<std::string> r) {
        if (done) done(r ? util::nonEmptyLines(*r) : std::vector<std::string>{});
    });
}

void RconManager::setGlobalKey(const std::string& key, CommandHandler done) {
    sendCommand("setkey " + key, std::move(done));
}

void RconManager::removeGlobalKey(const std::string& key, CommandHandler done) {
    sendCommand("removekey " + key, std::move(done));
}

void RconManager::resetGlobalKeys(CommandHandler done) {
    sendCommand("resetkeys", std::move(done));
}

void RconManager::sleep(CommandHandler done) {
    sendCommand("sleep", std::move(done));
}

void RconManager::skipTime(long seconds, CommandHandler done) {
    sendCommand("skiptime " + std::to_string(seconds), std::move(done));
}

void RconManager::getServerInfo(CommandHandler done) {
    sendCommand("info", std::move(done));
}

void RconManager::pingServer(CommandHandler done) {
    sendCommand("ping", std::move(done));
}

void RconManager::removeDrops(CommandHandler done) {
    sendCommand("removedrops", std::move(done));
}

void RconManager::save(CommandHandler done) {
    sendCommand("save", std::move(done));
}

} // namespace vsm
