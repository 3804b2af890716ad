/*
 * Valheim Server Manager — RCON connection manager (header)
 * Owns one RconConnection: reconnects, polls the player list and exposes
 * the admin command set of the server's RCON plugin.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "RconClient.hpp"
#include "Scheduler.hpp"
#include "Signal.hpp"

namespace vsm {

enum class ConnectionState { Disconnected, Connecting, Connected, Error };
const char* connectionStateName(ConnectionState s) noexcept;

struct RconManagerConfig {
    std::string host{"127.0.0.1"};
    int         port{25575};
    std::string password;
    int         timeoutMs{5000};
    bool        enabled{true};
    bool        autoReconnect{true};
    int         pollIntervalMs{10000};
};

/* Optional plain callbacks; held as one replaceable subscription each. */
struct RconManagerCallbacks {
    std::function<void(ConnectionState)>                 onConnectionStateChange;
    std::function<void(const std::vector<std::string>&)> onPlayerListUpdate;
};

/* Event keys accepted by "randomevent <key>". */
namespace rcon_events {
    constexpr const char* kArmyEikthyr  = "army_eikthyr";
    constexpr const char* kArmyTheElder = "army_theelder";
    constexpr const char* kArmyBonemass = "army_bonemass";
    constexpr const char* kArmyModer    = "army_moder";
    constexpr const char* kArmyGoblin   = "army_goblin";
    constexpr const char* kForestTrolls = "foresttrolls";
    constexpr const char* kSkeletons    = "skeletons";
    constexpr const char* kBlobs        = "blobs";
    constexpr const char* kWolves       = "wolves";
    constexpr const char* kBats         = "bats";
    constexpr const char* kSerpents     = "serpents";

    constexpr const char* const kAll[] = {
        kArmyEikthyr, kArmyTheElder, kArmyBonemass, kArmyModer, kArmyGoblin,
        kForestTrolls, kSkeletons, kBlobs, kWolves, kBats, kSerpents
    };
}

/* Boss progression global keys accepted by "setkey <key>". */
namespace rcon_keys {
    constexpr const char* kDefeatedEikthyr    = "defeated_eikthyr";
    constexpr const char* kDefeatedElder      = "defeated_gdking";
    constexpr const char* kDefeatedBonemass   = "defeated_bonemass";
    constexpr const char* kDefeatedModer      = "defeated_dragon";
    constexpr const char* kDefeatedYagluth    = "defeated_goblinking";
    constexpr const char* kDefeatedQueen      = "defeated_queen";

    constexpr const char* const kAll[] = {
        kDefeatedEikthyr, kDefeatedElder, kDefeatedBonemass,
        kDefeatedModer, kDefeatedYagluth, kDefeatedQueen
    };
}

/*
 * RconManager: explicitly owned; every timer and socket runs on the given
 * Scheduler. Command wrappers return at once; their handler receives nullopt
 * when not connected, on error, or when the link dropped mid-command
 * (callers cannot tell these apart). Handlers run on a later scheduler pass
 * and are dropped if the manager is destroyed first.
 */
class RconManager {
public:
    using ConnectionFactory =
        std::function<std::unique_ptr<RconConnection>(Scheduler&, const RconManagerConfig&)>;
    using CommandHandler = std::function<void(std::optional<std::string>)>;
    using ListHandler    = std::function<void(std::vector<std::string>)>;
    using PlayersHandler = std::function<void(std::optional<std::vector<std::string>>)>;

    static constexpr int kReconnectDelayMs = 5000;

    explicit RconManager(Scheduler& sched, ConnectionFactory factory = {});
    ~RconManager();

    RconManager(const RconManager&) = delete;
    RconManager& operator=(const RconManager&) = delete;

    /* Store configuration. Same host/port/password while connected: only
     * the callbacks are swapped. Otherwise any live link is dropped first. */
    void initialize(const RconManagerConfig& cfg, RconManagerCallbacks callbacks = {});

    /* Starts a connection attempt. No-op when uninitialized, disabled,
     * connecting or connected. */
    void connect();

    /* Idempotent; cancels poll and reconnect timers and abandons a connect
     * in progress. */
    void disconnect();

    bool isInitialized() const noexcept { return cfg_.has_value(); }
    bool isConnected() const;
    ConnectionState state() const noexcept { return state_; }
    const std::optional<RconManagerConfig>& config() const noexcept { return cfg_; }
    bool reconnectPending() const;
    bool pollingActive() const;
    const std::vector<std::string>& lastPlayers() const noexcept { return lastPlayers_; }

    Signal<ConnectionState>& onConnectionStateChange() { return stateChanged_; }
    Signal<const std::vector<std::string>&>& onPlayerListUpdate() { return playersUpdated_; }

    /* Raw command; nullopt when not connected or on failure. */
    void sendCommand(const std::string& command, CommandHandler done = {});

    // Players
    void kickPlayer(const std::string& name, CommandHandler done = {});
    void banPlayer(const std::string& name, CommandHandler done = {});
    void unbanPlayer(const std::string& identifier, CommandHandler done = {});
    void getBannedPlayers(ListHandler done);
    void getPlayers(PlayersHandler done);

    // Events
    void triggerEvent(const std::string& eventKey, CommandHandler done = {});
    void triggerRandomEvent(CommandHandler done = {});
    void stopEvent(CommandHandler done = {});

    // Global keys
    void listGlobalKeys(ListHandler done);
    void setGlobalKey(const std::string& key, CommandHandler done = {});
    void removeGlobalKey(const std::string& key, CommandHandler done = {});
    void resetGlobalKeys(CommandHandler done = {});

    // Time
    void sleep(CommandHandler done = {});
    void skipTime(long seconds, CommandHandler done = {});

    // Server
    void getServerInfo(CommandHandler done = {});
    void pingServer(CommandHandler done = {});
    void removeDrops(CommandHandler done = {});
    void save(CommandHandler done = {});

    /* Player names from a "players" reply: blank lines and the header dropped. */
    static std::vector<std::string> parsePlayers(const std::string& response);

private:
    std::unique_ptr<RconConnection> makeConnection_();
    void onConnected_(unsigned long epoch, RconResult result);
    void setState_(ConnectionState s);
    void startPolling_();
    void stopPolling_();
    void pollPlayers_();
    void scheduleReconnect_();
    void clearReconnect_();
    void handleLinkLost_();
    void post_(CommandHandler done, std::optional<std::string> response);

    Scheduler&                      sched_;
    ConnectionFactory               factory_;
    std::optional<RconManagerConfig> cfg_;
    std::unique_ptr<RconConnection> client_;
    ConnectionState                 state_{ConnectionState::Disconnected};
    std::vector<std::string>        lastPlayers_;
    bool                            pollInFlight_{false};

    Scheduler::TaskId pollTask_{Scheduler::kInvalidTask};
    Scheduler::TaskId reconnectTask_{Scheduler::kInvalidTask};

    // Bumped by disconnect()/initialize()/link loss so completions of work
    // started earlier can tell they are stale.
    unsigned long epoch_{0};
    // Expires with the manager; completion handlers hold a weak reference.
    std::shared_ptr<char> alive_{std::make_shared<char>(0)};

    Signal<ConnectionState>                 stateChanged_;
    Signal<const std::vector<std::string>&> playersUpdated_;
    SubscriptionToken cbStateToken_{0};
    SubscriptionToken cbPlayersToken_{0};
};

} // namespace vsm
