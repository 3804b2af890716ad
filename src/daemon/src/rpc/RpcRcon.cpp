/*
 * Valheim Server Manager — RPC: RCON admin commands
 * (c) 2025 ValheimServerManager contributors
 */
#include <functional>
#include <iterator>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"   // ok_ / err_
#include "include/Log.hpp"

namespace vsm {

using nlohmann::json;

namespace {

using Reply       = CommandRegistry::Reply;
using RconCall    = std::function<void(RconManager&, RconManager::CommandHandler)>;
using RconNamedCall =
    std::function<void(RconManager&, const std::string&, RconManager::CommandHandler)>;

RpcResult reply_(Daemon& self, const RpcRequest& rq, const char* method,
                 const std::optional<std::string>& response) {
    if (response) return ok_(rq, method, json{{"response", *response}});
    if (!self.rcon().isConnected()) {
        return err_(rq, method, rpc_errors::kNotConnected, "rcon is not connected");
    }
    return err_(rq, method, rpc_errors::kCommandFailed, "no reply from server");
}

RpcResult notConnected_(const RpcRequest& rq, const char* method) {
    return err_(rq, method, rpc_errors::kNotConnected, "rcon is not connected");
}

/* Completion that turns the raw reply text into the RPC result. */
RconManager::CommandHandler answer_(Daemon& self, const RpcRequest& rq, const char* method, Reply reply) {
    return [&self, rq, method, reply](std::optional<std::string> response) {
        reply(reply_(self, rq, method, response));
    };
}

// Commands without parameters that answer with the raw reply text
void addSimple_(Daemon& self, CommandRegistry& reg, const char* method, const char* help, RconCall fn) {
    reg.addAsync(method, help, [&self, method, fn](const RpcRequest& rq, Reply reply) {
        if (!self.rcon().isConnected()) return reply(notConnected_(rq, method));
        LOG_DEBUG("rpc %s", method);
        fn(self.rcon(), answer_(self, rq, method, std::move(reply)));
    });
}

// Commands taking one string parameter
void addNamed_(Daemon& self, CommandRegistry& reg, const char* method, const char* help,
               const char* param, RconNamedCall fn) {
    reg.addAsync(method, help, [&self, method, param, fn](const RpcRequest& rq, Reply reply) {
        const std::string value = paramString(rq, param);
        if (value.empty()) {
            return reply(err_(rq, method, rpc_errors::kInvalidParams, std::string("missing '") + param + "'"));
        }
        if (!self.rcon().isConnected()) return reply(notConnected_(rq, method));
        LOG_DEBUG("rpc %s %s", method, value.c_str());
        fn(self.rcon(), value, answer_(self, rq, method, std::move(reply)));
    });
}

bool isKnown_(const char* const* begin, const char* const* end, const std::string& key) {
    for (auto it = begin; it != end; ++it) {
        if (key == *it) return true;
    }
    return false;
}

json toArray_(const char* const* begin, const char* const* end) {
    json a = json::array();
    for (auto it = begin; it != end; ++it) a.push_back(*it);
    return a;
}

} // namespace

void BindRpcRcon(Daemon& self, CommandRegistry& reg) {
    // ---- connection --------------------------------------------------------
    reg.add(
        "rcon.status",
        "RCON connection state",
        [&self](const RpcRequest& rq) -> RpcResult {
            return ok_(rq, "rcon.status", self.rconStatus());
        }
    );

    reg.add(
        "rcon.connect",
        "Connect to the server's RCON port",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc rcon.connect");
            const auto& cfg = self.rcon().config();
            if (!cfg || !cfg->enabled) {
                return err_(rq, "rcon.connect", rpc_errors::kInvalidState, "rcon is disabled in the configuration");
            }
            self.rcon().connect();
            return ok_(rq, "rcon.connect", self.rconStatus());
        }
    );

    reg.add(
        "rcon.disconnect",
        "Close the RCON connection",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc rcon.disconnect");
            self.rcon().disconnect();
            return ok_(rq, "rcon.disconnect", self.rconStatus());
        }
    );

    // ---- players -----------------------------------------------------------
    reg.addAsync(
        "rcon.players",
        "List online players",
        [&self](const RpcRequest& rq, Reply reply) {
            if (!self.rcon().isConnected()) return reply(notConnected_(rq, "rcon.players"));
            self.rcon().getPlayers([&self, rq, reply](std::optional<std::vector<std::string>> players) {
                if (!players) return reply(reply_(self, rq, "rcon.players", std::nullopt));
                reply(ok_(rq, "rcon.players", json{{"players", *players}, {"count", players->size()}}));
            });
        }
    );

    addNamed_(self, reg, "rcon.kick", "Kick a player: {name}", "name",
              [](RconManager& m, const std::string& v, RconManager::CommandHandler h) { m.kickPlayer(v, std::move(h)); });
    addNamed_(self, reg, "rcon.ban", "Ban a player: {name}", "name",
              [](RconManager& m, const std::string& v, RconManager::CommandHandler h) { m.banPlayer(v, std::move(h)); });
    addNamed_(self, reg, "rcon.unban", "Unban a player name or Steam ID: {name}", "name",
              [](RconManager& m, const std::string& v, RconManager::CommandHandler h) { m.unbanPlayer(v, std::move(h)); });

    reg.addAsync(
        "rcon.banned",
        "List banned players",
        [&self](const RpcRequest& rq, Reply reply) {
            if (!self.rcon().isConnected()) return reply(notConnected_(rq, "rcon.banned"));
            self.rcon().getBannedPlayers([rq, reply](std::vector<std::string> banned) {
                reply(ok_(rq, "rcon.banned", json{{"banned", banned}}));
            });
        }
    );

    // ---- events ------------------------------------------------------------
    reg.addAsync(
        "rcon.event",
        "Trigger a raid event: {key}",
        [&self](const RpcRequest& rq, Reply reply) {
            const std::string key = paramString(rq, "key");
            if (!isKnown_(std::begin(rcon_events::kAll), std::end(rcon_events::kAll), key)) {
                return reply(err_(rq, "rcon.event", rpc_errors::kInvalidParams, "unknown event key",
                                  json{{"known", toArray_(std::begin(rcon_events::kAll), std::end(rcon_events::kAll))}}));
            }
            if (!self.rcon().isConnected()) return reply(notConnected_(rq, "rcon.event"));
            LOG_INFO("rpc rcon.event %s", key.c_str());
            self.rcon().triggerEvent(key, answer_(self, rq, "rcon.event", reply));
        }
    );
    addSimple_(self, reg, "rcon.event.random", "Trigger a random raid event",
               [](RconManager& m, RconManager::CommandHandler h) { m.triggerRandomEvent(std::move(h)); });
    addSimple_(self, reg, "rcon.event.stop", "Stop the current raid event",
               [](RconManager& m, RconManager::CommandHandler h) { m.stopEvent(std::move(h)); });

    // ---- global keys -------------------------------------------------------
    reg.addAsync(
        "rcon.keys",
        "List global keys",
        [&self](const RpcRequest& rq, Reply reply) {
            if (!self.rcon().isConnected()) return reply(notConnected_(rq, "rcon.keys"));
            self.rcon().listGlobalKeys([rq, reply](std::vector<std::string> keys) {
                reply(ok_(rq, "rcon.keys", json{{"keys", keys}}));
            });
        }
    );
    addNamed_(self, reg, "rcon.key.set", "Set a global key: {key}", "key",
              [](RconManager& m, const std::string& v, RconManager::CommandHandler h) { m.setGlobalKey(v, std::move(h)); });
    addNamed_(self, reg, "rcon.key.remove", "Remove a global key: {key}", "key",
              [](RconManager& m, const std::string& v, RconManager::CommandHandler h) { m.removeGlobalKey(v, std::move(h)); });
    addSimple_(self, reg, "rcon.keys.reset", "Remove all global keys",
               [](RconManager& m, RconManager::CommandHandler h) { m.resetGlobalKeys(std::move(h)); });

    // ---- time --------------------------------------------------------------
    addSimple_(self, reg, "rcon.sleep", "Skip to the next morning",
               [](RconManager& m, RconManager::CommandHandler h) { m.sleep(std::move(h)); });

    reg.addAsync(
        "rcon.skiptime",
        "Advance world time: {seconds}",
        [&self](const RpcRequest& rq, Reply reply) {
            const json p = paramsAsObject(rq);
            auto it = p.find("seconds");
            if (it == p.end() || !it->is_number_integer() || it->get<long>() <= 0) {
                return reply(err_(rq, "rcon.skiptime", rpc_errors::kInvalidParams,
                                  "'seconds' must be a positive integer"));
            }
            if (!self.rcon().isConnected()) return reply(notConnected_(rq, "rcon.skiptime"));
            self.rcon().skipTime(it->get<long>(), answer_(self, rq, "rcon.skiptime", reply));
        }
    );

    // ---- server ------------------------------------------------------------
    addSimple_(self, reg, "rcon.info", "Server information",
               [](RconManager& m, RconManager::CommandHandler h) { m.getServerInfo(std::move(h)); });
    addSimple_(self, reg, "rcon.ping", "Round trip to the server",
               [](RconManager& m, RconManager::CommandHandler h) { m.pingServer(std::move(h)); });
    addSimple_(self, reg, "rcon.removedrops", "Remove dropped items from the world",
               [](RconManager& m, RconManager::CommandHandler h) { m.removeDrops(std::move(h)); });
    addSimple_(self, reg, "rcon.save", "Save the world",
               [](RconManager& m, RconManager::CommandHandler h) { m.save(std::move(h)); });
}

} // namespace vsm
