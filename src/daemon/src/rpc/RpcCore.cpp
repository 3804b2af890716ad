/*
 * Valheim Server Manager — RPC: introspection (commands, help, ping, version)
 * (c) 2025 ValheimServerManager contributors
 */
#include <string>

#include <nlohmann/json.hpp>

#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"
#include "include/RconProtocol.hpp"
#include "include/Version.hpp"

namespace vsm {

using nlohmann::json;

class Daemon;

void BindRpcCore(Daemon&, CommandRegistry& reg) {
    reg.add("commands", "List available RPC commands", [&reg](const RpcRequest& rq) {
        return ok_(rq, "commands", reg.listJson());
    });

    reg.add("help", "Describe one command: {name}", [&reg](const RpcRequest& rq) -> RpcResult {
        const std::string name = paramString(rq, "name");
        if (name.empty()) {
            return err_(rq, "help", rpc_errors::kInvalidParams, "missing 'name'");
        }
        const auto text = reg.help(name);
        if (!text) {
            return err_(rq, "help", rpc_errors::kMethodNotFound, "unknown command", json{{"name", name}});
        }
        return ok_(rq, "help", json{{"name", name}, {"help", *text}});
    });

    reg.add("ping", "Daemon liveness check", [](const RpcRequest& rq) {
        LOG_TRACE("rpc: ping");
        return ok_(rq, "ping", json{{"pong", true}});
    });

    reg.add("version", "Daemon and protocol versions", [](const RpcRequest& rq) {
        return ok_(rq, "version", json{
            {"name",        "vsmd"},
            {"version",     VSMD_VERSION},
            {"jsonrpc",     "2.0"},
            {"rconMaxBody", rcon::kMaxBodySize},
        });
    });
}

} // namespace vsm
