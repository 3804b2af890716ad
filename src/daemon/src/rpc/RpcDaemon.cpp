/*
 * Valheim Server Manager — RPC: Daemon control
 * (c) 2025 ValheimServerManager contributors
 */
#include <nlohmann/json.hpp>
#include <string>

#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"   // ok_ / err_
#include "include/Log.hpp"

namespace vsm {

using nlohmann::json;

void BindRpcDaemon(Daemon& self, CommandRegistry& reg) {
    // daemon.shutdown: graceful stop; the server is stopped or detached per config
    reg.add(
        "daemon.shutdown",
        "Shutdown daemon gracefully",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc daemon.shutdown");
            self.requestStop();
            return ok_(rq, "daemon.shutdown", json{
                {"status", "stopping"},
                {"server", self.config().daemon.detachOnExit ? "detach" : "stop"}
            });
        }
    );

    // daemon.loglevel: read, or set with {level}
    reg.add(
        "daemon.loglevel",
        "Get or set the log level: {level?}",
        [](const RpcRequest& rq) -> RpcResult {
            const std::string wanted = paramString(rq, "level");
            if (!wanted.empty()) {
                const auto lvl = parseLogLevel(wanted);
                if (!lvl) {
                    return err_(rq, "daemon.loglevel", rpc_errors::kInvalidParams, "unknown level",
                                json{{"known", json::array({"error", "warn", "info", "debug", "trace"})}});
                }
                Logger::instance().setLevel(*lvl);
                LOG_INFO("rpc: log level set to %s", logLevelName(*lvl));
            }
            return ok_(rq, "daemon.loglevel", json{{"level", logLevelName(Logger::instance().level())}});
        }
    );
}

} // namespace vsm
