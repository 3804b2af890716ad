/*
 * Valheim Server Manager — RPC: Server lifecycle
 * (c) 2025 ValheimServerManager contributors
 */
#include <nlohmann/json.hpp>
#include <string>

#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"   // ok_ / err_
#include "include/Log.hpp"

namespace vsm {

using nlohmann::json;

namespace {

int paramInt_(const RpcRequest& rq, const char* key, int def) {
    const json p = paramsAsObject(rq);
    auto it = p.find(key);
    if (it == p.end() || !it->is_number_integer()) return def;
    return it->get<int>();
}

} // namespace

void BindRpcServer(Daemon& self, CommandRegistry& reg) {
    reg.add(
        "server.status",
        "Server process state, watchdog counters and players",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_TRACE("rpc server.status");
            return ok_(rq, "server.status", self.serverStatus());
        }
    );

    reg.add(
        "server.start",
        "Launch the dedicated server",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc server.start");
            Watchdog& wd = self.watchdog();
            if (wd.state() != ProcessState::Offline && wd.state() != ProcessState::Crashed) {
                return err_(rq, "server.start", rpc_errors::kInvalidState,
                            std::string("server is ") + processStateName(wd.state()));
            }
            if (!wd.start()) {
                return err_(rq, "server.start", rpc_errors::kInternal, "launch failed, see daemon log");
            }
            return ok_(rq, "server.start", self.serverStatus());
        }
    );

    // Params: { timeoutMs?: int }. Returns immediately; poll server.status.
    reg.add(
        "server.stop",
        "Stop the server gracefully (SIGKILL after timeoutMs)",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc server.stop");
            const int timeoutMs = paramInt_(rq, "timeoutMs", Watchdog::kDefaultStopTimeoutMs);
            if (timeoutMs <= 0) {
                return err_(rq, "server.stop", rpc_errors::kInvalidParams, "timeoutMs must be positive");
            }
            self.watchdog().stop(Scheduler::Duration(timeoutMs));
            return ok_(rq, "server.stop", json{
                {"state", processStateName(self.watchdog().state())}
            });
        }
    );

    reg.add(
        "server.kill",
        "Kill the server immediately",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc server.kill");
            self.watchdog().kill();
            return ok_(rq, "server.kill", json{
                {"state", processStateName(self.watchdog().state())}
            });
        }
    );

    reg.add(
        "server.detach",
        "Leave the server running without supervision",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc server.detach");
            const auto pid = self.watchdog().pid();
            if (!self.watchdog().detach()) {
                return err_(rq, "server.detach", rpc_errors::kInvalidState, "no server process");
            }
            return ok_(rq, "server.detach", json{{"pid", static_cast<int>(*pid)}, {"detached", true}});
        }
    );

    reg.add(
        "server.restart-count.reset",
        "Reset the watchdog restart counter",
        [&self](const RpcRequest& rq) -> RpcResult {
            LOG_INFO("rpc server.restart-count.reset");
            self.watchdog().resetRestartCount();
            return ok_(rq, "server.restart-count.reset", json{{"restartCount", 0}});
        }
    );
}

} // namespace vsm
