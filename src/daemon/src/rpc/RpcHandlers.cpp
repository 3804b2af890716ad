/*
 * Valheim Server Manager — RPC binder (thin aggregator)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"

namespace vsm {
// Forward declarations for all RPC binders
void BindRpcCore(Daemon&, CommandRegistry&);
void BindRpcDaemon(Daemon&, CommandRegistry&);
void BindRpcServer(Daemon&, CommandRegistry&);
void BindRpcRcon(Daemon&, CommandRegistry&);
void BindRpcLogs(Daemon&, CommandRegistry&);

// Keep this file tiny; all handlers live in src/rpc/*
void BindDaemonRpcCommands(Daemon& self, CommandRegistry& reg) {
    LOG_TRACE("rpc: binding commands");

    // Core/system
    BindRpcCore(self, reg);
    BindRpcDaemon(self, reg);

    // Server lifecycle / watchdog
    BindRpcServer(self, reg);

    // RCON admin commands
    BindRpcRcon(self, reg);

    // Server and framework logs
    BindRpcLogs(self, reg);

    LOG_DEBUG("rpc: binding complete (%zu commands)", reg.size());
}

} // namespace vsm
