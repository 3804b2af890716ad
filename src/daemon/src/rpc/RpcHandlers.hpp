/*
 * Valheim Server Manager — RPC binder (declaration)
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once
#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"

namespace vsm {
    // Registers all RPC commands into the given registry.
    void BindDaemonRpcCommands(Daemon& self, CommandRegistry& reg);
}
