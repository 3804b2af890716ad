/*
 * Valheim Server Manager — Process launching (header)
 * - LaunchSpec: what to exec, with which arguments and environment
 * - ServerProcess: handle to a running (spawned or adopted) process
 * - ProcessLauncher: spawn/adopt seam; tests substitute a fake
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace vsm {

struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;                // argv[1..]
    std::map<std::string, std::string> env;       // overrides on top of the daemon's environment
    std::string workDir;                          // empty = inherit
};

/* Exit status as reported by pollExit(): exit code, or 128 + signal. */
class ServerProcess {
public:
    virtual ~ServerProcess() = default;

    virtual pid_t pid() const = 0;

    /* nullopt while running; the status once it has exited (sticky). */
    virtual std::optional<int> pollExit() = 0;

    /* SIGTERM (graceful). False if the signal could not be delivered. */
    virtual bool terminate() = 0;

    /* SIGKILL and reap. */
    virtual bool kill() = 0;

    /* Drop the handle without signalling; the process keeps running. */
    virtual void release() = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /* Throws Error(ProcessSpawnFailed). */
    virtual std::unique_ptr<ServerProcess> launch(const LaunchSpec& spec) = 0;

    /* Handle to a process started by another invocation; nullptr if not alive. */
    virtual std::unique_ptr<ServerProcess> adopt(pid_t pid) = 0;
};

/*
 * PosixProcessLauncher: fork/execve. The child gets its own session so
 * terminal signals aimed at the daemon do not reach the server; stdio goes
 * to /dev/null (the server writes its own -logFile). exec failures are
 * reported back through a close-on-exec pipe.
 */
class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ServerProcess> launch(const LaunchSpec& spec) override;
    std::unique_ptr<ServerProcess> adopt(pid_t pid) override;
};

} // namespace vsm
