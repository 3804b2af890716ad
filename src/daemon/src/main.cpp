/*
 * Valheim Server Manager — Daemon entry (main)
 * (c) 2025 ValheimServerManager contributors
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "include/CommandRegistry.hpp"
#include "include/Config.hpp"
#include "include/Daemon.hpp"
#include "include/Log.hpp"
#include "include/Version.hpp"
#include "rpc/RpcHandlers.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> gSignalled{false};

void onSignal(int) { gSignalled.store(true); }

struct CliOptions {
    std::string configPath;
    bool foreground{false};
    bool debug{false};
    bool listCommands{false};
    bool help{false};
};

void printUsage(const char* exe) {
    std::printf(
        "vsmd %s: Valheim dedicated server manager\n"
        "Usage: %s [options]\n"
        "  --config PATH   config file (default: $XDG_CONFIG_HOME/vsm/config.json)\n"
        "  --foreground    stay attached to the terminal\n"
        "  --debug         debug logging\n"
        "  --cmds          print the RPC command table and exit\n"
        "  -h, --help      this text\n",
        VSMD_VERSION, exe);
}

/* Returns false on a usage error (already reported). */
bool parseArgs(int argc, char** argv, CliOptions& o) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--config") {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "vsmd: --config needs a path\n");
                return false;
            }
            o.configPath = argv[++i];
        } else if (a == "--foreground") {
            o.foreground = true;
        } else if (a == "--debug") {
            o.debug = true;
        } else if (a == "--cmds") {
            o.listCommands = true;
        } else if (a == "-h" || a == "--help") {
            o.help = true;
        } else {
            std::fprintf(stderr, "vsmd: unknown option '%s'\n", a.c_str());
            return false;
        }
    }
    return true;
}

/* Double fork; stdout/stderr land in logfile so nothing written to them is lost. */
bool detachFromTerminal(const std::string& logfile) {
    pid_t pid = ::fork();
    if (pid < 0) return false;
    if (pid > 0) ::_exit(0);
    if (::setsid() < 0) return false;
    pid = ::fork();
    if (pid < 0) return false;
    if (pid > 0) ::_exit(0);

    ::umask(022);
    if (::chdir("/") != 0) return false;

    std::string target = logfile;
    std::error_code ec;
    if (target.empty()) {
        target = "/tmp/vsmd.log";
    } else {
        fs::create_directories(fs::path(target).parent_path(), ec);
        if (ec) target = "/tmp/vsmd.log";
    }

    const int out = ::open(target.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    if (out < 0) return true;
    ::dup2(out, STDOUT_FILENO);
    ::dup2(out, STDERR_FILENO);
    ::close(out);
    const int in = ::open("/dev/null", O_RDONLY);
    if (in >= 0) {
        ::dup2(in, STDIN_FILENO);
        ::close(in);
    }
    return true;
}

int listCommands() {
    vsm::Daemon unused;   // binders only capture a reference
    vsm::CommandRegistry reg;
    vsm::BindDaemonRpcCommands(unused, reg);
    const auto cmds = reg.list();
    std::printf("%zu RPC commands:\n", cmds.size());
    for (const auto& c : cmds) std::printf("  %-28s  %s\n", c.name.c_str(), c.help.c_str());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opt;
    if (!parseArgs(argc, argv, opt)) {
        printUsage(argv[0]);
        return 2;
    }
    if (opt.help) {
        printUsage(argv[0]);
        return 0;
    }
    if (opt.listCommands) return listCommands();

    std::string cfgError;
    vsm::AppConfig cfg = vsm::loadAppConfig(opt.configPath, &cfgError);
    if (opt.debug) cfg.daemon.debug = true;

    if (!opt.foreground && !detachFromTerminal(cfg.daemon.logfile)) {
        std::fprintf(stderr, "vsmd: cannot detach from terminal\n");
        return 1;
    }

    // after the fork so the log file descriptor belongs to the daemon process
    vsm::Logger::instance().init(cfg.daemon.logfile,
                                 cfg.daemon.debug ? vsm::LogLevel::Debug : vsm::LogLevel::Info,
                                 opt.foreground || opt.debug);
    LOG_INFO("vsmd %s starting (config %s)", VSMD_VERSION, cfg.configFile.c_str());
    if (!cfgError.empty()) LOG_WARN("config: %s; running with defaults", cfgError.c_str());

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::signal(SIGPIPE, SIG_IGN);

    vsm::Daemon daemon;
    if (!daemon.init(cfg, opt.debug)) {
        LOG_ERROR("vsmd: init failed");
        vsm::Logger::instance().shutdown();
        return 2;
    }
    vsm::BindDaemonRpcCommands(daemon, daemon.rpcRegistry());

    std::thread loop([&daemon] { daemon.runLoop(); });

    // signal handlers only flip a flag; the loop thread is stopped from here
    while (!gSignalled.load() && !daemon.stopRequested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LOG_INFO("vsmd: stopping");
    daemon.requestStop();
    loop.join();
    daemon.shutdown();

    vsm::Logger::instance().shutdown();
    return 0;
}
