/*
 * Valheim Server Manager — Process launching (implementation; Linux-only)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/Process.hpp"
#include "include/Errors.hpp"
#include "include/Log.hpp"
#include "include/ProcessRecord.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace vsm {

namespace {

int decodeStatus_(int status) {
    if (WIFEXITED(status))   return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

/* Our own child: exit is observed with waitpid(WNOHANG). */
class ChildProcess : public ServerProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ~ChildProcess() override = default;

    pid_t pid() const override { return pid_; }

    std::optional<int> pollExit() override {
        if (exit_ || released_) return exit_;
        int status = 0;
        const pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            exit_ = decodeStatus_(status);
        } else if (r < 0 && errno == ECHILD) {
            exit_ = -1; // reaped elsewhere
        }
        return exit_;
    }

    bool terminate() override {
        if (exit_ || released_) return false;
        return ::kill(pid_, SIGTERM) == 0;
    }

    bool kill() override {
        if (exit_ || released_) return false;
        if (::kill(pid_, SIGKILL) != 0) return false;
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        exit_ = (r == pid_) ? decodeStatus_(status) : 128 + SIGKILL;
        return true;
    }

    void release() override { released_ = true; }

private:
    pid_t pid_;
    std::optional<int> exit_;
    bool released_{false};
};

/* Started by another invocation: not our child, so liveness is kill(pid, 0). */
class AdoptedProcess : public ServerProcess {
public:
    explicit AdoptedProcess(pid_t pid) : pid_(pid) {}

    pid_t pid() const override { return pid_; }

    std::optional<int> pollExit() override {
        if (exit_ || released_) return exit_;
        if (!isProcessRunning(pid_)) exit_ = -1; // status unknown
        return exit_;
    }

    bool terminate() override {
        if (exit_ || released_) return false;
        return signalProcess(pid_, false);
    }

    bool kill() override {
        if (exit_ || released_) return false;
        const bool ok = signalProcess(pid_, true);
        if (ok) exit_ = 128 + SIGKILL;
        return ok;
    }

    void release() override { released_ = true; }

private:
    pid_t pid_;
    std::optional<int> exit_;
    bool released_{false};
};

std::vector<std::string> buildEnv_(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        const char* eq = std::strchr(*e, '=');
        if (!eq) continue;
        merged[std::string(*e, static_cast<std::size_t>(eq - *e))] = std::string(eq + 1);
    }
    for (const auto& kv : overrides) merged[kv.first] = kv.second;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& kv : merged) out.push_back(kv.first + "=" + kv.second);
    return out;
}

} // namespace

std::unique_ptr<ServerProcess> PosixProcessLauncher::launch(const LaunchSpec& spec) {
    if (spec.executable.empty()) {
        throw Error(ErrorCode::ProcessSpawnFailed, "spawn: empty executable path");
    }

    // Everything the child needs is prepared before fork().
    std::vector<std::string> argvStore;
    argvStore.reserve(spec.args.size() + 1);
    argvStore.push_back(spec.executable);
    argvStore.insert(argvStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::vector<std::string> envStore = buildEnv_(spec.env);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        throw Error(ErrorCode::ProcessSpawnFailed,
                    std::string("spawn: pipe failed: ") + std::strerror(errno));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        throw Error(ErrorCode::ProcessSpawnFailed, std::string("spawn: fork failed: ") + std::strerror(e));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::close(errPipe[0]);
        ::setsid();
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        if (!spec.workDir.empty() && ::chdir(spec.workDir.c_str()) != 0) {
            const int e = errno;
            (void)!::write(errPipe[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execve(argv[0], argv.data(), envp.data());
        const int e = errno;
        (void)!::write(errPipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    ::close(errPipe[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        (void)::waitpid(pid, &status, 0);
        throw Error(ErrorCode::ProcessSpawnFailed,
                    "spawn: cannot exec " + spec.executable + ": " + std::strerror(childErr));
    }

    LOG_INFO("spawn: started %s (pid %d)", spec.executable.c_str(), static_cast<int>(pid));
    return std::make_unique<ChildProcess>(pid);
}

std::unique_ptr<ServerProcess> PosixProcessLauncher::adopt(pid_t pid) {
    if (!isProcessRunning(pid)) return nullptr;
    return std::make_unique<AdoptedProcess>(pid);
}

} // namespace vsm
