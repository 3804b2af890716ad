/*
 * Valheim Server Manager — process launcher tests (real fork/exec)
 * (c) 2025 ValheimServerManager contributors
 */
#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <thread>

#include <sys/wait.h>

#include "TestUtil.hpp"
#include "include/Errors.hpp"
#include "include/Process.hpp"

using namespace vsm;
using vsm::test::TempDir;

namespace {

std::optional<int> waitExit(ServerProcess& p, int timeoutMs = 5000) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < until) {
        if (auto st = p.pollExit()) return st;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return std::nullopt;
}

LaunchSpec shell(const std::string& script) {
    LaunchSpec s;
    s.executable = "/bin/sh";
    s.args = {"-c", script};
    return s;
}

} // namespace

TEST(PosixProcessLauncher, ReportsExitCode) {
    PosixProcessLauncher l;
    auto p = l.launch(shell("exit 3"));
    ASSERT_TRUE(p);
    EXPECT_GT(p->pid(), 0);
    EXPECT_EQ(waitExit(*p), 3);
    EXPECT_EQ(p->pollExit(), 3); // sticky
}

TEST(PosixProcessLauncher, PassesEnvironmentOverrides) {
    PosixProcessLauncher l;
    auto spec = shell("test \"$VSM_TEST_VAR\" = hello");
    spec.env["VSM_TEST_VAR"] = "hello";
    auto p = l.launch(spec);
    EXPECT_EQ(waitExit(*p), 0);
}

TEST(PosixProcessLauncher, RunsInWorkDir) {
    TempDir dir;
    PosixProcessLauncher l;
    auto spec = shell("touch marker");
    spec.workDir = dir.path().string();
    auto p = l.launch(spec);
    EXPECT_EQ(waitExit(*p), 0);
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "marker"));
}

TEST(PosixProcessLauncher, MissingExecutableThrows) {
    PosixProcessLauncher l;
    LaunchSpec spec;
    spec.executable = "/nonexistent/valheim_server.x86_64";
    try {
        l.launch(spec);
        FAIL() << "expected ProcessSpawnFailed";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::ProcessSpawnFailed);
    }
}

TEST(PosixProcessLauncher, EmptyExecutableThrows) {
    PosixProcessLauncher l;
    EXPECT_THROW(l.launch(LaunchSpec{}), Error);
}

TEST(PosixProcessLauncher, BadWorkDirThrows) {
    PosixProcessLauncher l;
    auto spec = shell("true");
    spec.workDir = "/nonexistent/dir";
    EXPECT_THROW(l.launch(spec), Error);
}

TEST(PosixProcessLauncher, TerminateDeliversSigterm) {
    PosixProcessLauncher l;
    auto p = l.launch(shell("exec sleep 30"));
    EXPECT_FALSE(p->pollExit());
    EXPECT_TRUE(p->terminate());
    EXPECT_EQ(waitExit(*p), 128 + SIGTERM);
    EXPECT_FALSE(p->terminate());
}

TEST(PosixProcessLauncher, KillReapsImmediately) {
    PosixProcessLauncher l;
    auto p = l.launch(shell("trap '' TERM; exec sleep 30"));
    EXPECT_TRUE(p->kill());
    EXPECT_EQ(p->pollExit(), 128 + SIGKILL);
}

TEST(PosixProcessLauncher, AdoptTracksForeignPid) {
    PosixProcessLauncher l;
    auto child = l.launch(shell("exec sleep 30"));
    auto adopted = l.adopt(child->pid());
    ASSERT_TRUE(adopted);
    EXPECT_EQ(adopted->pid(), child->pid());
    EXPECT_FALSE(adopted->pollExit());

    EXPECT_TRUE(child->kill());
    EXPECT_EQ(waitExit(*adopted), -1);
}

TEST(PosixProcessLauncher, AdoptRejectsDeadOrInvalidPid) {
    PosixProcessLauncher l;
    EXPECT_FALSE(l.adopt(0));
    EXPECT_FALSE(l.adopt(-5));

    auto p = l.launch(shell("exit 0"));
    const pid_t pid = p->pid();
    ASSERT_EQ(waitExit(*p), 0);
    EXPECT_FALSE(l.adopt(pid));
}

TEST(PosixProcessLauncher, ReleaseLeavesProcessRunning) {
    PosixProcessLauncher l;
    auto p = l.launch(shell("exec sleep 30"));
    const pid_t pid = p->pid();
    p->release();
    EXPECT_FALSE(p->pollExit());
    EXPECT_FALSE(p->terminate());
    EXPECT_EQ(::kill(pid, 0), 0);

    ::kill(pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
}
