/*
 * Valheim Server Manager — RPC registry, envelope and binder tests
 * (c) 2025 ValheimServerManager contributors
 */
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "FakeProcess.hpp"
#include "FakeRconServer.hpp"
#include "TestUtil.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Config.hpp"
#include "include/Daemon.hpp"
#include "include/RpcTcpServer.hpp"
#include "rpc/RpcHandlers.hpp"

using namespace vsm;
using nlohmann::json;
using vsm::test::FakeLauncher;
using vsm::test::TempDir;

namespace {

/* Reply to one request line; pumps sched (when given) until an async command answers. */
json lineReply(RpcTcpServer& srv, const std::string& line, Scheduler* sched = nullptr) {
    auto out = std::make_shared<std::optional<std::string>>();
    srv.handleLine(line, [out](std::string r) { *out = std::move(r); });
    if (!out->has_value() && sched) {
        sched->runUntil([&] { return out->has_value(); }, Scheduler::Duration(5000));
    }
    if (!out->has_value()) {
        ADD_FAILURE() << "no reply to " << line;
        return json();
    }
    return json::parse(**out);
}

json call(RpcTcpServer& srv, const std::string& method, const json& params = json(),
          Scheduler* sched = nullptr) {
    json req{{"jsonrpc", "2.0"}, {"id", 7}, {"method", method}};
    if (!params.is_null()) req["params"] = params;
    return lineReply(srv, req.dump(), sched);
}

int errorCodeOf(const json& reply) {
    return reply.at("result").at("error").at("code").get<int>();
}

} // namespace

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

TEST(CommandRegistry, AddCallListRemove) {
    CommandRegistry reg;
    reg.add("b.second", "second", [](const RpcRequest& rq) { return ok_(rq, "b.second"); });
    reg.add("a.first", "first", [](const RpcRequest& rq) {
        return ok_(rq, "a.first", json{{"echo", paramString(rq, "x")}});
    });
    EXPECT_EQ(reg.size(), 2u);
    EXPECT_TRUE(reg.exists("a.first"));

    const auto names = reg.list();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0].name, "a.first");
    EXPECT_EQ(reg.listJson()[1]["help"], "second");
    EXPECT_EQ(*reg.help("a.first"), "first");
    EXPECT_FALSE(reg.help("missing"));

    RpcRequest rq;
    rq.id = 1;
    rq.method = "a.first";
    rq.params = json::array({json{{"x", "hi"}}});
    const RpcResult r = reg.call(rq);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.result["data"]["echo"], "hi");

    reg.remove("a.first");
    EXPECT_FALSE(reg.exists("a.first"));
    EXPECT_THROW(reg.call(rq), CommandNotFound);
    reg.clear();
    EXPECT_EQ(reg.size(), 0u);
}

TEST(CommandRegistry, HandlerMayReplaceItself) {
    CommandRegistry reg;
    reg.add("once", "", [&reg](const RpcRequest& rq) {
        reg.add("once", "", [](const RpcRequest& r2) { return ok_(r2, "once", json{{"n", 2}}); });
        return ok_(rq, "once", json{{"n", 1}});
    });
    RpcRequest rq;
    rq.method = "once";
    EXPECT_EQ(reg.call(rq).result["data"]["n"], 1);
    EXPECT_EQ(reg.call(rq).result["data"]["n"], 2);
}

TEST(CommandRegistry, AsyncEntryAnswersLater) {
    CommandRegistry reg;
    CommandRegistry::Reply parked;
    reg.addAsync("later", "deferred", [&parked](const RpcRequest&, CommandRegistry::Reply reply) {
        parked = std::move(reply);
    });
    reg.add("now", "", [](const RpcRequest& rq) { return ok_(rq, "now"); });

    RpcRequest rq;
    rq.id = 5;
    rq.method = "later";
    std::optional<RpcResult> got;
    reg.dispatch(rq, [&got](RpcResult r) { got = std::move(r); });
    EXPECT_FALSE(got);
    ASSERT_TRUE(parked);
    parked(ok_(rq, "later", json{{"done", true}}));
    ASSERT_TRUE(got);
    EXPECT_EQ(got->result["data"]["done"], true);

    EXPECT_THROW(reg.call(rq), std::logic_error);
    rq.method = "now";
    got.reset();
    reg.dispatch(rq, [&got](RpcResult r) { got = std::move(r); });
    ASSERT_TRUE(got); // plain entries answer before dispatch returns
    EXPECT_TRUE(got->ok);
    rq.method = "missing";
    EXPECT_THROW(reg.dispatch(rq, [](RpcResult) {}), CommandNotFound);
}

TEST(RpcResult, ErrorEnvelopeKeepsMethodAndData) {
    RpcRequest rq;
    rq.id = "abc";
    const json j = err_(rq, "server.start", rpc_errors::kInvalidState, "server is online",
                        json{{"state", "online"}}).toJson();
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], "abc");
    EXPECT_EQ(j["result"]["success"], false);
    EXPECT_EQ(j["result"]["method"], "server.start");
    EXPECT_EQ(j["result"]["error"]["code"], rpc_errors::kInvalidState);
    EXPECT_EQ(j["result"]["data"]["state"], "online");

    const json bare = err_(rq, "x", rpc_errors::kInternal, "boom").toJson();
    EXPECT_FALSE(bare["result"].contains("data"));
}

// ---------------------------------------------------------------------------
// Line protocol
// ---------------------------------------------------------------------------

struct LineFixture : ::testing::Test {
    CommandRegistry reg;
    RpcTcpServer srv{"127.0.0.1", 0, false};
    std::vector<std::function<void()>> parked;

    int connectClient() {
        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(srv.boundPort());
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd);
            return -1;
        }
        return fd;
    }

    /* Poll the server until n reply lines arrived on fd. */
    std::vector<json> readReplies(int fd, size_t n) {
        std::string got;
        std::vector<json> out;
        for (int i = 0; i < 200 && out.size() < n; ++i) {
            srv.pollOnce(10);
            char buf[512];
            const ssize_t k = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
            if (k > 0) got.append(buf, static_cast<size_t>(k));
            for (auto pos = got.find('\n'); pos != std::string::npos; pos = got.find('\n')) {
                out.push_back(json::parse(got.substr(0, pos)));
                got.erase(0, pos + 1);
            }
        }
        return out;
    }

    void SetUp() override {
        reg.add("ping", "", [](const RpcRequest& rq) { return ok_(rq, "ping", json{{"pong", true}}); });
        reg.add("throws", "", [](const RpcRequest&) -> RpcResult { throw std::runtime_error("kaboom"); });
        reg.addAsync("deferred", "", [this](const RpcRequest& rq, CommandRegistry::Reply reply) {
            parked.push_back([rq, reply] { reply(ok_(rq, "deferred", json{{"late", true}})); });
        });
        reg.addAsync("answers.then.throws", "", [](const RpcRequest& rq, CommandRegistry::Reply reply) {
            reply(ok_(rq, "answers.then.throws"));
            throw std::runtime_error("after the fact");
        });
        ASSERT_TRUE(srv.start(&reg));
        ASSERT_NE(srv.boundPort(), 0);
    }
};

TEST_F(LineFixture, SuccessEnvelope) {
    const json r = call(srv, "ping");
    EXPECT_EQ(r["id"], 7);
    EXPECT_EQ(r["result"]["success"], true);
    EXPECT_EQ(r["result"]["method"], "ping");
    EXPECT_EQ(r["result"]["data"]["pong"], true);
}

TEST_F(LineFixture, ProtocolErrorsUseTopLevelError) {
    json r = lineReply(srv, "{not json");
    EXPECT_EQ(r["error"]["code"], -32700);
    EXPECT_TRUE(r["id"].is_null());

    r = lineReply(srv, R"({"jsonrpc":"2.0","id":3})");
    EXPECT_EQ(r["error"]["code"], -32600);
    EXPECT_EQ(r["id"], 3);

    r = call(srv, "no.such.method");
    EXPECT_EQ(r["error"]["code"], -32601);

    r = call(srv, "throws");
    EXPECT_EQ(r["error"]["code"], -32603);
    EXPECT_EQ(r["error"]["data"], "kaboom");

    r = call(srv, "answers.then.throws");
    EXPECT_EQ(r["result"]["success"], true);
}

TEST_F(LineFixture, DeferredReplyFollowsLaterRequests) {
    const int fd = connectClient();
    ASSERT_GE(fd, 0);
    const std::string reqs = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"deferred\"}\n"
                             "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n";
    ASSERT_EQ(::send(fd, reqs.data(), reqs.size(), MSG_NOSIGNAL), static_cast<ssize_t>(reqs.size()));

    auto first = readReplies(fd, 1);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0]["id"], 2);
    ASSERT_EQ(parked.size(), 1u);

    parked[0]();
    auto second = readReplies(fd, 1);
    ::close(fd);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0]["id"], 1);
    EXPECT_EQ(second[0]["result"]["data"]["late"], true);
}

TEST_F(LineFixture, DeferredReplyToDepartedClientIsDropped) {
    const int fd = connectClient();
    ASSERT_GE(fd, 0);
    const std::string req = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"deferred\"}\n";
    ASSERT_EQ(::send(fd, req.data(), req.size(), MSG_NOSIGNAL), static_cast<ssize_t>(req.size()));
    for (int i = 0; i < 200 && parked.empty(); ++i) srv.pollOnce(10);
    ASSERT_EQ(parked.size(), 1u);
    ::close(fd);
    for (int i = 0; i < 200 && srv.clientCount() > 0; ++i) srv.pollOnce(10);
    EXPECT_EQ(srv.clientCount(), 0u);

    // a new client may get the same fd; the old reply must not reach it
    const int again = connectClient();
    ASSERT_GE(again, 0);
    for (int i = 0; i < 20 && srv.clientCount() == 0; ++i) srv.pollOnce(10);
    parked[0]();
    EXPECT_TRUE(readReplies(again, 1).empty());
    ::close(again);
}

TEST_F(LineFixture, AnswersOverTcp) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(srv.boundPort());
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ASSERT_EQ(::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

    const std::string req = "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n";
    ASSERT_EQ(::send(fd, req.data(), req.size(), MSG_NOSIGNAL), static_cast<ssize_t>(req.size()));

    std::string got;
    for (int i = 0; i < 200 && got.find('\n') == std::string::npos; ++i) {
        srv.pollOnce(10);
        char buf[512];
        const ssize_t n = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
        if (n > 0) got.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    ASSERT_NE(got.find('\n'), std::string::npos);
    const json r = json::parse(got.substr(0, got.find('\n')));
    EXPECT_EQ(r["result"]["data"]["pong"], true);
    EXPECT_EQ(srv.clientCount(), 1u);
}

// ---------------------------------------------------------------------------
// Daemon bindings
// ---------------------------------------------------------------------------

struct DaemonRpcFixture : ::testing::Test {
    TempDir dir;
    FakeLauncher* launcher{nullptr};
    std::unique_ptr<Daemon> daemon;

    void SetUp() override {
        auto l = std::make_unique<FakeLauncher>();
        launcher = l.get();
        daemon = std::make_unique<Daemon>(std::move(l));

        AppConfig cfg = defaultConfig();
        cfg.server.installDir = dir.file("valheim");
        cfg.server.logFile    = dir.file("server.log");
        cfg.daemon.host       = "127.0.0.1";
        cfg.daemon.port       = 0;
        cfg.daemon.recordFile = dir.file("server.pid");
        cfg.framework.logFile = dir.file("LogOutput.log");
        cfg.rcon.enabled      = false;
        ASSERT_TRUE(daemon->init(cfg));
        BindDaemonRpcCommands(*daemon, daemon->rpcRegistry());
    }

    RpcTcpServer& srv() { return *daemon->rpcServer(); }
};

TEST_F(DaemonRpcFixture, CoreCommands) {
    json r = call(srv(), "version");
    EXPECT_EQ(r["result"]["data"]["name"], "vsmd");

    r = call(srv(), "commands");
    EXPECT_EQ(r["result"]["data"].size(), daemon->rpcRegistry().size());

    r = call(srv(), "help", json{{"name", "server.start"}});
    EXPECT_EQ(r["result"]["data"]["help"], "Launch the dedicated server");
    EXPECT_EQ(errorCodeOf(call(srv(), "help", json{{"name", "bogus"}})), rpc_errors::kMethodNotFound);
    EXPECT_EQ(errorCodeOf(call(srv(), "help")), rpc_errors::kInvalidParams);
}

TEST_F(DaemonRpcFixture, ServerLifecycle) {
    json r = call(srv(), "server.status");
    EXPECT_EQ(r["result"]["data"]["state"], "offline");
    EXPECT_TRUE(r["result"]["data"]["pid"].is_null());

    r = call(srv(), "server.start");
    EXPECT_EQ(r["result"]["success"], true);
    EXPECT_EQ(r["result"]["data"]["state"], "starting");
    EXPECT_EQ(r["result"]["data"]["pid"], 1000);
    EXPECT_EQ(launcher->specs.size(), 1u);

    r = call(srv(), "server.start");
    EXPECT_EQ(errorCodeOf(r), rpc_errors::kInvalidState);
    EXPECT_EQ(launcher->specs.size(), 1u);

    EXPECT_EQ(errorCodeOf(call(srv(), "server.stop", json{{"timeoutMs", 0}})), rpc_errors::kInvalidParams);
    r = call(srv(), "server.stop", json{{"timeoutMs", 1000}});
    EXPECT_EQ(r["result"]["data"]["state"], "offline");
    EXPECT_TRUE(launcher->last().terminated);
}

TEST_F(DaemonRpcFixture, SpawnFailureIsReported) {
    launcher->failNext = 1;
    const json r = call(srv(), "server.start");
    EXPECT_EQ(errorCodeOf(r), rpc_errors::kInternal);
    EXPECT_EQ(daemon->watchdog().state(), ProcessState::Crashed);
}

TEST_F(DaemonRpcFixture, DetachAndKill) {
    EXPECT_EQ(errorCodeOf(call(srv(), "server.detach")), rpc_errors::kInvalidState);

    call(srv(), "server.start");
    json r = call(srv(), "server.detach");
    EXPECT_EQ(r["result"]["data"]["pid"], 1000);
    EXPECT_TRUE(launcher->last().released);
    auto rec = daemon->records().read();
    ASSERT_TRUE(rec);
    EXPECT_TRUE(rec->detached);

    call(srv(), "server.start");
    r = call(srv(), "server.kill");
    EXPECT_EQ(r["result"]["data"]["state"], "offline");
    EXPECT_TRUE(launcher->last().killed);
}

TEST_F(DaemonRpcFixture, RestartCountReset) {
    const json r = call(srv(), "server.restart-count.reset");
    EXPECT_EQ(r["result"]["data"]["restartCount"], 0);
    EXPECT_EQ(daemon->watchdog().restartCount(), 0);
}

TEST_F(DaemonRpcFixture, RconCommandsWithoutLink) {
    EXPECT_EQ(call(srv(), "rcon.status")["result"]["data"]["state"], "disconnected");
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.connect")), rpc_errors::kInvalidState);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.players")), rpc_errors::kNotConnected);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.save")), rpc_errors::kNotConnected);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.kick", json{{"name", "Alice"}})), rpc_errors::kNotConnected);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.kick")), rpc_errors::kInvalidParams);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.event", json{{"key", "dragons"}})), rpc_errors::kInvalidParams);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.event", json{{"key", "wolves"}})), rpc_errors::kNotConnected);
    EXPECT_EQ(errorCodeOf(call(srv(), "rcon.skiptime", json{{"seconds", -5}})), rpc_errors::kInvalidParams);
    EXPECT_EQ(call(srv(), "rcon.disconnect")["result"]["success"], true);
}

TEST(DaemonRcon, CommandsAnswerOnceTheServerReplies) {
    TempDir dir;
    vsm::test::FakeRconServer rconSrv("pw");
    rconSrv.setReply("players", "Players:\nAlice\n");
    rconSrv.setReply("listkeys", "defeated_eikthyr\n");

    AppConfig cfg = defaultConfig();
    cfg.server.installDir = dir.file("valheim");
    cfg.server.logFile    = dir.file("server.log");
    cfg.daemon.host       = "127.0.0.1";
    cfg.daemon.port       = 0;
    cfg.daemon.recordFile = dir.file("server.pid");
    cfg.framework.logFile = dir.file("LogOutput.log");
    cfg.rcon.enabled      = true;
    cfg.rcon.autoReconnect = false;
    cfg.rcon.host         = "127.0.0.1";
    cfg.rcon.port         = rconSrv.port();
    cfg.rcon.password     = "pw";
    cfg.rcon.timeoutMs    = 2000;
    cfg.rcon.pollIntervalMs = 60000;

    Daemon d(std::make_unique<FakeLauncher>());
    ASSERT_TRUE(d.init(cfg));
    BindDaemonRpcCommands(d, d.rpcRegistry());
    RpcTcpServer& srv = *d.rpcServer();
    Scheduler& sched = d.scheduler();

    json r = call(srv, "rcon.connect");
    EXPECT_EQ(r["result"]["data"]["state"], "connecting");
    ASSERT_TRUE(sched.runUntil([&] { return d.rcon().isConnected(); }, Scheduler::Duration(3000)));

    r = call(srv, "rcon.save", json(), &sched);
    EXPECT_EQ(r["result"]["success"], true);
    EXPECT_EQ(r["result"]["data"]["response"], "ok:save");

    r = call(srv, "rcon.players", json(), &sched);
    EXPECT_EQ(r["result"]["data"]["players"], json::array({"Alice"}));
    EXPECT_EQ(r["result"]["data"]["count"], 1);

    r = call(srv, "rcon.keys", json(), &sched);
    EXPECT_EQ(r["result"]["data"]["keys"], json::array({"defeated_eikthyr"}));

    r = call(srv, "rcon.kick", json{{"name", "Alice"}}, &sched);
    EXPECT_EQ(r["result"]["data"]["response"], "ok:kick Alice");

    r = call(srv, "rcon.save", json(), &sched);
    EXPECT_EQ(r["result"]["data"]["response"], "ok:save");
    EXPECT_EQ(rconSrv.received().size(), 5u);

    d.shutdown();
}

TEST_F(DaemonRpcFixture, LogTail) {
    EXPECT_EQ(errorCodeOf(call(srv(), "logs.tail", json{{"lines", 0}})), rpc_errors::kInvalidParams);
    EXPECT_EQ(errorCodeOf(call(srv(), "logs.tail", json{{"lines", 5000}})), rpc_errors::kInvalidParams);

    json r = call(srv(), "logs.tail");
    EXPECT_EQ(r["result"]["data"]["source"], "none");

    vsm::test::writeFile(dir.file("server.log"), "one\n02/15/2024 12:00:00: Error two\n");
    call(srv(), "server.start");
    r = call(srv(), "logs.tail", json{{"lines", 1}});
    EXPECT_EQ(r["result"]["data"]["source"], dir.file("server.log"));
    ASSERT_EQ(r["result"]["data"]["lines"].size(), 1u);
    EXPECT_EQ(r["result"]["data"]["lines"][0]["message"], "Error two");
    EXPECT_EQ(r["result"]["data"]["lines"][0]["level"], "error");

    daemon->serverLog().add("buffered line");
    r = call(srv(), "logs.tail");
    EXPECT_EQ(r["result"]["data"]["source"], "buffer");
}

TEST_F(DaemonRpcFixture, FrameworkTailReadsConfiguredFile) {
    vsm::test::writeFile(dir.file("LogOutput.log"), "[Warning:  BepInEx] careful\n");
    const json r = call(srv(), "framework.tail", json{{"lines", 10}});
    EXPECT_EQ(r["result"]["data"]["file"], dir.file("LogOutput.log"));
    EXPECT_EQ(r["result"]["data"]["following"], false);
    ASSERT_EQ(r["result"]["data"]["lines"].size(), 1u);
    EXPECT_EQ(r["result"]["data"]["lines"][0]["level"], "warn");
}

TEST_F(DaemonRpcFixture, ShutdownRequestStopsLoop) {
    EXPECT_FALSE(daemon->stopRequested());
    const json r = call(srv(), "daemon.shutdown");
    EXPECT_EQ(r["result"]["data"]["server"], "stop");
    EXPECT_TRUE(daemon->stopRequested());
}

TEST_F(DaemonRpcFixture, LogLevelGetAndSet) {
    const LogLevel before = Logger::instance().level();
    json r = call(srv(), "daemon.loglevel", json{{"level", "Trace"}});
    EXPECT_EQ(r["result"]["data"]["level"], "TRACE");
    EXPECT_EQ(Logger::instance().level(), LogLevel::Trace);

    r = call(srv(), "daemon.loglevel");
    EXPECT_EQ(r["result"]["data"]["level"], "TRACE");
    EXPECT_EQ(errorCodeOf(call(srv(), "daemon.loglevel", json{{"level", "loud"}})), rpc_errors::kInvalidParams);
    Logger::instance().setLevel(before);
}

TEST_F(DaemonRpcFixture, ShutdownStopsRunningServer) {
    call(srv(), "server.start");
    daemon->shutdown();
    EXPECT_TRUE(launcher->last().terminated);
    EXPECT_FALSE(daemon->initialized());
}

TEST(DaemonInit, ReattachesToRecordedServer) {
    TempDir dir;
    auto l = std::make_unique<FakeLauncher>();
    FakeLauncher* launcher = l.get();
    launcher->adoptable.push_back(static_cast<pid_t>(::getpid()));

    ProcessRecord rec;
    rec.pid = static_cast<int>(::getpid());
    rec.world = "Dedicated";
    rec.detached = true;
    ProcessRecordStore(dir.file("server.pid")).write(rec);

    AppConfig cfg = defaultConfig();
    cfg.server.installDir = dir.file("valheim");
    cfg.daemon.port = 0;
    cfg.daemon.recordFile = dir.file("server.pid");
    cfg.daemon.detachOnExit = true;

    Daemon d(std::move(l));
    ASSERT_TRUE(d.init(cfg));
    EXPECT_EQ(d.watchdog().state(), ProcessState::Online);
    ASSERT_TRUE(d.watchdog().pid());
    EXPECT_EQ(*d.watchdog().pid(), ::getpid());

    d.shutdown(); // detachOnExit: leaves it running and marks the record
    EXPECT_TRUE(launcher->last().released);
    auto after = ProcessRecordStore(dir.file("server.pid")).read();
    ASSERT_TRUE(after);
    EXPECT_TRUE(after->detached);
}
