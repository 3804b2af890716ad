/*
 * Valheim Server Manager — RCON client (header)
 * One authenticated TCP connection driven by the scheduler: calls return at
 * once and complete through a handler.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/socket.h>

#include "Errors.hpp"
#include "RconProtocol.hpp"
#include "Scheduler.hpp"

namespace vsm {

struct RconClientConfig {
    std::string host{"127.0.0.1"};
    int         port{25575};
    std::string password;
    int         timeoutMs{5000};
};

enum class RconClientState { Disconnected, Connecting, Authenticating, Connected, Error };
const char* rconClientStateName(RconClientState s) noexcept;

/* Outcome of connect() or send(); body holds the response on success. */
struct RconResult {
    std::optional<Error> error;
    std::string          body;

    bool ok() const noexcept { return !error.has_value(); }
};

using RconHandler = std::function<void(RconResult)>;

/*
 * RconConnection: what the manager needs from a client. Implemented by
 * RconClient; tests substitute a scripted fake.
 * A handler runs exactly once, on a later scheduler pass, never inside the
 * call that took it. Destroying the connection drops unfinished handlers.
 * Calls made in the wrong state throw vsm::Error instead.
 */
class RconConnection {
public:
    virtual ~RconConnection() = default;

    virtual void connect(RconHandler done) = 0;
    virtual void send(const std::string& command, RconHandler done) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
};

class RconClient : public RconConnection {
public:
    /* Largest frame taken from the server before the link is dropped. */
    static constexpr std::size_t kMaxFrameBytes = rcon::kMaxBodySize * 16 + 10;

    RconClient(Scheduler& sched, RconClientConfig cfg);
    ~RconClient() override;

    RconClient(const RconClient&) = delete;
    RconClient& operator=(const RconClient&) = delete;

    /*
     * Open the socket and authenticate. Completes with AuthFailed (server
     * answered id -1), Timeout (socket open or auth took longer than
     * timeoutMs) or ConnectionRefused (resolve/connect failure).
     * Throws ConnectionRefused when already connecting or connected.
     */
    void connect(RconHandler done) override;

    /*
     * Send one command; completes with the body of the response carrying
     * its id. Throws Disconnected when not connected and InvalidBody for an
     * oversized command (link kept). Timeout, Disconnected and ProtocolError
     * close the socket; other commands still in flight then complete with
     * Disconnected.
     */
    void send(const std::string& command, RconHandler done) override;

    /* Idempotent. Unfinished operations complete with Disconnected. */
    void disconnect() override;
    bool isConnected() const override { return state_ == RconClientState::Connected && fd_ >= 0; }

    RconClientState state() const noexcept { return state_; }
    const RconClientConfig& config() const noexcept { return cfg_; }
    size_t pendingCount() const noexcept { return pending_.size(); }

private:
    struct Address {
        sockaddr_storage addr{};
        socklen_t        len{0};
        int              family{0};
        int              socktype{0};
        int              protocol{0};
    };

    struct PendingCommand {
        RconHandler       done;
        Scheduler::TaskId timer{Scheduler::kInvalidTask};
    };

    static RconResult failure_(ErrorCode code, const std::string& msg);

    std::int32_t nextId_();
    void armConnectTimer_();
    void tryNextAddress_();
    void socketOpen_();
    void onIo_(short revents);
    bool flush_();
    void readAvailable_();
    bool drain_();
    void dispatch_(rcon::Packet p);
    void updateWatch_();
    void fail_(ErrorCode code, const std::string& msg,
               std::optional<std::int32_t> culprit = std::nullopt);
    void post_(RconHandler done, RconResult r);
    void closeSocket_();

    Scheduler&        sched_;
    RconClientConfig  cfg_;
    RconClientState   state_{RconClientState::Disconnected};
    int               fd_{-1};
    std::int32_t      lastId_{0};
    std::int32_t      authId_{0};
    rcon::Bytes       rx_;
    rcon::Bytes       tx_;

    std::vector<Address> addrs_;
    size_t               nextAddr_{0};
    std::string          lastErr_;

    RconHandler        connectDone_;
    Scheduler::TaskId  connectTimer_{Scheduler::kInvalidTask};
    Scheduler::WatchId watch_{Scheduler::kInvalidWatch};
    std::map<std::int32_t, PendingCommand> pending_;
};

} // namespace vsm
