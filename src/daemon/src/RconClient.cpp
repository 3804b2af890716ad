/*
 * Valheim Server Manager — RCON client (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/RconClient.hpp"
#include "include/Log.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <sys/types.h>
#include <unistd.h>

namespace vsm {

const char* rconClientStateName(RconClientState s) noexcept {
    switch (s) {
        case RconClientState::Disconnected:   return "disconnected";
        case RconClientState::Connecting:     return "connecting";
        case RconClientState::Authenticating: return "authenticating";
        case RconClientState::Connected:      return "connected";
        case RconClientState::Error:          return "error";
    }
    return "?";
}

RconClient::RconClient(Scheduler& sched, RconClientConfig cfg)
: sched_(sched), cfg_(std::move(cfg)) {
    if (cfg_.port <= 0) cfg_.port = 25575;
    if (cfg_.timeoutMs <= 0) cfg_.timeoutMs = 5000;
}

RconClient::~RconClient() {
    for (auto& kv : pending_) sched_.cancel(kv.second.timer);
    pending_.clear();
    connectDone_ = nullptr;
    closeSocket_();
}

RconResult RconClient::failure_(ErrorCode code, const std::string& msg) {
    RconResult r;
    r.error = Error(code, msg);
    return r;
}

std::int32_t RconClient::nextId_() {
    lastId_ = (lastId_ + 1) % 0x7fffffff;
    return lastId_;
}

void RconClient::post_(RconHandler done, RconResult r) {
    if (!done) return;
    sched_.runAfter(Scheduler::Duration(0), [done = std::move(done), r = std::move(r)]() mutable {
        done(std::move(r));
    });
}

/* ----------------------------------------------------------------------------
 * Connect and authenticate
 * ----------------------------------------------------------------------------*/

void RconClient::connect(RconHandler done) {
    if (state_ == RconClientState::Connecting || state_ == RconClientState::Authenticating ||
        state_ == RconClientState::Connected) {
        throw Error(ErrorCode::ConnectionRefused,
                    std::string("rcon: already ") + rconClientStateName(state_));
    }

    closeSocket_();
    state_ = RconClientState::Connecting;
    connectDone_ = std::move(done);
    lastErr_ = "no address";

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_NUMERICSERV;
    addrinfo* res = nullptr;
    const std::string port = std::to_string(cfg_.port);
    const int gai = ::getaddrinfo(cfg_.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        fail_(ErrorCode::ConnectionRefused,
              "rcon: cannot resolve " + cfg_.host + ": " + ::gai_strerror(gai));
        return;
    }
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        Address a;
        std::memcpy(&a.addr, ai->ai_addr, ai->ai_addrlen);
        a.len      = ai->ai_addrlen;
        a.family   = ai->ai_family;
        a.socktype = ai->ai_socktype;
        a.protocol = ai->ai_protocol;
        addrs_.push_back(a);
    }
    ::freeaddrinfo(res);

    armConnectTimer_();
    tryNextAddress_();
}

void RconClient::armConnectTimer_() {
    sched_.cancel(connectTimer_);
    connectTimer_ = sched_.runAfter(Scheduler::Duration(cfg_.timeoutMs), [this] {
        connectTimer_ = Scheduler::kInvalidTask;
        const char* step = state_ == RconClientState::Connecting ? "connection" : "auth";
        fail_(ErrorCode::Timeout,
              std::string("rcon: ") + step + " timeout after " + std::to_string(cfg_.timeoutMs) + "ms");
    });
}

void RconClient::tryNextAddress_() {
    while (nextAddr_ < addrs_.size()) {
        const Address& a = addrs_[nextAddr_++];
        const int fd = ::socket(a.family, a.socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, a.protocol);
        if (fd < 0) {
            lastErr_ = std::strerror(errno);
            continue;
        }
        const int rc = ::connect(fd, reinterpret_cast<const sockaddr*>(&a.addr), a.len);
        if (rc == 0 || errno == EINPROGRESS) {
            fd_ = fd;
            watch_ = sched_.watchFd(fd_, POLLOUT, [this](short revents) { onIo_(revents); });
            if (rc == 0) socketOpen_();
            return;
        }
        lastErr_ = std::strerror(errno);
        ::close(fd);
    }
    fail_(ErrorCode::ConnectionRefused,
          "rcon: failed to connect to " + cfg_.host + ":" + std::to_string(cfg_.port) + ": " + lastErr_);
}

void RconClient::socketOpen_() {
    state_ = RconClientState::Authenticating;
    addrs_.clear();
    nextAddr_ = 0;
    armConnectTimer_();

    authId_ = nextId_();
    try {
        tx_ = rcon::makeAuthPacket(authId_, cfg_.password);
    } catch (const Error& e) {
        fail_(ErrorCode::AuthFailed, std::string("rcon: unusable password: ") + e.what());
        return;
    }
    if (flush_()) updateWatch_();
}

/* ----------------------------------------------------------------------------
 * Commands
 * ----------------------------------------------------------------------------*/

void RconClient::send(const std::string& command, RconHandler done) {
    if (!isConnected()) {
        throw Error(ErrorCode::Disconnected, "rcon: not connected");
    }

    const std::int32_t id = nextId_();
    const rcon::Bytes pkt = rcon::makeCommandPacket(id, command); // InvalidBody leaves the link intact

    PendingCommand pc;
    pc.done  = std::move(done);
    pc.timer = sched_.runAfter(Scheduler::Duration(cfg_.timeoutMs), [this, id] {
        auto it = pending_.find(id);
        if (it == pending_.end()) return;
        it->second.timer = Scheduler::kInvalidTask;
        fail_(ErrorCode::Timeout,
              "rcon: response timeout after " + std::to_string(cfg_.timeoutMs) + "ms", id);
    });
    pending_.emplace(id, std::move(pc));

    tx_.insert(tx_.end(), pkt.begin(), pkt.end());
    if (flush_()) updateWatch_();
}

void RconClient::disconnect() {
    const bool connecting = state_ == RconClientState::Connecting ||
                            state_ == RconClientState::Authenticating;
    RconHandler connectDone = std::move(connectDone_);
    connectDone_ = nullptr;
    std::map<std::int32_t, PendingCommand> pending;
    pending.swap(pending_);

    closeSocket_();
    state_ = RconClientState::Disconnected;

    if (connecting) post_(std::move(connectDone), failure_(ErrorCode::Disconnected, "rcon: disconnected"));
    for (auto& kv : pending) {
        sched_.cancel(kv.second.timer);
        post_(std::move(kv.second.done), failure_(ErrorCode::Disconnected, "rcon: disconnected"));
    }
}

/* ----------------------------------------------------------------------------
 * Socket I/O
 * ----------------------------------------------------------------------------*/

void RconClient::onIo_(short revents) {
    if (state_ == RconClientState::Connecting) {
        int soErr = 0;
        socklen_t len = sizeof(soErr);
        if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &soErr, &len) < 0) soErr = errno;
        if (soErr != 0) {
            lastErr_ = std::strerror(soErr);
            sched_.unwatchFd(watch_);
            watch_ = Scheduler::kInvalidWatch;
            ::close(fd_);
            fd_ = -1;
            tryNextAddress_();
            return;
        }
        socketOpen_();
        return;
    }

    if ((revents & POLLOUT) && !flush_()) return;
    if (revents & (POLLIN | POLLHUP | POLLERR)) readAvailable_();
    if (fd_ >= 0) updateWatch_();
}

bool RconClient::flush_() {
    while (!tx_.empty()) {
        const ssize_t n = ::send(fd_, tx_.data(), tx_.size(), MSG_NOSIGNAL);
        if (n > 0) {
            tx_.erase(tx_.begin(), tx_.begin() + n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        fail_(ErrorCode::Disconnected,
              std::string("rcon: write failed: ") + (n < 0 ? std::strerror(errno) : "no progress"));
        return false;
    }
    return true;
}

void RconClient::readAvailable_() {
    std::uint8_t buf[4096];
    for (;;) {
        const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
        if (n > 0) {
            rx_.insert(rx_.end(), buf, buf + n);
            if (!drain_()) return;
            continue;
        }
        if (n == 0) {
            fail_(ErrorCode::Disconnected, "rcon: connection closed by server");
            return;
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        fail_(ErrorCode::Disconnected, std::string("rcon: read failed: ") + std::strerror(errno));
        return;
    }
}

/* Decode every complete frame in rx_; a partial frame stays for the next read.
 * Returns false once the link failed. */
bool RconClient::drain_() {
    while (rx_.size() >= rcon::kSizeFieldBytes) {
        std::size_t frame = 0;
        try {
            frame = rcon::frameSize(rx_.data(), rx_.size());
        } catch (const Error& e) {
            fail_(ErrorCode::ProtocolError, std::string("rcon: undecodable frame: ") + e.what());
            return false;
        }
        if (frame > kMaxFrameBytes) {
            fail_(ErrorCode::ProtocolError,
                  "rcon: frame of " + std::to_string(frame) + " bytes exceeds the " +
                  std::to_string(kMaxFrameBytes) + " byte limit");
            return false;
        }
        if (!rcon::hasCompletePacket(rx_)) break;

        rcon::Packet p = rcon::decodePacket(rx_.data(), frame);
        rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(frame));
        dispatch_(std::move(p));
        if (fd_ < 0) return false;
    }
    return true;
}

void RconClient::dispatch_(rcon::Packet p) {
    if (state_ == RconClientState::Authenticating) {
        if (rcon::isAuthFailure(p)) {
            fail_(ErrorCode::AuthFailed, "rcon: invalid password");
            return;
        }
        // Source-style servers send an empty RESPONSE_VALUE ahead of the auth reply.
        if (p.type == rcon::kTypeResponseValue) return;
        if (p.type == rcon::kTypeAuthResponse && p.id == authId_) {
            sched_.cancel(connectTimer_);
            connectTimer_ = Scheduler::kInvalidTask;
            state_ = RconClientState::Connected;
            LOG_DEBUG("rcon: authenticated to %s:%d", cfg_.host.c_str(), cfg_.port);
            RconHandler done = std::move(connectDone_);
            connectDone_ = nullptr;
            post_(std::move(done), RconResult{});
            return;
        }
        LOG_DEBUG("rcon: ignoring packet id=%d type=%d during auth", p.id, p.type);
        return;
    }

    auto it = pending_.find(p.id);
    if (it == pending_.end()) {
        LOG_TRACE("rcon: dropping unmatched packet id=%d", p.id);
        return;
    }
    sched_.cancel(it->second.timer);
    RconHandler done = std::move(it->second.done);
    pending_.erase(it);

    RconResult r;
    r.body = std::move(p.body);
    post_(std::move(done), std::move(r));
}

void RconClient::updateWatch_() {
    if (watch_ == Scheduler::kInvalidWatch) return;
    sched_.setWatchEvents(watch_, tx_.empty() ? POLLIN : static_cast<short>(POLLIN | POLLOUT));
}

/* ----------------------------------------------------------------------------
 * Failure and teardown
 * ----------------------------------------------------------------------------*/

void RconClient::fail_(ErrorCode code, const std::string& msg, std::optional<std::int32_t> culprit) {
    if (state_ == RconClientState::Connecting || state_ == RconClientState::Authenticating) {
        // socket-level trouble before the link is up counts as a refused connection
        const ErrorCode c = code == ErrorCode::Disconnected ? ErrorCode::ConnectionRefused : code;
        LOG_DEBUG("rcon: connect to %s:%d failed: %s", cfg_.host.c_str(), cfg_.port, msg.c_str());
        closeSocket_();
        state_ = RconClientState::Error;
        RconHandler done = std::move(connectDone_);
        connectDone_ = nullptr;
        post_(std::move(done), failure_(c, msg));
        return;
    }

    LOG_DEBUG("rcon: link to %s:%d failed: %s", cfg_.host.c_str(), cfg_.port, msg.c_str());
    std::map<std::int32_t, PendingCommand> pending;
    pending.swap(pending_);
    closeSocket_();
    state_ = code == ErrorCode::Disconnected ? RconClientState::Disconnected : RconClientState::Error;

    for (auto& kv : pending) {
        sched_.cancel(kv.second.timer);
        const bool hit = !culprit || *culprit == kv.first;
        post_(std::move(kv.second.done),
              hit ? failure_(code, msg) : failure_(ErrorCode::Disconnected, "rcon: connection dropped"));
    }
}

void RconClient::closeSocket_() {
    if (watch_ != Scheduler::kInvalidWatch) {
        sched_.unwatchFd(watch_);
        watch_ = Scheduler::kInvalidWatch;
    }
    sched_.cancel(connectTimer_);
    connectTimer_ = Scheduler::kInvalidTask;
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
    rx_.clear();
    tx_.clear();
    addrs_.clear();
    nextAddr_ = 0;
}

} // namespace vsm
