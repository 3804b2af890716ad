/*
 * Valheim Server Manager — RPC TCP Server (implementation)
 * Minimal newline-delimited JSON-RPC 2.0 over TCP.
 * (c) 2025 ValheimServerManager contributors
 */
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "include/RpcTcpServer.hpp"
#include "include/Log.hpp"
#include "include/CommandRegistry.hpp"

namespace vsm {

using nlohmann::json;

namespace {

constexpr size_t kMaxLineBytes = 64 * 1024;

bool set_nonblock_(int fd) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    if (fl < 0) return false;
    return ::fcntl(fd, F_SETFL, fl | O_NONBLOCK) == 0;
}

std::string errorReply_(const json& id, int code, const char* message, const std::string& detail = {}) {
    json err{{"code", code}, {"message", message}};
    if (!detail.empty()) err["data"] = detail;
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", err}}.dump();
}

} // namespace

RpcTcpServer::RpcTcpServer(const std::string& host, unsigned short port, bool verbose)
: host_(host), port_(port), verbose_(verbose) {}

RpcTcpServer::~RpcTcpServer() {
    stop();
}

bool RpcTcpServer::start(CommandRegistry* reg) {
    if (listenFd_ >= 0) return true;

    reg_ = reg;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port_);
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("rpc: invalid listen address '%s'", host_.c_str());
        return false;
    }

    listenFd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listenFd_ < 0) {
        LOG_ERROR("rpc: socket() failed: %s", std::strerror(errno));
        return false;
    }

    int one = 1;
    if (::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one)) < 0) {
        LOG_WARN("rpc: SO_REUSEADDR failed: %s", std::strerror(errno));
    }

    if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG_ERROR("rpc: bind(%s:%u) failed: %s", host_.c_str(), port_, std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (::listen(listenFd_, 16) < 0 || !set_nonblock_(listenFd_)) {
        LOG_ERROR("rpc: listen() failed: %s", std::strerror(errno));
        ::close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        boundPort_ = ntohs(bound.sin_port);
    } else {
        boundPort_ = port_;
    }

    LOG_INFO("rpc: listening on %s:%u", host_.c_str(), boundPort_);
    return true;
}

void RpcTcpServer::stop() {
    if (listenFd_ < 0) return;

    ::close(listenFd_);
    listenFd_ = -1;

    for (auto& kv : clients_) {
        ::close(kv.first);
    }
    clients_.clear();

    LOG_INFO("rpc: stopped");
}

void RpcTcpServer::pollOnce(int timeoutMs) {
    if (listenFd_ < 0) return;

    fd_set rfds, wfds;
    FD_ZERO(&rfds);
    FD_ZERO(&wfds);

    int maxfd = listenFd_;
    FD_SET(listenFd_, &rfds);
    for (const auto& kv : clients_) {
        FD_SET(kv.first, &rfds);
        if (!kv.second.out.empty()) FD_SET(kv.first, &wfds);
        maxfd = std::max(maxfd, kv.first);
    }

    timeval tv{timeoutMs / 1000, (timeoutMs % 1000) * 1000};
    const int r = ::select(maxfd + 1, &rfds, &wfds, nullptr, &tv);
    if (r < 0) {
        if (errno != EINTR) LOG_WARN("rpc: select() failed: %s", std::strerror(errno));
        return;
    }
    if (r == 0) return;

    if (FD_ISSET(listenFd_, &rfds)) accept_();

    std::vector<int> toClose;
    for (auto& kv : clients_) {
        const int cfd = kv.first;
        bool alive = true;
        if (FD_ISSET(cfd, &rfds)) alive = readClient_(cfd, kv.second);
        if (alive && !kv.second.out.empty()) alive = flushClient_(cfd, kv.second);
        if (!alive) toClose.push_back(cfd);
    }

    for (int cfd : toClose) {
        LOG_DEBUG("rpc: client disconnected (fd=%d)", cfd);
        ::close(cfd);
        clients_.erase(cfd);
    }
}

void RpcTcpServer::accept_() {
    for (;;) {
        sockaddr_in cli{};
        socklen_t clilen = sizeof(cli);
        const int cfd = ::accept4(listenFd_, reinterpret_cast<sockaddr*>(&cli), &clilen,
                                  SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (cfd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                LOG_WARN("rpc: accept() failed: %s", std::strerror(errno));
            }
            return;
        }
        Client cl;
        cl.serial = nextSerial_++;
        clients_.emplace(cfd, std::move(cl));
        LOG_DEBUG("rpc: client connected (fd=%d)", cfd);
    }
}

bool RpcTcpServer::readClient_(int fd, Client& cl) {
    char buf[4096];
    for (;;) {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0) return false;
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            return false;
        }
        cl.acc.append(buf, static_cast<size_t>(n));
        if (cl.acc.size() > kMaxLineBytes && cl.acc.find('\n') == std::string::npos) {
            LOG_WARN("rpc: request line too long, dropping client (fd=%d)", fd);
            return false;
        }
    }

    for (;;) {
        const auto pos = cl.acc.find('\n');
        if (pos == std::string::npos) break;
        std::string line = cl.acc.substr(0, pos);
        cl.acc.erase(0, pos + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::weak_ptr<char> alive = alive_;
        const std::uint64_t serial = cl.serial;
        handleLine(line, [this, alive, fd, serial](std::string reply) {
            if (alive.expired()) return;
            deliver_(fd, serial, std::move(reply));
        });
    }
    return true;
}

/* Queue a reply line; flushed on the next poll. Dropped if the client left. */
void RpcTcpServer::deliver_(int fd, std::uint64_t serial, std::string line) {
    auto it = clients_.find(fd);
    if (it == clients_.end() || it->second.serial != serial) {
        LOG_DEBUG("rpc: client (fd=%d) gone, dropping reply", fd);
        return;
    }
    it->second.out += line;
    it->second.out.push_back('\n');
}

bool RpcTcpServer::flushClient_(int fd, Client& cl) {
    while (!cl.out.empty()) {
        const ssize_t n = ::send(fd, cl.out.data(), cl.out.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            return false;
        }
        cl.out.erase(0, static_cast<size_t>(n));
    }
    return true;
}

void RpcTcpServer::handleLine(const std::string& line, LineReply done) {
    json req = json::parse(line, nullptr, /*allow_exceptions*/ false);
    if (req.is_discarded() || !req.is_object()) {
        LOG_WARN("rpc: unparsable request");
        done(errorReply_(json(), rpc_errors::kParseError, "Parse error"));
        return;
    }

    const json id = req.contains("id") ? req["id"] : json();
    if (!req.contains("method") || !req["method"].is_string()) {
        done(errorReply_(id, rpc_errors::kInvalidRequest, "Invalid Request", "missing 'method'"));
        return;
    }

    RpcRequest r;
    r.method = req["method"].get<std::string>();
    r.params = req.contains("params") ? req["params"] : json();
    r.id     = id;

    if (verbose_) {
        LOG_DEBUG("rpc: call method='%s' id='%s'", r.method.c_str(), id.dump().c_str());
    }

    if (!reg_) {
        done(errorReply_(id, rpc_errors::kInternal, "Internal error", "no command table"));
        return;
    }

    // A handler that throws after answering must not answer twice.
    auto replied = std::make_shared<bool>(false);
    auto once = [done, replied](std::string text) {
        if (*replied) return;
        *replied = true;
        done(std::move(text));
    };

    try {
        reg_->dispatch(r, [once](RpcResult res) { once(res.toJson().dump()); });
    } catch (const CommandNotFound&) {
        once(errorReply_(id, rpc_errors::kMethodNotFound, "Method not found"));
    } catch (const std::exception& ex) {
        LOG_WARN("rpc: %s failed: %s", r.method.c_str(), ex.what());
        once(errorReply_(id, rpc_errors::kInternal, "Internal error", ex.what()));
    }
}

} // namespace vsm
