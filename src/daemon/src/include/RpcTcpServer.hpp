/*
 * Valheim Server Manager — RPC TCP Server (header)
 * Minimal newline-delimited JSON-RPC 2.0 over TCP, polled from the
 * scheduler thread.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace vsm {

class CommandRegistry; // forward declare to avoid heavy include

class RpcTcpServer {
public:
    RpcTcpServer(const std::string& host, unsigned short port, bool verbose);
    ~RpcTcpServer();

    RpcTcpServer(const RpcTcpServer&) = delete;
    RpcTcpServer& operator=(const RpcTcpServer&) = delete;

    /* Bind and listen. Port 0 picks an ephemeral port (see boundPort()). */
    bool start(CommandRegistry* reg);
    void stop();

    /* Accept, read and answer whatever is ready; waits at most timeoutMs. */
    void pollOnce(int timeoutMs = 0);

    bool running() const noexcept { return listenFd_ >= 0; }
    unsigned short boundPort() const noexcept { return boundPort_; }
    size_t clientCount() const noexcept { return clients_.size(); }

    using LineReply = std::function<void(std::string)>;

    /* Parse one request line; done receives the reply line (without '\n')
     * exactly once, right away or when an async command completes. */
    void handleLine(const std::string& line, LineReply done);

private:
    struct Client {
        std::uint64_t serial{0}; // tells a reused fd apart from the client a reply was meant for
        std::string   acc;       // receive accumulator (per-connection)
        std::string   out;       // pending reply bytes
    };

    void accept_();
    bool readClient_(int fd, Client& cl);
    bool flushClient_(int fd, Client& cl);
    void deliver_(int fd, std::uint64_t serial, std::string line);

private:
    std::string host_;
    unsigned short port_{0};
    unsigned short boundPort_{0};
    bool verbose_{false};

    int listenFd_{-1};
    std::unordered_map<int, Client> clients_;
    std::uint64_t nextSerial_{1};
    // Expires with the server; deferred replies hold a weak reference.
    std::shared_ptr<char> alive_{std::make_shared<char>(0)};

    CommandRegistry* reg_{nullptr};
};

} // namespace vsm
