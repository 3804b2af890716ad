/*
 * Valheim Server Manager — Command registry (RPC command table)
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace vsm {

/* One parsed JSON-RPC 2.0 request. id keeps its original JSON type. */
struct RpcRequest {
    nlohmann::json id;
    std::string    method;
    nlohmann::json params;
};

namespace rpc_errors {
    constexpr int kParseError     = -32700;
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams  = -32602;
    constexpr int kInternal       = -32603;
    constexpr int kInvalidState   = -32010;   // start while online, stop while offline
    constexpr int kNotConnected   = -32020;   // RCON link down
    constexpr int kCommandFailed  = -32021;   // RCON command gave no reply
}

struct RpcError {
    int            code{0};
    std::string    message;
    nlohmann::json data;
};

/*
 * Outcome of a command. Both outcomes travel in the JSON-RPC "result" member:
 *   ok:    {success:true,  method, data}
 *   error: {success:false, method, error:{code,message}, data?}
 */
struct RpcResult {
    bool                    ok{true};
    nlohmann::json          id;
    std::string             method;
    nlohmann::json          result;
    std::optional<RpcError> error;

    nlohmann::json toJson() const;
};

RpcResult ok_(const RpcRequest& rq, const char* method,
              const nlohmann::json& data = nlohmann::json::object());

RpcResult err_(const RpcRequest& rq, const char* method, int code, const std::string& message,
               const nlohmann::json& data = nlohmann::json::object());

class CommandNotFound : public std::runtime_error {
public:
    explicit CommandNotFound(const std::string& name)
        : std::runtime_error("unknown method: " + name) {}
};

struct CommandInfo {
    std::string name;
    std::string help;
};

/*
 * name -> handler table. Handlers run on the caller's thread and may add or
 * remove entries, including their own, while running. Async entries answer
 * through the Reply they are given, exactly once, possibly after returning.
 */
class CommandRegistry {
public:
    using RpcHandler   = std::function<RpcResult(const RpcRequest&)>;
    using Reply        = std::function<void(RpcResult)>;
    using AsyncHandler = std::function<void(const RpcRequest&, Reply)>;

    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    void add(const std::string& name, const std::string& help, RpcHandler fn);
    void addAsync(const std::string& name, const std::string& help, AsyncHandler fn);
    void remove(const std::string& name) { entries_.erase(name); }
    void clear() { entries_.clear(); }

    bool   exists(const std::string& name) const { return entries_.count(name) != 0; }
    size_t size() const { return entries_.size(); }

    /* Throws CommandNotFound for unknown methods. Plain entries reply before
     * returning. */
    void dispatch(const RpcRequest& req, Reply reply);

    /* Plain entries only; throws CommandNotFound, or std::logic_error for an
     * async entry. */
    RpcResult call(const RpcRequest& req);

    std::vector<CommandInfo>   list() const;       // ordered by name
    nlohmann::json             listJson() const;   // [{name, help}]
    std::optional<std::string> help(const std::string& name) const;

private:
    struct Entry {
        RpcHandler   fn;
        AsyncHandler async;
        std::string  help;
    };
    std::map<std::string, Entry> entries_;
};

/* Object params as-is; [ {...} ] unwraps to the single object; else {}. */
nlohmann::json paramsAsObject(const RpcRequest& rq);

/* String parameter by key; empty when missing or not a string. */
std::string paramString(const RpcRequest& rq, const char* key);

} // namespace vsm
