/*
 * Valheim Server Manager — Command registry (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/CommandRegistry.hpp"

#include <stdexcept>
#include <utility>

namespace vsm {

using nlohmann::json;

json RpcResult::toJson() const {
    json body;
    if (ok) {
        body = result;
    } else {
        body = json{{"success", false}, {"method", method}};
        if (error) {
            body["error"] = json{{"code", error->code}, {"message", error->message}};
            if (!error->data.is_null() && !error->data.empty()) body["data"] = error->data;
        }
    }
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(body)}};
}

RpcResult ok_(const RpcRequest& rq, const char* method, const json& data) {
    RpcResult r;
    r.id = rq.id;
    r.method = method;
    r.result = json{{"success", true}, {"method", method}, {"data", data}};
    return r;
}

RpcResult err_(const RpcRequest& rq, const char* method, int code, const std::string& message,
               const json& data) {
    RpcResult r;
    r.ok = false;
    r.id = rq.id;
    r.method = method;
    r.error = RpcError{code, message, data};
    return r;
}

void CommandRegistry::add(const std::string& name, const std::string& help, RpcHandler fn) {
    entries_[name] = Entry{std::move(fn), nullptr, help};
}

void CommandRegistry::addAsync(const std::string& name, const std::string& help, AsyncHandler fn) {
    entries_[name] = Entry{nullptr, std::move(fn), help};
}

void CommandRegistry::dispatch(const RpcRequest& req, Reply reply) {
    auto it = entries_.find(req.method);
    if (it == entries_.end()) throw CommandNotFound(req.method);
    // copy: the handler may overwrite or erase its own entry
    Entry e = it->second;
    if (e.async) {
        e.async(req, std::move(reply));
        return;
    }
    reply(e.fn(req));
}

RpcResult CommandRegistry::call(const RpcRequest& req) {
    auto it = entries_.find(req.method);
    if (it == entries_.end()) throw CommandNotFound(req.method);
    if (!it->second.fn) throw std::logic_error(req.method + " answers asynchronously");
    RpcHandler fn = it->second.fn;
    return fn(req);
}

std::vector<CommandInfo> CommandRegistry::list() const {
    std::vector<CommandInfo> out;
    out.reserve(entries_.size());
    for (const auto& [name, e] : entries_) out.push_back(CommandInfo{name, e.help});
    return out;
}

json CommandRegistry::listJson() const {
    json arr = json::array();
    for (const auto& [name, e] : entries_) arr.push_back({{"name", name}, {"help", e.help}});
    return arr;
}

std::optional<std::string> CommandRegistry::help(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return std::nullopt;
    return it->second.help;
}

json paramsAsObject(const RpcRequest& rq) {
    if (rq.params.is_object()) return rq.params;
    if (rq.params.is_array() && rq.params.size() == 1 && rq.params[0].is_object()) return rq.params[0];
    return json::object();
}

std::string paramString(const RpcRequest& rq, const char* key) {
    const json p = paramsAsObject(rq);
    auto it = p.find(key);
    if (it == p.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace vsm
