/*
 * Valheim Server Manager — Signal (header)
 * Subscription list with token-based unsubscribe. Handlers run synchronously
 * on the emitting thread, in subscription order.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

#include "Log.hpp"

namespace vsm {

using SubscriptionToken = std::uint64_t;

template <typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    SubscriptionToken subscribe(Handler fn) {
        const SubscriptionToken t = nextToken_++;
        handlers_.emplace_back(t, std::move(fn));
        return t;
    }

    /* Returns false when the token is unknown (already removed). */
    bool unsubscribe(SubscriptionToken t) {
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            if (it->first == t) {
                handlers_.erase(it);
                return true;
            }
        }
        return false;
    }

    void clear() { handlers_.clear(); }
    size_t size() const noexcept { return handlers_.size(); }
    bool empty() const noexcept { return handlers_.empty(); }

    /*
     * Handlers may subscribe/unsubscribe while being notified: emission works
     * on a snapshot and skips entries removed in the meantime. A throwing
     * handler is logged and does not stop delivery to the others.
     */
    void emit(Args... args) {
        const auto snapshot = handlers_;
        for (const auto& h : snapshot) {
            if (!contains_(h.first)) continue;
            try {
                h.second(args...);
            } catch (const std::exception& ex) {
                LOG_WARN("signal: handler %llu threw: %s",
                         static_cast<unsigned long long>(h.first), ex.what());
            }
        }
    }

private:
    bool contains_(SubscriptionToken t) const {
        for (const auto& h : handlers_) {
            if (h.first == t) return true;
        }
        return false;
    }

    std::vector<std::pair<SubscriptionToken, Handler>> handlers_;
    SubscriptionToken nextToken_{1};
};

} // namespace vsm
