/*
 * Valheim Server Manager — Signal tests
 * (c) 2025 ValheimServerManager contributors
 */
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "include/Signal.hpp"

using namespace vsm;

TEST(Signal, DeliversInSubscriptionOrder) {
    Signal<int> sig;
    std::vector<std::string> seen;
    sig.subscribe([&](int v) { seen.push_back("a" + std::to_string(v)); });
    sig.subscribe([&](int v) { seen.push_back("b" + std::to_string(v)); });
    sig.emit(7);
    EXPECT_EQ(seen, (std::vector<std::string>{"a7", "b7"}));
}

TEST(Signal, UnsubscribeStopsDelivery) {
    Signal<> sig;
    int calls = 0;
    const auto t = sig.subscribe([&] { ++calls; });
    sig.emit();
    EXPECT_TRUE(sig.unsubscribe(t));
    EXPECT_FALSE(sig.unsubscribe(t));
    sig.emit();
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sig.empty());
}

TEST(Signal, HandlerRemovedDuringEmitIsSkipped) {
    Signal<> sig;
    int second = 0;
    SubscriptionToken t2 = 0;
    sig.subscribe([&] { sig.unsubscribe(t2); });
    t2 = sig.subscribe([&] { ++second; });
    sig.emit();
    EXPECT_EQ(second, 0);
    EXPECT_EQ(sig.size(), 1u);
}

TEST(Signal, ThrowingHandlerDoesNotStopOthers) {
    Signal<const std::string&> sig;
    int after = 0;
    sig.subscribe([](const std::string&) { throw std::runtime_error("boom"); });
    sig.subscribe([&](const std::string&) { ++after; });
    sig.emit("x");
    EXPECT_EQ(after, 1);
}
