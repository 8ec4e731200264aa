/**
 * @file test_result_cache.cpp
 * @brief Unit tests for the TTL result cache and in-flight coalescing.
 */

#include "liveness/result_cache.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace lanwake;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════
// Basic Get / Set
// ═══════════════════════════════════════════════

TEST(ResultCacheTest, MissOnEmpty) {
    ResultCache cache(10s, 0ms);
    EXPECT_FALSE(cache.get("nas").has_value());
}

TEST(ResultCacheTest, SetThenGet) {
    ResultCache cache(10s, 0ms);
    cache.set("nas", true, true);
    cache.set("printer", false, true);

    auto nas = cache.get("nas");
    ASSERT_TRUE(nas.has_value());
    EXPECT_TRUE(nas->ping_success);
    EXPECT_TRUE(nas->arp_success);

    auto printer = cache.get("printer");
    ASSERT_TRUE(printer.has_value());
    EXPECT_FALSE(printer->ping_success);
    EXPECT_TRUE(printer->arp_success);
}

TEST(ResultCacheTest, ExpiresAfterTtl) {
    ResultCache cache(50ms, 0ms);
    cache.set("nas", true, true);
    ASSERT_TRUE(cache.get("nas").has_value());

    std::this_thread::sleep_for(120ms);
    EXPECT_FALSE(cache.get("nas").has_value());
}

TEST(ResultCacheTest, Invalidate) {
    ResultCache cache(10s, 0ms);
    cache.set("nas", true, true);
    cache.set("printer", true, true);

    cache.invalidate("nas");
    EXPECT_FALSE(cache.get("nas").has_value());
    EXPECT_TRUE(cache.get("printer").has_value());

    cache.invalidate_all();
    EXPECT_FALSE(cache.get("printer").has_value());
    EXPECT_EQ(cache.stats().total_entries, 0u);
}

// ═══════════════════════════════════════════════
// Coalescing
// ═══════════════════════════════════════════════

TEST(ResultCacheTest, FirstCallerOwnsProbe) {
    ResultCache cache(10s, 0ms);

    auto owner = cache.start_probe("nas");
    auto waiter = cache.start_probe("nas");
    EXPECT_TRUE(owner.is_owner);
    EXPECT_FALSE(waiter.is_owner);

    // In flight: not a cache hit
    EXPECT_FALSE(cache.get("nas").has_value());
    EXPECT_EQ(waiter.completion.wait_for(0ms), std::future_status::timeout);

    cache.set("nas", false, true);

    ASSERT_EQ(waiter.completion.wait_for(1s), std::future_status::ready);
    const auto& shared = waiter.completion.get();
    ASSERT_TRUE(shared.has_value());
    EXPECT_FALSE(shared->ping_success);
    EXPECT_TRUE(shared->arp_success);
    EXPECT_TRUE(cache.get("nas").has_value());
}

TEST(ResultCacheTest, ConcurrentCallersShareOneOwner) {
    ResultCache cache(10s, 0ms);
    constexpr int kCallers = 16;

    std::atomic<int> owners{0};
    std::vector<ProbeTicket> tickets(kCallers);
    std::vector<std::jthread> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i] {
            tickets[i] = cache.start_probe("nas");
            if (tickets[i].is_owner) ++owners;
        });
    }
    threads.clear();

    EXPECT_EQ(owners.load(), 1);
    cache.set("nas", true, true);

    for (auto& ticket : tickets) {
        ASSERT_EQ(ticket.completion.wait_for(1s), std::future_status::ready);
        EXPECT_TRUE(ticket.completion.get()->ping_success);
    }
}

TEST(ResultCacheTest, NewProbeAfterCompletion) {
    ResultCache cache(10s, 0ms);
    auto first = cache.start_probe("nas");
    cache.set("nas", true, true);

    auto second = cache.start_probe("nas");
    EXPECT_TRUE(second.is_owner);
    EXPECT_FALSE(cache.get("nas").has_value());
}

TEST(ResultCacheTest, ErrorReachesWaitersAndIsNotCached) {
    ResultCache cache(10s, 0ms);
    auto owner = cache.start_probe("nas");
    auto waiter = cache.start_probe("nas");

    cache.set_error("nas", Error{ErrorCode::Io, "cannot enumerate interfaces"});

    ASSERT_EQ(waiter.completion.wait_for(1s), std::future_status::ready);
    const auto& outcome = waiter.completion.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::Io);

    EXPECT_FALSE(cache.get("nas").has_value());
    EXPECT_EQ(cache.stats().total_entries, 0u);
    EXPECT_TRUE(cache.start_probe("nas").is_owner);
}

TEST(ResultCacheTest, InvalidateCancelsWaiters) {
    ResultCache cache(10s, 0ms);
    auto owner = cache.start_probe("nas");
    auto waiter = cache.start_probe("nas");

    cache.invalidate("nas");

    ASSERT_EQ(waiter.completion.wait_for(1s), std::future_status::ready);
    const auto& outcome = waiter.completion.get();
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, ErrorCode::Cancelled);

    // The owner finishing later still caches its answer
    cache.set("nas", true, true);
    EXPECT_TRUE(cache.get("nas").has_value());
}

// ═══════════════════════════════════════════════
// Maintenance
// ═══════════════════════════════════════════════

TEST(ResultCacheTest, SweepRemovesExpiredOnly) {
    ResultCache cache(60ms, 0ms);
    cache.set("old-1", true, true);
    cache.set("old-2", false, false);
    auto pending = cache.start_probe("in-flight");

    std::this_thread::sleep_for(120ms);
    cache.set("fresh", true, true);

    EXPECT_EQ(cache.sweep_expired(), 2u);
    auto stats = cache.stats();
    EXPECT_EQ(stats.total_entries, 2u);
    EXPECT_EQ(stats.in_flight, 1u);
    EXPECT_EQ(stats.completed, 1u);

    cache.set("in-flight", true, true);
}

TEST(ResultCacheTest, BackgroundSweeper) {
    ResultCache cache(10ms, 50ms);
    cache.set("nas", true, true);
    cache.set("printer", true, true);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (cache.stats().total_entries > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_EQ(cache.stats().total_entries, 0u);
}

TEST(ResultCacheTest, Stats) {
    ResultCache cache(4s, 0ms);
    cache.set("a", true, true);
    auto pending = cache.start_probe("b");

    auto stats = cache.stats();
    EXPECT_EQ(stats.total_entries, 2u);
    EXPECT_EQ(stats.in_flight, 1u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.ttl, 4000ms);
}

TEST(ResultCacheTest, DestructionCancelsPending) {
    ProbeCompletion completion;
    {
        ResultCache cache(10s, 0ms);
        completion = cache.start_probe("nas").completion;
    }
    ASSERT_EQ(completion.wait_for(0ms), std::future_status::ready);
    EXPECT_TRUE(completion.get().error().is(ErrorCode::Cancelled));
}
