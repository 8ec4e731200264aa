/**
 * @file result_cache.hpp
 * @brief TTL cache of probe results with in-flight request coalescing.
 *
 * Concurrent callers asking about the same host share one probe: the first
 * caller becomes the owner and runs the probe, everyone else waits on the
 * owner's completion future.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <thread>
#include <unordered_map>

namespace lanwake {

using ProbeCompletion = std::shared_future<Result<ProbeResult>>;

/**
 * @brief Returned by start_probe().
 *
 * The owner must finish with set() or set_error(). Non-owners wait on
 * completion with their own timeout.
 */
struct ProbeTicket {
    bool is_owner{false};
    ProbeCompletion completion;
};

struct CacheStats {
    size_t total_entries{0};
    size_t in_flight{0};
    size_t completed{0};
    std::chrono::milliseconds ttl{0};
};

class ResultCache {
public:
    /**
     * @param ttl             Completed results older than this are misses.
     * @param sweep_interval  Background sweep period; zero disables the sweeper.
     */
    explicit ResultCache(std::chrono::milliseconds ttl,
                         std::chrono::milliseconds sweep_interval = std::chrono::seconds(30));
    ~ResultCache();

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /// Fresh completed result, or nullopt when absent, in flight or expired.
    [[nodiscard]] std::optional<ProbeResult> get(const HostId& key) const;

    /// Join the in-flight probe for @p key, or become its owner.
    [[nodiscard]] ProbeTicket start_probe(const HostId& key);

    /// Complete the in-flight probe (if any) and cache the result.
    void set(const HostId& key, bool ping_success, bool arp_success);

    /// Complete waiters with @p error. Nothing is cached.
    void set_error(const HostId& key, Error error);

    /// Drop the entry; waiters of an in-flight probe receive ErrorCode::Cancelled.
    void invalidate(const HostId& key);
    void invalidate_all();

    /// Remove expired completed entries. Returns how many were removed.
    size_t sweep_expired();

    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        std::optional<ProbeResult> result;
        std::shared_ptr<std::promise<Result<ProbeResult>>> pending;
        ProbeCompletion completion;

        [[nodiscard]] bool in_flight() const noexcept { return pending != nullptr; }
    };

    [[nodiscard]] bool expired(const ProbeResult& result, Timestamp now) const noexcept;
    static void cancel(Entry& entry, const std::string& reason);
    void sweep_loop(std::stop_token stop);

    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds sweep_interval_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<HostId, Entry> entries_;
    std::jthread sweeper_;
};

}  // namespace lanwake
