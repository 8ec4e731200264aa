/**
 * @file liveness_service.hpp
 * @brief Top-level facade: cached and coalesced liveness checks, bulk
 *        checks in priority order, and wake requests.
 *
 * Provides a single entry point for:
 *   1. Checking one host (cache -> coalesce -> probe -> cache)
 *   2. Checking many hosts concurrently, streaming results as they finish
 *   3. Waking a host and recording the wake for later ordering
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "liveness/probe_engine.hpp"
#include "liveness/result_cache.hpp"
#include "net/network_backend.hpp"
#include "scheduler/priority_scheduler.hpp"
#include "wake/wake_broadcaster.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanwake {

struct LivenessSettings {
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds coalesce_grace{std::chrono::seconds(5)};
    uint32_t cache_ttl_multiplier{2};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(30)};
    size_t history_capacity{100};
    size_t bulk_workers{16};
    std::string default_broadcast{"255.255.255.255:9"};
    ProbeSettings probe;

    /// Derive settings from configuration and the capabilities detected at startup.
    [[nodiscard]] static LivenessSettings from_config(const Config& config, const Capabilities& caps);
};

/**
 * @brief Outcome of a single-host check.
 */
struct LivenessStatus {
    ProbeResult result;
    bool cached{false};      ///< Served from a fresh cache entry
    bool coalesced{false};   ///< Shared another caller's in-flight probe
};

/**
 * @brief One row of a bulk check. Failures degrade to offline with the
 *        error attached.
 */
struct HostStatus {
    HostId id;
    std::string name;
    ProbeResult result;
    bool cached{false};
    bool coalesced{false};
    std::optional<Error> error;
};

using HostStatusCallback = std::function<void(const HostStatus&)>;

class LivenessService {
public:
    LivenessService(INetworkBackend& backend, Logger& logger, LivenessSettings settings);

    // Non-copyable, non-movable
    LivenessService(const LivenessService&) = delete;
    LivenessService& operator=(const LivenessService&) = delete;

    /**
     * @brief Check one host.
     *
     * A fresh cache entry is returned as-is. Otherwise the first caller
     * probes and later callers wait up to probe_timeout + coalesce_grace
     * for its result; a waiter that times out reports offline.
     */
    [[nodiscard]] Result<LivenessStatus> check(const Host& host);

    /**
     * @brief Check every host concurrently, highest priority submitted first.
     *
     * @p on_result is called once per host as each check completes, never
     * concurrently with itself.
     */
    std::vector<HostStatus> check_all(const std::vector<Host>& hosts,
                                      const HostStatusCallback& on_result = {});

    /**
     * @brief Send the magic packet; on success record the wake and drop the
     *        cached liveness result.
     */
    [[nodiscard]] Result<void> wake(const Host& host);

    /**
     * @brief Check a host record before use: MAC, static IP, broadcast
     *        target and interface names against the live interface set.
     */
    [[nodiscard]] Result<void> validate_host(const Host& host);

    [[nodiscard]] Capabilities capabilities() const noexcept;

    // ── Accessors (for testing) ─────────────
    ResultCache& cache() { return cache_; }
    PriorityScheduler& scheduler() { return scheduler_; }
    ProbeEngine& engine() { return engine_; }
    const LivenessSettings& settings() const { return settings_; }

private:
    INetworkBackend& backend_;
    Logger& logger_;
    LivenessSettings settings_;

    ProbeEngine engine_;
    ResultCache cache_;
    WakeBroadcaster broadcaster_;
    PriorityScheduler scheduler_;
    ThreadPool bulk_pool_;
};

}  // namespace lanwake
