/**
 * @file priority_scheduler.hpp
 * @brief Wake history and probe ordering for bulk checks.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace lanwake {

/**
 * @brief Remembers recent wakes and orders hosts so that recently woken
 *        ones are probed first.
 *
 * The history only affects ordering. It is bounded; recording a wake past
 * capacity evicts the oldest entry.
 */
class PriorityScheduler {
public:
    explicit PriorityScheduler(size_t capacity = 100);

    void record_wake(const HostId& id);
    void record_wake(const HostId& id, Timestamp when);

    [[nodiscard]] std::optional<Timestamp> last_wake(const HostId& id) const;
    [[nodiscard]] size_t history_size() const;
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Stable ordering: woken hosts first (most recent wake first),
     *        then the rest by created_at, newest first. @p hosts is not modified.
     */
    [[nodiscard]] std::vector<Host> sort_by_priority(const std::vector<Host>& hosts) const;

private:
    size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<HostId, Timestamp> history_;
};

}  // namespace lanwake
