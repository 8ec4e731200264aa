/**
 * @file priority_scheduler.cpp
 * @brief PriorityScheduler implementation.
 */

#include "scheduler/priority_scheduler.hpp"

#include <algorithm>
#include <mutex>

namespace lanwake {

PriorityScheduler::PriorityScheduler(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void PriorityScheduler::record_wake(const HostId& id) {
    record_wake(id, std::chrono::system_clock::now());
}

void PriorityScheduler::record_wake(const HostId& id, Timestamp when) {
    std::unique_lock lock(mutex_);
    history_[id] = when;

    while (history_.size() > capacity_) {
        auto oldest = std::min_element(history_.begin(), history_.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        history_.erase(oldest);
    }
}

std::optional<Timestamp> PriorityScheduler::last_wake(const HostId& id) const {
    std::shared_lock lock(mutex_);
    auto it = history_.find(id);
    if (it == history_.end()) return std::nullopt;
    return it->second;
}

size_t PriorityScheduler::history_size() const {
    std::shared_lock lock(mutex_);
    return history_.size();
}

std::vector<Host> PriorityScheduler::sort_by_priority(const std::vector<Host>& hosts) const {
    struct Keyed {
        const Host* host;
        std::optional<Timestamp> woken;
    };

    std::vector<Keyed> keyed;
    keyed.reserve(hosts.size());
    {
        std::shared_lock lock(mutex_);
        for (const auto& host : hosts) {
            auto it = history_.find(host.id);
            keyed.push_back(Keyed{&host, it == history_.end() ? std::nullopt
                                                              : std::optional{it->second}});
        }
    }

    std::stable_sort(keyed.begin(), keyed.end(), [](const Keyed& a, const Keyed& b) {
        if (a.woken && b.woken) return *a.woken > *b.woken;
        if (a.woken.has_value() != b.woken.has_value()) return a.woken.has_value();
        return a.host->created_at > b.host->created_at;
    });

    std::vector<Host> ordered;
    ordered.reserve(keyed.size());
    for (const auto& k : keyed) ordered.push_back(*k.host);
    return ordered;
}

}  // namespace lanwake
