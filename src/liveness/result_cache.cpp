/**
 * @file result_cache.cpp
 * @brief ResultCache implementation.
 */

#include "liveness/result_cache.hpp"

#include <mutex>

namespace lanwake {

ResultCache::ResultCache(std::chrono::milliseconds ttl, std::chrono::milliseconds sweep_interval)
    : ttl_(ttl), sweep_interval_(sweep_interval) {
    if (sweep_interval_.count() > 0) {
        sweeper_ = std::jthread([this](std::stop_token stop) { sweep_loop(stop); });
    }
}

ResultCache::~ResultCache() {
    if (sweeper_.joinable()) {
        sweeper_.request_stop();
        sweeper_.join();
    }
    std::unique_lock lock(mutex_);
    for (auto& [key, entry] : entries_) {
        if (entry.in_flight()) cancel(entry, "result cache destroyed");
    }
}

// ─────────────────────────────────────────────
// Lookups
// ─────────────────────────────────────────────

bool ResultCache::expired(const ProbeResult& result, Timestamp now) const noexcept {
    return now - result.observed_at > ttl_;
}

std::optional<ProbeResult> ResultCache::get(const HostId& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.in_flight() || !it->second.result) {
        return std::nullopt;
    }
    if (expired(*it->second.result, std::chrono::system_clock::now())) {
        return std::nullopt;
    }
    return it->second.result;
}

ProbeTicket ResultCache::start_probe(const HostId& key) {
    std::unique_lock lock(mutex_);
    auto& entry = entries_[key];
    if (entry.in_flight()) {
        return ProbeTicket{false, entry.completion};
    }

    entry.result.reset();
    entry.pending = std::make_shared<std::promise<Result<ProbeResult>>>();
    entry.completion = entry.pending->get_future().share();
    return ProbeTicket{true, entry.completion};
}

// ─────────────────────────────────────────────
// Completion
// ─────────────────────────────────────────────

void ResultCache::set(const HostId& key, bool ping_success, bool arp_success) {
    ProbeResult result{ping_success, arp_success, std::chrono::system_clock::now()};

    std::unique_lock lock(mutex_);
    auto& entry = entries_[key];
    if (entry.in_flight()) {
        entry.pending->set_value(result);
        entry.pending.reset();
    }
    entry.result = result;
}

void ResultCache::set_error(const HostId& key, Error error) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;

    if (it->second.in_flight()) {
        it->second.pending->set_value(Result<ProbeResult>(std::move(error)));
    }
    entries_.erase(it);
}

void ResultCache::cancel(Entry& entry, const std::string& reason) {
    entry.pending->set_value(Result<ProbeResult>(Error{ErrorCode::Cancelled, reason}));
    entry.pending.reset();
}

void ResultCache::invalidate(const HostId& key) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;

    if (it->second.in_flight()) cancel(it->second, "probe for '" + key + "' was invalidated");
    entries_.erase(it);
}

void ResultCache::invalidate_all() {
    std::unique_lock lock(mutex_);
    for (auto& [key, entry] : entries_) {
        if (entry.in_flight()) cancel(entry, "probe for '" + key + "' was invalidated");
    }
    entries_.clear();
}

// ─────────────────────────────────────────────
// Maintenance
// ─────────────────────────────────────────────

size_t ResultCache::sweep_expired() {
    auto now = std::chrono::system_clock::now();
    size_t removed = 0;

    std::unique_lock lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        const auto& entry = it->second;
        if (!entry.in_flight() && (!entry.result || expired(*entry.result, now))) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

CacheStats ResultCache::stats() const {
    std::shared_lock lock(mutex_);
    CacheStats stats;
    stats.total_entries = entries_.size();
    stats.ttl = ttl_;
    for (const auto& [key, entry] : entries_) {
        if (entry.in_flight()) {
            ++stats.in_flight;
        } else if (entry.result) {
            ++stats.completed;
        }
    }
    return stats;
}

void ResultCache::sweep_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        // Sleep in small increments to respond to stop requests promptly
        auto deadline = std::chrono::steady_clock::now() + sweep_interval_;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (stop.stop_requested()) break;

        sweep_expired();
    }
}

}  // namespace lanwake
