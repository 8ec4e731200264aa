/**
 * @file liveness_service.cpp
 * @brief LivenessService implementation.
 */

#include "liveness/liveness_service.hpp"
#include "net/address.hpp"
#include "net/interface_selector.hpp"

#include <exception>
#include <future>
#include <mutex>

namespace lanwake {

LivenessSettings LivenessSettings::from_config(const Config& config, const Capabilities& caps) {
    LivenessSettings settings;
    settings.probe_timeout = std::chrono::seconds(config.probe.timeout_seconds);
    settings.coalesce_grace = std::chrono::seconds(config.probe.coalesce_grace_seconds);
    settings.cache_ttl_multiplier = config.probe.cache_ttl_multiplier;
    settings.sweep_interval = std::chrono::seconds(config.probe.sweep_interval_seconds);
    settings.history_capacity = config.wake.history_capacity;
    settings.default_broadcast = config.wake.default_broadcast;

    settings.probe.selection = InterfaceSelectionPolicy{
        .default_interfaces = config.network.default_interfaces,
        .per_host_enabled = config.network.enable_per_host_interfaces,
        .readonly_mode = config.network.readonly_mode,
    };
    settings.probe.active_arp_available = caps.active_arp;
    settings.probe.neighbor_flush_available = caps.neighbor_flush;
    settings.probe.icmp_available = caps.icmp;
    settings.probe.scan_workers = config.probe.scan_workers;
    settings.probe.icmp_timeout = std::chrono::seconds(config.probe.icmp_timeout_seconds);
    return settings;
}

LivenessService::LivenessService(INetworkBackend& backend, Logger& logger, LivenessSettings settings)
    : backend_(backend)
    , logger_(logger)
    , settings_(std::move(settings))
    , engine_(backend_, logger_, settings_.probe)
    , cache_(settings_.probe_timeout * settings_.cache_ttl_multiplier, settings_.sweep_interval)
    , broadcaster_(backend_, logger_)
    , scheduler_(settings_.history_capacity)
    , bulk_pool_(settings_.bulk_workers, "lw-check") {
}

// ─────────────────────────────────────────────
// Single Host
// ─────────────────────────────────────────────

Result<LivenessStatus> LivenessService::check(const Host& host) {
    if (auto cached = cache_.get(host.id)) {
        return LivenessStatus{*cached, true, false};
    }

    auto ticket = cache_.start_probe(host.id);

    if (!ticket.is_owner) {
        auto wait = settings_.probe_timeout + settings_.coalesce_grace;
        if (ticket.completion.wait_for(wait) != std::future_status::ready) {
            logger_.warn("Timed out waiting for in-flight probe of '" + host.name + "'");
            return LivenessStatus{ProbeResult::offline(), false, true};
        }

        const auto& outcome = ticket.completion.get();
        if (outcome) return LivenessStatus{*outcome, false, true};
        if (outcome.error().is(ErrorCode::Cancelled)) {
            return LivenessStatus{ProbeResult::offline(), false, true};
        }
        return outcome.error();
    }

    auto probed = [&]() -> Result<ProbeResult> {
        try {
            return engine_.probe(host, settings_.probe_timeout);
        } catch (const std::exception& e) {
            // Never leave waiters on a marker that will not complete.
            cache_.set_error(host.id, Error{ErrorCode::Failure, e.what()});
            throw;
        }
    }();

    if (!probed) {
        cache_.set_error(host.id, probed.error());
        logger_.warn("Probe of '" + host.name + "' failed: " + probed.error().message);
        return probed.error();
    }

    cache_.set(host.id, probed->ping_success, probed->arp_success);
    logger_.debug("Probe of '" + host.name + "': ping=" + (probed->ping_success ? "true" : "false")
                  + " arp=" + (probed->arp_success ? "true" : "false"));
    return LivenessStatus{*probed, false, false};
}

// ─────────────────────────────────────────────
// Bulk
// ─────────────────────────────────────────────

std::vector<HostStatus> LivenessService::check_all(const std::vector<Host>& hosts,
                                                   const HostStatusCallback& on_result) {
    auto ordered = scheduler_.sort_by_priority(hosts);

    std::mutex results_mutex;
    std::vector<HostStatus> results;
    results.reserve(ordered.size());

    std::vector<std::future<void>> pending;
    pending.reserve(ordered.size());

    for (const auto& host : ordered) {
        pending.push_back(bulk_pool_.submit([this, &host, &results, &results_mutex, &on_result] {
            HostStatus status{.id = host.id, .name = host.name};

            auto checked = check(host);
            if (checked) {
                status.result = checked->result;
                status.cached = checked->cached;
                status.coalesced = checked->coalesced;
            } else {
                status.result = ProbeResult::offline();
                status.error = checked.error();
            }

            std::lock_guard lock(results_mutex);
            results.push_back(status);
            if (on_result) on_result(results.back());
        }));
    }

    // Every task borrows this frame; all must finish before anything unwinds it.
    std::exception_ptr first_failure;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_failure) first_failure = std::current_exception();
        }
    }
    if (first_failure) std::rethrow_exception(first_failure);

    logger_.info("Bulk check finished: " + std::to_string(results.size()) + " hosts");
    return results;
}

// ─────────────────────────────────────────────
// Wake
// ─────────────────────────────────────────────

Result<void> LivenessService::wake(const Host& host) {
    auto mac = parse_mac(host.mac_address);
    if (!mac) return mac.error();

    const auto& target_text = host.broadcast_target.empty() ? settings_.default_broadcast
                                                            : host.broadcast_target;
    auto target = parse_broadcast_target(target_text);
    if (!target) return target.error();

    auto interfaces = select_interfaces(settings_.probe.selection, host);
    auto sent = broadcaster_.wake(*mac, *target, interfaces);
    if (!sent) {
        logger_.error("Wake of '" + host.name + "' failed: " + sent.error().message);
        return sent;
    }

    scheduler_.record_wake(host.id);
    cache_.invalidate(host.id);
    logger_.info("Woke '" + host.name + "' (" + format_mac(*mac) + ")");
    return {};
}

// ─────────────────────────────────────────────
// Validation / Capabilities
// ─────────────────────────────────────────────

Result<void> LivenessService::validate_host(const Host& host) {
    if (auto mac = parse_mac(host.mac_address); !mac) return mac.error();

    if (host.static_ip && !host.static_ip->empty()) {
        if (auto ip = validate_static_ipv4(*host.static_ip); !ip) return ip.error();
    }
    if (!host.broadcast_target.empty()) {
        if (auto target = parse_broadcast_target(host.broadcast_target); !target) {
            return target.error();
        }
    }
    if (host.interfaces.empty()) return {};

    auto available = backend_.interfaces();
    if (!available) return available.error();

    std::vector<InterfaceName> names;
    names.reserve(available->size());
    for (const auto& info : *available) names.push_back(info.name);
    return validate_interfaces(host.interfaces, names);
}

Capabilities LivenessService::capabilities() const noexcept {
    return Capabilities{
        .active_arp = engine_.active_scanning_available(),
        .neighbor_flush = engine_.neighbor_flush_available(),
        .icmp = settings_.probe.icmp_available,
    };
}

}  // namespace lanwake
