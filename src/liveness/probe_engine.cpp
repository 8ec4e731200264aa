/**
 * @file probe_engine.cpp
 * @brief ProbeEngine implementation.
 */

#include "liveness/probe_engine.hpp"
#include "executor/thread_pool.hpp"
#include "net/address.hpp"

#include <algorithm>
#include <future>
#include <iterator>
#include <mutex>
#include <utility>

namespace lanwake {

namespace {

using std::chrono::milliseconds;

/// Upper bound for a single ARP request outside the subnet scan.
constexpr milliseconds kArpReplyTimeout{500};

milliseconds time_left(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<milliseconds>(deadline - std::chrono::steady_clock::now());
    return std::max(left, milliseconds{0});
}

std::string describe(const std::vector<InterfaceName>& names) {
    if (names.empty()) return "all interfaces";
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ",";
        out += name;
    }
    return out;
}

/// One contiguous run of host addresses on one interface.
struct ScanRange {
    InterfaceName interface;
    uint32_t next;
    uint32_t last;
};

}  // anonymous namespace

ProbeEngine::ProbeEngine(INetworkBackend& backend, Logger& logger, ProbeSettings settings)
    : backend_(backend)
    , logger_(logger)
    , settings_(std::move(settings))
    , active_arp_(settings_.active_arp_available)
    , neighbor_flush_(settings_.neighbor_flush_available) {
    if (settings_.scan_workers == 0) settings_.scan_workers = 1;
}

bool ProbeEngine::active_scanning_available() const noexcept {
    return active_arp_.load();
}

bool ProbeEngine::neighbor_flush_available() const noexcept {
    return neighbor_flush_.load();
}

// ─────────────────────────────────────────────
// Probe
// ─────────────────────────────────────────────

Result<ProbeResult> ProbeEngine::probe(const Host& host, milliseconds timeout, std::stop_token stop) {
    auto mac = parse_mac(host.mac_address);
    if (!mac) return mac.error();

    std::optional<Ipv4Address> static_ip;
    if (host.static_ip && !host.static_ip->empty()) {
        auto ip = validate_static_ipv4(*host.static_ip);
        if (!ip) return ip.error();
        static_ip = *ip;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto selected = select_interfaces(settings_.selection, host);

    auto candidates = candidate_interfaces(selected);
    if (!candidates) return candidates.error();

    std::vector<InterfaceName> names;
    names.reserve(candidates->size());
    for (const auto& info : *candidates) names.push_back(info.name);

    // 1. Static IP is authoritative.
    if (static_ip && !host.use_as_fallback) {
        logger_.debug("Probe '" + host.name + "': static IP " + static_ip->to_string()
                      + " via " + describe(selected));
        return arp_ping(*static_ip, names, deadline) ? ProbeResult::online()
                                                     : ProbeResult::offline();
    }

    // 2 + 3. Neighbor table candidate, verified by active ARP.
    if (auto candidate = passive_lookup(host, *mac)) {
        if (auto reply = arp_ping(*candidate, names, deadline)) {
            if (reply->mac != *mac) {
                logger_.warn("Host '" + host.name + "' MAC mismatch - stored: "
                             + format_mac(*mac) + ", detected: " + format_mac(reply->mac)
                             + " at " + candidate->to_string() + " via " + reply->interface);
            }
            return ProbeResult::online();
        }

        flush(*candidate);
        logger_.debug("Probe '" + host.name + "': no ARP reply from " + candidate->to_string()
                      + ", flushed neighbor entry");
        if (!host.use_as_fallback) return ProbeResult::offline();
    }

    // 4. Full-subnet scan.
    if (!stop.stop_requested()) {
        if (auto found = subnet_scan(host, *mac, *candidates, time_left(deadline), stop)) {
            bool ping = settings_.icmp_available
                     && backend_.icmp_echo(*found, settings_.icmp_timeout);
            logger_.debug("Probe '" + host.name + "': found at " + found->to_string()
                          + (ping ? ", ICMP reply" : ", no ICMP reply"));
            return ProbeResult::online(ping);
        }
    }

    // 5. Static IP as fallback, with at least the verification budget.
    if (static_ip && host.use_as_fallback) {
        auto fallback_deadline = std::max(deadline,
                                          std::chrono::steady_clock::now() + settings_.icmp_timeout);
        logger_.debug("Probe '" + host.name + "': trying fallback IP " + static_ip->to_string());
        return arp_ping(*static_ip, names, fallback_deadline) ? ProbeResult::online()
                                                              : ProbeResult::offline();
    }

    return ProbeResult::offline();
}

// ─────────────────────────────────────────────
// Steps
// ─────────────────────────────────────────────

std::optional<ArpReply> ProbeEngine::arp_ping(Ipv4Address ip,
                                              const std::vector<InterfaceName>& interfaces,
                                              SteadyTime deadline) {
    // First reply wins. Overlapping subnets on two interfaces cannot be told
    // apart here; callers compare the replying MAC where they know it.
    for (const auto& name : interfaces) {
        if (!active_arp_.load()) return std::nullopt;

        auto left = time_left(deadline);
        if (left.count() == 0) break;

        auto reply = backend_.arp_request(ip, name, std::min(kArpReplyTimeout, left));
        if (reply) {
            logger_.debug("ARP reply from " + ip.to_string() + ": " + format_mac(reply->mac)
                          + " via " + name);
            return *reply;
        }
        if (reply.error().is(ErrorCode::PermissionDenied)) {
            disable_active_arp(reply.error());
            return std::nullopt;
        }
        logger_.debug("No ARP reply from " + ip.to_string() + " via " + name + ": "
                      + reply.error().message);
    }
    return std::nullopt;
}

std::optional<Ipv4Address> ProbeEngine::passive_lookup(const Host& host, const MacAddress& mac) {
    auto hit = backend_.lookup_neighbor(mac);
    if (!hit) {
        logger_.debug("Neighbor table unavailable: " + hit.error().message);
        return std::nullopt;
    }
    if (!hit->has_value()) return std::nullopt;

    Ipv4Address candidate = **hit;
    logger_.debug("Probe '" + host.name + "': neighbor table has " + candidate.to_string());

    // Drop the possibly stale entry so the active check resolves afresh.
    // Without a working flush the first answer is all we have.
    if (!neighbor_flush_.load()) return candidate;

    bool flushed = flush(candidate);
    auto again = backend_.lookup_neighbor(mac);
    if (again && again->has_value()) return **again;
    if (!flushed) return candidate;

    logger_.debug("Probe '" + host.name + "': " + candidate.to_string()
                  + " not re-learned after flush");
    return std::nullopt;
}

std::optional<Ipv4Address> ProbeEngine::subnet_scan(const Host& host,
                                                    const MacAddress& mac,
                                                    const std::vector<InterfaceInfo>& interfaces,
                                                    milliseconds timeout,
                                                    std::stop_token stop) {
    if (!active_arp_.load()) return std::nullopt;

    std::vector<ScanRange> ranges;
    uint64_t total = 0;
    for (const auto& info : interfaces) {
        if (!info.up || info.loopback) continue;
        for (const auto& net : info.addresses) {
            if (net.host_count() == 0) continue;
            ranges.push_back(ScanRange{info.name, net.network().value + 1, net.broadcast().value - 1});
            total += net.host_count();
        }
    }
    if (ranges.empty() || timeout.count() == 0) return std::nullopt;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    auto per_address = std::max(timeout / 20, settings_.min_scan_arp_timeout);

    logger_.debug("Probe '" + host.name + "': scanning " + std::to_string(total)
                  + " addresses for " + format_mac(mac));

    std::mutex generator_mutex;
    size_t range_index = 0;
    auto next_target = [&]() -> std::optional<std::pair<Ipv4Address, InterfaceName>> {
        std::lock_guard lock(generator_mutex);
        while (range_index < ranges.size()) {
            auto& range = ranges[range_index];
            if (range.next <= range.last) {
                return std::pair{Ipv4Address{range.next++}, range.interface};
            }
            ++range_index;
        }
        return std::nullopt;
    };

    std::stop_source scan_stop;
    std::stop_callback forward_stop(stop, [&scan_stop] { scan_stop.request_stop(); });

    std::mutex found_mutex;
    std::optional<Ipv4Address> found;

    auto worker = [&](std::stop_token pool_stop) {
        while (!scan_stop.stop_requested() && !pool_stop.stop_requested()) {
            auto left = time_left(deadline);
            if (left.count() == 0) break;

            auto target = next_target();
            if (!target) break;

            auto reply = backend_.arp_request(target->first, target->second,
                                              std::min(per_address, left));
            if (reply) {
                if (reply->mac != mac) continue;
                std::lock_guard lock(found_mutex);
                // Replies landing after the deadline or after another match are discarded.
                if (!found && !scan_stop.stop_requested()
                    && std::chrono::steady_clock::now() <= deadline) {
                    found = target->first;
                }
                scan_stop.request_stop();
            } else if (reply.error().is(ErrorCode::PermissionDenied)) {
                disable_active_arp(reply.error());
                scan_stop.request_stop();
            }
        }
    };

    {
        auto worker_count = static_cast<size_t>(
            std::min<uint64_t>(settings_.scan_workers, total));
        ThreadPool pool(worker_count, "lw-scan");
        std::vector<std::future<void>> running;
        running.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            running.push_back(pool.submit_cancellable(worker));
        }
        for (auto& f : running) f.get();
    }

    if (!found) {
        logger_.debug("Probe '" + host.name + "': " + format_mac(mac) + " not found before deadline");
    }
    return found;
}

bool ProbeEngine::flush(Ipv4Address ip) {
    if (!neighbor_flush_.load()) return false;

    auto result = backend_.flush_neighbor(ip);
    if (result) return true;

    if (result.error().is(ErrorCode::PermissionDenied)) {
        disable_neighbor_flush(result.error());
    } else {
        logger_.debug("Neighbor flush for " + ip.to_string() + " failed: " + result.error().message);
    }
    return false;
}

Result<std::vector<InterfaceInfo>> ProbeEngine::candidate_interfaces(
    const std::vector<InterfaceName>& selected) {
    auto all = backend_.interfaces();
    if (!all) return all.error();

    std::vector<InterfaceInfo> result;
    if (selected.empty()) {
        std::copy_if(all->begin(), all->end(), std::back_inserter(result),
                     [](const InterfaceInfo& info) { return info.usable(); });
        return result;
    }

    for (const auto& name : selected) {
        auto it = std::find_if(all->begin(), all->end(),
                               [&name](const InterfaceInfo& info) { return info.name == name; });
        if (it == all->end()) {
            logger_.warn("Network interface '" + name + "' not found, skipping");
            continue;
        }
        result.push_back(*it);
    }
    return result;
}

// ─────────────────────────────────────────────
// Capability Loss
// ─────────────────────────────────────────────

void ProbeEngine::disable_active_arp(const Error& cause) {
    if (active_arp_.exchange(false)) {
        logger_.error("Active ARP disabled for the lifetime of this process: " + cause.message
                      + ". Grant CAP_NET_RAW (setcap cap_net_raw+ep lanwake) to enable scanning");
    }
}

void ProbeEngine::disable_neighbor_flush(const Error& cause) {
    if (neighbor_flush_.exchange(false)) {
        logger_.error("Neighbor cache flushing disabled for the lifetime of this process: "
                      + cause.message + ". Grant CAP_NET_ADMIN to enable it");
    }
}

}  // namespace lanwake
