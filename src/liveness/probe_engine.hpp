/**
 * @file probe_engine.hpp
 * @brief Layered host liveness probe.
 *
 * Probe order for one host:
 *   1. static IP (not fallback)  -> active ARP of the static IP, terminal
 *   2. passive neighbor lookup   -> flush + re-query; an entry not re-learned
 *                                   after the flush goes straight to 4
 *   3. active ARP of candidate   -> success, or flush and (fallback only) go on
 *   4. full-subnet ARP scan      -> bounded workers, first MAC match wins,
 *                                   ICMP echo to tell arp-only from online
 *   5. static IP fallback        -> active ARP of the static IP
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "net/interface_selector.hpp"
#include "net/network_backend.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <stop_token>
#include <vector>

namespace lanwake {

struct ProbeSettings {
    InterfaceSelectionPolicy selection;
    bool active_arp_available{true};
    bool neighbor_flush_available{true};
    bool icmp_available{true};
    size_t scan_workers{10};
    std::chrono::milliseconds icmp_timeout{std::chrono::seconds(2)};
    std::chrono::milliseconds min_scan_arp_timeout{50};
};

class ProbeEngine {
public:
    ProbeEngine(INetworkBackend& backend, Logger& logger, ProbeSettings settings);

    // Non-copyable
    ProbeEngine(const ProbeEngine&) = delete;
    ProbeEngine& operator=(const ProbeEngine&) = delete;

    /**
     * @brief Determine whether @p host is online.
     *
     * Network silence is an outcome, not an error: it yields
     * (ping=false, arp=false). Errors are returned only for a malformed
     * host record (InvalidMac, InvalidIp) or when the interface list cannot
     * be read (Io).
     */
    [[nodiscard]] Result<ProbeResult> probe(const Host& host,
                                            std::chrono::milliseconds timeout,
                                            std::stop_token stop = {});

    /// False once raw ARP has been found to be unavailable.
    [[nodiscard]] bool active_scanning_available() const noexcept;
    [[nodiscard]] bool neighbor_flush_available() const noexcept;

    [[nodiscard]] const ProbeSettings& settings() const noexcept { return settings_; }

private:
    /// ARP @p ip over @p interfaces in order; the first reply wins.
    [[nodiscard]] std::optional<ArpReply> arp_ping(Ipv4Address ip,
                                                   const std::vector<InterfaceName>& interfaces,
                                                   SteadyTime deadline);

    [[nodiscard]] std::optional<Ipv4Address> passive_lookup(const Host& host, const MacAddress& mac);

    [[nodiscard]] std::optional<Ipv4Address> subnet_scan(const Host& host,
                                                         const MacAddress& mac,
                                                         const std::vector<InterfaceInfo>& interfaces,
                                                         std::chrono::milliseconds timeout,
                                                         std::stop_token stop);

    /// Returns true when the neighbor entry was removed.
    bool flush(Ipv4Address ip);

    /// Selected interfaces, or every usable interface when the selection is empty.
    [[nodiscard]] Result<std::vector<InterfaceInfo>> candidate_interfaces(
        const std::vector<InterfaceName>& selected);

    void disable_active_arp(const Error& cause);
    void disable_neighbor_flush(const Error& cause);

    INetworkBackend& backend_;
    Logger& logger_;
    ProbeSettings settings_;
    std::atomic<bool> active_arp_;
    std::atomic<bool> neighbor_flush_;
};

}  // namespace lanwake
