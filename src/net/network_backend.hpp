/**
 * @file network_backend.hpp
 * @brief Abstract seam over the OS facilities used for probing and waking.
 *
 * LinuxNetworkBackend talks to the kernel; tests provide a scripted fake.
 * Virtual dispatch is fine here: every call performs network I/O.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace lanwake {

struct InterfaceInfo {
    InterfaceName name;
    bool up{false};
    bool loopback{false};
    std::vector<Ipv4Network> addresses;

    [[nodiscard]] bool usable() const noexcept {
        return up && !loopback && !addresses.empty();
    }
};

/**
 * @brief Reply to an active ARP request.
 */
struct ArpReply {
    Ipv4Address ip;
    MacAddress mac;
    InterfaceName interface;
};

class INetworkBackend {
public:
    virtual ~INetworkBackend() = default;

    /// All interfaces with their IPv4 addresses.
    [[nodiscard]] virtual Result<std::vector<InterfaceInfo>> interfaces() = 0;

    /**
     * @brief Passive lookup of @p mac in the kernel neighbor table.
     * @return The IP, or std::nullopt on a miss.
     */
    [[nodiscard]] virtual Result<std::optional<Ipv4Address>> lookup_neighbor(const MacAddress& mac) = 0;

    /// Remove the neighbor entry for @p ip. PermissionDenied without CAP_NET_ADMIN.
    [[nodiscard]] virtual Result<void> flush_neighbor(Ipv4Address ip) = 0;

    /**
     * @brief Send one ARP who-has for @p target on @p interface and wait up
     *        to @p timeout for the reply.
     *
     * Returns ProbeTimeout when nothing answers and PermissionDenied without
     * CAP_NET_RAW.
     */
    [[nodiscard]] virtual Result<ArpReply> arp_request(Ipv4Address target,
                                                       const InterfaceName& interface,
                                                       std::chrono::milliseconds timeout) = 0;

    /// One ICMP echo. False on timeout or when ICMP is unavailable.
    [[nodiscard]] virtual bool icmp_echo(Ipv4Address target, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Send a UDP datagram from @p local to @p target:@p port with
     *        SO_BROADCAST enabled. A zero @p local leaves the socket unbound.
     */
    [[nodiscard]] virtual Result<void> send_udp(Ipv4Address local,
                                                Ipv4Address target,
                                                uint16_t port,
                                                std::span<const uint8_t> payload) = 0;

    /// Probe the process privileges. Called once at startup.
    [[nodiscard]] virtual Capabilities detect_capabilities() = 0;
};

}  // namespace lanwake
