/**
 * @file linux_backend.hpp
 * @brief INetworkBackend implementation for Linux.
 *
 * Data sources:
 *   getifaddrs()   interface flags and IPv4 addresses
 *   /proc/net/arp  kernel neighbor table (passive lookup)
 *   NETLINK_ROUTE  RTM_DELNEIGH for neighbor flush (CAP_NET_ADMIN)
 *   AF_PACKET      raw ARP request/reply frames (CAP_NET_RAW)
 *   ICMP socket    SOCK_DGRAM ping socket, raw socket as fallback
 *   UDP socket     SO_BROADCAST datagrams bound to a local address
 */

#pragma once

#include "net/network_backend.hpp"

#include <cstdint>
#include <filesystem>
#include <span>

namespace lanwake {

/**
 * @brief True when @p datagram is the echo reply to our request @p id / @p sequence.
 *
 * Raw ICMP sockets deliver the IPv4 header first and see every process's
 * replies, so the identifier is checked there. Ping sockets strip the IP
 * header and rewrite the identifier, so only the sequence is compared.
 * @p id and @p sequence are in host byte order.
 */
[[nodiscard]] bool matches_echo_reply(std::span<const uint8_t> datagram,
                                      bool raw,
                                      uint16_t id,
                                      uint16_t sequence) noexcept;

class LinuxNetworkBackend : public INetworkBackend {
public:
    explicit LinuxNetworkBackend(std::filesystem::path arp_table = "/proc/net/arp");

    [[nodiscard]] Result<std::vector<InterfaceInfo>> interfaces() override;
    [[nodiscard]] Result<std::optional<Ipv4Address>> lookup_neighbor(const MacAddress& mac) override;
    [[nodiscard]] Result<void> flush_neighbor(Ipv4Address ip) override;
    [[nodiscard]] Result<ArpReply> arp_request(Ipv4Address target,
                                               const InterfaceName& interface,
                                               std::chrono::milliseconds timeout) override;
    [[nodiscard]] bool icmp_echo(Ipv4Address target, std::chrono::milliseconds timeout) override;
    [[nodiscard]] Result<void> send_udp(Ipv4Address local,
                                        Ipv4Address target,
                                        uint16_t port,
                                        std::span<const uint8_t> payload) override;
    [[nodiscard]] Capabilities detect_capabilities() override;

private:
    struct NeighborEntry {
        Ipv4Address ip;
        MacAddress mac;
        InterfaceName device;
    };

    /// Complete entries of the kernel ARP table.
    [[nodiscard]] Result<std::vector<NeighborEntry>> read_arp_table() const;

    std::filesystem::path arp_table_;
};

}  // namespace lanwake
