/**
 * @file address.hpp
 * @brief MAC / IPv4 parsing, magic packet construction and broadcast
 *        address arithmetic.
 *
 * All functions are pure and thread-safe. Malformed input is reported as
 * InvalidMac, InvalidIp or InvalidBroadcast before any I/O happens.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lanwake {

// ─────────────────────────────────────────────
// MAC Addresses
// ─────────────────────────────────────────────

/**
 * @brief Canonicalize a MAC address to lowercase colon form.
 *
 * Accepts `AA:BB:CC:DD:EE:FF`, `AA-BB-CC-DD-EE-FF`, `aabbccddeeff` and
 * whitespace-separated variants. Rejects anything that is not exactly 12
 * hex digits after stripping separators, as well as the all-zero and
 * broadcast addresses. Idempotent.
 */
[[nodiscard]] Result<std::string> normalize_mac(std::string_view input);

/// Parse any accepted notation into binary form.
[[nodiscard]] Result<MacAddress> parse_mac(std::string_view input);

/// Lowercase colon form, e.g. "aa:bb:cc:dd:ee:ff".
[[nodiscard]] std::string format_mac(const MacAddress& mac);

// ─────────────────────────────────────────────
// Magic Packet
// ─────────────────────────────────────────────

inline constexpr size_t kMagicPacketSize = 102;
using MagicPacket = std::array<uint8_t, kMagicPacketSize>;

/// 6 x 0xFF followed by the MAC repeated 16 times.
[[nodiscard]] MagicPacket build_magic_packet(const MacAddress& mac) noexcept;

[[nodiscard]] Result<MagicPacket> build_magic_packet(std::string_view mac);

// ─────────────────────────────────────────────
// IPv4
// ─────────────────────────────────────────────

/// Dotted-quad IPv4 only.
[[nodiscard]] Result<Ipv4Address> parse_ipv4(std::string_view text);

/**
 * @brief Parse a host's static IP. Rejects loopback, multicast,
 *        0.0.0.0 and 255.255.255.255.
 */
[[nodiscard]] Result<Ipv4Address> validate_static_ipv4(std::string_view text);

/// Directed broadcast of an interface network (network | ~mask).
[[nodiscard]] Ipv4Address subnet_broadcast(const Ipv4Network& net) noexcept;

/// Same, from CIDR text such as "192.168.1.17/24". IPv6 input is InvalidIp.
[[nodiscard]] Result<Ipv4Address> subnet_broadcast(std::string_view cidr);

/// Parse "a.b.c.d/len".
[[nodiscard]] Result<Ipv4Network> parse_ipv4_network(std::string_view cidr);

// ─────────────────────────────────────────────
// Broadcast Targets / Interface Lists
// ─────────────────────────────────────────────

struct BroadcastTarget {
    Ipv4Address ip;
    uint16_t port{9};

    auto operator<=>(const BroadcastTarget&) const = default;
};

/**
 * @brief Parse "ip:port". The address must be IPv4 and neither loopback nor
 *        multicast; the port must lie in 1..65535.
 */
[[nodiscard]] Result<BroadcastTarget> parse_broadcast_target(std::string_view text);

/// Split "eth0, eth1," into {"eth0", "eth1"}; empty entries are dropped.
[[nodiscard]] std::vector<std::string> split_interface_list(std::string_view text);

}  // namespace lanwake
