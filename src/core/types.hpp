/**
 * @file types.hpp
 * @brief Fundamental types used throughout lanwake.
 *
 * Defines HostId, MacAddress, Ipv4Address, Ipv4Network, Host and
 * ProbeResult. All types are value types and cheap to copy.
 */

#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanwake {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using HostId = std::string;
using InterfaceName = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Link / Network Addresses
// ─────────────────────────────────────────────

/**
 * @brief 48-bit hardware address in wire order.
 */
struct MacAddress {
    std::array<uint8_t, 6> octets{};

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        for (auto b : octets) if (b != 0x00) return false;
        return true;
    }

    [[nodiscard]] constexpr bool is_broadcast() const noexcept {
        for (auto b : octets) if (b != 0xFF) return false;
        return true;
    }

    auto operator<=>(const MacAddress&) const = default;
};

/**
 * @brief IPv4 address held in host byte order.
 */
struct Ipv4Address {
    uint32_t value{0};

    [[nodiscard]] constexpr uint8_t octet(int index) const noexcept {
        return static_cast<uint8_t>(value >> (24 - 8 * index));
    }

    [[nodiscard]] constexpr bool is_loopback() const noexcept { return (value >> 24) == 127; }
    [[nodiscard]] constexpr bool is_multicast() const noexcept { return (value >> 28) == 0xE; }
    [[nodiscard]] constexpr bool is_unspecified() const noexcept { return value == 0; }
    [[nodiscard]] constexpr bool is_limited_broadcast() const noexcept { return value == 0xFFFFFFFFu; }

    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const Ipv4Address&) const = default;
};

/**
 * @brief An interface address with its prefix length.
 */
struct Ipv4Network {
    Ipv4Address address;
    uint8_t prefix_length{24};

    [[nodiscard]] constexpr uint32_t netmask() const noexcept {
        if (prefix_length == 0) return 0;
        if (prefix_length >= 32) return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix_length);
    }

    [[nodiscard]] constexpr Ipv4Address network() const noexcept {
        return Ipv4Address{address.value & netmask()};
    }

    [[nodiscard]] constexpr Ipv4Address broadcast() const noexcept {
        return Ipv4Address{network().value | ~netmask()};
    }

    [[nodiscard]] constexpr bool contains(Ipv4Address ip) const noexcept {
        return (ip.value & netmask()) == network().value;
    }

    /// Number of usable host addresses (network and broadcast excluded).
    [[nodiscard]] constexpr uint64_t host_count() const noexcept {
        if (prefix_length >= 31) return 0;
        return (uint64_t{1} << (32 - prefix_length)) - 2;
    }
};

// ─────────────────────────────────────────────
// Host Record
// ─────────────────────────────────────────────

/**
 * @brief Read-only view of a registered device, supplied by the host registry.
 */
struct Host {
    HostId id;
    std::string name;
    std::string mac_address;                   ///< Any accepted MAC notation
    std::optional<std::string> static_ip;
    bool use_as_fallback{false};
    std::vector<InterfaceName> interfaces;     ///< Empty = all interfaces
    std::string broadcast_target = "255.255.255.255:9";
    Timestamp created_at{};
};

// ─────────────────────────────────────────────
// Probe Result
// ─────────────────────────────────────────────

/**
 * @brief Liveness observation for one host.
 *
 * ping_success implies arp_success.
 */
struct ProbeResult {
    bool ping_success{false};
    bool arp_success{false};
    Timestamp observed_at{};

    [[nodiscard]] static ProbeResult offline() noexcept {
        return ProbeResult{false, false, std::chrono::system_clock::now()};
    }

    [[nodiscard]] static ProbeResult online(bool ping = true) noexcept {
        return ProbeResult{ping, true, std::chrono::system_clock::now()};
    }
};

/**
 * @brief Optional OS facilities detected once at startup.
 */
struct Capabilities {
    bool active_arp{false};       ///< AF_PACKET raw sockets (CAP_NET_RAW)
    bool neighbor_flush{false};   ///< rtnetlink neighbor deletion (CAP_NET_ADMIN)
    bool icmp{false};
};

}  // namespace lanwake
