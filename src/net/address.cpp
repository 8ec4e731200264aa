/**
 * @file address.cpp
 * @brief Address parsing and magic packet construction.
 */

#include "net/address.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <netinet/in.h>

namespace lanwake {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_mac_separator(char c) noexcept {
    return c == ':' || c == '-' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// MAC Addresses
// ─────────────────────────────────────────────

Result<MacAddress> parse_mac(std::string_view input) {
    MacAddress mac;
    size_t nibbles = 0;

    for (char c : input) {
        if (is_mac_separator(c)) continue;

        int v = hex_value(c);
        if (v < 0) {
            return Error{ErrorCode::InvalidMac,
                         "invalid MAC address '" + std::string{input} + "': non-hex character"};
        }
        if (nibbles >= 12) {
            return Error{ErrorCode::InvalidMac,
                         "invalid MAC address '" + std::string{input} + "': too many digits"};
        }

        auto& octet = mac.octets[nibbles / 2];
        octet = static_cast<uint8_t>((octet << 4) | v);
        ++nibbles;
    }

    if (nibbles != 12) {
        return Error{ErrorCode::InvalidMac,
                     "invalid MAC address '" + std::string{input} + "': expected 12 hex digits"};
    }
    if (mac.is_broadcast()) {
        return Error{ErrorCode::InvalidMac, "broadcast MAC address is not a valid host"};
    }
    if (mac.is_zero()) {
        return Error{ErrorCode::InvalidMac, "all-zero MAC address is not a valid host"};
    }
    return mac;
}

std::string format_mac(const MacAddress& mac) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  mac.octets[0], mac.octets[1], mac.octets[2],
                  mac.octets[3], mac.octets[4], mac.octets[5]);
    return std::string{buf};
}

Result<std::string> normalize_mac(std::string_view input) {
    return parse_mac(input).map([](const MacAddress& mac) { return format_mac(mac); });
}

// ─────────────────────────────────────────────
// Magic Packet
// ─────────────────────────────────────────────

MagicPacket build_magic_packet(const MacAddress& mac) noexcept {
    MagicPacket packet{};
    std::fill_n(packet.begin(), 6, uint8_t{0xFF});
    for (size_t rep = 0; rep < 16; ++rep) {
        std::copy(mac.octets.begin(), mac.octets.end(), packet.begin() + 6 + rep * 6);
    }
    return packet;
}

Result<MagicPacket> build_magic_packet(std::string_view mac) {
    auto parsed = parse_mac(mac);
    if (!parsed) return parsed.error();
    return build_magic_packet(*parsed);
}

// ─────────────────────────────────────────────
// IPv4
// ─────────────────────────────────────────────

std::string Ipv4Address::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                  octet(0), octet(1), octet(2), octet(3));
    return std::string{buf};
}

Result<Ipv4Address> parse_ipv4(std::string_view text) {
    std::string owned{trim(text)};
    in_addr addr{};
    if (owned.empty() || ::inet_pton(AF_INET, owned.c_str(), &addr) != 1) {
        return Error{ErrorCode::InvalidIp, "invalid IPv4 address '" + std::string{text} + "'"};
    }
    return Ipv4Address{ntohl(addr.s_addr)};
}

Result<Ipv4Address> validate_static_ipv4(std::string_view text) {
    auto ip = parse_ipv4(text);
    if (!ip) return ip;

    if (ip->is_loopback()) {
        return Error{ErrorCode::InvalidIp, "static IP cannot be a loopback address"};
    }
    if (ip->is_multicast()) {
        return Error{ErrorCode::InvalidIp, "static IP cannot be a multicast address"};
    }
    if (ip->is_limited_broadcast()) {
        return Error{ErrorCode::InvalidIp, "static IP cannot be the broadcast address"};
    }
    if (ip->is_unspecified()) {
        return Error{ErrorCode::InvalidIp, "static IP cannot be 0.0.0.0"};
    }
    return ip;
}

Ipv4Address subnet_broadcast(const Ipv4Network& net) noexcept {
    return net.broadcast();
}

Result<Ipv4Network> parse_ipv4_network(std::string_view cidr) {
    cidr = trim(cidr);
    if (cidr.find(':') != std::string_view::npos) {
        return Error{ErrorCode::InvalidIp,
                     "'" + std::string{cidr} + "' is not an IPv4 network"};
    }

    auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        return Error{ErrorCode::InvalidIp, "missing prefix length in '" + std::string{cidr} + "'"};
    }

    auto ip = parse_ipv4(cidr.substr(0, slash));
    if (!ip) return ip.error();

    auto len_text = cidr.substr(slash + 1);
    unsigned prefix = 0;
    auto [ptr, ec] = std::from_chars(len_text.data(), len_text.data() + len_text.size(), prefix);
    if (ec != std::errc{} || ptr != len_text.data() + len_text.size() || prefix > 32
        || len_text.empty()) {
        return Error{ErrorCode::InvalidIp, "invalid prefix length in '" + std::string{cidr} + "'"};
    }

    return Ipv4Network{*ip, static_cast<uint8_t>(prefix)};
}

Result<Ipv4Address> subnet_broadcast(std::string_view cidr) {
    return parse_ipv4_network(cidr).map(
        [](const Ipv4Network& net) { return net.broadcast(); });
}

// ─────────────────────────────────────────────
// Broadcast Targets / Interface Lists
// ─────────────────────────────────────────────

Result<BroadcastTarget> parse_broadcast_target(std::string_view text) {
    text = trim(text);
    auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return Error{ErrorCode::InvalidBroadcast,
                     "broadcast target '" + std::string{text} + "' must be IP:PORT"};
    }

    auto ip = parse_ipv4(text.substr(0, colon));
    if (!ip) {
        return Error{ErrorCode::InvalidBroadcast,
                     "broadcast target '" + std::string{text} + "' has an invalid IPv4 address"};
    }
    if (ip->is_loopback() || ip->is_multicast()) {
        return Error{ErrorCode::InvalidBroadcast,
                     "broadcast target cannot be a loopback or multicast address"};
    }

    auto port_text = text.substr(colon + 1);
    uint32_t port = 0;
    auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size()
        || port < 1 || port > 65535) {
        return Error{ErrorCode::InvalidBroadcast,
                     "broadcast port '" + std::string{port_text} + "' must be between 1 and 65535"};
    }

    return BroadcastTarget{*ip, static_cast<uint16_t>(port)};
}

std::vector<std::string> split_interface_list(std::string_view text) {
    std::vector<std::string> names;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto end = comma == std::string_view::npos ? text.size() : comma;
        auto name = trim(text.substr(start, end - start));
        if (!name.empty()) names.emplace_back(name);
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return names;
}

}  // namespace lanwake
