/**
 * @file wake_broadcaster.cpp
 * @brief WakeBroadcaster implementation.
 */

#include "wake/wake_broadcaster.hpp"

#include <algorithm>

namespace lanwake {

namespace {

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (const auto& part : parts) {
        if (!out.empty()) out += separator;
        out += part;
    }
    return out;
}

}  // anonymous namespace

WakeBroadcaster::WakeBroadcaster(INetworkBackend& backend, Logger& logger)
    : backend_(backend), logger_(logger) {}

Result<void> WakeBroadcaster::wake(std::string_view mac,
                                   const BroadcastTarget& target,
                                   const std::vector<InterfaceName>& interfaces) {
    auto parsed = parse_mac(mac);
    if (!parsed) return parsed.error();
    return wake(*parsed, target, interfaces);
}

Result<void> WakeBroadcaster::wake(const MacAddress& mac,
                                   const BroadcastTarget& target,
                                   const std::vector<InterfaceName>& interfaces) {
    auto packet = build_magic_packet(mac);
    auto destination = target.ip.to_string() + ":" + std::to_string(target.port);

    auto available = backend_.interfaces();
    if (!available) {
        return Error{ErrorCode::AllInterfacesFailed,
                     "cannot enumerate network interfaces: " + available.error().message,
                     {available.error().message}};
    }

    // (interface, local address) pairs to send from
    std::vector<std::pair<InterfaceName, Ipv4Address>> sources;
    std::vector<std::string> failures;

    if (interfaces.empty()) {
        // Every address, so secondary subnets on one NIC are reached too.
        for (const auto& info : *available) {
            if (!info.usable()) continue;
            for (const auto& net : info.addresses) sources.emplace_back(info.name, net.address);
        }
        if (sources.empty()) {
            return Error{ErrorCode::AllInterfacesFailed, "no suitable network interface found"};
        }
    } else {
        for (const auto& name : interfaces) {
            auto it = std::find_if(available->begin(), available->end(),
                                   [&name](const InterfaceInfo& info) { return info.name == name; });
            if (it == available->end()) {
                failures.push_back(name + ": network interface not found");
            } else if (it->addresses.empty()) {
                failures.push_back(name + ": no IPv4 address");
            } else {
                sources.emplace_back(name, it->addresses.front().address);
            }
        }
    }

    size_t sent = 0;
    for (const auto& [name, local] : sources) {
        auto result = backend_.send_udp(local, target.ip, target.port, packet);
        if (result) {
            ++sent;
            logger_.info("Magic packet for " + format_mac(mac) + " sent to " + destination
                         + " via " + name + " (" + local.to_string() + ")");
        } else {
            failures.push_back(name + ": " + result.error().message);
        }
    }

    if (sent == 0) {
        return Error{ErrorCode::AllInterfacesFailed,
                     "all interfaces failed: " + join(failures, "; "),
                     failures};
    }

    for (const auto& failure : failures) {
        logger_.warn("Magic packet for " + format_mac(mac) + " not sent via " + failure);
    }
    return {};
}

}  // namespace lanwake
