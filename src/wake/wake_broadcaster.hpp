/**
 * @file wake_broadcaster.hpp
 * @brief Sends Wake-on-LAN magic packets over one or many interfaces.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "net/address.hpp"
#include "net/network_backend.hpp"

#include <string_view>
#include <vector>

namespace lanwake {

/**
 * @brief Broadcasts the magic packet for a MAC address.
 *
 * With an empty interface list the packet leaves from every up,
 * non-loopback interface that has an IPv4 address. With an explicit list
 * each named interface is tried in order. Every interface is attempted
 * even after a success; the call succeeds when at least one send did, and
 * otherwise fails with AllInterfacesFailed carrying one detail line per
 * interface.
 */
class WakeBroadcaster {
public:
    WakeBroadcaster(INetworkBackend& backend, Logger& logger);

    [[nodiscard]] Result<void> wake(const MacAddress& mac,
                                    const BroadcastTarget& target,
                                    const std::vector<InterfaceName>& interfaces);

    /// Validates @p mac before any I/O (InvalidMac).
    [[nodiscard]] Result<void> wake(std::string_view mac,
                                    const BroadcastTarget& target,
                                    const std::vector<InterfaceName>& interfaces);

private:
    INetworkBackend& backend_;
    Logger& logger_;
};

}  // namespace lanwake
