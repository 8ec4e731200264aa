/**
 * @file interface_selector.hpp
 * @brief Chooses which NICs a probe or wake uses for a given host.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

namespace lanwake {

struct InterfaceSelectionPolicy {
    std::vector<InterfaceName> default_interfaces;   ///< Empty = all interfaces
    bool per_host_enabled{false};
    bool readonly_mode{false};
};

/**
 * @brief Resolve the interface list for @p host.
 *
 * First matching rule wins:
 *   1. per-host selection disabled  -> default_interfaces
 *   2. readonly mode                -> default_interfaces
 *   3. host lists interfaces        -> the host's list
 *   4. otherwise                    -> empty (all interfaces)
 */
[[nodiscard]] std::vector<InterfaceName> select_interfaces(const InterfaceSelectionPolicy& policy,
                                                           const Host& host);

/// Allowed characters: letters, digits, '.', '-', '_', ' ', '(' and ')'.
[[nodiscard]] bool is_valid_interface_name(std::string_view name) noexcept;

/**
 * @brief Check every name in @p names against the live interface set.
 *
 * Returns InvalidInterface for a malformed name and InterfaceNotFound for a
 * name absent from @p available.
 */
[[nodiscard]] Result<void> validate_interfaces(const std::vector<InterfaceName>& names,
                                               const std::vector<InterfaceName>& available);

}  // namespace lanwake
