/**
 * @file interface_selector.cpp
 * @brief Interface selection policy.
 */

#include "net/interface_selector.hpp"

#include <algorithm>
#include <cctype>

namespace lanwake {

std::vector<InterfaceName> select_interfaces(const InterfaceSelectionPolicy& policy,
                                             const Host& host) {
    if (!policy.per_host_enabled) return policy.default_interfaces;
    if (policy.readonly_mode) return policy.default_interfaces;
    if (!host.interfaces.empty()) return host.interfaces;
    return {};
}

bool is_valid_interface_name(std::string_view name) noexcept {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0
            || c == '.' || c == '-' || c == '_' || c == ' ' || c == '(' || c == ')';
    });
}

Result<void> validate_interfaces(const std::vector<InterfaceName>& names,
                                 const std::vector<InterfaceName>& available) {
    for (const auto& name : names) {
        if (!is_valid_interface_name(name)) {
            return Error{ErrorCode::InvalidInterface,
                         "interface name '" + name + "' contains invalid characters"};
        }
        if (std::find(available.begin(), available.end(), name) == available.end()) {
            return Error{ErrorCode::InterfaceNotFound,
                         "network interface '" + name + "' not found"};
        }
    }
    return {};
}

}  // namespace lanwake
