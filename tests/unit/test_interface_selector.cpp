/**
 * @file test_interface_selector.cpp
 * @brief Unit tests for per-host interface selection and validation.
 */

#include "net/interface_selector.hpp"

#include <gtest/gtest.h>

using namespace lanwake;

// ═══════════════════════════════════════════════
// Selection Matrix
// ═══════════════════════════════════════════════

struct SelectionCase {
    bool per_host_enabled;
    bool readonly_mode;
    std::vector<InterfaceName> defaults;
    std::vector<InterfaceName> host_interfaces;
    std::vector<InterfaceName> expected;
};

class InterfaceSelectionTest : public ::testing::TestWithParam<SelectionCase> {};

TEST_P(InterfaceSelectionTest, Select) {
    const auto& c = GetParam();
    InterfaceSelectionPolicy policy{
        .default_interfaces = c.defaults,
        .per_host_enabled = c.per_host_enabled,
        .readonly_mode = c.readonly_mode,
    };
    Host host;
    host.interfaces = c.host_interfaces;

    EXPECT_EQ(select_interfaces(policy, host), c.expected);
}

INSTANTIATE_TEST_SUITE_P(Policies, InterfaceSelectionTest, ::testing::Values(
    // Per-host disabled: host list ignored
    SelectionCase{false, false, {"eth0"}, {"wlan0"}, {"eth0"}},
    SelectionCase{false, false, {}, {"wlan0"}, {}},
    // Readonly wins over the host list
    SelectionCase{true, true, {"eth0"}, {"wlan0"}, {"eth0"}},
    SelectionCase{true, true, {}, {"wlan0"}, {}},
    // Per-host enabled with a host list
    SelectionCase{true, false, {"eth0"}, {"wlan0", "eth1"}, {"wlan0", "eth1"}},
    // Per-host enabled, host has no list: all interfaces
    SelectionCase{true, false, {"eth0"}, {}, {}}
));

// ═══════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════

TEST(InterfaceValidationTest, NameCharacters) {
    EXPECT_TRUE(is_valid_interface_name("eth0"));
    EXPECT_TRUE(is_valid_interface_name("br-lan.10"));
    EXPECT_TRUE(is_valid_interface_name("Ethernet (2)"));
    EXPECT_FALSE(is_valid_interface_name(""));
    EXPECT_FALSE(is_valid_interface_name("eth0;rm"));
    EXPECT_FALSE(is_valid_interface_name("eth0/1"));
}

TEST(InterfaceValidationTest, AgainstAvailable) {
    std::vector<InterfaceName> available{"lo", "eth0", "wlan0"};

    EXPECT_TRUE(validate_interfaces({"eth0", "wlan0"}, available).has_value());
    EXPECT_TRUE(validate_interfaces({}, available).has_value());

    auto missing = validate_interfaces({"eth0", "eth7"}, available);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::InterfaceNotFound);

    auto malformed = validate_interfaces({"eth$"}, available);
    ASSERT_FALSE(malformed.has_value());
    EXPECT_EQ(malformed.error().code, ErrorCode::InvalidInterface);
}
