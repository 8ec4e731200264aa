/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace lanwake;

TEST(Ipv4AddressTest, Classification) {
    EXPECT_TRUE((Ipv4Address{0x7F000001u}).is_loopback());
    EXPECT_TRUE((Ipv4Address{0xE0000001u}).is_multicast());
    EXPECT_TRUE((Ipv4Address{0}).is_unspecified());
    EXPECT_TRUE((Ipv4Address{0xFFFFFFFFu}).is_limited_broadcast());
    EXPECT_FALSE((Ipv4Address{0xC0A80101u}).is_loopback());
    EXPECT_EQ((Ipv4Address{0xC0A80114u}).octet(3), 0x14);
}

TEST(Ipv4NetworkTest, Arithmetic) {
    Ipv4Network net{Ipv4Address{0xC0A80111u}, 24};   // 192.168.1.17/24
    EXPECT_EQ(net.netmask(), 0xFFFFFF00u);
    EXPECT_EQ(net.network().value, 0xC0A80100u);
    EXPECT_EQ(net.broadcast().value, 0xC0A801FFu);
    EXPECT_EQ(net.host_count(), 254u);
    EXPECT_TRUE(net.contains(Ipv4Address{0xC0A801FEu}));
    EXPECT_FALSE(net.contains(Ipv4Address{0xC0A80201u}));
}

TEST(Ipv4NetworkTest, EdgePrefixes) {
    Ipv4Network whole{Ipv4Address{0x0A000001u}, 0};
    EXPECT_EQ(whole.netmask(), 0u);
    EXPECT_EQ(whole.broadcast().value, 0xFFFFFFFFu);

    Ipv4Network single{Ipv4Address{0x0A000001u}, 32};
    EXPECT_EQ(single.broadcast().value, 0x0A000001u);
    EXPECT_EQ(single.host_count(), 0u);
}

TEST(MacAddressTest, Predicates) {
    MacAddress zero;
    EXPECT_TRUE(zero.is_zero());
    EXPECT_FALSE(zero.is_broadcast());

    MacAddress all{{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}};
    EXPECT_TRUE(all.is_broadcast());
    EXPECT_NE(zero, all);
}

TEST(ProbeResultTest, Factories) {
    auto offline = ProbeResult::offline();
    EXPECT_FALSE(offline.ping_success);
    EXPECT_FALSE(offline.arp_success);

    auto arp_only = ProbeResult::online(false);
    EXPECT_FALSE(arp_only.ping_success);
    EXPECT_TRUE(arp_only.arp_success);

    auto online = ProbeResult::online();
    EXPECT_TRUE(online.ping_success);
    EXPECT_TRUE(online.arp_success);
    EXPECT_GT(online.observed_at.time_since_epoch().count(), 0);
}

TEST(HostTest, Defaults) {
    Host host;
    EXPECT_FALSE(host.use_as_fallback);
    EXPECT_FALSE(host.static_ip.has_value());
    EXPECT_TRUE(host.interfaces.empty());
    EXPECT_EQ(host.broadcast_target, "255.255.255.255:9");
}
