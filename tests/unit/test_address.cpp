/**
 * @file test_address.cpp
 * @brief Unit tests for MAC / IPv4 parsing and magic packet construction.
 */

#include "net/address.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace lanwake;

// ═══════════════════════════════════════════════
// MAC Address Tests
// ═══════════════════════════════════════════════

TEST(MacAddressTest, NormalizeAcceptedNotations) {
    for (const char* input : {"AA:BB:CC:DD:EE:FF", "AA-BB-CC-DD-EE-FF",
                              "aabbccddeeff", "aa bb cc dd ee 0f", " Aa:bB:cc:DD:ee:0F "}) {
        auto normalized = normalize_mac(input);
        ASSERT_TRUE(normalized.has_value()) << input << ": " << normalized.error().message;
        EXPECT_EQ(normalized->size(), 17u);
        EXPECT_TRUE(*normalized == "aa:bb:cc:dd:ee:ff" || *normalized == "aa:bb:cc:dd:ee:0f")
            << *normalized;
    }
}

TEST(MacAddressTest, NormalizeIsIdempotent) {
    auto once = normalize_mac("00-1A-2B-3C-4D-5E");
    ASSERT_TRUE(once.has_value());
    EXPECT_EQ(*once, "00:1a:2b:3c:4d:5e");

    auto twice = normalize_mac(*once);
    ASSERT_TRUE(twice.has_value());
    EXPECT_EQ(*twice, *once);
}

TEST(MacAddressTest, RejectsMalformed) {
    for (const char* input : {"", "AA:BB:CC:DD:EE", "AA:BB:CC:DD:EE:FF:00",
                              "GG:BB:CC:DD:EE:FF", "AA.BB.CC.DD.EE.FF", "not a mac"}) {
        auto parsed = parse_mac(input);
        ASSERT_FALSE(parsed.has_value()) << input;
        EXPECT_EQ(parsed.error().code, ErrorCode::InvalidMac) << input;
    }
}

TEST(MacAddressTest, RejectsBroadcastAndZero) {
    EXPECT_TRUE(parse_mac("FF:FF:FF:FF:FF:FF").error().is(ErrorCode::InvalidMac));
    EXPECT_TRUE(parse_mac("00:00:00:00:00:00").error().is(ErrorCode::InvalidMac));
}

TEST(MacAddressTest, ParseOctets) {
    auto mac = parse_mac("01-23-45-67-89-ab");
    ASSERT_TRUE(mac.has_value());
    std::array<uint8_t, 6> expected{0x01, 0x23, 0x45, 0x67, 0x89, 0xAB};
    EXPECT_EQ(mac->octets, expected);
    EXPECT_EQ(format_mac(*mac), "01:23:45:67:89:ab");
}

// ═══════════════════════════════════════════════
// Magic Packet Tests
// ═══════════════════════════════════════════════

TEST(MagicPacketTest, Layout) {
    auto packet = build_magic_packet("AA:BB:CC:DD:EE:FF");
    ASSERT_TRUE(packet.has_value());
    ASSERT_EQ(packet->size(), 102u);

    for (size_t i = 0; i < 6; ++i) EXPECT_EQ((*packet)[i], 0xFF) << "sync byte " << i;

    const std::array<uint8_t, 6> mac{0xAA, 0xBB, 0xCC, 0xDD, 0xEE, 0xFF};
    for (size_t rep = 0; rep < 16; ++rep) {
        EXPECT_TRUE(std::equal(mac.begin(), mac.end(), packet->begin() + 6 + rep * 6))
            << "repetition " << rep;
    }
}

TEST(MagicPacketTest, InvalidMacBuildsNothing) {
    auto packet = build_magic_packet("AA:BB:CC");
    ASSERT_FALSE(packet.has_value());
    EXPECT_EQ(packet.error().code, ErrorCode::InvalidMac);
}

// ═══════════════════════════════════════════════
// IPv4 Tests
// ═══════════════════════════════════════════════

TEST(Ipv4Test, ParseAndFormat) {
    auto ip = parse_ipv4("192.168.1.20");
    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(ip->value, 0xC0A80114u);
    EXPECT_EQ(ip->to_string(), "192.168.1.20");
    EXPECT_FALSE(parse_ipv4("192.168.1").has_value());
    EXPECT_FALSE(parse_ipv4("fe80::1").has_value());
}

TEST(Ipv4Test, StaticIpValidation) {
    EXPECT_TRUE(validate_static_ipv4("10.0.0.5").has_value());
    for (const char* bad : {"127.0.0.1", "224.0.0.1", "255.255.255.255", "0.0.0.0", "nonsense"}) {
        auto result = validate_static_ipv4(bad);
        ASSERT_FALSE(result.has_value()) << bad;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidIp) << bad;
    }
}

TEST(Ipv4Test, SubnetBroadcast) {
    auto b24 = subnet_broadcast(std::string_view{"192.168.1.17/24"});
    ASSERT_TRUE(b24.has_value());
    EXPECT_EQ(b24->to_string(), "192.168.1.255");

    auto b20 = subnet_broadcast(std::string_view{"10.1.2.3/20"});
    ASSERT_TRUE(b20.has_value());
    EXPECT_EQ(b20->to_string(), "10.1.15.255");

    auto b32 = subnet_broadcast(std::string_view{"10.1.2.3/32"});
    ASSERT_TRUE(b32.has_value());
    EXPECT_EQ(b32->to_string(), "10.1.2.3");
}

TEST(Ipv4Test, SubnetBroadcastRejectsIpv6) {
    auto result = subnet_broadcast(std::string_view{"fe80::1/64"});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidIp);
}

TEST(Ipv4Test, NetworkHostCount) {
    EXPECT_EQ(parse_ipv4_network("192.0.2.1/24")->host_count(), 254u);
    EXPECT_EQ(parse_ipv4_network("192.0.2.1/30")->host_count(), 2u);
    EXPECT_EQ(parse_ipv4_network("192.0.2.1/31")->host_count(), 0u);
    EXPECT_TRUE(parse_ipv4_network("192.0.2.1/24")->contains(Ipv4Address{0xC00002FEu}));
}

// ═══════════════════════════════════════════════
// Broadcast Target / Interface List Tests
// ═══════════════════════════════════════════════

TEST(BroadcastTargetTest, Parse) {
    auto target = parse_broadcast_target("192.168.1.255:9");
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->ip.to_string(), "192.168.1.255");
    EXPECT_EQ(target->port, 9);

    auto limited = parse_broadcast_target("255.255.255.255:7");
    ASSERT_TRUE(limited.has_value());
    EXPECT_EQ(limited->port, 7);
}

TEST(BroadcastTargetTest, RejectsInvalid) {
    for (const char* bad : {"192.168.1.255", "192.168.1.255:0", "192.168.1.255:70000",
                            "127.0.0.1:9", "239.1.1.1:9", "host:9", ":9", "10.0.0.255:"}) {
        auto result = parse_broadcast_target(bad);
        ASSERT_FALSE(result.has_value()) << bad;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidBroadcast) << bad;
    }
}

TEST(InterfaceListTest, Split) {
    EXPECT_EQ(split_interface_list("eth0, eth1,"), (std::vector<std::string>{"eth0", "eth1"}));
    EXPECT_EQ(split_interface_list("wlan0"), (std::vector<std::string>{"wlan0"}));
    EXPECT_TRUE(split_interface_list("").empty());
    EXPECT_TRUE(split_interface_list(" , ,").empty());
}
