/**
 * @file test_wake_broadcaster.cpp
 * @brief Unit tests for multi-interface magic packet delivery.
 */

#include "wake/wake_broadcaster.hpp"
#include "fake_network_backend.hpp"

#include <gtest/gtest.h>

using namespace lanwake;
using namespace lanwake::test;

class WakeBroadcasterTest : public ::testing::Test {
protected:
    FakeNetworkBackend backend_;
    std::shared_ptr<LogCapture> capture_ = std::make_shared<LogCapture>();
    Logger logger_{std::make_unique<CapturingSink>(capture_), LogLevel::Debug};
    WakeBroadcaster broadcaster_{backend_, logger_};
    BroadcastTarget target_ = parse_broadcast_target("255.255.255.255:9").value();

    void SetUp() override {
        auto loopback = make_interface("lo", "127.0.0.1/8");
        loopback.loopback = true;
        backend_.interface_list = {
            loopback,
            make_interface("eth0", "192.168.1.10/24"),
            make_interface("eth1", "10.0.0.10/24"),
            make_interface("wlan0", "172.16.0.10/24", false),
        };
    }
};

TEST_F(WakeBroadcasterTest, PacketContents) {
    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {"eth0"});
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto sent = backend_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].local, ip("192.168.1.10"));
    EXPECT_EQ(sent[0].target, ip("255.255.255.255"));
    EXPECT_EQ(sent[0].port, 9);

    auto expected = build_magic_packet(mac("AA:BB:CC:DD:EE:FF"));
    EXPECT_EQ(sent[0].payload, std::vector<uint8_t>(expected.begin(), expected.end()));
}

TEST_F(WakeBroadcasterTest, DefaultModeUsesUsableInterfaces) {
    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {});
    ASSERT_TRUE(result.has_value());

    auto sent = backend_.sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].local, ip("192.168.1.10"));
    EXPECT_EQ(sent[1].local, ip("10.0.0.10"));
}

TEST_F(WakeBroadcasterTest, DefaultModeSendsFromEverySecondaryAddress) {
    auto eth0 = make_interface("eth0", "192.168.1.10/24");
    eth0.addresses.push_back(parse_ipv4_network("192.168.50.10/24").value());
    backend_.interface_list = {eth0};
    // One segment down must not stop the other
    backend_.failing_sources.insert(ip("192.168.1.10").value);

    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {});
    ASSERT_TRUE(result.has_value());

    auto sent = backend_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].local, ip("192.168.50.10"));
    EXPECT_EQ(capture_->count_containing("not sent via eth0"), 1u);
}

TEST_F(WakeBroadcasterTest, DefaultModeWithoutUsableInterface) {
    backend_.interface_list = {make_interface("eth0", "192.168.1.10/24", false)};

    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AllInterfacesFailed);
    EXPECT_EQ(result.error().message, "no suitable network interface found");
}

TEST_F(WakeBroadcasterTest, PartialFailureStillSucceeds) {
    backend_.failing_sources.insert(ip("192.168.1.10").value);

    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {"eth0", "eth1"});
    ASSERT_TRUE(result.has_value());

    auto sent = backend_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].local, ip("10.0.0.10"));
    EXPECT_EQ(capture_->count_containing("not sent via eth0"), 1u);
}

TEST_F(WakeBroadcasterTest, AttemptsEveryInterfaceAfterSuccess) {
    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {"eth1", "eth0"});
    ASSERT_TRUE(result.has_value());

    auto sent = backend_.sent();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].local, ip("10.0.0.10"));
    EXPECT_EQ(sent[1].local, ip("192.168.1.10"));
}

TEST_F(WakeBroadcasterTest, AllInterfacesFailed) {
    backend_.failing_sources.insert(ip("192.168.1.10").value);

    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {"eth0", "eth9"});
    ASSERT_FALSE(result.has_value());

    const auto& error = result.error();
    EXPECT_EQ(error.code, ErrorCode::AllInterfacesFailed);
    ASSERT_EQ(error.details.size(), 2u);
    EXPECT_EQ(error.details[0], "eth9: network interface not found");
    EXPECT_EQ(error.details[1], "eth0: sendto: network is unreachable");
    EXPECT_NE(error.message.find("all interfaces failed: "), std::string::npos);
    EXPECT_NE(error.message.find("eth9: network interface not found"), std::string::npos);
    EXPECT_TRUE(backend_.sent().empty());
}

TEST_F(WakeBroadcasterTest, InterfaceWithoutAddress) {
    backend_.interface_list.push_back(InterfaceInfo{.name = "eth2", .up = true});

    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", target_, {"eth2"});
    ASSERT_FALSE(result.has_value());
    ASSERT_EQ(result.error().details.size(), 1u);
    EXPECT_EQ(result.error().details[0], "eth2: no IPv4 address");
}

TEST_F(WakeBroadcasterTest, InvalidMacSendsNothing) {
    auto result = broadcaster_.wake("AA:BB:CC:DD:EE", target_, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidMac);
    EXPECT_EQ(backend_.interfaces_calls.load(), 0);
    EXPECT_TRUE(backend_.sent().empty());
}

TEST_F(WakeBroadcasterTest, DirectedBroadcastTarget) {
    auto directed = parse_broadcast_target("192.168.1.255:7").value();

    auto result = broadcaster_.wake("AA:BB:CC:DD:EE:FF", directed, {"eth0"});
    ASSERT_TRUE(result.has_value());
    auto sent = backend_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].target, ip("192.168.1.255"));
    EXPECT_EQ(sent[0].port, 7);
}
