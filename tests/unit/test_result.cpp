/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and typed errors.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace lanwake;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Failure);
}

TEST(ResultTest, TypedError) {
    Result<int> r = Error{ErrorCode::AllInterfacesFailed, "all interfaces failed",
                          {"eth0: down", "eth1: down"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_TRUE(r.error().is(ErrorCode::AllInterfacesFailed));
    EXPECT_EQ(r.error().details.size(), 2u);
    EXPECT_EQ(to_string(r.error().code), "all_interfaces_failed");
}

TEST(ResultTest, ValueThrowsWithMessage) {
    Result<int> r = Error{ErrorCode::InvalidMac, "bad mac"};
    try {
        (void)r.value();
        FAIL() << "expected exception";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("bad mac"), std::string::npos);
    }
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsCode) {
    Result<int> r = Error{ErrorCode::InvalidIp, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().code, ErrorCode::InvalidIp);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.has_value());

    Result<void> failed = Error{ErrorCode::Cancelled, "invalidated"};
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(failed.error().is(ErrorCode::Cancelled));
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::Config, "bad config");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::Config);
}
