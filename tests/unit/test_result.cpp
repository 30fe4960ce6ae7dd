/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace game_factory;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorDefaultsToInternal) {
    Result<int> r = Error{"something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_TRUE(r.error().is(ErrorCode::Internal));
}

TEST(ResultTest, ErrorCarriesCode) {
    Result<std::string> r = Error{ErrorCode::NotFound, "Server not found: abc"};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_FALSE(r.error().is(ErrorCode::Gone));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorCode::InvalidInput, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapKeepsErrorCode) {
    Result<int> r = Error{ErrorCode::LaunchFailed, "port is already allocated"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::LaunchFailed);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 20;
    auto chained = r.and_then([](int v) -> Result<int> {
        if (v > 10) return Error{ErrorCode::ResourceExhausted, "too many"};
        return v;
    });
    ASSERT_FALSE(chained);
    EXPECT_EQ(chained.error().code, ErrorCode::ResourceExhausted);
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{"fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::Gone, "expired"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::Gone);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::NoPortAvailable, "range exhausted");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NoPortAvailable);
    EXPECT_EQ(r.error().what(), "range exhausted");
}

TEST(ErrorCodeTest, StableNames) {
    EXPECT_EQ(to_string(ErrorCode::InvalidInput), "invalid_input");
    EXPECT_EQ(to_string(ErrorCode::ResourceExhausted), "resource_exhausted");
    EXPECT_EQ(to_string(ErrorCode::NoPortAvailable), "no_port_available");
    EXPECT_EQ(to_string(ErrorCode::BuildFailed), "build_failed");
    EXPECT_EQ(to_string(ErrorCode::LaunchFailed), "launch_failed");
    EXPECT_EQ(to_string(ErrorCode::NotFound), "not_found");
    EXPECT_EQ(to_string(ErrorCode::Gone), "gone");
}
