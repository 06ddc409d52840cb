#include "badgegate/device/DuplicateSuppressor.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace
{
using badgegate::core::TimePoint;
using badgegate::device::DuplicateSuppressor;
using std::chrono::milliseconds;
} // namespace

TEST(DuplicateSuppressor, AcceptsFirstToken)
{
    DuplicateSuppressor suppressor{};
    EXPECT_TRUE(suppressor.accept("1234567890", TimePoint{}));
}

TEST(DuplicateSuppressor, RejectsRepeatWithinWindow)
{
    DuplicateSuppressor suppressor{ milliseconds{ 2000 } };
    const TimePoint t0{};
    ASSERT_TRUE(suppressor.accept("1234567890", t0));
    EXPECT_FALSE(suppressor.accept("1234567890", t0 + milliseconds{ 500 }));
    EXPECT_FALSE(suppressor.accept("1234567890", t0 + milliseconds{ 1999 }));
}

TEST(DuplicateSuppressor, AcceptsRepeatOnceWindowHasElapsed)
{
    DuplicateSuppressor suppressor{ milliseconds{ 2000 } };
    const TimePoint t0{};
    ASSERT_TRUE(suppressor.accept("1234567890", t0));
    EXPECT_TRUE(suppressor.accept("1234567890", t0 + milliseconds{ 2000 }));
}

TEST(DuplicateSuppressor, RejectedRepeatDoesNotExtendWindow)
{
    DuplicateSuppressor suppressor{ milliseconds{ 2000 } };
    const TimePoint t0{};
    ASSERT_TRUE(suppressor.accept("1234567890", t0));
    ASSERT_FALSE(suppressor.accept("1234567890", t0 + milliseconds{ 1500 }));
    EXPECT_TRUE(suppressor.accept("1234567890", t0 + milliseconds{ 2100 }));
}

TEST(DuplicateSuppressor, DifferentTokenIsAlwaysAccepted)
{
    DuplicateSuppressor suppressor{};
    const TimePoint t0{};
    ASSERT_TRUE(suppressor.accept("1234567890", t0));
    EXPECT_TRUE(suppressor.accept("0987654321", t0 + milliseconds{ 10 }));
    // Only the immediately preceding token is remembered.
    EXPECT_TRUE(suppressor.accept("1234567890", t0 + milliseconds{ 20 }));
}

TEST(DuplicateSuppressor, ResetForgetsLastToken)
{
    DuplicateSuppressor suppressor{};
    const TimePoint t0{};
    ASSERT_TRUE(suppressor.accept("1234567890", t0));
    suppressor.reset();
    EXPECT_TRUE(suppressor.accept("1234567890", t0 + milliseconds{ 10 }));
}
