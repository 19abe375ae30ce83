/**
 * @file time_tests.cpp
 * @brief Unit tests for wall-clock formatting
 */

#include <gtest/gtest.h>
#include "scaleguard/core/types.h"

using namespace scaleguard;

TEST(FormatTimeTest, Epoch) {
    EXPECT_EQ(format_time(Clock::from_time_t(0)), "1970-01-01T00:00:00Z");
}

TEST(FormatTimeTest, FormatsInUtc) {
    EXPECT_EQ(format_time(Clock::from_time_t(1700000000)), "2023-11-14T22:13:20Z");
    EXPECT_EQ(format_time(Clock::from_time_t(1700000000) + Seconds(3600)), "2023-11-14T23:13:20Z");
}

TEST(FormatTimeTest, DropsSubsecondPart) {
    TimePoint time = Clock::from_time_t(1700000000) + std::chrono::milliseconds(999);
    EXPECT_EQ(format_time(time), "2023-11-14T22:13:20Z");
}
