#include <gtest/gtest.h>

#include <chrono>

#include "diffline/utils/time.hpp"

using namespace diffline::utils;
using namespace std::chrono_literals;

class TimeTest : public ::testing::Test {
protected:
    static auto at(std::chrono::seconds sinceEpoch) -> TimePoint {
        return TimePoint(sinceEpoch);
    }
};

TEST_F(TimeTest, ParsesUtcTimestamps) {
    // 2024-01-01T00:00:00Z
    const auto expected = at(1704067200s);
    EXPECT_EQ(parseIsoTimestamp("2024-01-01T00:00:00Z"), expected);
    EXPECT_EQ(parseIsoTimestamp("2024-01-01 00:00:00"), expected);
    EXPECT_EQ(parseIsoTimestamp("2024-01-01t00:00:00z"), expected);
}

TEST_F(TimeTest, KeepsMilliseconds) {
    const auto parsed = parseIsoTimestamp("2024-01-01T00:00:00.123456Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, at(1704067200s) + 123ms);
}

TEST_F(TimeTest, AppliesZoneOffsets) {
    const auto expected = at(1704067200s);
    EXPECT_EQ(parseIsoTimestamp("2024-01-01T08:00:00+08:00"), expected);
    EXPECT_EQ(parseIsoTimestamp("2024-01-01T08:00:00+0800"), expected);
    EXPECT_EQ(parseIsoTimestamp("2023-12-31T19:30:00-04:30"), expected);
}

TEST_F(TimeTest, RejectsMalformedText) {
    EXPECT_FALSE(parseIsoTimestamp("").has_value());
    EXPECT_FALSE(parseIsoTimestamp("yesterday").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-01-01X00:00:00Z").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-01-01T00:00:00.Z").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-01-01T00:00:00+8").has_value());
    EXPECT_FALSE(parseIsoTimestamp("2024-01-01T00:00:00Z trailing").has_value());
}

TEST_F(TimeTest, FormatsWithMilliseconds) {
    EXPECT_EQ(toIsoTimestamp(at(1704067200s) + 7ms),
              "2024-01-01T00:00:00.007Z");
    EXPECT_EQ(toIsoTimestamp(at(0s)), "1970-01-01T00:00:00.000Z");
}

TEST_F(TimeTest, FormatParsesBack) {
    const auto time = at(1714564805s) + 250ms;
    const auto text = toIsoTimestamp(time);
    EXPECT_EQ(text, "2024-05-01T12:00:05.250Z");
    EXPECT_EQ(parseIsoTimestamp(text), time);
}
