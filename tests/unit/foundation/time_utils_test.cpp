#include <gtest/gtest.h>

#include <chrono>

#include "fxp/foundation/time_utils.hpp"

using namespace fxp::foundation;
using namespace std::chrono;

TEST(TimeUtilsTest, MakeUtcRejectsInvalidDates) {
    EXPECT_TRUE(makeUtc(2024, 2, 29, 0, 0, 0).has_value());
    EXPECT_FALSE(makeUtc(2023, 2, 29, 0, 0, 0).has_value());
    EXPECT_FALSE(makeUtc(2024, 13, 1, 0, 0, 0).has_value());
    EXPECT_FALSE(makeUtc(2024, 1, 1, 24, 0, 0).has_value());
    EXPECT_FALSE(makeUtc(2024, 1, 1, 0, 60, 0).has_value());
}

TEST(TimeUtilsTest, FormatIso8601) {
    auto ts = makeUtc(2024, 1, 1, 0, 0, 0);
    ASSERT_TRUE(ts);
    EXPECT_EQ(formatIso8601(*ts), "2024-01-01T00:00:00Z");
    EXPECT_EQ(formatIso8601(*ts + 1h + 2min + 3s + 400ms), "2024-01-01T01:02:03Z");
    EXPECT_EQ(formatDate(*ts + 23h), "2024-01-01");
}

TEST(TimeUtilsTest, ParseIso8601AcceptsOptionalZulu) {
    auto expected = makeUtc(2024, 3, 15, 12, 30, 45);
    EXPECT_EQ(parseIso8601("2024-03-15T12:30:45Z"), expected);
    EXPECT_EQ(parseIso8601("2024-03-15T12:30:45"), expected);
}

TEST(TimeUtilsTest, ParseIso8601RejectsMalformed) {
    EXPECT_FALSE(parseIso8601("").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-15 12:30:45").has_value());
    EXPECT_FALSE(parseIso8601("2024-3-15T12:30:45").has_value());
    EXPECT_FALSE(parseIso8601("2024-02-30T00:00:00").has_value());
    EXPECT_FALSE(parseIso8601("2024-03-15T12:30:45+01").has_value());
}

TEST(TimeUtilsTest, ReadDigitsNeedsTheFullWidth) {
    unsigned value = 7;
    EXPECT_TRUE(readDigits("x2024y", 1, 4, value));
    EXPECT_EQ(value, 2024u);
    EXPECT_FALSE(readDigits("20a4", 0, 4, value));
    EXPECT_FALSE(readDigits("202", 0, 4, value));
    EXPECT_EQ(value, 2024u);
}

TEST(TimeUtilsTest, ReadClockTime) {
    unsigned h = 0, m = 0, s = 0;
    EXPECT_TRUE(readClockTime("at 09:05:59", 3, h, m, s));
    EXPECT_EQ(h, 9u);
    EXPECT_EQ(m, 5u);
    EXPECT_EQ(s, 59u);
    EXPECT_FALSE(readClockTime("09-05-59", 0, h, m, s));
    EXPECT_FALSE(readClockTime("09:05:5", 0, h, m, s));
}

TEST(TimeUtilsTest, UtcMidnight) {
    auto ts = *makeUtc(2024, 5, 6, 17, 4, 9);
    EXPECT_EQ(utcMidnight(ts), *makeUtc(2024, 5, 6, 0, 0, 0));
}

TEST(TimeUtilsTest, FloorToDayCycleIsStableWithinCycle) {
    // 1970-01-01 is day 0; 7-day cycles start on Thursdays.
    auto start = *makeUtc(2024, 1, 4, 0, 0, 0);
    EXPECT_EQ(floorToDayCycle(start, 7), start);
    EXPECT_EQ(floorToDayCycle(start + 3 * 24h + 5h, 7), start);
    EXPECT_EQ(floorToDayCycle(start + 7 * 24h, 7), start + 7 * 24h);
    EXPECT_EQ(floorToDayCycle(start - 1s, 7), start - 7 * 24h);
}

TEST(TimeUtilsTest, FloorToDayCycleTreatsNonPositiveAsOneDay) {
    auto ts = *makeUtc(2024, 1, 4, 13, 0, 0);
    EXPECT_EQ(floorToDayCycle(ts, 0), utcMidnight(ts));
    EXPECT_EQ(floorToDayCycle(ts, -3), utcMidnight(ts));
}
