// =============================================================================
// Unit tests for datetime.hpp
// Tests: EXIF text parsing/formatting, calendar helpers, local epoch round trip
// =============================================================================
#include <gtest/gtest.h>
#include "datetime.hpp"

using namespace exif_redate;

TEST(DateTimeTest, ParsesExifText) {
    auto dt = ParseExifDateTime("2019:05:17 10:00:00");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->year,   2019);
    EXPECT_EQ(dt->month,  5);
    EXPECT_EQ(dt->day,    17);
    EXPECT_EQ(dt->hour,   10);
    EXPECT_EQ(dt->minute, 0);
    EXPECT_EQ(dt->second, 0);
}

TEST(DateTimeTest, ToleratesTrailingPadding) {
    EXPECT_TRUE(ParseExifDateTime(std::string("2019:05:17 10:00:00\0", 20)).has_value());
    EXPECT_TRUE(ParseExifDateTime("2019:05:17 10:00:00  ").has_value());
}

TEST(DateTimeTest, RejectsMalformedText) {
    EXPECT_FALSE(ParseExifDateTime("").has_value());
    EXPECT_FALSE(ParseExifDateTime("2019-05-17 10:00:00").has_value());
    EXPECT_FALSE(ParseExifDateTime("2019:05:17T10:00:00").has_value());
    EXPECT_FALSE(ParseExifDateTime("2019:5:17 10:00:00").has_value());
    EXPECT_FALSE(ParseExifDateTime("0000:00:00 00:00:00").has_value());
    EXPECT_FALSE(ParseExifDateTime("2019:02:30 10:00:00").has_value());
    EXPECT_FALSE(ParseExifDateTime("2019:05:17 24:00:00").has_value());
}

TEST(DateTimeTest, FormatsWithZeroPadding) {
    DateTime dt{2023, 1, 2, 3, 4, 5};
    EXPECT_EQ(FormatExifDateTime(dt), "2023:01:02 03:04:05");
}

TEST(DateTimeTest, DaysInMonthHandlesLeapYears) {
    EXPECT_EQ(DaysInMonth(2020, 2), 29);
    EXPECT_EQ(DaysInMonth(2023, 2), 28);
    EXPECT_EQ(DaysInMonth(1900, 2), 28);
    EXPECT_EQ(DaysInMonth(2000, 2), 29);
    EXPECT_EQ(DaysInMonth(2023, 4), 30);
    EXPECT_EQ(DaysInMonth(2023, 12), 31);
    EXPECT_EQ(DaysInMonth(2023, 13), 0);
}

TEST(DateTimeTest, LocalEpochRoundTrip) {
    DateTime dt{2023, 12, 17, 10, 0, 0};
    std::time_t t = ToTimeT(dt);
    ASSERT_NE(t, static_cast<std::time_t>(-1));
    EXPECT_EQ(FromTimeT(t), dt);
}
