/**
 * @file test_datetime.cpp
 * @brief Unit tests for date-time literal parsing (GoogleTest)
 */

#include <gtest/gtest.h>
#include "tomlet/DateTime.hpp"

using namespace tomlet;

// ============================================================================
// Accepted forms
// ============================================================================

TEST(ParseDateTimeTest, DateOnly) {
    auto dt = parse_date_time("1979-05-27");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->year, 1979);
    EXPECT_EQ(dt->month, 5);
    EXPECT_EQ(dt->day, 27);
    EXPECT_FALSE(dt->has_time);
    EXPECT_FALSE(dt->has_offset);
}

TEST(ParseDateTimeTest, LocalDateTime) {
    auto dt = parse_date_time("1979-05-27T07:32:00");
    ASSERT_TRUE(dt.has_value());
    EXPECT_TRUE(dt->has_time);
    EXPECT_EQ(dt->hour, 7);
    EXPECT_EQ(dt->minute, 32);
    EXPECT_EQ(dt->second, 0);
    EXPECT_FALSE(dt->has_offset);
}

TEST(ParseDateTimeTest, Utc) {
    auto dt = parse_date_time("1979-05-27T07:32:00Z");
    ASSERT_TRUE(dt.has_value());
    EXPECT_TRUE(dt->has_offset);
    EXPECT_EQ(dt->offset_minutes, 0);
}

TEST(ParseDateTimeTest, LowerCaseDesignators) {
    auto dt = parse_date_time("1979-05-27t07:32:00z");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(*dt, *parse_date_time("1979-05-27T07:32:00Z"));
}

TEST(ParseDateTimeTest, NegativeOffset) {
    auto dt = parse_date_time("1979-05-27T00:32:00-07:00");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->offset_minutes, -420);
}

TEST(ParseDateTimeTest, PositiveOffset) {
    auto dt = parse_date_time("1979-05-27T00:32:00+05:30");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->offset_minutes, 330);
}

TEST(ParseDateTimeTest, FractionalSeconds) {
    auto dt = parse_date_time("1979-05-27T00:32:00.999999");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(dt->nanosecond, 999999000u);
}

TEST(ParseDateTimeTest, LeapDay) {
    EXPECT_TRUE(parse_date_time("2020-02-29").has_value());
    EXPECT_TRUE(parse_date_time("2000-02-29").has_value());
    EXPECT_FALSE(parse_date_time("2019-02-29").has_value());
    EXPECT_FALSE(parse_date_time("1900-02-29").has_value());
}

// ============================================================================
// Rejected forms
// ============================================================================

TEST(ParseDateTimeTest, RejectsOutOfRangeFields) {
    EXPECT_FALSE(parse_date_time("1979-13-01").has_value());
    EXPECT_FALSE(parse_date_time("1979-00-01").has_value());
    EXPECT_FALSE(parse_date_time("1979-04-31").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27T24:00:00").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27T23:60:00").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27T23:00:00+24:00").has_value());
}

TEST(ParseDateTimeTest, RejectsMalformedText) {
    EXPECT_FALSE(parse_date_time("").has_value());
    EXPECT_FALSE(parse_date_time("1979-5-27").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27T07:32").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27T07:32:00.").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27T07:32:00Zjunk").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27X07:32:00").has_value());
}

TEST(ParseDateTimeTest, RejectsOtherValueKinds) {
    EXPECT_FALSE(parse_date_time("07:32:00").has_value());
    EXPECT_FALSE(parse_date_time("1979").has_value());
    EXPECT_FALSE(parse_date_time("1979.5").has_value());
}

TEST(ParseDateTimeTest, RejectsTextBeyondTheLiteral) {
    EXPECT_FALSE(parse_date_time("1979-05-27 07:32:00").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27 # birthday").has_value());
    EXPECT_FALSE(parse_date_time("1979-05-27\nw = 1").has_value());
}

// ============================================================================
// to_string
// ============================================================================

TEST(DateTimeToStringTest, CanonicalForms) {
    EXPECT_EQ(parse_date_time("1979-05-27")->to_string(), "1979-05-27");
    EXPECT_EQ(parse_date_time("1979-05-27t07:32:00z")->to_string(), "1979-05-27T07:32:00Z");
    EXPECT_EQ(parse_date_time("1979-05-27T00:32:00.500-07:00")->to_string(),
              "1979-05-27T00:32:00.5-07:00");
    EXPECT_EQ(parse_date_time("1979-05-27T07:32:00+00:00")->to_string(), "1979-05-27T07:32:00Z");
}

TEST(DateTimeToStringTest, ReadsBack) {
    const auto dt = parse_date_time("2024-02-29T23:59:59.123+05:30");
    ASSERT_TRUE(dt.has_value());
    EXPECT_EQ(parse_date_time(dt->to_string()), dt);
}
