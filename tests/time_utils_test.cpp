// time_utils_test.cpp — Tests for civil-calendar helpers and ISO-8601 parsing
//
// Covers month arithmetic used by the fold builder, calendar-day spans used
// by trades-per-day, and round-tripping of the timestamp text format.

#include <gtest/gtest.h>

#include "errors.hpp"
#include "time_utils.hpp"

#include <cstdint>
#include <string>

using namespace time_utils;

// ===========================================================================
// 1. Civil date conversion
// ===========================================================================

TEST(TimeUtilsTest, EpochIsDayZero) {
    EXPECT_EQ(days_from_civil(1970, 1, 1), 0);
    auto cd = civil_from_days(0);
    EXPECT_EQ(cd.year, 1970);
    EXPECT_EQ(cd.month, 1);
    EXPECT_EQ(cd.day, 1);
}

TEST(TimeUtilsTest, LeapDayRoundTrips) {
    int64_t d = days_from_civil(2024, 2, 29);
    auto cd = civil_from_days(d);
    EXPECT_EQ(cd.year, 2024);
    EXPECT_EQ(cd.month, 2);
    EXPECT_EQ(cd.day, 29);
    EXPECT_EQ(days_from_civil(2024, 3, 1), d + 1);
}

TEST(TimeUtilsTest, DaysSinceEpochFloorsNegativeTimestamps) {
    EXPECT_EQ(days_since_epoch(-1), -1);
    EXPECT_EQ(days_since_epoch(-NS_PER_DAY), -1);
    EXPECT_EQ(days_since_epoch(NS_PER_DAY - 1), 0);
}

// ===========================================================================
// 2. Month arithmetic
// ===========================================================================

TEST(TimeUtilsTest, MonthFloorDropsDayAndTime) {
    int64_t ts = make_timestamp(2023, 7, 19, 14, 35, 12);
    EXPECT_EQ(month_floor(ts), make_timestamp(2023, 7, 1));
}

TEST(TimeUtilsTest, AddMonthsCrossesYearBoundary) {
    int64_t jan = make_timestamp(2023, 1, 1);
    EXPECT_EQ(add_months(jan, 12), make_timestamp(2024, 1, 1));
    EXPECT_EQ(add_months(jan, 13), make_timestamp(2024, 2, 1));
    EXPECT_EQ(add_months(jan, -1), make_timestamp(2022, 12, 1));
}

TEST(TimeUtilsTest, AddMonthsPreservesTimeOfDay) {
    int64_t ts = make_timestamp(2023, 11, 1, 9, 15);
    EXPECT_EQ(add_months(ts, 3), make_timestamp(2024, 2, 1, 9, 15));
}

// ===========================================================================
// 3. Calendar day span
// ===========================================================================

TEST(TimeUtilsTest, CalendarDaysSpannedIsInclusive) {
    int64_t a = make_timestamp(2024, 1, 2, 9, 15);
    int64_t b = make_timestamp(2024, 1, 2, 15, 29);
    EXPECT_EQ(calendar_days_spanned(a, b), 1);
    EXPECT_EQ(calendar_days_spanned(a, make_timestamp(2024, 1, 5, 0, 0)), 4);
}

TEST(TimeUtilsTest, CalendarDaysSpannedReversedIsZero) {
    int64_t a = make_timestamp(2024, 1, 5);
    int64_t b = make_timestamp(2024, 1, 2);
    EXPECT_EQ(calendar_days_spanned(a, b), 0);
}

// ===========================================================================
// 4. ISO-8601
// ===========================================================================

TEST(TimeUtilsTest, ParsesDateOnly) {
    EXPECT_EQ(parse_iso8601("2024-03-15"), make_timestamp(2024, 3, 15));
}

TEST(TimeUtilsTest, ParsesSpaceAndTSeparators) {
    int64_t expected = make_timestamp(2024, 3, 15, 9, 16, 0);
    EXPECT_EQ(parse_iso8601("2024-03-15 09:16:00"), expected);
    EXPECT_EQ(parse_iso8601("2024-03-15T09:16:00"), expected);
    EXPECT_EQ(parse_iso8601("2024-03-15T09:16"), expected);
}

TEST(TimeUtilsTest, OffsetIsIgnoredWallClockKept) {
    int64_t expected = make_timestamp(2024, 3, 15, 9, 16, 0);
    EXPECT_EQ(parse_iso8601("2024-03-15 09:16:00+05:30"), expected);
    EXPECT_EQ(parse_iso8601("2024-03-15T09:16:00Z"), expected);
}

TEST(TimeUtilsTest, ParsesFractionalSeconds) {
    int64_t base = make_timestamp(2024, 3, 15, 9, 16, 0);
    EXPECT_EQ(parse_iso8601("2024-03-15 09:16:00.25"), base + NS_PER_SEC / 4);
}

TEST(TimeUtilsTest, MalformedTimestampThrowsSchemaError) {
    EXPECT_THROW(parse_iso8601("15/03/2024"), SchemaError);
    EXPECT_THROW(parse_iso8601("2024-13-01"), SchemaError);
    EXPECT_THROW(parse_iso8601("2024-03-15 9:16"), SchemaError);
    EXPECT_THROW(parse_iso8601(""), SchemaError);
}

TEST(TimeUtilsTest, FormatRoundTrips) {
    int64_t ts = make_timestamp(2023, 12, 31, 23, 59, 59);
    EXPECT_EQ(format_iso8601(ts), "2023-12-31T23:59:59");
    EXPECT_EQ(parse_iso8601(format_iso8601(ts)), ts);

    int64_t frac = ts + 123;
    EXPECT_EQ(format_iso8601(frac), "2023-12-31T23:59:59.000000123");
    EXPECT_EQ(parse_iso8601(format_iso8601(frac)), frac);
}

// ===========================================================================
// 5. Zone-aware instants
// ===========================================================================

TEST(TimeUtilsTest, ParsesFixedUtcOffsets) {
    int64_t off = 0;
    ASSERT_TRUE(parse_utc_offset("+05:30", off));
    EXPECT_EQ(off, 5 * NS_PER_HOUR + 30 * NS_PER_MINUTE);
    ASSERT_TRUE(parse_utc_offset("-0400", off));
    EXPECT_EQ(off, -4 * NS_PER_HOUR);
    ASSERT_TRUE(parse_utc_offset("UTC", off));
    EXPECT_EQ(off, 0);
    EXPECT_FALSE(parse_utc_offset("Asia/Kolkata", off));
    EXPECT_FALSE(parse_utc_offset("+5:30", off));
}

TEST(TimeUtilsTest, UtcInstantMapsToMarketWallClock) {
    int64_t utc = make_timestamp(2024, 3, 15, 3, 46);
    EXPECT_EQ(utc_to_local(utc, "+05:30"), make_timestamp(2024, 3, 15, 9, 16));
    EXPECT_EQ(utc_to_local(utc, "UTC"), utc);
    // Crossing midnight moves the calendar day.
    EXPECT_EQ(utc_to_local(make_timestamp(2024, 3, 15, 20, 0), "+05:30"),
              make_timestamp(2024, 3, 16, 1, 30));
}

TEST(TimeUtilsTest, CsvOffsetAndZoneAwareInstantAgree) {
    int64_t from_text = parse_iso8601("2024-03-15 09:16:00+05:30");
    int64_t from_instant = utc_to_local(make_timestamp(2024, 3, 15, 3, 46), "+05:30");
    EXPECT_EQ(from_text, from_instant);
}
