#include <Almanac/Core/Calendar.hpp>
#include <Almanac/Core/Observation.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Types.hpp>

#include "gtest/gtest.h"

using namespace almanac::core;
using almanac::utils::error::AlmanacErrorCode;
using almanac::utils::types::Result;
using almanac::utils::types::String;

class CalendarTest : public testing::Test {};

TEST_F(CalendarTest, LeapYears) {
  EXPECT_TRUE(IsLeapYear(2024));
  EXPECT_TRUE(IsLeapYear(2000));
  EXPECT_FALSE(IsLeapYear(1900));
  EXPECT_FALSE(IsLeapYear(2023));
}

TEST_F(CalendarTest, DaysInMonth) {
  EXPECT_EQ(DaysInMonth(2023, 2), 28);
  EXPECT_EQ(DaysInMonth(2024, 2), 29);
  EXPECT_EQ(DaysInMonth(2023, 4), 30);
  EXPECT_EQ(DaysInMonth(2023, 12), 31);
}

TEST_F(CalendarTest, ResolveInYear_LeapDayFallsBackInCommonYears) {
  EXPECT_EQ(ResolveInYear(2023, 2, 29), (CalendarDate { .year = 2023, .month = 2, .day = 28 }));
  EXPECT_EQ(ResolveInYear(2024, 2, 29), (CalendarDate { .year = 2024, .month = 2, .day = 29 }));
  EXPECT_EQ(ResolveInYear(2021, 7, 4), (CalendarDate { .year = 2021, .month = 7, .day = 4 }));
}

TEST_F(CalendarTest, ParseTargetDate_MonthDay) {
  Result<TargetDate> date = ParseTargetDate("07-04");

  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->month, 7);
  EXPECT_EQ(date->day, 4);
  EXPECT_FALSE(date->year.has_value());
}

TEST_F(CalendarTest, ParseTargetDate_FullDate) {
  Result<TargetDate> date = ParseTargetDate("2025-12-31");

  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(date->year, 2025);
  EXPECT_EQ(date->month, 12);
  EXPECT_EQ(date->day, 31);
}

TEST_F(CalendarTest, ParseTargetDate_LeapDayWithoutYear) {
  EXPECT_TRUE(ParseTargetDate("02-29").has_value());
}

TEST_F(CalendarTest, ParseTargetDate_Rejects) {
  for (const char* text : { "2023-02-29", "13-01", "00-10", "04-31", "2024/01/01", "7-4", "", "ab-cd" }) {
    Result<TargetDate> date = ParseTargetDate(text);

    ASSERT_FALSE(date.has_value()) << text;
    EXPECT_EQ(date.error().code, AlmanacErrorCode::InvalidArgument) << text;
  }
}

TEST_F(CalendarTest, CalendarDateFormatting) {
  const CalendarDate date { .year = 2021, .month = 3, .day = 9 };

  EXPECT_EQ(date.toIso(), "2021-03-09");
  EXPECT_EQ(date.toCompact(), "20210309");
}

TEST_F(CalendarTest, ValidateCoords) {
  EXPECT_TRUE(ValidateCoords({ .lat = 90.0, .lon = -180.0 }).has_value());
  EXPECT_TRUE(ValidateCoords({ .lat = -90.0, .lon = 180.0 }).has_value());
  EXPECT_FALSE(ValidateCoords({ .lat = 90.5, .lon = 0.0 }).has_value());
  EXPECT_FALSE(ValidateCoords({ .lat = 0.0, .lon = -180.01 }).has_value());
}

TEST_F(CalendarTest, CacheKey_RoundsToCentidegrees) {
  const CalendarDate date { .year = 2020, .month = 7, .day = 4 };

  const CacheKey first  = CacheKey::For({ .lat = 40.7128, .lon = -74.0060 }, date);
  const CacheKey second = CacheKey::For({ .lat = 40.7131, .lon = -74.0058 }, date);

  EXPECT_EQ(first.canonical, "4071_-7401_2020-07-04");
  EXPECT_EQ(first, second);
  EXPECT_EQ(first.hex().size(), 16U);
}

TEST_F(CalendarTest, CacheKey_DistinguishesDaysAndPlaces) {
  const CacheKey base     = CacheKey::For({ .lat = 10.0, .lon = 20.0 }, { .year = 2020, .month = 1, .day = 1 });
  const CacheKey nextDay  = CacheKey::For({ .lat = 10.0, .lon = 20.0 }, { .year = 2020, .month = 1, .day = 2 });
  const CacheKey nextYear = CacheKey::For({ .lat = 10.0, .lon = 20.0 }, { .year = 2021, .month = 1, .day = 1 });
  const CacheKey moved    = CacheKey::For({ .lat = 10.01, .lon = 20.0 }, { .year = 2020, .month = 1, .day = 1 });

  EXPECT_NE(base.digest, nextDay.digest);
  EXPECT_NE(base.digest, nextYear.digest);
  EXPECT_NE(base.digest, moved.digest);
}

TEST_F(CalendarTest, Fnv1a64_KnownVectors) {
  EXPECT_EQ(Fnv1a64(""), 0xcbf29ce484222325ULL);
  EXPECT_EQ(Fnv1a64("a"), 0xaf63dc4c8601ec8cULL);
}

TEST_F(CalendarTest, Clamped_BringsFieldsIntoRange) {
  ObservationRecord record {};
  record.hourOfMax        = 30;
  record.hourOfMin        = -2;
  record.humidityPct      = 130.0;
  record.windSpeedMs      = -1.0;
  record.windDirectionDeg = -90.0;
  record.precipitationMm  = -0.5;
  record.cloudCoverPct    = 101.0;
  record.uvIndex          = -3.0;

  const ObservationRecord out = record.clamped();

  EXPECT_EQ(out.hourOfMax, 23);
  EXPECT_EQ(out.hourOfMin, 0);
  EXPECT_DOUBLE_EQ(out.humidityPct, 100.0);
  EXPECT_DOUBLE_EQ(out.windSpeedMs, 0.0);
  EXPECT_DOUBLE_EQ(out.windDirectionDeg, 270.0);
  EXPECT_DOUBLE_EQ(out.precipitationMm, 0.0);
  EXPECT_DOUBLE_EQ(out.cloudCoverPct, 100.0);
  EXPECT_DOUBLE_EQ(out.uvIndex, 0.0);
}

TEST_F(CalendarTest, OriginNames) {
  EXPECT_EQ(OriginName(RecordOrigin::Cache), "cache");
  EXPECT_EQ(OriginName(RecordOrigin::Archive), "archive");
  EXPECT_EQ(OriginName(RecordOrigin::Climatology), "climatology");
}
