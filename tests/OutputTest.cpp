#include <Almanac/Core/Calendar.hpp>
#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/Types.hpp>

#include "Core/Output.hpp"
#include "UI/UI.hpp"

#include "gtest/gtest.h"

using almanac::cli::JsonOutput;
using almanac::cli::ToJsonOutput;
using almanac::cli::WriteJson;
using almanac::core::CalendarDate;
using almanac::core::Coords;
using almanac::core::ObservationRecord;
using almanac::core::RecordOrigin;
using almanac::core::Sample;
using almanac::services::prediction::PredictionEngine;
using almanac::services::prediction::PredictionResult;
using almanac::utils::types::i32;
using almanac::utils::types::Result;
using almanac::utils::types::String;

namespace {
  fn MakeResult() -> PredictionResult {
    Sample sample;

    for (i32 year = 2017; year < 2020; ++year) {
      ObservationRecord record {
        .year             = year,
        .temperatureC     = 21.0,
        .temperatureMaxC  = 25.0,
        .temperatureMinC  = 17.0,
        .temperatureAvgC  = 21.0,
        .hourOfMax        = 15,
        .hourOfMin        = 5,
        .humidityPct      = 60.0,
        .windSpeedMs      = 2.0,
        .windDirectionDeg = 180.0,
        .precipitationMm  = 0.0,
        .cloudCoverPct    = 30.0,
        .pressureHpa      = 1012.0,
        .dewPointC        = 13.0,
        .uvIndex          = 6.0,
        .feelsLikeC       = 21.0,
      };

      if (year == 2019)
        sample.push_back({ .record = record, .origin = RecordOrigin::Climatology, .fallbackReason = String("deadline exceeded") });
      else
        sample.push_back({ .record = record, .origin = RecordOrigin::Archive, .fallbackReason = {} });
    }

    PredictionEngine         engine(3);
    Result<PredictionResult> result = engine.predict(sample, 3);

    EXPECT_TRUE(result.has_value());

    result->coords = Coords { .lat = 51.5, .lon = -0.13 };
    result->date   = CalendarDate { .year = 2026, .month = 6, .day = 21 };

    return *result;
  }
} // namespace

class OutputTest : public testing::Test {};

TEST_F(OutputTest, HistoricalEntriesCarryDateAndOrigin) {
  const JsonOutput output = ToJsonOutput(MakeResult());

  ASSERT_EQ(output.historicalData.size(), 3U);
  EXPECT_EQ(output.historicalData[0].date, "2017-06-21");
  EXPECT_EQ(output.historicalData[0].origin, "archive");
  EXPECT_FALSE(output.historicalData[0].fallbackReason.has_value());
  EXPECT_EQ(output.historicalData[2].origin, "climatology");
  EXPECT_EQ(output.historicalData[2].fallbackReason, "deadline exceeded");

  ASSERT_TRUE(output.date.has_value());
  EXPECT_EQ(*output.date, "2026-06-21");
  EXPECT_EQ(output.dataPoints, 3U);
  EXPECT_EQ(output.yearsRequested, 3);
}

TEST_F(OutputTest, JsonContainsEverySection) {
  Result<String> json = WriteJson(MakeResult(), false);

  ASSERT_TRUE(json.has_value()) << json.error().message;

  for (const char* key : { "\"location\"", "\"prediction\"", "\"weatherType\"", "\"confidence\"", "\"statistics\"", "\"historicalData\"", "\"trendAnalysis\"", "\"fallbackReason\":\"deadline exceeded\"" })
    EXPECT_NE(json->find(key), String::npos) << key;

  EXPECT_EQ(json->find('\n'), String::npos);
}

TEST_F(OutputTest, PrettyJsonIsIndented) {
  Result<String> json = WriteJson(MakeResult(), true);

  ASSERT_TRUE(json.has_value()) << json.error().message;
  EXPECT_NE(json->find("\n   "), String::npos);
}

TEST_F(OutputTest, TextReportIncludesNotes) {
  PredictionResult result = MakeResult();
  result.notes            = "Estimated from three sampled years";

  const String report = almanac::ui::CreateReport(result, false);

  EXPECT_NE(report.find("Notes"), String::npos) << report;
  EXPECT_NE(report.find("sampled"), String::npos) << report;
}
