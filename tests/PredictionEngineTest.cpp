#include <cmath>   // std::round
#include <utility> // std::pair

#include <Almanac/Core/Calendar.hpp>
#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/HistoricalFetcher.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/CacheStore.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Types.hpp>

#include "gtest/gtest.h"

using almanac::core::CalendarDate;
using almanac::core::Coords;
using almanac::core::CurrentYear;
using almanac::core::ObservationRecord;
using almanac::core::RecordOrigin;
using almanac::core::Sample;
using almanac::services::fetch::HistoricalFetcher;
using almanac::services::prediction::PredictForPoint;
using almanac::services::prediction::PredictionEngine;
using almanac::services::prediction::PredictionResult;
using almanac::services::prediction::WeatherCategory;
using almanac::utils::cache::CacheLocation;
using almanac::utils::cache::CacheStore;
using almanac::utils::error::AlmanacErrorCode;
using almanac::utils::types::f64;
using almanac::utils::types::i32;
using almanac::utils::types::Result;
using almanac::utils::types::String;
using almanac::utils::types::u64;
using almanac::utils::types::usize;

namespace {
  fn UniformRecord(const i32 year) -> ObservationRecord {
    return {
      .year             = year,
      .temperatureC     = 24.0,
      .temperatureMaxC  = 29.0,
      .temperatureMinC  = 19.0,
      .temperatureAvgC  = 24.0,
      .hourOfMax        = 14,
      .hourOfMin        = 6,
      .humidityPct      = 55.0,
      .windSpeedMs      = 3.5,
      .windDirectionDeg = 90.0,
      .precipitationMm  = 0.0,
      .cloudCoverPct    = 20.0,
      .pressureHpa      = 1016.0,
      .dewPointC        = 14.0,
      .uvIndex          = 8.0,
      .feelsLikeC       = 24.0,
    };
  }

  fn UniformSample(const i32 years) -> Sample {
    Sample sample;

    for (i32 year = 2020 - years; year < 2020; ++year)
      sample.push_back({ .record = UniformRecord(year), .origin = RecordOrigin::Archive, .fallbackReason = {} });

    return sample;
  }

  fn ExpectOneDecimal(const f64 value) -> void {
    EXPECT_NEAR(value * 10.0, std::round(value * 10.0), 1e-6) << value;
  }
} // namespace

class PredictionEngineTest : public testing::Test {};

TEST_F(PredictionEngineTest, EmptySampleIsInsufficientData) {
  PredictionEngine engine(1);

  Result<PredictionResult> result = engine.predict({}, 10);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, AlmanacErrorCode::InsufficientData);
}

TEST_F(PredictionEngineTest, NonPositiveYearsIsInvalid) {
  PredictionEngine engine(1);

  Result<PredictionResult> result = engine.predict(UniformSample(3), 0);

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, AlmanacErrorCode::InvalidArgument);
}

TEST_F(PredictionEngineTest, UniformSampleReproducesItsMean) {
  PredictionEngine engine(7);

  Result<PredictionResult> result = engine.predict(UniformSample(10), 10);

  ASSERT_TRUE(result.has_value());

  const auto& pred = result->prediction;

  EXPECT_DOUBLE_EQ(pred.temperatureC, 24.0);
  EXPECT_DOUBLE_EQ(pred.humidityPct, 55.0);
  EXPECT_DOUBLE_EQ(pred.windSpeedMs, 3.5);
  EXPECT_DOUBLE_EQ(pred.windDirectionDeg, 90.0);
  EXPECT_EQ(pred.windCompass, "E");
  EXPECT_DOUBLE_EQ(pred.precipitationMm, 0.0);
  EXPECT_DOUBLE_EQ(pred.pressureHpa, 1016.0);
  EXPECT_DOUBLE_EQ(pred.uvIndex, 8.0);
  EXPECT_EQ(pred.category, WeatherCategory::Sunny);
  EXPECT_EQ(pred.conditions, "Warm, dry, clear");
  EXPECT_EQ(pred.precipitationOutlook, "Low chance (< 20%)");
  EXPECT_EQ(pred.visibility, "Excellent (> 10 km)");
  EXPECT_DOUBLE_EQ(pred.rainProbabilityPct, 25.0);
  EXPECT_DOUBLE_EQ(pred.snowProbabilityPct, 0.0);

  EXPECT_DOUBLE_EQ(result->confidencePct, 100.0);
  EXPECT_EQ(result->dataPoints, 10U);
  EXPECT_EQ(result->yearsRequested, 10);
  EXPECT_EQ(result->sample.size(), 10U);
}

TEST_F(PredictionEngineTest, PartialSampleLowersConfidence) {
  PredictionEngine engine(7);

  Result<PredictionResult> result = engine.predict(UniformSample(5), 10);

  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->confidencePct, 80.0);
}

TEST_F(PredictionEngineTest, SameSeedSamePrediction) {
  Sample sample = UniformSample(6);

  for (usize i = 0; i < sample.size(); ++i) {
    sample[i].record.temperatureC += static_cast<f64>(i) * 1.5;
    sample[i].record.humidityPct += static_cast<f64>(i) * 3.0;
  }

  PredictionEngine first(99);
  PredictionEngine second(99);

  Result<PredictionResult> a = first.predict(sample, 6);
  Result<PredictionResult> b = second.predict(sample, 6);

  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_DOUBLE_EQ(a->prediction.temperatureC, b->prediction.temperatureC);
  EXPECT_DOUBLE_EQ(a->prediction.humidityPct, b->prediction.humidityPct);
  EXPECT_EQ(a->trendAnalysis, b->trendAnalysis);
}

TEST_F(PredictionEngineTest, PredictionsStayInPhysicalRanges) {
  Sample sample = UniformSample(8);

  for (usize i = 0; i < sample.size(); ++i) {
    auto& rec           = sample[i].record;
    rec.temperatureC    = (i % 2 == 0) ? -45.0 : 55.0;
    rec.humidityPct     = (i % 2 == 0) ? 0.0 : 100.0;
    rec.cloudCoverPct   = (i % 2 == 0) ? 0.0 : 100.0;
    rec.precipitationMm = (i % 2 == 0) ? 0.0 : 40.0;
    rec.uvIndex         = (i % 2 == 0) ? 0.0 : 11.0;
    rec.windSpeedMs     = (i % 2 == 0) ? 0.0 : 45.0;
  }

  for (u64 seed = 0; seed < 25; ++seed) {
    PredictionEngine engine(seed);

    Result<PredictionResult> result = engine.predict(sample, 8);

    ASSERT_TRUE(result.has_value());

    const auto& pred = result->prediction;

    EXPECT_GE(pred.temperatureC, -50.0);
    EXPECT_LE(pred.temperatureC, 60.0);
    EXPECT_GE(pred.humidityPct, 0.0);
    EXPECT_LE(pred.humidityPct, 100.0);
    EXPECT_GE(pred.cloudCoverPct, 0.0);
    EXPECT_LE(pred.cloudCoverPct, 100.0);
    EXPECT_GE(pred.windSpeedMs, 0.0);
    EXPECT_LE(pred.windSpeedMs, 50.0);
    EXPECT_GE(pred.precipitationMm, 0.0);
    EXPECT_GE(pred.uvIndex, 0.0);
    EXPECT_LE(pred.uvIndex, 11.0);
    EXPECT_GE(pred.pressureHpa, 950.0);
    EXPECT_LE(pred.pressureHpa, 1050.0);
    EXPECT_GE(result->confidencePct, 0.0);
    EXPECT_LE(result->confidencePct, 100.0);

    ExpectOneDecimal(pred.temperatureC);
    ExpectOneDecimal(pred.humidityPct);
    ExpectOneDecimal(pred.precipitationMm);
    ExpectOneDecimal(result->confidencePct);
  }
}

TEST_F(PredictionEngineTest, WindDirectionUsesCircularMean) {
  Sample sample = UniformSample(2);

  sample[0].record.windDirectionDeg = 350.0;
  sample[1].record.windDirectionDeg = 10.0;

  PredictionEngine engine(3);

  Result<PredictionResult> result = engine.predict(sample, 2);

  ASSERT_TRUE(result.has_value());
  EXPECT_DOUBLE_EQ(result->prediction.windDirectionDeg, 0.0);
  EXPECT_EQ(result->prediction.windCompass, "N");
}

TEST_F(PredictionEngineTest, PredictForPoint_NewYorkWithoutArchive) {
  auto cache = std::make_shared<CacheStore>(CacheLocation::InMemory);

  HistoricalFetcher fetcher(nullptr, cache);
  PredictionEngine  engine(2024);

  const Coords newYork { .lat = 40.71, .lon = -74.01 };

  Result<PredictionResult> result = PredictForPoint(newYork, "07-04", fetcher, engine, 5);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->dataPoints, 5U);
  EXPECT_EQ(result->yearsRequested, 5);
  ASSERT_EQ(result->sample.size(), 5U);

  for (const auto& entry : result->sample) {
    EXPECT_EQ(entry.origin, RecordOrigin::Climatology);
    EXPECT_EQ(entry.fallbackReason, "no archive configured");
  }

  // Temperate July estimates for New York sit in the mid to high twenties.
  EXPECT_GT(result->statistics.temperature.mean, 10.0);
  EXPECT_LT(result->statistics.temperature.mean, 40.0);

  ASSERT_TRUE(result->coords.has_value());
  EXPECT_DOUBLE_EQ(result->coords->lat, 40.71);

  ASSERT_TRUE(result->date.has_value());
  EXPECT_EQ(result->date->month, 7);
  EXPECT_EQ(result->date->day, 4);
  EXPECT_EQ(result->date->year, CurrentYear());

  EXPECT_FALSE(result->notes.empty());
  EXPECT_FALSE(result->trendAnalysis.empty());
  EXPECT_GE(result->confidencePct, 0.0);
  EXPECT_LE(result->confidencePct, 100.0);
}

TEST_F(PredictionEngineTest, PredictForPoint_KeepsExplicitYear) {
  HistoricalFetcher fetcher(nullptr, nullptr);
  PredictionEngine  engine(5);

  Result<PredictionResult> result = PredictForPoint({ .lat = -33.87, .lon = 151.21 }, "2030-01-15", fetcher, engine, 3);

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->date.has_value());
  EXPECT_EQ(*result->date, (CalendarDate { .year = 2030, .month = 1, .day = 15 }));
}

TEST_F(PredictionEngineTest, PredictForPoint_RejectsBadInput) {
  HistoricalFetcher fetcher(nullptr, nullptr);
  PredictionEngine  engine(5);

  for (const auto& [coords, date] : {
         std::pair { Coords { .lat = 95.0, .lon = 0.0 }, String("07-04") },
         std::pair { Coords { .lat = 0.0, .lon = 0.0 }, String("2023-02-29") },
         std::pair { Coords { .lat = 0.0, .lon = 0.0 }, String("July 4") },
       }) {
    Result<PredictionResult> result = PredictForPoint(coords, date, fetcher, engine, 3);

    ASSERT_FALSE(result.has_value()) << date;
    EXPECT_EQ(result.error().code, AlmanacErrorCode::InvalidArgument) << date;
  }
}
