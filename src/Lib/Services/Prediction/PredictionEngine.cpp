#include <Almanac/Services/Prediction.hpp>

#include <algorithm> // std::{clamp, max}
#include <random>    // std::{normal_distribution, random_device}

#include <Almanac/Core/Calendar.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

#include "Narrative.hpp"
#include "WeatherMath.hpp"

using namespace almanac::utils::types;
using almanac::core::CalendarDate;
using almanac::core::Coords;
using almanac::core::Sample;
using almanac::services::fetch::HistoricalFetcher;
using almanac::services::prediction::PointPrediction;
using almanac::services::prediction::PredictionEngine;
using almanac::services::prediction::PredictionResult;
using almanac::services::prediction::SampleStatistics;
using enum almanac::utils::error::AlmanacErrorCode;

namespace math      = almanac::services::prediction::math;
namespace narrative = almanac::services::prediction::narrative;

namespace {
  constexpr f64 SPREAD_FACTOR               = 0.3;
  constexpr f64 PRECIPITATION_SPREAD_FACTOR = 0.5;

  fn InitialSeed(const Option<u64> seed) -> u64 {
    if (seed)
      return *seed;

    std::random_device device;

    return (static_cast<u64>(device()) << 32U) | static_cast<u64>(device());
  }
} // namespace

PredictionEngine::PredictionEngine(const Option<u64> seed)
  : m_rng(InitialSeed(seed)) {}

fn PredictionEngine::jitter(const f64 mean, const f64 spread) -> f64 {
  if (spread <= 0.0)
    return mean;

  std::normal_distribution<f64> noise(0.0, spread);

  return mean + noise(m_rng);
}

fn PredictionEngine::predict(const Sample& sample, const i32 yearsRequested) -> Result<PredictionResult> {
  if (sample.empty())
    ERR(InsufficientData, "Cannot predict from an empty sample");

  if (yearsRequested <= 0)
    ERR_FMT(InvalidArgument, "years requested must be positive, got {}", yearsRequested);

  const SampleStatistics stats = math::ComputeStatistics(sample);

  Vec<f64> directions;
  directions.reserve(sample.size());

  for (const auto& entry : sample)
    directions.push_back(entry.record.windDirectionDeg);

  const f64 temperature   = std::clamp(jitter(stats.temperature.mean, stats.temperature.std * SPREAD_FACTOR), -50.0, 60.0);
  const f64 humidity      = std::clamp(jitter(stats.humidity.mean, stats.humidity.std * SPREAD_FACTOR), 0.0, 100.0);
  const f64 windSpeed     = std::clamp(jitter(stats.windSpeed.mean, stats.windSpeed.std * SPREAD_FACTOR), 0.0, 50.0);
  const f64 precipitation = std::max(0.0, jitter(stats.precipitation.mean, stats.precipitation.std * PRECIPITATION_SPREAD_FACTOR));
  const f64 cloudCover    = std::clamp(jitter(stats.cloudCover.mean, stats.cloudCover.std * SPREAD_FACTOR), 0.0, 100.0);
  const f64 pressure      = std::clamp(jitter(stats.pressure.mean, stats.pressure.std * SPREAD_FACTOR), 950.0, 1050.0);
  const f64 dewPoint      = jitter(stats.dewPoint.mean, stats.dewPoint.std * SPREAD_FACTOR);
  const f64 uvIndex       = std::clamp(jitter(stats.uvIndex.mean, stats.uvIndex.std * SPREAD_FACTOR), 0.0, 11.0);
  const f64 feelsLike     = jitter(stats.feelsLike.mean, stats.feelsLike.std * SPREAD_FACTOR);
  const f64 direction     = math::CircularMeanDegrees(directions);

  const math::PrecipitationOdds odds = math::ComputePrecipitationOdds(temperature, humidity, precipitation);

  const f64 confidence = math::ComputeConfidence(sample.size(), yearsRequested, stats.temperature.std, stats.humidity.std);

  PointPrediction prediction {
    .temperatureC         = math::Round1(temperature),
    .humidityPct          = math::Round1(humidity),
    .windSpeedMs          = math::Round1(windSpeed),
    .windDirectionDeg     = math::Round1(direction) >= 360.0 ? 0.0 : math::Round1(direction),
    .windCompass          = String(narrative::WindDegToCompass(direction)),
    .precipitationMm      = math::Round1(precipitation),
    .cloudCoverPct        = math::Round1(cloudCover),
    .pressureHpa          = math::Round1(pressure),
    .dewPointC            = math::Round1(dewPoint),
    .uvIndex              = math::Round1(uvIndex),
    .feelsLikeC           = math::Round1(feelsLike),
    .heatIndexC           = math::Round1(math::HeatIndex(temperature, humidity)),
    .rainProbabilityPct   = math::Round1(odds.rainPct),
    .snowProbabilityPct   = math::Round1(odds.snowPct),
    .category             = math::ClassifyWeather(temperature, humidity, precipitation, cloudCover, windSpeed),
    .conditions           = narrative::DescribeConditions(temperature, humidity, precipitation),
    .precipitationOutlook = narrative::DescribePrecipitation(stats.precipitation.mean),
    .visibility           = String(narrative::DescribeVisibility(humidity, precipitation)),
  };

  usize fallbacks = 0;

  for (const auto& entry : sample)
    if (entry.isFallback())
      ++fallbacks;

  if (fallbacks > 0)
    debug_log("{} of {} sample years are climatology estimates", fallbacks, sample.size());

  PredictionResult result {
    .prediction     = std::move(prediction),
    .confidencePct  = math::Round1(confidence),
    .statistics     = stats,
    .sample         = sample,
    .yearsRequested = yearsRequested,
    .dataPoints     = sample.size(),
    .trendAnalysis  = narrative::TrendAnalysis(sample, stats),
  };

  return result;
}

namespace almanac::services::prediction {
  fn PredictForPoint(
    const Coords&      coords,
    const StringView   targetDate,
    HistoricalFetcher& fetcher,
    PredictionEngine&  engine,
    const i32          yearsBack
  ) -> Result<PredictionResult> {
    if (Result<> valid = core::ValidateCoords(coords); !valid)
      return Err(valid.error());

    Result<core::TargetDate> date = core::ParseTargetDate(targetDate);

    if (!date)
      return Err(date.error());

    Result<Sample> sample = fetcher.fetch(coords, date->month, date->day, yearsBack);

    if (!sample)
      return Err(sample.error());

    Result<PredictionResult> result = engine.predict(*sample, yearsBack);

    if (!result)
      return Err(result.error());

    result->coords = coords;
    result->date   = date->year ? CalendarDate { .year = *date->year, .month = date->month, .day = date->day }
                                : core::ResolveInYear(core::CurrentYear(), date->month, date->day);
    result->notes  = narrative::GenerateNotes(coords, result->dataPoints, result->confidencePct);

    return result;
  }
} // namespace almanac::services::prediction
