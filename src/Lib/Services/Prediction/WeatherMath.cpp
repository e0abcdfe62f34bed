#include "WeatherMath.hpp"

#include <algorithm> // std::{clamp, max, min, minmax_element}
#include <cmath>     // std::{atan2, cos, round, sin, sqrt}
#include <numbers>   // std::numbers::pi
#include <numeric>   // std::accumulate

using namespace almanac::utils::types;
using almanac::core::ObservationRecord;
using almanac::core::Sample;
using almanac::services::prediction::SampleStatistics;
using almanac::services::prediction::VariableSummary;
using almanac::services::prediction::WeatherCategory;

namespace {
  constexpr f64 DEGREES_PER_RADIAN = 180.0 / std::numbers::pi;

  template <typename Projection>
  fn Project(const Sample& sample, Projection projection) -> Vec<f64> {
    Vec<f64> values;
    values.reserve(sample.size());

    for (const auto& entry : sample)
      values.push_back(projection(entry.record));

    return values;
  }

  fn PrecipitationFactor(const f64 precipitationMm) -> f64 {
    if (precipitationMm < 5.0)
      return precipitationMm * 2.0;

    if (precipitationMm < 15.0)
      return 10.0 + ((precipitationMm - 5.0) * 1.5);

    return std::min(30.0, 25.0 + ((precipitationMm - 15.0) * 0.5));
  }
} // namespace

namespace almanac::services::prediction::math {
  fn Summarize(const Span<const f64> values, const bool withTotal) -> VariableSummary {
    VariableSummary summary;

    if (values.empty())
      return summary;

    const f64 count = static_cast<f64>(values.size());
    const f64 total = std::accumulate(values.begin(), values.end(), 0.0);

    summary.mean = total / count;

    if (values.size() > 1) {
      f64 squares = 0.0;

      for (const f64 value : values)
        squares += (value - summary.mean) * (value - summary.mean);

      summary.std = std::sqrt(squares / (count - 1.0));
    }

    const auto [minIter, maxIter] = std::minmax_element(values.begin(), values.end());

    summary.min = *minIter;
    summary.max = *maxIter;

    if (withTotal)
      summary.total = total;

    return summary;
  }

  fn ComputeStatistics(const Sample& sample) -> SampleStatistics {
    // clang-format off
    return {
      .temperature   = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.temperatureC; })),
      .humidity      = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.humidityPct; })),
      .windSpeed     = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.windSpeedMs; })),
      .precipitation = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.precipitationMm; }), true),
      .cloudCover    = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.cloudCoverPct; })),
      .pressure      = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.pressureHpa; })),
      .dewPoint      = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.dewPointC; })),
      .uvIndex       = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.uvIndex; })),
      .feelsLike     = Summarize(Project(sample, [](const ObservationRecord& rec) { return rec.feelsLikeC; })),
    };
    // clang-format on
  }

  fn ClassifyWeather(const f64 temperatureC, const f64 humidityPct, const f64 precipitationMm, const f64 cloudCoverPct, const f64 windSpeedMs) -> WeatherCategory {
    using enum WeatherCategory;

    if (precipitationMm > 10.0 && windSpeedMs > 15.0)
      return Stormy;

    if (temperatureC < 2.0 && precipitationMm > 2.0)
      return Snowy;

    if (precipitationMm > 5.0)
      return Rainy;

    if (humidityPct > 90.0)
      return Foggy;

    if (cloudCoverPct > 60.0)
      return Cloudy;

    return Sunny;
  }

  fn ComputePrecipitationOdds(const f64 temperatureC, const f64 humidityPct, const f64 precipitationMm) -> PrecipitationOdds {
    const f64 humidityFactor = std::clamp(humidityPct - 30.0, 0.0, 70.0);

    f64 rain = std::clamp(humidityFactor + PrecipitationFactor(precipitationMm), 0.0, 100.0);
    f64 snow = 0.0;

    if (temperatureC < 5.0) {
      snow = rain * (5.0 - temperatureC) / 5.0;
      rain = std::max(0.0, rain - snow);
    }

    return { .rainPct = std::clamp(rain, 0.0, 100.0), .snowPct = std::clamp(snow, 0.0, 100.0) };
  }

  fn HeatIndex(const f64 temperatureC, const f64 humidityPct) -> f64 {
    const f64 tempF = (temperatureC * 9.0 / 5.0) + 32.0;

    if (tempF < 80.0 || humidityPct < 40.0)
      return temperatureC;

    const f64 hum = humidityPct;

    // clang-format off
    const f64 indexF = -42.379
      + (2.04901523 * tempF)
      + (10.14333127 * hum)
      - (0.22475541 * tempF * hum)
      - (0.00683783 * tempF * tempF)
      - (0.05481717 * hum * hum)
      + (0.00122874 * tempF * tempF * hum)
      + (0.00085282 * tempF * hum * hum)
      - (0.00000199 * tempF * tempF * hum * hum);
    // clang-format on

    return (indexF - 32.0) * 5.0 / 9.0;
  }

  fn ComputeConfidence(const usize sampleSize, const i32 yearsRequested, const f64 temperatureStd, const f64 humidityStd) -> f64 {
    const f64 sufficiency = yearsRequested > 0
      ? std::min(static_cast<f64>(sampleSize) / static_cast<f64>(yearsRequested), 1.0)
      : 0.0;

    const f64 temperatureConsistency = std::max(0.0, 1.0 - (temperatureStd / 10.0));
    const f64 humidityConsistency    = std::max(0.0, 1.0 - (humidityStd / 20.0));

    return std::clamp(100.0 * ((0.4 * sufficiency) + (0.3 * temperatureConsistency) + (0.3 * humidityConsistency)), 0.0, 100.0);
  }

  fn CircularMeanDegrees(const Span<const f64> degrees) -> f64 {
    if (degrees.empty())
      return 0.0;

    f64 sinSum = 0.0;
    f64 cosSum = 0.0;

    for (const f64 bearing : degrees) {
      sinSum += std::sin(bearing / DEGREES_PER_RADIAN);
      cosSum += std::cos(bearing / DEGREES_PER_RADIAN);
    }

    if (std::abs(sinSum) < 1e-9 && std::abs(cosSum) < 1e-9)
      return 0.0;

    f64 mean = std::atan2(sinSum, cosSum) * DEGREES_PER_RADIAN;

    if (mean < 0.0)
      mean += 360.0;

    return mean >= 360.0 ? 0.0 : mean;
  }

  fn Round1(const f64 value) -> f64 {
    return std::round(value * 10.0) / 10.0;
  }
} // namespace almanac::services::prediction::math
