#pragma once

#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/Types.hpp>

namespace almanac::services::prediction::math {
  namespace {
    using core::Coords;
    using core::Sample;

    using utils::types::f64;
    using utils::types::i32;
    using utils::types::Span;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
  } // namespace

  struct PrecipitationOdds {
    f64 rainPct;
    f64 snowPct;
  };

  /**
   * @brief Mean, sample standard deviation, min and max of a set of values.
   * @param values Must not be empty.
   * @param withTotal Also report the sum.
   */
  fn Summarize(Span<const f64> values, bool withTotal = false) -> VariableSummary;

  /**
   * @brief Per-variable summaries over every record of a non-empty sample.
   */
  fn ComputeStatistics(const Sample& sample) -> SampleStatistics;

  /**
   * @brief Priority-ordered classification; the first matching rule wins.
   *
   * stormy: precipitation > 10 and wind > 15
   * snowy:  temperature < 2 and precipitation > 2
   * rainy:  precipitation > 5
   * foggy:  humidity > 90
   * cloudy: cloud cover > 60
   * sunny:  otherwise
   */
  fn ClassifyWeather(f64 temperatureC, f64 humidityPct, f64 precipitationMm, f64 cloudCoverPct, f64 windSpeedMs) -> WeatherCategory;

  /**
   * @brief Rain and snow probabilities from humidity and expected precipitation.
   *
   * Humidity contributes up to 70 points and precipitation up to 30. Below 5°C
   * part of the rain probability is moved to snow in proportion to how far
   * below 5°C the temperature is.
   */
  fn ComputePrecipitationOdds(f64 temperatureC, f64 humidityPct, f64 precipitationMm) -> PrecipitationOdds;

  /**
   * @brief Rothfusz heat index in °C.
   * @return The input temperature unless it is at least 80°F with humidity of at least 40%.
   */
  fn HeatIndex(f64 temperatureC, f64 humidityPct) -> f64;

  /**
   * @brief Confidence score in [0, 100].
   *
   * 40% sample sufficiency (entries over years requested), 30% temperature
   * consistency (std over 10°C) and 30% humidity consistency (std over 20%).
   */
  fn ComputeConfidence(usize sampleSize, i32 yearsRequested, f64 temperatureStd, f64 humidityStd) -> f64;

  /**
   * @brief Mean direction of a set of bearings, in [0, 360).
   *
   * 350° and 10° average to 0°, not 180°. Returns 0 for an empty set or when the
   * bearings cancel out.
   */
  fn CircularMeanDegrees(Span<const f64> degrees) -> f64;

  /**
   * @brief Rounds to one decimal place.
   */
  fn Round1(f64 value) -> f64;
} // namespace almanac::services::prediction::math
