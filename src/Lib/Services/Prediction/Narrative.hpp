#pragma once

#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/Types.hpp>

namespace almanac::services::prediction::narrative {
  namespace {
    using core::Coords;
    using core::Sample;

    using utils::types::f64;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::usize;
  } // namespace

  /**
   * @brief Eight-point compass name (N, NE, E, SE, S, SW, W, NW) for a bearing.
   */
  fn WindDegToCompass(f64 degrees) -> StringView;

  /**
   * @brief Short description such as "Warm, drizzly, partly cloudy".
   */
  fn DescribeConditions(f64 temperatureC, f64 humidityPct, f64 precipitationMm) -> String;

  fn DescribePrecipitation(f64 precipitationMeanMm) -> String;

  fn DescribeVisibility(f64 humidityPct, f64 precipitationMm) -> StringView;

  /**
   * @brief Paragraph describing the sample: averages, a linear temperature trend and prevailing wind.
   *
   * The trend is the least-squares slope of temperature against year. Slopes
   * within ±0.1°C per year read as stable.
   */
  fn TrendAnalysis(const Sample& sample, const SampleStatistics& statistics) -> String;

  fn GenerateNotes(const Coords& coords, usize dataPoints, f64 confidencePct) -> String;
} // namespace almanac::services::prediction::narrative
