#include "Narrative.hpp"

#include <algorithm> // std::min
#include <cmath>     // std::{abs, floor}
#include <format>    // std::format

using namespace almanac::utils::types;
using almanac::core::Coords;
using almanac::core::Sample;
using almanac::services::prediction::SampleStatistics;

namespace {
  constexpr Array<StringView, 8> COMPASS_POINTS = { "N", "NE", "E", "SE", "S", "SW", "W", "NW" };

  constexpr f64 STABLE_TREND_PER_YEAR = 0.1;

  // Least-squares slope of temperature against year; None with fewer than two distinct years.
  fn TemperatureSlope(const Sample& sample) -> Option<f64> {
    if (sample.size() < 2)
      return None;

    const f64 count = static_cast<f64>(sample.size());

    f64 meanYear = 0.0;
    f64 meanTemp = 0.0;

    for (const auto& entry : sample) {
      meanYear += static_cast<f64>(entry.record.year);
      meanTemp += entry.record.temperatureC;
    }

    meanYear /= count;
    meanTemp /= count;

    f64 covariance = 0.0;
    f64 variance   = 0.0;

    for (const auto& entry : sample) {
      const f64 dYear = static_cast<f64>(entry.record.year) - meanYear;

      covariance += dYear * (entry.record.temperatureC - meanTemp);
      variance += dYear * dYear;
    }

    if (variance == 0.0)
      return None;

    return covariance / variance;
  }
} // namespace

namespace almanac::services::prediction::narrative {
  fn WindDegToCompass(const f64 degrees) -> StringView {
    f64 wrapped = std::fmod(degrees, 360.0);

    if (wrapped < 0.0)
      wrapped += 360.0;

    const auto index = static_cast<usize>(std::floor((wrapped + 22.5) / 45.0)) % COMPASS_POINTS.size();

    return COMPASS_POINTS.at(index);
  }

  fn DescribeConditions(const f64 temperatureC, const f64 humidityPct, const f64 precipitationMm) -> String {
    const StringView warmth = temperatureC < 10.0 ? "Cold"
      : temperatureC < 20.0                       ? "Mild"
      : temperatureC < 30.0                       ? "Warm"
                                                  : "Hot";

    const StringView moisture = precipitationMm > 5.0 ? "rainy"
      : precipitationMm > 1.0                         ? "drizzly"
      : humidityPct > 80.0                            ? "very humid"
      : humidityPct > 60.0                            ? "humid"
                                                      : "dry";

    const StringView sky = humidityPct > 80.0 ? "cloudy"
      : humidityPct > 60.0                    ? "partly cloudy"
                                              : "clear";

    return std::format("{}, {}, {}", warmth, moisture, sky);
  }

  fn DescribePrecipitation(const f64 precipitationMeanMm) -> String {
    if (precipitationMeanMm < 0.5)
      return "Low chance (< 20%)";

    if (precipitationMeanMm < 2.0)
      return "Moderate chance (~40%)";

    if (precipitationMeanMm < 5.0)
      return "High chance (~60%)";

    return std::format("Very high chance (~80%), expected precipitation: {:.1f}mm", precipitationMeanMm);
  }

  fn DescribeVisibility(const f64 humidityPct, const f64 precipitationMm) -> StringView {
    if (precipitationMm > 5.0)
      return "Reduced (2-5 km)";

    if (humidityPct > 90.0)
      return "Moderate (5-8 km)";

    if (humidityPct > 70.0)
      return "Good (8-10 km)";

    return "Excellent (> 10 km)";
  }

  fn TrendAnalysis(const Sample& sample, const SampleStatistics& statistics) -> String {
    String trend = "Insufficient data to determine a trend.";

    if (const Option<f64> slope = TemperatureSlope(sample)) {
      if (*slope > STABLE_TREND_PER_YEAR)
        trend = std::format("A warming trend of approximately {:.2f}°C per year is observed.", std::abs(*slope));
      else if (*slope < -STABLE_TREND_PER_YEAR)
        trend = std::format("A cooling trend of approximately {:.2f}°C per year is observed.", std::abs(*slope));
      else
        trend = "Temperature has remained relatively stable.";
    }

    const f64 precipitationMean = statistics.precipitation.mean;
    const i32 precipitationPct  = precipitationMean > 0.0 ? std::min(static_cast<i32>(precipitationMean / 5.0 * 100.0), 100) : 10;

    const f64        humidityMean  = statistics.humidity.mean;
    const StringView humidityLevel = humidityMean > 70.0 ? "high" : humidityMean > 50.0 ? "moderate" : "low";

    return std::format(
      "Based on the last {} years, the average temperature for this date is {:.1f}°C with a standard deviation of {:.1f}°C. "
      "{} Humidity tends to be {} (average {:.1f}%) and historical data gives a {}% chance of precipitation. "
      "Winds average {:.1f} m/s.",
      sample.size(),
      statistics.temperature.mean,
      statistics.temperature.std,
      trend,
      humidityLevel,
      humidityMean,
      precipitationPct,
      statistics.windSpeed.mean
    );
  }

  fn GenerateNotes(const Coords& coords, const usize dataPoints, const f64 confidencePct) -> String {
    return std::format(
      "Generated by statistical analysis of historical patterns. {} data points were analyzed for (lat {:.2f}, lon {:.2f}). "
      "The confidence level of {:.1f}% reflects the size and consistency of the historical sample. "
      "Check an up-to-date forecast closer to the target date.",
      dataPoints,
      coords.lat,
      coords.lon,
      confidencePct
    );
  }
} // namespace almanac::services::prediction::narrative
