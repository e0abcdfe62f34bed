#pragma once

#include <format>                // std::{format_to, formatter}
#include <glaze/core/common.hpp> // glz::object
#include <glaze/core/meta.hpp>   // glz::meta
#include <matchit.hpp>           // matchit::{match, is}
#include <random>                // std::mt19937_64

#include "../Core/Calendar.hpp"
#include "../Core/Observation.hpp"
#include "../Utils/Types.hpp"
#include "HistoricalFetcher.hpp"

namespace almanac::services::prediction {
  namespace {
    using core::CalendarDate;
    using core::Coords;
    using core::Sample;

    using fetch::HistoricalFetcher;

    using utils::types::f64;
    using utils::types::i32;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::usize;
  } // namespace

  /// Default number of past years a prediction is built from.
  constexpr i32 DEFAULT_YEARS_BACK = 10;

  enum class WeatherCategory : u8 {
    Sunny,
    Cloudy,
    Rainy,
    Snowy,
    Stormy,
    Foggy,
  };

  /**
   * @struct VariableSummary
   * @brief Descriptive statistics of one variable across the sample.
   *
   * `std` is the sample standard deviation (n - 1), zero for a single value.
   */
  struct VariableSummary {
    f64         mean  = 0.0;
    f64         std   = 0.0;
    f64         min   = 0.0;
    f64         max   = 0.0;
    Option<f64> total = None; ///< Sum over the sample, precipitation only.
  };

  struct SampleStatistics {
    VariableSummary temperature;
    VariableSummary humidity;
    VariableSummary windSpeed;
    VariableSummary precipitation;
    VariableSummary cloudCover;
    VariableSummary pressure;
    VariableSummary dewPoint;
    VariableSummary uvIndex;
    VariableSummary feelsLike;
  };

  /**
   * @struct PointPrediction
   * @brief Predicted conditions for the target day, rounded to one decimal.
   */
  struct PointPrediction {
    f64             temperatureC;
    f64             humidityPct;
    f64             windSpeedMs;
    f64             windDirectionDeg;
    String          windCompass;
    f64             precipitationMm;
    f64             cloudCoverPct;
    f64             pressureHpa;
    f64             dewPointC;
    f64             uvIndex;
    f64             feelsLikeC;
    f64             heatIndexC;
    f64             rainProbabilityPct;
    f64             snowProbabilityPct;
    WeatherCategory category;
    String          conditions;
    String          precipitationOutlook;
    String          visibility;
  };

  /**
   * @struct PredictionResult
   * @brief Everything derived from one sample.
   *
   * `coords`, `date` and `notes` are filled in by PredictForPoint(); predict()
   * alone leaves them empty.
   */
  struct PredictionResult {
    PointPrediction      prediction;
    f64                  confidencePct;
    SampleStatistics     statistics;
    Sample               sample;
    i32                  yearsRequested;
    usize                dataPoints;
    String               trendAnalysis;
    Option<Coords>       coords = None;
    Option<CalendarDate> date   = None;
    String               notes;
  };

  /**
   * @brief Reduces a multi-year sample into a single-day prediction.
   *
   * The engine owns its random engine, so one instance must not be shared by
   * concurrent predict() calls.
   */
  class PredictionEngine {
   public:
    /**
     * @param seed Fixed seed for reproducible predictions. Seeded from std::random_device when absent.
     */
    explicit PredictionEngine(Option<u64> seed = None);

    /**
     * @brief Predicts the target day from a sample.
     * @param sample Per-year entries, ascending by year.
     * @param yearsRequested How many years were asked for, used to score sample sufficiency.
     * @return InsufficientData for an empty sample, InvalidArgument for a non-positive year count.
     */
    fn predict(const Sample& sample, i32 yearsRequested) -> Result<PredictionResult>;

   private:
    std::mt19937_64 m_rng;

    fn jitter(f64 mean, f64 spread) -> f64;
  };

  /**
   * @brief Full pipeline for one point: parse the date, fetch the sample, predict.
   * @param coords Coordinate to predict for.
   * @param targetDate "YYYY-MM-DD" or "MM-DD". Only the month and day are used to select history.
   * @param fetcher Fetcher wired to the archive and cache.
   * @param engine Engine to reduce the sample with.
   * @param yearsBack Number of past years to analyse.
   */
  fn PredictForPoint(
    const Coords&      coords,
    StringView         targetDate,
    HistoricalFetcher& fetcher,
    PredictionEngine&  engine,
    i32                yearsBack = DEFAULT_YEARS_BACK
  ) -> Result<PredictionResult>;

  [[nodiscard]] inline fn CategoryName(const WeatherCategory category) -> StringView {
    using matchit::match, matchit::is;
    using enum WeatherCategory;

    return match(category)(
      is | Sunny  = StringView("sunny"),
      is | Cloudy = StringView("cloudy"),
      is | Rainy  = StringView("rainy"),
      is | Snowy  = StringView("snowy"),
      is | Stormy = StringView("stormy"),
      is | Foggy  = StringView("foggy")
    );
  }
} // namespace almanac::services::prediction

template <>
struct std::formatter<almanac::services::prediction::WeatherCategory> : std::formatter<std::string_view> {
  fn format(almanac::services::prediction::WeatherCategory category, std::format_context& ctx) const {
    return std::formatter<std::string_view>::format(almanac::services::prediction::CategoryName(category), ctx);
  }
};

template <>
struct glz::meta<almanac::services::prediction::VariableSummary> {
  using T = almanac::services::prediction::VariableSummary;

  static constexpr auto value = object("mean", &T::mean, "std", &T::std, "min", &T::min, "max", &T::max, "total", &T::total);
};

template <>
struct glz::meta<almanac::services::prediction::SampleStatistics> {
  using T = almanac::services::prediction::SampleStatistics;

  // clang-format off
  static constexpr auto value = object(
    "temperature",   &T::temperature,
    "humidity",      &T::humidity,
    "windSpeed",     &T::windSpeed,
    "precipitation", &T::precipitation,
    "cloudCover",    &T::cloudCover,
    "pressure",      &T::pressure,
    "dewPoint",      &T::dewPoint,
    "uvIndex",       &T::uvIndex,
    "feelsLike",     &T::feelsLike
  );
  // clang-format on
};
