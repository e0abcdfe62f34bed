#pragma once

// clang-format off
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
// clang-format on

#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/Types.hpp>

namespace almanac::cli {
  namespace {
    using core::Coords;
    using core::ObservationRecord;

    using services::prediction::PredictionResult;
    using services::prediction::SampleStatistics;

    using utils::types::f64;
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::usize;
    using utils::types::Vec;
  } // namespace

  struct JsonPrediction {
    f64    temperatureC;
    f64    humidity;
    f64    windSpeed;
    f64    windDirection;
    String windCompass;
    f64    precipitation;
    f64    heatIndex;
    String conditions;
    String weatherType;
    f64    cloudCover;
    f64    pressure;
    f64    dewPoint;
    f64    uvIndex;
    f64    feelsLike;
    f64    rainProbability;
    f64    snowProbability;
    String precipitationOutlook;
    String visibility;
  };

  struct JsonHistoricalEntry {
    String            date;
    String            origin;
    Option<String>    fallbackReason;
    ObservationRecord observation;
  };

  struct JsonOutput {
    Option<Coords>           location;
    Option<String>           date;
    JsonPrediction           prediction;
    f64                      confidence;
    i32                      yearsRequested;
    usize                    dataPoints;
    SampleStatistics         statistics;
    Vec<JsonHistoricalEntry> historicalData;
    String                   trendAnalysis;
    String                   notes;
  };

  fn ToJsonOutput(const PredictionResult& result) -> JsonOutput;

  /**
   * @brief Serializes a prediction as JSON.
   * @return ParseError if glaze fails to write the document.
   */
  fn WriteJson(const PredictionResult& result, bool pretty) -> Result<String>;
} // namespace almanac::cli

template <>
struct glz::meta<almanac::cli::JsonPrediction> {
  using T = almanac::cli::JsonPrediction;

  // clang-format off
  static constexpr auto value = object(
    "temperatureC",         &T::temperatureC,
    "humidity",             &T::humidity,
    "windSpeed",            &T::windSpeed,
    "windDirection",        &T::windDirection,
    "windCompass",          &T::windCompass,
    "precipitation",        &T::precipitation,
    "heatIndex",            &T::heatIndex,
    "conditions",           &T::conditions,
    "weatherType",          &T::weatherType,
    "cloudCover",           &T::cloudCover,
    "pressure",             &T::pressure,
    "dewPoint",             &T::dewPoint,
    "uvIndex",              &T::uvIndex,
    "feelsLike",            &T::feelsLike,
    "rainProbability",      &T::rainProbability,
    "snowProbability",      &T::snowProbability,
    "precipitationOutlook", &T::precipitationOutlook,
    "visibility",           &T::visibility
  );
  // clang-format on
};

template <>
struct glz::meta<almanac::cli::JsonHistoricalEntry> {
  using T = almanac::cli::JsonHistoricalEntry;

  static constexpr auto value = object("date", &T::date, "origin", &T::origin, "fallbackReason", &T::fallbackReason, "observation", &T::observation);
};

template <>
struct glz::meta<almanac::cli::JsonOutput> {
  using T = almanac::cli::JsonOutput;

  // clang-format off
  static constexpr auto value = object(
    "location",       &T::location,
    "date",           &T::date,
    "prediction",     &T::prediction,
    "confidence",     &T::confidence,
    "yearsRequested", &T::yearsRequested,
    "dataPoints",     &T::dataPoints,
    "statistics",     &T::statistics,
    "historicalData", &T::historicalData,
    "trendAnalysis",  &T::trendAnalysis,
    "notes",          &T::notes
  );
  // clang-format on
};
