#pragma once

#include <random> // std::mt19937_64

#include "../Core/Calendar.hpp"
#include "../Core/Observation.hpp"
#include "../Utils/Types.hpp"

namespace almanac::services::climatology {
  namespace {
    using core::CalendarDate;
    using core::Coords;
    using core::ObservationRecord;

    using utils::types::f64;
    using utils::types::i32;
    using utils::types::StringView;
    using utils::types::u64;
  } // namespace

  /**
   * @brief Random engine handed to the estimator.
   *
   * Taken by value so each call owns its state; nothing is shared between threads.
   */
  using RandomEngine = std::mt19937_64;

  /**
   * @struct ClimateZone
   * @brief Latitudinal band with its baseline temperature and seasonal amplitude.
   */
  struct ClimateZone {
    StringView name;
    f64        baseTemperatureC;
    f64        seasonalAmplitudeC;
  };

  /**
   * @brief Classifies an absolute latitude into tropical (<23.5), subtropical (<35),
   * temperate (<50), subpolar (<66.5) or polar.
   */
  fn GetClimateZone(f64 absLat) -> ClimateZone;

  /**
   * @brief sin(2π·(effective_month − 3)/12), with the month shifted by six in the southern hemisphere.
   */
  fn SeasonalFactor(f64 lat, i32 month) -> f64;

  /**
   * @brief Crude ocean proximity test: longitudes within 30 degrees of 0 or 180.
   */
  fn IsCoastal(f64 lon) -> bool;

  /**
   * @brief Apparent temperature heuristic.
   *
   * Wind chill of 0.5°C per m/s below 10°C with wind above 5 m/s, a humidity
   * penalty of 0.2°C per percent above 40% when warmer than 27°C, otherwise the
   * air temperature.
   */
  fn FeelsLike(f64 temperatureC, f64 windSpeedMs, f64 humidityPct) -> f64;

  /**
   * @brief Seed for the estimator's random engine, derived from the cache key of the coordinate and day.
   */
  fn SeedFor(const Coords& coords, const CalendarDate& date) -> u64;

  /**
   * @brief Synthesizes a plausible daily observation from seasonal and latitudinal heuristics.
   *
   * Total: every input produces a record with all fields clamped to their ranges.
   *
   * @param coords Coordinate of the request.
   * @param month Calendar month of the request (1-12).
   * @param year Year the record stands in for.
   * @param rng Random source, consumed by value.
   */
  fn Estimate(const Coords& coords, i32 month, i32 year, RandomEngine rng) -> ObservationRecord;

  /**
   * @brief Estimate() seeded with SeedFor(coords, date), so repeated calls for the same key agree.
   */
  fn EstimateFor(const Coords& coords, const CalendarDate& date) -> ObservationRecord;
} // namespace almanac::services::climatology
