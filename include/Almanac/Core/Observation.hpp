#pragma once

#include <glaze/core/common.hpp> // glz::object
#include <glaze/core/meta.hpp>   // glz::meta

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Calendar.hpp"

namespace almanac::core {
  namespace {
    using utils::types::f64;
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::u64;
    using utils::types::u8;
    using utils::types::Vec;
  } // namespace

  struct Coords {
    f64 lat;
    f64 lon;
  };

  /**
   * @brief Checks that a coordinate lies within lat [-90, 90] and lon [-180, 180].
   * @return InvalidArgument naming the offending component otherwise.
   */
  fn ValidateCoords(const Coords& coords) -> Result<>;

  /**
   * @struct ObservationRecord
   * @brief One year's resolved weather observation for a coordinate and calendar day.
   *
   * Records are produced by the archive client, the cache or the climatology
   * estimator and always pass through clamped() before they reach a Sample.
   */
  struct ObservationRecord {
    i32 year;
    f64 temperatureC;
    f64 temperatureMaxC;
    f64 temperatureMinC;
    f64 temperatureAvgC;
    i32 hourOfMax;        ///< 0-23
    i32 hourOfMin;        ///< 0-23
    f64 humidityPct;      ///< 0-100
    f64 windSpeedMs;      ///< >= 0
    f64 windDirectionDeg; ///< [0, 360)
    f64 precipitationMm;  ///< >= 0
    f64 cloudCoverPct;    ///< 0-100
    f64 pressureHpa;
    f64 dewPointC;
    f64 uvIndex; ///< >= 0
    f64 feelsLikeC;

    /**
     * @brief Returns a copy with every bounded field clamped to its valid range.
     *
     * Wind direction is reduced modulo 360 into [0, 360).
     */
    [[nodiscard]] fn clamped() const -> ObservationRecord;

    fn operator==(const ObservationRecord&) const -> bool = default;
  };

  /**
   * @enum RecordOrigin
   * @brief Where a Sample entry came from.
   */
  enum class RecordOrigin : u8 {
    Cache,       ///< Served from the local cache without a network call.
    Archive,     ///< Fetched from the remote archive during this request.
    Climatology, ///< Synthesized by the climatology estimator.
  };

  /**
   * @struct SampleEntry
   * @brief A resolved year tagged with how it was obtained.
   *
   * Climatology entries carry the reason the real observation was unavailable.
   */
  struct SampleEntry {
    ObservationRecord record;
    RecordOrigin      origin;
    Option<String>    fallbackReason;

    [[nodiscard]] fn isFallback() const -> bool {
      return origin == RecordOrigin::Climatology;
    }
  };

  /// Per-year entries for one request, in ascending year order.
  using Sample = Vec<SampleEntry>;

  /**
   * @struct CacheKey
   * @brief Deterministic key for a (coordinate, calendar day) observation.
   *
   * Coordinates are rounded to 0.01 degrees so nearby repeated queries share an
   * entry. The digest is a 64-bit FNV-1a hash of the canonical text, which does
   * not depend on the process or platform.
   */
  struct CacheKey {
    String canonical; ///< "<lat centidegrees>_<lon centidegrees>_<YYYY-MM-DD>"
    u64    digest;

    static fn For(const Coords& coords, const CalendarDate& date) -> CacheKey;

    /// 16 lowercase hex digits of the digest.
    [[nodiscard]] fn hex() const -> String;

    fn operator==(const CacheKey&) const -> bool = default;
  };

  /**
   * @brief 64-bit FNV-1a hash.
   */
  [[nodiscard]] fn Fnv1a64(std::string_view data) -> u64;

  /**
   * @brief Converts a RecordOrigin to a lowercase name ("cache", "archive", "climatology").
   */
  [[nodiscard]] fn OriginName(RecordOrigin origin) -> std::string_view;
} // namespace almanac::core

template <>
struct glz::meta<almanac::core::ObservationRecord> {
  using T = almanac::core::ObservationRecord;

  // clang-format off
  static constexpr auto value = object(
    "year",             &T::year,
    "temperatureC",     &T::temperatureC,
    "temperatureMax",   &T::temperatureMaxC,
    "temperatureMin",   &T::temperatureMinC,
    "temperatureAvg",   &T::temperatureAvgC,
    "hourMax",          &T::hourOfMax,
    "hourMin",          &T::hourOfMin,
    "humidity",         &T::humidityPct,
    "windSpeed",        &T::windSpeedMs,
    "windDirection",    &T::windDirectionDeg,
    "precipitation",    &T::precipitationMm,
    "cloudCover",       &T::cloudCoverPct,
    "pressure",         &T::pressureHpa,
    "dewPoint",         &T::dewPointC,
    "uvIndex",          &T::uvIndex,
    "feelsLike",        &T::feelsLikeC
  );
  // clang-format on
};

template <>
struct glz::meta<almanac::core::Coords> {
  using T = almanac::core::Coords;

  static constexpr auto value = object("lat", &T::lat, "lon", &T::lon);
};
