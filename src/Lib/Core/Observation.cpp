#include <Almanac/Core/Observation.hpp>

#include <algorithm> // std::clamp
#include <cmath>     // std::{fmod, isfinite, llround}
#include <format>    // std::format

using namespace almanac::utils::types;
using almanac::utils::error::AlmanacError;
using enum almanac::utils::error::AlmanacErrorCode;

namespace {
  constexpr u64 FNV_OFFSET_BASIS = 14695981039346656037ULL;
  constexpr u64 FNV_PRIME        = 1099511628211ULL;

  fn WrapDegrees(const f64 degrees) -> f64 {
    if (!std::isfinite(degrees))
      return 0.0;

    f64 wrapped = std::fmod(degrees, 360.0);

    if (wrapped < 0.0)
      wrapped += 360.0;

    // fmod of a tiny negative value can round back up to exactly 360.
    return wrapped >= 360.0 ? 0.0 : wrapped;
  }

  fn ToCentidegrees(const f64 degrees) -> i64 {
    return std::llround(degrees * 100.0);
  }
} // namespace

namespace almanac::core {
  fn ValidateCoords(const Coords& coords) -> Result<> {
    if (!std::isfinite(coords.lat) || coords.lat < -90.0 || coords.lat > 90.0)
      ERR_FMT(InvalidArgument, "Latitude {} is out of range [-90, 90]", coords.lat);

    if (!std::isfinite(coords.lon) || coords.lon < -180.0 || coords.lon > 180.0)
      ERR_FMT(InvalidArgument, "Longitude {} is out of range [-180, 180]", coords.lon);

    return {};
  }

  fn ObservationRecord::clamped() const -> ObservationRecord {
    ObservationRecord out = *this;

    out.hourOfMax        = std::clamp(hourOfMax, 0, 23);
    out.hourOfMin        = std::clamp(hourOfMin, 0, 23);
    out.humidityPct      = std::clamp(humidityPct, 0.0, 100.0);
    out.windSpeedMs      = std::max(windSpeedMs, 0.0);
    out.windDirectionDeg = WrapDegrees(windDirectionDeg);
    out.precipitationMm  = std::max(precipitationMm, 0.0);
    out.cloudCoverPct    = std::clamp(cloudCoverPct, 0.0, 100.0);
    out.uvIndex          = std::max(uvIndex, 0.0);

    return out;
  }

  fn Fnv1a64(const std::string_view data) -> u64 {
    u64 hash = FNV_OFFSET_BASIS;

    for (const char character : data) {
      hash ^= static_cast<u64>(static_cast<u8>(character));
      hash *= FNV_PRIME;
    }

    return hash;
  }

  fn CacheKey::For(const Coords& coords, const CalendarDate& date) -> CacheKey {
    String canonical = std::format("{}_{}_{}", ToCentidegrees(coords.lat), ToCentidegrees(coords.lon), date.toIso());

    const u64 digest = Fnv1a64(canonical);

    return { .canonical = std::move(canonical), .digest = digest };
  }

  fn CacheKey::hex() const -> String {
    return std::format("{:016x}", digest);
  }

  fn OriginName(const RecordOrigin origin) -> std::string_view {
    switch (origin) {
      case RecordOrigin::Cache:
        return "cache";
      case RecordOrigin::Archive:
        return "archive";
      case RecordOrigin::Climatology:
        return "climatology";
    }

    return "unknown";
  }
} // namespace almanac::core
