#include <Almanac/Services/Climatology.hpp>

#include <algorithm> // std::{clamp, max}
#include <cmath>     // std::{abs, fmod, round, sin}
#include <numbers>   // std::numbers::pi

#include <Almanac/Core/Observation.hpp>
#include <Almanac/Utils/Types.hpp>

using namespace almanac::utils::types;
using almanac::core::CacheKey;
using almanac::core::CalendarDate;
using almanac::core::Coords;
using almanac::core::ObservationRecord;

namespace {
  constexpr f64 SEA_LEVEL_PRESSURE_HPA = 1013.0;
  constexpr i32 DEFAULT_HOUR_OF_MAX    = 14;
  constexpr i32 DEFAULT_HOUR_OF_MIN    = 6;

  fn Round1(const f64 value) -> f64 {
    return std::round(value * 10.0) / 10.0;
  }

  fn PrecipitationMean(const f64 humidity, const f64 absLat, const f64 seasonal) -> f64 {
    f64 rate = humidity > 70.0 ? 2.5
      : humidity > 50.0        ? 1.0
                               : 0.3;

    // Wet tropical summers, Mediterranean-pattern wet winters.
    if (absLat < 35.0 && seasonal > 0.0)
      rate *= 1.8;
    else if (absLat > 35.0 && absLat < 45.0 && seasonal < 0.0)
      rate *= 1.5;

    return rate;
  }
} // namespace

namespace almanac::services::climatology {
  fn GetClimateZone(const f64 absLat) -> ClimateZone {
    if (absLat < 23.5)
      return { .name = "tropical", .baseTemperatureC = 25.0 + ((23.5 - absLat) * 0.3), .seasonalAmplitudeC = 5.0 };

    if (absLat < 35.0)
      return { .name = "subtropical", .baseTemperatureC = 20.0 + ((35.0 - absLat) * 0.4), .seasonalAmplitudeC = 8.0 };

    if (absLat < 50.0)
      return { .name = "temperate", .baseTemperatureC = 12.0 + ((50.0 - absLat) * 0.5), .seasonalAmplitudeC = 12.0 };

    if (absLat < 66.5)
      return { .name = "subpolar", .baseTemperatureC = 5.0 + ((66.5 - absLat) * 0.3), .seasonalAmplitudeC = 15.0 };

    return { .name = "polar", .baseTemperatureC = -10.0, .seasonalAmplitudeC = 20.0 };
  }

  fn SeasonalFactor(const f64 lat, const i32 month) -> f64 {
    i32 effectiveMonth = month;

    if (lat < 0.0) {
      effectiveMonth = (month + 6) % 12;

      if (effectiveMonth == 0)
        effectiveMonth = 12;
    }

    return std::sin(2.0 * std::numbers::pi * static_cast<f64>(effectiveMonth - 3) / 12.0);
  }

  fn IsCoastal(const f64 lon) -> bool {
    return std::abs(lon) > 150.0 || std::abs(lon) < 30.0;
  }

  fn FeelsLike(const f64 temperatureC, const f64 windSpeedMs, const f64 humidityPct) -> f64 {
    if (temperatureC < 10.0 && windSpeedMs > 5.0)
      return temperatureC - (windSpeedMs * 0.5);

    if (temperatureC > 27.0 && humidityPct > 40.0)
      return temperatureC + ((humidityPct - 40.0) * 0.2);

    return temperatureC;
  }

  fn SeedFor(const Coords& coords, const CalendarDate& date) -> u64 {
    return CacheKey::For(coords, date).digest;
  }

  fn Estimate(const Coords& coords, const i32 month, const i32 year, RandomEngine rng) -> ObservationRecord {
    const f64         absLat   = std::abs(coords.lat);
    const ClimateZone zone     = GetClimateZone(absLat);
    const f64         seasonal = SeasonalFactor(coords.lat, month);
    const bool        coastal  = IsCoastal(coords.lon);

    std::normal_distribution<f64> yearAnomaly(0.0, 1.5);
    std::normal_distribution<f64> dailyNoise(0.0, 2.0);
    std::normal_distribution<f64> humidityNoise(0.0, 8.0);
    std::normal_distribution<f64> windNoise(0.0, 3.0);

    const f64 temperature = zone.baseTemperatureC + (seasonal * zone.seasonalAmplitudeC) + yearAnomaly(rng) + dailyNoise(rng);

    f64 humidityBase = 70.0 - ((temperature - 15.0) * 1.5);

    if (coastal)
      humidityBase += 10.0;

    const f64 humidity = std::clamp(humidityBase + humidityNoise(rng), 20.0, 100.0);

    f64 windBase = 5.0 + (std::abs(absLat - 45.0) * 0.1);

    if (coastal)
      windBase += 3.0;

    const f64 windSpeed = std::max(0.0, windBase + windNoise(rng));

    f64 windDirection = 0.0;

    if (absLat > 30.0 && absLat < 60.0) {
      // Prevailing westerlies.
      std::normal_distribution<f64> westerly(270.0, 45.0);
      windDirection = westerly(rng);
    } else {
      std::uniform_real_distribution<f64> anyDirection(0.0, 360.0);
      windDirection = anyDirection(rng);
    }

    std::exponential_distribution<f64> precipitationDraw(1.0 / PrecipitationMean(humidity, absLat, seasonal));

    const f64 precipitation = std::max(0.0, precipitationDraw(rng));

    // Everything below is derived from the draws above.
    const f64 cloudCover   = std::clamp((humidity * 0.8) + (precipitation * 2.0), 0.0, 100.0);
    const f64 pressure     = SEA_LEVEL_PRESSURE_HPA - (absLat * 0.5) - ((humidity - 60.0) * 0.15);
    const f64 dewPoint     = temperature - ((100.0 - humidity) / 5.0);
    const f64 uvIndex      = std::clamp(11.0 - (absLat / 9.0) + (seasonal * 2.0) - (cloudCover / 20.0), 0.0, 11.0);
    const f64 diurnalRange = 4.0 + (8.0 * (1.0 - (cloudCover / 100.0)));

    ObservationRecord record {
      .year             = year,
      .temperatureC     = Round1(temperature),
      .temperatureMaxC  = Round1(temperature + (diurnalRange / 2.0)),
      .temperatureMinC  = Round1(temperature - (diurnalRange / 2.0)),
      .temperatureAvgC  = Round1(temperature),
      .hourOfMax        = DEFAULT_HOUR_OF_MAX,
      .hourOfMin        = DEFAULT_HOUR_OF_MIN,
      .humidityPct      = Round1(humidity),
      .windSpeedMs      = Round1(windSpeed),
      .windDirectionDeg = Round1(windDirection),
      .precipitationMm  = Round1(precipitation),
      .cloudCoverPct    = Round1(cloudCover),
      .pressureHpa      = Round1(pressure),
      .dewPointC        = Round1(dewPoint),
      .uvIndex          = Round1(uvIndex),
      .feelsLikeC       = Round1(FeelsLike(temperature, windSpeed, humidity)),
    };

    return record.clamped();
  }

  fn EstimateFor(const Coords& coords, const CalendarDate& date) -> ObservationRecord {
    return Estimate(coords, date.month, date.year, RandomEngine(SeedFor(coords, date)));
  }
} // namespace almanac::services::climatology
