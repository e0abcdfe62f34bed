#pragma once

// clang-format off
// glaze.hpp must come first, core/meta.hpp needs uint8_t from it
#include <glaze/glaze.hpp>
#include <glaze/core/meta.hpp>
#include <glaze/json/read.hpp>

#include <Almanac/Utils/Types.hpp>
// clang-format on

namespace almanac::services::archive::dto {
  // NASA POWER daily point responses (GeoJSON feature)
  namespace power {
    /// Values keyed by "YYYYMMDD". Missing observations are reported as the fill value.
    using DailySeries = almanac::utils::types::Map<almanac::utils::types::String, almanac::utils::types::f64>;

    struct Properties {
      almanac::utils::types::Map<almanac::utils::types::String, DailySeries> parameter;
    };

    struct Header {
      almanac::utils::types::Option<almanac::utils::types::f64> fillValue;
    };

    struct Response {
      Properties                                                    properties;
      almanac::utils::types::Option<Header>                         header;
      almanac::utils::types::Option<almanac::utils::types::Vec<almanac::utils::types::String>> messages;
    };

    /// Error body returned with 4xx/5xx statuses.
    struct ErrorResponse {
      almanac::utils::types::Option<almanac::utils::types::Vec<almanac::utils::types::String>> messages;
    };
  } // namespace power
} // namespace almanac::services::archive::dto

template <>
struct glz::meta<almanac::services::archive::dto::power::Properties> {
  using T = almanac::services::archive::dto::power::Properties;

  static constexpr auto value = object("parameter", &T::parameter);
};

template <>
struct glz::meta<almanac::services::archive::dto::power::Header> {
  using T = almanac::services::archive::dto::power::Header;

  static constexpr auto value = object("fill_value", &T::fillValue);
};

template <>
struct glz::meta<almanac::services::archive::dto::power::Response> {
  using T = almanac::services::archive::dto::power::Response;

  static constexpr auto value = object("properties", &T::properties, "header", &T::header, "messages", &T::messages);
};

template <>
struct glz::meta<almanac::services::archive::dto::power::ErrorResponse> {
  using T = almanac::services::archive::dto::power::ErrorResponse;

  static constexpr auto value = object("messages", &T::messages);
};
