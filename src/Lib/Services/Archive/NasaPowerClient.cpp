#include "NasaPowerClient.hpp"

#include <format> // std::format

#include <Almanac/Services/Climatology.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

#include "DataTransferObjects.hpp"
#include "Wrappers/Curl.hpp"

using namespace almanac::utils::types;
using almanac::core::CalendarDate;
using almanac::core::Coords;
using almanac::core::ObservationRecord;
using almanac::services::archive::ArchiveOptions;
using almanac::services::archive::NasaPowerClient;
using almanac::utils::error::AlmanacError;
using enum almanac::utils::error::AlmanacErrorCode;

namespace {
  namespace power = almanac::services::archive::dto::power;

  constexpr f64 DEFAULT_FILL_VALUE  = -999.0;
  constexpr f64 KPA_TO_HPA          = 10.0;
  constexpr i32 DEFAULT_HOUR_OF_MAX = 14;
  constexpr i32 DEFAULT_HOUR_OF_MIN = 6;

  fn ValueFor(const power::Response& response, const StringView parameter, const String& day, const f64 fillValue) -> Result<f64> {
    const auto series = response.properties.parameter.find(String(parameter));

    if (series == response.properties.parameter.end())
      ERR_FMT(ParseError, "Archive response has no {} series", parameter);

    const auto value = series->second.find(day);

    if (value == series->second.end())
      ERR_FMT(ParseError, "Archive response has no {} value for {}", parameter, day);

    if (value->second == fillValue || value->second <= DEFAULT_FILL_VALUE)
      ERR_FMT(ParseError, "Archive has no {} observation for {}", parameter, day);

    return value->second;
  }

  fn DescribeErrorBody(const String& body) -> String {
    power::ErrorResponse errorResponse {};

    if (const glz::error_ctx errc = glz::read<glz::opts { .error_on_unknown_keys = false }>(errorResponse, body); errc)
      return "no details";

    if (!errorResponse.messages || errorResponse.messages->empty())
      return "no details";

    return errorResponse.messages->front();
  }
} // namespace

NasaPowerClient::NasaPowerClient(ArchiveOptions options)
  : m_options(std::move(options)) {}

fn NasaPowerClient::requestUrl(const Coords& coords, const CalendarDate& date) const -> String {
  const String day = date.toCompact();

  return std::format(
    "{}?parameters={}&community=AG&longitude={:.4f}&latitude={:.4f}&start={}&end={}&format=JSON",
    m_options.baseUrl.value_or(String(DEFAULT_BASE_URL)),
    PARAMETERS,
    coords.lon,
    coords.lat,
    day,
    day
  );
}

fn NasaPowerClient::DecodeDay(const String& body, const CalendarDate& date) -> Result<ObservationRecord> {
  using glz::error_ctx, glz::read;

  power::Response response {};

  if (error_ctx errc = read<glz::opts { .error_on_unknown_keys = false }>(response, body); errc)
    ERR_FMT(ParseError, "Failed to parse archive response: {}", glz::format_error(errc, body));

  const String day       = date.toCompact();
  const f64    fillValue = response.header && response.header->fillValue ? *response.header->fillValue : DEFAULT_FILL_VALUE;

  ObservationRecord record {};
  record.year      = date.year;
  record.hourOfMax = DEFAULT_HOUR_OF_MAX;
  record.hourOfMin = DEFAULT_HOUR_OF_MIN;

  // clang-format off
  const Array<Pair<StringView, f64*>, 11> fields = {{
    { "T2M",                 &record.temperatureC     },
    { "T2M_MAX",             &record.temperatureMaxC  },
    { "T2M_MIN",             &record.temperatureMinC  },
    { "RH2M",                &record.humidityPct      },
    { "WS10M",               &record.windSpeedMs      },
    { "WD10M",               &record.windDirectionDeg },
    { "PRECTOTCORR",         &record.precipitationMm  },
    { "CLOUD_AMT",           &record.cloudCoverPct    },
    { "PS",                  &record.pressureHpa      },
    { "T2MDEW",              &record.dewPointC        },
    { "ALLSKY_SFC_UV_INDEX", &record.uvIndex          },
  }};
  // clang-format on

  for (const auto& [parameter, target] : fields) {
    Result<f64> value = ValueFor(response, parameter, day, fillValue);

    if (!value)
      return Err(value.error());

    *target = *value;
  }

  record.pressureHpa    *= KPA_TO_HPA;
  record.temperatureAvgC = record.temperatureC;
  record.feelsLikeC      = almanac::services::climatology::FeelsLike(record.temperatureC, record.windSpeedMs, record.humidityPct);

  return record.clamped();
}

fn NasaPowerClient::fetchDay(const Coords& coords, const CalendarDate& date) const -> Result<ObservationRecord> {
  const String url = requestUrl(coords, date);

  debug_log("Requesting archive observation for {}: {}", date.toIso(), url);

  Curl::Easy curl({
    .url                = url,
    .timeoutSecs        = static_cast<i64>(m_options.timeout.count()),
    .connectTimeoutSecs = static_cast<i64>(m_options.connectTimeout.count()),
    .userAgent          = std::format("almanac/{}", ALMANAC_VERSION),
    .username           = m_options.credentials.username,
    .password           = m_options.credentials.password,
  });

  if (!curl) {
    if (const Option<AlmanacError>& initError = curl.getInitializationError())
      return Err(*initError);

    ERR(ApiUnavailable, "Failed to initialize cURL (Easy handle is invalid after construction)");
  }

  Result<Curl::Response> response = curl.perform();

  if (!response)
    return Err(response.error());

  if (response->status >= 400)
    ERR_FMT(ApiUnavailable, "Archive returned HTTP {} for {}: {}", response->status, date.toIso(), DescribeErrorBody(response->body));

  return DecodeDay(response->body, date);
}
