#include "Output.hpp"

#include <format> // std::format

#include <Almanac/Utils/Error.hpp>

using namespace almanac::utils::types;
using almanac::cli::JsonHistoricalEntry;
using almanac::cli::JsonOutput;
using almanac::services::prediction::CategoryName;
using almanac::services::prediction::PredictionResult;
using enum almanac::utils::error::AlmanacErrorCode;

namespace almanac::cli {
  fn ToJsonOutput(const PredictionResult& result) -> JsonOutput {
    const auto& pred = result.prediction;

    JsonOutput output {
      .location   = result.coords,
      .date       = result.date ? Option<String>(result.date->toIso()) : None,
      .prediction = {
        .temperatureC         = pred.temperatureC,
        .humidity             = pred.humidityPct,
        .windSpeed            = pred.windSpeedMs,
        .windDirection        = pred.windDirectionDeg,
        .windCompass          = pred.windCompass,
        .precipitation        = pred.precipitationMm,
        .heatIndex            = pred.heatIndexC,
        .conditions           = pred.conditions,
        .weatherType          = String(CategoryName(pred.category)),
        .cloudCover           = pred.cloudCoverPct,
        .pressure             = pred.pressureHpa,
        .dewPoint             = pred.dewPointC,
        .uvIndex              = pred.uvIndex,
        .feelsLike            = pred.feelsLikeC,
        .rainProbability      = pred.rainProbabilityPct,
        .snowProbability      = pred.snowProbabilityPct,
        .precipitationOutlook = pred.precipitationOutlook,
        .visibility           = pred.visibility,
      },
      .confidence     = result.confidencePct,
      .yearsRequested = result.yearsRequested,
      .dataPoints     = result.dataPoints,
      .statistics     = result.statistics,
      .historicalData = {},
      .trendAnalysis  = result.trendAnalysis,
      .notes          = result.notes,
    };

    output.historicalData.reserve(result.sample.size());

    const i32 month = result.date ? result.date->month : 0;
    const i32 day   = result.date ? result.date->day : 0;

    for (const auto& entry : result.sample)
      output.historicalData.push_back({
        .date           = month > 0 ? std::format("{:04}-{:02}-{:02}", entry.record.year, month, day) : std::format("{:04}", entry.record.year),
        .origin         = String(core::OriginName(entry.origin)),
        .fallbackReason = entry.fallbackReason,
        .observation    = entry.record,
      });

    return output;
  }

  fn WriteJson(const PredictionResult& result, const bool pretty) -> Result<String> {
    const JsonOutput output = ToJsonOutput(result);

    String jsonStr;

    const glz::error_ctx errorContext = pretty
      ? glz::write<glz::opts { .prettify = true }>(output, jsonStr)
      : glz::write_json(output, jsonStr);

    if (errorContext)
      ERR_FMT(ParseError, "Failed to write JSON output: {}", glz::format_error(errorContext, jsonStr));

    return jsonStr;
  }
} // namespace almanac::cli
