#include <cstdlib> // EXIT_SUCCESS, EXIT_FAILURE
#include <glaze/glaze.hpp>

#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/Archive.hpp>
#include <Almanac/Services/HistoricalFetcher.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/ArgumentParser.hpp>
#include <Almanac/Utils/CacheStore.hpp>
#include <Almanac/Utils/Definitions.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

#include "Config/Config.hpp"
#include "Core/Output.hpp"
#include "UI/UI.hpp"
#include "Wrappers/Curl.hpp"

using namespace almanac::utils::types;
using namespace almanac::utils::logging;
using namespace almanac::config;

namespace {
  fn WriteToConsole(const String& document) -> Unit {
    Println(document);
  }

  // Keeps curl_global_init/cleanup paired around every handle the workers create.
  struct CurlSession {
    bool initialized = false;

    CurlSession() {
      if (Result res = Curl::GlobalInit(); res)
        initialized = true;
      else
        error_at(res.error());
    }

    ~CurlSession() {
      if (initialized)
        Curl::GlobalCleanup();
    }

    CurlSession(const CurlSession&)                = delete;
    CurlSession(CurlSession&&)                     = delete;
    fn operator=(const CurlSession&)->CurlSession& = delete;
    fn operator=(CurlSession&&)->CurlSession&      = delete;
  };
} // namespace

fn main(const i32 argc, CStr argv[]) -> i32 try {
  using almanac::utils::argparse::ArgumentParser;

  ArgumentParser parser("almanac", ALMANAC_VERSION);

  parser
    .addArguments("--lat")
    .help("Latitude of the point, in degrees [-90, 90].")
    .defaultValue(0.0);

  parser
    .addArguments("--lon")
    .help("Longitude of the point, in degrees [-180, 180].")
    .defaultValue(0.0);

  parser
    .addArguments("--date")
    .help("Target day as YYYY-MM-DD or MM-DD.")
    .defaultValue(String(""));

  parser
    .addArguments("--years")
    .help("Number of past years to analyse. Defaults to [fetch] years_back from the config.")
    .defaultValue(0);

  parser
    .addArguments("--json")
    .help("Output the prediction in JSON format.")
    .flag();

  parser
    .addArguments("--pretty")
    .help("Pretty-print JSON output. Only valid when --json is used.")
    .flag();

  parser
    .addArguments("--history")
    .help("List every sampled year in the text report.")
    .flag();

  parser
    .addArguments("--clear-cache")
    .help("Removes every cached observation, then exits.")
    .flag();

  parser
    .addArguments("--ignore-cache")
    .help("Skip cache lookups for this run. Fetched observations are still stored.")
    .flag();

  parser
    .addArguments("-V", "--verbose")
    .help("Enable verbose logging. Overrides --log-level.")
    .flag();

  parser
    .addArguments("-l", "--log-level")
    .help("Set the minimum log level.")
    .defaultValue(LogLevel::Info);

  if (Result result = parser.parseArgs(Vec<String>(argv, argv + argc)); !result) {
    error_at(result.error());
    Println(parser.helpText());
    return EXIT_FAILURE;
  }

  if (parser.helpRequested()) {
    Println(parser.helpText());
    return EXIT_SUCCESS;
  }

  if (parser.versionRequested()) {
    Println(parser.version());
    return EXIT_SUCCESS;
  }

  const Config config = Config::getInstance();

  if (parser.get<bool>("--verbose"))
    SetRuntimeLogLevel(LogLevel::Debug);
  else if (parser.isUsed("--log-level"))
    SetRuntimeLogLevel(parser.getEnum<LogLevel>("--log-level"));
  else
    SetRuntimeLogLevel(config.general.logLevel);

  using almanac::utils::cache::CacheStore;

  const SharedPointer<CacheStore> cache = std::make_shared<CacheStore>(config.cache.location);

  if (parser.get<bool>("--clear-cache")) {
    if (Result res = cache->clear(); !res) {
      error_at(res.error());
      return EXIT_FAILURE;
    }

    Println("Cache cleared.");
    return EXIT_SUCCESS;
  }

  if (!parser.isUsed("--lat") || !parser.isUsed("--lon") || !parser.isUsed("--date")) {
    error_log("--lat, --lon and --date are required");
    Println(parser.helpText());
    return EXIT_FAILURE;
  }

  const almanac::core::Coords coords { .lat = parser.get<f64>("--lat"), .lon = parser.get<f64>("--lon") };

  const i32 yearsBack = parser.isUsed("--years") ? parser.get<i32>("--years") : config.fetch.yearsBack;

  const CurlSession curl;

  using almanac::services::archive::CreateArchiveClient;
  using almanac::services::fetch::FetcherOptions;
  using almanac::services::fetch::HistoricalFetcher;
  using almanac::services::prediction::PredictForPoint;
  using almanac::services::prediction::PredictionEngine;
  using almanac::services::prediction::PredictionResult;

  debug_log("Archive provider: {}", config.archive.provider);

  FetcherOptions fetchOptions = config.fetch.toOptions();
  fetchOptions.readCache      = !parser.get<bool>("--ignore-cache");

  HistoricalFetcher fetcher(CreateArchiveClient(config.archive.provider, config.archive.toOptions()), cache, fetchOptions);
  PredictionEngine  engine;

  Result<PredictionResult> result = PredictForPoint(coords, parser.get<String>("--date"), fetcher, engine, yearsBack);

  if (!result) {
    error_at(result.error());
    return EXIT_FAILURE;
  }

  if (parser.get<bool>("--json")) {
    Result<String> json = almanac::cli::WriteJson(*result, parser.get<bool>("--pretty"));

    if (!json) {
      error_at(json.error());
      return EXIT_FAILURE;
    }

    WriteToConsole(*json);
  } else
    WriteToConsole(almanac::ui::CreateReport(*result, parser.get<bool>("--history")));

  return EXIT_SUCCESS;
} catch (const Exception& e) {
  error_at(e);
  return EXIT_FAILURE;
}
