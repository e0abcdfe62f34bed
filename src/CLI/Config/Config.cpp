#include "Config.hpp"

#include <chrono>                    // std::chrono::{milliseconds, seconds}
#include <fstream>                   // std::ofstream
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_cast, case_insensitive}
#include <system_error>              // std::error_code
#include <toml++/impl/parser.hpp>    // toml::parse_file

#include <Almanac/Utils/Env.hpp>
#include <Almanac/Utils/Logging.hpp>

using namespace almanac::utils::types;
using almanac::config::Archive;
using almanac::config::Cache;
using almanac::config::Config;
using almanac::config::Fetch;
using almanac::config::General;
using almanac::services::archive::ArchiveCredentials;
using almanac::services::archive::ArchiveOptions;
using almanac::services::archive::Provider;
using almanac::services::fetch::FetcherOptions;
using almanac::utils::cache::CacheLocation;
using almanac::utils::env::GetEnv;
using almanac::utils::logging::LogLevel;

namespace fs = std::filesystem;

namespace {
  constexpr PCStr DEFAULT_CONFIG_TEMPLATE = R"toml(# Almanac configuration

[general]
log_level = "info" # debug, info, warn or error

[archive]
provider = "nasa_power"     # "nasa_power" or "climatology" (offline estimates only)
# base_url = "https://power.larc.nasa.gov/api/temporal/daily/point"
timeout_secs = 8            # per request
connect_timeout_secs = 4
# Optional HTTP basic credentials. EARTHDATA_USERNAME and EARTHDATA_PASSWORD are used when unset.
# username = ""
# password = ""

[fetch]
years_back = 10    # number of past years to analyse, at most 100
deadline_secs = 60 # upper bound on the whole fetch

[cache]
location = "persistent" # "persistent", "temp" or "memory"
)toml";

  fn CreateDefaultConfig(const fs::path& configPath) -> bool {
    std::error_code errc;
    fs::create_directories(configPath.parent_path(), errc);

    if (errc) {
      error_log("Failed to create config directory: {}", errc.message());
      return false;
    }

    std::ofstream file(configPath);

    if (!file) {
      error_log("Failed to open config file for writing: {}", configPath.string());
      return false;
    }

    file << DEFAULT_CONFIG_TEMPLATE;

    if (!file) {
      error_log("Failed to write to config file: {}", configPath.string());
      return false;
    }

    info_log("Created default config file at {}", configPath.string());
    return true;
  }

  fn PositiveOr(const toml::node_view<const toml::node> node, const i64 fallback, const StringView key) -> i64 {
    const Option<i64> value = node.value<i64>();

    if (!value)
      return fallback;

    if (*value <= 0) {
      warn_log("Ignoring non-positive {} = {}, using {}", key, *value, fallback);
      return fallback;
    }

    return *value;
  }
} // namespace

namespace almanac::config {
  fn ParseProvider(const StringView name) -> Option<Provider> {
    if (name == "nasa_power" || name == "nasa-power" || name == "power")
      return Provider::NasaPower;

    if (name == "climatology" || name == "none")
      return Provider::Climatology;

    return None;
  }

  fn ParseCacheLocation(const StringView name) -> Option<CacheLocation> {
    if (name == "persistent")
      return CacheLocation::Persistent;

    if (name == "temp" || name == "temporary")
      return CacheLocation::TempDirectory;

    if (name == "memory")
      return CacheLocation::InMemory;

    return None;
  }
} // namespace almanac::config

fn General::fromToml(const toml::table& tbl) -> General {
  General gen;

  if (const Option<String> level = tbl["log_level"].value<String>()) {
    if (const auto parsed = magic_enum::enum_cast<LogLevel>(*level, magic_enum::case_insensitive))
      gen.logLevel = *parsed;
    else
      warn_log("Unknown log_level '{}', using info", *level);
  }

  return gen;
}

fn Archive::fromToml(const toml::table& tbl) -> Archive {
  Archive archive;

  if (const Option<String> provider = tbl["provider"].value<String>()) {
    if (const Option<Provider> parsed = almanac::config::ParseProvider(*provider))
      archive.provider = *parsed;
    else
      warn_log("Unknown archive provider '{}', using {}", *provider, archive.provider);
  }

  if (Option<String> baseUrl = tbl["base_url"].value<String>(); baseUrl && !baseUrl->empty())
    archive.baseUrl = std::move(*baseUrl);

  archive.timeoutSecs        = PositiveOr(tbl["timeout_secs"], archive.timeoutSecs, "timeout_secs");
  archive.connectTimeoutSecs = PositiveOr(tbl["connect_timeout_secs"], archive.connectTimeoutSecs, "connect_timeout_secs");

  if (Option<String> username = tbl["username"].value<String>(); username && !username->empty())
    archive.username = std::move(*username);

  if (Option<String> password = tbl["password"].value<String>(); password && !password->empty())
    archive.password = std::move(*password);

  return archive;
}

fn Archive::resolveCredentials() const -> ArchiveCredentials {
  ArchiveCredentials credentials { .username = username, .password = password };

  if (!credentials.username)
    if (Result<String> envUser = GetEnv("EARTHDATA_USERNAME"))
      credentials.username = *envUser;

  if (!credentials.password)
    if (Result<String> envPassword = GetEnv("EARTHDATA_PASSWORD"))
      credentials.password = *envPassword;

  return credentials;
}

fn Archive::toOptions() const -> ArchiveOptions {
  return {
    .baseUrl        = baseUrl,
    .timeout        = std::chrono::seconds(timeoutSecs),
    .connectTimeout = std::chrono::seconds(connectTimeoutSecs),
    .credentials    = resolveCredentials(),
  };
}

fn Fetch::fromToml(const toml::table& tbl) -> Fetch {
  Fetch fetch;

  fetch.yearsBack    = static_cast<i32>(PositiveOr(tbl["years_back"], fetch.yearsBack, "years_back"));
  fetch.deadlineSecs = PositiveOr(tbl["deadline_secs"], fetch.deadlineSecs, "deadline_secs");

  return fetch;
}

fn Fetch::toOptions() const -> FetcherOptions {
  return { .deadline = std::chrono::seconds(deadlineSecs), .readCache = true };
}

fn Cache::fromToml(const toml::table& tbl) -> Cache {
  Cache cache;

  if (const Option<String> location = tbl["location"].value<String>()) {
    if (const Option<CacheLocation> parsed = almanac::config::ParseCacheLocation(*location))
      cache.location = *parsed;
    else
      warn_log("Unknown cache location '{}', using persistent", *location);
  }

  return cache;
}

Config::Config(const toml::table& tbl) {
  const toml::node_view genTbl     = tbl["general"];
  const toml::node_view archiveTbl = tbl["archive"];
  const toml::node_view fetchTbl   = tbl["fetch"];
  const toml::node_view cacheTbl   = tbl["cache"];

  this->general = genTbl.is_table() ? General::fromToml(*genTbl.as_table()) : General {};
  this->archive = archiveTbl.is_table() ? Archive::fromToml(*archiveTbl.as_table()) : Archive {};
  this->fetch   = fetchTbl.is_table() ? Fetch::fromToml(*fetchTbl.as_table()) : Fetch {};
  this->cache   = cacheTbl.is_table() ? Cache::fromToml(*cacheTbl.as_table()) : Cache {};
}

fn Config::getConfigPath() -> fs::path {
  Vec<fs::path> possiblePaths;

#ifdef _WIN32
  if (Result<String> result = GetEnv("LOCALAPPDATA"))
    possiblePaths.emplace_back(fs::path(*result) / "almanac" / "config.toml");

  if (Result<String> result = GetEnv("APPDATA"))
    possiblePaths.emplace_back(fs::path(*result) / "almanac" / "config.toml");
#else
  if (Result<String> result = GetEnv("XDG_CONFIG_HOME"))
    possiblePaths.emplace_back(fs::path(*result) / "almanac" / "config.toml");

  if (Result<String> result = GetEnv("HOME"))
    possiblePaths.emplace_back(fs::path(*result) / ".config" / "almanac" / "config.toml");
#endif

  possiblePaths.emplace_back(fs::path(".") / "config.toml");

  for (const fs::path& path : possiblePaths)
    if (std::error_code errc; fs::exists(path, errc) && !errc)
      return path;

  return possiblePaths.front();
}

fn Config::getInstance() -> Config {
  try {
    const fs::path configPath = getConfigPath();

    if (std::error_code errc; !fs::exists(configPath, errc)) {
      info_log("Config file not found at {}, creating defaults.", configPath.string());

      if (!CreateDefaultConfig(configPath))
        return {};
    }

    const toml::table parsedConfig = toml::parse_file(configPath.string());

    debug_log("Config loaded from {}", configPath.string());

    return Config(parsedConfig);
  } catch (const Exception& e) {
    warn_log("Config loading failed: {}, using defaults", e.what());
    return {};
  }
}
