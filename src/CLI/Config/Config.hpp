#pragma once

#include <filesystem>                // std::filesystem::path
#include <toml++/impl/node.hpp>      // toml::node
#include <toml++/impl/node_view.hpp> // toml::node_view
#include <toml++/impl/table.hpp>     // toml::table

#include <Almanac/Services/Archive.hpp>
#include <Almanac/Services/HistoricalFetcher.hpp>
#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/CacheStore.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

namespace almanac::config {
  namespace {
    using services::archive::ArchiveCredentials;
    using services::archive::ArchiveOptions;
    using services::archive::Provider;
    using services::fetch::FetcherOptions;

    using utils::cache::CacheLocation;
    using utils::logging::LogLevel;

    using utils::types::i32;
    using utils::types::i64;
    using utils::types::None;
    using utils::types::Option;
    using utils::types::String;
    using utils::types::StringView;

    namespace fs = std::filesystem;
  } // namespace

  /**
   * @struct General
   * @brief [general] table.
   */
  struct General {
    LogLevel logLevel = LogLevel::Info;

    static fn fromToml(const toml::table& tbl) -> General;
  };

  /**
   * @struct Archive
   * @brief [archive] table: which remote archive to use and how to reach it.
   */
  struct Archive {
    Provider       provider           = Provider::NasaPower;
    Option<String> baseUrl            = None;
    i64            timeoutSecs        = 8;
    i64            connectTimeoutSecs = 4;
    Option<String> username           = None;
    Option<String> password           = None;

    static fn fromToml(const toml::table& tbl) -> Archive;

    /**
     * @brief Credentials from the config, falling back to EARTHDATA_USERNAME and EARTHDATA_PASSWORD.
     */
    [[nodiscard]] fn resolveCredentials() const -> ArchiveCredentials;

    [[nodiscard]] fn toOptions() const -> ArchiveOptions;
  };

  /**
   * @struct Fetch
   * @brief [fetch] table.
   */
  struct Fetch {
    i32 yearsBack    = services::prediction::DEFAULT_YEARS_BACK;
    i64 deadlineSecs = 60;

    static fn fromToml(const toml::table& tbl) -> Fetch;

    [[nodiscard]] fn toOptions() const -> FetcherOptions;
  };

  /**
   * @struct Cache
   * @brief [cache] table.
   */
  struct Cache {
    CacheLocation location = CacheLocation::Persistent;

    static fn fromToml(const toml::table& tbl) -> Cache;
  };

  /**
   * @brief Parses a provider name ("nasa_power" or "climatology").
   */
  fn ParseProvider(StringView name) -> Option<Provider>;

  /**
   * @brief Parses a cache location name ("persistent", "temp" or "memory").
   */
  fn ParseCacheLocation(StringView name) -> Option<CacheLocation>;

  /**
   * @struct Config
   * @brief Holds the application configuration settings.
   */
  struct Config {
    General general;
    Archive archive;
    Fetch   fetch;
    Cache   cache;

    Config() = default;

    /**
     * @brief Builds a Config from a parsed TOML document. Missing tables and keys keep their defaults.
     */
    explicit Config(const toml::table& tbl);

    /**
     * @brief First existing config file among $XDG_CONFIG_HOME/almanac, ~/.config/almanac and ./config.toml.
     *
     * When none exists the first candidate is returned so a default file can be created there.
     */
    static fn getConfigPath() -> fs::path;

    /**
     * @brief Loads the config file, creating a commented default when it does not exist.
     *
     * Any failure is logged and yields the built-in defaults.
     */
    static fn getInstance() -> Config;
  };
} // namespace almanac::config
