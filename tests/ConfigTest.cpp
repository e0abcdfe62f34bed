#include <chrono>        // std::chrono::seconds
#include <toml++/toml.h> // toml::{parse_result, parse}

#include <Almanac/Services/Archive.hpp>
#include <Almanac/Utils/CacheStore.hpp>
#include <Almanac/Utils/Logging.hpp>

#include "Config/Config.hpp"

#include "gtest/gtest.h"

using namespace almanac::config;
using almanac::services::archive::Provider;
using almanac::utils::cache::CacheLocation;
using almanac::utils::logging::LogLevel;

class ConfigTest : public testing::Test {};

TEST_F(ConfigTest, GeneralFromToml_LogLevel) {
  toml::parse_result tbl = toml::parse(R"(
    log_level = "Debug"
  )");

  ASSERT_TRUE(tbl.is_table());
  General generalConfig = General::fromToml(*tbl.as_table());
  EXPECT_EQ(generalConfig.logLevel, LogLevel::Debug);
}

TEST_F(ConfigTest, GeneralFromToml_UnknownLevelKeepsDefault) {
  toml::parse_result tbl = toml::parse(R"(
    log_level = "chatty"
  )");

  ASSERT_TRUE(tbl.is_table());
  General generalConfig = General::fromToml(*tbl.as_table());
  EXPECT_EQ(generalConfig.logLevel, LogLevel::Info);
}

TEST_F(ConfigTest, ArchiveFromToml_AllKeys) {
  toml::parse_result tbl = toml::parse(R"(
    provider = "climatology"
    base_url = "http://localhost:8080/daily"
    timeout_secs = 20
    connect_timeout_secs = 2
    username = "alice"
    password = "secret"
  )");

  ASSERT_TRUE(tbl.is_table());
  Archive archiveConfig = Archive::fromToml(*tbl.as_table());
  EXPECT_EQ(archiveConfig.provider, Provider::Climatology);
  ASSERT_TRUE(archiveConfig.baseUrl.has_value());
  EXPECT_EQ(*archiveConfig.baseUrl, "http://localhost:8080/daily");
  EXPECT_EQ(archiveConfig.timeoutSecs, 20);
  EXPECT_EQ(archiveConfig.connectTimeoutSecs, 2);

  const auto options = archiveConfig.toOptions();
  EXPECT_EQ(options.baseUrl, archiveConfig.baseUrl);
  EXPECT_EQ(options.timeout, std::chrono::seconds(20));
  EXPECT_EQ(options.connectTimeout, std::chrono::seconds(2));
  EXPECT_EQ(options.credentials.username, "alice");
  EXPECT_EQ(options.credentials.password, "secret");
  EXPECT_TRUE(options.credentials.complete());
}

TEST_F(ConfigTest, ArchiveFromToml_Defaults) {
  toml::parse_result tbl = toml::parse(R"(
    # Nothing set
  )");

  ASSERT_TRUE(tbl.is_table());
  Archive archiveConfig = Archive::fromToml(*tbl.as_table());
  EXPECT_EQ(archiveConfig.provider, Provider::NasaPower);
  EXPECT_FALSE(archiveConfig.baseUrl.has_value());
  EXPECT_EQ(archiveConfig.timeoutSecs, 8);
  EXPECT_EQ(archiveConfig.connectTimeoutSecs, 4);
}

TEST_F(ConfigTest, ArchiveFromToml_InvalidValuesFallBack) {
  toml::parse_result tbl = toml::parse(R"(
    provider = "openweathermap"
    base_url = ""
    timeout_secs = 0
    connect_timeout_secs = -3
  )");

  ASSERT_TRUE(tbl.is_table());
  Archive archiveConfig = Archive::fromToml(*tbl.as_table());
  EXPECT_EQ(archiveConfig.provider, Provider::NasaPower);
  EXPECT_FALSE(archiveConfig.baseUrl.has_value());
  EXPECT_EQ(archiveConfig.timeoutSecs, 8);
  EXPECT_EQ(archiveConfig.connectTimeoutSecs, 4);
}

TEST_F(ConfigTest, FetchFromToml) {
  toml::parse_result tbl = toml::parse(R"(
    years_back = 25
    deadline_secs = 90
  )");

  ASSERT_TRUE(tbl.is_table());
  Fetch fetchConfig = Fetch::fromToml(*tbl.as_table());
  EXPECT_EQ(fetchConfig.yearsBack, 25);
  EXPECT_EQ(fetchConfig.deadlineSecs, 90);

  const auto options = fetchConfig.toOptions();
  EXPECT_EQ(options.deadline, std::chrono::seconds(90));
  EXPECT_TRUE(options.readCache);
}

TEST_F(ConfigTest, FetchFromToml_NonPositiveFallsBack) {
  toml::parse_result tbl = toml::parse(R"(
    years_back = 0
    deadline_secs = -1
  )");

  ASSERT_TRUE(tbl.is_table());
  Fetch fetchConfig = Fetch::fromToml(*tbl.as_table());
  EXPECT_EQ(fetchConfig.yearsBack, 10);
  EXPECT_EQ(fetchConfig.deadlineSecs, 60);
}

TEST_F(ConfigTest, CacheFromToml) {
  toml::parse_result tbl = toml::parse(R"(
    location = "memory"
  )");

  ASSERT_TRUE(tbl.is_table());
  Cache cacheConfig = Cache::fromToml(*tbl.as_table());
  EXPECT_EQ(cacheConfig.location, CacheLocation::InMemory);
}

TEST_F(ConfigTest, ParseProviderAndLocationNames) {
  EXPECT_EQ(ParseProvider("nasa_power"), Provider::NasaPower);
  EXPECT_EQ(ParseProvider("power"), Provider::NasaPower);
  EXPECT_EQ(ParseProvider("climatology"), Provider::Climatology);
  EXPECT_FALSE(ParseProvider("metno").has_value());

  EXPECT_EQ(ParseCacheLocation("persistent"), CacheLocation::Persistent);
  EXPECT_EQ(ParseCacheLocation("temp"), CacheLocation::TempDirectory);
  EXPECT_EQ(ParseCacheLocation("memory"), CacheLocation::InMemory);
  EXPECT_FALSE(ParseCacheLocation("disk").has_value());
}

TEST_F(ConfigTest, ConfigFromWholeDocument) {
  toml::parse_result tbl = toml::parse(R"(
    [general]
    log_level = "warn"

    [fetch]
    years_back = 3

    [cache]
    location = "temp"
  )");

  ASSERT_TRUE(tbl.is_table());
  const Config config(*tbl.as_table());
  EXPECT_EQ(config.general.logLevel, LogLevel::Warn);
  EXPECT_EQ(config.archive.provider, Provider::NasaPower);
  EXPECT_EQ(config.fetch.yearsBack, 3);
  EXPECT_EQ(config.fetch.deadlineSecs, 60);
  EXPECT_EQ(config.cache.location, CacheLocation::TempDirectory);
}

TEST_F(ConfigTest, ConfigIgnoresNonTableSections) {
  toml::parse_result tbl = toml::parse(R"(
    general = "loud"
    archive = 5
  )");

  ASSERT_TRUE(tbl.is_table());
  const Config config(*tbl.as_table());
  EXPECT_EQ(config.general.logLevel, LogLevel::Info);
  EXPECT_EQ(config.archive.provider, Provider::NasaPower);
  EXPECT_EQ(config.cache.location, CacheLocation::Persistent);
}
