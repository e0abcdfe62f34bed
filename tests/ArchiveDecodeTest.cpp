#include <format> // std::format

#include <Almanac/Core/Calendar.hpp>
#include <Almanac/Core/Observation.hpp>
#include <Almanac/Services/Archive.hpp>
#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Types.hpp>

#include "Services/Archive/NasaPowerClient.hpp"

#include "gtest/gtest.h"

using almanac::core::CalendarDate;
using almanac::core::ObservationRecord;
using almanac::services::archive::ArchiveOptions;
using almanac::services::archive::CreateArchiveClient;
using almanac::services::archive::NasaPowerClient;
using almanac::services::archive::Provider;
using almanac::utils::error::AlmanacErrorCode;
using almanac::utils::types::Result;
using almanac::utils::types::String;
using almanac::utils::types::StringView;

namespace {
  constexpr CalendarDate JULY_4_2020 { .year = 2020, .month = 7, .day = 4 };

  // Shaped like a real daily point response, trimmed to the parts the client reads.
  fn PowerBody(const StringView humidity = "68.5", const StringView day = "20200704", const StringView fillValue = "-999.0") -> String {
    return std::format(
      R"({{
  "type": "Feature",
  "geometry": {{ "type": "Point", "coordinates": [-74.01, 40.71, 25.0] }},
  "properties": {{
    "parameter": {{
      "T2M": {{ "{0}": 26.4 }},
      "T2M_MAX": {{ "{0}": 31.2 }},
      "T2M_MIN": {{ "{0}": 21.9 }},
      "RH2M": {{ "{0}": {1} }},
      "WS10M": {{ "{0}": 3.1 }},
      "WD10M": {{ "{0}": 231.0 }},
      "PRECTOTCORR": {{ "{0}": 0.42 }},
      "CLOUD_AMT": {{ "{0}": 37.5 }},
      "PS": {{ "{0}": 101.21 }},
      "T2MDEW": {{ "{0}": 19.8 }},
      "ALLSKY_SFC_UV_INDEX": {{ "{0}": 7.9 }}
    }}
  }},
  "header": {{
    "title": "NASA/POWER Source Native Resolution Daily Data",
    "api": {{ "version": "v2.5.9", "name": "POWER Daily API" }},
    "fill_value": {2},
    "start": "{0}",
    "end": "{0}"
  }},
  "messages": [],
  "parameters": {{ "T2M": {{ "units": "C", "longname": "Temperature at 2 Meters" }} }},
  "times": {{ "data": 0.9, "process": 0.02 }}
}})",
      day,
      humidity,
      fillValue
    );
  }
} // namespace

class ArchiveDecodeTest : public testing::Test {};

TEST_F(ArchiveDecodeTest, DecodesEveryParameter) {
  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(PowerBody(), JULY_4_2020);

  ASSERT_TRUE(record.has_value()) << record.error().message;

  EXPECT_EQ(record->year, 2020);
  EXPECT_DOUBLE_EQ(record->temperatureC, 26.4);
  EXPECT_DOUBLE_EQ(record->temperatureMaxC, 31.2);
  EXPECT_DOUBLE_EQ(record->temperatureMinC, 21.9);
  EXPECT_DOUBLE_EQ(record->temperatureAvgC, 26.4);
  EXPECT_DOUBLE_EQ(record->humidityPct, 68.5);
  EXPECT_DOUBLE_EQ(record->windSpeedMs, 3.1);
  EXPECT_DOUBLE_EQ(record->windDirectionDeg, 231.0);
  EXPECT_DOUBLE_EQ(record->precipitationMm, 0.42);
  EXPECT_DOUBLE_EQ(record->cloudCoverPct, 37.5);
  EXPECT_NEAR(record->pressureHpa, 1012.1, 1e-9);
  EXPECT_DOUBLE_EQ(record->dewPointC, 19.8);
  EXPECT_DOUBLE_EQ(record->uvIndex, 7.9);
  EXPECT_EQ(record->hourOfMax, 14);
  EXPECT_EQ(record->hourOfMin, 6);
}

TEST_F(ArchiveDecodeTest, FeelsLikeIsDerivedFromDecodedValues) {
  Result<ObservationRecord> mild = NasaPowerClient::DecodeDay(PowerBody(), JULY_4_2020);

  ASSERT_TRUE(mild.has_value());
  EXPECT_DOUBLE_EQ(mild->feelsLikeC, 26.4);
}

TEST_F(ArchiveDecodeTest, OutOfRangeValuesAreClamped) {
  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(PowerBody("104.2"), JULY_4_2020);

  ASSERT_TRUE(record.has_value());
  EXPECT_DOUBLE_EQ(record->humidityPct, 100.0);
}

TEST_F(ArchiveDecodeTest, FillValueIsAParseError) {
  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(PowerBody("-999.0"), JULY_4_2020);

  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().code, AlmanacErrorCode::ParseError);
  EXPECT_NE(record.error().message.find("RH2M"), String::npos);
}

TEST_F(ArchiveDecodeTest, HeaderFillValueIsHonoured) {
  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(PowerBody("-99.0", "20200704", "-99.0"), JULY_4_2020);

  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().code, AlmanacErrorCode::ParseError);
}

TEST_F(ArchiveDecodeTest, MissingDayIsAParseError) {
  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(PowerBody("68.5", "20200705"), JULY_4_2020);

  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().code, AlmanacErrorCode::ParseError);
}

TEST_F(ArchiveDecodeTest, MissingParameterIsAParseError) {
  const String body = R"({ "properties": { "parameter": { "T2M": { "20200704": 26.4 } } } })";

  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(body, JULY_4_2020);

  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().code, AlmanacErrorCode::ParseError);
}

TEST_F(ArchiveDecodeTest, MalformedJsonIsAParseError) {
  const String body = R"({ "properties": { "parameter": )";

  Result<ObservationRecord> record = NasaPowerClient::DecodeDay(body, JULY_4_2020);

  ASSERT_FALSE(record.has_value());
  EXPECT_EQ(record.error().code, AlmanacErrorCode::ParseError);
}

TEST_F(ArchiveDecodeTest, RequestUrl) {
  const NasaPowerClient client(ArchiveOptions {});

  const String url = client.requestUrl({ .lat = 40.71, .lon = -74.01 }, JULY_4_2020);

  EXPECT_TRUE(url.starts_with(NasaPowerClient::DEFAULT_BASE_URL)) << url;
  EXPECT_NE(url.find("longitude=-74.0100&latitude=40.7100"), String::npos) << url;
  EXPECT_NE(url.find("start=20200704&end=20200704"), String::npos) << url;
  EXPECT_NE(url.find("parameters=T2M,T2M_MAX"), String::npos) << url;
  EXPECT_NE(url.find("format=JSON"), String::npos) << url;
}

TEST_F(ArchiveDecodeTest, RequestUrlHonoursBaseOverride) {
  const NasaPowerClient client(ArchiveOptions { .baseUrl = "http://localhost:8080/point" });

  EXPECT_TRUE(client.requestUrl({ .lat = 0.0, .lon = 0.0 }, JULY_4_2020).starts_with("http://localhost:8080/point?"));
}

TEST_F(ArchiveDecodeTest, FactoryReturnsClientPerProvider) {
  EXPECT_NE(CreateArchiveClient(Provider::NasaPower), nullptr);
  EXPECT_EQ(CreateArchiveClient(Provider::Climatology), nullptr);

  EXPECT_EQ(std::format("{}", Provider::NasaPower), "nasa-power");
  EXPECT_EQ(std::format("{}", Provider::Climatology), "climatology");
}
