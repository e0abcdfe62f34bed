#pragma once

#include <Almanac/Services/Archive.hpp>
#include <Almanac/Utils/Types.hpp>

namespace almanac::services::archive {
  namespace {
    using utils::types::StringView;
  } // namespace

  /**
   * @brief Daily point client for the NASA POWER archive.
   *
   * Each call performs one blocking GET on its own curl handle, so the client is
   * safe to share between fetch workers.
   */
  class NasaPowerClient final : public IArchiveClient {
   public:
    static constexpr StringView DEFAULT_BASE_URL = "https://power.larc.nasa.gov/api/temporal/daily/point";

    /// Requested parameters, in the order they appear in the query string.
    static constexpr StringView PARAMETERS = "T2M,T2M_MAX,T2M_MIN,RH2M,WS10M,WD10M,PRECTOTCORR,CLOUD_AMT,PS,T2MDEW,ALLSKY_SFC_UV_INDEX";

    explicit NasaPowerClient(ArchiveOptions options);

    [[nodiscard]] fn fetchDay(const Coords& coords, const CalendarDate& date) const -> Result<ObservationRecord> override;

    /**
     * @brief Builds the request URL for one coordinate and day.
     */
    [[nodiscard]] fn requestUrl(const Coords& coords, const CalendarDate& date) const -> String;

    /**
     * @brief Decodes a daily point response body into a record for the given day.
     * @return ParseError when the body is malformed, a parameter is missing or a value is the fill value.
     */
    static fn DecodeDay(const String& body, const CalendarDate& date) -> Result<ObservationRecord>;

   private:
    ArchiveOptions m_options;
  };
} // namespace almanac::services::archive
