#pragma once

#include <chrono>      // std::chrono::seconds
#include <format>      // std::{format_to, formatter}
#include <matchit.hpp> // matchit::{match, is, _}

#include "../Core/Calendar.hpp"
#include "../Core/Observation.hpp"
#include "../Utils/Types.hpp"

namespace almanac::services::archive {
  namespace {
    using core::CalendarDate;
    using core::Coords;
    using core::ObservationRecord;

    using utils::types::None;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::SharedPointer;
    using utils::types::String;
    using utils::types::u8;
  } // namespace

  /**
   * @brief Specifies where historical observations come from.
   */
  enum class Provider : u8 {
    NasaPower,   ///< NASA POWER daily point API. Works anonymously, credentials are sent when present.
    Climatology, ///< No remote archive. Every year is synthesized by the estimator.
  };

  /**
   * @struct ArchiveCredentials
   * @brief HTTP basic credentials for archives behind an account (e.g. Earthdata).
   */
  struct ArchiveCredentials {
    Option<String> username = None;
    Option<String> password = None;

    [[nodiscard]] fn complete() const -> bool {
      return username.has_value() && password.has_value();
    }
  };

  struct ArchiveOptions {
    Option<String>       baseUrl        = None; ///< Overrides the provider's default endpoint.
    std::chrono::seconds timeout        = std::chrono::seconds(8);
    std::chrono::seconds connectTimeout = std::chrono::seconds(4);
    ArchiveCredentials   credentials;
  };

  /**
   * @brief Source of real daily observations.
   *
   * Implementations must be callable from several worker threads at once.
   */
  class IArchiveClient {
   public:
    IArchiveClient(const IArchiveClient&) = delete;
    IArchiveClient(IArchiveClient&&)      = delete;

    fn operator=(const IArchiveClient&)->IArchiveClient& = delete;
    fn operator=(IArchiveClient&&)->IArchiveClient&      = delete;

    virtual ~IArchiveClient() = default;

    /**
     * @brief Fetches the observation for one coordinate on one concrete date.
     * @return The record, or NetworkError, ApiUnavailable, ParseError or Timeout.
     */
    [[nodiscard]] virtual fn fetchDay(const Coords& coords, const CalendarDate& date) const -> Result<ObservationRecord> = 0;

   protected:
    IArchiveClient() = default;
  };

  /**
   * @brief Creates the client for a provider.
   * @return The client, or nullptr for Provider::Climatology.
   */
  fn CreateArchiveClient(Provider provider, const ArchiveOptions& options = {}) -> SharedPointer<IArchiveClient>;
} // namespace almanac::services::archive

template <>
struct std::formatter<almanac::services::archive::Provider> {
  static constexpr auto parse(std::format_parse_context& ctx) {
    return ctx.begin();
  }

  static fn format(almanac::services::archive::Provider provider, std::format_context& ctx) {
    using matchit::match, matchit::is;
    using enum almanac::services::archive::Provider;

    return std::format_to(ctx.out(), "{}", match(provider)(is | NasaPower = "nasa-power", is | Climatology = "climatology"));
  }
};
