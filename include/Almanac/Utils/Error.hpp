#pragma once

#include <expected>        // std::{expected, unexpected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::{errc, error_code}

#include "Definitions.hpp"
#include "Types.hpp"

namespace almanac::utils {
  namespace error {
    namespace {
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum AlmanacErrorCode
     * @brief Error categories shared by the fetch pipeline, the cache and the engine.
     */
    enum class AlmanacErrorCode : u8 {
      ApiUnavailable,     ///< The remote archive answered with an error status or could not be reached by libcurl.
      ConfigurationError, ///< Configuration or environment issue.
      CorruptedData,      ///< Data present but corrupt or inconsistent (e.g. a damaged cache entry).
      InsufficientData,   ///< No observation could be resolved for the request.
      InternalError,      ///< An error occurred within Almanac's own logic.
      InvalidArgument,    ///< Invalid coordinate, date or year count supplied by the caller.
      IoError,            ///< General I/O error (filesystem, pipes, etc.).
      NetworkError,       ///< A network-related error occurred (e.g. DNS resolution, connection failure).
      NotFound,           ///< A required resource (file, variable, endpoint) was not found.
      Other,              ///< A generic or unclassified error.
      ParseError,         ///< Failed to parse data (archive response, date string, config).
      PermissionDenied,   ///< Insufficient permissions to perform the operation.
      Timeout,            ///< An operation timed out.
    };

    /**
     * @struct AlmanacError
     * @brief Holds structured information about an error.
     *
     * Used as the error type in Result throughout the library.
     */
    struct AlmanacError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      AlmanacErrorCode     code;     ///< The general category of the error.

      AlmanacError(const AlmanacErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      /**
       * @brief Builds an error from a std::error_code reported by the filesystem library.
       * @param context What was being attempted when the error occurred.
       * @param errc The error code.
       * @param loc Source location.
       */
      AlmanacError(const String& context, const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(std::format("{}: {}", context, errc.message())), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum AlmanacErrorCode;

        const std::errc condition = static_cast<std::errc>(errc.value());

        code = match(condition)(
          is | or_(std::errc::permission_denied, std::errc::operation_not_permitted) = PermissionDenied,
          is | std::errc::no_such_file_or_directory                                 = NotFound,
          is | std::errc::timed_out                                                 = Timeout,
          is | _                                                                    = IoError
        );
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Either a success value of type Tp or an error of type Er.
     */
    template <typename Tp = void, typename Er = error::AlmanacError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     */
    template <typename Er = error::AlmanacError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace almanac::utils

namespace std {
  template <>
  struct formatter<::almanac::utils::error::AlmanacErrorCode> : formatter<::almanac::utils::types::StringView> {
    template <typename FormatContext>
    fn format(almanac::utils::error::AlmanacErrorCode code, FormatContext& ctx) const {
      using enum almanac::utils::error::AlmanacErrorCode;
      using matchit::match, matchit::is, matchit::_;

      almanac::utils::types::StringView name = match(code)(
        is | ApiUnavailable     = "ApiUnavailable",
        is | ConfigurationError = "ConfigurationError",
        is | CorruptedData      = "CorruptedData",
        is | InsufficientData   = "InsufficientData",
        is | InternalError      = "InternalError",
        is | InvalidArgument    = "InvalidArgument",
        is | IoError            = "IoError",
        is | NetworkError       = "NetworkError",
        is | NotFound           = "NotFound",
        is | ParseError         = "ParseError",
        is | PermissionDenied   = "PermissionDenied",
        is | Timeout            = "Timeout",
        is | _                  = "Other"
      );

      return formatter<almanac::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::almanac::utils::types::Err(::almanac::utils::error::AlmanacError(errc, msg))
#define ERR_FROM(err)           return ::almanac::utils::types::Err(err)
#define ERR_FMT(errc, fmt, ...) return ::almanac::utils::types::Err(::almanac::utils::error::AlmanacError(errc, std::format(fmt, __VA_ARGS__)))
