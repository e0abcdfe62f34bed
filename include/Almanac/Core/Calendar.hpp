#pragma once

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace almanac::core {
  namespace {
    using utils::types::i32;
    using utils::types::Option;
    using utils::types::Result;
    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  /**
   * @struct CalendarDate
   * @brief A proleptic Gregorian calendar day.
   */
  struct CalendarDate {
    i32 year;
    i32 month; ///< 1-12
    i32 day;   ///< 1-31

    /// "YYYY-MM-DD"
    [[nodiscard]] fn toIso() const -> String;

    /// "YYYYMMDD", the form used by the archive's query parameters.
    [[nodiscard]] fn toCompact() const -> String;

    fn operator==(const CalendarDate&) const -> bool = default;
  };

  /**
   * @struct TargetDate
   * @brief The month/day a prediction is requested for, optionally with the year it was given with.
   */
  struct TargetDate {
    i32         month;
    i32         day;
    Option<i32> year;
  };

  [[nodiscard]] fn IsLeapYear(i32 year) -> bool;

  /**
   * @brief Number of days in a month.
   * @param year Year, used for February.
   * @param month 1-12.
   */
  [[nodiscard]] fn DaysInMonth(i32 year, i32 month) -> i32;

  /**
   * @brief The current year according to the system clock (UTC).
   */
  [[nodiscard]] fn CurrentYear() -> i32;

  /**
   * @brief Resolves a requested month/day inside a specific year.
   *
   * February 29th maps to February 28th in years that do not have it.
   */
  [[nodiscard]] fn ResolveInYear(i32 year, i32 month, i32 day) -> CalendarDate;

  /**
   * @brief Validates a month/day pair. February 29th is accepted.
   * @return InvalidArgument if the month or day is out of range.
   */
  fn ValidateMonthDay(i32 month, i32 day) -> Result<>;

  /**
   * @brief Parses "YYYY-MM-DD" or "MM-DD".
   * @param text The date as given by the caller.
   * @return The parsed date, or InvalidArgument if it cannot be parsed or is not a real calendar day.
   */
  fn ParseTargetDate(StringView text) -> Result<TargetDate>;
} // namespace almanac::core
