#include <Almanac/Core/Calendar.hpp>

#include <algorithm> // std::min
#include <charconv>  // std::from_chars
#include <chrono>    // std::chrono::{floor, days, system_clock, year_month_day}
#include <format>    // std::format

#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Types.hpp>

using namespace almanac::utils::types;
using almanac::utils::error::AlmanacError;
using enum almanac::utils::error::AlmanacErrorCode;

namespace {
  fn ParseInt(const StringView sview, i32& outVal) -> bool {
    if (sview.empty())
      return false;

    auto [ptr, ec] = std::from_chars(sview.data(), sview.data() + sview.size(), outVal);
    return ec == std::errc() && ptr == sview.data() + sview.size();
  }
} // namespace

namespace almanac::core {
  fn CalendarDate::toIso() const -> String {
    return std::format("{:04}-{:02}-{:02}", year, month, day);
  }

  fn CalendarDate::toCompact() const -> String {
    return std::format("{:04}{:02}{:02}", year, month, day);
  }

  fn IsLeapYear(const i32 year) -> bool {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  }

  fn DaysInMonth(const i32 year, const i32 month) -> i32 {
    static constexpr Array<i32, 12> DAYS = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };

    if (month == 2 && IsLeapYear(year))
      return 29;

    return DAYS.at(static_cast<usize>(month - 1));
  }

  fn CurrentYear() -> i32 {
    using namespace std::chrono;

    const year_month_day today { floor<days>(system_clock::now()) };

    return static_cast<i32>(today.year());
  }

  fn ResolveInYear(const i32 year, const i32 month, const i32 day) -> CalendarDate {
    return { .year = year, .month = month, .day = std::min(day, DaysInMonth(year, month)) };
  }

  fn ValidateMonthDay(const i32 month, const i32 day) -> Result<> {
    if (month < 1 || month > 12)
      ERR_FMT(InvalidArgument, "Month {} is out of range [1, 12]", month);

    // 2000 is a leap year, so February 29th is accepted here.
    if (day < 1 || day > DaysInMonth(2000, month))
      ERR_FMT(InvalidArgument, "Day {} is out of range for month {}", day, month);

    return {};
  }

  fn ParseTargetDate(const StringView text) -> Result<TargetDate> {
    // Supported forms:
    // 10: "YYYY-MM-DD"
    //  5: "MM-DD"
    TargetDate out { .month = 0, .day = 0, .year = None };

    if (text.size() == 10) {
      i32 year = 0;

      if (!ParseInt(text.substr(0, 4), year) || text[4] != '-' || !ParseInt(text.substr(5, 2), out.month) || text[7] != '-' || !ParseInt(text.substr(8, 2), out.day))
        ERR_FMT(InvalidArgument, "Failed to parse date '{}', expected YYYY-MM-DD", text);

      out.year = year;
    } else if (text.size() == 5) {
      if (!ParseInt(text.substr(0, 2), out.month) || text[2] != '-' || !ParseInt(text.substr(3, 2), out.day))
        ERR_FMT(InvalidArgument, "Failed to parse date '{}', expected MM-DD", text);
    } else
      ERR_FMT(InvalidArgument, "Failed to parse date '{}', unexpected length {}. Expected YYYY-MM-DD or MM-DD.", text, text.size());

    if (Result<> valid = ValidateMonthDay(out.month, out.day); !valid)
      return Err(valid.error());

    if (out.year && out.day > DaysInMonth(*out.year, out.month))
      ERR_FMT(InvalidArgument, "{} is not a valid calendar date", text);

    return out;
  }
} // namespace almanac::core
