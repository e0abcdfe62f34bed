#pragma once

#include <chrono>                 // std::chrono::system_clock
#include <ctime>                  // localtime_r/s, strftime, time_t, tm
#include <filesystem>             // std::filesystem::path
#include <format>                 // std::format
#include <ftxui/screen/color.hpp> // ftxui::Color
#include <utility>                // std::forward

#include <cstdio>                 // stderr, std::fflush

#ifdef __cpp_lib_print
  #include <print> // std::{print, println}
#else
  #include <iostream> // std::{cout, cerr}
#endif

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace almanac::utils::logging {
  namespace {
    using types::Array;
    using types::LockGuard;
    using types::Mutex;
    using types::PCStr;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::usize;
  } // namespace

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  struct LogLevelConst {
    // clang-format off
    static constexpr Array<StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr ftxui::Color::Palette16 DEBUG_COLOR      = ftxui::Color::Palette16::Cyan;
    static constexpr ftxui::Color::Palette16 INFO_COLOR       = ftxui::Color::Palette16::Green;
    static constexpr ftxui::Color::Palette16 WARN_COLOR       = ftxui::Color::Palette16::Yellow;
    static constexpr ftxui::Color::Palette16 ERROR_COLOR      = ftxui::Color::Palette16::Red;
    static constexpr ftxui::Color::Palette16 DEBUG_INFO_COLOR = ftxui::Color::Palette16::GrayLight;

    static constexpr PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels.
   */
  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetRuntimeLogLevel() -> LogLevel& {
    static LogLevel RuntimeLogLevel = LogLevel::Info;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) {
    GetRuntimeLogLevel() = level;
  }

  /**
   * @brief Wraps text in the ANSI escape for a 16-color palette entry.
   * @param text The text to colorize
   * @param color The FTXUI palette color
   * @return Styled string with ANSI codes
   */
  inline fn Colorize(const StringView text, const ftxui::Color::Palette16& color) -> String {
    return std::format("{}{}{}", LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)), text, LogLevelConst::RESET_CODE);
  }

  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::BOLD_START, text, LogLevelConst::BOLD_END);
  }

  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::ITALIC_START, text, LogLevelConst::ITALIC_END);
  }

  /**
   * @brief Returns the pre-formatted and styled log level tags.
   * @note Function-local static to avoid static initialization order issues.
   */
  inline fn GetLevelInfo() -> const Array<String, 4>& {
    static const Array<String, 4> LEVEL_INFO_INSTANCE = {
      Bold(Colorize(LogLevelConst::DEBUG_STR, LogLevelConst::DEBUG_COLOR)),
      Bold(Colorize(LogLevelConst::INFO_STR, LogLevelConst::INFO_COLOR)),
      Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR)),
      Bold(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)),
    };
    return LEVEL_INFO_INSTANCE;
  }

  /**
   * @brief Writes a line of program output to stdout.
   */
  inline fn Println(const StringView text) {
#ifdef __cpp_lib_print
    std::println("{}", text);
#else
    std::cout << text << '\n';
#endif
  }

  /**
   * @brief Writes one finished log record to stderr, keeping stdout free for reports and JSON.
   */
  inline fn WriteLogRecord(const StringView record) {
#ifdef __cpp_lib_print
    std::print(stderr, "{}", record);
#else
    std::cerr << record;
#endif
    std::fflush(stderr);
  }

  /**
   * @brief Formats the current local wall-clock time for a log line.
   * @return "HH:MM:SS" in the locale's representation, or "??:??:??" if the clock cannot be read.
   */
  inline fn FormatTimestamp() -> String {
    using std::chrono::system_clock;

    const std::time_t nowTt = system_clock::to_time_t(system_clock::now());
    std::tm           localTm {};

#ifdef _WIN32
    if (localtime_s(&localTm, &nowTt) != 0)
#else
    if (localtime_r(&nowTt, &localTm) == nullptr)
#endif
      return "??:??:??";

    Array<char, 64> timeBuffer {};

    if (std::strftime(timeBuffer.data(), timeBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
      return "??:??:??";

    return timeBuffer.data();
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   * @tparam Args Parameter pack for format arguments.
   * @param level The log level (DEBUG, INFO, WARN, ERROR).
   * @param loc The source location of the log message (only in Debug builds).
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  fn LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) {
    if (level < GetRuntimeLogLevel())
      return;

    const String message = std::format(fmt, std::forward<Args>(args)...);

    const String mainLogLine = std::format(
      LogLevelConst::LOG_FORMAT,
      Colorize(std::format("[{}]", FormatTimestamp()), LogLevelConst::DEBUG_INFO_COLOR),
      GetLevelInfo().at(static_cast<usize>(level)),
      message
    );

    String record = std::format("{}\n", mainLogLine);

#ifndef NDEBUG
    const String fileLine = std::format(LogLevelConst::FILE_LINE_FORMAT, std::filesystem::path(loc.file_name()).lexically_normal().string(), loc.line());
    record += std::format("{}\n", Italic(Colorize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, fileLine), LogLevelConst::DEBUG_INFO_COLOR)));
#endif

    const LockGuard lock(GetLogMutex());
    WriteLogRecord(record);
  }

  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& error_obj) {
    using DecayedErrorType = std::decay_t<ErrorType>;

#ifndef NDEBUG
    std::source_location logLocation;
#endif

    String errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::AlmanacError>) {
#ifndef NDEBUG
      logLocation = error_obj.location;
#endif
      errorMessagePart = std::format("{} ({})", error_obj.message, error_obj.code);
    } else {
#ifndef NDEBUG
      logLocation = std::source_location::current();
#endif
      if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
        errorMessagePart = error_obj.what();
      else if constexpr (requires { error_obj.message; })
        errorMessagePart = error_obj.message;
      else
        errorMessagePart = "Unknown error type logged";
    }

#ifndef NDEBUG
    LogImpl(level, logLocation, "{}", errorMessagePart);
#else
    LogImpl(level, "{}", errorMessagePart);
#endif
  }

#define debug_at(error_obj) ::almanac::utils::logging::LogError(::almanac::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::almanac::utils::logging::LogError(::almanac::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::almanac::utils::logging::LogError(::almanac::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::almanac::utils::logging::LogError(::almanac::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug_log(fmt, ...) ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)  ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...)  ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug_log(fmt, ...) \
    ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...) \
    ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::almanac::utils::logging::LogImpl(::almanac::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace almanac::utils::logging
