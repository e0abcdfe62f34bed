/**
 * @file ArgumentParser.hpp
 * @brief Small command-line argument parser for Almanac.
 *
 * Supports flags, typed options (integer, floating point, string), enum-style
 * options whose choices come from magic_enum, and help text generation.
 */

#pragma once

#include <algorithm>                 // std::ranges::{equal, transform}
#include <cctype>                    // std::tolower
#include <charconv>                  // std::from_chars
#include <concepts>                  // std::convertible_to
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::{enum_name, enum_cast, enum_values}
#include <sstream>                   // std::ostringstream
#include <utility>                   // std::forward
#include <variant>                   // std::{variant, get, holds_alternative, visit}

#include "Error.hpp"
#include "Types.hpp"

namespace almanac::utils::argparse {
  namespace {
    using error::AlmanacError;
    using error::AlmanacErrorCode;

    using types::Err;
    using types::f64;
    using types::i32;
    using types::Map;
    using types::None;
    using types::Option;
    using types::Result;
    using types::Span;
    using types::String;
    using types::StringView;
    using types::UniquePointer;
    using types::Unit;
    using types::usize;
    using types::Vec;

    inline fn EqualsIgnoreCase(const StringView lhs, const StringView rhs) -> bool {
      return std::ranges::equal(lhs, rhs, [](const char charA, const char charB) {
        return std::tolower(static_cast<unsigned char>(charA)) == std::tolower(static_cast<unsigned char>(charB));
      });
    }

    inline fn ToLower(String text) -> String {
      std::ranges::transform(text, text.begin(), [](const char character) { return static_cast<char>(std::tolower(static_cast<unsigned char>(character))); });
      return text;
    }
  } // namespace

  using ArgValue = std::variant<bool, i32, f64, String>;

  using ArgChoices = Vec<String>;

  /**
   * @brief Enum string conversion through magic_enum.
   * @tparam EnumType A scoped enum.
   */
  template <typename EnumType>
  struct EnumTraits {
    static constexpr bool has_string_conversion = magic_enum::is_scoped_enum_v<EnumType>;

    static fn getChoices() -> ArgChoices {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      ArgChoices choices;
      const auto enumValues = magic_enum::enum_values<EnumType>();
      choices.reserve(enumValues.size());

      for (const auto value : enumValues)
        choices.emplace_back(magic_enum::enum_name(value));

      return choices;
    }

    /**
     * @brief Case-insensitive lookup of an enumerator by name.
     */
    static fn stringToEnum(const String& str) -> Option<EnumType> {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");

      if (auto result = magic_enum::enum_cast<EnumType>(str))
        return *result;

      for (const auto value : magic_enum::enum_values<EnumType>())
        if (EqualsIgnoreCase(str, magic_enum::enum_name(value)))
          return value;

      return None;
    }

    static fn enumToString(EnumType value) -> String {
      static_assert(has_string_conversion, "Enum type must be a scoped enum");
      return String(magic_enum::enum_name(value));
    }
  };

  /**
   * @brief A command-line argument with its metadata and value.
   *
   * The type of the default value decides how a supplied value is converted:
   * an i32 or f64 default makes the option numeric.
   */
  class Argument {
   public:
    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    explicit Argument(NameTs&&... names)
      : m_names { String(std::forward<NameTs>(names))... } {}

    fn help(String help_text) -> Argument& {
      m_helpText = std::move(help_text);
      return *this;
    }

    template <typename T>
      requires(!std::is_enum_v<T>)
    fn defaultValue(T value) -> Argument& {
      m_defaultValue = ArgValue(std::move(value));
      return *this;
    }

    /**
     * @brief Sets an enum default and restricts the accepted values to the enum's names.
     */
    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn defaultValue(EnumType value) -> Argument& {
      m_defaultValue = EnumTraits<EnumType>::enumToString(value);
      m_choices      = EnumTraits<EnumType>::getChoices();
      return *this;
    }

    fn flag() -> Argument& {
      m_isFlag       = true;
      m_defaultValue = false;
      return *this;
    }

    fn choices(ArgChoices choices) -> Argument& {
      m_choices = std::move(choices);
      return *this;
    }

    /**
     * @brief The supplied value, else the default, else a value-initialized T.
     */
    template <typename T>
    fn get() const -> T {
      if (m_isUsed && m_value && std::holds_alternative<T>(*m_value))
        return std::get<T>(*m_value);

      if (m_defaultValue && std::holds_alternative<T>(*m_defaultValue))
        return std::get<T>(*m_defaultValue);

      return T {};
    }

    template <typename EnumType>
      requires std::is_enum_v<EnumType> && EnumTraits<EnumType>::has_string_conversion
    fn getEnum() const -> EnumType {
      if (Option<EnumType> value = EnumTraits<EnumType>::stringToEnum(get<String>()))
        return *value;

      return magic_enum::enum_values<EnumType>()[0];
    }

    [[nodiscard]] fn isUsed() const -> bool {
      return m_isUsed;
    }

    [[nodiscard]] fn getPrimaryName() const -> const String& {
      return m_names.back();
    }

    [[nodiscard]] fn getNames() const -> const Vec<String>& {
      return m_names;
    }

    [[nodiscard]] fn getHelpText() const -> const String& {
      return m_helpText;
    }

    [[nodiscard]] fn isFlag() const -> bool {
      return m_isFlag;
    }

    [[nodiscard]] fn hasChoices() const -> bool {
      return m_choices.has_value();
    }

    [[nodiscard]] fn getChoices() const -> ArgChoices {
      return m_choices.value_or(ArgChoices {});
    }

    /**
     * @brief Converts and stores a value given on the command line.
     * @return InvalidArgument if the value is not one of the choices or not a valid number.
     */
    fn setValue(const String& text) -> Result<> {
      if (hasChoices()) {
        const ArgChoices& choices = *m_choices;

        if (std::ranges::none_of(choices, [&text](const String& choice) { return EqualsIgnoreCase(text, choice); })) {
          std::ostringstream choicesStream;

          for (usize i = 0; i < choices.size(); ++i) {
            if (i > 0)
              choicesStream << ", ";

            choicesStream << ToLower(choices[i]);
          }

          return Err(AlmanacError(
            AlmanacErrorCode::InvalidArgument,
            std::format("Invalid value '{}' for argument '{}'. Allowed values: {}", text, getPrimaryName(), choicesStream.str())
          ));
        }
      }

      Result<ArgValue> converted = convert(text);

      if (!converted)
        return Err(converted.error());

      m_value  = std::move(*converted);
      m_isUsed = true;
      return {};
    }

    fn markUsed() -> Unit {
      m_isUsed = true;

      if (m_isFlag)
        m_value = true;
    }

   private:
    Vec<String>        m_names;
    String             m_helpText;
    Option<ArgValue>   m_value;
    Option<ArgValue>   m_defaultValue;
    Option<ArgChoices> m_choices;
    bool               m_isFlag {};
    bool               m_isUsed {};

    template <typename Number>
    fn parseNumber(const String& text) const -> Result<ArgValue> {
      Number value {};

      const char* first = text.data();
      const char* last  = first + text.size();

      if (first != last && *first == '+')
        ++first;

      const auto [ptr, errc] = std::from_chars(first, last, value);

      if (errc != std::errc() || ptr != last || first == last)
        return Err(AlmanacError(AlmanacErrorCode::InvalidArgument, std::format("Argument {} expects a number, got '{}'", getPrimaryName(), text)));

      return ArgValue(value);
    }

    fn convert(const String& text) const -> Result<ArgValue> {
      if (m_defaultValue && std::holds_alternative<i32>(*m_defaultValue))
        return parseNumber<i32>(text);

      if (m_defaultValue && std::holds_alternative<f64>(*m_defaultValue))
        return parseNumber<f64>(text);

      return ArgValue(text);
    }
  };

  /**
   * @brief Parses argv against a set of declared arguments.
   *
   * `-h/--help` and `-v/--version` are always declared. The parser only records
   * that they were given; the caller decides what to print and when to exit.
   */
  class ArgumentParser {
   public:
    explicit ArgumentParser(String programName = "", String version = "1.0")
      : m_programName(std::move(programName)), m_version(std::move(version)) {
      addArguments("-h", "--help")
        .help("Show this help message and exit")
        .flag();

      addArguments("-v", "--version")
        .help("Show version information and exit")
        .flag();
    }

    template <typename... NameTs>
      requires(sizeof...(NameTs) >= 1 && (std::convertible_to<NameTs, String> && ...))
    fn addArguments(NameTs&&... names) -> Argument& {
      m_arguments.emplace_back(std::make_unique<Argument>(std::forward<NameTs>(names)...));
      Argument& arg = *m_arguments.back();

      for (const String& name : arg.getNames())
        m_argumentMap[name] = &arg;

      return arg;
    }

    fn parseArgs(Span<const char* const> args) -> Result<> {
      Vec<String> stringArgs;
      stringArgs.reserve(args.size());

      for (const char* arg : args)
        stringArgs.emplace_back(arg);

      return parseArgs(stringArgs);
    }

    /**
     * @brief Parses arguments. The first element is the program name.
     *
     * Accepts both "--name value" and "--name=value".
     */
    fn parseArgs(const Vec<String>& args) -> Result<> {
      if (args.empty())
        return {};

      if (m_programName.empty())
        m_programName = args[0];

      for (usize i = 1; i < args.size(); ++i) {
        String         arg = args[i];
        Option<String> inlineValue;

        if (const usize equals = arg.find('='); arg.starts_with("--") && equals != String::npos) {
          inlineValue = arg.substr(equals + 1);
          arg.resize(equals);
        }

        auto iter = m_argumentMap.find(arg);

        if (iter == m_argumentMap.end())
          return Err(AlmanacError(AlmanacErrorCode::InvalidArgument, std::format("Unknown argument: {}", arg)));

        Argument* argument = iter->second;

        if (argument->isFlag()) {
          if (inlineValue)
            return Err(AlmanacError(AlmanacErrorCode::InvalidArgument, std::format("Flag {} does not take a value", arg)));

          argument->markUsed();
          continue;
        }

        if (!inlineValue) {
          if (i + 1 >= args.size())
            return Err(AlmanacError(AlmanacErrorCode::InvalidArgument, std::format("Argument {} requires a value", arg)));

          inlineValue = args[++i];
        }

        if (Result result = argument->setValue(*inlineValue); !result)
          return result;
      }

      return {};
    }

    template <typename T = String>
    fn get(const StringView name) const -> T {
      if (auto iter = m_argumentMap.find(String(name)); iter != m_argumentMap.end())
        return iter->second->get<T>();

      return T {};
    }

    template <typename EnumType>
    fn getEnum(const StringView name) const -> EnumType {
      static_assert(EnumTraits<EnumType>::has_string_conversion, "Enum type not supported. Add a specialization to EnumTraits.");

      if (auto iter = m_argumentMap.find(String(name)); iter != m_argumentMap.end())
        return iter->second->getEnum<EnumType>();

      return magic_enum::enum_values<EnumType>()[0];
    }

    [[nodiscard]] fn isUsed(const StringView name) const -> bool {
      if (auto iter = m_argumentMap.find(String(name)); iter != m_argumentMap.end())
        return iter->second->isUsed();

      return false;
    }

    [[nodiscard]] fn helpRequested() const -> bool {
      return isUsed("--help");
    }

    [[nodiscard]] fn versionRequested() const -> bool {
      return isUsed("--version");
    }

    [[nodiscard]] fn version() const -> const String& {
      return m_version;
    }

    /**
     * @brief Renders the usage line and the argument list.
     */
    [[nodiscard]] fn helpText() const -> String {
      std::ostringstream out;
      out << "Usage: " << m_programName;

      for (const auto& arg : m_arguments) {
        out << " [" << arg->getPrimaryName();

        if (!arg->isFlag())
          out << " VALUE";

        out << "]";
      }

      out << "\n\nArguments:\n";

      for (const auto& arg : m_arguments) {
        out << "  ";

        for (usize i = 0; i < arg->getNames().size(); ++i)
          out << (i > 0 ? ", " : "") << arg->getNames()[i];

        if (!arg->isFlag())
          out << " VALUE";

        out << '\n';

        if (!arg->getHelpText().empty())
          out << "    " << arg->getHelpText() << '\n';

        if (arg->hasChoices()) {
          out << "    Available values: ";

          const ArgChoices choices = arg->getChoices();

          for (usize i = 0; i < choices.size(); ++i)
            out << (i > 0 ? ", " : "") << ToLower(choices[i]);

          out << '\n';
        }
      }

      return out.str();
    }

   private:
    String                       m_programName;
    String                       m_version;
    Vec<UniquePointer<Argument>> m_arguments;
    Map<String, Argument*>       m_argumentMap;
  };
} // namespace almanac::utils::argparse
