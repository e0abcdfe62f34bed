#include "UI.hpp"

#include <algorithm> // std::max
#include <format>    // std::format
#include <sstream>   // std::stringstream

#include <Almanac/Core/Observation.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

using namespace almanac::utils::types;
using namespace almanac::utils::logging;

namespace almanac::ui {
  using core::OriginName;
  using core::SampleEntry;

  using services::prediction::PredictionResult;

  constexpr Theme DEFAULT_THEME = {
    .icon   = ftxui::Color::Palette16::Cyan,
    .label  = ftxui::Color::Palette16::Yellow,
    .value  = ftxui::Color::Palette16::White,
    .accent = ftxui::Color::Palette16::Magenta,
  };

  constexpr Icons ICON_TYPE = {
    .location      = " 📍 ",
    .calendar      = " 📅 ",
    .temperature   = " 🌡 ",
    .humidity      = " 💧 ",
    .wind          = " 🌬 ",
    .precipitation = " ☔ ",
    .cloud         = " ☁ ",
    .pressure      = " 🧭 ",
    .sun           = " 🔆 ",
    .confidence    = " 🎯 ",
    .history       = " 📜 ",
  };

  struct RowInfo {
    StringView icon;
    String     label;
    String     value;
  };

  struct UIGroup {
    Vec<RowInfo> rows;
    Vec<usize>   iconWidths;
    Vec<usize>   labelWidths;
    Vec<usize>   valueWidths;
    Vec<String>  colouredIcons;
    Vec<String>  colouredLabels;
    Vec<String>  colouredValues;
    usize        maxLabelWidth = 0;
  };

  namespace {
    constexpr fn IsWideCharacter(const char32_t codepoint) -> bool {
      return (codepoint >= 0x1F300 && codepoint <= 0x1FAFF) || // Pictographs and emoji
        (codepoint >= 0x2600 && codepoint <= 0x26FF) ||        // Miscellaneous symbols
        (codepoint >= 0x1100 && codepoint <= 0x115F) ||        // Hangul Jamo
        (codepoint >= 0x3000 && codepoint <= 0x9FFF) ||        // CJK
        (codepoint >= 0xFF00 && codepoint <= 0xFF60);          // Fullwidth forms
    }

    constexpr fn IsZeroWidth(const char32_t codepoint) -> bool {
      return (codepoint >= 0xFE00 && codepoint <= 0xFE0F) || codepoint == 0x200D;
    }

    constexpr fn DecodeUTF8(const StringView& str, usize& pos) -> char32_t {
      if (pos >= str.length())
        return 0;

      const fn getByte = [&](const usize index) -> u8 {
        return static_cast<u8>(str[index]);
      };

      const u8 first = getByte(pos++);

      if ((first & 0x80) == 0)
        return first;

      if ((first & 0xE0) == 0xC0) {
        if (pos >= str.length())
          return 0;

        const u8 second = getByte(pos++);

        return ((first & 0x1F) << 6) | (second & 0x3F);
      }

      if ((first & 0xF0) == 0xE0) {
        if (pos + 1 >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        const u8 third  = getByte(pos++);

        return ((first & 0x0F) << 12) | ((second & 0x3F) << 6) | (third & 0x3F);
      }

      if ((first & 0xF8) == 0xF0) {
        if (pos + 2 >= str.length())
          return 0;

        const u8 second = getByte(pos++);
        const u8 third  = getByte(pos++);
        const u8 fourth = getByte(pos++);

        return ((first & 0x07) << 18) | ((second & 0x3F) << 12) | ((third & 0x3F) << 6) | (fourth & 0x3F);
      }

      return 0;
    }

    constexpr fn GetVisualWidth(const StringView& str) -> usize {
      usize width    = 0;
      bool  inEscape = false;
      usize pos      = 0;

      while (pos < str.length()) {
        const char current = str[pos];

        if (inEscape) {
          inEscape = (current != 'm');
          pos++;
        } else if (current == '\033') {
          inEscape = true;
          pos++;
        } else {
          const char32_t codepoint = DecodeUTF8(str, pos);

          if (codepoint != 0 && !IsZeroWidth(codepoint))
            width += IsWideCharacter(codepoint) ? 2 : 1;
        }
      }

      return width;
    }

    fn ProcessGroup(UIGroup& group) -> usize {
      if (group.rows.empty())
        return 0;

      usize groupMaxWidth = 0;

      for (const RowInfo& row : group.rows) {
        const usize labelWidth = GetVisualWidth(row.label);
        group.maxLabelWidth    = std::max(group.maxLabelWidth, labelWidth);

        const usize iconW  = GetVisualWidth(row.icon);
        const usize valueW = GetVisualWidth(row.value);

        group.iconWidths.push_back(iconW);
        group.labelWidths.push_back(labelWidth);
        group.valueWidths.push_back(valueW);

        group.colouredIcons.push_back(Colorize(row.icon, DEFAULT_THEME.icon));
        group.colouredLabels.push_back(Colorize(row.label, DEFAULT_THEME.label));
        group.colouredValues.push_back(Colorize(row.value, DEFAULT_THEME.value));

        groupMaxWidth = std::max(groupMaxWidth, iconW + valueW);
      }

      return groupMaxWidth + group.maxLabelWidth + 1;
    }

    fn RenderGroup(String& out, const UIGroup& group, const usize maxContentWidth, const String& hBorder) {
      if (group.rows.empty())
        return;

      out += "├";
      out += hBorder;
      out += "┤\n";

      for (usize i = 0; i < group.rows.size(); ++i) {
        const usize leftWidth  = group.iconWidths[i] + group.maxLabelWidth;
        const usize rightWidth = group.valueWidths[i];
        const usize padding    = (maxContentWidth >= leftWidth + rightWidth)
             ? maxContentWidth - (leftWidth + rightWidth)
             : 0;

        out += "│";
        out += group.colouredIcons[i];
        out += group.colouredLabels[i];
        out.append(group.maxLabelWidth - group.labelWidths[i], ' ');
        out.append(padding, ' ');
        out += group.colouredValues[i];
        out += " │\n";
      }
    }

    fn WordWrap(const StringView& text, const usize wrapWidth) -> Vec<String> {
      Vec<String> lines;

      if (wrapWidth == 0) {
        lines.emplace_back(text);
        return lines;
      }

      std::stringstream textStream((String(text)));
      String            word;
      String            currentLine;

      while (textStream >> word) {
        if (!currentLine.empty() && GetVisualWidth(currentLine) + GetVisualWidth(word) + 1 > wrapWidth) {
          lines.emplace_back(currentLine);
          currentLine.clear();
        }

        if (!currentLine.empty())
          currentLine += " ";

        currentLine += word;
      }

      if (!currentLine.empty())
        lines.emplace_back(currentLine);

      return lines;
    }

    fn DescribeEntry(const SampleEntry& entry) -> String {
      const auto& rec = entry.record;

      String value = std::format("{:.1f}°C {:.0f}% {:.1f}mm [{}]", rec.temperatureC, rec.humidityPct, rec.precipitationMm, OriginName(entry.origin));

      if (entry.fallbackReason)
        value += std::format(" ({})", *entry.fallbackReason);

      return value;
    }
  } // namespace

  fn CreateReport(const PredictionResult& result, const bool showHistory) -> String {
    const Icons& icons = ICON_TYPE;
    const auto&  pred  = result.prediction;

    UIGroup headerGroup;
    UIGroup conditionsGroup;
    UIGroup outlookGroup;
    UIGroup historyGroup;

    {
      if (result.coords)
        headerGroup.rows.push_back({ .icon = icons.location, .label = "Location", .value = std::format("{:.4f}, {:.4f}", result.coords->lat, result.coords->lon) });

      if (result.date)
        headerGroup.rows.push_back({ .icon = icons.calendar, .label = "Date", .value = result.date->toIso() });

      headerGroup.rows.push_back({ .icon = icons.sun, .label = "Weather", .value = std::format("{} ({})", pred.category, pred.conditions) });
    }

    {
      conditionsGroup.rows.push_back({ .icon = icons.temperature, .label = "Temperature", .value = std::format("{:.1f}°C", pred.temperatureC) });
      conditionsGroup.rows.push_back({ .icon = icons.temperature, .label = "Feels like", .value = std::format("{:.1f}°C", pred.feelsLikeC) });
      conditionsGroup.rows.push_back({ .icon = icons.temperature, .label = "Heat index", .value = std::format("{:.1f}°C", pred.heatIndexC) });
      conditionsGroup.rows.push_back({ .icon = icons.humidity, .label = "Humidity", .value = std::format("{:.1f}%", pred.humidityPct) });
      conditionsGroup.rows.push_back({ .icon = icons.humidity, .label = "Dew point", .value = std::format("{:.1f}°C", pred.dewPointC) });
      conditionsGroup.rows.push_back({ .icon = icons.wind, .label = "Wind", .value = std::format("{:.1f} m/s {} ({:.0f}°)", pred.windSpeedMs, pred.windCompass, pred.windDirectionDeg) });
      conditionsGroup.rows.push_back({ .icon = icons.cloud, .label = "Cloud cover", .value = std::format("{:.1f}%", pred.cloudCoverPct) });
      conditionsGroup.rows.push_back({ .icon = icons.pressure, .label = "Pressure", .value = std::format("{:.1f} hPa", pred.pressureHpa) });
      conditionsGroup.rows.push_back({ .icon = icons.sun, .label = "UV index", .value = std::format("{:.1f}", pred.uvIndex) });
    }

    {
      outlookGroup.rows.push_back({ .icon = icons.precipitation, .label = "Precipitation", .value = std::format("{:.1f}mm", pred.precipitationMm) });
      outlookGroup.rows.push_back({ .icon = icons.precipitation, .label = "Rain / Snow", .value = std::format("{:.0f}% / {:.0f}%", pred.rainProbabilityPct, pred.snowProbabilityPct) });
      outlookGroup.rows.push_back({ .icon = icons.cloud, .label = "Visibility", .value = pred.visibility });
      outlookGroup.rows.push_back({ .icon = icons.confidence, .label = "Confidence", .value = std::format("{:.1f}% ({} of {} years)", result.confidencePct, result.dataPoints, result.yearsRequested) });
    }

    if (showHistory)
      for (const SampleEntry& entry : result.sample)
        historyGroup.rows.push_back({ .icon = icons.history, .label = std::format("{}", entry.record.year), .value = DescribeEntry(entry) });

    Vec<UIGroup*> groups = { &headerGroup, &conditionsGroup, &outlookGroup, &historyGroup };

    usize maxContentWidth = 0;

    for (UIGroup* group : groups)
      maxContentWidth = std::max(maxContentWidth, ProcessGroup(*group));

    const String title = Bold(Colorize(" Almanac prediction", DEFAULT_THEME.accent));
    maxContentWidth    = std::max(maxContentWidth, GetVisualWidth(title));

    String out;

    const usize innerWidth = maxContentWidth + 1;

    String hBorder;
    hBorder.reserve(innerWidth * 3);
    for (usize i = 0; i < innerWidth; ++i) hBorder += "─";

    const fn createLine = [&](const String& content) {
      const usize width   = GetVisualWidth(content);
      const usize padding = maxContentWidth > width ? maxContentWidth - width : 0;

      out += "│";
      out += content;
      out.append(padding, ' ');
      out += " │\n";
    };

    out += "╭";
    out += hBorder;
    out += "╮\n";

    createLine(title);

    for (const UIGroup* group : groups)
      RenderGroup(out, *group, maxContentWidth, hBorder);

    const fn renderNote = [&](const StringView label, const String& text) {
      if (text.empty())
        return;

      out += "├";
      out += hBorder;
      out += "┤\n";

      createLine(" " + Colorize(label, DEFAULT_THEME.label));

      for (const String& line : WordWrap(text, maxContentWidth - 1))
        createLine(" " + Italic(line));
    };

    renderNote("Outlook", pred.precipitationOutlook);
    renderNote("Trend", result.trendAnalysis);
    renderNote("Notes", result.notes);

    out += "╰";
    out += hBorder;
    out += "╯\n";
    return out;
  }
} // namespace almanac::ui
