#pragma once

#include <Almanac/Services/Prediction.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

namespace almanac::ui {
  namespace {
    using services::prediction::PredictionResult;

    using utils::types::String;
    using utils::types::StringView;
  } // namespace

  struct Theme {
    ftxui::Color::Palette16 icon;
    ftxui::Color::Palette16 label;
    ftxui::Color::Palette16 value;
    ftxui::Color::Palette16 accent;
  };

  extern const Theme DEFAULT_THEME;

  struct Icons {
    StringView location;
    StringView calendar;
    StringView temperature;
    StringView humidity;
    StringView wind;
    StringView precipitation;
    StringView cloud;
    StringView pressure;
    StringView sun;
    StringView confidence;
    StringView history;
  };

  extern const Icons ICON_TYPE;

  /**
   * @brief Renders a prediction as a boxed terminal report.
   * @param result The prediction to render.
   * @param showHistory Adds one row per sampled year, tagged with its origin.
   * @return A string containing the formatted report.
   */
  fn CreateReport(const PredictionResult& result, bool showHistory) -> String;
} // namespace almanac::ui
