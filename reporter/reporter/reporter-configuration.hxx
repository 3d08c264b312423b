#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace reporter
{
  // Text styles understood by configuration::format().
  //
  enum class text_style
  {
    blue_bright,
    yellow_bright,
    red_bright,
    grey,
    green
  };

  // Progress bar style.
  //
  // A bar is drawn with two glyphs: `done` for the filled part and `todo`
  // for the rest. The size is the bar width on an 80-column terminal and is
  // scaled down proportionally on narrower ones.
  //
  struct progress_bar_style
  {
    std::string name;
    std::string done;
    std::string todo;
    int size;

    // Day and month on which this style is the default (seasonal styles
    // only).
    //
    std::optional<int> day;
    std::optional<int> month;
  };

  // All the known styles, `default` last.
  //
  const std::vector<progress_bar_style>&
  progress_bar_styles ();

  // Find a style by name. Throw std::invalid_argument if there is no such
  // style.
  //
  const progress_bar_style&
  find_progress_bar_style (const std::string& name);

  // Pick the default style for the given terminal and date.
  //
  // Seasonal styles use emoji, so we only consider them on terminals known
  // to render those out of the box.
  //
  std::string
  default_progress_bar_style (const std::string& term_program,
                              int day,
                              int month);

  // Reporter configuration.
  //
  // This is resolved once (normally with from_environment()) and then passed
  // by value to the reporter. Nothing downstream looks at the environment or
  // the terminal on its own.
  //
  struct configuration
  {
    bool enable_timers = true;
    bool enable_progress_bars = false;
    bool enable_colors = false;

    // Empty means the `default` style.
    //
    std::string progress_bar_style;

    std::size_t terminal_columns = 80;

    // Prefix of message labels (YN0001, etc).
    //
    std::string label_prefix = "YN";

    // Colorize text if colors are enabled, return it unchanged otherwise.
    //
    std::string
    format (const std::string& text, text_style) const;

    // Sniff the environment and the terminal attached to stdout.
    //
    static configuration
    from_environment ();
  };
}
