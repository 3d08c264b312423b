#include <reporter/reporter-configuration.hxx>

#include <ctime>
#include <cstdlib>
#include <stdexcept>

#include <unistd.h>

#include <ftxui/screen/terminal.hpp>

using namespace std;

namespace reporter
{
  const vector<progress_bar_style>&
  progress_bar_styles ()
  {
    static const vector<progress_bar_style> r {
      {"patrick",    "🍀", "🌱", 40, 17, 3},
      {"simba",      "🌟", "✨", 40, 19, 7},
      {"jack",       "🎃", "🦇", 40, 31, 10},
      {"hogsfather", "🎉", "🎄", 40, 31, 12},
      {"default",    "=",  "-",  80, nullopt, nullopt}};

    return r;
  }

  const progress_bar_style&
  find_progress_bar_style (const string& n)
  {
    const string& k (n.empty () ? string ("default") : n);

    for (const auto& s: progress_bar_styles ())
      if (s.name == k)
        return s;

    throw invalid_argument ("invalid progress bar style '" + n + "'");
  }

  string
  default_progress_bar_style (const string& tp, int d, int m)
  {
    if (tp == "iTerm.app" || tp == "Apple_Terminal")
    {
      for (const auto& s: progress_bar_styles ())
      {
        if (s.day && s.month && *s.day == d && *s.month == m)
          return s.name;
      }
    }

    return "default";
  }

  string configuration::
  format (const string& t, text_style s) const
  {
    if (!enable_colors)
      return t;

    const char* c ("");
    switch (s)
    {
    case text_style::blue_bright:   c = "\x1b[94m"; break;
    case text_style::yellow_bright: c = "\x1b[93m"; break;
    case text_style::red_bright:    c = "\x1b[91m"; break;
    case text_style::grey:          c = "\x1b[90m"; break;
    case text_style::green:         c = "\x1b[32m"; break;
    }

    return c + t + "\x1b[39m";
  }

  // Return true if the variable is set to something other than empty or 0.
  //
  static bool
  env_set (const char* n)
  {
    const char* v (getenv (n));
    return v != nullptr && v[0] != '\0' && !(v[0] == '0' && v[1] == '\0');
  }

  configuration configuration::
  from_environment ()
  {
    configuration r;

    bool tty (isatty (STDOUT_FILENO) == 1);

    // Colors. NO_COLOR always wins, FORCE_COLOR overrides the TTY check, and
    // otherwise we want a terminal that understands at least the 16-color
    // palette.
    //
    if (getenv ("NO_COLOR") != nullptr)
      r.enable_colors = false;
    else if (env_set ("FORCE_COLOR"))
      r.enable_colors = true;
    else
      r.enable_colors = tty &&
        ftxui::Terminal::ColorSupport () != ftxui::Terminal::Color::Palette1;

    // Progress bars rewrite lines in place, which makes a mess of anything
    // that is not an interactive terminal (CI logs in particular).
    //
    r.enable_progress_bars = tty && !env_set ("CI");

    if (tty)
    {
      int w (ftxui::Terminal::Size ().dimx);
      if (w > 0)
        r.terminal_columns = static_cast<size_t> (w);
    }

    time_t t (time (nullptr));
    tm lt {};
    localtime_r (&t, &lt);

    const char* tp (getenv ("TERM_PROGRAM"));
    r.progress_bar_style = default_progress_bar_style (tp != nullptr ? tp : "",
                                                       lt.tm_mday,
                                                       lt.tm_mon + 1);
    return r;
  }
}
