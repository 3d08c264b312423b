#include <reporter/render/redraw-controller.hxx>

#include <cmath>
#include <algorithm>

#include <reporter/reporter-types.hxx>

using namespace std;

namespace reporter
{
  redraw_controller::
  redraw_controller (asio::io_context& ioc,
                     ostream& out,
                     const configuration& cfg,
                     bool structured,
                     row_provider rows)
    : out_ (out),
      config_ (cfg),
      style_ (find_progress_bar_style (cfg.progress_bar_style)),
      structured_ (structured),
      progress_bars_ (cfg.enable_progress_bars),
      rows_ (move (rows)),
      clock_ (ioc, state_)
  {
  }

  redraw_controller::
  ~redraw_controller ()
  {
    clock_.cancel ();
  }

  void redraw_controller::
  enable (bool v)
  {
    if (v == progress_bars_)
      return;

    if (!v)
    {
      // Take the rows off the screen while we still know how many there
      // are. From here on nothing is drawn, so nothing can be left behind.
      //
      string b;
      erase (b, state_.active_rows);
      clock_.cancel ();
      progress_bars_ = false;
      flush (b);
    }
    else
    {
      progress_bars_ = true;
      draw ();
    }
  }

  void redraw_controller::
  write_line (const string& l)
  {
    string b;
    erase (b, state_.active_rows);

    b += l;
    b += '\n';

    draw (b);
    flush (b);
  }

  void redraw_controller::
  write_lines (const vector<string>& ls, size_t n)
  {
    if (ls.empty ())
      return;

    string b;

    if (enabled ())
    {
      erase (b, state_.active_rows + n);

      for (const string& l: ls)
      {
        b += l;
        b += '\n';
      }

      draw (b);
    }
    else
    {
      b += ls.back ();
      b += '\n';
    }

    flush (b);
  }

  void redraw_controller::
  refresh ()
  {
    string b;
    erase (b, state_.active_rows);
    draw (b);
    flush (b);
  }

  void redraw_controller::
  erase (size_t n)
  {
    string b;
    erase (b, n);
    flush (b);
  }

  void redraw_controller::
  draw ()
  {
    string b;
    draw (b);
    flush (b);
  }

  void redraw_controller::
  erase (string& b, size_t n)
  {
    if (!enabled () || n == 0)
      return;

    // Cursor up n lines, then clear from the cursor to the end of the
    // screen.
    //
    b += "\x1b[";
    b += to_string (n);
    b += "A\x1b[0J";

    // Whatever rows there were are gone now.
    //
    state_.active_rows = 0;
  }

  void redraw_controller::
  draw (string& b)
  {
    clock_.cancel ();

    if (!enabled ())
      return;

    rows_type rs (rows_ ());

    if (rs.empty ())
    {
      state_.active_rows = 0;
      return;
    }

    const char* s (clock_.spinner (clock_type::now ()));

    for (const progress_definition& r: rs)
    {
      b += format_row (r, s);
      b += '\n';
    }

    state_.active_rows = rs.size ();
    ++frames_;

    // Keep animating for as long as there is something on the screen.
    //
    clock_.arm ([this] {refresh ();});
  }

  void redraw_controller::
  flush (const string& b)
  {
    if (b.empty ())
      return;

    out_ << b;
    out_.flush ();
  }

  size_t redraw_controller::
  bar_width () const noexcept
  {
    // Width of the row prefix, measured against the widest line prefix
    // (marker, label, and the opening of a timed scope: `➤ YN0000: ┌ `).
    //
    long p (static_cast<long> (config_.label_prefix.size ()) + 10);
    long c (static_cast<long> (config_.terminal_columns));

    long w (min (c - p, 80L));
    if (w <= 0)
      return 0;

    return static_cast<size_t> (style_.size * w / 80);
  }

  string redraw_controller::
  format_row (const progress_definition& d, const char* s) const
  {
    size_t w (bar_width ());

    // Clamp so that a misbehaving source can't make the bar overflow.
    //
    double p (clamp (d.progress, 0.0, 1.0));
    if (std::isnan (p))
      p = 0.0;

    size_t f (static_cast<size_t> (floor (static_cast<double> (w) * p)));
    f = min (f, w);

    string r (config_.format ("➤", text_style::blue_bright));
    r += ' ';
    r += config_.format (format_label (nullopt, config_.label_prefix),
                         text_style::grey);
    r += ": ";
    r += s;
    r += ' ';

    for (size_t i (0); i < f; ++i)
      r += style_.done;

    for (size_t i (f); i < w; ++i)
      r += style_.todo;

    return r;
  }
}
