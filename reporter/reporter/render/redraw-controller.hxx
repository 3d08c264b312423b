#pragma once

#include <reporter/reporter-configuration.hxx>
#include <reporter/progress/progress-types.hxx>
#include <reporter/render/render-state.hxx>
#include <reporter/render/animation-clock.hxx>

#include <boost/asio.hpp>

#include <string>
#include <vector>
#include <cstddef>
#include <ostream>
#include <functional>

namespace reporter
{
  namespace asio = boost::asio;

  // Owner of the output stream.
  //
  // Live progress rows are kept as a contiguous block at the bottom of the
  // output, with the cursor always left directly below the last row (or at
  // the start of a fresh line if there are no rows). Every write goes through
  // here so that the block can be erased before and redrawn after, which is
  // what keeps ordinary output from being interleaved with (or overwritten
  // by) the rows.
  //
  // In structured mode, or with progress bars disabled, we never emit a
  // control sequence: erase() and draw() do nothing and lines are written
  // as is.
  //
  class redraw_controller
  {
  public:
    using rows_type = std::vector<progress_definition>;

    // Supplies the rows to draw, in display order.
    //
    using row_provider = std::function<rows_type ()>;

    redraw_controller (asio::io_context& ioc,
                       std::ostream& out,
                       const configuration& cfg,
                       bool structured,
                       row_provider rows);

    ~redraw_controller ();

    redraw_controller (const redraw_controller&) = delete;
    redraw_controller& operator= (const redraw_controller&) = delete;

    // Whether rows are rendered.
    //
    bool
    enabled () const noexcept
    {
      return progress_bars_ && !structured_;
    }

    // Turn row rendering on or off mid-session. Turning it off erases the
    // rows currently drawn; turning it on draws them.
    //
    void
    enable (bool);

    // Write one line: erase the rows, write, redraw.
    //
    void
    write_line (const std::string& line);

    // Rewrite a block of lines: erase the rows together with the
    // `overwritten` lines printed just above them, write the block, redraw.
    //
    // Without row rendering we cannot move the cursor, so only the last line
    // of the block (the one not printed yet) is written.
    //
    void
    write_lines (const std::vector<std::string>& lines,
                 std::size_t overwritten);

    // Erase and redraw the rows.
    //
    void
    refresh ();

    // Move the cursor up n lines and clear to the end of the screen.
    //
    void
    erase (std::size_t n);

    // Draw the rows below the cursor and schedule the next frame.
    //
    void
    draw ();

    // Width of the bar part of a row, in glyphs.
    //
    std::size_t
    bar_width () const noexcept;

    std::string
    format_row (const progress_definition&, const char* spinner) const;

    const render_state&
    state () const noexcept
    {
      return state_;
    }

    // Number of frames drawn so far.
    //
    std::size_t
    frames () const noexcept
    {
      return frames_;
    }

  private:
    void
    erase (std::string& buf, std::size_t n);

    void
    draw (std::string& buf);

    void
    flush (const std::string& buf);

    std::ostream& out_;
    const configuration& config_;
    const progress_bar_style& style_;
    bool structured_;
    bool progress_bars_;
    row_provider rows_;

    render_state state_;
    animation_clock clock_;
    std::size_t frames_ {0};
  };
}
