#pragma once

#include <chrono>
#include <cstddef>

namespace reporter
{
  using clock_type = std::chrono::steady_clock;

  // What is currently on the terminal.
  //
  // active_rows is the number of progress rows drawn below the cursor's
  // "home" line, and timer_pending is true iff a frame is scheduled, which
  // in turn is the case iff active_rows is not 0.
  //
  struct render_state
  {
    std::size_t active_rows {0};
    std::size_t spinner_frame {0};
    clock_type::time_point last_frame {};
    bool timer_pending {false};
  };
}
