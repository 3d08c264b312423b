#pragma once

#include <reporter/render/render-state.hxx>

#include <utility> // Needed by boost/asio/awaitable.hpp (1.74).

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <memory>
#include <cstdint>
#include <functional>

namespace reporter
{
  namespace asio = boost::asio;

  // Animation clock traits.
  //
  struct animation_clock_traits
  {
    // Redraw interval (~60 frames per second).
    //
    static constexpr std::chrono::milliseconds frame_interval {1000 / 60};

    // Spinner rotation interval. This is deliberately decoupled from the
    // frame interval: we redraw often so that progress moves smoothly but
    // rotate at a readable pace.
    //
    static constexpr std::chrono::milliseconds spinner_interval {80};

    static constexpr std::array<const char*, 10> spinner_frames {
      "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
  };

  // Single-slot frame scheduler.
  //
  // At most one frame is ever scheduled: arming replaces whatever was
  // scheduled before. The owner re-arms from the frame callback while there
  // is something to animate and simply doesn't otherwise, so there is no idle
  // ticking.
  //
  class animation_clock
  {
  public:
    using traits_type = animation_clock_traits;

    animation_clock (asio::io_context& ioc, render_state& s)
      : timer_ (ioc),
        state_ (s),
        generation_ (std::make_shared<std::uint64_t> (0))
    {
    }

    animation_clock (const animation_clock&) = delete;
    animation_clock& operator= (const animation_clock&) = delete;

    // Schedule f to run one frame interval from now, replacing the
    // currently scheduled frame, if any.
    //
    void
    arm (std::function<void ()> f);

    // Drop the scheduled frame, if any.
    //
    void
    cancel ();

    bool
    pending () const noexcept
    {
      return state_.timer_pending;
    }

    // Return the spinner glyph for a frame drawn at `now`, advancing it if
    // the spinner interval has elapsed since the last advance.
    //
    const char*
    spinner (clock_type::time_point now) noexcept;

  private:
    asio::steady_timer timer_;
    render_state& state_;

    // Bumped on every arm/cancel. A handler only runs its callback if the
    // generation it was armed with is still current (a cancel cannot recall
    // a completion that is already queued). Shared so that a handler that
    // outlives us can tell.
    //
    std::shared_ptr<std::uint64_t> generation_;
  };
}
