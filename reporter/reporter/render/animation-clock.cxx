#include <reporter/render/animation-clock.hxx>

#include <utility>

using namespace std;

namespace reporter
{
  void animation_clock::
  arm (function<void ()> f)
  {
    uint64_t g (++*generation_);
    weak_ptr<uint64_t> w (generation_);

    // Note that expires_after() cancels any outstanding wait, which is what
    // makes this a single slot.
    //
    timer_.expires_after (traits_type::frame_interval);
    state_.timer_pending = true;

    timer_.async_wait ([this, g, w, f = move (f)] (const boost::system::error_code& ec)
    {
      if (ec == asio::error::operation_aborted)
        return;

      shared_ptr<uint64_t> l (w.lock ());
      if (l == nullptr || *l != g)
        return;

      state_.timer_pending = false;
      f ();
    });
  }

  void animation_clock::
  cancel ()
  {
    ++*generation_;

    timer_.cancel ();
    state_.timer_pending = false;
  }

  const char* animation_clock::
  spinner (clock_type::time_point now) noexcept
  {
    const auto& fs (traits_type::spinner_frames);

    if (now - state_.last_frame > traits_type::spinner_interval)
    {
      state_.spinner_frame = (state_.spinner_frame + 1) % fs.size ();
      state_.last_frame = now;
    }

    return fs[state_.spinner_frame];
  }
}
