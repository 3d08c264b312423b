#include <reporter/progress/progress-source.hxx>

#include <algorithm>

#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace reporter
{
  void progress_source::
  update (progress_definition d)
  {
    if (closed_)
      return;

    pending_ = move (d);

    // Wake up the consumer if it is parked in next(). If it is not, the
    // cancel is a no-op and it will find the value on its next call.
    //
    signal_.cancel ();
  }

  void progress_source::
  close ()
  {
    if (closed_)
      return;

    closed_ = true;
    signal_.cancel ();
  }

  asio::awaitable<optional<progress_definition>> progress_source::
  next ()
  {
    // The timer is used as an event: it never expires on its own and we are
    // woken up by update() or close() cancelling the wait.
    //
    while (!pending_ && !closed_)
    {
      signal_.expires_at (asio::steady_timer::time_point::max ());

      try
      {
        co_await signal_.async_wait (asio::use_awaitable);
      }
      catch (const boost::system::system_error& e)
      {
        if (e.code () != asio::error::operation_aborted)
          throw;
      }
    }

    if (pending_)
    {
      optional<progress_definition> r (move (pending_));
      pending_.reset ();
      co_return r;
    }

    co_return nullopt;
  }

  progress_counter::
  progress_counter (shared_ptr<progress_source> s, size_t m)
    : source_ (move (s)),
      max_ (m)
  {
    // Nothing to count, so we are done before we started.
    //
    if (max_ == 0)
      source_->close ();
  }

  void progress_counter::
  set (size_t n)
  {
    if (source_->closed ())
      return;

    current_ = n;

    double p (static_cast<double> (min (current_, max_)) /
              static_cast<double> (max_));

    source_->update (progress_definition (p));

    if (current_ >= max_)
      source_->close ();
  }
}
