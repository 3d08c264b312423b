#include <reporter/progress/progress-multiplexer.hxx>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

using namespace std;

namespace reporter
{
  void progress_handle::
  stop ()
  {
    if (r_ == nullptr || r_->stopped)
      return;

    r_->stopped = true;

    if (r_->owner != nullptr)
      r_->owner->remove (r_->token);
  }

  asio::awaitable<void> progress_handle::
  wait ()
  {
    if (r_ == nullptr || r_->finished)
      co_return;

    // Keep our own reference: the handle may be reassigned while we are
    // suspended.
    //
    shared_ptr<progress_registration> r (r_);

    try
    {
      co_await r->done.async_wait (asio::use_awaitable);
    }
    catch (const boost::system::system_error& e)
    {
      if (e.code () != asio::error::operation_aborted)
        throw;
    }
  }

  progress_multiplexer::
  ~progress_multiplexer ()
  {
    // Consumption loops can outlive us (they run until their source is
    // exhausted), so make sure they don't call back into a dead object.
    //
    for (const auto& p: registrations_)
    {
      if (shared_ptr<progress_registration> r = p.second.lock ())
        r->owner = nullptr;
    }
  }

  progress_handle progress_multiplexer::
  add (shared_ptr<progress_source> s)
  {
    // Drop the bookkeeping of loops that have since finished.
    //
    for (auto i (registrations_.begin ()); i != registrations_.end (); )
    {
      shared_ptr<progress_registration> r (i->second.lock ());

      if (r == nullptr || r->finished)
        i = registrations_.erase (i);
      else
        ++i;
    }

    // A second consumer would race the first one for the same values (and
    // the two would keep cancelling each other's wait).
    //
    auto i (registrations_.find (s.get ()));
    if (i != registrations_.end ())
      return progress_handle (i->second.lock ());

    progress_token t (next_token_++);

    auto r (make_shared<progress_registration> (ioc_, t, this));
    registrations_.emplace (s.get (), r);

    states_.emplace (t, progress_definition ());
    redraw_ ();

    asio::co_spawn (ioc_, consume (move (s), r), asio::detached);

    return progress_handle (move (r));
  }

  progress_multiplexer::rows_type progress_multiplexer::
  rows () const
  {
    rows_type r;
    r.reserve (states_.size ());

    for (const auto& p: states_)
      r.push_back (p.second);

    return r;
  }

  const progress_definition* progress_multiplexer::
  find (progress_token t) const
  {
    auto i (states_.find (t));
    return i != states_.end () ? &i->second : nullptr;
  }

  void progress_multiplexer::
  update (progress_token t, progress_definition d)
  {
    auto i (states_.find (t));
    if (i == states_.end ())
      return;

    // Sources are free to re-publish the same value (e.g., a counter that
    // ticks without moving the percentage). Don't redraw for nothing.
    //
    if (i->second == d)
      return;

    i->second = move (d);
    ++changes_;

    redraw_ ();
  }

  void progress_multiplexer::
  remove (progress_token t)
  {
    if (states_.erase (t) != 0)
      redraw_ ();
  }

  asio::awaitable<void> progress_multiplexer::
  consume (shared_ptr<progress_source> s, shared_ptr<progress_registration> r)
  {
    for (;;)
    {
      optional<progress_definition> d (co_await s->next ());

      if (!d)
        break;

      // Once detached we keep draining the source but ignore its values.
      //
      if (r->stopped || r->owner == nullptr)
        continue;

      r->owner->update (r->token, move (*d));
    }

    // Exhausted: same as an explicit stop (which may already have happened).
    //
    if (!r->stopped)
    {
      r->stopped = true;

      if (r->owner != nullptr)
        r->owner->remove (r->token);
    }

    r->finished = true;
    r->done.cancel ();
  }
}
