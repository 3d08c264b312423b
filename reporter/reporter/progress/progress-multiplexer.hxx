#pragma once

#include <reporter/progress/progress-types.hxx>
#include <reporter/progress/progress-source.hxx>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <map>
#include <memory>
#include <vector>
#include <cstddef>
#include <functional>

namespace reporter
{
  namespace asio = boost::asio;

  class progress_multiplexer;

  // Per-registration bookkeeping shared between the multiplexer, the
  // consumption loop, and the handle returned to the caller.
  //
  struct progress_registration
  {
    progress_token token;

    // Reset when the multiplexer goes away before the source is exhausted.
    //
    progress_multiplexer* owner;

    bool stopped {false};  // Detached (stop() or exhaustion)
    bool finished {false}; // Consumption loop has returned

    // Completion signal. Never expires, cancelled when finished.
    //
    asio::steady_timer done;

    progress_registration (asio::io_context& ioc,
                           progress_token t,
                           progress_multiplexer* o)
      : token (t),
        owner (o),
        done (ioc, asio::steady_timer::time_point::max ())
    {
    }
  };

  // Handle to a registered progress source.
  //
  // Stopping only detaches the row: the source keeps being drained (its
  // production is not ours to cancel), its values are just ignored. Waiting
  // completes when the source is exhausted, whether stopped or not.
  //
  class progress_handle
  {
  public:
    progress_handle () = default;

    explicit
    progress_handle (std::shared_ptr<progress_registration> r)
      : r_ (std::move (r))
    {
    }

    // Idempotent.
    //
    void
    stop ();

    bool
    stopped () const noexcept
    {
      return r_ == nullptr || r_->stopped;
    }

    bool
    finished () const noexcept
    {
      return r_ == nullptr || r_->finished;
    }

    progress_token
    token () const noexcept
    {
      return r_ != nullptr ? r_->token : 0;
    }

    asio::awaitable<void>
    wait ();

  private:
    std::shared_ptr<progress_registration> r_;
  };

  // Tracks the latest value of every registered progress source.
  //
  // Each source is consumed by its own coroutine on the io_context. Since
  // everything runs on that one context, the loops only interleave at their
  // co_await points and the state map needs no synchronization. We request a
  // redraw whenever the set of rows or a row's value actually changes.
  //
  class progress_multiplexer
  {
  public:
    using rows_type = std::vector<progress_definition>;
    using redraw_function = std::function<void ()>;

    progress_multiplexer (asio::io_context& ioc, redraw_function redraw)
      : ioc_ (ioc),
        redraw_ (std::move (redraw))
    {
    }

    ~progress_multiplexer ();

    progress_multiplexer (const progress_multiplexer&) = delete;
    progress_multiplexer& operator= (const progress_multiplexer&) = delete;

    // Register a source and start consuming it. The row appears (empty)
    // right away.
    //
    // A source has a single consumer, so registering one that is still being
    // consumed returns the existing handle instead.
    //
    progress_handle
    add (std::shared_ptr<progress_source> s);

    // Latest values in registration order.
    //
    rows_type
    rows () const;

    const progress_definition*
    find (progress_token t) const;

    std::size_t
    size () const noexcept
    {
      return states_.size ();
    }

    bool
    empty () const noexcept
    {
      return states_.empty ();
    }

    // Number of value changes seen (repeated values don't count).
    //
    std::size_t
    changes () const noexcept
    {
      return changes_;
    }

  private:
    friend class progress_handle;

    void
    update (progress_token t, progress_definition d);

    void
    remove (progress_token t);

    static asio::awaitable<void>
    consume (std::shared_ptr<progress_source> s,
             std::shared_ptr<progress_registration> r);

    asio::io_context& ioc_;
    redraw_function redraw_;

    progress_token next_token_ {1};
    std::map<progress_token, progress_definition> states_;
    std::map<const progress_source*,
             std::weak_ptr<progress_registration>> registrations_;
    std::size_t changes_ {0};
  };
}
