#pragma once

#include <reporter/progress/progress-types.hxx>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string>
#include <cstddef>
#include <optional>

namespace reporter
{
  namespace asio = boost::asio;

  // Asynchronous sequence of progress snapshots.
  //
  // The producer publishes with update() and signals the end with close().
  // Neither suspends. The (single) consumer pulls with next(), suspending
  // until something is published.
  //
  // There is no queue: a value that has not been consumed yet is replaced by
  // the next one. This is all a progress row needs (only the latest value is
  // ever drawn) and it means a fast producer cannot build up a backlog.
  // Values are never reordered.
  //
  class progress_source
  {
  public:
    explicit
    progress_source (asio::io_context& ioc)
      : signal_ (ioc)
    {
    }

    progress_source (const progress_source&) = delete;
    progress_source& operator= (const progress_source&) = delete;

    // Publish a snapshot. Ignored once closed.
    //
    void
    update (progress_definition d);

    void
    update (double progress, std::optional<std::string> title = std::nullopt)
    {
      update (progress_definition (progress, std::move (title)));
    }

    // Mark the sequence as exhausted. The consumer still receives a value
    // published before the close.
    //
    void
    close ();

    bool
    closed () const noexcept
    {
      return closed_;
    }

    // Wait for the next snapshot. Return nullopt once the sequence is closed
    // and drained.
    //
    asio::awaitable<std::optional<progress_definition>>
    next ();

  private:
    asio::steady_timer signal_;
    std::optional<progress_definition> pending_;
    bool closed_ {false};
  };

  // Counter-driven progress.
  //
  // Publishes n / max on each set() and closes the source once the counter
  // reaches max.
  //
  class progress_counter
  {
  public:
    progress_counter (std::shared_ptr<progress_source> s, std::size_t max);

    void
    set (std::size_t n);

    void
    tick (std::size_t n = 1)
    {
      set (current_ + n);
    }

    std::size_t
    current () const noexcept
    {
      return current_;
    }

    std::size_t
    max () const noexcept
    {
      return max_;
    }

  private:
    std::shared_ptr<progress_source> source_;
    std::size_t max_;
    std::size_t current_ {0};
  };
}
