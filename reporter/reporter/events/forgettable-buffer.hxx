#pragma once

#include <deque>
#include <string>
#include <cstddef>

namespace reporter
{
  // Forgettable buffer traits.
  //
  template <typename S = std::string>
  struct forgettable_buffer_traits
  {
    using string_type = S;

    // Maximum number of forgettable lines kept on the screen.
    //
    static constexpr std::size_t capacity = 5;
  };

  // Sliding window over the most recent forgettable lines.
  //
  // Forgettable lines are high-frequency notices (think "fetching X" for
  // every package) that are only interesting while they are happening. We
  // keep the last few visible and, once the window is full, overwrite it in
  // place instead of letting them scroll everything else off the screen.
  //
  // The buffer only does the bookkeeping; push() tells the caller what to
  // do with the terminal.
  //
  template <typename T = forgettable_buffer_traits<>>
  class basic_forgettable_buffer
  {
  public:
    using traits_type = T;
    using string_type = typename traits_type::string_type;
    using lines_type = std::deque<string_type>;

    // What to do after a push.
    //
    struct push_result
    {
      // If false, print the pushed line as usual. If true, rewrite the
      // whole window (lines()) over the `overwritten` lines printed before.
      //
      bool rewrite {false};
      std::size_t overwritten {0};
    };

    explicit
    basic_forgettable_buffer (std::size_t capacity = traits_type::capacity)
      : capacity_ (capacity)
    {
    }

    push_result
    push (string_type line);

    // Forget the history. The lines stay on the screen, they just won't be
    // overwritten anymore.
    //
    void
    reset () noexcept;

    const lines_type&
    lines () const noexcept
    {
      return lines_;
    }

    std::size_t
    size () const noexcept
    {
      return lines_.size ();
    }

    bool
    empty () const noexcept
    {
      return lines_.empty ();
    }

    std::size_t
    capacity () const noexcept
    {
      return capacity_;
    }

    // Number of forgettable lines currently on the screen, directly above
    // the progress rows.
    //
    std::size_t
    printed () const noexcept
    {
      return printed_;
    }

  private:
    std::size_t capacity_;
    lines_type lines_;
    std::size_t printed_ {0};
  };

  using forgettable_buffer = basic_forgettable_buffer<>;
}

#include <reporter/events/forgettable-buffer.txx>
