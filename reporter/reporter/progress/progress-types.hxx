#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <utility>

namespace reporter
{
  // Progress snapshot as produced by a progress source.
  //
  struct progress_definition
  {
    double progress {0.0};             // Fraction in [0, 1]
    std::optional<std::string> title;

    progress_definition () = default;

    explicit
    progress_definition (double p, std::optional<std::string> t = std::nullopt)
      : progress (p), title (std::move (t))
    {
    }
  };

  // Note that we compare the progress exactly: the point is to skip a redraw
  // when a source re-publishes the very same value, not to detect "close
  // enough" changes.
  //
  inline bool
  operator== (const progress_definition& x, const progress_definition& y)
  {
    return x.progress == y.progress && x.title == y.title;
  }

  inline bool
  operator!= (const progress_definition& x, const progress_definition& y)
  {
    return !(x == y);
  }

  // Registration token.
  //
  // Issued by the multiplexer on registration and increasing, so ordering by
  // token is ordering by registration.
  //
  using progress_token = std::uint64_t;
}
