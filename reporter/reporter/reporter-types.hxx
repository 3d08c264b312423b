#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>

namespace reporter
{
  // Message names.
  //
  // Every diagnostic carries a stable numeric code so that users (and tools
  // grepping the output) can refer to a class of message independently of
  // its wording. The numbering is part of the output contract: never
  // renumber, only append.
  //
  enum class message_name: std::uint16_t
  {
    unnamed                 = 0,
    exception               = 1,
    missing_peer_dependency = 2,
    cyclic_dependencies     = 3,
    disabled_build_scripts  = 4,
    build_disabled          = 5,
    soft_link_build         = 6,
    must_build              = 7,
    must_rebuild            = 8,
    build_failed            = 9,
    resolver_not_found      = 10,
    fetcher_not_found       = 11,
    linker_not_found        = 12,
    fetch_not_cached        = 13
  };

  inline std::uint16_t
  message_code (message_name n) noexcept
  {
    return static_cast<std::uint16_t> (n);
  }

  // Diagnostic severity.
  //
  enum class severity
  {
    info,
    warning,
    error
  };

  std::ostream&
  operator<< (std::ostream&, severity);

  // Format the label of a message: the prefix followed by the code padded
  // to four digits (e.g., YN0013). An absent name is rendered as code 0.
  //
  std::string
  format_label (std::optional<message_name> name,
                const std::string& prefix = "YN");

  // Format the indentation prefix for the given nesting level.
  //
  std::string
  format_indent (std::size_t level);

  // Subject of a cache hit or miss.
  //
  // The reporter only counts these; the fields are for the caller's benefit.
  //
  struct locator
  {
    std::string scope;
    std::string name;
    std::string reference;

    locator () = default;

    locator (std::string s, std::string n, std::string r = "")
      : scope (std::move (s)),
        name (std::move (n)),
        reference (std::move (r))
    {
    }
  };

  // Exception that knows which message it should be reported under.
  //
  // When such an exception crosses a timed scope it is reported with its own
  // code rather than the generic message_name::exception.
  //
  class diagnostic_error: public std::runtime_error
  {
  public:
    diagnostic_error (message_name n, const std::string& what)
      : std::runtime_error (what),
        name_ (n)
    {
    }

    message_name
    name () const noexcept
    {
      return name_;
    }

  private:
    message_name name_;
  };
}
