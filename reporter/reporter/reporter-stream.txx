#include <utility>

namespace reporter
{
  template <typename F>
  auto stream_report::
  start_timer_sync (const std::string& what, F&& f) -> decltype (f ())
  {
    using result_type = decltype (f ());

    clock_type::time_point b (open_timer (what));

    // The scope is always closed, and closed after the failure (if any) was
    // reported, so that the error shows up inside the scope it came from.
    //
    std::exception_ptr e;

    if constexpr (std::is_void_v<result_type>)
    {
      try
      {
        f ();
      }
      catch (...)
      {
        e = std::current_exception ();
        report_exception_once (e);
      }

      close_timer (b);

      if (e)
        std::rethrow_exception (e);
    }
    else
    {
      std::optional<result_type> r;

      try
      {
        r.emplace (f ());
      }
      catch (...)
      {
        e = std::current_exception ();
        report_exception_once (e);
      }

      close_timer (b);

      if (e)
        std::rethrow_exception (e);

      return std::move (*r);
    }
  }

  template <typename F>
  auto stream_report::
  start_timer (std::string what, F f) -> std::invoke_result_t<F&>
  {
    using result_type = typename std::invoke_result_t<F&>::value_type;

    clock_type::time_point b (open_timer (what));

    // Note that we cannot co_await in a handler, which is one more reason
    // to carry the exception out of it.
    //
    std::exception_ptr e;

    if constexpr (std::is_void_v<result_type>)
    {
      try
      {
        co_await f ();
      }
      catch (...)
      {
        e = std::current_exception ();
        report_exception_once (e);
      }

      close_timer (b);

      if (e)
        std::rethrow_exception (e);
    }
    else
    {
      std::optional<result_type> r;

      try
      {
        r.emplace (co_await f ());
      }
      catch (...)
      {
        e = std::current_exception ();
        report_exception_once (e);
      }

      close_timer (b);

      if (e)
        std::rethrow_exception (e);

      co_return std::move (*r);
    }
  }
}
