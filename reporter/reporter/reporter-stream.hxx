#pragma once

#include <reporter/reporter-types.hxx>
#include <reporter/reporter-configuration.hxx>
#include <reporter/events/forgettable-buffer.hxx>
#include <reporter/progress/progress-source.hxx>
#include <reporter/progress/progress-multiplexer.hxx>
#include <reporter/render/redraw-controller.hxx>
#include <reporter/summary/summary.hxx>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>

#include <string>
#include <vector>
#include <memory>
#include <ostream>
#include <optional>
#include <exception>
#include <functional>
#include <type_traits>
#include <unordered_set>

namespace reporter
{
  namespace asio = boost::asio;

  // Report options.
  //
  // The include_* flags default to include_logs which itself defaults to
  // !json. Errors are always shown.
  //
  struct report_options
  {
    bool json {false};
    bool include_footer {true};
    std::optional<bool> include_logs;
    std::optional<bool> include_infos;
    std::optional<bool> include_warnings;
  };

  // Report lifecycle.
  //
  enum class report_phase
  {
    created,    // Nothing reported yet
    active,     // Accepting events and progress sources
    finalizing, // Writing the summary
    closed      // Done
  };

  std::ostream&
  operator<< (std::ostream&, report_phase);

  // Streaming diagnostics reporter.
  //
  // Turns info/warning/error events, timed scopes, and any number of live
  // progress sources into either a human-readable terminal view or one JSON
  // record per event.
  //
  // Everything, including the progress consumption loops and the animation,
  // runs on the io_context passed at construction, which must be driven by
  // a single thread. The output stream is ours alone for the lifetime of the
  // report.
  //
  class stream_report
  {
  public:
    using callback_type = std::function<asio::awaitable<void> (stream_report&)>;

    stream_report (asio::io_context& ioc,
                   std::ostream& out,
                   configuration cfg,
                   report_options opts = report_options ());

    stream_report (const stream_report&) = delete;
    stream_report& operator= (const stream_report&) = delete;

    // Create a report, run the callback, and finalize. An exception escaping
    // the callback is reported (once) rather than propagated; consult
    // exit_code() on the returned report.
    //
    static asio::awaitable<std::unique_ptr<stream_report>>
    start (asio::io_context& ioc,
           std::ostream& out,
           configuration cfg,
           report_options opts,
           callback_type cb);

    // True iff at least one error was reported. Errors are never "undone".
    //
    bool
    has_errors () const noexcept
    {
      return counters_.errors > 0;
    }

    int
    exit_code () const noexcept
    {
      return has_errors () ? 1 : 0;
    }

    void
    report_cache_hit (const locator&);

    void
    report_cache_miss (const locator&);

    // Run f as a timed scope: announce it, indent everything reported from
    // within, and print the elapsed time when it returns. An exception
    // thrown by f is reported as an error (once, even if it crosses several
    // scopes) and then rethrown.
    //
    template <typename F>
    auto
    start_timer_sync (const std::string& what, F&& f) -> decltype (f ());

    // As above but for a coroutine: f returns asio::awaitable<R>.
    //
    template <typename F>
    auto
    start_timer (std::string what, F f) -> std::invoke_result_t<F&>;

    // Blank line at the top level, empty info when nested.
    //
    void
    report_separator ();

    void
    report_info (std::optional<message_name>, const std::string& text);

    void
    report_warning (message_name, const std::string& text);

    void
    report_error (message_name, const std::string& text);

    // Report only the first time the key (the text by default) is seen.
    //
    void
    report_info_once (std::optional<message_name>,
                      const std::string& text,
                      std::optional<std::string> key = std::nullopt);

    void
    report_warning_once (message_name,
                         const std::string& text,
                         std::optional<std::string> key = std::nullopt);

    void
    report_error_once (message_name,
                       const std::string& text,
                       std::optional<std::string> key = std::nullopt);

    // Report an exception as an error unless this very exception object was
    // already reported.
    //
    void
    report_exception_once (std::exception_ptr);

    // Register a progress source and show it as a live row until it is
    // exhausted or the returned handle is stopped.
    //
    progress_handle
    report_progress (std::shared_ptr<progress_source>);

    // Emit a raw record (structured mode only, ignored otherwise).
    //
    void
    report_json (const boost::json::value&);

    // Write the summary line (unless disabled by include_footer). Calling it
    // again is a no-op. Never throws.
    //
    void
    finalize () noexcept;

    // Turn progress row rendering on or off mid-session.
    //
    void
    enable_progress_bars (bool v)
    {
      redraw_.enable (v);
    }

    const report_counters&
    counters () const noexcept
    {
      return counters_;
    }

    std::size_t
    indent () const noexcept
    {
      return indent_;
    }

    report_phase
    phase () const noexcept
    {
      return phase_;
    }

    bool
    json () const noexcept
    {
      return json_;
    }

    const progress_multiplexer&
    progress () const noexcept
    {
      return progress_;
    }

    const redraw_controller&
    redraw () const noexcept
    {
      return redraw_;
    }

    const forgettable_buffer&
    forgettable () const noexcept
    {
      return forgettable_;
    }

    // Whether messages with this name are collapsed into the forgettable
    // window.
    //
    static bool
    is_forgettable (std::optional<message_name>) noexcept;

  private:
    clock_type::time_point
    open_timer (const std::string& what);

    void
    close_timer (clock_type::time_point before);

    // Write an info/warning/error without touching the counters.
    //
    void
    emit (severity, std::optional<message_name>, const std::string& text);

    std::string
    format_name (std::optional<message_name>) const;

    std::string
    format_line (text_style,
                 std::optional<message_name>,
                 const std::string& text) const;

    void
    write_line (const std::string&);

    void
    write_line_with_forgettable_reset (const std::string&);

    void
    write_record (severity,
                  std::optional<message_name>,
                  const std::string& text);

    void
    activate () noexcept
    {
      if (phase_ == report_phase::created)
        phase_ = report_phase::active;
    }

    configuration config_;

    bool json_;
    bool include_footer_;
    bool include_infos_;
    bool include_warnings_;

    report_counters counters_;
    clock_type::time_point start_time_;
    std::size_t indent_ {0};
    report_phase phase_ {report_phase::created};

    std::unordered_set<std::string> reported_infos_;
    std::unordered_set<std::string> reported_warnings_;
    std::unordered_set<std::string> reported_errors_;
    std::vector<std::exception_ptr> reported_exceptions_;

    forgettable_buffer forgettable_;
    redraw_controller redraw_;
    progress_multiplexer progress_;
  };
}

#include <reporter/reporter-stream.txx>
