#include <reporter/reporter-stream.hxx>

#include <iostream>
#include <algorithm>

#include <reporter/events/event-record.hxx>

using namespace std;

namespace reporter
{
  ostream&
  operator<< (ostream& os, report_phase p)
  {
    switch (p)
    {
    case report_phase::created:    return os << "created";
    case report_phase::active:     return os << "active";
    case report_phase::finalizing: return os << "finalizing";
    case report_phase::closed:     return os << "closed";
    }
    return os;
  }

  stream_report::
  stream_report (asio::io_context& ioc,
                 ostream& out,
                 configuration cfg,
                 report_options o)
    : config_ (move (cfg)),
      json_ (o.json),
      include_footer_ (o.include_footer),
      include_infos_ (o.include_infos.value_or (
                        o.include_logs.value_or (!o.json))),
      include_warnings_ (o.include_warnings.value_or (
                           o.include_logs.value_or (!o.json))),
      start_time_ (clock_type::now ()),
      redraw_ (ioc,
               out,
               config_,
               o.json,
               [this] {return progress_.rows ();}),
      progress_ (ioc, [this] {redraw_.refresh ();})
  {
  }

  asio::awaitable<unique_ptr<stream_report>> stream_report::
  start (asio::io_context& ioc,
         ostream& out,
         configuration cfg,
         report_options o,
         callback_type cb)
  {
    auto r (make_unique<stream_report> (ioc, out, move (cfg), move (o)));

    exception_ptr e;

    try
    {
      co_await cb (*r);
    }
    catch (...)
    {
      e = current_exception ();
    }

    // Whatever went wrong is now an error on the report, which is where the
    // caller is expected to look (exit_code()).
    //
    if (e)
      r->report_exception_once (e);

    r->finalize ();
    co_return r;
  }

  bool stream_report::
  is_forgettable (optional<message_name> n) noexcept
  {
    return n && *n == message_name::fetch_not_cached;
  }

  void stream_report::
  report_cache_hit (const locator&)
  {
    activate ();
    ++counters_.cache_hits;
  }

  void stream_report::
  report_cache_miss (const locator&)
  {
    activate ();
    ++counters_.cache_misses;
  }

  clock_type::time_point stream_report::
  open_timer (const string& what)
  {
    report_info (nullopt, "┌ " + what);

    ++indent_;
    return clock_type::now ();
  }

  void stream_report::
  close_timer (clock_type::time_point b)
  {
    auto e (chrono::duration_cast<chrono::milliseconds> (
              clock_type::now () - b));

    if (indent_ > 0)
      --indent_;

    if (config_.enable_timers)
      report_info (nullopt, "└ Completed in " + format_timing (e));
    else
      report_info (nullopt, "└ Completed");
  }

  void stream_report::
  report_separator ()
  {
    activate ();

    // A blank line would not be a record.
    //
    if (json_)
      return;

    if (indent_ == 0)
      write_line_with_forgettable_reset ("");
    else
      report_info (nullopt, "");
  }

  void stream_report::
  report_info (optional<message_name> n, const string& t)
  {
    activate ();
    emit (severity::info, n, t);
  }

  void stream_report::
  report_warning (message_name n, const string& t)
  {
    activate ();
    ++counters_.warnings;
    emit (severity::warning, n, t);
  }

  void stream_report::
  report_error (message_name n, const string& t)
  {
    activate ();
    ++counters_.errors;
    emit (severity::error, n, t);
  }

  void stream_report::
  report_info_once (optional<message_name> n,
                    const string& t,
                    optional<string> k)
  {
    if (reported_infos_.insert (k ? move (*k) : t).second)
      report_info (n, t);
  }

  void stream_report::
  report_warning_once (message_name n, const string& t, optional<string> k)
  {
    if (reported_warnings_.insert (k ? move (*k) : t).second)
      report_warning (n, t);
  }

  void stream_report::
  report_error_once (message_name n, const string& t, optional<string> k)
  {
    if (reported_errors_.insert (k ? move (*k) : t).second)
      report_error (n, t);
  }

  void stream_report::
  report_exception_once (exception_ptr e)
  {
    if (e == nullptr)
      return;

    // The same exception object can reach us several times, typically on
    // its way out through nested timed scopes. exception_ptr equality is
    // object identity.
    //
    if (find (reported_exceptions_.begin (),
              reported_exceptions_.end (),
              e) != reported_exceptions_.end ())
      return;

    reported_exceptions_.push_back (e);

    try
    {
      rethrow_exception (e);
    }
    catch (const diagnostic_error& x)
    {
      report_error (x.name (), x.what ());
    }
    catch (const exception& x)
    {
      report_error (message_name::exception, x.what ());
    }
    catch (...)
    {
      report_error (message_name::exception, "unknown exception");
    }
  }

  progress_handle stream_report::
  report_progress (shared_ptr<progress_source> s)
  {
    activate ();
    return progress_.add (move (s));
  }

  void stream_report::
  report_json (const boost::json::value& v)
  {
    if (json_)
      write_line_with_forgettable_reset (boost::json::serialize (v));
  }

  void stream_report::
  finalize () noexcept
  {
    if (phase_ == report_phase::finalizing || phase_ == report_phase::closed)
      return;

    phase_ = report_phase::finalizing;

    // Note that we don't stop the progress sources that are still running:
    // they are the caller's, and their rows go away as they complete.
    //
    try
    {
      if (include_footer_)
      {
        auto e (chrono::duration_cast<chrono::milliseconds> (
                  clock_type::now () - start_time_));

        emit (summary_severity (counters_),
              message_name::unnamed,
              format_summary (counters_, e, config_.enable_timers));
      }
    }
    catch (const exception& x)
    {
      cerr << "error: unable to write summary: " << x.what () << endl;
    }

    phase_ = report_phase::closed;
  }

  void stream_report::
  emit (severity s, optional<message_name> n, const string& t)
  {
    switch (s)
    {
    case severity::info:
      {
        if (!include_infos_)
          return;

        if (json_)
        {
          write_record (s, n, t);
          return;
        }

        if (!is_forgettable (n))
        {
          write_line_with_forgettable_reset (
            format_line (text_style::blue_bright, n, t));
          return;
        }

        // The window keeps the bare text: a rewrite formats every line
        // afresh, with the current name and indentation.
        //
        auto r (forgettable_.push (t));

        if (r.rewrite)
        {
          vector<string> ls;
          ls.reserve (forgettable_.size ());

          for (const string& l: forgettable_.lines ())
            ls.push_back (format_line (text_style::blue_bright, n, l));

          redraw_.write_lines (ls, r.overwritten);
        }
        else
          write_line (format_line (text_style::blue_bright, n, t));

        break;
      }
    case severity::warning:
      {
        if (!include_warnings_)
          return;

        if (json_)
          write_record (s, n, t);
        else
          write_line_with_forgettable_reset (
            format_line (text_style::yellow_bright, n, t));

        break;
      }
    case severity::error:
      {
        // Errors are shown no matter what.
        //
        if (json_)
          write_record (s, n, t);
        else
          write_line_with_forgettable_reset (
            format_line (text_style::red_bright, n, t));

        break;
      }
    }
  }

  string stream_report::
  format_name (optional<message_name> n) const
  {
    string l (format_label (n, config_.label_prefix));

    // Unnamed messages are just noise as far as the label goes, so we tone
    // it down.
    //
    if (!json_ && !n)
      return config_.format (l, text_style::grey);

    return l;
  }

  string stream_report::
  format_line (text_style s, optional<message_name> n, const string& t) const
  {
    string r (config_.format ("➤", s));
    r += ' ';
    r += format_name (n);
    r += ": ";
    r += format_indent (indent_);
    r += t;
    return r;
  }

  void stream_report::
  write_line (const string& l)
  {
    redraw_.write_line (l);
  }

  void stream_report::
  write_line_with_forgettable_reset (const string& l)
  {
    // An ordinary line ends the run of forgettable ones: they stay on the
    // screen as they are and the window starts afresh below this line.
    //
    forgettable_.reset ();
    write_line (l);
  }

  void stream_report::
  write_record (severity s, optional<message_name> n, const string& t)
  {
    event_record r;
    r.type = s;
    r.name = n;
    r.display_name = format_name (n);
    r.indent = format_indent (indent_);
    r.data = t;

    write_line_with_forgettable_reset (serialize_record (r));
  }
}
