#include <reporter/reporter-stream.hxx>
#include <reporter/events/event-record.hxx>

#include <cassert>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <stdexcept>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>

using namespace std;
using namespace reporter;

// Plain output: no colors, no rows, no timings (so that lines are
// predictable).
//
static configuration
make_config (bool bars = false)
{
  configuration c;
  c.enable_colors = false;
  c.enable_timers = false;
  c.enable_progress_bars = bars;
  c.terminal_columns = 92;
  return c;
}

static void
drain (asio::io_context& ioc)
{
  ioc.restart ();
  ioc.poll ();
}

static vector<string>
split (const string& s)
{
  vector<string> r;
  istringstream i (s);
  for (string l; getline (i, l); )
    r.push_back (l);
  return r;
}

static size_t
count (const string& s, const string& x)
{
  size_t r (0);
  for (size_t p (s.find (x)); p != string::npos; p = s.find (x, p + x.size ()))
    ++r;
  return r;
}

static void
test_lines ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  assert (r.phase () == report_phase::created);

  r.report_info (nullopt, "hello");
  r.report_warning (message_name::missing_peer_dependency, "careful");
  r.report_error (message_name::build_failed, "boom");

  assert (r.phase () == report_phase::active);
  assert (o.str () == "➤ YN0000: hello\n"
                      "➤ YN0002: careful\n"
                      "➤ YN0009: boom\n");

  assert (r.counters ().warnings == 1);
  assert (r.counters ().errors == 1);
}

// One JSON record per line and never a control sequence, even with
// progress bars enabled and a source registered.
//
static void
test_structured ()
{
  asio::io_context ioc;
  ostringstream o;

  report_options ro;
  ro.json = true;
  ro.include_warnings = true;

  stream_report r (ioc, o, make_config (true), ro);

  auto s (make_shared<progress_source> (ioc));
  progress_handle h (r.report_progress (s));
  s->update (0.5);
  drain (ioc);

  r.report_warning (message_name::missing_peer_dependency, "no peer");

  vector<string> ls (split (o.str ()));
  assert (ls.size () == 1);

  event_record e (parse_record (ls[0]));
  assert (e.type == severity::warning);
  assert (e.name && *e.name == message_name::missing_peer_dependency);
  assert (e.display_name == "YN0002");
  assert (e.indent == "");
  assert (e.data == "no peer");

  r.report_json (boost::json::object {{"custom", 1}});
  assert (split (o.str ()).back () == R"({"custom":1})");

  // A separator is not a record.
  //
  r.report_separator ();
  assert (split (o.str ()).size () == 2);
  assert (o.str ().find ('\x1b') == string::npos);

  s->close ();
  drain (ioc);
}

static void
test_include_defaults ()
{
  asio::io_context ioc;

  // Human-readable: everything shown.
  //
  {
    ostringstream o;
    stream_report r (ioc, o, make_config ());

    r.report_info (nullopt, "i");
    r.report_warning (message_name::unnamed, "w");
    assert (split (o.str ()).size () == 2);

    // Raw records are for structured mode only.
    //
    r.report_json (boost::json::object {{"x", 1}});
    assert (split (o.str ()).size () == 2);
  }

  // Structured: only errors unless asked for.
  //
  {
    ostringstream o;
    report_options ro;
    ro.json = true;
    stream_report r (ioc, o, make_config (), ro);

    r.report_info (nullopt, "i");
    r.report_warning (message_name::unnamed, "w");
    assert (o.str ().empty ());

    r.report_error (message_name::unnamed, "e");
    assert (split (o.str ()).size () == 1);
  }

  // include_logs drives both, the specific flags override it.
  //
  {
    ostringstream o;
    report_options ro;
    ro.include_logs = false;
    ro.include_warnings = true;
    stream_report r (ioc, o, make_config (), ro);

    r.report_info (nullopt, "i");
    assert (o.str ().empty ());

    r.report_warning (message_name::unnamed, "w");
    r.report_error (message_name::unnamed, "e");
    assert (split (o.str ()).size () == 2);

    // Hidden or not, warnings are counted.
    //
    assert (r.counters ().warnings == 1);
  }
}

static void
test_exit_code ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  r.report_warning (message_name::unnamed, "w");
  assert (!r.has_errors () && r.exit_code () == 0);

  r.report_error (message_name::unnamed, "e");
  assert (r.exit_code () == 1);

  r.report_info (nullopt, "fine now");
  r.finalize ();
  assert (r.exit_code () == 1);
}

static void
test_once ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  r.report_info_once (nullopt, "a");
  r.report_info_once (nullopt, "a");
  r.report_warning_once (message_name::unnamed, "w", string ("k"));
  r.report_warning_once (message_name::unnamed, "other text", string ("k"));
  r.report_error_once (message_name::unnamed, "e");
  r.report_error_once (message_name::unnamed, "e");

  assert (split (o.str ()).size () == 3);
  assert (r.counters ().warnings == 1);
  assert (r.counters ().errors == 1);
}

static void
test_timer_sync ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  int v (r.start_timer_sync ("Outer", [&r]
  {
    r.report_info (nullopt, "inside");

    r.start_timer_sync ("Inner", [&r]
    {
      assert (r.indent () == 2);
      r.report_warning (message_name::unnamed, "deep");
    });

    return 42;
  }));

  assert (v == 42);
  assert (r.indent () == 0);
  assert (o.str () == "➤ YN0000: ┌ Outer\n"
                      "➤ YN0000: │ inside\n"
                      "➤ YN0000: │ ┌ Inner\n"
                      "➤ YN0000: │ │ deep\n"
                      "➤ YN0000: │ └ Completed\n"
                      "➤ YN0000: └ Completed\n");
}

// An exception crossing nested scopes is reported once, inside the
// innermost scope, and every scope is still closed.
//
static void
test_timer_exception ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  bool caught (false);
  try
  {
    r.start_timer_sync ("Outer", [&r]
    {
      r.start_timer_sync ("Inner", []
      {
        throw runtime_error ("boom");
      });
    });
  }
  catch (const runtime_error& e)
  {
    caught = string (e.what ()) == "boom";
  }

  assert (caught);
  assert (r.indent () == 0);
  assert (r.counters ().errors == 1);

  string s (o.str ());
  assert (count (s, "boom") == 1);
  assert (s.find ("➤ YN0001: │ │ boom\n") != string::npos);
  assert (count (s, "Completed") == 2);

  // Reporting it again by hand is a no-op too.
  //
  exception_ptr e (make_exception_ptr (diagnostic_error (
                     message_name::build_failed, "build")));

  try
  {
    r.start_timer_sync ("Build", [e] {rethrow_exception (e);});
  }
  catch (const diagnostic_error&)
  {
  }

  r.report_exception_once (e);

  assert (r.counters ().errors == 2);
  assert (o.str ().find ("➤ YN0009: │ build\n") != string::npos);
}

static void
test_timer_async ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  int v (0);
  bool failed (false);

  asio::co_spawn (ioc,
                  [&r, &v, &failed] () -> asio::awaitable<void>
                  {
                    v = co_await r.start_timer ("Step", [&r] () -> asio::awaitable<int>
                    {
                      r.report_info (nullopt, "working");
                      co_return 7;
                    });

                    try
                    {
                      co_await r.start_timer ("Bad", [] () -> asio::awaitable<void>
                      {
                        throw runtime_error ("async boom");
                        co_return;
                      });
                    }
                    catch (const runtime_error&)
                    {
                      failed = true;
                    }
                  },
                  asio::detached);

  ioc.run ();

  assert (v == 7);
  assert (failed);
  assert (r.counters ().errors == 1);
  assert (o.str ().find ("➤ YN0000: │ working\n") != string::npos);
  assert (o.str ().find ("➤ YN0001: │ async boom\n") != string::npos);
  assert (count (o.str (), "└ Completed") == 2);
}

static void
test_start ()
{
  asio::io_context ioc;
  ostringstream o;

  unique_ptr<stream_report> rep;
  bool escaped (false);

  asio::co_spawn (
    ioc,
    stream_report::start (ioc,
                          o,
                          make_config (),
                          report_options (),
                          [] (stream_report& r) -> asio::awaitable<void>
                          {
                            r.report_info (nullopt, "started");
                            throw diagnostic_error (message_name::linker_not_found,
                                                    "no linker");
                            co_return;
                          }),
    [&rep, &escaped] (exception_ptr e, unique_ptr<stream_report> r)
    {
      escaped = e != nullptr;
      rep = move (r);
    });

  ioc.run ();

  assert (!escaped);
  assert (rep != nullptr);
  assert (rep->exit_code () == 1);
  assert (rep->phase () == report_phase::closed);

  vector<string> ls (split (o.str ()));
  assert (ls.size () == 3);
  assert (ls[1] == "➤ YN0012: no linker");
  assert (ls[2] == "➤ YN0000: Failed with errors");
}

// C + 3 forgettable notices: the window fills, then slides three times.
//
static void
test_forgettable ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config (true));

  size_t c (r.forgettable ().capacity ());

  for (size_t i (0); i < c + 3; ++i)
    r.report_info (message_name::fetch_not_cached, "fetch " + to_string (i));

  string s (o.str ());
  assert (count (s, "\x1b[5A\x1b[0J") == 3);
  assert (r.forgettable ().size () == c);
  assert (r.forgettable ().lines ().front () == "fetch 3");

  // An ordinary line ends the run.
  //
  r.report_info (nullopt, "done");
  assert (r.forgettable ().empty ());

  // Without rendering each notice simply gets its own line.
  //
  ostringstream p;
  stream_report q (ioc, p, make_config ());

  for (size_t i (0); i < c + 3; ++i)
    q.report_info (message_name::fetch_not_cached, "fetch " + to_string (i));

  assert (split (p.str ()).size () == c + 3);
  assert (split (p.str ()).back () == "➤ YN0013: fetch 7");
  assert (p.str ().find ('\x1b') == string::npos);
}

// A rewritten window is formatted at the indentation in effect when it is
// rewritten, like the lines it replaces.
//
static void
test_forgettable_indent ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config (true));

  size_t c (r.forgettable ().capacity ());

  r.start_timer_sync ("Fetch step", [&r, c]
  {
    for (size_t i (0); i <= c; ++i)
      r.report_info (message_name::fetch_not_cached, "fetch " + to_string (i));
  });

  string s (o.str ());
  size_t p (s.find ("\x1b[5A\x1b[0J"));
  assert (p != string::npos);

  vector<string> ls (split (s.substr (p + 8)));
  assert (ls.size () >= c);

  for (size_t i (0); i < c; ++i)
    assert (ls[i] == "➤ YN0013: │ fetch " + to_string (i + 1));
}

static void
test_summary ()
{
  asio::io_context ioc;
  ostringstream o;

  configuration cfg (make_config ());
  cfg.enable_timers = true;
  stream_report r (ioc, o, cfg);

  r.report_cache_hit (locator ("npm", "a"));
  r.report_cache_hit (locator ("npm", "b"));
  r.report_cache_miss (locator ("npm", "c"));
  r.report_warning (message_name::unnamed, "w");

  r.finalize ();

  string s (o.str ());
  assert (s.find ("Done with warnings in ") != string::npos);
  assert (s.find ("2 packages were already cached") != string::npos);
  assert (s.find ("one had to be fetched") != string::npos);

  // The summary itself is not counted.
  //
  assert (r.counters ().warnings == 1);
  assert (r.phase () == report_phase::closed);

  r.finalize ();
  assert (o.str () == s);

  // No footer, no summary.
  //
  ostringstream p;
  report_options ro;
  ro.include_footer = false;
  stream_report q (ioc, p, cfg, ro);

  q.report_cache_hit (locator ("npm", "a"));
  q.finalize ();
  assert (p.str ().empty ());
  assert (q.phase () == report_phase::closed);
}

static void
test_separator ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  r.report_separator ();
  r.start_timer_sync ("Step", [&r] {r.report_separator ();});

  assert (o.str () == "\n"
                      "➤ YN0000: ┌ Step\n"
                      "➤ YN0000: │ \n"
                      "➤ YN0000: └ Completed\n");
}

// Rows go away when rendering is turned off and come back when it is
// turned on again.
//
static void
test_toggle ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config (true));

  auto s (make_shared<progress_source> (ioc));
  progress_handle h (r.report_progress (s));
  s->update (0.5);
  drain (ioc);

  assert (r.redraw ().state ().active_rows == 1);
  assert (o.str ().find ("➤ YN0000: ") != string::npos);

  o.str ("");
  r.enable_progress_bars (false);

  assert (o.str () == "\x1b[1A\x1b[0J");
  assert (r.redraw ().state ().active_rows == 0);
  assert (!r.redraw ().state ().timer_pending);

  o.str ("");
  r.report_info (nullopt, "quiet");
  assert (o.str () == "➤ YN0000: quiet\n");

  r.enable_progress_bars (true);
  assert (r.redraw ().state ().active_rows == 1);

  s->close ();
  drain (ioc);
  assert (r.progress ().empty ());
  assert (r.redraw ().state ().active_rows == 0);
}

// Finalizing leaves running sources alone.
//
static void
test_finalize_sources ()
{
  asio::io_context ioc;
  ostringstream o;
  stream_report r (ioc, o, make_config ());

  auto s (make_shared<progress_source> (ioc));
  progress_handle h (r.report_progress (s));

  r.finalize ();
  assert (r.phase () == report_phase::closed);
  assert (!h.stopped ());

  s->update (0.4);
  drain (ioc);

  assert (r.progress ().rows ().size () == 1);
  assert (r.progress ().rows ()[0].progress == 0.4);

  s->close ();
  drain (ioc);
  assert (h.finished ());
}

int
main ()
{
  test_lines ();
  test_structured ();
  test_include_defaults ();
  test_exit_code ();
  test_once ();
  test_timer_sync ();
  test_timer_exception ();
  test_timer_async ();
  test_start ();
  test_forgettable ();
  test_forgettable_indent ();
  test_summary ();
  test_separator ();
  test_toggle ();
  test_finalize_sources ();
}
