#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <reporter/reporter-stream.hxx>
#include <reporter/reporter-options.hxx>

using namespace std;
namespace asio = boost::asio;

namespace reporter
{
  // Sleep on the io_context (yields to the other coroutines).
  //
  static asio::awaitable<void>
  sleep_for (chrono::milliseconds d)
  {
    asio::steady_timer t (co_await asio::this_coro::executor, d);
    co_await t.async_wait (asio::use_awaitable);
  }

  // Simulated package. Cached packages don't need fetching.
  //
  struct package
  {
    string name;
    bool cached;
  };

  static const vector<package> packages {
    {"left-pad@npm:1.3.0",      true},
    {"lodash@npm:4.17.21",      false},
    {"react@npm:18.2.0",        true},
    {"react-dom@npm:18.2.0",    false},
    {"scheduler@npm:0.23.0",    false},
    {"loose-envify@npm:1.4.0",  true},
    {"js-tokens@npm:4.0.0",     false},
    {"typescript@npm:5.3.3",    false},
    {"chalk@npm:4.1.2",         true}};

  // Drive a counter to completion, one step per tick.
  //
  static asio::awaitable<void>
  produce (shared_ptr<progress_source> s,
           size_t steps,
           chrono::milliseconds tick)
  {
    progress_counter c (move (s), steps);

    while (c.current () < c.max ())
    {
      co_await sleep_for (tick);
      c.tick ();
    }
  }

  static asio::awaitable<void>
  install (asio::io_context& ioc, stream_report& r)
  {
    co_await r.start_timer ("Resolution step", [&r] () -> asio::awaitable<void>
    {
      for (const package& p: packages)
        r.report_info (nullopt, "Resolved " + p.name);

      co_await sleep_for (chrono::milliseconds (200));

      r.report_warning (message_name::missing_peer_dependency,
                        "react-dom@npm:18.2.0 doesn't provide @types/react");
    });

    co_await r.start_timer ("Fetch step", [&r, &ioc] () -> asio::awaitable<void>
    {
      auto s (make_shared<progress_source> (ioc));
      progress_handle h (r.report_progress (s));

      asio::co_spawn (ioc,
                      produce (s, packages.size (), chrono::milliseconds (150)),
                      asio::detached);

      for (const package& p: packages)
      {
        if (p.cached)
          r.report_cache_hit (locator ("npm", p.name));
        else
        {
          r.report_cache_miss (locator ("npm", p.name));
          r.report_info (message_name::fetch_not_cached,
                         p.name + " can't be found in the cache and will be "
                         "fetched from the remote registry");
        }

        co_await sleep_for (chrono::milliseconds (150));
      }

      co_await h.wait ();
    });

    co_await r.start_timer ("Link step", [&r, &ioc] () -> asio::awaitable<void>
    {
      // A couple of build scripts running side by side.
      //
      vector<progress_handle> hs;

      for (size_t i (0); i < 2; ++i)
      {
        auto s (make_shared<progress_source> (ioc));
        hs.push_back (r.report_progress (s));

        asio::co_spawn (ioc,
                        produce (s, 20, chrono::milliseconds (50 + 40 * i)),
                        asio::detached);
      }

      for (progress_handle& h: hs)
        co_await h.wait ();

      r.report_info (message_name::must_build,
                     "typescript@npm:5.3.3 must be built because it never "
                     "has been before");
    });
  }
}

int
main (int argc, char* argv[])
{
  using namespace reporter;

  try
  {
    options opt (argc, argv);

    // Handle --version.
    //
    if (opt.version ())
    {
      cout << "reporter " << REPORTER_VERSION_ID << "\n";
      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << "usage: reporter [options]" << "\n"
        << "options:"                  << "\n";

      opt.print_usage (o);

      return 0;
    }

    report_options o;
    o.json = opt.json ();
    o.include_footer = !opt.no_footer ();

    if (opt.include_logs ())
      o.include_logs = true;

    asio::io_context ioc;
    configuration cfg (configuration::from_environment ());

    int r (0);

    asio::co_spawn (
      ioc,
      stream_report::start (ioc,
                            cout,
                            move (cfg),
                            o,
                            [&ioc] (stream_report& s)
                            {
                              return install (ioc, s);
                            }),
      [&r] (exception_ptr e, unique_ptr<stream_report> rep)
      {
        if (e)
        {
          try { rethrow_exception (e); }
          catch (const exception& x)
          {
            cerr << "error: " << x.what () << endl;
          }

          r = 1;
          return;
        }

        r = rep->exit_code ();
      });

    ioc.run ();
    return r;
  }
  catch (const cli::exception& e)
  {
    cerr << "error: " << e.what () << endl;
    return 1;
  }
  catch (const exception& e)
  {
    cerr << "error: " << e.what () << endl;
    return 1;
  }
}
