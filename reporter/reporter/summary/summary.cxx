#include <reporter/summary/summary.hxx>

#include <cmath>
#include <sstream>

using namespace std;

namespace reporter
{
  severity
  summary_severity (const report_counters& c) noexcept
  {
    if (c.errors > 0)
      return severity::error;

    if (c.warnings > 0)
      return severity::warning;

    return severity::info;
  }

  string
  format_status (const report_counters& c)
  {
    switch (summary_severity (c))
    {
    case severity::error:   return "Failed with errors";
    case severity::warning: return "Done with warnings";
    case severity::info:    break;
    }

    return "Done";
  }

  string
  format_cache_status (size_t h, size_t m)
  {
    ostringstream o;

    if (h > 1)
      o << " - " << h << " packages were already cached";
    else if (h == 1)
      o << " - one package was already cached";

    // If we already said something about the cache, the misses are a
    // continuation of the same sentence ("..., one had to be fetched").
    // Otherwise they start it.
    //
    if (h > 0)
    {
      if (m > 1)
        o << ", " << m << " had to be fetched";
      else if (m == 1)
        o << ", one had to be fetched";
    }
    else
    {
      if (m > 1)
        o << " - " << m << " packages had to be fetched";
      else if (m == 1)
        o << " - one package had to be fetched";
    }

    return o.str ();
  }

  string
  format_timing (chrono::milliseconds e)
  {
    double ms (static_cast<double> (e.count ()));

    // Work in hundredths of the unit so that the rounding is done once and
    // the formatting is exact.
    //
    bool s (ms < 60 * 1000);
    long long h (static_cast<long long> (round (s ? ms / 10 : ms / 600)));

    ostringstream o;
    o << h / 100;

    if (long long f = h % 100)
    {
      o << '.' << f / 10;

      if (f % 10 != 0)
        o << f % 10;
    }

    o << (s ? 's' : 'm');
    return o.str ();
  }

  string
  format_summary (const report_counters& c,
                  chrono::milliseconds e,
                  bool t)
  {
    string r (format_status (c));

    if (t)
    {
      r += " in ";
      r += format_timing (e);
      r += format_cache_status (c.cache_hits, c.cache_misses);
    }

    return r;
  }
}
