#pragma once

#include <reporter/reporter-types.hxx>

#include <chrono>
#include <string>
#include <cstddef>

namespace reporter
{
  // Report counters.
  //
  // Only ever incremented, and only by the corresponding report call.
  //
  struct report_counters
  {
    std::size_t cache_hits {0};
    std::size_t cache_misses {0};
    std::size_t warnings {0};
    std::size_t errors {0};
  };

  // Severity of the summary line: error if there were any errors, warning
  // if there were any warnings, info otherwise.
  //
  severity
  summary_severity (const report_counters&) noexcept;

  // Status phrase matching summary_severity() (e.g., "Done with warnings").
  //
  std::string
  format_status (const report_counters&);

  // Cache phrase (e.g., " - 2 packages were already cached, one had to be
  // fetched"). Empty if there were neither hits nor misses.
  //
  std::string
  format_cache_status (std::size_t hits, std::size_t misses);

  // Format elapsed time as seconds under one minute and as minutes
  // otherwise, rounded to two decimals with trailing zeros dropped (e.g.,
  // 1.5s, 45s, 1.08m).
  //
  std::string
  format_timing (std::chrono::milliseconds elapsed);

  // Compose the whole summary line. The timing and cache phrases are only
  // included with timers enabled.
  //
  std::string
  format_summary (const report_counters&,
                  std::chrono::milliseconds elapsed,
                  bool timers);
}
