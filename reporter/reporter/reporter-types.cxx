#include <reporter/reporter-types.hxx>

#include <iomanip>
#include <sstream>

using namespace std;

namespace reporter
{
  ostream&
  operator<< (ostream& os, severity s)
  {
    switch (s)
    {
    case severity::info:    return os << "info";
    case severity::warning: return os << "warning";
    case severity::error:   return os << "error";
    }
    return os;
  }

  string
  format_label (optional<message_name> n, const string& p)
  {
    // Note that setw() only pads, it never truncates, so codes past 9999
    // still come out whole.
    //
    ostringstream o;
    o << p << setfill ('0') << setw (4) << message_code (
      n ? *n : message_name::unnamed);

    return o.str ();
  }

  string
  format_indent (size_t n)
  {
    string r;
    r.reserve (n * 4);

    for (size_t i (0); i < n; ++i)
      r += "│ ";

    return r;
  }
}
