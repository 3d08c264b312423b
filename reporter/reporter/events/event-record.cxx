#include <reporter/events/event-record.hxx>

#include <sstream>
#include <stdexcept>

using namespace std;

namespace reporter
{
  boost::json::object
  to_json (const event_record& r)
  {
    ostringstream t;
    t << r.type;

    // Note that boost::json::object preserves insertion order, so the keys
    // come out in the documented order.
    //
    boost::json::object o;
    o["type"] = t.str ();

    if (r.name)
      o["name"] = message_code (*r.name);
    else
      o["name"] = nullptr;

    o["displayName"] = r.display_name;
    o["indent"] = r.indent;
    o["data"] = r.data;

    return o;
  }

  string
  serialize_record (const event_record& r)
  {
    return boost::json::serialize (to_json (r));
  }

  event_record
  parse_record (const string& l)
  {
    boost::json::error_code ec;
    boost::json::value v (boost::json::parse (l, ec));

    if (ec)
      throw invalid_argument ("invalid event record: " + ec.message ());

    const boost::json::object* o (v.if_object ());
    if (o == nullptr)
      throw invalid_argument ("invalid event record: not an object");

    auto str = [o] (const char* k) -> string
    {
      const boost::json::value* x (o->if_contains (k));
      if (x == nullptr || !x->is_string ())
        throw invalid_argument (string ("invalid event record: missing '") +
                                k + "'");

      const boost::json::string& s (x->get_string ());
      return string (s.data (), s.size ());
    };

    event_record r;

    string t (str ("type"));
    if      (t == "info")    r.type = severity::info;
    else if (t == "warning") r.type = severity::warning;
    else if (t == "error")   r.type = severity::error;
    else
      throw invalid_argument ("invalid event record type '" + t + "'");

    const boost::json::value* n (o->if_contains ("name"));
    if (n == nullptr)
      throw invalid_argument ("invalid event record: missing 'name'");

    if (!n->is_null ())
    {
      if (!n->is_int64 () || n->get_int64 () < 0 || n->get_int64 () > 0xFFFF)
        throw invalid_argument ("invalid event record name");

      r.name = static_cast<message_name> (n->get_int64 ());
    }

    r.display_name = str ("displayName");
    r.indent = str ("indent");
    r.data = str ("data");

    return r;
  }
}
