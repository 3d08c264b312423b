#include <reporter/events/event-record.hxx>

#include <cassert>
#include <stdexcept>
#include <string>

using namespace std;
using namespace reporter;

static void
test_serialize ()
{
  event_record r;
  r.type = severity::warning;
  r.name = message_name::fetch_not_cached;
  r.display_name = "YN0013";
  r.indent = "│ ";
  r.data = "some \"quoted\" text";

  string s (serialize_record (r));

  // One line, keys in the documented order.
  //
  assert (s.find ('\n') == string::npos);
  assert (s.find ("\"type\":\"warning\"") == 1);
  assert (s.find ("\"name\":13") != string::npos);
  assert (s.find ("\"type\"") < s.find ("\"name\""));
  assert (s.find ("\"name\"") < s.find ("\"displayName\""));
  assert (s.find ("\"displayName\"") < s.find ("\"indent\""));
  assert (s.find ("\"indent\"") < s.find ("\"data\""));

  event_record p (parse_record (s));
  assert (p.type == severity::warning);
  assert (p.name && *p.name == message_name::fetch_not_cached);
  assert (p.display_name == "YN0013");
  assert (p.indent == "│ ");
  assert (p.data == "some \"quoted\" text");
}

// An absent name is null, which is not the same as unnamed (0).
//
static void
test_null_name ()
{
  event_record r;
  r.display_name = "YN0000";

  string s (serialize_record (r));
  assert (s.find ("\"name\":null") != string::npos);
  assert (!parse_record (s).name);

  r.name = message_name::unnamed;
  s = serialize_record (r);
  assert (s.find ("\"name\":0") != string::npos);

  auto p (parse_record (s));
  assert (p.name && *p.name == message_name::unnamed);
}

static void
test_invalid ()
{
  auto fails = [] (const string& s)
  {
    try
    {
      parse_record (s);
    }
    catch (const invalid_argument&)
    {
      return true;
    }
    return false;
  };

  assert (fails ("not json"));
  assert (fails ("[1, 2]"));
  assert (fails (R"({"type":"info"})"));
  assert (fails (R"({"type":"debug","name":null,"displayName":"","indent":"","data":""})"));
  assert (fails (R"({"type":"info","name":"x","displayName":"","indent":"","data":""})"));
  assert (fails (R"({"type":"info","name":-1,"displayName":"","indent":"","data":""})"));
  assert (!fails (R"({"type":"error","name":1,"displayName":"YN0001","indent":"","data":"boom"})"));
}

int
main ()
{
  test_serialize ();
  test_null_name ();
  test_invalid ();
}
