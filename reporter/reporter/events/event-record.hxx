#pragma once

#include <reporter/reporter-types.hxx>

#include <boost/json.hpp>

#include <string>
#include <optional>

namespace reporter
{
  // Structured event record.
  //
  // In structured mode every diagnostic is written as one of these, encoded
  // as a single-line JSON object:
  //
  // {"type":"warning","name":13,"displayName":"YN0013","indent":"","data":"..."}
  //
  // An absent name is encoded as null.
  //
  struct event_record
  {
    severity type {severity::info};
    std::optional<message_name> name;
    std::string display_name;
    std::string indent;
    std::string data;
  };

  boost::json::object
  to_json (const event_record&);

  // Serialize to a single line (no trailing newline).
  //
  std::string
  serialize_record (const event_record&);

  // Parse a line produced by serialize_record().
  //
  // Throw std::invalid_argument if the line is not a valid record.
  //
  event_record
  parse_record (const std::string& line);
}
