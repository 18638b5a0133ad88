#pragma once

#include "core/json_value.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcpcat::events {

// Well-known MCP interaction kinds. `Event::event_type` stays a free string so
// custom types published by hosts pass through untouched.
enum class EventType {
  kInitialize,
  kToolsList,
  kToolsCall,
  kIdentify,
  kCustom,
};

// Stable wire names, e.g. `mcp:tools/call`.
std::string EventTypeName(EventType event_type);

// One recorded MCP interaction.
//
// Scalar metadata is produced by the tracing layer and is trusted in shape.
// `parameters`, `response`, `identify_actor_data` and `error` are
// user-controlled trees of any shape; an undefined tree means the field is
// absent. Every field is optional and absent fields are never invented.
struct Event {
  std::optional<std::string> id;
  std::optional<std::string> session_id;
  std::optional<std::string> project_id;

  std::optional<std::string> event_type;
  std::optional<std::chrono::system_clock::time_point> timestamp;
  std::optional<double> duration;

  std::optional<std::string> ip_address;
  std::optional<std::string> sdk_language;
  std::optional<std::string> mcpcat_version;
  std::optional<std::string> server_name;
  std::optional<std::string> server_version;
  std::optional<std::string> client_name;
  std::optional<std::string> client_version;

  std::optional<std::string> identify_actor_given_id;
  std::optional<std::string> identify_actor_name;
  core::json::Value identify_actor_data;

  std::optional<std::string> resource_name;
  core::json::Value parameters;
  core::json::Value response;
  std::optional<std::string> user_intent;

  std::optional<bool> is_error;
  core::json::Value error;

  std::optional<std::string> actor_id;
  std::optional<std::string> event_id;
};

// Object form with camelCase keys in a fixed order (the order of the struct
// above). Absent fields are omitted. Trees are shared, not copied.
core::json::Value ToValue(const Event& event);

// Canonical JSON line for export and for the byte ceiling.
std::string ToJson(const Event& event);

// UTF-8 byte length of ToJson(event).
std::size_t ByteSize(const Event& event);

// Reads an event from its object form. `timestamp` may be a date value or an
// ISO-8601 UTC string. JSON null on a scalar field reads as absent; unknown
// keys are ignored. Returns false with `error` naming the offending field.
bool FromValue(const core::json::Value& value, Event& event, std::string& error);
bool FromJson(std::string_view text, Event& event, std::string& error);

} // namespace mcpcat::events
