#include "events/event_model.hpp"

#include "core/json_dom.hpp"
#include "core/json_writer.hpp"
#include "core/time_utils.hpp"

#include <array>
#include <utility>

namespace mcpcat::events {

namespace {

using core::json::Object;
using core::json::Value;

struct StringField {
  std::string_view key;
  std::optional<std::string> Event::*member;
};

struct TreeField {
  std::string_view key;
  Value Event::*member;
};

constexpr std::array<StringField, 17> kStringFields = {{
    {"id", &Event::id},
    {"sessionId", &Event::session_id},
    {"projectId", &Event::project_id},
    {"eventType", &Event::event_type},
    {"ipAddress", &Event::ip_address},
    {"sdkLanguage", &Event::sdk_language},
    {"mcpcatVersion", &Event::mcpcat_version},
    {"serverName", &Event::server_name},
    {"serverVersion", &Event::server_version},
    {"clientName", &Event::client_name},
    {"clientVersion", &Event::client_version},
    {"identifyActorGivenId", &Event::identify_actor_given_id},
    {"identifyActorName", &Event::identify_actor_name},
    {"resourceName", &Event::resource_name},
    {"userIntent", &Event::user_intent},
    {"actorId", &Event::actor_id},
    {"eventId", &Event::event_id},
}};

constexpr std::array<TreeField, 4> kTreeFields = {{
    {"identifyActorData", &Event::identify_actor_data},
    {"parameters", &Event::parameters},
    {"response", &Event::response},
    {"error", &Event::error},
}};

void AddString(Object& object, std::string_view key, const std::optional<std::string>& field) {
  if (field.has_value()) {
    object.members.emplace_back(std::string(key), core::json::MakeString(*field));
  }
}

void AddTree(Object& object, std::string_view key, const Value& field) {
  if (!field.IsUndefined()) {
    object.members.emplace_back(std::string(key), field);
  }
}

bool ReadString(const Value& value, std::string_view key, std::optional<std::string>& field,
                std::string& error) {
  if (value.IsNullish()) {
    field.reset();
    return true;
  }
  if (!value.IsString()) {
    error = "field '" + std::string(key) + "' must be a string";
    return false;
  }
  field = value.string_value;
  return true;
}

bool ReadTimestamp(const Value& value, Event& event, std::string& error) {
  if (value.IsNullish()) {
    event.timestamp.reset();
    return true;
  }
  if (value.type == Value::Type::kDate) {
    if (!value.date_value.has_value()) {
      error = "field 'timestamp' is an invalid date";
      return false;
    }
    event.timestamp = value.date_value;
    return true;
  }
  if (!value.IsString()) {
    error = "field 'timestamp' must be an ISO-8601 string";
    return false;
  }

  std::chrono::system_clock::time_point parsed{};
  std::string parse_error;
  if (!core::ParseUtcTimestamp(value.string_value, parsed, parse_error)) {
    error = "field 'timestamp': " + parse_error;
    return false;
  }
  event.timestamp = parsed;
  return true;
}

} // namespace

std::string EventTypeName(EventType event_type) {
  switch (event_type) {
  case EventType::kInitialize:
    return "mcp:initialize";
  case EventType::kToolsList:
    return "mcp:tools/list";
  case EventType::kToolsCall:
    return "mcp:tools/call";
  case EventType::kIdentify:
    return "mcpcat:identify";
  case EventType::kCustom:
    return "mcpcat:custom";
  }

  return "mcpcat:custom";
}

Value ToValue(const Event& event) {
  Value root = core::json::MakeObject();
  Object& object = *root.object_value;

  AddString(object, "id", event.id);
  AddString(object, "sessionId", event.session_id);
  AddString(object, "projectId", event.project_id);
  AddString(object, "eventType", event.event_type);
  if (event.timestamp.has_value()) {
    object.members.emplace_back("timestamp", core::json::MakeDate(*event.timestamp));
  }
  if (event.duration.has_value()) {
    object.members.emplace_back("duration", core::json::MakeNumber(*event.duration));
  }

  AddString(object, "ipAddress", event.ip_address);
  AddString(object, "sdkLanguage", event.sdk_language);
  AddString(object, "mcpcatVersion", event.mcpcat_version);
  AddString(object, "serverName", event.server_name);
  AddString(object, "serverVersion", event.server_version);
  AddString(object, "clientName", event.client_name);
  AddString(object, "clientVersion", event.client_version);

  AddString(object, "identifyActorGivenId", event.identify_actor_given_id);
  AddString(object, "identifyActorName", event.identify_actor_name);
  AddTree(object, "identifyActorData", event.identify_actor_data);

  AddString(object, "resourceName", event.resource_name);
  AddTree(object, "parameters", event.parameters);
  AddTree(object, "response", event.response);
  AddString(object, "userIntent", event.user_intent);

  if (event.is_error.has_value()) {
    object.members.emplace_back("isError", core::json::MakeBool(*event.is_error));
  }
  AddTree(object, "error", event.error);

  AddString(object, "actorId", event.actor_id);
  AddString(object, "eventId", event.event_id);
  return root;
}

std::string ToJson(const Event& event) {
  return core::json::ToJson(ToValue(event));
}

std::size_t ByteSize(const Event& event) {
  return ToJson(event).size();
}

bool FromValue(const Value& value, Event& event, std::string& error) {
  if (!value.IsObject()) {
    error = "event must be a JSON object";
    return false;
  }

  Event parsed;
  for (const auto& field : kStringFields) {
    if (const Value* member = value.Find(field.key)) {
      if (!ReadString(*member, field.key, parsed.*field.member, error)) {
        return false;
      }
    }
  }

  for (const auto& field : kTreeFields) {
    if (const Value* member = value.Find(field.key)) {
      parsed.*field.member = *member;
    }
  }

  if (const Value* timestamp = value.Find("timestamp")) {
    if (!ReadTimestamp(*timestamp, parsed, error)) {
      return false;
    }
  }

  if (const Value* duration = value.Find("duration")) {
    if (duration->type == Value::Type::kNumber) {
      parsed.duration = duration->number_value;
    } else if (!duration->IsNullish()) {
      error = "field 'duration' must be a number";
      return false;
    }
  }

  if (const Value* is_error = value.Find("isError")) {
    if (is_error->type == Value::Type::kBool) {
      parsed.is_error = is_error->bool_value;
    } else if (!is_error->IsNullish()) {
      error = "field 'isError' must be a boolean";
      return false;
    }
  }

  event = std::move(parsed);
  return true;
}

bool FromJson(std::string_view text, Event& event, std::string& error) {
  Value root;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  return FromValue(root, event, error);
}

} // namespace mcpcat::events
