#include "events/error_data.hpp"

#include <utility>

namespace mcpcat::events {

namespace {

using core::json::Object;
using core::json::Value;

void AddOptionalString(Object& object, const char* key, const std::optional<std::string>& field) {
  if (field.has_value()) {
    object.members.emplace_back(key, core::json::MakeString(*field));
  }
}

Value FramesToValue(const std::vector<StackFrame>& frames) {
  Value array = core::json::MakeArray();
  array.array_value->items.reserve(frames.size());
  for (const auto& frame : frames) {
    array.array_value->items.push_back(ToValue(frame));
  }
  return array;
}

Value ToValue(const ChainedErrorData& chained) {
  Value root = core::json::MakeObject();
  Object& object = *root.object_value;
  object.members.emplace_back("message", core::json::MakeString(chained.message));
  AddOptionalString(object, "type", chained.type);
  AddOptionalString(object, "stack", chained.stack);
  if (chained.frames.has_value()) {
    object.members.emplace_back("frames", FramesToValue(*chained.frames));
  }
  return root;
}

} // namespace

Value ToValue(const StackFrame& frame) {
  Value root = core::json::MakeObject();
  Object& object = *root.object_value;
  object.members.emplace_back("filename", core::json::MakeString(frame.filename));
  AddOptionalString(object, "abs_path", frame.abs_path);
  object.members.emplace_back("function", core::json::MakeString(frame.function));
  if (frame.lineno.has_value()) {
    object.members.emplace_back("lineno", core::json::MakeNumber(*frame.lineno));
  }
  if (frame.colno.has_value()) {
    object.members.emplace_back("colno", core::json::MakeNumber(*frame.colno));
  }
  object.members.emplace_back("in_app", core::json::MakeBool(frame.in_app));
  AddOptionalString(object, "context_line", frame.context_line);
  return root;
}

Value ToValue(const ErrorData& error) {
  Value root = core::json::MakeObject();
  Object& object = *root.object_value;
  object.members.emplace_back("message", core::json::MakeString(error.message));
  AddOptionalString(object, "type", error.type);
  AddOptionalString(object, "stack", error.stack);
  if (error.frames.has_value()) {
    object.members.emplace_back("frames", FramesToValue(*error.frames));
  }
  if (error.chained_errors.has_value()) {
    Value chained = core::json::MakeArray();
    for (const auto& entry : *error.chained_errors) {
      chained.array_value->items.push_back(ToValue(entry));
    }
    object.members.emplace_back("chained_errors", std::move(chained));
  }
  return root;
}

} // namespace mcpcat::events
