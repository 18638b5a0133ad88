#include "scrub/sanitizer.hpp"

#include "core/json_writer.hpp"
#include "core/time_utils.hpp"
#include "scrub/limits.hpp"

#include <string>
#include <unordered_set>
#include <utility>

namespace mcpcat::scrub {

namespace {

using core::json::Object;
using core::json::Value;

bool IsBase64Alphabet(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' ||
         c == '/' || c == '\n' || c == '\r';
}

Value TextBlock(std::string_view text) {
  return core::json::MakeObject({
      {"type", core::json::MakeString("text")},
      {"text", core::json::MakeString(std::string(text))},
  });
}

// How a type tag reads when embedded in the unsupported-content marker.
std::string TypeTagName(const Value* tag) {
  if (tag == nullptr) {
    return "undefined";
  }

  switch (tag->type) {
  case Value::Type::kUndefined:
    return "undefined";
  case Value::Type::kNull:
    return "null";
  case Value::Type::kBool:
    return tag->bool_value ? "true" : "false";
  case Value::Type::kNumber:
    return core::json::FormatNumber(tag->number_value);
  case Value::Type::kBigInt:
  case Value::Type::kString:
    return tag->string_value;
  case Value::Type::kSymbol:
    return "Symbol(" + tag->string_value + ")";
  case Value::Type::kFunction:
    return "function " + tag->string_value;
  case Value::Type::kDate:
    return tag->date_value.has_value() ? core::FormatUtcTimestamp(*tag->date_value)
                                       : "Invalid Date";
  case Value::Type::kArray:
  case Value::Type::kObject:
    return "[object Object]";
  }

  return "undefined";
}

class ParameterScanner {
public:
  Value Scan(const Value& value) {
    switch (value.type) {
    case Value::Type::kString:
      if (LooksLikeLargeBase64(value.string_value)) {
        return core::json::MakeString(std::string(kBinaryDataRedacted));
      }
      return value;
    case Value::Type::kArray:
    case Value::Type::kObject:
      return ScanContainer(value);
    default:
      return value;
    }
  }

private:
  Value ScanContainer(const Value& value) {
    const void* identity = value.Identity();
    if (identity == nullptr) {
      return value;
    }
    // A back-edge gets the marker the normalizer would put on the same edge.
    if (active_.count(identity) != 0U) {
      return core::json::MakeString(std::string(kCircularMarker));
    }
    active_.insert(identity);

    Value result;
    if (value.IsArray()) {
      result = core::json::MakeArray();
      auto& items = result.array_value->items;
      items.reserve(value.array_value->items.size());
      for (const auto& item : value.array_value->items) {
        items.push_back(Scan(item));
      }
    } else {
      result = core::json::MakeObject();
      auto& members = result.object_value->members;
      members.reserve(value.object_value->members.size());
      for (const auto& [key, member] : value.object_value->members) {
        members.emplace_back(key, Scan(member));
      }
    }

    active_.erase(identity);
    return result;
  }

  std::unordered_set<const void*> active_;
};

Value SanitizeResourceBlock(const Value& block) {
  const Value* resource = block.Find("resource");
  if (resource != nullptr && resource->IsObject()) {
    const Value* blob = resource->Find("blob");
    if (blob != nullptr && !blob->IsUndefined()) {
      return TextBlock(kBinaryResourceRedacted);
    }
  }
  return block;
}

Value SanitizeContentBlock(const Value& block) {
  if (block.IsArray()) {
    return TextBlock(UnsupportedContentMarker("undefined"));
  }
  if (!block.IsObject()) {
    return block;
  }

  const Value* tag = block.Find("type");
  if (tag != nullptr && tag->IsString()) {
    const std::string& type = tag->string_value;
    if (type == "text" || type == "resource_link") {
      return block;
    }
    if (type == "image") {
      return TextBlock(kImageRedacted);
    }
    if (type == "audio") {
      return TextBlock(kAudioRedacted);
    }
    if (type == "resource") {
      return SanitizeResourceBlock(block);
    }
  }

  return TextBlock(UnsupportedContentMarker(TypeTagName(tag)));
}

Value SanitizeResponse(const Value& response) {
  if (!response.IsObject()) {
    return response;
  }

  Value result = core::json::MakeObject();
  result.object_value->members = response.object_value->members;

  if (Value* content = result.object_value->Find("content"); content != nullptr && content->IsArray()) {
    Value mapped = core::json::MakeArray();
    mapped.array_value->items.reserve(content->array_value->items.size());
    for (const auto& block : content->array_value->items) {
      mapped.array_value->items.push_back(SanitizeContentBlock(block));
    }
    *content = std::move(mapped);
  }

  if (Value* structured = result.object_value->Find("structuredContent");
      structured != nullptr && structured->IsContainer()) {
    *structured = SanitizeParameters(*structured);
  }

  return result;
}

} // namespace

bool LooksLikeLargeBase64(std::string_view text) {
  // Every matching string is ASCII, so the byte size equals the length.
  if (text.size() < kBase64SizeGate) {
    return false;
  }

  std::size_t pos = 0;
  while (pos < text.size() && IsBase64Alphabet(text[pos])) {
    ++pos;
  }
  if (pos == 0U) {
    return false;
  }
  while (pos < text.size() && text[pos] == '=') {
    ++pos;
  }
  return pos == text.size();
}

std::string UnsupportedContentMarker(std::string_view type_name) {
  return "[unsupported content type \"" + std::string(type_name) +
         "\" redacted - not supported by MCPcat]";
}

Value SanitizeParameters(const Value& value) {
  ParameterScanner scanner;
  return scanner.Scan(value);
}

events::Event SanitizeEvent(const events::Event& event) {
  events::Event result = event;

  if (!result.response.IsNullish()) {
    result.response = SanitizeResponse(result.response);
  }

  if (!result.parameters.IsNullish()) {
    result.parameters = SanitizeParameters(result.parameters);
  }

  return result;
}

} // namespace mcpcat::scrub
