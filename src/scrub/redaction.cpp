#include "scrub/redaction.hpp"

#include "scrub/limits.hpp"

#include <array>
#include <exception>
#include <unordered_set>
#include <utility>

namespace mcpcat::scrub {

namespace {

using core::json::Value;

constexpr std::array<std::string_view, 10> kProtectedFields = {
    "sessionId",  "id",           "projectId",    "server",    "identifyActorGivenId",
    "identifyActorName", "identifyData", "resourceName", "eventType", "actorId",
};

class Redactor {
public:
  explicit Redactor(const RedactFunction& redact) : redact_(redact) {}

  Value Redact(const Value& value, bool is_protected) {
    switch (value.type) {
    case Value::Type::kString:
      if (is_protected) {
        return value;
      }
      return core::json::MakeString(redact_(value.string_value));
    case Value::Type::kArray:
    case Value::Type::kObject:
      return RedactContainer(value, is_protected);
    default:
      return value;
    }
  }

  // Top level of the event: protection is decided per key.
  Value RedactRoot(const Value& root) {
    if (!root.IsObject()) {
      return Redact(root, false);
    }
    return RedactObject(root, [](std::string_view key) { return IsProtectedField(key); });
  }

private:
  template <typename IsProtectedFn>
  Value RedactObject(const Value& value, IsProtectedFn&& is_key_protected) {
    Value result = core::json::MakeObject();
    auto& members = result.object_value->members;
    for (const auto& [key, member] : value.object_value->members) {
      if (member.IsUndefined() || member.type == Value::Type::kFunction) {
        continue;
      }
      members.emplace_back(key, Redact(member, is_key_protected(key)));
    }
    return result;
  }

  Value RedactContainer(const Value& value, bool is_protected) {
    const void* identity = value.Identity();
    if (identity == nullptr) {
      return value;
    }
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
        items.push_back(Redact(item, is_protected));
      }
    } else {
      result = RedactObject(value, [is_protected](std::string_view) { return is_protected; });
    }

    active_.erase(identity);
    return result;
  }

  const RedactFunction& redact_;
  std::unordered_set<const void*> active_;
};

} // namespace

bool IsProtectedField(std::string_view key) {
  for (const auto field : kProtectedFields) {
    if (field == key) {
      return true;
    }
  }
  return false;
}

bool RedactEvent(const events::Event& event, const RedactFunction& redact,
                 events::Event& redacted, std::string& error) {
  if (!redact) {
    error = "redaction function is empty";
    return false;
  }

  Value tree;
  try {
    Redactor redactor(redact);
    tree = redactor.RedactRoot(events::ToValue(event));
  } catch (const std::exception& ex) {
    error = std::string("redaction function failed: ") + ex.what();
    return false;
  }

  events::Event result;
  if (!events::FromValue(tree, result, error)) {
    error = "redacted event no longer reads back: " + error;
    return false;
  }

  redacted = std::move(result);
  return true;
}

} // namespace mcpcat::scrub
