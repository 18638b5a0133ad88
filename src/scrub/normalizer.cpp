#include "scrub/normalizer.hpp"

#include "core/time_utils.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_set>

namespace mcpcat::scrub {

namespace {

using core::json::Value;

Value Marker(std::string_view text) {
  return core::json::MakeString(std::string(text));
}

class Normalizer {
public:
  explicit Normalizer(const NormalizeLimits& limits) : limits_(limits) {}

  Value Visit(const Value& value, int remaining_depth) {
    switch (value.type) {
    case Value::Type::kNull:
      return core::json::MakeNull();
    case Value::Type::kUndefined:
      return Marker(kUndefinedMarker);
    case Value::Type::kBool:
      return value;
    case Value::Type::kNumber:
      if (std::isnan(value.number_value)) {
        return Marker("[NaN]");
      }
      if (std::isinf(value.number_value)) {
        return Marker(value.number_value > 0 ? "[Infinity]" : "[-Infinity]");
      }
      return value;
    case Value::Type::kBigInt:
      return Marker("[BigInt: " + (value.string_value.empty() ? "0" : value.string_value) + "]");
    case Value::Type::kString:
      return core::json::MakeString(
          core::utf8::TruncateWithSuffix(value.string_value, limits_.string_length));
    case Value::Type::kSymbol:
      return Marker(value.string_value.empty() ? "[Symbol()]"
                                               : "[Symbol(" + value.string_value + ")]");
    case Value::Type::kFunction:
      return Marker("[Function: " +
                    (value.string_value.empty() ? std::string("<anonymous>") : value.string_value) +
                    "]");
    case Value::Type::kDate:
      return VisitDate(value);
    case Value::Type::kArray:
    case Value::Type::kObject:
      return VisitContainer(value, remaining_depth);
    }

    return core::json::MakeNull();
  }

private:
  static Value VisitDate(const Value& value) {
    if (!value.date_value.has_value()) {
      return Marker("[Invalid Date]");
    }
    const std::string formatted = core::FormatUtcTimestamp(*value.date_value);
    if (formatted.empty()) {
      return Marker("[Invalid Date]");
    }
    return core::json::MakeString(formatted);
  }

  Value VisitContainer(const Value& value, int remaining_depth) {
    const void* identity = value.Identity();
    if (identity == nullptr) {
      return core::json::MakeNull();
    }
    if (active_.count(identity) != 0U) {
      return Marker(kCircularMarker);
    }
    if (remaining_depth <= 0) {
      return Marker(value.IsArray() ? kArrayMarker : kObjectMarker);
    }

    active_.insert(identity);
    Value result = value.IsArray() ? VisitArray(value, remaining_depth - 1)
                                   : VisitObject(value, remaining_depth - 1);
    active_.erase(identity);
    return result;
  }

  Value VisitArray(const Value& value, int remaining_depth) {
    const auto& items = value.array_value->items;
    Value result = core::json::MakeArray();
    auto& out = result.array_value->items;
    out.reserve(std::min(items.size(), limits_.breadth + 1U));

    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i >= limits_.breadth) {
        out.push_back(Marker(kMaxPropertiesMarker));
        break;
      }
      out.push_back(Visit(items[i], remaining_depth));
    }
    return result;
  }

  Value VisitObject(const Value& value, int remaining_depth) {
    Value result = core::json::MakeObject();
    auto& out = *result.object_value;
    std::size_t count = 0;

    for (const auto& [key, member] : value.object_value->members) {
      if (count >= limits_.breadth) {
        out.Set(std::string(kMaxPropertiesKey), Marker(kMaxPropertiesMarker));
        break;
      }
      if (member.IsUndefined()) {
        continue;
      }
      out.members.emplace_back(key, Visit(member, remaining_depth));
      ++count;
    }
    return result;
  }

  NormalizeLimits limits_;
  std::unordered_set<const void*> active_;
};

} // namespace

Value Normalize(const Value& value, const NormalizeLimits& limits) {
  Normalizer normalizer(limits);
  return normalizer.Visit(value, limits.depth);
}

} // namespace mcpcat::scrub
