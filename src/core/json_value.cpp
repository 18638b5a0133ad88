#include "core/json_value.hpp"

#include <cmath>
#include <set>
#include <unordered_map>

namespace mcpcat::core::json {

namespace {

class Copier {
public:
  Value Copy(const Value& value) {
    if (!value.IsContainer()) {
      return value;
    }

    const auto found = copies_.find(value.Identity());
    if (found != copies_.end()) {
      return found->second;
    }

    if (value.IsArray()) {
      Value copy = MakeArray();
      copies_.emplace(value.Identity(), copy);
      copy.array_value->items.reserve(value.array_value->items.size());
      for (const auto& item : value.array_value->items) {
        copy.array_value->items.push_back(Copy(item));
      }
      return copy;
    }

    Value copy = MakeObject();
    copies_.emplace(value.Identity(), copy);
    copy.object_value->members.reserve(value.object_value->members.size());
    for (const auto& [key, member] : value.object_value->members) {
      copy.object_value->members.emplace_back(key, Copy(member));
    }
    return copy;
  }

private:
  std::unordered_map<const void*, Value> copies_;
};

class Comparator {
public:
  bool Compare(const Value& lhs, const Value& rhs) {
    if (lhs.type != rhs.type) {
      return false;
    }

    switch (lhs.type) {
    case Value::Type::kUndefined:
    case Value::Type::kNull:
      return true;
    case Value::Type::kBool:
      return lhs.bool_value == rhs.bool_value;
    case Value::Type::kNumber:
      if (std::isnan(lhs.number_value) && std::isnan(rhs.number_value)) {
        return true;
      }
      return lhs.number_value == rhs.number_value;
    case Value::Type::kBigInt:
    case Value::Type::kString:
    case Value::Type::kSymbol:
    case Value::Type::kFunction:
      return lhs.string_value == rhs.string_value;
    case Value::Type::kDate:
      return lhs.date_value == rhs.date_value;
    case Value::Type::kArray:
    case Value::Type::kObject:
      return CompareContainers(lhs, rhs);
    }

    return false;
  }

private:
  bool CompareContainers(const Value& lhs, const Value& rhs) {
    if (lhs.Identity() == rhs.Identity()) {
      return true;
    }
    if (lhs.Identity() == nullptr || rhs.Identity() == nullptr) {
      return false;
    }

    const auto pair = std::make_pair(lhs.Identity(), rhs.Identity());
    if (active_.count(pair) != 0U) {
      return true;
    }
    active_.insert(pair);

    bool equal = true;
    if (lhs.IsArray()) {
      const auto& left = lhs.array_value->items;
      const auto& right = rhs.array_value->items;
      equal = left.size() == right.size();
      for (std::size_t i = 0; equal && i < left.size(); ++i) {
        equal = Compare(left[i], right[i]);
      }
    } else {
      const auto& left = lhs.object_value->members;
      const auto& right = rhs.object_value->members;
      equal = left.size() == right.size();
      for (std::size_t i = 0; equal && i < left.size(); ++i) {
        equal = left[i].first == right[i].first && Compare(left[i].second, right[i].second);
      }
    }

    active_.erase(pair);
    return equal;
  }

  std::set<std::pair<const void*, const void*>> active_;
};

} // namespace

Value DeepCopy(const Value& value) {
  Copier copier;
  return copier.Copy(value);
}

bool Equals(const Value& lhs, const Value& rhs) {
  Comparator comparator;
  return comparator.Compare(lhs, rhs);
}

} // namespace mcpcat::core::json
