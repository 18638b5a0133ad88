#ifndef MCPCAT_CORE_JSON_VALUE_HPP_
#define MCPCAT_CORE_JSON_VALUE_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpcat::core::json {

struct Array;
struct Object;

// Value tree carried by the user-controlled event fields.
//
// Besides the JSON kinds it can hold values a host runtime hands us that have
// no JSON form (undefined, big integers, symbols, functions, dates, NaN and
// infinities). Arrays and objects are shared by reference: two values may point
// at the same container, and a container may reach itself. Container identity
// is the address returned by `Identity()`.
struct Value {
  enum class Type {
    kUndefined,
    kNull,
    kBool,
    kNumber,
    kBigInt,
    kString,
    kSymbol,
    kFunction,
    kDate,
    kArray,
    kObject,
  };

  Type type = Type::kUndefined;
  bool bool_value = false;
  double number_value = 0.0;
  // kString text, kBigInt decimal digits, kSymbol description, kFunction name.
  std::string string_value;
  // nullopt on a kDate value means an invalid date.
  std::optional<std::chrono::system_clock::time_point> date_value;
  std::shared_ptr<Array> array_value;
  std::shared_ptr<Object> object_value;

  bool IsUndefined() const {
    return type == Type::kUndefined;
  }

  bool IsNull() const {
    return type == Type::kNull;
  }

  // True for null and undefined.
  bool IsNullish() const {
    return type == Type::kUndefined || type == Type::kNull;
  }

  bool IsString() const {
    return type == Type::kString;
  }

  bool IsArray() const {
    return type == Type::kArray && array_value != nullptr;
  }

  bool IsObject() const {
    return type == Type::kObject && object_value != nullptr;
  }

  bool IsContainer() const {
    return IsArray() || IsObject();
  }

  const void* Identity() const;

  // Object member lookup. nullptr when this is not an object or the key is
  // missing.
  const Value* Find(std::string_view key) const;
};

struct Array {
  std::vector<Value> items;
};

// Insertion-ordered object.
struct Object {
  using Member = std::pair<std::string, Value>;

  std::vector<Member> members;

  const Value* Find(std::string_view key) const {
    for (const auto& member : members) {
      if (member.first == key) {
        return &member.second;
      }
    }
    return nullptr;
  }

  Value* Find(std::string_view key) {
    for (auto& member : members) {
      if (member.first == key) {
        return &member.second;
      }
    }
    return nullptr;
  }

  // Replaces an existing key in place, otherwise appends.
  void Set(std::string key, Value value) {
    if (Value* existing = Find(key)) {
      *existing = std::move(value);
      return;
    }
    members.emplace_back(std::move(key), std::move(value));
  }
};

inline const void* Value::Identity() const {
  if (type == Type::kArray) {
    return array_value.get();
  }
  if (type == Type::kObject) {
    return object_value.get();
  }
  return nullptr;
}

inline const Value* Value::Find(std::string_view key) const {
  if (!IsObject()) {
    return nullptr;
  }
  return object_value->Find(key);
}

inline Value MakeUndefined() {
  return Value{};
}

inline Value MakeNull() {
  Value value;
  value.type = Value::Type::kNull;
  return value;
}

inline Value MakeBool(bool b) {
  Value value;
  value.type = Value::Type::kBool;
  value.bool_value = b;
  return value;
}

inline Value MakeNumber(double number) {
  Value value;
  value.type = Value::Type::kNumber;
  value.number_value = number;
  return value;
}

inline Value MakeBigInt(std::string digits) {
  Value value;
  value.type = Value::Type::kBigInt;
  value.string_value = std::move(digits);
  return value;
}

inline Value MakeString(std::string text) {
  Value value;
  value.type = Value::Type::kString;
  value.string_value = std::move(text);
  return value;
}

// An empty description renders as `Symbol()`.
inline Value MakeSymbol(std::string description = {}) {
  Value value;
  value.type = Value::Type::kSymbol;
  value.string_value = std::move(description);
  return value;
}

// An empty name is an anonymous function.
inline Value MakeFunction(std::string name = {}) {
  Value value;
  value.type = Value::Type::kFunction;
  value.string_value = std::move(name);
  return value;
}

inline Value MakeDate(std::chrono::system_clock::time_point ts) {
  Value value;
  value.type = Value::Type::kDate;
  value.date_value = ts;
  return value;
}

inline Value MakeInvalidDate() {
  Value value;
  value.type = Value::Type::kDate;
  return value;
}

inline Value MakeArray(std::vector<Value> items = {}) {
  Value value;
  value.type = Value::Type::kArray;
  value.array_value = std::make_shared<Array>();
  value.array_value->items = std::move(items);
  return value;
}

inline Value MakeObject(std::vector<Object::Member> members = {}) {
  Value value;
  value.type = Value::Type::kObject;
  value.object_value = std::make_shared<Object>();
  for (auto& member : members) {
    value.object_value->Set(std::move(member.first), std::move(member.second));
  }
  return value;
}

// Copies `value` into fresh containers. Sharing and cycles in the input are
// reproduced among the copies, so the result never aliases the input.
Value DeepCopy(const Value& value);

// Structural equality. NaN equals NaN; dates compare by time point; object
// member order is significant. Cyclic pairs already under comparison compare
// equal.
bool Equals(const Value& lhs, const Value& rhs);

} // namespace mcpcat::core::json

#endif // MCPCAT_CORE_JSON_VALUE_HPP_
