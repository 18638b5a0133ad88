#include "core/json_writer.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>
#include <unordered_set>

namespace mcpcat::core::json {

namespace {

constexpr std::string_view kCircularMarker = "[Circular ~]";

// Kinds that JSON has no spelling for and therefore drops from objects.
bool IsOmittedInObject(const Value& value) {
  return value.type == Value::Type::kUndefined || value.type == Value::Type::kFunction ||
         value.type == Value::Type::kSymbol;
}

class Writer {
public:
  explicit Writer(std::string& out) : out_(out) {}

  void Write(const Value& value) {
    switch (value.type) {
    case Value::Type::kUndefined:
    case Value::Type::kNull:
    case Value::Type::kFunction:
    case Value::Type::kSymbol:
      out_ += "null";
      return;
    case Value::Type::kBool:
      out_ += value.bool_value ? "true" : "false";
      return;
    case Value::Type::kNumber:
      if (!std::isfinite(value.number_value)) {
        out_ += "null";
        return;
      }
      out_ += FormatNumber(value.number_value);
      return;
    case Value::Type::kBigInt:
      out_ += value.string_value.empty() ? "0" : value.string_value;
      return;
    case Value::Type::kString:
      WriteString(value.string_value);
      return;
    case Value::Type::kDate:
      WriteDate(value);
      return;
    case Value::Type::kArray:
    case Value::Type::kObject:
      WriteContainer(value);
      return;
    }
  }

private:
  void WriteString(std::string_view text) {
    out_.push_back('"');
    AppendEscapedJson(out_, text);
    out_.push_back('"');
  }

  void WriteDate(const Value& value) {
    if (!value.date_value.has_value()) {
      out_ += "null";
      return;
    }
    const std::string formatted = FormatUtcTimestamp(*value.date_value);
    if (formatted.empty()) {
      out_ += "null";
      return;
    }
    WriteString(formatted);
  }

  void WriteContainer(const Value& value) {
    const void* identity = value.Identity();
    if (identity == nullptr) {
      out_ += "null";
      return;
    }
    if (active_.count(identity) != 0U) {
      WriteString(kCircularMarker);
      return;
    }
    active_.insert(identity);

    if (value.IsArray()) {
      out_.push_back('[');
      bool first = true;
      for (const auto& item : value.array_value->items) {
        if (!first) {
          out_.push_back(',');
        }
        Write(item);
        first = false;
      }
      out_.push_back(']');
    } else {
      out_.push_back('{');
      bool first = true;
      for (const auto& [key, member] : value.object_value->members) {
        if (IsOmittedInObject(member)) {
          continue;
        }
        if (!first) {
          out_.push_back(',');
        }
        WriteString(key);
        out_.push_back(':');
        Write(member);
        first = false;
      }
      out_.push_back('}');
    }

    active_.erase(identity);
  }

  std::string& out_;
  std::unordered_set<const void*> active_;
};

} // namespace

std::string FormatNumber(double number) {
  if (std::isnan(number)) {
    return "NaN";
  }
  if (std::isinf(number)) {
    return number > 0 ? "Infinity" : "-Infinity";
  }
  if (number == 0.0) {
    return "0";
  }

  std::array<char, 64> buffer{};
  const double magnitude = std::fabs(number);
  const bool plain = magnitude >= 1e-6 && magnitude < 1e21;
  const auto [ptr, ec] =
      std::to_chars(buffer.data(), buffer.data() + buffer.size(), number,
                    plain ? std::chars_format::fixed : std::chars_format::scientific);
  if (ec != std::errc()) {
    return "null";
  }

  std::string text(buffer.data(), ptr);
  if (plain) {
    return text;
  }

  // to_chars pads the exponent to two digits ("e-07"); drop the padding.
  const std::size_t exponent_pos = text.find('e');
  if (exponent_pos == std::string::npos || exponent_pos + 2U >= text.size()) {
    return text;
  }
  std::size_t digits_pos = exponent_pos + 2U;
  while (digits_pos + 1U < text.size() && text[digits_pos] == '0') {
    text.erase(digits_pos, 1);
  }
  return text;
}

void AppendJson(const Value& value, std::string& out) {
  Writer writer(out);
  writer.Write(value);
}

std::string ToJson(const Value& value) {
  std::string out;
  AppendJson(value, out);
  return out;
}

std::size_t ByteSize(const Value& value) {
  return ToJson(value).size();
}

} // namespace mcpcat::core::json
