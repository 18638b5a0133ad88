#ifndef MCPCAT_CORE_JSON_WRITER_HPP_
#define MCPCAT_CORE_JSON_WRITER_HPP_

#include "core/json_value.hpp"

#include <cstddef>
#include <string>

namespace mcpcat::core::json {

// Canonical JSON rendering. This is the form the event byte ceiling is
// measured against.
//
// - Object members holding undefined, a function or a symbol are omitted;
//   inside arrays those kinds render as null.
// - NaN and infinities render as null; dates as ISO-8601 strings (invalid
//   dates as null); big integers as bare digits.
// - A container reached again while it is still being rendered renders as
//   "[Circular ~]", so rendering terminates on any input.
std::string ToJson(const Value& value);
void AppendJson(const Value& value, std::string& out);

// Shortest round-trip decimal form: integers print without a fraction and
// magnitudes outside [1e-6, 1e21) use exponent form such as `1e+21`.
std::string FormatNumber(double number);

// UTF-8 byte length of the canonical rendering.
std::size_t ByteSize(const Value& value);

} // namespace mcpcat::core::json

#endif // MCPCAT_CORE_JSON_WRITER_HPP_
