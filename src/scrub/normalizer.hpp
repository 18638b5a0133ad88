#pragma once

#include "core/json_value.hpp"
#include "scrub/limits.hpp"

#include <cstddef>

namespace mcpcat::scrub {

struct NormalizeLimits {
  int depth = kMaxDepth;
  std::size_t breadth = kMaxBreadth;
  std::size_t string_length = kMaxStringLength;
};

// Converts an arbitrary value tree into a bounded, acyclic tree that renders
// to JSON without loss of shape information:
//
//   undefined        -> "[undefined]"      NaN / +-Infinity -> "[NaN]" / "[Infinity]" / "[-Infinity]"
//   big integer      -> "[BigInt: <n>]"    symbol           -> "[Symbol(<desc>)]" / "[Symbol()]"
//   function         -> "[Function: <name>]" / "[Function: <anonymous>]"
//   date             -> ISO-8601 string, or "[Invalid Date]"
//   long string      -> first `string_length` code points + "..."
//
// Containers on the current path are replaced by "[Circular ~]". Containers
// reached with no depth left become "[Object]" / "[Array]". Past `breadth`
// entries a single "[MaxProperties ~]" sentinel is appended (as the last array
// element, or under key "..."). Object members holding undefined are dropped
// and do not count toward the breadth.
//
// The result never shares containers with `value`.
core::json::Value Normalize(const core::json::Value& value, const NormalizeLimits& limits = {});

inline core::json::Value Normalize(const core::json::Value& value, int depth,
                                   std::size_t breadth = kMaxBreadth,
                                   std::size_t string_length = kMaxStringLength) {
  return Normalize(value, NormalizeLimits{depth, breadth, string_length});
}

} // namespace mcpcat::scrub
