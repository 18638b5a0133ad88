#pragma once

#include "events/event_model.hpp"
#include "scrub/limits.hpp"

#include <cstddef>

namespace mcpcat::scrub {

// Outcome of one TruncateEvent call, for logging and tests.
//
// - `initial_bytes`: size after field limits and normalization.
// - `depth_used`: normalization depth of the returned event (kMaxDepth when
//   no reduction was needed, 1 when surgery ran).
// - `surgery_passes`: largest-field passes that shortened at least one string.
// - `within_budget`: false only when surgery ran out of strings to shorten.
struct TruncationReport {
  std::size_t initial_bytes = 0;
  std::size_t final_bytes = 0;
  int depth_used = kMaxDepth;
  int surgery_passes = 0;
  bool within_budget = true;
};

// Bounds the size of an event in three layers:
//
// 1. Field limits: userIntent and error.message to 2048 code points,
//    resourceName and the server/client name/version fields to 256, text
//    content blocks to 32768 (each "..."-suffixed when cut), and error.frames
//    to the first 25 plus the last 25 when longer than 50.
// 2. Normalize parameters, response, identifyActorData and error with the
//    default limits.
// 3. When the canonical JSON still exceeds kMaxEventBytes, re-normalize those
//    trees at depth 9 down to 1 and return the first candidate that fits;
//    failing that, repeatedly halve the longest strings of the depth-1
//    candidate until the budget is met or nothing is left to shorten.
//
// The ceiling is a soft guarantee: an event with too few long strings to cut
// is returned best-effort with `within_budget` false. Never throws and never
// mutates `event`.
events::Event TruncateEvent(const events::Event& event);
events::Event TruncateEvent(const events::Event& event, TruncationReport& report);

} // namespace mcpcat::scrub
