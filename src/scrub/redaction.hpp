#pragma once

#include "events/event_model.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace mcpcat::scrub {

// Host-supplied scrubber for sensitive text. May throw a std::exception to
// reject an event.
using RedactFunction = std::function<std::string(std::string_view)>;

// True for top-level event keys whose whole subtree is exempt from
// redaction (identifiers the backend needs for grouping).
bool IsProtectedField(std::string_view key);

// Applies `redact` to every string of the event outside the protected fields.
// Dates, numbers, booleans and null are kept as-is; object members holding a
// function or undefined are dropped.
//
// Returns false with `error` set when `redact` throws; `redacted` is left
// untouched in that case.
bool RedactEvent(const events::Event& event, const RedactFunction& redact,
                 events::Event& redacted, std::string& error);

} // namespace mcpcat::scrub
