#pragma once

#include "core/json_value.hpp"
#include "events/event_model.hpp"

#include <string>
#include <string_view>

namespace mcpcat::scrub {

// Replaces content the backend cannot store with fixed redaction markers.
//
// - `response.content` blocks: text and resource_link pass through; image and
//   audio become text markers; resource blocks carrying a `blob` become a
//   marker; any other tag becomes a marker naming the tag.
// - `response.structuredContent` and `parameters`: large base64-looking
//   strings are replaced.
//
// Never throws and never mutates `event`; absent or malformed fields pass
// through unchanged.
events::Event SanitizeEvent(const events::Event& event);

// Scanner applied to `parameters` and `structuredContent`. Exposed for tests.
core::json::Value SanitizeParameters(const core::json::Value& value);

// True when `text` is at least the size gate long and consists only of the
// base64 alphabet (line breaks allowed) followed by optional `=` padding.
bool LooksLikeLargeBase64(std::string_view text);

// Marker for an unrecognized content block type tag.
std::string UnsupportedContentMarker(std::string_view type_name);

} // namespace mcpcat::scrub
