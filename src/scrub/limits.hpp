#pragma once

#include <cstddef>
#include <string_view>

namespace mcpcat::scrub {

// Fixed scrub limits. Character limits count code points.

// Sanitizer: strings shorter than this skip the base64 check.
inline constexpr std::size_t kBase64SizeGate = 10'240;

// Ceiling on the canonical JSON size of an exported event, in bytes.
inline constexpr std::size_t kMaxEventBytes = 102'400;

// Normalizer defaults.
inline constexpr int kMaxDepth = 10;
inline constexpr std::size_t kMaxBreadth = 100;
inline constexpr std::size_t kMaxStringLength = 32'768;

// Field-level limits.
inline constexpr std::size_t kMaxUserIntentLength = 2'048;
inline constexpr std::size_t kMaxErrorMessageLength = 2'048;
inline constexpr std::size_t kMaxResourceNameLength = 256;
inline constexpr std::size_t kMaxMetadataLength = 256;
inline constexpr std::size_t kMaxStackFrames = 50;
inline constexpr std::size_t kMaxContentTextLength = 32'768;

// Largest-field surgery.
inline constexpr std::size_t kSurgeryMinStringLength = 100;
inline constexpr int kSurgeryMaxPasses = 10;
inline constexpr std::size_t kSurgeryOverheadBytes = 200;
inline constexpr std::size_t kSurgeryMinReduction = 10;

// Redaction markers.
inline constexpr std::string_view kImageRedacted =
    "[image content redacted - not supported by MCPcat]";
inline constexpr std::string_view kAudioRedacted =
    "[audio content redacted - not supported by MCPcat]";
inline constexpr std::string_view kBinaryResourceRedacted =
    "[binary resource content redacted - not supported by MCPcat]";
inline constexpr std::string_view kBinaryDataRedacted =
    "[binary data redacted - not supported by MCPcat]";

// Sentinel markers.
inline constexpr std::string_view kCircularMarker = "[Circular ~]";
inline constexpr std::string_view kMaxPropertiesMarker = "[MaxProperties ~]";
inline constexpr std::string_view kMaxPropertiesKey = "...";
inline constexpr std::string_view kObjectMarker = "[Object]";
inline constexpr std::string_view kArrayMarker = "[Array]";
inline constexpr std::string_view kUndefinedMarker = "[undefined]";

} // namespace mcpcat::scrub
