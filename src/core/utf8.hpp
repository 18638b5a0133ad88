#ifndef MCPCAT_CORE_UTF8_HPP_
#define MCPCAT_CORE_UTF8_HPP_

#include <cstddef>
#include <string>
#include <string_view>

namespace mcpcat::core::utf8 {

// Character limits throughout the scrubber count code points of UTF-8 text.
// A byte that cannot start a well-formed sequence counts as one code point on
// its own, so counting and cutting never read past the end of the input.

inline std::size_t SequenceLength(std::string_view text, std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 1U;
  if (lead >= 0xF0U && lead <= 0xF4U) {
    length = 4U;
  } else if (lead >= 0xE0U) {
    length = lead <= 0xEFU ? 3U : 1U;
  } else if (lead >= 0xC2U) {
    length = 2U;
  }

  if (pos + length > text.size()) {
    return 1U;
  }
  for (std::size_t i = 1; i < length; ++i) {
    const auto continuation = static_cast<unsigned char>(text[pos + i]);
    if ((continuation & 0xC0U) != 0x80U) {
      return 1U;
    }
  }
  return length;
}

inline std::size_t CodePointLength(std::string_view text) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    pos += SequenceLength(text, pos);
    ++count;
  }
  return count;
}

// Byte offset of the first `count` code points, or text.size() when shorter.
inline std::size_t PrefixBytes(std::string_view text, std::size_t count) {
  std::size_t pos = 0;
  for (std::size_t seen = 0; seen < count && pos < text.size(); ++seen) {
    pos += SequenceLength(text, pos);
  }
  return pos;
}

inline constexpr std::string_view kTruncationSuffix = "...";

// Returns `text` unchanged when it fits in `limit` code points, otherwise its
// first `limit` code points followed by "...".
inline std::string TruncateWithSuffix(std::string_view text, std::size_t limit) {
  // Fewer bytes than the limit means fewer code points too.
  if (text.size() <= limit) {
    return std::string(text);
  }

  const std::size_t cut = PrefixBytes(text, limit);
  if (cut == text.size()) {
    return std::string(text);
  }

  std::string truncated(text.substr(0, cut));
  truncated += kTruncationSuffix;
  return truncated;
}

} // namespace mcpcat::core::utf8

#endif // MCPCAT_CORE_UTF8_HPP_
