#ifndef MCPCAT_CORE_TIME_UTILS_HPP_
#define MCPCAT_CORE_TIME_UTILS_HPP_

#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace mcpcat::core {

// Canonical ISO-8601 UTC form with millisecond precision, e.g.
// `2025-01-15T12:00:00.000Z`. Returns an empty string when the time point is
// outside what the platform calendar can represent.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  // Floor to whole seconds so pre-epoch instants keep a positive millisecond part.
  const auto floored_seconds = (millis_since_epoch - millis_component) / 1000;
  const auto epoch_seconds = static_cast<std::time_t>(floored_seconds);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

namespace detail {

inline bool ReadFixedInt(std::string_view text, std::size_t pos, std::size_t width, int& value) {
  if (pos + width > text.size()) {
    return false;
  }
  const char* first = text.data() + pos;
  const char* last = first + width;
  const auto [ptr, ec] = std::from_chars(first, last, value);
  return ec == std::errc() && ptr == last;
}

} // namespace detail

// Parses `YYYY-MM-DDTHH:MM:SS[.fraction]Z`. Fractions beyond milliseconds are
// truncated. Offsets other than `Z` are rejected.
inline bool ParseUtcTimestamp(std::string_view text, std::chrono::system_clock::time_point& out,
                              std::string& error) {
  std::tm utc_time{};
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;

  const bool shape_ok = text.size() >= 20U && text[4] == '-' && text[7] == '-' &&
                        (text[10] == 'T' || text[10] == 't') && text[13] == ':' &&
                        text[16] == ':';
  if (!shape_ok || !detail::ReadFixedInt(text, 0, 4, year) ||
      !detail::ReadFixedInt(text, 5, 2, month) || !detail::ReadFixedInt(text, 8, 2, day) ||
      !detail::ReadFixedInt(text, 11, 2, hour) || !detail::ReadFixedInt(text, 14, 2, minute) ||
      !detail::ReadFixedInt(text, 17, 2, second)) {
    error = "timestamp must look like YYYY-MM-DDTHH:MM:SS.sssZ: '" + std::string(text) + "'";
    return false;
  }

  std::size_t pos = 19;
  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int scale = 100;
    std::size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      millis += (text[pos] - '0') * scale;
      scale /= 10;
      ++pos;
      ++digits;
    }
    if (digits == 0U) {
      error = "timestamp fraction has no digits: '" + std::string(text) + "'";
      return false;
    }
  }

  if (pos + 1U != text.size() || (text[pos] != 'Z' && text[pos] != 'z')) {
    error = "timestamp must be UTC with a trailing 'Z': '" + std::string(text) + "'";
    return false;
  }

  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
    error = "timestamp field out of range: '" + std::string(text) + "'";
    return false;
  }

  utc_time.tm_year = year - 1900;
  utc_time.tm_mon = month - 1;
  utc_time.tm_mday = day;
  utc_time.tm_hour = hour;
  utc_time.tm_min = minute;
  utc_time.tm_sec = second;

#if defined(_WIN32)
  const std::time_t epoch_seconds = _mkgmtime(&utc_time);
#else
  const std::time_t epoch_seconds = timegm(&utc_time);
#endif

  out = std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds)) +
        std::chrono::milliseconds(millis);
  return true;
}

} // namespace mcpcat::core

#endif // MCPCAT_CORE_TIME_UTILS_HPP_
