#pragma once

#include "core/json_value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcpcat::events {

// Structured failure info as captured by the error-capture layer. Frames are
// ordered oldest call first.
struct StackFrame {
  std::string filename;
  std::optional<std::string> abs_path;
  std::string function;
  std::optional<std::uint32_t> lineno;
  std::optional<std::uint32_t> colno;
  bool in_app = false;
  std::optional<std::string> context_line;
};

struct ChainedErrorData {
  std::string message;
  std::optional<std::string> type;
  std::optional<std::string> stack;
  std::optional<std::vector<StackFrame>> frames;
};

struct ErrorData {
  std::string message;
  std::optional<std::string> type;
  std::optional<std::string> stack;
  std::optional<std::vector<StackFrame>> frames;
  std::optional<std::vector<ChainedErrorData>> chained_errors;
};

// Tree form stored in `Event::error`, snake_case keys as exported.
core::json::Value ToValue(const StackFrame& frame);
core::json::Value ToValue(const ErrorData& error);

} // namespace mcpcat::events
