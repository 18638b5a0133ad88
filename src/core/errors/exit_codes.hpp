#pragma once

namespace mcpcat::core::errors {

// Process-exit contract for `mcpcat-scrub`:
// - 0 success
// - 1 command failed after valid invocation
// - 2 usage/argument failure
// - 10 some input lines were not valid events and were skipped
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInvalidInput = 10,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace mcpcat::core::errors
