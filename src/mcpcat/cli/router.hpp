#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <string>

namespace mcpcat::cli {

// Options for `mcpcat-scrub scrub`.
struct ScrubOptions {
  // Input JSONL path, or "-" for stdin.
  std::string input_path;
  // Empty means stdout.
  std::filesystem::path output_path;
  bool fail_fast = false;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Routes `mcpcat-scrub` subcommands and returns process exit codes with a
// stable contract for scripts and CI:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => finished, but some input lines were not valid events
int Dispatch(int argc, char** argv);

} // namespace mcpcat::cli
