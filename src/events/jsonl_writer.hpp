#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <ostream>
#include <string>

namespace mcpcat::events {

// Appends the canonical JSON of `event` plus a newline to `path`.
//
// Contract:
// - Creates the parent directory of `path` if needed.
// - Opens the file in append mode.
// - Writes exactly one line per call.
// - Returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& path, std::string& error);

// Same line format, written to an already open stream (stdout for the CLI).
bool WriteEventJsonl(const Event& event, std::ostream& out, std::string& error);

} // namespace mcpcat::events
