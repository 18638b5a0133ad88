#pragma once

#include "core/logging/logger.hpp"
#include "events/event_model.hpp"
#include "scrub/redaction.hpp"
#include "scrub/truncator.hpp"

#include <string>

namespace mcpcat::scrub {

struct PipelineOptions {
  // Optional. Runs before sanitization when set.
  RedactFunction redact;
  // Optional, non-owning.
  core::logging::Logger* logger = nullptr;
};

struct PreparedEvent {
  events::Event event;
  TruncationReport report;
};

// Readies one event for export: redact (when configured), then sanitize, then
// truncate.
//
// Returns false with `error` populated when redaction rejects the event; the
// caller drops it. `out` is only written on success.
bool PrepareEvent(const events::Event& event, const PipelineOptions& options, PreparedEvent& out,
                  std::string& error);

} // namespace mcpcat::scrub
