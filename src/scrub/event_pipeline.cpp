#include "scrub/event_pipeline.hpp"

#include "scrub/sanitizer.hpp"

#include <string>
#include <utility>

namespace mcpcat::scrub {

namespace {

std::string EventLabel(const events::Event& event) {
  if (event.id.has_value()) {
    return *event.id;
  }
  if (event.event_id.has_value()) {
    return *event.event_id;
  }
  return "-";
}

} // namespace

bool PrepareEvent(const events::Event& event, const PipelineOptions& options, PreparedEvent& out,
                  std::string& error) {
  core::logging::Logger* logger = options.logger;
  if (logger != nullptr) {
    logger->SetEventId(EventLabel(event));
  }

  events::Event current = event;
  if (options.redact) {
    events::Event redacted;
    if (!RedactEvent(current, options.redact, redacted, error)) {
      if (logger != nullptr) {
        logger->Warn("event dropped by redaction",
                     {{"event_type", current.event_type.value_or("")}, {"error", error}});
        logger->SetEventId("-");
      }
      return false;
    }
    current = std::move(redacted);
  }

  current = SanitizeEvent(current);

  PreparedEvent prepared;
  prepared.event = TruncateEvent(current, prepared.report);

  if (logger != nullptr) {
    const std::string initial = std::to_string(prepared.report.initial_bytes);
    const std::string final_bytes = std::to_string(prepared.report.final_bytes);
    const std::string depth = std::to_string(prepared.report.depth_used);
    const std::string passes = std::to_string(prepared.report.surgery_passes);
    logger->Debug("event prepared", {{"initial_bytes", initial},
                                     {"final_bytes", final_bytes},
                                     {"depth", depth},
                                     {"surgery_passes", passes}});
    if (!prepared.report.within_budget) {
      logger->Warn("event exceeds byte ceiling after truncation",
                   {{"final_bytes", final_bytes},
                    {"max_bytes", std::to_string(kMaxEventBytes)}});
    }
    logger->SetEventId("-");
  }

  out = std::move(prepared);
  return true;
}

} // namespace mcpcat::scrub
