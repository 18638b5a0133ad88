#include "scrub/event_pipeline.hpp"

#include "core/json_writer.hpp"
#include "scrub/limits.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace json = mcpcat::core::json;
namespace scrub = mcpcat::scrub;
using mcpcat::core::logging::Logger;
using mcpcat::core::logging::LogLevel;
using mcpcat::events::Event;

namespace {

Event ToolCallEvent() {
  Event event;
  event.id = "evt_pipe";
  event.session_id = "ses_pipe";
  event.event_type = "mcp:tools/call";
  event.user_intent = std::string(3'000, 'u');
  event.parameters = json::MakeObject({
      {"token", json::MakeString("sk-live-123")},
      {"file", json::MakeString(std::string(15'000, 'Z'))},
  });
  event.response = json::MakeObject({
      {"content", json::MakeArray({json::MakeObject({
                      {"type", json::MakeString("audio")},
                      {"data", json::MakeString("UklGRg==")},
                  })})},
  });
  return event;
}

} // namespace

TEST_CASE("PrepareEvent runs sanitize and truncate without redaction", "[scrub][pipeline]") {
  scrub::PreparedEvent prepared;
  std::string error;
  REQUIRE(scrub::PrepareEvent(ToolCallEvent(), scrub::PipelineOptions{}, prepared, error));

  const Event& event = prepared.event;
  CHECK(event.user_intent->size() == 2'051U);
  CHECK(event.parameters.Find("token")->string_value == "sk-live-123");
  CHECK(event.parameters.Find("file")->string_value == std::string(scrub::kBinaryDataRedacted));
  CHECK(event.response.Find("content")->array_value->items[0].Find("text")->string_value ==
        std::string(scrub::kAudioRedacted));
  CHECK(prepared.report.within_budget);
  CHECK(prepared.report.final_bytes == mcpcat::events::ByteSize(event));
}

TEST_CASE("Redaction runs before sanitization", "[scrub][pipeline]") {
  scrub::PipelineOptions options;
  options.redact = [](std::string_view text) -> std::string {
    if (text.rfind("sk-", 0) == 0) {
      return "[REDACTED]";
    }
    return std::string(text);
  };

  scrub::PreparedEvent prepared;
  std::string error;
  REQUIRE(scrub::PrepareEvent(ToolCallEvent(), options, prepared, error));

  CHECK(prepared.event.parameters.Find("token")->string_value == "[REDACTED]");
  CHECK(prepared.event.parameters.Find("file")->string_value ==
        std::string(scrub::kBinaryDataRedacted));
  CHECK(prepared.event.session_id == "ses_pipe");
}

TEST_CASE("A failing redaction drops the event and logs a warning", "[scrub][pipeline]") {
  std::ostringstream log_stream;
  Logger logger(LogLevel::kDebug, log_stream);

  scrub::PipelineOptions options;
  options.logger = &logger;
  options.redact = [](std::string_view) -> std::string {
    throw std::runtime_error("pii service down");
  };

  scrub::PreparedEvent prepared;
  prepared.event.id = "previous";
  std::string error;
  CHECK_FALSE(scrub::PrepareEvent(ToolCallEvent(), options, prepared, error));
  CHECK(prepared.event.id == "previous");
  CHECK(error.find("pii service down") != std::string::npos);

  const std::string logs = log_stream.str();
  CHECK(logs.find("level=WARN") != std::string::npos);
  CHECK(logs.find(R"(event_id="evt_pipe")") != std::string::npos);
  CHECK(logs.find(R"(msg="event dropped by redaction")") != std::string::npos);
  CHECK(logger.EventId() == "-");
}

TEST_CASE("Successful preparation logs sizes at debug level", "[scrub][pipeline]") {
  std::ostringstream log_stream;
  Logger logger(LogLevel::kDebug, log_stream);
  scrub::PipelineOptions options;
  options.logger = &logger;

  scrub::PreparedEvent prepared;
  std::string error;
  REQUIRE(scrub::PrepareEvent(ToolCallEvent(), options, prepared, error));

  const std::string logs = log_stream.str();
  CHECK(logs.find("level=DEBUG") != std::string::npos);
  CHECK(logs.find(R"(msg="event prepared")") != std::string::npos);
  CHECK(logs.find("final_bytes=\"" + std::to_string(prepared.report.final_bytes) + "\"") !=
        std::string::npos);
  CHECK(logs.find("level=WARN") == std::string::npos);
}

TEST_CASE("Prepared events always respect the byte ceiling", "[scrub][pipeline]") {
  Event event = ToolCallEvent();
  json::Value wide = json::MakeObject();
  for (int i = 0; i < 300; ++i) {
    json::Value row = json::MakeArray();
    for (int j = 0; j < 30; ++j) {
      row.array_value->items.push_back(json::MakeString(std::string(150, 'r')));
    }
    wide.object_value->members.emplace_back("row" + std::to_string(i), row);
  }
  event.parameters.object_value->Set("rows", wide);
  event.identify_actor_data = json::MakeObject({{"bio", json::MakeString(std::string(90'000, 'b'))}});

  scrub::PreparedEvent prepared;
  std::string error;
  REQUIRE(scrub::PrepareEvent(event, scrub::PipelineOptions{}, prepared, error));
  CHECK(mcpcat::events::ByteSize(prepared.event) <= scrub::kMaxEventBytes);
}
