#include "scrub/truncator.hpp"

#include "core/json_writer.hpp"
#include "scrub/limits.hpp"
#include "scrub/sanitizer.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace json = mcpcat::core::json;
namespace scrub = mcpcat::scrub;
using mcpcat::events::Event;

namespace {

json::Value Frame(int index) {
  return json::MakeObject({
      {"filename", json::MakeString("frame" + std::to_string(index) + ".js")},
      {"function", json::MakeString("fn" + std::to_string(index))},
      {"lineno", json::MakeNumber(index)},
      {"in_app", json::MakeBool(true)},
  });
}

Event BaseEvent() {
  Event event;
  event.id = "evt_trunc";
  event.session_id = "ses_trunc";
  event.event_type = "mcp:tools/call";
  event.resource_name = "search";
  return event;
}

} // namespace

TEST_CASE("Metadata fields are cut at their limits", "[scrub][truncator]") {
  Event event = BaseEvent();
  event.user_intent = std::string(3'000, 'x');
  event.resource_name = std::string(300, 'r');
  event.server_name = std::string(256, 's');
  event.client_version = std::string(257, 'v');

  const Event truncated = scrub::TruncateEvent(event);

  REQUIRE(truncated.user_intent.has_value());
  CHECK(truncated.user_intent->size() == 2'051U);
  CHECK(truncated.user_intent->substr(2'048) == "...");
  CHECK(truncated.resource_name->size() == 259U);
  CHECK(*truncated.server_name == std::string(256, 's'));
  CHECK(*truncated.client_version == std::string(256, 'v') + "...");
  CHECK_FALSE(truncated.client_name.has_value());
  CHECK(truncated.session_id == event.session_id);
}

TEST_CASE("Stack frames keep the first and last twenty-five", "[scrub][truncator]") {
  std::vector<json::Value> frames;
  for (int i = 0; i < 80; ++i) {
    frames.push_back(Frame(i));
  }

  Event event = BaseEvent();
  event.error = json::MakeObject({
      {"message", json::MakeString(std::string(5'000, 'm'))},
      {"frames", json::MakeArray(frames)},
  });

  const Event truncated = scrub::TruncateEvent(event);

  const auto& kept = truncated.error.Find("frames")->array_value->items;
  REQUIRE(kept.size() == 50U);
  for (std::size_t i = 0; i < 25U; ++i) {
    CHECK(json::Equals(kept[i], frames[i]));
  }
  for (std::size_t i = 25; i < 50U; ++i) {
    CHECK(json::Equals(kept[i], frames[i + 30U]));
  }
  CHECK(truncated.error.Find("message")->string_value.size() == 2'051U);
}

TEST_CASE("Fifty frames or fewer are left alone", "[scrub][truncator]") {
  std::vector<json::Value> frames;
  for (int i = 0; i < 50; ++i) {
    frames.push_back(Frame(i));
  }
  Event event = BaseEvent();
  event.error = json::MakeObject({{"frames", json::MakeArray(frames)}});

  const Event truncated = scrub::TruncateEvent(event);
  CHECK(truncated.error.Find("frames")->array_value->items.size() == 50U);
}

TEST_CASE("Sanitize then truncate bounds a mixed oversized event", "[scrub][truncator]") {
  Event event = BaseEvent();
  event.user_intent = std::string(3'000, 'x');
  event.parameters = json::MakeObject({
      {"imageData", json::MakeString(std::string(12'000, 'A') + "=")},
  });
  event.response = json::MakeObject({
      {"content",
       json::MakeArray({
           json::MakeObject({
               {"type", json::MakeString("text")},
               {"text", json::MakeString(std::string(40'000, 'z'))},
           }),
           json::MakeObject({
               {"type", json::MakeString("image")},
               {"data", json::MakeString("...")},
               {"mimeType", json::MakeString("image/png")},
           }),
       })},
  });

  const Event result = scrub::TruncateEvent(scrub::SanitizeEvent(event));

  REQUIRE(result.user_intent.has_value());
  CHECK(result.user_intent->size() == 2'051U);
  CHECK(result.user_intent->substr(2'048) == "...");
  CHECK(result.parameters.Find("imageData")->string_value ==
        std::string(scrub::kBinaryDataRedacted));

  const auto& content = result.response.Find("content")->array_value->items;
  REQUIRE(content.size() == 2U);
  CHECK(content[0].Find("text")->string_value.size() <= 32'771U);
  CHECK(json::Equals(content[1], json::MakeObject({
                                     {"type", json::MakeString("text")},
                                     {"text", json::MakeString(std::string(scrub::kImageRedacted))},
                                 })));
  CHECK(mcpcat::events::ByteSize(result) <= scrub::kMaxEventBytes);
}

TEST_CASE("Oversized nesting is resolved by the depth sweep", "[scrub][truncator]") {
  std::vector<json::Value> items;
  for (int i = 0; i < 100; ++i) {
    items.push_back(json::MakeObject({
        {"inner", json::MakeObject({{"body", json::MakeString(std::string(2'000, 'b'))}})},
    }));
  }
  Event event = BaseEvent();
  event.parameters = json::MakeArray(items);
  REQUIRE(mcpcat::events::ByteSize(event) > scrub::kMaxEventBytes);

  scrub::TruncationReport report;
  const Event truncated = scrub::TruncateEvent(event, report);

  CHECK(report.initial_bytes > scrub::kMaxEventBytes);
  CHECK(report.depth_used == 2);
  CHECK(report.surgery_passes == 0);
  CHECK(report.within_budget);
  CHECK(report.final_bytes == mcpcat::events::ByteSize(truncated));
  CHECK(report.final_bytes <= scrub::kMaxEventBytes);
  CHECK(truncated.parameters.array_value->items[0].Find("inner")->string_value == "[Object]");
}

TEST_CASE("Largest-field surgery shortens top-level strings", "[scrub][truncator]") {
  Event event = BaseEvent();
  event.parameters = json::MakeObject();
  for (int i = 0; i < 10; ++i) {
    event.parameters.object_value->members.emplace_back(
        "field" + std::to_string(i), json::MakeString(std::string(20'000, static_cast<char>('a' + i))));
  }

  scrub::TruncationReport report;
  const Event truncated = scrub::TruncateEvent(event, report);

  CHECK(report.depth_used == 1);
  CHECK(report.surgery_passes >= 1);
  CHECK(report.within_budget);
  CHECK(mcpcat::events::ByteSize(truncated) <= scrub::kMaxEventBytes);

  const json::Value* first = truncated.parameters.Find("field0");
  REQUIRE(first != nullptr);
  CHECK(first->string_value.size() < 20'000U);
  CHECK(first->string_value.substr(first->string_value.size() - 3) == "...");
}

TEST_CASE("Events without long strings are returned best-effort", "[scrub][truncator]") {
  Event event = BaseEvent();
  event.parameters = json::MakeObject();
  for (int i = 0; i < 100; ++i) {
    event.parameters.object_value->members.emplace_back(
        std::string(1'100, 'k') + std::to_string(i), json::MakeNumber(i));
  }

  scrub::TruncationReport report;
  const Event truncated = scrub::TruncateEvent(event, report);

  CHECK_FALSE(report.within_budget);
  CHECK(report.final_bytes > scrub::kMaxEventBytes);
  CHECK(truncated.parameters.object_value->members.size() == 100U);
}

TEST_CASE("Cyclic oversized input still yields a bounded event", "[scrub][truncator]") {
  json::Value root = json::MakeObject();
  for (int i = 0; i < 8; ++i) {
    root.object_value->members.emplace_back("blob" + std::to_string(i),
                                            json::MakeString(std::string(30'000, 'c')));
  }
  root.object_value->Set("self", root);
  root.object_value->Set("list", json::MakeArray({root}));

  Event event = BaseEvent();
  event.parameters = root;
  event.identify_actor_data = root;

  const Event truncated = scrub::TruncateEvent(event);
  CHECK(mcpcat::events::ByteSize(truncated) <= scrub::kMaxEventBytes);
  CHECK(truncated.parameters.Find("self")->string_value == "[Circular ~]");

  event.parameters = json::MakeUndefined();
  event.identify_actor_data = json::MakeUndefined();
  root.object_value->members.clear();
}

TEST_CASE("Truncation is idempotent for events within limits", "[scrub][truncator]") {
  Event event = BaseEvent();
  event.user_intent = "find the weather";
  event.parameters = json::MakeObject({
      {"city", json::MakeString("Oslo")},
      {"days", json::MakeNumber(3)},
      {"tags", json::MakeArray({json::MakeString("a"), json::MakeNull()})},
  });

  const Event once = scrub::TruncateEvent(event);
  const Event twice = scrub::TruncateEvent(once);

  CHECK(mcpcat::events::ToJson(once) == mcpcat::events::ToJson(event));
  CHECK(mcpcat::events::ToJson(twice) == mcpcat::events::ToJson(once));
}

TEST_CASE("Truncation never mutates its input", "[scrub][truncator]") {
  Event event = BaseEvent();
  event.user_intent = std::string(3'000, 'x');
  event.parameters = json::MakeObject({{"body", json::MakeString(std::string(50'000, 'p'))}});
  const std::string before = mcpcat::events::ToJson(event);

  const Event truncated = scrub::TruncateEvent(event);

  CHECK(mcpcat::events::ToJson(event) == before);
  CHECK(truncated.parameters.Identity() != event.parameters.Identity());
}
