#include "scrub/truncator.hpp"

#include "core/json_writer.hpp"
#include "core/utf8.hpp"
#include "scrub/normalizer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace mcpcat::scrub {

namespace {

using core::json::Value;
using events::Event;

void LimitField(std::optional<std::string>& field, std::size_t limit) {
  if (field.has_value()) {
    *field = core::utf8::TruncateWithSuffix(*field, limit);
  }
}

Value LimitStackFrames(const Value& frames) {
  if (!frames.IsArray() || frames.array_value->items.size() <= kMaxStackFrames) {
    return frames;
  }

  const auto& items = frames.array_value->items;
  const std::size_t half = kMaxStackFrames / 2;
  std::vector<Value> kept(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(half));
  kept.insert(kept.end(), items.end() - static_cast<std::ptrdiff_t>(half), items.end());
  return core::json::MakeArray(std::move(kept));
}

Value LimitErrorFields(const Value& error) {
  if (!error.IsObject()) {
    return error;
  }

  Value result = core::json::MakeObject();
  result.object_value->members = error.object_value->members;

  if (Value* message = result.object_value->Find("message"); message != nullptr && message->IsString()) {
    *message = core::json::MakeString(
        core::utf8::TruncateWithSuffix(message->string_value, kMaxErrorMessageLength));
  }
  if (Value* frames = result.object_value->Find("frames"); frames != nullptr) {
    *frames = LimitStackFrames(*frames);
  }
  return result;
}

Value LimitTextBlock(const Value& block) {
  if (!block.IsObject()) {
    return block;
  }
  const Value* type = block.Find("type");
  const Value* text = block.Find("text");
  if (type == nullptr || !type->IsString() || type->string_value != "text" || text == nullptr ||
      !text->IsString()) {
    return block;
  }

  std::string limited = core::utf8::TruncateWithSuffix(text->string_value, kMaxContentTextLength);
  if (limited.size() == text->string_value.size()) {
    return block;
  }

  Value result = core::json::MakeObject();
  result.object_value->members = block.object_value->members;
  result.object_value->Set("text", core::json::MakeString(std::move(limited)));
  return result;
}

Value LimitResponseContent(const Value& response) {
  if (!response.IsObject()) {
    return response;
  }

  Value result = core::json::MakeObject();
  result.object_value->members = response.object_value->members;

  Value* content = result.object_value->Find("content");
  if (content != nullptr && content->IsArray()) {
    Value mapped = core::json::MakeArray();
    mapped.array_value->items.reserve(content->array_value->items.size());
    for (const auto& block : content->array_value->items) {
      mapped.array_value->items.push_back(LimitTextBlock(block));
    }
    *content = std::move(mapped);
  }
  return result;
}

Event ApplyFieldLimits(const Event& event) {
  Event result = event;

  LimitField(result.user_intent, kMaxUserIntentLength);
  LimitField(result.resource_name, kMaxResourceNameLength);
  LimitField(result.server_name, kMaxMetadataLength);
  LimitField(result.server_version, kMaxMetadataLength);
  LimitField(result.client_name, kMaxMetadataLength);
  LimitField(result.client_version, kMaxMetadataLength);

  result.error = LimitErrorFields(result.error);
  result.response = LimitResponseContent(result.response);
  return result;
}

Event NormalizeTrees(const Event& event, int depth) {
  Event result = event;
  for (Value* tree :
       {&result.parameters, &result.response, &result.identify_actor_data, &result.error}) {
    if (!tree->IsNullish()) {
      *tree = Normalize(*tree, depth);
    }
  }
  return result;
}

struct StringSlot {
  std::string* text = nullptr;
  std::size_t length = 0;
};

// Collects strings longer than the surgery threshold in canonical key order.
class LongStringCollector {
public:
  explicit LongStringCollector(std::vector<StringSlot>& slots) : slots_(slots) {}

  void Collect(Value& value) {
    if (value.IsString()) {
      const std::size_t length = core::utf8::CodePointLength(value.string_value);
      if (length > kSurgeryMinStringLength) {
        slots_.push_back({&value.string_value, length});
      }
      return;
    }
    if (!value.IsContainer() || active_.count(value.Identity()) != 0U) {
      return;
    }

    active_.insert(value.Identity());
    if (value.IsArray()) {
      for (auto& item : value.array_value->items) {
        Collect(item);
      }
    } else {
      for (auto& member : value.object_value->members) {
        Collect(member.second);
      }
    }
    active_.erase(value.Identity());
  }

private:
  std::vector<StringSlot>& slots_;
  std::unordered_set<const void*> active_;
};

// Shortens the longest strings of `tree` in place. Returns the number of
// passes that made progress.
int TruncateLargestFields(Value& tree) {
  int productive_passes = 0;

  for (int pass = 0; pass < kSurgeryMaxPasses; ++pass) {
    const std::size_t current = core::json::ByteSize(tree);
    if (current <= kMaxEventBytes) {
      break;
    }

    std::vector<StringSlot> slots;
    LongStringCollector collector(slots);
    collector.Collect(tree);
    if (slots.empty()) {
      break;
    }
    std::stable_sort(slots.begin(), slots.end(), [](const StringSlot& lhs, const StringSlot& rhs) {
      return lhs.length > rhs.length;
    });

    auto remaining = static_cast<std::int64_t>(current - kMaxEventBytes + kSurgeryOverheadBytes);
    bool truncated = false;

    for (const auto& slot : slots) {
      if (remaining <= 0) {
        break;
      }
      const auto reduction =
          std::min<std::int64_t>(remaining, static_cast<std::int64_t>(slot.length / 2));
      if (reduction < static_cast<std::int64_t>(kSurgeryMinReduction)) {
        continue;
      }

      const std::size_t new_length = slot.length - static_cast<std::size_t>(reduction);
      std::string& text = *slot.text;
      text.resize(core::utf8::PrefixBytes(text, new_length));
      text += core::utf8::kTruncationSuffix;
      remaining -= reduction;
      truncated = true;
    }

    if (!truncated) {
      break;
    }
    ++productive_passes;
  }

  return productive_passes;
}

Event EnforceByteBudget(const Event& event, TruncationReport& report) {
  report.initial_bytes = events::ByteSize(event);
  if (report.initial_bytes <= kMaxEventBytes) {
    report.final_bytes = report.initial_bytes;
    report.depth_used = kMaxDepth;
    return event;
  }

  for (int depth = kMaxDepth - 1; depth >= 1; --depth) {
    Event candidate = NormalizeTrees(event, depth);
    const std::size_t size = events::ByteSize(candidate);
    if (size <= kMaxEventBytes) {
      report.final_bytes = size;
      report.depth_used = depth;
      return candidate;
    }
  }

  // Normalized output is acyclic, and DeepCopy is cycle-safe regardless.
  const Event minimal = NormalizeTrees(event, 1);
  Value tree = core::json::DeepCopy(events::ToValue(minimal));
  report.depth_used = 1;
  report.surgery_passes = TruncateLargestFields(tree);

  Event result;
  std::string error;
  if (!events::FromValue(tree, result, error)) {
    // Surgery only shortens strings, so the object form always reads back.
    result = minimal;
  }

  report.final_bytes = events::ByteSize(result);
  report.within_budget = report.final_bytes <= kMaxEventBytes;
  return result;
}

} // namespace

Event TruncateEvent(const Event& event) {
  TruncationReport report;
  return TruncateEvent(event, report);
}

Event TruncateEvent(const Event& event, TruncationReport& report) {
  report = TruncationReport{};
  const Event layered = NormalizeTrees(ApplyFieldLimits(event), kMaxDepth);
  return EnforceByteBudget(layered, report);
}

} // namespace mcpcat::scrub
