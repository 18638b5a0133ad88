#include "scrub/normalizer.hpp"

#include "core/json_writer.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <limits>
#include <string>
#include <vector>

namespace json = mcpcat::core::json;
namespace scrub = mcpcat::scrub;

namespace {

json::Value NestedObjects(int levels) {
  json::Value leaf = json::MakeObject({{"leaf", json::MakeBool(true)}});
  for (int i = 1; i < levels; ++i) {
    leaf = json::MakeObject({{"next", leaf}});
  }
  return leaf;
}

} // namespace

TEST_CASE("Scalars without a JSON form become markers", "[scrub][normalizer]") {
  const json::Value input = json::MakeArray({
      json::MakeUndefined(),
      json::MakeNumber(std::numeric_limits<double>::quiet_NaN()),
      json::MakeNumber(std::numeric_limits<double>::infinity()),
      json::MakeNumber(-std::numeric_limits<double>::infinity()),
      json::MakeBigInt("9007199254740993"),
      json::MakeSymbol("token"),
      json::MakeSymbol(),
      json::MakeFunction("handler"),
      json::MakeFunction(),
      json::MakeDate(std::chrono::system_clock::time_point(std::chrono::seconds(0))),
      json::MakeInvalidDate(),
      json::MakeNull(),
      json::MakeBool(false),
      json::MakeNumber(2.5),
  });

  CHECK(json::ToJson(scrub::Normalize(input)) ==
        R"(["[undefined]","[NaN]","[Infinity]","[-Infinity]","[BigInt: 9007199254740993]",)"
        R"("[Symbol(token)]","[Symbol()]","[Function: handler]","[Function: <anonymous>]",)"
        R"("1970-01-01T00:00:00.000Z","[Invalid Date]",null,false,2.5])");
}

TEST_CASE("Long strings are cut to the limit plus an ellipsis", "[scrub][normalizer]") {
  const json::Value exact = json::MakeString(std::string(32'768, 'y'));
  CHECK(scrub::Normalize(exact).string_value.size() == 32'768U);

  const json::Value over = json::MakeString(std::string(40'000, 'z'));
  const std::string normalized = scrub::Normalize(over).string_value;
  CHECK(normalized.size() == 32'771U);
  CHECK(normalized.substr(32'768) == "...");

  CHECK(scrub::Normalize(over, 10, 100, 4).string_value == "zzzz...");
}

TEST_CASE("Self references are reported at the cyclic edge", "[scrub][normalizer]") {
  json::Value root = json::MakeObject({
      {"name", json::MakeString("loop")},
      {"count", json::MakeNumber(2)},
  });
  root.object_value->Set("self", root);

  CHECK(json::ToJson(scrub::Normalize(root)) ==
        R"({"name":"loop","count":2,"self":"[Circular ~]"})");

  root.object_value->members.clear();
}

TEST_CASE("Shared acyclic subtrees are normalized on every path", "[scrub][normalizer]") {
  const json::Value shared = json::MakeObject({{"x", json::MakeNumber(1)}});
  const json::Value root = json::MakeObject({{"a", shared}, {"b", shared}});

  const std::string rendered = json::ToJson(scrub::Normalize(root));
  CHECK(rendered == R"({"a":{"x":1},"b":{"x":1}})");
  CHECK(rendered.find("Circular") == std::string::npos);
}

TEST_CASE("Depth limit replaces deeper containers with a type marker", "[scrub][normalizer]") {
  const json::Value normalized = scrub::Normalize(NestedObjects(15), 5);

  const json::Value* node = &normalized;
  for (int level = 1; level < 5; ++level) {
    node = node->Find("next");
    REQUIRE(node != nullptr);
    REQUIRE(node->IsObject());
  }
  const json::Value* fifth = node->Find("next");
  REQUIRE(fifth != nullptr);
  CHECK(fifth->string_value == "[Object]");

  const json::Value arrays = json::MakeArray({json::MakeArray({json::MakeNumber(1)})});
  CHECK(json::ToJson(scrub::Normalize(arrays, 1)) == R"(["[Array]"])");
  CHECK(json::ToJson(scrub::Normalize(arrays, 0)) == R"("[Array]")");
}

TEST_CASE("Breadth limit appends a single sentinel", "[scrub][normalizer]") {
  json::Value wide = json::MakeObject();
  for (int i = 0; i < 150; ++i) {
    wide.object_value->members.emplace_back("key" + std::to_string(i), json::MakeNumber(i));
  }

  const json::Value normalized = scrub::Normalize(wide, 10, 5);
  const auto& members = normalized.object_value->members;
  REQUIRE(members.size() == 6U);
  for (std::size_t i = 0; i < 5U; ++i) {
    CHECK(members[i].first == "key" + std::to_string(i));
  }
  CHECK(members[5].first == "...");
  CHECK(members[5].second.string_value == "[MaxProperties ~]");

  std::vector<json::Value> items;
  for (int i = 0; i < 150; ++i) {
    items.push_back(json::MakeNumber(i));
  }
  const json::Value array = scrub::Normalize(json::MakeArray(items), 10, 5);
  REQUIRE(array.array_value->items.size() == 6U);
  CHECK(array.array_value->items[5].string_value == "[MaxProperties ~]");
}

TEST_CASE("Undefined object members are dropped, array holes are marked", "[scrub][normalizer]") {
  const json::Value input = json::MakeObject({
      {"gone", json::MakeUndefined()},
      {"kept", json::MakeArray({json::MakeUndefined()})},
  });
  CHECK(json::ToJson(scrub::Normalize(input)) == R"({"kept":["[undefined]"]})");
  CHECK(scrub::Normalize(json::MakeUndefined()).string_value == "[undefined]");
}

TEST_CASE("Normalize never aliases or mutates its input", "[scrub][normalizer]") {
  const json::Value input = json::MakeObject({
      {"list", json::MakeArray({json::MakeString(std::string(40'000, 'q'))})},
  });
  const std::string before = json::ToJson(input);

  const json::Value normalized = scrub::Normalize(input);
  CHECK(json::ToJson(input) == before);
  CHECK(normalized.Identity() != input.Identity());
  CHECK(normalized.Find("list")->Identity() != input.Find("list")->Identity());
}
