#include "core/json_value.hpp"

#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

using mcpcat::core::json::DeepCopy;
using mcpcat::core::json::Equals;
using mcpcat::core::json::MakeArray;
using mcpcat::core::json::MakeNumber;
using mcpcat::core::json::MakeObject;
using mcpcat::core::json::MakeString;
using mcpcat::core::json::Value;

TEST_CASE("Object Set replaces existing keys in place", "[core][json]") {
  Value object = MakeObject({
      {"a", MakeNumber(1)},
      {"b", MakeNumber(2)},
  });
  object.object_value->Set("a", MakeString("one"));
  object.object_value->Set("c", MakeNumber(3));

  const auto& members = object.object_value->members;
  REQUIRE(members.size() == 3U);
  CHECK(members[0].first == "a");
  CHECK(members[0].second.string_value == "one");
  CHECK(members[1].first == "b");
  CHECK(members[2].first == "c");
}

TEST_CASE("DeepCopy never aliases the source containers", "[core][json]") {
  Value shared = MakeObject({{"x", MakeNumber(1)}});
  Value root = MakeObject({{"a", shared}, {"b", shared}});

  const Value copy = DeepCopy(root);
  REQUIRE(Equals(copy, root));
  CHECK(copy.Identity() != root.Identity());

  const Value* a = copy.Find("a");
  const Value* b = copy.Find("b");
  REQUIRE(a != nullptr);
  REQUIRE(b != nullptr);
  CHECK(a->Identity() != shared.Identity());
  // Sharing in the source is kept among the copies.
  CHECK(a->Identity() == b->Identity());
}

TEST_CASE("DeepCopy reproduces cycles", "[core][json]") {
  Value root = MakeObject({{"name", MakeString("loop")}});
  root.object_value->Set("self", root);

  Value copy = DeepCopy(root);
  const Value* self = copy.Find("self");
  REQUIRE(self != nullptr);
  CHECK(self->Identity() == copy.Identity());
  CHECK(Equals(copy, root));

  copy.object_value->members.clear();
  root.object_value->members.clear();
}

TEST_CASE("Equals treats NaN as equal and respects member order", "[core][json]") {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  CHECK(Equals(MakeArray({MakeNumber(nan)}), MakeArray({MakeNumber(nan)})));

  const Value ab = MakeObject({{"a", MakeNumber(1)}, {"b", MakeNumber(2)}});
  const Value ba = MakeObject({{"b", MakeNumber(2)}, {"a", MakeNumber(1)}});
  CHECK_FALSE(Equals(ab, ba));
}
