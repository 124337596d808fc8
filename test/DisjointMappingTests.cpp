#include <catch2/catch.hpp>

#include "msx/core/exceptions.hpp"
#include "msx/registry/chained_range.hpp"
#include "msx/registry/disjoint_mapping.hpp"

#include <string>
#include <vector>

using msx::registry::ChainedRange;
using msx::registry::DisjointMapping;

TEST_CASE("Keys are unique across all groups", "[DisjointMapping]") {
  DisjointMapping<int> mapping;
  mapping.add_disjoint_group("a");
  mapping.add_disjoint_group("b");

  mapping.add_item_to_group("a", "x", 1);

  SECTION("Same key in another group") {
    CHECK_THROWS_AS(mapping.add_item_to_group("b", "x", 2), msx::core::KeyExistsError);
  }

  SECTION("Same key without a group") {
    CHECK_THROWS_AS(mapping.add_item_to_group(std::nullopt, "x", 2), msx::core::NameCollisionError);
  }

  SECTION("Failed insert leaves the mapping unchanged") {
    CHECK_THROWS(mapping.add_item_to_group("b", "x", 2));
    CHECK(mapping.at("x") == 1);
    CHECK(mapping.size() == 1);
    CHECK(mapping.group("b").empty());
  }
}

TEST_CASE("Groups partition the keys", "[DisjointMapping]") {
  DisjointMapping<std::string> mapping;
  mapping.add_disjoint_group("species");
  mapping.add_disjoint_group("terms");

  mapping.add_item_to_group("species", "A", "first");
  mapping.add_item_to_group("terms", "T", "term");
  mapping.add_item_to_group("species", "B", "second");
  mapping.add_item_to_group(std::nullopt, "free", "ungrouped");

  CHECK(mapping.group("species").keys() == std::vector<std::string>{"A", "B"});
  CHECK(mapping.group("terms").keys() == std::vector<std::string>{"T"});
  CHECK(mapping.keys() == std::vector<std::string>{"A", "T", "B", "free"});

  CHECK(mapping.group_of("B") == "species");
  CHECK_FALSE(mapping.group_of("free").has_value());
  CHECK(mapping.group("species").contains("A"));
  CHECK_FALSE(mapping.group("species").contains("T"));

  SECTION("Group views iterate values in insertion order") {
    std::vector<std::string> values;
    for (const auto& value : mapping.group("species")) {
      values.push_back(value);
    }
    CHECK(values == std::vector<std::string>{"first", "second"});
  }

  SECTION("Inserting through a group view") {
    mapping.group("terms").insert("U", "other");
    CHECK(mapping.group_of("U") == "terms");
    CHECK(mapping.size() == 5);
  }

  SECTION("Erase removes the key from its group") {
    CHECK(mapping.erase("A"));
    CHECK_FALSE(mapping.contains("A"));
    CHECK(mapping.group("species").keys() == std::vector<std::string>{"B"});
    CHECK_FALSE(mapping.erase("A"));
  }

  SECTION("Unknown groups") {
    CHECK_FALSE(mapping.has_group("constants"));
    CHECK_THROWS_AS(mapping.group("constants"), msx::core::UnknownReferenceError);
    CHECK_THROWS_AS(mapping.add_item_to_group("constants", "k", "x"), msx::core::UnknownReferenceError);
    CHECK_THROWS_AS(mapping.add_disjoint_group("species"), msx::core::InvalidValueError);
  }
}

TEST_CASE("Stored values keep their address", "[DisjointMapping]") {
  DisjointMapping<int> mapping;
  mapping.add_disjoint_group("g");
  int& first = mapping.add_item_to_group("g", "k0", 0);
  for (int i = 1; i < 200; ++i) {
    mapping.add_item_to_group("g", "k" + std::to_string(i), i);
  }
  first = 42;
  CHECK(mapping.at("k0") == 42);
  CHECK(mapping.find("missing") == nullptr);
  CHECK_THROWS_AS(mapping.at("missing"), msx::core::UnknownReferenceError);
}

TEST_CASE("Chained ranges are lazy and restartable", "[DisjointMapping]") {
  DisjointMapping<int> mapping;
  mapping.add_disjoint_group("a");
  mapping.add_disjoint_group("b");
  mapping.add_item_to_group("a", "x", 1);
  mapping.add_item_to_group("b", "y", 2);

  ChainedRange<int> range({{&mapping, &mapping.group("a").keys()}, {&mapping, &mapping.group("b").keys()}});

  auto collect = [&range] {
    std::vector<int> values;
    for (const int value : range) {
      values.push_back(value);
    }
    return values;
  };

  CHECK(collect() == std::vector<int>{1, 2});
  CHECK(collect() == std::vector<int>{1, 2});

  // Items added after the range was created show up on the next pass
  mapping.add_item_to_group("a", "z", 3);
  CHECK(collect() == std::vector<int>{1, 3, 2});
  CHECK(range.size() == 3);
}
