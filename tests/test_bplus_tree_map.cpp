// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#include <catch2/catch_template_test_macros.hpp>
#include <catch2/catch_test_macros.hpp>
#include <leafchain/bplus_tree_map.hpp>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace leafchain;

// Helper types for running the same cases at several orders
struct SmallestOrder {
  static constexpr std::size_t value = 3;
};
struct SmallOrder {
  static constexpr std::size_t value = 4;
};
struct DefaultOrder {
  static constexpr std::size_t value = 16;
};

// Helper function to populate a map using put()
template <typename Map>
void populate_map(Map& map, std::vector<std::pair<int, int>> data) {
  for (const auto& [key, value] : data) {
    map.put(key, value);
  }
}

TEST_CASE("bplus_tree_map constructors", "[map][constructor]") {
  SECTION("Default constructor uses the default order") {
    bplus_tree_map<int, int> map;
    REQUIRE(map.empty());
    REQUIRE(map.size() == 0);
    REQUIRE(map.order() == 16);
    REQUIRE(map.height() == 0);
  }

  SECTION("Explicit order") {
    bplus_tree_map<int, std::string> map(5);
    REQUIRE(map.empty());
    REQUIRE(map.order() == 5);
  }

  SECTION("Smallest valid order") {
    bplus_tree_map<int, int> map(3);
    REQUIRE(map.order() == 3);
  }

  SECTION("Order below 3 is rejected") {
    REQUIRE_THROWS_AS((bplus_tree_map<int, int>(2)), invalid_order_error);
    REQUIRE_THROWS_AS((bplus_tree_map<int, int>(1)), invalid_order_error);
    REQUIRE_THROWS_AS((bplus_tree_map<int, int>(0)), invalid_order_error);
  }

  SECTION("Configuration error carries the order") {
    try {
      bplus_tree_map<int, int> map(2);
      FAIL("constructor should have thrown");
    } catch (const invalid_order_error& e) {
      REQUIRE(e.order() == 2);
      REQUIRE(std::string(e.what()).find("order 2") != std::string::npos);
    }
  }
}

TEST_CASE("bplus_tree_map empty map behavior", "[map][empty]") {
  bplus_tree_map<int, int> map(4);

  SECTION("Queries on an empty map") {
    REQUIRE(map.empty());
    REQUIRE(map.size() == 0);
    REQUIRE_FALSE(map.contains_key(42));
    REQUIRE(map.find(42) == map.end());
    REQUIRE(map.begin() == map.end());
  }

  SECTION("Materializers return empty containers") {
    REQUIRE(map.key_set().empty());
    REQUIRE(map.values().empty());
    REQUIRE(map.entry_set().empty());
  }

  SECTION("get throws absent-key error") {
    REQUIRE_THROWS_AS(map.get(1), no_such_key_error);
    const auto& const_map = map;
    REQUIRE_THROWS_AS(const_map.get(1), no_such_key_error);
  }

  SECTION("verify accepts an empty map") {
    REQUIRE_NOTHROW(map.verify());
  }
}

TEMPLATE_TEST_CASE("bplus_tree_map put and get", "[map][put][get]",
                   SmallestOrder, SmallOrder, DefaultOrder) {
  constexpr std::size_t Order = TestType::value;

  SECTION("First put creates a single leaf root") {
    bplus_tree_map<int, std::string> map(Order);
    const auto& stored = map.put(7, "seven");
    REQUIRE(stored == "seven");
    REQUIRE_FALSE(map.empty());
    REQUIRE(map.size() == 1);
    REQUIRE(map.height() == 1);
    REQUIRE(map.get(7) == "seven");
  }

  SECTION("Lookup of every inserted key") {
    bplus_tree_map<int, int> map(Order);
    for (int i = 0; i < 200; ++i) {
      const int key = (i * 37) % 200;
      map.put(key, key * 10);
    }
    REQUIRE(map.size() == 200);
    for (int key = 0; key < 200; ++key) {
      REQUIRE(map.contains_key(key));
      REQUIRE(map.get(key) == key * 10);
    }
    REQUIRE_FALSE(map.contains_key(-1));
    REQUIRE_FALSE(map.contains_key(200));
    REQUIRE_NOTHROW(map.verify());
  }

  SECTION("put returns the stored value even when it causes a split") {
    bplus_tree_map<int, int> map(Order);
    for (int i = 1; i <= 50; ++i) {
      const int& stored = map.put(i, i * 3);
      REQUIRE(stored == i * 3);
      REQUIRE(&stored == &map.get(i));
    }
  }

  SECTION("get of a missing key in a populated map") {
    bplus_tree_map<int, int> map(Order);
    populate_map(map, {{1, 10}, {3, 30}, {5, 50}});
    REQUIRE_THROWS_AS(map.get(2), no_such_key_error);
    REQUIRE_THROWS_AS(map.get(6), no_such_key_error);
    REQUIRE(map.size() == 3);
  }

  SECTION("get returns a mutable reference") {
    bplus_tree_map<int, int> map(Order);
    populate_map(map, {{1, 10}, {2, 20}});
    map.get(2) = 99;
    REQUIRE(map.get(2) == 99);
  }
}

TEMPLATE_TEST_CASE("bplus_tree_map overwrite semantics", "[map][put]",
                   SmallestOrder, SmallOrder, DefaultOrder) {
  constexpr std::size_t Order = TestType::value;
  bplus_tree_map<int, std::string> map(Order);

  SECTION("Second put replaces the value and keeps the size") {
    map.put(5, "first");
    map.put(5, "second");
    REQUIRE(map.size() == 1);
    REQUIRE(map.get(5) == "second");
  }

  SECTION("Overwrite after splits") {
    for (int i = 0; i < 30; ++i) {
      map.put(i, "v" + std::to_string(i));
    }
    const auto height = map.height();
    for (int i = 0; i < 30; i += 3) {
      const auto& stored = map.put(i, "new");
      REQUIRE(stored == "new");
    }
    REQUIRE(map.size() == 30);
    REQUIRE(map.height() == height);
    for (int i = 0; i < 30; ++i) {
      REQUIRE(map.get(i) == (i % 3 == 0 ? "new" : "v" + std::to_string(i)));
    }
    REQUIRE_NOTHROW(map.verify());
  }
}

TEST_CASE("bplus_tree_map round-trip scenario", "[map][scenario]") {
  bplus_tree_map<int, std::string> map(4);
  for (int key : {10, 20, 5, 15, 25, 1, 30}) {
    map.put(key, "value-" + std::to_string(key));
  }

  REQUIRE(map.size() == 7);

  std::vector<int> keys;
  for (const auto& e : map.entry_set()) {
    keys.push_back(e.key);
  }
  REQUIRE(keys == std::vector<int>{1, 5, 10, 15, 20, 25, 30});

  REQUIRE(map.get(15) == "value-15");
  REQUIRE_FALSE(map.contains_key(99));
  REQUIRE_NOTHROW(map.verify());
}

TEMPLATE_TEST_CASE("bplus_tree_map materializers", "[map][traversal]",
                   SmallestOrder, SmallOrder, DefaultOrder) {
  constexpr std::size_t Order = TestType::value;
  bplus_tree_map<int, int> map(Order);
  std::map<int, int> reference;

  std::vector<int> insert_order = {9, 3,  15, 1,  17, 5,  13, 7,  11,
                                   2, 16, 4,  14, 6,  12, 8,  10, 18};
  for (int key : insert_order) {
    map.put(key, key * 100);
    reference[key] = key * 100;
  }

  SECTION("key_set is ascending") {
    std::vector<int> expected;
    for (const auto& [key, value] : reference) {
      expected.push_back(key);
    }
    REQUIRE(map.key_set() == expected);
  }

  SECTION("values follow key order") {
    std::vector<int> expected;
    for (const auto& [key, value] : reference) {
      expected.push_back(value);
    }
    REQUIRE(map.values() == expected);
  }

  SECTION("entry_set pairs keys with their values") {
    auto entries = map.entry_set();
    REQUIRE(entries.size() == reference.size());
    auto ref_it = reference.begin();
    for (const auto& e : entries) {
      REQUIRE(e.key == ref_it->first);
      REQUIRE(e.value == ref_it->second);
      ++ref_it;
    }
  }

  SECTION("Iterator walks the leaf chain in order") {
    std::vector<std::pair<int, int>> collected;
    for (auto it = map.begin(); it != map.end(); ++it) {
      collected.push_back({it->first, it->second});
    }
    REQUIRE(collected ==
            std::vector<std::pair<int, int>>(reference.begin(),
                                             reference.end()));
  }

  SECTION("Range-based for with structured bindings") {
    int previous = 0;
    std::size_t count = 0;
    for (auto [key, value] : map) {
      REQUIRE(key > previous);
      REQUIRE(value == key * 100);
      previous = key;
      ++count;
    }
    REQUIRE(count == map.size());
  }

  SECTION("find returns an iterator positioned at the entry") {
    auto it = map.find(13);
    REQUIRE(it != map.end());
    REQUIRE(it->first == 13);
    REQUIRE(it->second == 1300);
    ++it;
    REQUIRE(it->first == 14);
    REQUIRE(map.find(100) == map.end());
  }
}

TEST_CASE("bplus_tree_map entry printing", "[map][entry]") {
  using Map = bplus_tree_map<int, std::string>;
  Map map(4);
  map.put(2, "two");
  map.put(1, "one");

  auto entries = map.entry_set();
  REQUIRE(entries.size() == 2);
  REQUIRE(entries[0] == Map::entry{1, "one"});

  std::ostringstream os;
  os << entries[0];
  REQUIRE(os.str() == "{1: one }");
}

TEMPLATE_TEST_CASE("bplus_tree_map clear", "[map][clear]", SmallestOrder,
                   SmallOrder, DefaultOrder) {
  constexpr std::size_t Order = TestType::value;
  bplus_tree_map<int, int> map(Order);

  SECTION("clear - empty map") {
    map.clear();
    REQUIRE(map.empty());
    REQUIRE(map.size() == 0);

    // Idempotent
    map.clear();
    REQUIRE(map.empty());
    REQUIRE_NOTHROW(map.verify());
  }

  SECTION("clear - multiple levels") {
    for (int i = 1; i <= 100; ++i) {
      map.put(i, i);
    }
    REQUIRE(map.height() > 1);

    map.clear();
    REQUIRE(map.empty());
    REQUIRE(map.size() == 0);
    REQUIRE(map.height() == 0);
    REQUIRE_FALSE(map.contains_key(50));
    REQUIRE(map.key_set().empty());
    REQUIRE(map.begin() == map.end());
  }

  SECTION("put after clear behaves like the first insertion") {
    for (int i = 1; i <= 20; ++i) {
      map.put(i, i);
    }
    map.clear();

    map.put(42, 420);
    REQUIRE(map.size() == 1);
    REQUIRE(map.height() == 1);
    REQUIRE(map.get(42) == 420);
    REQUIRE(map.key_set() == std::vector<int>{42});
    REQUIRE(map.order() == Order);
    REQUIRE_NOTHROW(map.verify());
  }
}

TEST_CASE("bplus_tree_map unsupported operations", "[map][unsupported]") {
  SECTION("Empty map") {
    bplus_tree_map<int, int> map(4);
    REQUIRE_THROWS_AS(map.contains_value(1), unsupported_operation_error);
    REQUIRE_THROWS_AS(map.remove(1), unsupported_operation_error);
    REQUIRE_THROWS_AS((map.put_all(std::map<int, int>{{1, 1}})),
                      unsupported_operation_error);
    REQUIRE(map.empty());
  }

  SECTION("Populated map is left untouched") {
    bplus_tree_map<int, int> map(4);
    populate_map(map, {{1, 10}, {2, 20}, {3, 30}, {4, 40}, {5, 50}});

    REQUIRE_THROWS_AS(map.contains_value(10), unsupported_operation_error);
    REQUIRE_THROWS_AS(map.remove(3), unsupported_operation_error);
    REQUIRE_THROWS_AS((map.put_all(std::map<int, int>{{6, 60}})),
                      unsupported_operation_error);

    REQUIRE(map.size() == 5);
    REQUIRE(map.get(3) == 30);
    REQUIRE_FALSE(map.contains_key(6));
  }

  SECTION("Error names the operation") {
    bplus_tree_map<int, int> map(4);
    try {
      map.remove(1);
      FAIL("remove should have thrown");
    } catch (const unsupported_operation_error& e) {
      REQUIRE(e.operation() == "remove");
      REQUIRE(std::string(e.what()).find("remove") != std::string::npos);
    }
  }
}

TEMPLATE_TEST_CASE("bplus_tree_map copy and move", "[map][copy][move]",
                   SmallestOrder, SmallOrder, DefaultOrder) {
  constexpr std::size_t Order = TestType::value;
  using Map = bplus_tree_map<int, std::string>;

  Map source(Order);
  for (int i = 0; i < 40; ++i) {
    source.put(i, std::to_string(i));
  }

  SECTION("Copy constructor - deep copy") {
    Map copy(source);
    REQUIRE(copy.size() == 40);
    REQUIRE(copy.order() == Order);
    REQUIRE(copy.key_set() == source.key_set());
    REQUIRE_NOTHROW(copy.verify());

    // Modifying the copy does not affect the source
    copy.put(100, "hundred");
    copy.put(0, "zero");
    REQUIRE_FALSE(source.contains_key(100));
    REQUIRE(source.get(0) == "0");
  }

  SECTION("Copy assignment replaces contents and order") {
    Map target(7);
    target.put(-5, "minus five");
    target = source;
    REQUIRE(target.order() == Order);
    REQUIRE(target.size() == 40);
    REQUIRE_FALSE(target.contains_key(-5));
    REQUIRE_NOTHROW(target.verify());
  }

  SECTION("Self copy assignment is a no-op") {
    auto& alias = source;
    source = alias;
    REQUIRE(source.size() == 40);
    REQUIRE_NOTHROW(source.verify());
  }

  SECTION("Move constructor leaves the source empty") {
    Map moved(std::move(source));
    REQUIRE(moved.size() == 40);
    REQUIRE(moved.get(39) == "39");
    REQUIRE(source.empty());
    REQUIRE(source.size() == 0);
    REQUIRE(source.begin() == source.end());

    // The moved-from map is still usable
    source.put(1, "one");
    REQUIRE(source.size() == 1);
    REQUIRE_NOTHROW(source.verify());
  }

  SECTION("Move assignment") {
    Map target(5);
    target.put(1000, "old");
    target = std::move(source);
    REQUIRE(target.size() == 40);
    REQUIRE_FALSE(target.contains_key(1000));
    REQUIRE(source.empty());
    REQUIRE_NOTHROW(target.verify());
  }

  SECTION("swap exchanges contents and order") {
    Map other(5);
    other.put(-1, "neg");
    swap(source, other);
    REQUIRE(source.size() == 1);
    REQUIRE(source.order() == 5);
    REQUIRE(source.get(-1) == "neg");
    REQUIRE(other.size() == 40);
    REQUIRE(other.order() == Order);
    REQUIRE_NOTHROW(source.verify());
    REQUIRE_NOTHROW(other.verify());
  }
}
