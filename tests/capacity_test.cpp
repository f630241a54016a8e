#include <catch2/catch_test_macros.hpp>

#include <map>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../src/ordered_bounded_map.hpp"

namespace {

using IntMap = OrderedBoundedMap<int, std::string>;

std::vector<int> keysOf(const IntMap& map) {
  return std::vector<int>(map.keys().begin(), map.keys().end());
}

// Key whose comparison of 13 against 20 throws once armed, so a batch
// fails only after part of it has been applied to the working tree
struct Fragile {
  int value;
  static bool armed;
  bool operator<(const Fragile& other) const {
    bool pair = (value == 13 && other.value == 20) || (value == 20 && other.value == 13);
    if (armed && pair) {
      throw std::runtime_error("comparison failed");
    }
    return value < other.value;
  }
};
bool Fragile::armed = false;

}  // namespace

TEST_CASE("capacity rejects new keys when full", "[capacity]") {
  IntMap map(2);
  map.insert(1, "a");
  map.insert(2, "b");

  REQUIRE_THROWS_AS(map.insert(3, "c"), CapacityExceededError);
  REQUIRE(keysOf(map) == std::vector<int>{1, 2});

  SECTION("Overwriting an existing key still succeeds") {
    REQUIRE(map.insert(1, "z") == std::optional<std::string>("a"));
    REQUIRE(map.size() == 2);
  }

  SECTION("setdefault on a new key is subject to capacity") {
    REQUIRE_THROWS_AS(map.setDefault(3, "c"), CapacityExceededError);
    REQUIRE(map.setDefault(2, "c") == "b");
  }

  SECTION("Room frees up after a pop") {
    map.pop(1);
    map.insert(3, "c");
    REQUIRE(keysOf(map) == std::vector<int>{2, 3});
  }
}

TEST_CASE("capacity evicts the smallest key under evict policy", "[capacity]") {
  IntMap map(3, std::nullopt, OverflowPolicy::EvictMinKey);
  map.insert(5, "e");
  map.insert(2, "b");
  map.insert(8, "h");

  map.insert(6, "f");
  REQUIRE(keysOf(map) == std::vector<int>{5, 6, 8});

  SECTION("A new smallest key replaces the old smallest") {
    map.insert(1, "a");
    REQUIRE(keysOf(map) == std::vector<int>{1, 6, 8});
  }

  SECTION("Overwrites never evict") {
    map.insert(5, "E");
    REQUIRE(keysOf(map) == std::vector<int>{5, 6, 8});
    REQUIRE(map.get(5) == std::optional<std::string>("E"));
  }
}

TEST_CASE("update inserts in ascending key order", "[capacity]") {
  IntMap map(10);
  std::map<int, std::string> other{{3, "c"}, {1, "a"}, {2, "b"}};

  map.update(other);
  REQUIRE(keysOf(map) == std::vector<int>{1, 2, 3});

  map.update({{2, "B"}, {4, "d"}});
  REQUIRE(map.get(2) == std::optional<std::string>("B"));
  REQUIRE(map.size() == 4);

  SECTION("Last occurrence of a repeated key wins") {
    std::vector<std::pair<int, std::string>> repeated{{7, "first"}, {6, "x"}, {7, "second"}};
    map.update(repeated);
    REQUIRE(map.get(7) == std::optional<std::string>("second"));
  }

  SECTION("Empty update is a no-op") {
    map.update(std::vector<std::pair<int, std::string>>());
    REQUIRE(map.size() == 4);
  }
}

TEST_CASE("update is all or nothing", "[capacity]") {
  IntMap map(10);
  for (int key = 0; key < 5; ++key) {
    map.insert(key, "v");
  }
  IntMap before = map;

  std::vector<std::pair<int, std::string>> tooMany;
  for (int key = 5; key < 20; ++key) {
    tooMany.emplace_back(key, "w");
  }

  REQUIRE_THROWS_AS(map.update(tooMany), CapacityExceededError);
  REQUIRE(map == before);
  REQUIRE(map.size() == 5);
  for (int key = 5; key < 20; ++key) {
    REQUIRE_FALSE(map.contains(key));
  }
}

TEST_CASE("update rolls back when a comparison throws", "[capacity]") {
  OrderedBoundedMap<Fragile, int> map;
  map.insert(Fragile{1}, 1);
  map.insert(Fragile{20}, 20);

  Fragile::armed = true;
  std::vector<std::pair<Fragile, int>> batch{{Fragile{5}, 5}, {Fragile{13}, 13}};
  REQUIRE_THROWS_AS(map.update(batch), std::runtime_error);
  Fragile::armed = false;

  REQUIRE(map.size() == 2);
  REQUIRE_FALSE(map.contains(Fragile{5}));
}

TEST_CASE("update with eviction stays within capacity", "[capacity]") {
  IntMap map(3, std::nullopt, OverflowPolicy::EvictMinKey);
  map.update({{1, "a"}, {2, "b"}, {3, "c"}, {4, "d"}, {5, "e"}});
  REQUIRE(keysOf(map) == std::vector<int>{3, 4, 5});
}

TEST_CASE("capacity invariant holds under random insert and pop", "[capacity]") {
  const size_t capacity = 16;
  for (OverflowPolicy policy : {OverflowPolicy::Reject, OverflowPolicy::EvictMinKey}) {
    IntMap map(static_cast<int64_t>(capacity), std::nullopt, policy);
    std::mt19937 rng(2024);
    std::uniform_int_distribution<int> keyDist(0, 63);
    std::uniform_int_distribution<int> opDist(0, 3);

    for (int step = 0; step < 3000; ++step) {
      int key = keyDist(rng);
      switch (opDist(rng)) {
        case 0:
          map.pop(key, "none");
          break;
        case 1:
          if (!map.empty()) map.popItem();
          break;
        default:
          try {
            map.insert(key, "v");
          } catch (const CapacityExceededError&) {
            REQUIRE(policy == OverflowPolicy::Reject);
            REQUIRE(map.size() == capacity);
          }
          break;
      }
      REQUIRE(map.size() <= capacity);
      REQUIRE(map.size() == keysOf(map).size());
    }
  }
}

TEST_CASE("usage and health status", "[capacity]") {
  SECTION("Unbounded collections are always healthy") {
    IntMap map;
    map.insert(1, "a");
    REQUIRE_FALSE(map.usage().has_value());
    REQUIRE(map.status() == HealthStatus::Healthy);
  }

  SECTION("Status follows the fill level") {
    IntMap map(10);
    REQUIRE(map.usage() == std::optional<double>(0.0));
    REQUIRE(map.status() == HealthStatus::Healthy);

    for (int key = 0; key < 6; ++key) map.insert(key, "v");
    REQUIRE(map.status() == HealthStatus::Acceptable);

    map.insert(6, "v");
    REQUIRE(map.status() == HealthStatus::Alert);

    map.insert(7, "v");
    REQUIRE(map.status() == HealthStatus::Warning);

    map.insert(8, "v");
    REQUIRE(map.status() == HealthStatus::Critical);

    map.insert(9, "v");
    REQUIRE(map.usage() == std::optional<double>(1.0));
    REQUIRE(map.status() == HealthStatus::Critical);
  }

  SECTION("Partial percentages round up") {
    REQUIRE(healthStatusFor(59, 100) == HealthStatus::Healthy);
    REQUIRE(healthStatusFor(1, 3) == HealthStatus::Healthy);
    REQUIRE(healthStatusFor(2, 3) == HealthStatus::Acceptable);
    REQUIRE(healthStatusFor(599, 1000) == HealthStatus::Acceptable);
    REQUIRE(std::string(healthStatusName(HealthStatus::Warning)) == "WARNING");
  }
}
