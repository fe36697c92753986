#include "sme/cache/eviction_cache.h"
#include "sme/core/clock.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sme;
using Catch::Matchers::WithinAbs;

namespace {

cache::CacheConfig small_config(std::size_t capacity) {
  return cache::CacheConfig{capacity, std::chrono::minutes{5}};
}

}  // namespace

TEST_CASE("EvictionCache stores and expires entries", "[cache][ttl]") {
  core::ManualClock clock;
  cache::EvictionCache<std::string, int> cache(small_config(10), clock);

  SECTION("set then get returns the value immediately") {
    cache.set("k", 42);
    const auto value = cache.get("k");
    REQUIRE(value.has_value());
    CHECK(*value == 42);
  }

  SECTION("entry is still live exactly at the ttl") {
    cache.set("k", 1);
    clock.advance(std::chrono::minutes{5});
    CHECK(cache.get("k").has_value());
  }

  SECTION("entry is absent once the ttl has elapsed") {
    cache.set("k", 1);
    clock.advance(std::chrono::minutes{5} + std::chrono::milliseconds{1});
    CHECK_FALSE(cache.get("k").has_value());
    CHECK(cache.size() == 0);
    CHECK(cache.stats().expirations == 1);
  }

  SECTION("a read does not refresh the creation timestamp") {
    cache.set("k", 1);
    clock.advance(std::chrono::minutes{4});
    REQUIRE(cache.get("k").has_value());
    clock.advance(std::chrono::minutes{2});
    CHECK_FALSE(cache.get("k").has_value());
  }

  SECTION("re-setting a key restarts its lifetime") {
    cache.set("k", 1);
    clock.advance(std::chrono::minutes{4});
    cache.set("k", 2);
    clock.advance(std::chrono::minutes{4});
    const auto value = cache.get("k");
    REQUIRE(value.has_value());
    CHECK(*value == 2);
  }

  SECTION("purge_expired removes stale entries eagerly") {
    cache.set("old", 1);
    clock.advance(std::chrono::minutes{3});
    cache.set("new", 2);
    clock.advance(std::chrono::minutes{3});
    CHECK(cache.purge_expired() == 1);
    CHECK(cache.size() == 1);
    CHECK(cache.contains("new"));
    CHECK_FALSE(cache.contains("old"));
  }
}

TEST_CASE("EvictionCache evicts the least valuable entry at capacity", "[cache][eviction]") {
  core::ManualClock clock;
  cache::EvictionCache<std::string, int> cache(small_config(2), clock);

  SECTION("rarely read entry is evicted before a frequently read one") {
    cache.set("hot", 1);
    cache.set("cold", 2);
    REQUIRE(cache.get("hot").has_value());
    REQUIRE(cache.get("hot").has_value());
    clock.advance(std::chrono::milliseconds{10});

    cache.set("new", 3);

    CHECK(cache.size() == 2);
    CHECK(cache.contains("hot"));
    CHECK(cache.contains("new"));
    CHECK_FALSE(cache.contains("cold"));
    CHECK(cache.stats().evictions == 1);
  }

  SECTION("older entry loses when access counts are equal") {
    cache.set("a", 1);
    clock.advance(std::chrono::milliseconds{100});
    cache.set("b", 2);
    clock.advance(std::chrono::milliseconds{1});

    cache.set("c", 3);

    CHECK_FALSE(cache.contains("a"));
    CHECK(cache.contains("b"));
    CHECK(cache.contains("c"));
  }

  SECTION("ties go to the first key in order") {
    cache.set("x", 1);
    cache.set("y", 2);
    cache.set("z", 3);
    CHECK_FALSE(cache.contains("x"));
    CHECK(cache.contains("y"));
  }

  SECTION("updating an existing key never evicts") {
    cache.set("a", 1);
    cache.set("b", 2);
    cache.set("a", 10);
    CHECK(cache.size() == 2);
    CHECK(cache.stats().evictions == 0);
    CHECK(*cache.get("a") == 10);
  }
}

TEST_CASE("EvictionCache reports statistics", "[cache][stats]") {
  core::ManualClock clock;
  cache::EvictionCache<std::string, int> cache(small_config(4), clock);

  cache.set("a", 1);
  cache.set("b", 2);
  REQUIRE(cache.get("a").has_value());
  REQUIRE(cache.get("a").has_value());
  REQUIRE_FALSE(cache.get("missing").has_value());

  const auto stats = cache.stats();
  CHECK(stats.size == 2);
  CHECK(stats.capacity == 4);
  CHECK(stats.hits == 2);
  CHECK(stats.misses == 1);
  CHECK_THAT(stats.hit_rate, WithinAbs(2.0 / 3.0, 1e-9));
  // a: 1 + 2 reads, b: 1
  CHECK_THAT(stats.average_access_count, WithinAbs(2.0, 1e-9));

  SECTION("clear drops entries but keeps counters") {
    cache.clear();
    CHECK(cache.size() == 0);
    CHECK(cache.stats().hits == 2);
  }

  SECTION("erase reports whether the key existed") {
    CHECK(cache.erase("a"));
    CHECK_FALSE(cache.erase("a"));
  }
}

TEST_CASE("EvictionCache serializes concurrent access at capacity", "[cache][concurrency]") {
  constexpr std::size_t kCapacity = 8;
  constexpr int kThreads = 4;
  constexpr int kIterations = 500;
  constexpr int kKeySpace = 16;

  core::ManualClock clock;
  cache::EvictionCache<std::string, int> cache(small_config(kCapacity), clock);

  std::vector<std::thread> workers;
  workers.reserve(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&cache, t] {
      for (int i = 0; i < kIterations; ++i) {
        cache.set("k" + std::to_string((i * (t + 1)) % kKeySpace), i);
        (void)cache.get("k" + std::to_string((i + t) % kKeySpace));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto stats = cache.stats();
  CHECK(cache.size() <= cache.capacity());
  CHECK(stats.size <= kCapacity);
  CHECK(stats.hits + stats.misses == static_cast<std::size_t>(kThreads * kIterations));
  CHECK(stats.evictions > 0);
}

TEST_CASE("EvictionCache rejects unusable configuration", "[cache][config]") {
  core::ManualClock clock;
  using Cache = cache::EvictionCache<std::string, int>;

  CHECK_THROWS_AS(Cache(cache::CacheConfig{0, std::chrono::minutes{5}}, clock),
                  std::invalid_argument);
  CHECK_THROWS_AS(Cache(cache::CacheConfig{10, std::chrono::milliseconds{0}}, clock),
                  std::invalid_argument);
}
