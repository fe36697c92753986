#include "sme/cache/memoizer.h"
#include "sme/core/clock.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>

using namespace sme;

TEST_CASE("Memoizer calls the wrapped function once per key", "[cache][memoizer]") {
  core::ManualClock clock;
  int calls = 0;

  cache::Memoizer<int, int, int> add(
      [&calls](const int& a, const int& b) {
        ++calls;
        return a + b;
      },
      [](const int& a, const int& b) { return std::to_string(a) + "+" + std::to_string(b); },
      cache::CacheConfig{16, std::chrono::seconds{30}}, clock);

  CHECK(add(2, 3) == 5);
  CHECK(add(2, 3) == 5);
  CHECK(calls == 1);
  CHECK(add(3, 2) == 5);
  CHECK(calls == 2);

  SECTION("results are recomputed after the ttl") {
    clock.advance(std::chrono::seconds{31});
    CHECK(add(2, 3) == 5);
    CHECK(calls == 3);
  }

  SECTION("stats reflect hits and misses") {
    const auto stats = add.stats();
    CHECK(stats.hits == 1);
    CHECK(stats.misses == 2);
  }

  SECTION("clear forces recomputation") {
    add.clear();
    CHECK(add(2, 3) == 5);
    CHECK(calls == 3);
  }
}
