#include "sme/core/clock.h"
#include "sme/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace sme;

TEST_CASE("parse_iso8601 accepts the supported forms", "[core][time]") {
  const auto nine_utc = core::from_unix_millis(1704099600000LL);  // 2024-01-01T09:00:00Z

  CHECK(core::parse_iso8601("2024-01-01T09:00:00Z") == nine_utc);
  CHECK(core::parse_iso8601("2024-01-01T09:00Z") == nine_utc);
  CHECK(core::parse_iso8601("2024-01-01T09:00:00") == nine_utc);
  CHECK(core::parse_iso8601("2024-01-01T10:30:00+01:30") == nine_utc);
  CHECK(core::parse_iso8601("2024-01-01T04:00:00-05:00") == nine_utc);
  CHECK(core::parse_iso8601("2024-01-01T09:00:00.250Z") ==
        nine_utc + std::chrono::milliseconds{250});
  CHECK(core::parse_iso8601("2024-01-01") == core::from_unix_millis(1704067200000LL));
}

TEST_CASE("parse_iso8601 rejects malformed input", "[core][time]") {
  CHECK_FALSE(core::parse_iso8601("").has_value());
  CHECK_FALSE(core::parse_iso8601("not a date").has_value());
  CHECK_FALSE(core::parse_iso8601("2024-13-01").has_value());
  CHECK_FALSE(core::parse_iso8601("2023-02-29").has_value());
  CHECK_FALSE(core::parse_iso8601("2024-01-01T25:00:00Z").has_value());
  CHECK_FALSE(core::parse_iso8601("2024-01-01T09:00:00Zjunk").has_value());
}

TEST_CASE("format_iso8601 renders UTC seconds", "[core][time]") {
  CHECK(core::format_iso8601(core::from_unix_millis(1704099600000LL)) == "2024-01-01T09:00:00Z");
}

TEST_CASE("ManualClock only moves when told", "[core][clock]") {
  core::ManualClock clock(core::from_unix_millis(1000));
  CHECK(core::to_unix_millis(clock.now()) == 1000);
  clock.advance(std::chrono::milliseconds{500});
  CHECK(core::to_unix_millis(clock.now()) == 1500);
  clock.set(core::from_unix_millis(42));
  CHECK(core::to_unix_millis(clock.now()) == 42);
}
