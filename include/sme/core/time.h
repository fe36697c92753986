#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sme::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Millis = std::chrono::milliseconds;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<Millis>(ts.time_since_epoch()).count();
}

inline Timestamp from_unix_millis(const std::int64_t millis) { return Timestamp{Millis{millis}}; }

// parse_iso8601 accepts "YYYY-MM-DDTHH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]" and the
// date-only form "YYYY-MM-DD" (midnight UTC). Returns nullopt on any malformed input.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

// format_iso8601 renders a UTC timestamp as "YYYY-MM-DDTHH:MM:SSZ".
[[nodiscard]] std::string format_iso8601(Timestamp ts);

}  // namespace sme::core
