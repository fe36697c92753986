#pragma once

#include "sme/core/ids.h"
#include "sme/core/time.h"

#include <string>
#include <vector>

namespace sme::domain {

// TimeSlot is the boundary shape of one availability window: the day label and
// timezone are carried through for display; start/end are absolute instants on the
// shared calendar reference that every computation uses.
struct TimeSlot {
  std::string day;
  core::Timestamp start;
  core::Timestamp end;
  std::string timezone;

  [[nodiscard]] bool is_degenerate() const { return !(start < end); }
};

// TimeInterval is an owned, non-degenerate window (start < end).
struct TimeInterval {
  core::Timestamp start;
  core::Timestamp end;
  core::ParticipantId owner;

  [[nodiscard]] core::Millis duration() const {
    return std::chrono::duration_cast<core::Millis>(end - start);
  }
};

// to_intervals tags every non-degenerate slot with its owner.
// Degenerate slots (start >= end) contribute no availability and are dropped here
// so no downstream ratio can divide by a zero-length total.
[[nodiscard]] std::vector<TimeInterval> to_intervals(const core::ParticipantId& owner,
                                                     const std::vector<TimeSlot>& slots);

[[nodiscard]] core::Millis total_duration(const std::vector<TimeInterval>& intervals);

// overlap_duration runs a two-pointer sweep over both lists sorted by start,
// accumulating min(end) - max(start) for every intersecting pair and advancing
// whichever interval ends first.
[[nodiscard]] core::Millis overlap_duration(std::vector<TimeInterval> a,
                                            std::vector<TimeInterval> b);

}  // namespace sme::domain
