#pragma once

#include "sme/domain/match_result.h"
#include "sme/domain/participant.h"

#include <cstddef>
#include <vector>

namespace sme::scheduling {

inline constexpr std::size_t kMaxScheduleSlots = 5;

// AvailabilityScheduler finds meeting windows shared by several participants.
//
// Each availability interval is used as an anchor: the candidate slot is bounded by
// the anchor's own start/end and lists every participant with an interval
// overlapping it. Slots with too few participants or shorter than the requested
// duration are dropped; the rest are stable-sorted by participant count (descending,
// so equal counts keep chronological order) and the first five returned.
class AvailabilityScheduler {
 public:
  // Throws std::invalid_argument when required_duration_minutes <= 0 or
  // min_participants <= 0.
  [[nodiscard]] std::vector<domain::ScheduleSlot> find_slots(
      const std::vector<domain::Participant>& participants, int required_duration_minutes,
      int min_participants) const;
};

}  // namespace sme::scheduling
