#include "sme/scheduling/availability_scheduler.h"

#include "sme/domain/availability.h"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>

namespace sme::scheduling {

std::vector<domain::ScheduleSlot> AvailabilityScheduler::find_slots(
    const std::vector<domain::Participant>& participants, const int required_duration_minutes,
    const int min_participants) const {
  if (required_duration_minutes <= 0) {
    throw std::invalid_argument("find_slots: required duration must be positive");
  }
  if (min_participants <= 0) {
    throw std::invalid_argument("find_slots: min_participants must be positive");
  }

  std::vector<domain::TimeInterval> intervals;
  for (const auto& participant : participants) {
    auto owned = domain::to_intervals(participant.id, participant.availability);
    intervals.insert(intervals.end(), owned.begin(), owned.end());
  }
  std::stable_sort(intervals.begin(), intervals.end(),
                   [](const domain::TimeInterval& a, const domain::TimeInterval& b) {
                     return a.start < b.start;
                   });

  const auto required = std::chrono::minutes{required_duration_minutes};
  const auto min_count = static_cast<std::size_t>(min_participants);

  std::vector<domain::ScheduleSlot> slots;
  for (const auto& anchor : intervals) {
    if (anchor.end - anchor.start < required) {
      continue;
    }
    std::set<core::ParticipantId> present{anchor.owner};
    for (const auto& other : intervals) {
      if (other.start < anchor.end && anchor.start < other.end) {
        present.insert(other.owner);
      }
    }
    if (present.size() < min_count) {
      continue;
    }
    slots.push_back(domain::ScheduleSlot{
        anchor.start, anchor.end,
        std::vector<core::ParticipantId>(present.begin(), present.end())});
  }

  std::stable_sort(slots.begin(), slots.end(),
                   [](const domain::ScheduleSlot& a, const domain::ScheduleSlot& b) {
                     return a.participant_ids.size() > b.participant_ids.size();
                   });
  if (slots.size() > kMaxScheduleSlots) {
    slots.resize(kMaxScheduleSlots);
  }
  return slots;
}

}  // namespace sme::scheduling
