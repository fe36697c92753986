#include "sme/domain/availability.h"

#include <algorithm>

namespace sme::domain {

namespace {

void sort_by_start(std::vector<TimeInterval>& intervals) {
  std::sort(intervals.begin(), intervals.end(),
            [](const TimeInterval& lhs, const TimeInterval& rhs) {
              if (lhs.start != rhs.start) {
                return lhs.start < rhs.start;
              }
              return lhs.end < rhs.end;
            });
}

}  // namespace

std::vector<TimeInterval> to_intervals(const core::ParticipantId& owner,
                                       const std::vector<TimeSlot>& slots) {
  std::vector<TimeInterval> intervals;
  intervals.reserve(slots.size());
  for (const auto& slot : slots) {
    if (slot.is_degenerate()) {
      continue;
    }
    intervals.push_back(TimeInterval{slot.start, slot.end, owner});
  }
  return intervals;
}

core::Millis total_duration(const std::vector<TimeInterval>& intervals) {
  core::Millis total{0};
  for (const auto& interval : intervals) {
    total += interval.duration();
  }
  return total;
}

core::Millis overlap_duration(std::vector<TimeInterval> a, std::vector<TimeInterval> b) {
  sort_by_start(a);
  sort_by_start(b);

  core::Millis overlap{0};
  std::size_t i = 0;
  std::size_t j = 0;
  while (i < a.size() && j < b.size()) {
    const auto start = std::max(a[i].start, b[j].start);
    const auto end = std::min(a[i].end, b[j].end);
    if (start < end) {
      overlap += std::chrono::duration_cast<core::Millis>(end - start);
    }

    if (a[i].end < b[j].end) {
      ++i;
    } else {
      ++j;
    }
  }
  return overlap;
}

}  // namespace sme::domain
