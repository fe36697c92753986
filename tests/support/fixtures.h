#pragma once

#include "sme/core/time.h"
#include "sme/domain/participant.h"

#include <initializer_list>
#include <string>

namespace sme::testing {

// Monday 2024-01-01 00:00 UTC; every fixture window is an offset from it.
inline core::Timestamp monday() {
  return core::from_unix_millis(1704067200000LL);
}

inline domain::TimeSlot window(const int start_hour, const int end_hour,
                               const int day_offset = 0) {
  const auto day = monday() + std::chrono::hours{24 * day_offset};
  return domain::TimeSlot{"monday", day + std::chrono::hours{start_hour},
                          day + std::chrono::hours{end_hour}, "UTC"};
}

inline domain::Participant make_participant(
    const std::string& id, std::initializer_list<const char*> subjects,
    const domain::AcademicLevel level = domain::AcademicLevel::kIntermediate) {
  domain::Participant p;
  p.id = core::ParticipantId{id};
  p.academic_level = level;
  for (const char* subject : subjects) {
    p.subjects.push_back(domain::SubjectProficiency{core::SubjectId{subject}, level});
  }
  return p;
}

}  // namespace sme::testing
