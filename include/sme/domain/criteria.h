#pragma once

#include "sme/core/ids.h"
#include "sme/domain/availability.h"
#include "sme/domain/participant.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sme::domain {

enum class SessionType { kVirtual, kInPerson, kHybrid };
enum class GroupSize { kOneOnOne, kSmallGroup, kLargeGroup };
enum class CommunicationStyle { kFormal, kCasual, kMixed };
enum class StudyIntensity { kRelaxed, kModerate, kIntensive };

struct SessionPreferences {
  SessionType session_type{SessionType::kVirtual};
  GroupSize group_size{GroupSize::kOneOnOne};
  CommunicationStyle communication_style{CommunicationStyle::kMixed};
  StudyIntensity study_intensity{StudyIntensity::kModerate};
};

// MatchingCriteria is supplied per request and never mutated by the engine.
// The desired level/style feed hard filters only when the matching require_exact_*
// flag is set; otherwise they are informational and do not change scoring.
struct MatchingCriteria {
  std::set<core::SubjectId> subjects;
  std::optional<AcademicLevel> academic_level;
  std::optional<LearningStyle> learning_style;
  std::vector<TimeSlot> availability;
  std::string location;
  SessionPreferences preferences;
  std::optional<double> max_distance;
  std::optional<double> min_compatibility_score;
  bool require_exact_level{false};
  bool require_exact_style{false};
};

}  // namespace sme::domain
