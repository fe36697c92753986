#pragma once

#include "sme/core/ids.h"
#include "sme/domain/participant.h"

#include <string>
#include <vector>

namespace sme::domain {

// CompatibilityScore: seven independent components in [0,1] and their weighted sum.
struct CompatibilityScore {
  double overall{0.0};
  double subject_match{0.0};
  double level_compatibility{0.0};
  double style_compatibility{0.0};
  double time_overlap{0.0};
  double location_compatibility{0.0};
  double activity_compatibility{0.0};
  double reputation_score{0.0};
};

struct MatchStats {
  std::size_t total_partnerships{0};
  int recent_activity{0};
};

// MatchResult is produced fresh per call (or served from cache) and never mutated.
struct MatchResult {
  Participant participant;
  CompatibilityScore score;
  std::vector<core::SubjectId> shared_subjects;         // sorted
  std::vector<core::SubjectId> complementary_subjects;  // candidate-only subjects, sorted
  std::vector<std::string> reasons;
  MatchStats stats;
};

// ScheduleSlot: one candidate meeting window and everyone free during it.
struct ScheduleSlot {
  core::Timestamp start;
  core::Timestamp end;
  std::vector<core::ParticipantId> participant_ids;  // sorted, unique
};

enum class RecommendationMethod {
  kCollaborative,
  kContent,
  kHybrid,
};

[[nodiscard]] constexpr const char* to_string(const RecommendationMethod method) {
  switch (method) {
    case RecommendationMethod::kCollaborative:
      return "collaborative";
    case RecommendationMethod::kContent:
      return "content";
    case RecommendationMethod::kHybrid:
      return "hybrid";
  }
  return "content";
}

struct Recommendation {
  core::ParticipantId candidate_id;
  double score{0.0};
  RecommendationMethod method{RecommendationMethod::kContent};
  std::string reason;
};

}  // namespace sme::domain
