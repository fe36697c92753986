#pragma once

#include "sme/core/ids.h"
#include "sme/domain/availability.h"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sme::domain {

// Ordinal academic / proficiency level. Underlying values are the ordinals used
// by level compatibility (0..3); proficiency ratings are ordinal + 1.
enum class AcademicLevel {
  kBeginner = 0,
  kIntermediate = 1,
  kAdvanced = 2,
  kExpert = 3,
};

enum class LearningStyle {
  kVisual,
  kAuditory,
  kReading,
  kKinesthetic,
};

[[nodiscard]] std::string_view to_string(AcademicLevel level);
[[nodiscard]] std::string_view to_string(LearningStyle style);

// Case-insensitive; nullopt for unknown tags.
[[nodiscard]] std::optional<AcademicLevel> parse_academic_level(std::string_view text);
[[nodiscard]] std::optional<LearningStyle> parse_learning_style(std::string_view text);

[[nodiscard]] constexpr int level_ordinal(const AcademicLevel level) {
  return static_cast<int>(level);
}

// Beginner=1 .. Expert=4; used as ratings (collaborative) and feature weights (content).
[[nodiscard]] constexpr double proficiency_rating(const AcademicLevel level) {
  return static_cast<double>(level_ordinal(level) + 1);
}

struct SubjectProficiency {
  core::SubjectId subject_id;
  AcademicLevel level{AcademicLevel::kBeginner};
};

// Participant is the single record shape consumed by every engine entry point.
// Records are supplied by the caller and treated as immutable for a call.
// Optional attributes are explicit std::optional rather than sentinel strings.
struct Participant {
  core::ParticipantId id;
  AcademicLevel academic_level{AcademicLevel::kBeginner};
  std::optional<LearningStyle> learning_style;
  std::string institution;
  std::string timezone;
  std::string region;
  std::optional<std::string> major;
  std::optional<int> graduation_year;
  std::vector<SubjectProficiency> subjects;
  std::vector<TimeSlot> availability;
  int recent_activity{0};  // completed study sessions
  std::set<core::ParticipantId> partner_ids;
  bool is_active{true};
  bool profile_complete{true};
  // Review-aggregate supplied upstream; consumed through IReputationProvider.
  std::optional<double> reputation;

  [[nodiscard]] std::set<core::SubjectId> subject_ids() const;

  // Proficiency for a subject, nullopt if the participant does not study it.
  [[nodiscard]] std::optional<AcademicLevel> proficiency(const core::SubjectId& subject) const;

  [[nodiscard]] bool is_partnered_with(const core::ParticipantId& other) const {
    return partner_ids.contains(other);
  }
};

}  // namespace sme::domain
