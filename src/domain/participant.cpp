#include "sme/domain/participant.h"

#include "sme/core/normalization.h"

namespace sme::domain {

std::string_view to_string(const AcademicLevel level) {
  switch (level) {
    case AcademicLevel::kBeginner:
      return "BEGINNER";
    case AcademicLevel::kIntermediate:
      return "INTERMEDIATE";
    case AcademicLevel::kAdvanced:
      return "ADVANCED";
    case AcademicLevel::kExpert:
      return "EXPERT";
  }
  return "BEGINNER";
}

std::string_view to_string(const LearningStyle style) {
  switch (style) {
    case LearningStyle::kVisual:
      return "visual";
    case LearningStyle::kAuditory:
      return "auditory";
    case LearningStyle::kReading:
      return "reading";
    case LearningStyle::kKinesthetic:
      return "kinesthetic";
  }
  return "visual";
}

std::optional<AcademicLevel> parse_academic_level(const std::string_view text) {
  const std::string key = core::normalize_key(text);
  if (key == "beginner") {
    return AcademicLevel::kBeginner;
  }
  if (key == "intermediate") {
    return AcademicLevel::kIntermediate;
  }
  if (key == "advanced") {
    return AcademicLevel::kAdvanced;
  }
  if (key == "expert") {
    return AcademicLevel::kExpert;
  }
  return std::nullopt;
}

std::optional<LearningStyle> parse_learning_style(const std::string_view text) {
  const std::string key = core::normalize_key(text);
  if (key == "visual") {
    return LearningStyle::kVisual;
  }
  if (key == "auditory") {
    return LearningStyle::kAuditory;
  }
  if (key == "reading" || key == "reading_writing" || key == "reading/writing") {
    return LearningStyle::kReading;
  }
  if (key == "kinesthetic") {
    return LearningStyle::kKinesthetic;
  }
  return std::nullopt;
}

std::set<core::SubjectId> Participant::subject_ids() const {
  std::set<core::SubjectId> ids;
  for (const auto& subject : subjects) {
    ids.insert(subject.subject_id);
  }
  return ids;
}

std::optional<AcademicLevel> Participant::proficiency(const core::SubjectId& subject) const {
  for (const auto& entry : subjects) {
    if (entry.subject_id == subject) {
      return entry.level;
    }
  }
  return std::nullopt;
}

}  // namespace sme::domain
