#include "sme/recommendation/content_engine.h"

#include "sme/core/normalization.h"

#include <string>

namespace sme::recommendation {

FeatureVector feature_vector(const domain::Participant& participant) {
  FeatureVector features;
  for (const auto& subject : participant.subjects) {
    features["subject:" + subject.subject_id.value] = domain::proficiency_rating(subject.level);
  }
  features["level:" + std::string(domain::to_string(participant.academic_level))] = 1.0;
  if (participant.learning_style.has_value()) {
    features["style:" + std::string(domain::to_string(*participant.learning_style))] = 1.0;
  }
  if (!participant.institution.empty()) {
    features["institution:" + core::normalize_key(participant.institution)] = 1.0;
  }
  if (participant.major.has_value() && !participant.major->empty()) {
    features["major:" + core::normalize_key(*participant.major)] = 1.0;
  }
  if (participant.graduation_year.has_value()) {
    features["year:" + std::to_string(*participant.graduation_year)] = 1.0;
  }
  return features;
}

std::string describe_content_match(const domain::Participant& target,
                                   const domain::Participant& candidate) {
  std::vector<std::string> parts;

  const auto target_subjects = target.subject_ids();
  std::size_t shared = 0;
  for (const auto& subject : candidate.subject_ids()) {
    if (target_subjects.contains(subject)) {
      ++shared;
    }
  }
  if (shared > 0) {
    parts.push_back(std::to_string(shared) + (shared == 1 ? " shared subject" : " shared subjects"));
  }
  if (target.academic_level == candidate.academic_level) {
    parts.emplace_back("same study level");
  }
  if (target.learning_style.has_value() && target.learning_style == candidate.learning_style) {
    parts.emplace_back("same learning style");
  }
  if (!target.institution.empty() &&
      core::normalize_key(target.institution) == core::normalize_key(candidate.institution)) {
    parts.emplace_back("same institution");
  }

  if (parts.empty()) {
    return "Good overall match";
  }
  std::string reason = "High compatibility: ";
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      reason += ", ";
    }
    reason += parts[i];
  }
  return reason;
}

std::vector<domain::Recommendation> ContentEngine::recommend(
    const domain::Participant& target, const std::vector<domain::Participant>& pool,
    const int limit) const {
  const std::size_t take = checked_limit(limit, "ContentEngine::recommend");
  const auto target_features = feature_vector(target);

  std::vector<domain::Recommendation> out;
  out.reserve(pool.size());
  for (const auto& candidate : pool) {
    if (candidate.id == target.id) {
      continue;
    }
    out.push_back(domain::Recommendation{
        candidate.id, cosine_similarity(target_features, feature_vector(candidate)),
        domain::RecommendationMethod::kContent, describe_content_match(target, candidate)});
  }
  sort_and_truncate(out, take);
  return out;
}

}  // namespace sme::recommendation
