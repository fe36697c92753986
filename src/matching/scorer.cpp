#include "sme/matching/scorer.h"

#include "sme/domain/availability.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace sme::matching {

namespace {

constexpr double kNeutral = 0.5;

double clamp_unit(const double value) {
  if (std::isnan(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

bool is_complementary(const domain::LearningStyle a, const domain::LearningStyle b) {
  using domain::LearningStyle;
  auto pair_is = [a, b](LearningStyle x, LearningStyle y) {
    return (a == x && b == y) || (a == y && b == x);
  };
  return pair_is(LearningStyle::kVisual, LearningStyle::kKinesthetic) ||
         pair_is(LearningStyle::kAuditory, LearningStyle::kReading) ||
         pair_is(LearningStyle::kVisual, LearningStyle::kAuditory);
}

std::pair<std::string, std::string> ordered_pair(const std::string& a, const std::string& b) {
  return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

}  // namespace

std::string validate_weights(const ScoreWeights& weights) {
  for (const double w : {weights.subject, weights.level, weights.style, weights.time,
                         weights.location, weights.activity, weights.reputation}) {
    if (w < 0.0 || std::isnan(w)) {
      return "score weights must be non-negative";
    }
  }
  if (std::abs(weights.sum() - 1.0) > 1e-9) {
    return "score weights must sum to 1.0 (got " + std::to_string(weights.sum()) + ")";
  }
  return "";
}

std::optional<double> NullDistanceProvider::distance(
    [[maybe_unused]] const domain::Participant& a,
    [[maybe_unused]] const domain::Participant& b) const {
  return std::nullopt;
}

void RegionDistanceTable::set_distance(const std::string& region_a, const std::string& region_b,
                                       const double distance) {
  distances_[ordered_pair(region_a, region_b)] = distance;
}

std::optional<double> RegionDistanceTable::distance(const domain::Participant& a,
                                                    const domain::Participant& b) const {
  const auto it = distances_.find(ordered_pair(a.region, b.region));
  if (it == distances_.end()) {
    return std::nullopt;
  }
  return it->second;
}

double RecordReputationProvider::reputation(const domain::Participant& participant) const {
  return participant.reputation.value_or(fallback_);
}

double subject_match(const domain::Participant& a, const domain::Participant& b) {
  const auto subjects_a = a.subject_ids();
  const auto subjects_b = b.subject_ids();
  if (subjects_a.empty() && subjects_b.empty()) {
    return 0.0;
  }

  std::size_t shared = 0;
  for (const auto& subject : subjects_a) {
    if (subjects_b.contains(subject)) {
      ++shared;
    }
  }
  const std::size_t united = subjects_a.size() + subjects_b.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(united);
}

double level_compatibility(const domain::AcademicLevel a, const domain::AcademicLevel b) {
  switch (std::abs(domain::level_ordinal(a) - domain::level_ordinal(b))) {
    case 0:
      return 1.0;
    case 1:
      return 0.8;
    case 2:
      return 0.5;
    default:
      return 0.2;
  }
}

double style_compatibility(const std::optional<domain::LearningStyle>& a,
                           const std::optional<domain::LearningStyle>& b) {
  if (!a.has_value() || !b.has_value()) {
    return kNeutral;
  }
  if (*a == *b) {
    return 1.0;
  }
  return is_complementary(*a, *b) ? 0.8 : 0.3;
}

double time_overlap(const domain::Participant& a, const domain::Participant& b) {
  const auto intervals_a = domain::to_intervals(a.id, a.availability);
  const auto intervals_b = domain::to_intervals(b.id, b.availability);

  const auto total_a = domain::total_duration(intervals_a);
  const auto total_b = domain::total_duration(intervals_b);
  if (total_a.count() <= 0 || total_b.count() <= 0) {
    return 0.0;
  }

  const auto overlap = domain::overlap_duration(intervals_a, intervals_b);
  const auto denominator = std::min(total_a, total_b);
  return clamp_unit(static_cast<double>(overlap.count()) /
                    static_cast<double>(denominator.count()));
}

double distance_band(const double distance) {
  if (distance < 10.0) {
    return 0.9;
  }
  if (distance < 50.0) {
    return 0.7;
  }
  if (distance < 200.0) {
    return 0.4;
  }
  return 0.1;
}

double activity_compatibility(const int activity_a, const int activity_b) {
  const int a = std::max(activity_a, 0);
  const int b = std::max(activity_b, 0);
  if (a == 0 && b == 0) {
    return kNeutral;
  }
  const double diff = std::abs(a - b);
  return std::max(0.0, 1.0 - diff / static_cast<double>(std::max(a, b)));
}

CompatibilityScorer::CompatibilityScorer(const ILocationDistanceProvider& distances,
                                         const IReputationProvider& reputations,
                                         ScoreWeights weights)
    : distances_(distances), reputations_(reputations), weights_(weights) {
  if (const auto error = validate_weights(weights_); !error.empty()) {
    throw std::invalid_argument(error);
  }
}

double CompatibilityScorer::location_compatibility(const domain::Participant& a,
                                                   const domain::Participant& b) const {
  if (!a.timezone.empty() && a.timezone == b.timezone) {
    return 1.0;
  }
  if (!a.region.empty() && a.region == b.region) {
    return 1.0;
  }
  if ((a.timezone.empty() && a.region.empty()) || (b.timezone.empty() && b.region.empty())) {
    return kNeutral;
  }
  const auto distance = distances_.distance(a, b);
  if (!distance.has_value() || std::isnan(*distance)) {
    return kNeutral;
  }
  return distance_band(std::max(*distance, 0.0));
}

domain::CompatibilityScore CompatibilityScorer::score(
    const domain::Participant& requester, const domain::Participant& candidate) const {
  domain::CompatibilityScore s;
  s.subject_match = clamp_unit(subject_match(requester, candidate));
  s.level_compatibility = level_compatibility(requester.academic_level, candidate.academic_level);
  s.style_compatibility = style_compatibility(requester.learning_style, candidate.learning_style);
  s.time_overlap = time_overlap(requester, candidate);
  s.location_compatibility = location_compatibility(requester, candidate);
  s.activity_compatibility =
      activity_compatibility(requester.recent_activity, candidate.recent_activity);
  s.reputation_score = clamp_unit(reputations_.reputation(candidate));

  s.overall = clamp_unit(weights_.subject * s.subject_match +
                         weights_.level * s.level_compatibility +
                         weights_.style * s.style_compatibility + weights_.time * s.time_overlap +
                         weights_.location * s.location_compatibility +
                         weights_.activity * s.activity_compatibility +
                         weights_.reputation * s.reputation_score);
  return s;
}

}  // namespace sme::matching
