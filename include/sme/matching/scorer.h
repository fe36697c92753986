#pragma once

#include "sme/domain/match_result.h"
#include "sme/domain/participant.h"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace sme::matching {

struct ScoreWeights {
  double subject{0.25};
  double level{0.20};
  double style{0.15};
  double time{0.15};
  double location{0.10};
  double activity{0.10};
  double reputation{0.05};

  [[nodiscard]] double sum() const {
    return subject + level + style + time + location + activity + reputation;
  }
};

// validate_weights returns an empty string when every weight is non-negative and the
// total is 1.0 (within 1e-9), otherwise a description of the problem.
[[nodiscard]] std::string validate_weights(const ScoreWeights& weights);

// ILocationDistanceProvider supplies a scalar distance between two participants'
// locations (geocoding lives outside the engine). nullopt means unknown.
class ILocationDistanceProvider {
 public:
  virtual ~ILocationDistanceProvider() = default;

  [[nodiscard]] virtual std::optional<double> distance(const domain::Participant& a,
                                                       const domain::Participant& b) const = 0;
};

// NullDistanceProvider never knows a distance; differing location tags score neutral.
class NullDistanceProvider final : public ILocationDistanceProvider {
 public:
  [[nodiscard]] std::optional<double> distance(const domain::Participant& a,
                                               const domain::Participant& b) const override;
};

// RegionDistanceTable looks up symmetric distances between region tags.
class RegionDistanceTable final : public ILocationDistanceProvider {
 public:
  void set_distance(const std::string& region_a, const std::string& region_b, double distance);

  [[nodiscard]] std::optional<double> distance(const domain::Participant& a,
                                               const domain::Participant& b) const override;

 private:
  std::map<std::pair<std::string, std::string>, double> distances_;
};

// IReputationProvider supplies the review-aggregate component for a participant.
class IReputationProvider {
 public:
  virtual ~IReputationProvider() = default;

  [[nodiscard]] virtual double reputation(const domain::Participant& participant) const = 0;
};

// RecordReputationProvider reads Participant::reputation, falling back to a fixed
// default when the record carries none.
class RecordReputationProvider final : public IReputationProvider {
 public:
  static constexpr double kDefaultReputation = 0.8;

  explicit RecordReputationProvider(double fallback = kDefaultReputation) : fallback_(fallback) {}

  [[nodiscard]] double reputation(const domain::Participant& participant) const override;

 private:
  double fallback_;
};

// Component scores. Each returns a value in [0,1] for every input.
[[nodiscard]] double subject_match(const domain::Participant& a, const domain::Participant& b);
[[nodiscard]] double level_compatibility(domain::AcademicLevel a, domain::AcademicLevel b);
[[nodiscard]] double style_compatibility(const std::optional<domain::LearningStyle>& a,
                                         const std::optional<domain::LearningStyle>& b);
[[nodiscard]] double time_overlap(const domain::Participant& a, const domain::Participant& b);
[[nodiscard]] double distance_band(double distance);
[[nodiscard]] double activity_compatibility(int activity_a, int activity_b);

// CompatibilityScorer computes the seven-component score for a pair of participants.
// score() is const and deterministic; the providers are borrowed and must outlive
// the scorer.
class CompatibilityScorer {
 public:
  CompatibilityScorer(const ILocationDistanceProvider& distances,
                      const IReputationProvider& reputations,
                      ScoreWeights weights = ScoreWeights{});

  [[nodiscard]] domain::CompatibilityScore score(const domain::Participant& requester,
                                                 const domain::Participant& candidate) const;

  [[nodiscard]] double location_compatibility(const domain::Participant& a,
                                              const domain::Participant& b) const;

  [[nodiscard]] const ScoreWeights& weights() const { return weights_; }

 private:
  const ILocationDistanceProvider& distances_;
  const IReputationProvider& reputations_;
  ScoreWeights weights_;
};

}  // namespace sme::matching
