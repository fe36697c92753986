#pragma once

#include "sme/recommendation/recommendation_engine.h"

namespace sme::recommendation {

// feature_vector builds the sparse profile used for content similarity:
// "subject:<id>" weighted by proficiency rating (1..4), plus weight-1 dimensions for
// level, learning style, institution, major and graduation year when present.
[[nodiscard]] FeatureVector feature_vector(const domain::Participant& participant);

// describe_content_match lists the matched dimensions, or "Good overall match".
[[nodiscard]] std::string describe_content_match(const domain::Participant& target,
                                                 const domain::Participant& candidate);

// ContentEngine scores every other pool member by cosine similarity of feature
// vectors against the target.
class ContentEngine final : public IRecommendationEngine {
 public:
  [[nodiscard]] std::vector<domain::Recommendation> recommend(
      const domain::Participant& target, const std::vector<domain::Participant>& pool,
      int limit) const override;
};

}  // namespace sme::recommendation
