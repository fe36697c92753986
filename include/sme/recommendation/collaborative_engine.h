#pragma once

#include "sme/recommendation/recommendation_engine.h"

#include <cstddef>

namespace sme::recommendation {

struct CollaborativeConfig {
  double min_similarity{0.3};      // neighbours must exceed this correlation
  std::size_t neighborhood_size{20};
  std::size_t min_shared_subjects{2};
};

// Similarity between two participants: Pearson correlation of their proficiency
// ratings (Beginner=1 .. Expert=4) over the subjects both study. Defined as 0 when
// fewer than min_shared_subjects are shared.
[[nodiscard]] double rating_similarity(const domain::Participant& a, const domain::Participant& b,
                                       std::size_t min_shared_subjects = 2);

// CollaborativeEngine recommends the partners of the target's most similar peers.
// Each neighbour contributes its similarity to every one of its partners that is in
// the pool, is not the target and is not already partnered with the target.
class CollaborativeEngine final : public IRecommendationEngine {
 public:
  explicit CollaborativeEngine(CollaborativeConfig config = CollaborativeConfig{})
      : config_(config) {}

  [[nodiscard]] std::vector<domain::Recommendation> recommend(
      const domain::Participant& target, const std::vector<domain::Participant>& pool,
      int limit) const override;

 private:
  CollaborativeConfig config_;
};

}  // namespace sme::recommendation
