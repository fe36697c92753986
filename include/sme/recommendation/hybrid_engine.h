#pragma once

#include "sme/recommendation/collaborative_engine.h"
#include "sme/recommendation/content_engine.h"

namespace sme::recommendation {

struct HybridWeights {
  double collaborative{0.6};
  double content{0.4};
};

// HybridEngine runs both strategies for 2×limit candidates and merges by candidate:
// score = w_collab × collaborative + w_content × content, where a candidate missing
// from one list contributes only the other term. The method is kHybrid when both
// strategies contributed, otherwise the contributing strategy.
class HybridEngine final : public IRecommendationEngine {
 public:
  HybridEngine(const CollaborativeEngine& collaborative, const ContentEngine& content,
               HybridWeights weights = HybridWeights{})
      : collaborative_(collaborative), content_(content), weights_(weights) {}

  [[nodiscard]] std::vector<domain::Recommendation> recommend(
      const domain::Participant& target, const std::vector<domain::Participant>& pool,
      int limit) const override;

 private:
  const CollaborativeEngine& collaborative_;
  const ContentEngine& content_;
  HybridWeights weights_;
};

}  // namespace sme::recommendation
