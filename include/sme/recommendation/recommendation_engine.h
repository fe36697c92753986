#pragma once

#include "sme/domain/match_result.h"
#include "sme/domain/participant.h"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace sme::recommendation {

// IRecommendationEngine is the seam shared by the collaborative, content-based and
// hybrid strategies. Implementations are stateless and const.
//
// recommend() returns at most `limit` recommendations sorted by score descending
// (ties by candidate id). limit <= 0 throws std::invalid_argument.
class IRecommendationEngine {
 public:
  virtual ~IRecommendationEngine() = default;

  [[nodiscard]] virtual std::vector<domain::Recommendation> recommend(
      const domain::Participant& target, const std::vector<domain::Participant>& pool,
      int limit) const = 0;
};

using FeatureVector = std::map<std::string, double>;

// Pearson correlation of two equally sized samples; 0 for empty, mismatched or
// zero-variance input.
[[nodiscard]] double pearson_correlation(const std::vector<double>& x,
                                         const std::vector<double>& y);

// Cosine similarity of two sparse vectors; 0 when either has zero norm.
[[nodiscard]] double cosine_similarity(const FeatureVector& a, const FeatureVector& b);

// Sorts by score descending, then candidate id, and truncates to limit.
void sort_and_truncate(std::vector<domain::Recommendation>& recommendations, std::size_t limit);

// Throws std::invalid_argument for limit <= 0; returns the limit as a size.
std::size_t checked_limit(int limit, const char* caller);

}  // namespace sme::recommendation
