#include "sme/recommendation/recommendation_engine.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sme::recommendation {

double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) {
  const std::size_t n = x.size();
  if (n == 0 || n != y.size()) {
    return 0.0;
  }

  double sum_x = 0.0;
  double sum_y = 0.0;
  double sum_xy = 0.0;
  double sum_x2 = 0.0;
  double sum_y2 = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    sum_x += x[i];
    sum_y += y[i];
    sum_xy += x[i] * y[i];
    sum_x2 += x[i] * x[i];
    sum_y2 += y[i] * y[i];
  }

  const double count = static_cast<double>(n);
  const double numerator = count * sum_xy - sum_x * sum_y;
  const double variance_product =
      (count * sum_x2 - sum_x * sum_x) * (count * sum_y2 - sum_y * sum_y);
  if (variance_product <= 0.0) {
    return 0.0;
  }
  return numerator / std::sqrt(variance_product);
}

double cosine_similarity(const FeatureVector& a, const FeatureVector& b) {
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (const auto& [key, value] : a) {
    norm_a += value * value;
    const auto it = b.find(key);
    if (it != b.end()) {
      dot += value * it->second;
    }
  }
  for (const auto& [key, value] : b) {
    norm_b += value * value;
  }
  const double denominator = std::sqrt(norm_a) * std::sqrt(norm_b);
  return denominator == 0.0 ? 0.0 : dot / denominator;
}

void sort_and_truncate(std::vector<domain::Recommendation>& recommendations,
                       const std::size_t limit) {
  std::sort(recommendations.begin(), recommendations.end(),
            [](const domain::Recommendation& a, const domain::Recommendation& b) {
              if (a.score != b.score) {
                return a.score > b.score;
              }
              return a.candidate_id < b.candidate_id;
            });
  if (recommendations.size() > limit) {
    recommendations.resize(limit);
  }
}

std::size_t checked_limit(const int limit, const char* caller) {
  if (limit <= 0) {
    throw std::invalid_argument(std::string(caller) + ": limit must be positive");
  }
  return static_cast<std::size_t>(limit);
}

}  // namespace sme::recommendation
