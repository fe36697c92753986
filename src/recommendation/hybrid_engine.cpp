#include "sme/recommendation/hybrid_engine.h"

#include <limits>
#include <map>

namespace sme::recommendation {

std::vector<domain::Recommendation> HybridEngine::recommend(
    const domain::Participant& target, const std::vector<domain::Participant>& pool,
    const int limit) const {
  const std::size_t take = checked_limit(limit, "HybridEngine::recommend");
  constexpr int kMaxLimit = std::numeric_limits<int>::max();
  const int expanded = limit > kMaxLimit / 2 ? kMaxLimit : limit * 2;

  const auto collaborative = collaborative_.recommend(target, pool, expanded);
  const auto content = content_.recommend(target, pool, expanded);

  std::map<core::ParticipantId, domain::Recommendation> merged;
  for (const auto& rec : collaborative) {
    merged.emplace(rec.candidate_id,
                   domain::Recommendation{rec.candidate_id, rec.score * weights_.collaborative,
                                          domain::RecommendationMethod::kCollaborative,
                                          rec.reason});
  }
  for (const auto& rec : content) {
    auto it = merged.find(rec.candidate_id);
    if (it == merged.end()) {
      merged.emplace(rec.candidate_id,
                     domain::Recommendation{rec.candidate_id, rec.score * weights_.content,
                                            domain::RecommendationMethod::kContent, rec.reason});
      continue;
    }
    it->second.score += rec.score * weights_.content;
    it->second.method = domain::RecommendationMethod::kHybrid;
    it->second.reason += "; " + rec.reason;
  }

  std::vector<domain::Recommendation> out;
  out.reserve(merged.size());
  for (auto& [id, rec] : merged) {
    out.push_back(std::move(rec));
  }
  sort_and_truncate(out, take);
  return out;
}

}  // namespace sme::recommendation
