#pragma once

#include "sme/cache/eviction_cache.h"
#include "sme/domain/criteria.h"
#include "sme/domain/match_result.h"
#include "sme/domain/participant.h"
#include "sme/matching/scorer.h"

#include <cstddef>
#include <string>
#include <vector>

namespace sme::matching {

using MatchCache = cache::EvictionCache<std::string, std::vector<domain::MatchResult>>;

struct DiversityConfig {
  std::size_t max_per_institution{3};
  std::size_t max_per_level{2};
};

// Score bands: a band opens at its highest overall score and holds every following
// candidate within this distance of that anchor. Inside a band candidates are
// ordered by subject_match, then time_overlap; bands keep overall order.
inline constexpr double kRankBandWidth = 0.1;

// passes_hard_filters is the pre-filter predicate applied before scoring. A candidate
// passes when it is not the requester, not already partnered with the requester,
// active with a complete profile, matches the exact level/style when the criteria
// require it, and shares at least one subject with a non-empty criteria subject set.
[[nodiscard]] bool passes_hard_filters(const domain::Participant& requester,
                                       const domain::Participant& candidate,
                                       const domain::MatchingCriteria& criteria);

// make_cache_key hashes the requester id together with the canonical criteria JSON.
[[nodiscard]] std::string make_cache_key(const core::ParticipantId& requester,
                                         const domain::MatchingCriteria& criteria);

// rank_results sorts in place. Within a score band the higher subject_match wins,
// then the higher time_overlap, then the higher overall, then the smaller id.
void rank_results(std::vector<domain::MatchResult>& results);

// diversify walks the ranked list admitting a candidate only while its institution
// and its academic level are both under their caps among admitted candidates, then
// appends the unadmitted candidates in ranked order.
[[nodiscard]] std::vector<domain::MatchResult> diversify(std::vector<domain::MatchResult> ranked,
                                                         const DiversityConfig& config);

// MatchingPipeline runs pre-filter → score → rank → diversify for one requester and
// memoizes the diversified list in an injected cache. The cache may be shared with
// other pipelines; the scorer and cache must outlive the pipeline.
class MatchingPipeline {
 public:
  MatchingPipeline(const CompatibilityScorer& scorer, MatchCache& cache,
                   DiversityConfig diversity = DiversityConfig{});

  // find_matches returns at most `limit` results. limit <= 0 throws
  // std::invalid_argument. An empty pool or an unsatisfiable criteria set yields an
  // empty list.
  [[nodiscard]] std::vector<domain::MatchResult> find_matches(
      const domain::Participant& requester, const std::vector<domain::Participant>& pool,
      const domain::MatchingCriteria& criteria, int limit) const;

  // build_result scores one candidate and attaches shared/complementary subjects,
  // reasons and stats.
  [[nodiscard]] domain::MatchResult build_result(const domain::Participant& requester,
                                                 const domain::Participant& candidate) const;

 private:
  const CompatibilityScorer& scorer_;
  MatchCache& cache_;
  DiversityConfig diversity_;
};

}  // namespace sme::matching
