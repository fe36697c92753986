#pragma once

#include "sme/cache/eviction_cache.h"
#include "sme/core/clock.h"
#include "sme/core/result.h"
#include "sme/domain/criteria.h"
#include "sme/domain/match_result.h"
#include "sme/matching/matching_pipeline.h"
#include "sme/matching/scorer.h"
#include "sme/prediction/progress_predictor.h"
#include "sme/recommendation/collaborative_engine.h"
#include "sme/recommendation/content_engine.h"
#include "sme/recommendation/hybrid_engine.h"
#include "sme/scheduling/availability_scheduler.h"
#include "sme/storage/candidate_source.h"

#include <optional>
#include <string>
#include <vector>

namespace sme::app {

// EngineConfig gathers the tunables of every component. Defaults match production.
struct EngineConfig {
  cache::CacheConfig cache;               // NOLINT(readability-identifier-naming)
  matching::ScoreWeights weights;         // NOLINT(readability-identifier-naming)
  matching::DiversityConfig diversity;    // NOLINT(readability-identifier-naming)
  recommendation::CollaborativeConfig collaborative;  // NOLINT(readability-identifier-naming)
  recommendation::HybridWeights hybrid;   // NOLINT(readability-identifier-naming)
};

// Returns an empty string when the config is usable, otherwise the first problem.
[[nodiscard]] std::string validate_engine_config(const EngineConfig& config);

// ────────────────────────────────────────────────────────────────
// Match
// ────────────────────────────────────────────────────────────────

struct MatchRequest {
  core::ParticipantId requester_id;   // NOLINT(readability-identifier-naming)
  domain::MatchingCriteria criteria;  // NOLINT(readability-identifier-naming)
  int limit{10};                      // NOLINT(readability-identifier-naming)
};

struct MatchResponse {
  std::vector<domain::MatchResult> matches;  // NOLINT(readability-identifier-naming)
  std::size_t candidates_considered{0};      // NOLINT(readability-identifier-naming)
  cache::CacheStats cache_stats;             // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Recommend
// ────────────────────────────────────────────────────────────────

struct RecommendRequest {
  core::ParticipantId requester_id;  // NOLINT(readability-identifier-naming)
  domain::RecommendationMethod method{
      domain::RecommendationMethod::kHybrid};  // NOLINT(readability-identifier-naming)
  int limit{10};                               // NOLINT(readability-identifier-naming)
};

[[nodiscard]] std::optional<domain::RecommendationMethod> parse_recommendation_method(
    const std::string& text);

// EngineService is the composition root: it owns the cache and every engine and
// resolves requests against a candidate source. The clock and providers are
// borrowed and must outlive the service. Instances are shared across requests;
// only the cache carries mutable state.
class EngineService {
 public:
  EngineService(EngineConfig config, const core::IClock& clock,
                const matching::ILocationDistanceProvider& distances,
                const matching::IReputationProvider& reputations);

  // Not copyable or movable (engines hold references into this object)
  EngineService(const EngineService&) = delete;
  EngineService& operator=(const EngineService&) = delete;
  EngineService(EngineService&&) = delete;
  EngineService& operator=(EngineService&&) = delete;
  ~EngineService() = default;

  [[nodiscard]] core::Result<MatchResponse, std::string> run_match(
      const MatchRequest& request, const storage::ICandidateSource& source) const;

  // Participants restricted to `ids` when non-empty; unknown ids are an error.
  [[nodiscard]] core::Result<std::vector<domain::ScheduleSlot>, std::string> run_schedule(
      const storage::ICandidateSource& source, const std::vector<core::ParticipantId>& ids,
      int duration_minutes, int min_participants) const;

  [[nodiscard]] core::Result<std::vector<domain::Recommendation>, std::string> run_recommend(
      const RecommendRequest& request, const storage::ICandidateSource& source) const;

  [[nodiscard]] core::Result<std::vector<std::vector<core::ParticipantId>>, std::string>
  run_circles(const storage::ICandidateSource& source) const;

  [[nodiscard]] prediction::ProgressProjection run_predict(
      const std::vector<prediction::ProgressPoint>& history,
      const prediction::ProgressGoal& goal) const;

  [[nodiscard]] const matching::MatchingPipeline& pipeline() const { return pipeline_; }
  [[nodiscard]] const recommendation::IRecommendationEngine& engine(
      domain::RecommendationMethod method) const;
  [[nodiscard]] cache::CacheStats cache_stats() const { return cache_.stats(); }

 private:
  EngineConfig config_;
  matching::CompatibilityScorer scorer_;
  mutable matching::MatchCache cache_;
  matching::MatchingPipeline pipeline_;
  scheduling::AvailabilityScheduler scheduler_;
  recommendation::CollaborativeEngine collaborative_;
  recommendation::ContentEngine content_;
  recommendation::HybridEngine hybrid_;
  prediction::ProgressPredictor predictor_;
};

}  // namespace sme::app
