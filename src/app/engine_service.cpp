#include "sme/app/engine_service.h"

#include "sme/core/normalization.h"
#include "sme/structures/participant_graph.h"

#include <algorithm>

namespace sme::app {

namespace {

const domain::Participant* find_participant(const std::vector<domain::Participant>& pool,
                                            const core::ParticipantId& id) {
  const auto it = std::find_if(pool.begin(), pool.end(),
                               [&](const domain::Participant& p) { return p.id == id; });
  return it == pool.end() ? nullptr : &*it;
}

}  // namespace

std::string validate_engine_config(const EngineConfig& config) {
  if (config.cache.capacity == 0) {
    return "cache capacity must be positive";
  }
  if (config.cache.ttl <= core::Millis{0}) {
    return "cache ttl must be positive";
  }
  if (auto error = matching::validate_weights(config.weights); !error.empty()) {
    return error;
  }
  if (config.diversity.max_per_institution == 0 || config.diversity.max_per_level == 0) {
    return "diversity caps must be positive";
  }
  if (config.collaborative.neighborhood_size == 0) {
    return "collaborative neighbourhood size must be positive";
  }
  return "";
}

std::optional<domain::RecommendationMethod> parse_recommendation_method(const std::string& text) {
  const std::string key = core::normalize_key(text);
  if (key == "collaborative") {
    return domain::RecommendationMethod::kCollaborative;
  }
  if (key == "content") {
    return domain::RecommendationMethod::kContent;
  }
  if (key == "hybrid") {
    return domain::RecommendationMethod::kHybrid;
  }
  return std::nullopt;
}

EngineService::EngineService(EngineConfig config, const core::IClock& clock,
                             const matching::ILocationDistanceProvider& distances,
                             const matching::IReputationProvider& reputations)
    : config_(config),
      scorer_(distances, reputations, config_.weights),
      cache_(config_.cache, clock),
      pipeline_(scorer_, cache_, config_.diversity),
      collaborative_(config_.collaborative),
      hybrid_(collaborative_, content_, config_.hybrid),
      predictor_(clock) {}

const recommendation::IRecommendationEngine& EngineService::engine(
    const domain::RecommendationMethod method) const {
  switch (method) {
    case domain::RecommendationMethod::kCollaborative:
      return collaborative_;
    case domain::RecommendationMethod::kContent:
      return content_;
    case domain::RecommendationMethod::kHybrid:
      return hybrid_;
  }
  return hybrid_;
}

core::Result<MatchResponse, std::string> EngineService::run_match(
    const MatchRequest& request, const storage::ICandidateSource& source) const {
  using R = core::Result<MatchResponse, std::string>;

  auto pool = source.load_all();
  if (!pool.has_value()) {
    return R::err(pool.error());
  }
  const auto* requester = find_participant(pool.value(), request.requester_id);
  if (requester == nullptr) {
    return R::err("requester not found: " + request.requester_id.value);
  }

  auto candidates = source.load_candidates(*requester, request.criteria);
  if (!candidates.has_value()) {
    return R::err(candidates.error());
  }

  MatchResponse response;
  response.candidates_considered = candidates.value().size();
  response.matches =
      pipeline_.find_matches(*requester, candidates.value(), request.criteria, request.limit);
  response.cache_stats = cache_.stats();
  return R::ok(std::move(response));
}

core::Result<std::vector<domain::ScheduleSlot>, std::string> EngineService::run_schedule(
    const storage::ICandidateSource& source, const std::vector<core::ParticipantId>& ids,
    const int duration_minutes, const int min_participants) const {
  using R = core::Result<std::vector<domain::ScheduleSlot>, std::string>;

  auto pool = source.load_all();
  if (!pool.has_value()) {
    return R::err(pool.error());
  }
  if (ids.empty()) {
    return R::ok(scheduler_.find_slots(pool.value(), duration_minutes, min_participants));
  }

  std::vector<domain::Participant> selected;
  selected.reserve(ids.size());
  for (const auto& id : ids) {
    const auto* participant = find_participant(pool.value(), id);
    if (participant == nullptr) {
      return R::err("participant not found: " + id.value);
    }
    selected.push_back(*participant);
  }
  return R::ok(scheduler_.find_slots(selected, duration_minutes, min_participants));
}

core::Result<std::vector<domain::Recommendation>, std::string> EngineService::run_recommend(
    const RecommendRequest& request, const storage::ICandidateSource& source) const {
  using R = core::Result<std::vector<domain::Recommendation>, std::string>;

  auto pool = source.load_all();
  if (!pool.has_value()) {
    return R::err(pool.error());
  }
  const auto* target = find_participant(pool.value(), request.requester_id);
  if (target == nullptr) {
    return R::err("requester not found: " + request.requester_id.value);
  }
  return R::ok(engine(request.method).recommend(*target, pool.value(), request.limit));
}

core::Result<std::vector<std::vector<core::ParticipantId>>, std::string>
EngineService::run_circles(const storage::ICandidateSource& source) const {
  using R = core::Result<std::vector<std::vector<core::ParticipantId>>, std::string>;

  auto pool = source.load_all();
  if (!pool.has_value()) {
    return R::err(pool.error());
  }
  return R::ok(structures::build_partnership_graph(pool.value()).connected_components());
}

prediction::ProgressProjection EngineService::run_predict(
    const std::vector<prediction::ProgressPoint>& history,
    const prediction::ProgressGoal& goal) const {
  return predictor_.predict(history, goal);
}

}  // namespace sme::app
