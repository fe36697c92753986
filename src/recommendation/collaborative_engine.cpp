#include "sme/recommendation/collaborative_engine.h"

#include "sme/structures/priority_queue.h"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>

namespace sme::recommendation {

namespace {

struct Neighbour {
  const domain::Participant* participant;
  double similarity;
};

// Higher similarity first; on equal similarity the smaller id is "greater".
struct NeighbourOrder {
  bool operator()(const Neighbour& a, const Neighbour& b) const {
    if (a.similarity != b.similarity) {
      return a.similarity < b.similarity;
    }
    return b.participant->id < a.participant->id;
  }
};

std::string format_similarity(const double similarity) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << similarity;
  return out.str();
}

}  // namespace

double rating_similarity(const domain::Participant& a, const domain::Participant& b,
                         const std::size_t min_shared_subjects) {
  std::vector<double> ratings_a;
  std::vector<double> ratings_b;
  for (const auto& subject : a.subjects) {
    const auto other = b.proficiency(subject.subject_id);
    if (!other.has_value()) {
      continue;
    }
    ratings_a.push_back(domain::proficiency_rating(subject.level));
    ratings_b.push_back(domain::proficiency_rating(*other));
  }
  if (ratings_a.size() < min_shared_subjects || ratings_a.size() < 2) {
    return 0.0;
  }
  return pearson_correlation(ratings_a, ratings_b);
}

std::vector<domain::Recommendation> CollaborativeEngine::recommend(
    const domain::Participant& target, const std::vector<domain::Participant>& pool,
    const int limit) const {
  const std::size_t take = checked_limit(limit, "CollaborativeEngine::recommend");

  structures::PriorityQueue<Neighbour, NeighbourOrder> neighbours;
  std::map<core::ParticipantId, const domain::Participant*> by_id;
  for (const auto& candidate : pool) {
    by_id.emplace(candidate.id, &candidate);
    if (candidate.id == target.id) {
      continue;
    }
    const double similarity = rating_similarity(target, candidate, config_.min_shared_subjects);
    if (similarity > config_.min_similarity) {
      neighbours.push(Neighbour{&candidate, similarity});
    }
  }

  struct Accumulated {
    double score{0.0};
    double best_similarity{0.0};
  };
  std::map<core::ParticipantId, Accumulated> scores;

  for (const auto& neighbour : neighbours.take(config_.neighborhood_size)) {
    for (const auto& partner_id : neighbour.participant->partner_ids) {
      if (partner_id == target.id || target.is_partnered_with(partner_id) ||
          !by_id.contains(partner_id)) {
        continue;
      }
      auto& entry = scores[partner_id];
      entry.score += neighbour.similarity;
      entry.best_similarity = std::max(entry.best_similarity, neighbour.similarity);
    }
  }

  std::vector<domain::Recommendation> out;
  out.reserve(scores.size());
  for (const auto& [id, entry] : scores) {
    out.push_back(domain::Recommendation{
        id, entry.score, domain::RecommendationMethod::kCollaborative,
        "Recommended by participants similar to you (similarity: " +
            format_similarity(entry.best_similarity) + ")"});
  }
  sort_and_truncate(out, take);
  return out;
}

}  // namespace sme::recommendation
