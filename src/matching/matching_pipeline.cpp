#include "sme/matching/matching_pipeline.h"

#include "sme/core/hashing.h"
#include "sme/domain/participant_json.h"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace sme::matching {

namespace {

std::string plural(const std::size_t n, const std::string& word) {
  return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

std::vector<std::string> build_reasons(const domain::Participant& requester,
                                       const domain::Participant& candidate,
                                       const domain::CompatibilityScore& score,
                                       const std::size_t shared_subjects) {
  std::vector<std::string> reasons;
  if (shared_subjects > 0) {
    reasons.push_back(plural(shared_subjects, "shared subject"));
  }
  if (requester.academic_level == candidate.academic_level) {
    reasons.emplace_back("Same study level");
  } else if (score.level_compatibility >= 0.8) {
    reasons.emplace_back("Complementary skill levels");
  }
  if (requester.learning_style.has_value() && candidate.learning_style.has_value()) {
    reasons.emplace_back(requester.learning_style == candidate.learning_style
                             ? "Compatible learning styles"
                             : "Diverse learning approaches");
  }
  if (score.time_overlap > 0.0) {
    reasons.emplace_back("Overlapping availability");
  }
  const long long activity_gap = static_cast<long long>(requester.recent_activity) -
                                 static_cast<long long>(candidate.recent_activity);
  if (std::llabs(activity_gap) <= 2) {
    reasons.emplace_back("Similar activity levels");
  }
  if (!candidate.partner_ids.empty() && candidate.partner_ids.size() < 5) {
    reasons.emplace_back("Experienced study partner");
  }
  if (!requester.timezone.empty() && requester.timezone == candidate.timezone) {
    reasons.emplace_back("Same time zone");
  }
  return reasons;
}

}  // namespace

bool passes_hard_filters(const domain::Participant& requester,
                         const domain::Participant& candidate,
                         const domain::MatchingCriteria& criteria) {
  if (candidate.id == requester.id) {
    return false;
  }
  if (requester.is_partnered_with(candidate.id) || candidate.is_partnered_with(requester.id)) {
    return false;
  }
  if (!candidate.is_active || !candidate.profile_complete) {
    return false;
  }
  if (criteria.require_exact_level && criteria.academic_level.has_value() &&
      candidate.academic_level != *criteria.academic_level) {
    return false;
  }
  if (criteria.require_exact_style && criteria.learning_style.has_value() &&
      candidate.learning_style != criteria.learning_style) {
    return false;
  }
  if (!criteria.subjects.empty()) {
    const bool any_subject = std::any_of(
        candidate.subjects.begin(), candidate.subjects.end(),
        [&](const domain::SubjectProficiency& s) { return criteria.subjects.contains(s.subject_id); });
    if (!any_subject) {
      return false;
    }
  }
  return true;
}

std::string make_cache_key(const core::ParticipantId& requester,
                           const domain::MatchingCriteria& criteria) {
  // Criteria strings are opaque bytes. The canonical form replaces invalid UTF-8, so
  // the raw free-text fields are folded in as well to keep distinct byte strings apart.
  const std::string canonical = domain::criteria_to_json(criteria).dump(
      -1, ' ', false, nlohmann::json::error_handler_t::replace);
  auto hash = core::stable_hash64_extend(core::stable_hash64(requester.value), canonical);
  const auto fold = [&hash](const std::string& raw) {
    hash = core::stable_hash64_extend(hash, std::to_string(raw.size()) + ":" + raw);
  };
  for (const auto& subject : criteria.subjects) {
    fold(subject.value);
  }
  fold(criteria.location);
  for (const auto& slot : criteria.availability) {
    fold(slot.day);
    fold(slot.timezone);
  }
  return "match:" + core::hash_to_hex(hash);
}

void rank_results(std::vector<domain::MatchResult>& results) {
  // Pass 1: order by overall so bands are contiguous.
  std::stable_sort(results.begin(), results.end(),
                   [](const domain::MatchResult& a, const domain::MatchResult& b) {
                     if (a.score.overall != b.score.overall) {
                       return a.score.overall > b.score.overall;
                     }
                     return a.participant.id < b.participant.id;
                   });

  // Pass 2: each band is anchored on its first (highest) score and never spans more
  // than the band width.
  std::size_t band_start = 0;
  while (band_start < results.size()) {
    const double anchor = results[band_start].score.overall;
    std::size_t band_end = band_start + 1;
    while (band_end < results.size() &&
           anchor - results[band_end].score.overall <= kRankBandWidth) {
      ++band_end;
    }
    std::stable_sort(results.begin() + static_cast<std::ptrdiff_t>(band_start),
                     results.begin() + static_cast<std::ptrdiff_t>(band_end),
                     [](const domain::MatchResult& a, const domain::MatchResult& b) {
                       if (a.score.subject_match != b.score.subject_match) {
                         return a.score.subject_match > b.score.subject_match;
                       }
                       if (a.score.time_overlap != b.score.time_overlap) {
                         return a.score.time_overlap > b.score.time_overlap;
                       }
                       if (a.score.overall != b.score.overall) {
                         return a.score.overall > b.score.overall;
                       }
                       return a.participant.id < b.participant.id;
                     });
    band_start = band_end;
  }
}

std::vector<domain::MatchResult> diversify(std::vector<domain::MatchResult> ranked,
                                           const DiversityConfig& config) {
  std::vector<domain::MatchResult> admitted;
  std::vector<domain::MatchResult> deferred;
  admitted.reserve(ranked.size());

  std::map<std::string, std::size_t> institution_counts;
  std::map<domain::AcademicLevel, std::size_t> level_counts;

  for (auto& result : ranked) {
    const std::string institution = result.participant.institution;
    const auto level = result.participant.academic_level;
    if (institution_counts[institution] < config.max_per_institution &&
        level_counts[level] < config.max_per_level) {
      ++institution_counts[institution];
      ++level_counts[level];
      admitted.push_back(std::move(result));
    } else {
      deferred.push_back(std::move(result));
    }
  }

  // Backfill: skipped candidates follow in ranked order.
  for (auto& result : deferred) {
    admitted.push_back(std::move(result));
  }
  return admitted;
}

MatchingPipeline::MatchingPipeline(const CompatibilityScorer& scorer, MatchCache& cache,
                                   DiversityConfig diversity)
    : scorer_(scorer), cache_(cache), diversity_(diversity) {}

domain::MatchResult MatchingPipeline::build_result(const domain::Participant& requester,
                                                   const domain::Participant& candidate) const {
  domain::MatchResult result;
  result.participant = candidate;
  result.score = scorer_.score(requester, candidate);

  const auto requester_subjects = requester.subject_ids();
  for (const auto& subject : candidate.subject_ids()) {
    if (requester_subjects.contains(subject)) {
      result.shared_subjects.push_back(subject);
    } else {
      result.complementary_subjects.push_back(subject);
    }
  }

  result.reasons =
      build_reasons(requester, candidate, result.score, result.shared_subjects.size());
  result.stats.total_partnerships = candidate.partner_ids.size();
  result.stats.recent_activity = candidate.recent_activity;
  return result;
}

std::vector<domain::MatchResult> MatchingPipeline::find_matches(
    const domain::Participant& requester, const std::vector<domain::Participant>& pool,
    const domain::MatchingCriteria& criteria, const int limit) const {
  if (limit <= 0) {
    throw std::invalid_argument("find_matches: limit must be positive");
  }
  const auto take = static_cast<std::size_t>(limit);

  const std::string key = make_cache_key(requester.id, criteria);
  if (auto cached = cache_.get(key)) {
    if (cached->size() > take) {
      cached->resize(take);
    }
    return std::move(*cached);
  }

  std::vector<domain::MatchResult> scored;
  for (const auto& candidate : pool) {
    if (!passes_hard_filters(requester, candidate, criteria)) {
      continue;
    }
    auto result = build_result(requester, candidate);
    if (criteria.min_compatibility_score.has_value() &&
        result.score.overall < *criteria.min_compatibility_score) {
      continue;
    }
    scored.push_back(std::move(result));
  }

  rank_results(scored);
  auto diversified = diversify(std::move(scored), diversity_);

  cache_.set(key, diversified);
  if (diversified.size() > take) {
    diversified.resize(take);
  }
  return diversified;
}

}  // namespace sme::matching
