#include "match.h"

#include "pool_source.h"

#include "sme/app/engine_service.h"
#include "sme/core/clock.h"
#include "sme/domain/participant_json.h"
#include "sme/matching/scorer.h"
#include "sme/storage/candidate_source.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include "shared/json_output.h"
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct MatchCliConfig {
  sme::cli::PoolOptions pool;
  std::optional<std::string> requester_id;
  std::optional<std::string> criteria_path;
  int limit{10};
  sme::app::EngineConfig engine;
};

std::string validate_match_cli_config(const MatchCliConfig& config) {
  if (auto error = sme::cli::validate_pool_options(config.pool); !error.empty()) {
    return error;
  }
  if (!config.requester_id.has_value() || config.requester_id->empty()) {
    return "--requester <id> is required";
  }
  if (config.limit <= 0) {
    return "--limit must be positive";
  }
  return sme::app::validate_engine_config(config.engine);
}

nlohmann::json render_cache_stats(const sme::cache::CacheStats& stats) {
  return nlohmann::json{
      {"size", stats.size},
      {"capacity", stats.capacity},
      {"hits", stats.hits},
      {"misses", stats.misses},
      {"hit_rate", stats.hit_rate},
  };
}

}  // namespace

int cmd_match(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sme::apps::Option<MatchCliConfig>> options = {
      {"--pool", true, "Participants JSON file",
       [](MatchCliConfig& c, const std::string& v) {
         c.pool.pool_path = v;
         return true;
       }},
      {"--db", true, "Participants SQLite database (opened read-only)",
       [](MatchCliConfig& c, const std::string& v) {
         c.pool.db_path = v;
         return true;
       }},
      {"--requester", true, "Id of the participant looking for partners",
       [](MatchCliConfig& c, const std::string& v) {
         c.requester_id = v;
         return true;
       }},
      {"--criteria", true, "Matching criteria JSON file",
       [](MatchCliConfig& c, const std::string& v) {
         c.criteria_path = v;
         return true;
       }},
      {"--limit", true, "Maximum number of matches (default 10)",
       [](MatchCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_int(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --limit: " << v << "\n";
           return false;
         }
         c.limit = *parsed;
         return true;
       }},
      {"--cache-capacity", true, "Match cache capacity (default 1000)",
       [](MatchCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_int(v);
         if (!parsed.has_value() || *parsed <= 0) {
           std::cerr << "Invalid --cache-capacity: " << v << "\n";
           return false;
         }
         c.engine.cache.capacity = static_cast<std::size_t>(*parsed);
         return true;
       }},
      {"--cache-ttl-seconds", true, "Match cache TTL in seconds (default 300)",
       [](MatchCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_int(v);
         if (!parsed.has_value() || *parsed <= 0) {
           std::cerr << "Invalid --cache-ttl-seconds: " << v << "\n";
           return false;
         }
         c.engine.cache.ttl = std::chrono::seconds{*parsed};
         return true;
       }},
  };
  auto parsed = sme::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    sme::apps::print_options(std::cerr, options);
    return 1;
  }
  const MatchCliConfig& config = parsed.config;
  if (auto error = validate_match_cli_config(config); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  sme::cli::print_startup_block(std::cerr, "match", config.pool, config.engine);

  sme::app::MatchRequest request;
  request.requester_id = sme::core::ParticipantId{*config.requester_id};
  request.limit = config.limit;
  if (config.criteria_path.has_value()) {
    auto criteria_json = sme::storage::read_json_file(*config.criteria_path);
    if (!criteria_json.has_value()) {
      std::cerr << "Error: " << criteria_json.error() << "\n";
      return 1;
    }
    auto criteria = sme::domain::criteria_from_json(criteria_json.value());
    if (!criteria.has_value()) {
      std::cerr << "Error: invalid criteria: " << criteria.error() << "\n";
      return 1;
    }
    request.criteria = criteria.take_value();
  }

  auto source = sme::cli::open_candidate_source(config.pool);
  if (!source.has_value()) {
    std::cerr << "Error: " << source.error() << "\n";
    return 1;
  }

  sme::core::SystemClock clock;
  sme::matching::NullDistanceProvider distances;
  sme::matching::RecordReputationProvider reputations;
  const sme::app::EngineService service(config.engine, clock, distances, reputations);

  const auto response = service.run_match(request, *source.value());
  if (!response.has_value()) {
    std::cerr << "Error: " << response.error() << "\n";
    return 1;
  }

  nlohmann::json out;
  out["requester_id"] = request.requester_id.value;
  out["candidates_considered"] = response.value().candidates_considered;
  out["matches"] = nlohmann::json::array();
  for (const auto& match : response.value().matches) {
    out["matches"].push_back(sme::domain::match_result_to_json(match));
  }
  out["cache"] = render_cache_stats(response.value().cache_stats);

  sme::apps::print_json(std::cout, out);
  return 0;
}
