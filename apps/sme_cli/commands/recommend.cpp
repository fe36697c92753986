#include "recommend.h"

#include "pool_source.h"

#include "sme/app/engine_service.h"
#include "sme/core/clock.h"
#include "sme/domain/participant_json.h"
#include "sme/matching/scorer.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include "shared/json_output.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct RecommendCliConfig {
  sme::cli::PoolOptions pool;
  std::optional<std::string> requester_id;
  sme::domain::RecommendationMethod method{sme::domain::RecommendationMethod::kHybrid};
  int limit{10};
};

std::string validate_recommend_cli_config(const RecommendCliConfig& config) {
  if (auto error = sme::cli::validate_pool_options(config.pool); !error.empty()) {
    return error;
  }
  if (!config.requester_id.has_value() || config.requester_id->empty()) {
    return "--requester <id> is required";
  }
  if (config.limit <= 0) {
    return "--limit must be positive";
  }
  return "";
}

}  // namespace

int cmd_recommend(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sme::apps::Option<RecommendCliConfig>> options = {
      {"--pool", true, "Participants JSON file",
       [](RecommendCliConfig& c, const std::string& v) {
         c.pool.pool_path = v;
         return true;
       }},
      {"--db", true, "Participants SQLite database (opened read-only)",
       [](RecommendCliConfig& c, const std::string& v) {
         c.pool.db_path = v;
         return true;
       }},
      {"--requester", true, "Id of the participant receiving recommendations",
       [](RecommendCliConfig& c, const std::string& v) {
         c.requester_id = v;
         return true;
       }},
      {"--method", true, "Recommendation method (collaborative|content|hybrid)",
       [](RecommendCliConfig& c, const std::string& v) {
         const auto method = sme::app::parse_recommendation_method(v);
         if (!method.has_value()) {
           std::cerr << "Invalid --method: " << v << " (valid: collaborative, content, hybrid)\n";
           return false;
         }
         c.method = *method;
         return true;
       }},
      {"--limit", true, "Maximum number of recommendations (default 10)",
       [](RecommendCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_int(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --limit: " << v << "\n";
           return false;
         }
         c.limit = *parsed;
         return true;
       }},
  };
  auto parsed = sme::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    sme::apps::print_options(std::cerr, options);
    return 1;
  }
  const RecommendCliConfig& config = parsed.config;
  if (auto error = validate_recommend_cli_config(config); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const sme::app::EngineConfig engine_config{};
  sme::cli::print_startup_block(std::cerr, "recommend", config.pool, engine_config);
  std::cerr << "Recommendation method: " << sme::domain::to_string(config.method) << "\n";

  auto source = sme::cli::open_candidate_source(config.pool);
  if (!source.has_value()) {
    std::cerr << "Error: " << source.error() << "\n";
    return 1;
  }

  sme::core::SystemClock clock;
  sme::matching::NullDistanceProvider distances;
  sme::matching::RecordReputationProvider reputations;
  const sme::app::EngineService service(engine_config, clock, distances, reputations);

  sme::app::RecommendRequest request;
  request.requester_id = sme::core::ParticipantId{*config.requester_id};
  request.method = config.method;
  request.limit = config.limit;

  const auto recommendations = service.run_recommend(request, *source.value());
  if (!recommendations.has_value()) {
    std::cerr << "Error: " << recommendations.error() << "\n";
    return 1;
  }

  nlohmann::json out;
  out["requester_id"] = request.requester_id.value;
  out["method"] = sme::domain::to_string(config.method);
  out["recommendations"] = nlohmann::json::array();
  for (const auto& recommendation : recommendations.value()) {
    out["recommendations"].push_back(sme::domain::recommendation_to_json(recommendation));
  }

  sme::apps::print_json(std::cout, out);
  return 0;
}
