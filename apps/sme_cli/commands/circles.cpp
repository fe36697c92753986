#include "circles.h"

#include "pool_source.h"

#include "sme/app/engine_service.h"
#include "sme/core/clock.h"
#include "sme/matching/scorer.h"

#include <nlohmann/json.hpp>

#include "shared/arg_parser.h"
#include "shared/json_output.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CirclesCliConfig {
  sme::cli::PoolOptions pool;
};

}  // namespace

int cmd_circles(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sme::apps::Option<CirclesCliConfig>> options = {
      {"--pool", true, "Participants JSON file",
       [](CirclesCliConfig& c, const std::string& v) {
         c.pool.pool_path = v;
         return true;
       }},
      {"--db", true, "Participants SQLite database (opened read-only)",
       [](CirclesCliConfig& c, const std::string& v) {
         c.pool.db_path = v;
         return true;
       }},
  };
  auto parsed = sme::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    sme::apps::print_options(std::cerr, options);
    return 1;
  }
  const CirclesCliConfig& config = parsed.config;
  if (auto error = sme::cli::validate_pool_options(config.pool); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const sme::app::EngineConfig engine_config{};
  sme::cli::print_startup_block(std::cerr, "circles", config.pool, engine_config);

  auto source = sme::cli::open_candidate_source(config.pool);
  if (!source.has_value()) {
    std::cerr << "Error: " << source.error() << "\n";
    return 1;
  }

  sme::core::SystemClock clock;
  sme::matching::NullDistanceProvider distances;
  sme::matching::RecordReputationProvider reputations;
  const sme::app::EngineService service(engine_config, clock, distances, reputations);

  const auto circles = service.run_circles(*source.value());
  if (!circles.has_value()) {
    std::cerr << "Error: " << circles.error() << "\n";
    return 1;
  }

  nlohmann::json out;
  out["circles"] = nlohmann::json::array();
  for (const auto& circle : circles.value()) {
    nlohmann::json members = nlohmann::json::array();
    for (const auto& id : circle) {
      members.push_back(id.value);
    }
    out["circles"].push_back(nlohmann::json{{"size", circle.size()}, {"members", members}});
  }

  sme::apps::print_json(std::cout, out);
  return 0;
}
