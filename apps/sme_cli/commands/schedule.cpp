#include "schedule.h"

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
#include <sstream>
#include <string>
#include <vector>

namespace {

struct ScheduleCliConfig {
  sme::cli::PoolOptions pool;
  std::vector<sme::core::ParticipantId> participant_ids;
  std::optional<int> duration_minutes;
  int min_participants{2};
};

std::vector<sme::core::ParticipantId> split_ids(const std::string& csv) {
  std::vector<sme::core::ParticipantId> ids;
  std::istringstream stream(csv);
  std::string token;
  while (std::getline(stream, token, ',')) {
    if (!token.empty()) {
      ids.push_back(sme::core::ParticipantId{token});
    }
  }
  return ids;
}

std::string validate_schedule_cli_config(const ScheduleCliConfig& config) {
  if (auto error = sme::cli::validate_pool_options(config.pool); !error.empty()) {
    return error;
  }
  if (!config.duration_minutes.has_value()) {
    return "--duration <minutes> is required";
  }
  if (*config.duration_minutes <= 0) {
    return "--duration must be positive";
  }
  if (config.min_participants <= 0) {
    return "--min-participants must be positive";
  }
  return "";
}

}  // namespace

int cmd_schedule(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sme::apps::Option<ScheduleCliConfig>> options = {
      {"--pool", true, "Participants JSON file",
       [](ScheduleCliConfig& c, const std::string& v) {
         c.pool.pool_path = v;
         return true;
       }},
      {"--db", true, "Participants SQLite database (opened read-only)",
       [](ScheduleCliConfig& c, const std::string& v) {
         c.pool.db_path = v;
         return true;
       }},
      {"--participants", true, "Comma-separated participant ids",
       [](ScheduleCliConfig& c, const std::string& v) {
         c.participant_ids = split_ids(v);
         return true;
       }},
      {"--duration", true, "Required session length in minutes",
       [](ScheduleCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_int(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --duration: " << v << "\n";
           return false;
         }
         c.duration_minutes = *parsed;
         return true;
       }},
      {"--min-participants", true, "Minimum attendees per slot (default 2)",
       [](ScheduleCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_int(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --min-participants: " << v << "\n";
           return false;
         }
         c.min_participants = *parsed;
         return true;
       }},
  };
  auto parsed = sme::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    sme::apps::print_options(std::cerr, options);
    return 1;
  }
  const ScheduleCliConfig& config = parsed.config;
  if (auto error = validate_schedule_cli_config(config); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  const sme::app::EngineConfig engine_config{};
  sme::cli::print_startup_block(std::cerr, "schedule", config.pool, engine_config);

  auto source = sme::cli::open_candidate_source(config.pool);
  if (!source.has_value()) {
    std::cerr << "Error: " << source.error() << "\n";
    return 1;
  }

  sme::core::SystemClock clock;
  sme::matching::NullDistanceProvider distances;
  sme::matching::RecordReputationProvider reputations;
  const sme::app::EngineService service(engine_config, clock, distances, reputations);

  const auto slots = service.run_schedule(*source.value(), config.participant_ids,
                                          *config.duration_minutes, config.min_participants);
  if (!slots.has_value()) {
    std::cerr << "Error: " << slots.error() << "\n";
    return 1;
  }

  nlohmann::json out;
  out["duration_minutes"] = *config.duration_minutes;
  out["min_participants"] = config.min_participants;
  out["slots"] = nlohmann::json::array();
  for (const auto& slot : slots.value()) {
    out["slots"].push_back(sme::domain::schedule_slot_to_json(slot));
  }

  sme::apps::print_json(std::cout, out);
  return 0;
}
