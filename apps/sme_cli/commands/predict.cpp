#include "predict.h"

#include "sme/app/engine_service.h"
#include "sme/core/clock.h"
#include "sme/core/time.h"
#include "sme/core/version.h"
#include "sme/matching/scorer.h"
#include "sme/prediction/progress_json.h"
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

constexpr int kDefaultDeadlineDays = 30;

struct PredictCliConfig {
  std::optional<std::string> history_path;
  std::optional<double> target_hours;
  std::optional<sme::core::Timestamp> deadline;
};

std::string validate_predict_cli_config(const PredictCliConfig& config) {
  if (!config.history_path.has_value()) {
    return "--history <file.json> is required";
  }
  if (!config.target_hours.has_value()) {
    return "--target <hours> is required";
  }
  if (*config.target_hours <= 0.0) {
    return "--target must be positive";
  }
  return "";
}

}  // namespace

int cmd_predict(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<sme::apps::Option<PredictCliConfig>> options = {
      {"--history", true, "Study history JSON file ([{\"date\", \"hours\"}])",
       [](PredictCliConfig& c, const std::string& v) {
         c.history_path = v;
         return true;
       }},
      {"--target", true, "Goal in total study hours",
       [](PredictCliConfig& c, const std::string& v) {
         const auto parsed = sme::apps::parse_double(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --target: " << v << "\n";
           return false;
         }
         c.target_hours = *parsed;
         return true;
       }},
      {"--deadline", true, "Goal deadline (ISO-8601 date)",
       [](PredictCliConfig& c, const std::string& v) {
         const auto parsed = sme::core::parse_iso8601(v);
         if (!parsed.has_value()) {
           std::cerr << "Invalid --deadline: " << v << "\n";
           return false;
         }
         c.deadline = *parsed;
         return true;
       }},
  };
  auto parsed = sme::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    sme::apps::print_options(std::cerr, options);
    return 1;
  }
  const PredictCliConfig& config = parsed.config;
  if (auto error = validate_predict_cli_config(config); !error.empty()) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cerr << "study-match-engine v" << sme::core::kBuildVersion << " (predict)\n";
  std::cerr << "History: " << *config.history_path << "\n";

  auto history_json = sme::storage::read_json_file(*config.history_path);
  if (!history_json.has_value()) {
    std::cerr << "Error: " << history_json.error() << "\n";
    return 1;
  }
  auto history = sme::prediction::history_from_json(history_json.value());
  if (!history.has_value()) {
    std::cerr << "Error: " << history.error() << "\n";
    return 1;
  }

  sme::core::SystemClock clock;
  sme::matching::NullDistanceProvider distances;
  sme::matching::RecordReputationProvider reputations;
  const sme::app::EngineService service(sme::app::EngineConfig{}, clock, distances, reputations);

  sme::prediction::ProgressGoal goal;
  goal.target_hours = *config.target_hours;
  goal.deadline = config.deadline.value_or(clock.now() +
                                           std::chrono::hours{24 * kDefaultDeadlineDays});

  const auto projection = service.run_predict(history.take_value(), goal);

  nlohmann::json out = sme::prediction::projection_to_json(projection);
  out["target_hours"] = goal.target_hours;
  out["deadline"] = sme::core::format_iso8601(goal.deadline);

  sme::apps::print_json(std::cout, out);
  return 0;
}
