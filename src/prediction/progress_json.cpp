#include "sme/prediction/progress_json.h"

namespace sme::prediction {

core::Result<std::vector<ProgressPoint>, std::string> history_from_json(const nlohmann::json& j) {
  using R = core::Result<std::vector<ProgressPoint>, std::string>;

  const nlohmann::json* entries = &j;
  if (j.is_object() && j.contains("history")) {
    entries = &j.at("history");
  }
  if (!entries->is_array()) {
    return R::err("history must be a JSON array");
  }

  std::vector<ProgressPoint> history;
  history.reserve(entries->size());
  for (const auto& entry : *entries) {
    if (!entry.is_object() || !entry.contains("date") || !entry.at("date").is_string()) {
      return R::err("history entry is missing a \"date\" string");
    }
    const auto text = entry.at("date").get<std::string>();
    const auto date = core::parse_iso8601(text);
    if (!date.has_value()) {
      return R::err("invalid history date: " + text);
    }
    double hours = 0.0;
    if (entry.contains("hours") && entry.at("hours").is_number()) {
      hours = entry.at("hours").get<double>();
    }
    history.push_back(ProgressPoint{*date, hours});
  }
  return R::ok(std::move(history));
}

nlohmann::json projection_to_json(const ProgressProjection& projection) {
  return nlohmann::json{
      {"estimated_completion", core::format_iso8601(projection.estimated_completion)},
      {"confidence", projection.confidence},
      {"current_rate", projection.current_rate},
      {"required_rate", projection.required_rate},
      {"completed_hours", projection.completed_hours},
  };
}

}  // namespace sme::prediction
