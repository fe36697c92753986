#pragma once

#include "sme/core/result.h"
#include "sme/prediction/progress_predictor.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sme::prediction {

// Decodes [{"date": "YYYY-MM-DD", "hours": 2.5}, ...]. An object wrapping the array
// under "history" is accepted too. Entries with an unparseable date are an error.
[[nodiscard]] core::Result<std::vector<ProgressPoint>, std::string> history_from_json(
    const nlohmann::json& j);

[[nodiscard]] nlohmann::json projection_to_json(const ProgressProjection& projection);

}  // namespace sme::prediction
