#pragma once

#include "sme/core/result.h"
#include "sme/domain/criteria.h"
#include "sme/domain/match_result.h"
#include "sme/domain/participant.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sme::domain {

// ────────────────────────────────────────────────────────────────
// Decoding (system boundary)
// ────────────────────────────────────────────────────────────────

// parse_availability accepts either a JSON array of slot objects or a string holding
// the JSON-encoded array (the upstream storage format). Slot keys: "day", "startTime",
// "endTime", "timezone" (snake_case aliases accepted). Anything unparseable yields an
// empty list; individual slots with unparseable instants are skipped.
[[nodiscard]] std::vector<TimeSlot> parse_availability(const nlohmann::json& j);
[[nodiscard]] std::vector<TimeSlot> parse_availability_string(const std::string& text);

// participant_from_json decodes one participant. Only "id" is required; every other
// field falls back to its default. Unknown level/style tags fall back to Beginner/unset.
[[nodiscard]] core::Result<Participant, std::string> participant_from_json(
    const nlohmann::json& j);

// Accepts a top-level array or an object with a "participants" array.
[[nodiscard]] core::Result<std::vector<Participant>, std::string> participants_from_json(
    const nlohmann::json& j);

[[nodiscard]] core::Result<MatchingCriteria, std::string> criteria_from_json(
    const nlohmann::json& j);

// ────────────────────────────────────────────────────────────────
// Encoding
// ────────────────────────────────────────────────────────────────

// criteria_to_json is canonical: sets are emitted sorted and keys are ordered by the
// default std::map container, so equal criteria always dump to identical text.
[[nodiscard]] nlohmann::json criteria_to_json(const MatchingCriteria& criteria);

[[nodiscard]] nlohmann::json time_slot_to_json(const TimeSlot& slot);
[[nodiscard]] nlohmann::json participant_to_json(const Participant& participant);
[[nodiscard]] nlohmann::json score_to_json(const CompatibilityScore& score);
[[nodiscard]] nlohmann::json match_result_to_json(const MatchResult& result);
[[nodiscard]] nlohmann::json schedule_slot_to_json(const ScheduleSlot& slot);
[[nodiscard]] nlohmann::json recommendation_to_json(const Recommendation& recommendation);

}  // namespace sme::domain
