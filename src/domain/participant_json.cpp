#include "sme/domain/participant_json.h"

#include "sme/core/normalization.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace sme::domain {

namespace {

using json = nlohmann::json;

// Field readers tolerate missing keys and wrong types; upstream records are loosely typed.

std::string string_field(const json& j, const char* key, const std::string& fallback = "") {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return fallback;
  }
  return core::trim(it->get<std::string>());
}

std::optional<std::string> optional_string_field(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  std::string value = core::trim(it->get<std::string>());
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<double> number_field(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<double>();
}

// Numbers outside the int range (or non-finite) read as absent.
std::optional<int> int_value(const json& value) {
  constexpr auto kMin = std::numeric_limits<int>::min();
  constexpr auto kMax = std::numeric_limits<int>::max();
  if (value.is_number_unsigned()) {
    const auto u = value.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(kMax)) {
      return std::nullopt;
    }
    return static_cast<int>(u);
  }
  if (value.is_number_integer()) {
    const auto i = value.get<std::int64_t>();
    if (i < kMin || i > kMax) {
      return std::nullopt;
    }
    return static_cast<int>(i);
  }
  if (value.is_number_float()) {
    const double d = value.get<double>();
    if (!std::isfinite(d) || d < static_cast<double>(kMin) || d > static_cast<double>(kMax)) {
      return std::nullopt;
    }
    return static_cast<int>(d);
  }
  return std::nullopt;
}

int int_field(const json& j, const char* key, const int fallback) {
  const auto it = j.find(key);
  if (it == j.end()) {
    return fallback;
  }
  return int_value(*it).value_or(fallback);
}

bool bool_field(const json& j, const char* key, const bool fallback) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

// First key present wins, so camelCase upstream payloads and snake_case files both decode.
std::string first_string(const json& j, std::initializer_list<const char*> keys) {
  for (const char* key : keys) {
    std::string value = string_field(j, key);
    if (!value.empty()) {
      return value;
    }
  }
  return {};
}

std::optional<TimeSlot> slot_from_json(const json& j) {
  if (!j.is_object()) {
    return std::nullopt;
  }
  const auto start = core::parse_iso8601(first_string(j, {"startTime", "start_time", "start"}));
  const auto end = core::parse_iso8601(first_string(j, {"endTime", "end_time", "end"}));
  if (!start.has_value() || !end.has_value()) {
    return std::nullopt;
  }
  return TimeSlot{string_field(j, "day"), *start, *end, string_field(j, "timezone")};
}

std::vector<SubjectProficiency> subjects_from_json(const json& j) {
  std::vector<SubjectProficiency> subjects;
  if (!j.is_array()) {
    return subjects;
  }
  for (const auto& entry : j) {
    if (entry.is_string()) {
      subjects.push_back({core::SubjectId{entry.get<std::string>()}, AcademicLevel::kBeginner});
      continue;
    }
    if (!entry.is_object()) {
      continue;
    }
    std::string id = first_string(entry, {"subject_id", "subjectId"});
    if (id.empty()) {
      continue;
    }
    const std::string level = first_string(entry, {"proficiency", "proficiencyLevel", "level"});
    subjects.push_back({core::SubjectId{std::move(id)},
                        parse_academic_level(level).value_or(AcademicLevel::kBeginner)});
  }
  return subjects;
}

std::set<core::ParticipantId> ids_from_json(const json& j) {
  std::set<core::ParticipantId> ids;
  if (!j.is_array()) {
    return ids;
  }
  for (const auto& entry : j) {
    if (entry.is_string() && !entry.get<std::string>().empty()) {
      ids.insert(core::ParticipantId{entry.get<std::string>()});
    }
  }
  return ids;
}

const char* to_string(const SessionType value) {
  switch (value) {
    case SessionType::kVirtual:
      return "virtual";
    case SessionType::kInPerson:
      return "in_person";
    case SessionType::kHybrid:
      return "hybrid";
  }
  return "virtual";
}

const char* to_string(const GroupSize value) {
  switch (value) {
    case GroupSize::kOneOnOne:
      return "one_on_one";
    case GroupSize::kSmallGroup:
      return "small_group";
    case GroupSize::kLargeGroup:
      return "large_group";
  }
  return "one_on_one";
}

const char* to_string(const CommunicationStyle value) {
  switch (value) {
    case CommunicationStyle::kFormal:
      return "formal";
    case CommunicationStyle::kCasual:
      return "casual";
    case CommunicationStyle::kMixed:
      return "mixed";
  }
  return "mixed";
}

const char* to_string(const StudyIntensity value) {
  switch (value) {
    case StudyIntensity::kRelaxed:
      return "relaxed";
    case StudyIntensity::kModerate:
      return "moderate";
    case StudyIntensity::kIntensive:
      return "intensive";
  }
  return "moderate";
}

SessionPreferences preferences_from_json(const json& j) {
  SessionPreferences prefs;
  if (!j.is_object()) {
    return prefs;
  }
  const std::string session = core::normalize_key(first_string(j, {"session_type", "sessionType"}));
  if (session == "in_person") {
    prefs.session_type = SessionType::kInPerson;
  } else if (session == "hybrid") {
    prefs.session_type = SessionType::kHybrid;
  }
  const std::string group = core::normalize_key(first_string(j, {"group_size", "groupSize"}));
  if (group == "small_group") {
    prefs.group_size = GroupSize::kSmallGroup;
  } else if (group == "large_group") {
    prefs.group_size = GroupSize::kLargeGroup;
  }
  const std::string comm =
      core::normalize_key(first_string(j, {"communication_style", "communicationStyle"}));
  if (comm == "formal") {
    prefs.communication_style = CommunicationStyle::kFormal;
  } else if (comm == "casual") {
    prefs.communication_style = CommunicationStyle::kCasual;
  }
  const std::string intensity =
      core::normalize_key(first_string(j, {"study_intensity", "studyIntensity"}));
  if (intensity == "relaxed") {
    prefs.study_intensity = StudyIntensity::kRelaxed;
  } else if (intensity == "intensive") {
    prefs.study_intensity = StudyIntensity::kIntensive;
  }
  return prefs;
}

}  // namespace

std::vector<TimeSlot> parse_availability(const json& j) {
  if (j.is_string()) {
    return parse_availability_string(j.get<std::string>());
  }
  std::vector<TimeSlot> slots;
  if (!j.is_array()) {
    return slots;
  }
  for (const auto& entry : j) {
    if (auto slot = slot_from_json(entry); slot.has_value()) {
      slots.push_back(std::move(*slot));
    }
  }
  return slots;
}

std::vector<TimeSlot> parse_availability_string(const std::string& text) {
  const json parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || parsed.is_string()) {
    return {};
  }
  return parse_availability(parsed);
}

core::Result<Participant, std::string> participant_from_json(const json& j) {
  using R = core::Result<Participant, std::string>;

  if (!j.is_object()) {
    return R::err("participant must be a JSON object");
  }
  const std::string id = string_field(j, "id");
  if (id.empty()) {
    return R::err("participant id must not be empty");
  }

  Participant p;
  p.id = core::ParticipantId{id};
  p.academic_level = parse_academic_level(first_string(j, {"academic_level", "academicLevel"}))
                         .value_or(AcademicLevel::kBeginner);
  p.learning_style = parse_learning_style(first_string(j, {"learning_style", "learningStyle"}));
  p.institution = string_field(j, "institution");
  p.timezone = string_field(j, "timezone");
  p.region = string_field(j, "region");
  p.major = optional_string_field(j, "major");
  if (const auto it = j.find("graduation_year"); it != j.end()) {
    p.graduation_year = int_value(*it);
  }

  if (const auto it = j.find("subjects"); it != j.end()) {
    p.subjects = subjects_from_json(*it);
  }
  if (const auto it = j.find("availability"); it != j.end()) {
    p.availability = parse_availability(*it);
  }
  p.recent_activity = std::max(0, int_field(j, "recent_activity", 0));
  if (const auto it = j.find("partner_ids"); it != j.end()) {
    p.partner_ids = ids_from_json(*it);
  }
  p.is_active = bool_field(j, "is_active", true);
  p.profile_complete = bool_field(j, "profile_complete", true);
  p.reputation = number_field(j, "reputation");

  return R::ok(std::move(p));
}

core::Result<std::vector<Participant>, std::string> participants_from_json(const json& j) {
  using R = core::Result<std::vector<Participant>, std::string>;

  const json* list = &j;
  if (j.is_object()) {
    const auto it = j.find("participants");
    if (it == j.end()) {
      return R::err("expected a \"participants\" array");
    }
    list = &(*it);
  }
  if (!list->is_array()) {
    return R::err("participants must be a JSON array");
  }

  std::vector<Participant> participants;
  participants.reserve(list->size());
  std::set<core::ParticipantId> seen;
  for (std::size_t i = 0; i < list->size(); ++i) {
    auto decoded = participant_from_json((*list)[i]);
    if (!decoded.has_value()) {
      return R::err("participant[" + std::to_string(i) + "]: " + decoded.error());
    }
    if (!seen.insert(decoded.value().id).second) {
      return R::err("duplicate participant id: " + decoded.value().id.value);
    }
    participants.push_back(decoded.take_value());
  }
  return R::ok(std::move(participants));
}

core::Result<MatchingCriteria, std::string> criteria_from_json(const json& j) {
  using R = core::Result<MatchingCriteria, std::string>;

  if (!j.is_object()) {
    return R::err("criteria must be a JSON object");
  }

  MatchingCriteria criteria;
  if (const auto it = j.find("subjects"); it != j.end() && it->is_array()) {
    for (const auto& entry : *it) {
      if (entry.is_string() && !entry.get<std::string>().empty()) {
        criteria.subjects.insert(core::SubjectId{entry.get<std::string>()});
      }
    }
  }
  criteria.academic_level =
      parse_academic_level(first_string(j, {"academic_level", "academicLevel"}));
  criteria.learning_style =
      parse_learning_style(first_string(j, {"learning_style", "learningStyle"}));
  if (const auto it = j.find("availability"); it != j.end()) {
    criteria.availability = parse_availability(*it);
  }
  criteria.location = string_field(j, "location");
  if (const auto it = j.find("preferences"); it != j.end()) {
    criteria.preferences = preferences_from_json(*it);
  }
  criteria.max_distance = number_field(j, "max_distance");
  criteria.min_compatibility_score = number_field(j, "min_compatibility_score");
  criteria.require_exact_level = bool_field(j, "require_exact_level", false);
  criteria.require_exact_style = bool_field(j, "require_exact_style", false);

  if (criteria.require_exact_level && !criteria.academic_level.has_value()) {
    return R::err("require_exact_level needs academic_level");
  }
  if (criteria.require_exact_style && !criteria.learning_style.has_value()) {
    return R::err("require_exact_style needs learning_style");
  }
  return R::ok(std::move(criteria));
}

json criteria_to_json(const MatchingCriteria& criteria) {
  json j;
  json subjects = json::array();
  for (const auto& subject : criteria.subjects) {
    subjects.push_back(subject.value);
  }
  j["subjects"] = subjects;
  j["academic_level"] =
      criteria.academic_level ? json(std::string(to_string(*criteria.academic_level))) : json(nullptr);
  j["learning_style"] =
      criteria.learning_style ? json(std::string(to_string(*criteria.learning_style))) : json(nullptr);
  json availability = json::array();
  for (const auto& slot : criteria.availability) {
    availability.push_back(time_slot_to_json(slot));
  }
  j["availability"] = availability;
  j["location"] = criteria.location;
  j["preferences"] = {
      {"session_type", to_string(criteria.preferences.session_type)},
      {"group_size", to_string(criteria.preferences.group_size)},
      {"communication_style", to_string(criteria.preferences.communication_style)},
      {"study_intensity", to_string(criteria.preferences.study_intensity)},
  };
  j["max_distance"] = criteria.max_distance ? json(*criteria.max_distance) : json(nullptr);
  j["min_compatibility_score"] =
      criteria.min_compatibility_score ? json(*criteria.min_compatibility_score) : json(nullptr);
  j["require_exact_level"] = criteria.require_exact_level;
  j["require_exact_style"] = criteria.require_exact_style;
  return j;
}

json time_slot_to_json(const TimeSlot& slot) {
  return json{
      {"day", slot.day},
      {"startTime", core::format_iso8601(slot.start)},
      {"endTime", core::format_iso8601(slot.end)},
      {"timezone", slot.timezone},
  };
}

json participant_to_json(const Participant& participant) {
  json j;
  j["id"] = participant.id.value;
  j["academic_level"] = std::string(to_string(participant.academic_level));
  if (participant.learning_style.has_value()) {
    j["learning_style"] = std::string(to_string(*participant.learning_style));
  }
  j["institution"] = participant.institution;
  j["timezone"] = participant.timezone;
  j["region"] = participant.region;
  json subjects = json::array();
  for (const auto& subject : participant.subjects) {
    subjects.push_back(
        {{"subject_id", subject.subject_id.value}, {"proficiency", std::string(to_string(subject.level))}});
  }
  j["subjects"] = subjects;
  j["recent_activity"] = participant.recent_activity;
  return j;
}

json score_to_json(const CompatibilityScore& score) {
  return json{
      {"overall", score.overall},
      {"subject_match", score.subject_match},
      {"level_compatibility", score.level_compatibility},
      {"style_compatibility", score.style_compatibility},
      {"time_overlap", score.time_overlap},
      {"location_compatibility", score.location_compatibility},
      {"activity_compatibility", score.activity_compatibility},
      {"reputation_score", score.reputation_score},
  };
}

json match_result_to_json(const MatchResult& result) {
  json j;
  j["participant"] = participant_to_json(result.participant);
  j["score"] = score_to_json(result.score);
  json shared = json::array();
  for (const auto& subject : result.shared_subjects) {
    shared.push_back(subject.value);
  }
  j["shared_subjects"] = shared;
  json complementary = json::array();
  for (const auto& subject : result.complementary_subjects) {
    complementary.push_back(subject.value);
  }
  j["complementary_subjects"] = complementary;
  j["reasons"] = result.reasons;
  j["stats"] = {
      {"total_partnerships", result.stats.total_partnerships},
      {"recent_activity", result.stats.recent_activity},
  };
  return j;
}

json schedule_slot_to_json(const ScheduleSlot& slot) {
  json ids = json::array();
  for (const auto& id : slot.participant_ids) {
    ids.push_back(id.value);
  }
  return json{
      {"start", core::format_iso8601(slot.start)},
      {"end", core::format_iso8601(slot.end)},
      {"participants", ids},
  };
}

json recommendation_to_json(const Recommendation& recommendation) {
  return json{
      {"candidate_id", recommendation.candidate_id.value},
      {"score", recommendation.score},
      {"method", to_string(recommendation.method)},
      {"reason", recommendation.reason},
  };
}

}  // namespace sme::domain
