#include "sme/domain/participant_json.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace sme;
using nlohmann::json;

TEST_CASE("participant_from_json decodes a full record", "[domain][json]") {
  const json j = json::parse(R"({
    "id": "p1",
    "academic_level": "ADVANCED",
    "learning_style": "Reading/Writing",
    "institution": "State U",
    "timezone": "UTC",
    "region": "north",
    "major": "Physics",
    "graduation_year": 2026,
    "subjects": [{"subject_id": "math", "proficiency": "EXPERT"}, "cs"],
    "availability": [{"day": "monday", "startTime": "2024-01-01T09:00:00Z",
                      "endTime": "2024-01-01T11:00:00Z", "timezone": "UTC"}],
    "recent_activity": 7,
    "partner_ids": ["p2", "p3"],
    "is_active": true,
    "profile_complete": false,
    "reputation": 0.9
  })");

  const auto decoded = domain::participant_from_json(j);
  REQUIRE(decoded.has_value());
  const auto& p = decoded.value();

  CHECK(p.id.value == "p1");
  CHECK(p.academic_level == domain::AcademicLevel::kAdvanced);
  CHECK(p.learning_style == domain::LearningStyle::kReading);
  CHECK(p.major == "Physics");
  CHECK(p.graduation_year == 2026);
  REQUIRE(p.subjects.size() == 2);
  CHECK(p.subjects[0].level == domain::AcademicLevel::kExpert);
  CHECK(p.subjects[1].subject_id.value == "cs");
  REQUIRE(p.availability.size() == 1);
  CHECK(p.availability[0].end - p.availability[0].start == std::chrono::hours{2});
  CHECK(p.recent_activity == 7);
  CHECK(p.partner_ids.size() == 2);
  CHECK(p.is_active);
  CHECK_FALSE(p.profile_complete);
  CHECK(p.reputation == 0.9);
}

TEST_CASE("participant_from_json falls back to defaults", "[domain][json]") {
  const auto decoded = domain::participant_from_json(json{{"id", "only-id"}});
  REQUIRE(decoded.has_value());
  const auto& p = decoded.value();

  CHECK(p.academic_level == domain::AcademicLevel::kBeginner);
  CHECK_FALSE(p.learning_style.has_value());
  CHECK(p.subjects.empty());
  CHECK(p.availability.empty());
  CHECK(p.is_active);
  CHECK(p.profile_complete);
  CHECK_FALSE(p.reputation.has_value());

  SECTION("missing id is an error") {
    CHECK_FALSE(domain::participant_from_json(json{{"institution", "x"}}).has_value());
    CHECK_FALSE(domain::participant_from_json(json::array()).has_value());
  }
}

TEST_CASE("participant_from_json rejects out-of-range integers", "[domain][json]") {
  SECTION("huge or non-finite numbers fall back") {
    const json j = json::parse(R"({
      "id": "x",
      "recent_activity": 1e20,
      "graduation_year": 4e9
    })");
    const auto decoded = domain::participant_from_json(j);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value().recent_activity == 0);
    CHECK_FALSE(decoded.value().graduation_year.has_value());
  }

  SECTION("64-bit integers outside int range fall back") {
    const json j = json::parse(R"({
      "id": "x",
      "recent_activity": 9223372036854775807,
      "graduation_year": -9223372036854775807
    })");
    const auto decoded = domain::participant_from_json(j);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value().recent_activity == 0);
    CHECK_FALSE(decoded.value().graduation_year.has_value());
  }

  SECTION("in-range whole numbers still decode") {
    const json j = json::parse(R"({"id": "x", "recent_activity": 7.0, "graduation_year": 2026})");
    const auto decoded = domain::participant_from_json(j);
    REQUIRE(decoded.has_value());
    CHECK(decoded.value().recent_activity == 7);
    CHECK(decoded.value().graduation_year == 2026);
  }
}

TEST_CASE("Availability parsing tolerates garbage","[domain][json][availability]") {
  SECTION("JSON-encoded string form") {
    const std::string text =
        R"([{"day":"tuesday","startTime":"2024-01-02T08:00:00Z","endTime":"2024-01-02T09:30:00Z"}])";
    const auto slots = domain::parse_availability(json(text));
    REQUIRE(slots.size() == 1);
    CHECK(slots[0].day == "tuesday");
  }

  SECTION("unparseable string yields no availability") {
    CHECK(domain::parse_availability_string("{not json").empty());
    CHECK(domain::parse_availability(json("garbage")).empty());
    CHECK(domain::parse_availability(json(42)).empty());
  }

  SECTION("slots with bad instants are skipped") {
    const json slots = json::parse(R"([
      {"day": "monday", "startTime": "yesterday", "endTime": "2024-01-01T10:00:00Z"},
      {"day": "monday", "startTime": "2024-01-01T09:00:00Z", "endTime": "2024-01-01T10:00:00Z"},
      "noise"
    ])");
    CHECK(domain::parse_availability(slots).size() == 1);
  }

  SECTION("a participant with garbage availability still decodes") {
    const auto decoded =
        domain::participant_from_json(json{{"id", "p"}, {"availability", "[{broken"}});
    REQUIRE(decoded.has_value());
    CHECK(decoded.value().availability.empty());
  }
}

TEST_CASE("participants_from_json validates the collection", "[domain][json]") {
  SECTION("wrapped array") {
    const auto decoded = domain::participants_from_json(
        json{{"participants", json::array({json{{"id", "a"}}, json{{"id", "b"}}})}});
    REQUIRE(decoded.has_value());
    CHECK(decoded.value().size() == 2);
  }

  SECTION("duplicate ids are rejected") {
    const auto decoded =
        domain::participants_from_json(json::array({json{{"id", "a"}}, json{{"id", "a"}}}));
    REQUIRE_FALSE(decoded.has_value());
    CHECK(decoded.error() == "duplicate participant id: a");
  }

  SECTION("an object without participants is rejected") {
    CHECK_FALSE(domain::participants_from_json(json{{"people", json::array()}}).has_value());
  }
}

TEST_CASE("Criteria decoding and canonical encoding", "[domain][json][criteria]") {
  const json j = json::parse(R"({
    "subjects": ["physics", "math"],
    "academic_level": "intermediate",
    "require_exact_level": true,
    "min_compatibility_score": 0.5,
    "preferences": {"session_type": "in_person", "group_size": "small_group"}
  })");

  const auto decoded = domain::criteria_from_json(j);
  REQUIRE(decoded.has_value());
  const auto& c = decoded.value();
  CHECK(c.subjects.size() == 2);
  CHECK(c.academic_level == domain::AcademicLevel::kIntermediate);
  CHECK(c.require_exact_level);
  CHECK(c.min_compatibility_score == 0.5);
  CHECK(c.preferences.session_type == domain::SessionType::kInPerson);
  CHECK(c.preferences.group_size == domain::GroupSize::kSmallGroup);

  SECTION("equal criteria dump identically") {
    const json reordered = json::parse(R"({
      "preferences": {"group_size": "small_group", "session_type": "in_person"},
      "min_compatibility_score": 0.5,
      "require_exact_level": true,
      "academic_level": "INTERMEDIATE",
      "subjects": ["math", "physics"]
    })");
    const auto other = domain::criteria_from_json(reordered);
    REQUIRE(other.has_value());
    CHECK(domain::criteria_to_json(c).dump() == domain::criteria_to_json(other.value()).dump());
  }

  SECTION("exact level without a level is an error") {
    CHECK_FALSE(domain::criteria_from_json(json{{"require_exact_level", true}}).has_value());
  }
}

TEST_CASE("Result encoders emit the wire field names", "[domain][json]") {
  domain::Recommendation rec{core::ParticipantId{"x"}, 0.75,
                             domain::RecommendationMethod::kHybrid, "why"};
  const auto j = domain::recommendation_to_json(rec);
  CHECK(j.at("candidate_id") == "x");
  CHECK(j.at("method") == "hybrid");
  CHECK(j.at("score") == 0.75);
}
