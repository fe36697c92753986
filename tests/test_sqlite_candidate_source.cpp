#include "sme/matching/matching_pipeline.h"
#include "sme/storage/sqlite/sqlite_candidate_source.h"
#include "sme/storage/sqlite/sqlite_db.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>
#include <vector>

using namespace sme;
using namespace sme::storage::sqlite;

namespace {

constexpr const char* kSeedRows = R"(
INSERT INTO participants (id, academic_level, learning_style, institution, timezone,
                          subjects_json, availability_json, recent_activity,
                          partner_ids_json, is_active, profile_complete, reputation)
VALUES
  ('req', 'INTERMEDIATE', 'visual', 'State U', 'UTC',
   '[{"subject_id":"math","proficiency":"INTERMEDIATE"}]',
   '[{"day":"monday","startTime":"2024-01-01T09:00:00Z","endTime":"2024-01-01T12:00:00Z"}]',
   3, '["p-partner"]', 1, 1, NULL),
  ('a', 'intermediate', 'VISUAL', 'State U', 'UTC',
   '[{"subject_id":"math","proficiency":"ADVANCED"}]',
   '[{"day":"monday","startTime":"2024-01-01T10:00:00Z","endTime":"2024-01-01T11:00:00Z"}]',
   4, '[]', 1, 1, 0.9),
  ('b', ' EXPERT ', 'Reading/Writing', 'Tech', 'UTC',
   '[{"subject_id":"cs","proficiency":"EXPERT"}]', '[]', 10, '["z"]', 1, 1, NULL),
  ('p-partner', 'INTERMEDIATE', 'visual', 'State U', 'UTC',
   '[{"subject_id":"math","proficiency":"BEGINNER"}]', '[]', 1, '["req"]', 1, 1, NULL),
  ('inactive', 'INTERMEDIATE', 'visual', 'State U', 'UTC',
   '[{"subject_id":"math","proficiency":"BEGINNER"}]', '[]', 0, '[]', 0, 1, NULL),
  ('incomplete', 'INTERMEDIATE', 'visual', 'State U', 'UTC',
   '[{"subject_id":"math","proficiency":"BEGINNER"}]', '[]', 0, '[]', 1, 0, NULL),
  ('c', 'INTERMEDIATE', NULL, 'Arts College', 'UTC',
   '[{"subject_id":"art","proficiency":"BEGINNER"}]', 'not json at all', 2, 'broken', 1, 1, NULL);
)";

// Level tags the decoder accepts leniently: unknown tags read as Beginner and
// surrounding tabs are trimmed.
constexpr const char* kLenientLevelRows = R"(
INSERT INTO participants (id, academic_level, learning_style, subjects_json)
VALUES
  ('req', 'BEGINNER', 'visual', '[]'),
  ('nolevel', 'sophomore', 'visual', '[]'),
  ('tab', char(9) || 'BEGINNER' || char(10), char(9) || 'Visual', '[]'),
  ('adv', 'ADVANCED', 'auditory', '[]');
)";

// Creates a seeded database file and removes it on scope exit.
class SeededDatabase {
 public:
  explicit SeededDatabase(const char* rows = kSeedRows,
                          const char* file_name = "sme_candidate_source_test.sqlite")
      : path_((std::filesystem::temp_directory_path() / file_name).string()) {
    std::filesystem::remove(path_);
    auto db = SqliteDb::open(path_, OpenMode::kReadWrite);
    REQUIRE(db.has_value());
    REQUIRE(db.value()->exec(kParticipantsSchema).has_value());
    REQUIRE(db.value()->exec(rows).has_value());
  }

  ~SeededDatabase() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
  }

  SeededDatabase(const SeededDatabase&) = delete;
  SeededDatabase& operator=(const SeededDatabase&) = delete;
  SeededDatabase(SeededDatabase&&) = delete;
  SeededDatabase& operator=(SeededDatabase&&) = delete;

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  std::string path_;
};

std::vector<std::string> ids_of(const std::vector<domain::Participant>& participants) {
  std::vector<std::string> ids;
  for (const auto& p : participants) {
    ids.push_back(p.id.value);
  }
  return ids;
}

}  // namespace

TEST_CASE("SqliteCandidateSource decodes rows", "[storage][sqlite][candidates]") {
  SeededDatabase seeded;
  auto db = SqliteDb::open(seeded.path(), OpenMode::kReadOnly);
  REQUIRE(db.has_value());
  REQUIRE(db.value()->has_table("participants"));

  const SqliteCandidateSource source(db.value());
  const auto all = source.load_all();
  REQUIRE(all.has_value());
  CHECK(ids_of(all.value()) == std::vector<std::string>{"a", "b", "c", "inactive", "incomplete",
                                                        "p-partner", "req"});

  const auto& b = all.value()[1];
  CHECK(b.academic_level == domain::AcademicLevel::kExpert);
  CHECK(b.learning_style == domain::LearningStyle::kReading);
  CHECK(b.recent_activity == 10);

  const auto& c = all.value()[2];
  CHECK_FALSE(c.learning_style.has_value());
  CHECK(c.availability.empty());
  CHECK(c.partner_ids.empty());

  const auto& a = all.value()[0];
  CHECK(a.reputation == 0.9);
  REQUIRE(a.availability.size() == 1);

  SECTION("read-only connections refuse writes") {
    CHECK_FALSE(db.value()->exec("DELETE FROM participants").has_value());
  }
}

TEST_CASE("SqliteCandidateSource filters like the in-memory predicate",
          "[storage][sqlite][candidates]") {
  SeededDatabase seeded;
  auto db = SqliteDb::open(seeded.path(), OpenMode::kReadOnly);
  REQUIRE(db.has_value());
  const SqliteCandidateSource source(db.value());

  const auto all = source.load_all();
  REQUIRE(all.has_value());
  const auto& requester = all.value().back();
  REQUIRE(requester.id.value == "req");

  auto expected_for = [&](const domain::MatchingCriteria& criteria) {
    std::vector<domain::Participant> expected;
    for (const auto& candidate : all.value()) {
      if (matching::passes_hard_filters(requester, candidate, criteria)) {
        expected.push_back(candidate);
      }
    }
    return ids_of(expected);
  };

  std::vector<domain::MatchingCriteria> variants(5);
  variants[1].subjects = {core::SubjectId{"math"}};
  variants[2].academic_level = domain::AcademicLevel::kIntermediate;
  variants[2].require_exact_level = true;
  variants[3].learning_style = domain::LearningStyle::kReading;
  variants[3].require_exact_style = true;
  variants[4].academic_level = domain::AcademicLevel::kExpert;
  variants[4].require_exact_level = false;

  for (const auto& criteria : variants) {
    const auto loaded = source.load_candidates(requester, criteria);
    REQUIRE(loaded.has_value());
    CHECK(ids_of(loaded.value()) == expected_for(criteria));
  }

  CHECK(ids_of(source.load_candidates(requester, variants[0]).value()) ==
        std::vector<std::string>{"a", "b", "c"});
  CHECK(ids_of(source.load_candidates(requester, variants[2]).value()) ==
        std::vector<std::string>{"a", "c"});
  CHECK(ids_of(source.load_candidates(requester, variants[3]).value()) ==
        std::vector<std::string>{"b"});
}

TEST_CASE("SqliteCandidateSource matches in-memory filtering for lenient tags",
          "[storage][sqlite][candidates]") {
  SeededDatabase seeded(kLenientLevelRows, "sme_candidate_source_lenient.sqlite");
  auto db = SqliteDb::open(seeded.path(), OpenMode::kReadOnly);
  REQUIRE(db.has_value());
  const SqliteCandidateSource source(db.value());

  const auto all = source.load_all();
  REQUIRE(all.has_value());
  REQUIRE(ids_of(all.value()) == std::vector<std::string>{"adv", "nolevel", "req", "tab"});
  const auto& requester = all.value()[2];

  domain::MatchingCriteria by_level;
  by_level.academic_level = domain::AcademicLevel::kBeginner;
  by_level.require_exact_level = true;

  domain::MatchingCriteria by_style;
  by_style.learning_style = domain::LearningStyle::kVisual;
  by_style.require_exact_style = true;

  for (const auto& criteria : {by_level, by_style}) {
    std::vector<std::string> expected;
    for (const auto& candidate : all.value()) {
      if (matching::passes_hard_filters(requester, candidate, criteria)) {
        expected.push_back(candidate.id.value);
      }
    }
    const auto loaded = source.load_candidates(requester, criteria);
    REQUIRE(loaded.has_value());
    CHECK(ids_of(loaded.value()) == expected);
  }

  CHECK(ids_of(source.load_candidates(requester, by_level).value()) ==
        std::vector<std::string>{"nolevel", "tab"});
  CHECK(ids_of(source.load_candidates(requester, by_style).value()) ==
        std::vector<std::string>{"nolevel", "tab"});
}

TEST_CASE("SqliteDb reports missing files in read-only mode", "[storage][sqlite]") {
  const auto missing =
      (std::filesystem::temp_directory_path() / "sme_definitely_missing.sqlite").string();
  std::filesystem::remove(missing);
  CHECK_FALSE(SqliteDb::open(missing, OpenMode::kReadOnly).has_value());
}
