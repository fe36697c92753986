#pragma once

#include "sme/storage/candidate_source.h"
#include "sme/storage/sqlite/sqlite_db.h"

#include <memory>

namespace sme::storage::sqlite {

// Table layout read by SqliteCandidateSource. Level and style are stored as their
// text tags; list-valued fields are JSON-encoded TEXT columns.
inline constexpr const char* kParticipantsSchema = R"(
CREATE TABLE IF NOT EXISTS participants (
  id TEXT PRIMARY KEY,
  academic_level TEXT NOT NULL DEFAULT 'BEGINNER',
  learning_style TEXT,
  institution TEXT NOT NULL DEFAULT '',
  timezone TEXT NOT NULL DEFAULT '',
  region TEXT NOT NULL DEFAULT '',
  major TEXT,
  graduation_year INTEGER,
  subjects_json TEXT NOT NULL DEFAULT '[]',
  availability_json TEXT NOT NULL DEFAULT '[]',
  recent_activity INTEGER NOT NULL DEFAULT 0,
  partner_ids_json TEXT NOT NULL DEFAULT '[]',
  is_active INTEGER NOT NULL DEFAULT 1 CHECK(is_active IN (0, 1)),
  profile_complete INTEGER NOT NULL DEFAULT 1 CHECK(profile_complete IN (0, 1)),
  reputation REAL
);

CREATE INDEX IF NOT EXISTS idx_participants_eligible
  ON participants(is_active, profile_complete);
)";

// SqliteCandidateSource reads participant pools from a `participants` table.
// load_candidates() pushes the id and active/complete filters into the WHERE clause
// and runs passes_hard_filters over the decoded rows, so level, style, partner and
// subject checks see exactly what in-memory filtering sees. Rows are ordered by id.
class SqliteCandidateSource final : public ICandidateSource {
 public:
  explicit SqliteCandidateSource(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] PoolResult load_all() const override;
  [[nodiscard]] PoolResult load_candidates(const domain::Participant& requester,
                                           const domain::MatchingCriteria& criteria) const override;

 private:
  [[nodiscard]] PoolResult run_query(PreparedStatement& stmt) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace sme::storage::sqlite
