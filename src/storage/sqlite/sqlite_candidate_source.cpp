#include "sme/storage/sqlite/sqlite_candidate_source.h"

#include "sme/domain/participant_json.h"
#include "sme/matching/matching_pipeline.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <string>

namespace sme::storage::sqlite {

namespace {

constexpr const char* kSelectColumns = R"(
  SELECT id, academic_level, learning_style, institution, timezone, region, major,
         graduation_year, subjects_json, availability_json, recent_activity,
         partner_ids_json, is_active, profile_complete, reputation
  FROM participants
)";

// Malformed JSON columns decode as null and fall back to empty lists.
nlohmann::json parse_column(const std::string& text) {
  return nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
}

nlohmann::json row_to_json(const PreparedStatement& stmt) {
  nlohmann::json j;
  j["id"] = stmt.column_text(0);
  j["academic_level"] = stmt.column_text(1);
  j["learning_style"] = stmt.column_text(2);
  j["institution"] = stmt.column_text(3);
  j["timezone"] = stmt.column_text(4);
  j["region"] = stmt.column_text(5);
  j["major"] = stmt.column_text(6);
  if (!stmt.column_is_null(7)) {
    j["graduation_year"] = stmt.column_int(7);
  }
  j["subjects"] = parse_column(stmt.column_text(8));
  j["availability"] = stmt.column_text(9);
  j["recent_activity"] = stmt.column_int(10);
  j["partner_ids"] = parse_column(stmt.column_text(11));
  j["is_active"] = stmt.column_int(12, 1) != 0;
  j["profile_complete"] = stmt.column_int(13, 1) != 0;
  if (!stmt.column_is_null(14)) {
    j["reputation"] = stmt.column_double(14);
  }
  return j;
}

}  // namespace

SqliteCandidateSource::SqliteCandidateSource(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

PoolResult SqliteCandidateSource::run_query(PreparedStatement& stmt) const {
  std::vector<domain::Participant> participants;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    auto decoded = domain::participant_from_json(row_to_json(stmt));
    if (!decoded.has_value()) {
      return PoolResult::err("participants row: " + decoded.error());
    }
    participants.push_back(decoded.take_value());
  }
  if (rc != SQLITE_DONE) {
    return PoolResult::err(std::string("participants query failed: ") +
                           sqlite3_errmsg(db_->connection()));
  }
  return PoolResult::ok(std::move(participants));
}

PoolResult SqliteCandidateSource::load_all() const {
  PreparedStatement stmt(db_->connection(), std::string(kSelectColumns) + " ORDER BY id");
  if (!stmt.is_valid()) {
    return PoolResult::err("Failed to prepare participants query: " + stmt.error());
  }
  return run_query(stmt);
}

PoolResult SqliteCandidateSource::load_candidates(
    const domain::Participant& requester, const domain::MatchingCriteria& criteria) const {
  // Only columns whose SQL test matches the decoder exactly are pushed down; the
  // rows that survive are a superset of the in-memory result.
  std::string sql = kSelectColumns;
  sql += " WHERE id <> ?1 AND COALESCE(is_active, 1) <> 0 AND COALESCE(profile_complete, 1) <> 0";
  sql += " ORDER BY id";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return PoolResult::err("Failed to prepare candidates query: " + stmt.error());
  }
  stmt.bind_text(1, requester.id.value);

  auto rows = run_query(stmt);
  if (!rows.has_value()) {
    return rows;
  }

  // Level and style tags decode leniently (unknown levels read as Beginner), and the
  // partner and subject filters need the decoded JSON columns.
  std::vector<domain::Participant> filtered;
  for (auto& candidate : rows.take_value()) {
    if (matching::passes_hard_filters(requester, candidate, criteria)) {
      filtered.push_back(std::move(candidate));
    }
  }
  return PoolResult::ok(std::move(filtered));
}

}  // namespace sme::storage::sqlite
