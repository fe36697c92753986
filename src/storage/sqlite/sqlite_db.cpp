#include "sme/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace sme::storage::sqlite {

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path,
                                                                    const OpenMode mode) {
  using R = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  const int flags = mode == OpenMode::kReadOnly ? SQLITE_OPEN_READONLY
                                                : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return R::err("Failed to open database: " + error);
  }

  return R::ok(std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

bool SqliteDb::has_table(const std::string& name) const {
  PreparedStatement stmt(db_.get(),
                         "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?");
  if (!stmt.is_valid()) {
    return false;
  }
  stmt.bind_text(1, name);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

void PreparedStatement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void PreparedStatement::bind_int(const int index, const int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

std::string PreparedStatement::column_text(const int column) const {
  const unsigned char* text = sqlite3_column_text(stmt_.get(), column);
  return text != nullptr ? reinterpret_cast<const char*>(text) : std::string{};
}

int PreparedStatement::column_int(const int column, const int fallback) const {
  if (column_is_null(column)) {
    return fallback;
  }
  return sqlite3_column_int(stmt_.get(), column);
}

double PreparedStatement::column_double(const int column) const {
  return sqlite3_column_double(stmt_.get(), column);
}

bool PreparedStatement::column_is_null(const int column) const {
  return sqlite3_column_type(stmt_.get(), column) == SQLITE_NULL;
}

}  // namespace sme::storage::sqlite
