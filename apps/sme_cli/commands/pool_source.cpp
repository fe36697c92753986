#include "pool_source.h"

#include "sme/core/version.h"
#include "sme/storage/sqlite/sqlite_candidate_source.h"
#include "sme/storage/sqlite/sqlite_db.h"

#include <chrono>
#include <ostream>

namespace sme::cli {

std::string validate_pool_options(const PoolOptions& options) {
  if (options.pool_path.has_value() && options.db_path.has_value()) {
    return "--pool and --db are mutually exclusive";
  }
  if (!options.pool_path.has_value() && !options.db_path.has_value()) {
    return "one of --pool <file.json> or --db <file.sqlite> is required";
  }
  return "";
}

core::Result<std::unique_ptr<storage::ICandidateSource>, std::string> open_candidate_source(
    const PoolOptions& options) {
  using R = core::Result<std::unique_ptr<storage::ICandidateSource>, std::string>;

  if (auto error = validate_pool_options(options); !error.empty()) {
    return R::err(error);
  }
  if (options.pool_path.has_value()) {
    return R::ok(std::make_unique<storage::JsonFileCandidateSource>(*options.pool_path));
  }

  auto db_result =
      storage::sqlite::SqliteDb::open(*options.db_path, storage::sqlite::OpenMode::kReadOnly);
  if (!db_result.has_value()) {
    return R::err("failed to open database: " + db_result.error());
  }
  auto db = db_result.value();
  if (!db->has_table("participants")) {
    return R::err("database has no participants table: " + *options.db_path);
  }
  return R::ok(std::make_unique<storage::sqlite::SqliteCandidateSource>(db));
}

void print_startup_block(std::ostream& os, const std::string& command, const PoolOptions& pool,
                         const app::EngineConfig& engine) {
  os << "study-match-engine v" << core::kBuildVersion << " (" << command << ")\n";
  if (pool.pool_path.has_value()) {
    os << "Pool source: JSON file " << *pool.pool_path << "\n";
  } else if (pool.db_path.has_value()) {
    os << "Pool source: SQLite database " << *pool.db_path << " (read-only)\n";
  }
  const auto ttl_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(engine.cache.ttl).count();
  os << "Match cache: capacity=" << engine.cache.capacity << " ttl=" << ttl_seconds << "s\n";
}

}  // namespace sme::cli
