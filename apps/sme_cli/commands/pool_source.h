#pragma once

#include "sme/app/engine_service.h"
#include "sme/core/result.h"
#include "sme/storage/candidate_source.h"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace sme::cli {

// PoolOptions selects where a subcommand reads its participants from. Exactly one
// of pool_path (JSON file) and db_path (SQLite file, opened read-only) is set.
struct PoolOptions {
  std::optional<std::string> pool_path;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
};

// Returns "" when exactly one source is configured.
[[nodiscard]] std::string validate_pool_options(const PoolOptions& options);

[[nodiscard]] core::Result<std::unique_ptr<storage::ICandidateSource>, std::string>
open_candidate_source(const PoolOptions& options);

// print_startup_block writes the version banner, the pool source and the engine
// tunables to `os` (stderr in every subcommand).
void print_startup_block(std::ostream& os, const std::string& command, const PoolOptions& pool,
                         const app::EngineConfig& engine);

}  // namespace sme::cli
