#pragma once

#include "sme/core/result.h"
#include "sme/domain/criteria.h"
#include "sme/domain/participant.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sme::storage {

using PoolResult = core::Result<std::vector<domain::Participant>, std::string>;

// ICandidateSource supplies participant pools to the engine. Sources are read-only.
//
// load_candidates() must return exactly the pool members that pass
// matching::passes_hard_filters for the requester and criteria; implementations
// may push part of that predicate into their query.
class ICandidateSource {
 public:
  virtual ~ICandidateSource() = default;

  [[nodiscard]] virtual PoolResult load_all() const = 0;

  [[nodiscard]] virtual PoolResult load_candidates(
      const domain::Participant& requester, const domain::MatchingCriteria& criteria) const = 0;
};

// JsonFileCandidateSource reads a participants file (array or {"participants": [...]})
// on every call and filters in memory.
class JsonFileCandidateSource final : public ICandidateSource {
 public:
  explicit JsonFileCandidateSource(std::string path) : path_(std::move(path)) {}

  [[nodiscard]] PoolResult load_all() const override;
  [[nodiscard]] PoolResult load_candidates(const domain::Participant& requester,
                                           const domain::MatchingCriteria& criteria) const override;

 private:
  std::string path_;
};

// Reads and decodes a whole JSON document from disk.
[[nodiscard]] core::Result<nlohmann::json, std::string> read_json_file(const std::string& path);

}  // namespace sme::storage
