#include "sme/storage/candidate_source.h"

#include "sme/domain/participant_json.h"
#include "sme/matching/matching_pipeline.h"

#include <fstream>
#include <sstream>

namespace sme::storage {

core::Result<nlohmann::json, std::string> read_json_file(const std::string& path) {
  using R = core::Result<nlohmann::json, std::string>;

  std::ifstream in(path);
  if (!in) {
    return R::err("cannot open " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json parsed = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    return R::err("invalid JSON in " + path);
  }
  return R::ok(std::move(parsed));
}

PoolResult JsonFileCandidateSource::load_all() const {
  auto document = read_json_file(path_);
  if (!document.has_value()) {
    return PoolResult::err(document.error());
  }
  return domain::participants_from_json(document.value());
}

PoolResult JsonFileCandidateSource::load_candidates(
    const domain::Participant& requester, const domain::MatchingCriteria& criteria) const {
  auto all = load_all();
  if (!all.has_value()) {
    return all;
  }
  std::vector<domain::Participant> filtered;
  for (auto& candidate : all.take_value()) {
    if (matching::passes_hard_filters(requester, candidate, criteria)) {
      filtered.push_back(std::move(candidate));
    }
  }
  return PoolResult::ok(std::move(filtered));
}

}  // namespace sme::storage
