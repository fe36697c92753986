#pragma once

#include "sme/core/ids.h"
#include "sme/domain/participant.h"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace sme::structures {

struct Neighbor {
  core::ParticipantId id;
  double weight{1.0};
};

// ParticipantGraph is an undirected weighted graph keyed by participant id.
// Adjacency is held in ordered maps so every traversal is deterministic.
class ParticipantGraph {
 public:
  void add_node(const core::ParticipantId& id);

  // add_edge inserts both endpoints if absent; re-adding an edge replaces its weight.
  // Self-loops are ignored.
  void add_edge(const core::ParticipantId& a, const core::ParticipantId& b, double weight = 1.0);

  [[nodiscard]] bool has_node(const core::ParticipantId& id) const;
  [[nodiscard]] std::optional<double> weight(const core::ParticipantId& a,
                                             const core::ParticipantId& b) const;

  // Neighbours sorted by id; empty for unknown nodes.
  [[nodiscard]] std::vector<Neighbor> neighbors(const core::ParticipantId& id) const;

  [[nodiscard]] std::size_t node_count() const { return adjacency_.size(); }
  [[nodiscard]] std::size_t edge_count() const;

  // connected_components returns every component (isolated nodes included) with
  // members sorted by id. Components are ordered by size descending, then by their
  // smallest member id.
  [[nodiscard]] std::vector<std::vector<core::ParticipantId>> connected_components() const;

 private:
  std::map<core::ParticipantId, std::map<core::ParticipantId, double>> adjacency_;
};

// build_partnership_graph adds a node per pool member and an edge for every partner
// relation whose two ends are both in the pool.
[[nodiscard]] ParticipantGraph build_partnership_graph(
    const std::vector<domain::Participant>& pool);

}  // namespace sme::structures
