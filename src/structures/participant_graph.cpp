#include "sme/structures/participant_graph.h"

#include <algorithm>
#include <set>
#include <utility>

namespace sme::structures {

void ParticipantGraph::add_node(const core::ParticipantId& id) {
  adjacency_.try_emplace(id);
}

void ParticipantGraph::add_edge(const core::ParticipantId& a, const core::ParticipantId& b,
                                const double weight) {
  add_node(a);
  add_node(b);
  if (a == b) {
    return;
  }
  adjacency_[a][b] = weight;
  adjacency_[b][a] = weight;
}

bool ParticipantGraph::has_node(const core::ParticipantId& id) const {
  return adjacency_.contains(id);
}

std::optional<double> ParticipantGraph::weight(const core::ParticipantId& a,
                                               const core::ParticipantId& b) const {
  const auto it = adjacency_.find(a);
  if (it == adjacency_.end()) {
    return std::nullopt;
  }
  const auto edge = it->second.find(b);
  if (edge == it->second.end()) {
    return std::nullopt;
  }
  return edge->second;
}

std::vector<Neighbor> ParticipantGraph::neighbors(const core::ParticipantId& id) const {
  std::vector<Neighbor> out;
  const auto it = adjacency_.find(id);
  if (it == adjacency_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto& [other, w] : it->second) {
    out.push_back(Neighbor{other, w});
  }
  return out;
}

std::size_t ParticipantGraph::edge_count() const {
  std::size_t half_edges = 0;
  for (const auto& [id, edges] : adjacency_) {
    half_edges += edges.size();
  }
  return half_edges / 2;
}

std::vector<std::vector<core::ParticipantId>> ParticipantGraph::connected_components() const {
  std::vector<std::vector<core::ParticipantId>> components;
  std::set<core::ParticipantId> visited;

  // Iterative DFS from each unvisited node in id order.
  for (const auto& [root, edges] : adjacency_) {
    if (visited.contains(root)) {
      continue;
    }
    std::vector<core::ParticipantId> component;
    std::vector<core::ParticipantId> stack{root};
    visited.insert(root);
    while (!stack.empty()) {
      core::ParticipantId current = stack.back();
      stack.pop_back();
      for (const auto& [next, w] : adjacency_.at(current)) {
        if (visited.insert(next).second) {
          stack.push_back(next);
        }
      }
      component.push_back(std::move(current));
    }
    std::sort(component.begin(), component.end());
    components.push_back(std::move(component));
  }

  std::stable_sort(components.begin(), components.end(),
                   [](const auto& a, const auto& b) { return a.size() > b.size(); });
  return components;
}

ParticipantGraph build_partnership_graph(const std::vector<domain::Participant>& pool) {
  ParticipantGraph graph;
  std::set<core::ParticipantId> members;
  for (const auto& participant : pool) {
    graph.add_node(participant.id);
    members.insert(participant.id);
  }
  for (const auto& participant : pool) {
    for (const auto& partner : participant.partner_ids) {
      if (members.contains(partner)) {
        graph.add_edge(participant.id, partner);
      }
    }
  }
  return graph;
}

}  // namespace sme::structures
