/*
  AdjacencySnapshot — compacts a LabeledDiGraph into CSR form for one search.

  Parallel edges are grouped per (u, v) in first-seen order and resolved to a
  single weight; hidden pairs are dropped. Each surviving entry receives an
  edge identity proportional to its CSR position.
*/
#include "bmssp_core/adjacency.hpp"

#include <unordered_map>
#include <utility>

#include "bmssp_core/error.hpp"

namespace bmssp_core {

AdjacencySnapshot AdjacencySnapshot::build(
    const LabeledDiGraph& g,
    const WeightFunction& weight,
    double edge_adjustment) {

  if (!g.is_directed()) {
    throw NotImplementedError("BMSSP is not implemented for undirected graphs; "
                              "convert with to_directed() first");
  }
  AdjacencySnapshot a;
  const auto N = g.num_nodes();
  a.num_nodes_ = N;
  a.row_offsets_.assign(static_cast<std::size_t>(N) + 1, 0);
  a.targets_.reserve(static_cast<std::size_t>(g.num_edges()));
  a.weights_.reserve(static_cast<std::size_t>(g.num_edges()));
  a.edge_identity_.reserve(static_cast<std::size_t>(g.num_edges()));

  // Reused per source node: neighbor order and its parallel edge group
  std::vector<NodeId> order;
  std::vector<std::vector<EdgeId>> groups;
  std::unordered_map<NodeId, std::size_t> slot;
  for (NodeId u = 0; u < N; ++u) {
    order.clear();
    groups.clear();
    slot.clear();
    for (auto e : g.out_edges(u)) {
      NodeId v = g.edge_dst(e);
      auto [it, inserted] = slot.emplace(v, groups.size());
      if (inserted) {
        order.push_back(v);
        groups.emplace_back();
      }
      groups[it->second].push_back(e);
    }
    for (std::size_t i = 0; i < order.size(); ++i) {
      auto w = weight(u, order[i], groups[i]);
      if (!w) continue;  // every parallel edge hidden
      const auto idx = a.targets_.size();
      a.targets_.push_back(order[i]);
      a.weights_.push_back(*w);
      a.edge_identity_.push_back(static_cast<double>(idx) * edge_adjustment);
    }
    a.row_offsets_[static_cast<std::size_t>(u) + 1] = static_cast<std::int32_t>(a.targets_.size());
  }
  return a;
}

} // namespace bmssp_core
