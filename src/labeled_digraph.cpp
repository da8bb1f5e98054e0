/*
  LabeledDiGraph — attribute-carrying (multi)graph keyed by caller labels.

  Labels are assigned dense NodeIds in insertion order. Edges keep their
  insertion index as EdgeId and are listed per source node in insertion
  order, which is the order the adjacency builder later walks.
*/
#include "bmssp_core/labeled_digraph.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "bmssp_core/error.hpp"

namespace bmssp_core {

LabeledDiGraph LabeledDiGraph::from_arrays(
    std::int32_t num_nodes,
    std::span<const std::int32_t> src,
    std::span<const std::int32_t> dst,
    std::span<const Weight> weight,
    bool add_reverse) {

  if (num_nodes < 0) {
    throw std::invalid_argument("num_nodes must be >= 0");
  }
  if (src.size() != dst.size() || src.size() != weight.size()) {
    throw std::invalid_argument("src, dst, and weight must have the same length");
  }
  const std::size_t m = src.size();
  // Invariants: ids within [0, num_nodes), finite weights
  for (std::size_t i = 0; i < m; ++i) {
    if (src[i] < 0 || dst[i] < 0 || src[i] >= num_nodes || dst[i] >= num_nodes) {
      throw std::out_of_range("edge index out of range of num_nodes");
    }
    if (!std::isfinite(weight[i])) {
      throw std::invalid_argument("weight values must be finite");
    }
  }

  LabeledDiGraph g(/*directed=*/true, /*multigraph=*/true);
  g.labels_.reserve(static_cast<std::size_t>(num_nodes));
  for (std::int32_t v = 0; v < num_nodes; ++v) {
    g.add_node(NodeLabel{static_cast<std::int64_t>(v)});
  }
  const std::size_t total = add_reverse ? 2 * m : m;
  g.src_.reserve(total);
  g.dst_.reserve(total);
  g.edge_attrs_.reserve(total);
  for (std::size_t i = 0; i < m; ++i) {
    g.add_edge(NodeLabel{static_cast<std::int64_t>(src[i])},
               NodeLabel{static_cast<std::int64_t>(dst[i])},
               EdgeAttrs{{"weight", weight[i]}});
  }
  if (add_reverse) {
    for (std::size_t i = 0; i < m; ++i) {
      g.add_edge(NodeLabel{static_cast<std::int64_t>(dst[i])},
                 NodeLabel{static_cast<std::int64_t>(src[i])},
                 EdgeAttrs{{"weight", weight[i]}});
    }
  }
  return g;
}

NodeId LabeledDiGraph::add_node(const NodeLabel& label, const NodeAttrs& attrs) {
  auto it = index_.find(label);
  if (it != index_.end()) {
    auto& existing = node_attrs_[static_cast<std::size_t>(it->second)];
    for (const auto& [key, value] : attrs) existing[key] = value;
    return it->second;
  }
  const auto id = static_cast<NodeId>(labels_.size());
  labels_.push_back(label);
  index_.emplace(label, id);
  node_attrs_.push_back(attrs);
  out_edges_.emplace_back();
  return id;
}

EdgeId LabeledDiGraph::add_edge(const NodeLabel& u, const NodeLabel& v, const EdgeAttrs& attrs) {
  const NodeId ui = add_node(u);
  const NodeId vi = add_node(v);
  if (!multigraph_) {
    auto it = pair_index_.find(pair_key(ui, vi));
    if (it != pair_index_.end()) {
      auto& existing = edge_attrs_[static_cast<std::size_t>(it->second)];
      for (const auto& [key, value] : attrs) existing[key] = value;
      return it->second;
    }
  }
  const auto e = static_cast<EdgeId>(src_.size());
  src_.push_back(ui);
  dst_.push_back(vi);
  edge_attrs_.push_back(attrs);
  out_edges_[static_cast<std::size_t>(ui)].push_back(e);
  if (!directed_ && ui != vi) {
    out_edges_[static_cast<std::size_t>(vi)].push_back(e);
  }
  if (!multigraph_) {
    pair_index_.emplace(pair_key(ui, vi), e);
  }
  return e;
}

void LabeledDiGraph::add_weighted_edges(
    const std::vector<std::tuple<NodeLabel, NodeLabel, Weight>>& edges,
    const std::string& key) {
  for (const auto& [u, v, w] : edges) {
    add_edge(u, v, EdgeAttrs{{key, w}});
  }
}

void LabeledDiGraph::add_cycle(const std::vector<NodeLabel>& labels, const EdgeAttrs& attrs) {
  if (labels.empty()) return;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    add_edge(labels[i], labels[(i + 1) % labels.size()], attrs);
  }
}

LabeledDiGraph LabeledDiGraph::to_directed() const {
  LabeledDiGraph out(/*directed=*/true, multigraph_);
  for (std::size_t v = 0; v < labels_.size(); ++v) {
    out.add_node(labels_[v], node_attrs_[v]);
  }
  for (std::size_t e = 0; e < src_.size(); ++e) {
    const auto& u = labels_[static_cast<std::size_t>(src_[e])];
    const auto& v = labels_[static_cast<std::size_t>(dst_[e])];
    out.add_edge(u, v, edge_attrs_[e]);
    if (!directed_ && src_[e] != dst_[e]) {
      out.add_edge(v, u, edge_attrs_[e]);
    }
  }
  return out;
}

bool LabeledDiGraph::has_node(const NodeLabel& label) const noexcept {
  return index_.find(label) != index_.end();
}

NodeId LabeledDiGraph::index_of(const NodeLabel& label) const {
  auto it = index_.find(label);
  if (it == index_.end()) {
    throw NodeNotFound("Node " + to_string(label) + " not found in graph");
  }
  return it->second;
}

const NodeAttrs& LabeledDiGraph::node_attrs(const NodeLabel& label) const {
  return node_attrs_[static_cast<std::size_t>(index_of(label))];
}

std::uint64_t LabeledDiGraph::pair_key(NodeId u, NodeId v) const noexcept {
  if (!directed_ && v < u) std::swap(u, v);
  return (static_cast<std::uint64_t>(static_cast<std::uint32_t>(u)) << 32) |
         static_cast<std::uint64_t>(static_cast<std::uint32_t>(v));
}

} // namespace bmssp_core
