/* Labeled (multi)graph with attribute maps and dense integer indexing. */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "bmssp_core/types.hpp"

namespace bmssp_core {

// Notes on identifiers:
// - NodeId is the insertion index of a node label; the label <-> id mapping is
//   a bijection that never changes (nodes and edges are never removed).
// - EdgeId is the insertion index of an edge. On a non-multigraph, adding an
//   existing (u, v) edge updates its attributes in place and keeps its id.
// - Undirected edges are stored once and listed in the out-edges of both
//   endpoints.

class LabeledDiGraph {
public:
  explicit LabeledDiGraph(bool directed = true, bool multigraph = false) noexcept
      : directed_(directed), multigraph_(multigraph) {}
  ~LabeledDiGraph() noexcept = default;

  // Integer-labelled directed multigraph from parallel arrays; every edge gets
  // a numeric "weight" attribute. add_reverse also inserts each edge reversed.
  [[nodiscard]] static LabeledDiGraph from_arrays(
      std::int32_t num_nodes,
      std::span<const std::int32_t> src,
      std::span<const std::int32_t> dst,
      std::span<const Weight> weight,
      bool add_reverse = false);

  NodeId add_node(const NodeLabel& label, const NodeAttrs& attrs = {});
  EdgeId add_edge(const NodeLabel& u, const NodeLabel& v, const EdgeAttrs& attrs = {});
  // Each tuple is (u, v, w); w is stored under `key`.
  void add_weighted_edges(const std::vector<std::tuple<NodeLabel, NodeLabel, Weight>>& edges,
                          const std::string& key = "weight");
  // Adds edges labels[0]->labels[1]->...->labels.back()->labels[0].
  void add_cycle(const std::vector<NodeLabel>& labels, const EdgeAttrs& attrs = {});

  // Directed copy; each undirected edge becomes a pair of opposite arcs.
  [[nodiscard]] LabeledDiGraph to_directed() const;

  [[nodiscard]] bool is_directed() const noexcept { return directed_; }
  [[nodiscard]] bool is_multigraph() const noexcept { return multigraph_; }
  [[nodiscard]] std::int32_t num_nodes() const noexcept { return static_cast<std::int32_t>(labels_.size()); }
  [[nodiscard]] std::int32_t num_edges() const noexcept { return static_cast<std::int32_t>(src_.size()); }

  [[nodiscard]] bool has_node(const NodeLabel& label) const noexcept;
  // Throws NodeNotFound for unknown labels.
  [[nodiscard]] NodeId index_of(const NodeLabel& label) const;
  [[nodiscard]] const NodeLabel& label_of(NodeId id) const { return labels_.at(static_cast<std::size_t>(id)); }
  [[nodiscard]] const NodeAttrs& node_attrs(const NodeLabel& label) const;

  [[nodiscard]] NodeId edge_src(EdgeId e) const { return src_.at(static_cast<std::size_t>(e)); }
  [[nodiscard]] NodeId edge_dst(EdgeId e) const { return dst_.at(static_cast<std::size_t>(e)); }
  [[nodiscard]] const EdgeAttrs& edge_attrs(EdgeId e) const { return edge_attrs_.at(static_cast<std::size_t>(e)); }
  // Edges incident out of u in insertion order (both directions when undirected).
  [[nodiscard]] std::span<const EdgeId> out_edges(NodeId u) const {
    return out_edges_.at(static_cast<std::size_t>(u));
  }
  [[nodiscard]] std::span<const NodeLabel> labels() const noexcept { return labels_; }

private:
  [[nodiscard]] std::uint64_t pair_key(NodeId u, NodeId v) const noexcept;

  bool directed_ {true};
  bool multigraph_ {false};

  std::vector<NodeLabel> labels_ {};
  std::unordered_map<NodeLabel, NodeId, NodeLabelHash> index_ {};
  std::vector<NodeAttrs> node_attrs_ {};

  std::vector<NodeId> src_ {};
  std::vector<NodeId> dst_ {};
  std::vector<EdgeAttrs> edge_attrs_ {};
  std::vector<std::vector<EdgeId>> out_edges_ {};
  // (u, v) -> EdgeId for non-multigraphs (unordered pair when undirected)
  std::unordered_map<std::uint64_t, EdgeId> pair_index_ {};
};

} // namespace bmssp_core
