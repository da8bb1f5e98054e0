/* Dense CSR snapshot of a directed graph with resolved weights and edge identities. */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "bmssp_core/labeled_digraph.hpp"
#include "bmssp_core/types.hpp"
#include "bmssp_core/weight.hpp"

namespace bmssp_core {

// Notes on entries:
// - One CSR entry per ordered pair (u, v) with at least one visible edge;
//   parallel edges are collapsed to their minimum resolved weight.
// - Entries of u are ordered by the first appearance of v among u's out-edges.
// - edge_identity[i] = i * edge_adjustment is strictly increasing in i and is
//   used only to break distance ties deterministically.

class AdjacencySnapshot {
public:
  // Throws NotImplementedError for undirected graphs and propagates the
  // weight function's ValueError/TypeError.
  [[nodiscard]] static AdjacencySnapshot build(
      const LabeledDiGraph& g,
      const WeightFunction& weight,
      double edge_adjustment);
  ~AdjacencySnapshot() noexcept = default;

  [[nodiscard]] std::int32_t num_nodes() const noexcept { return num_nodes_; }
  [[nodiscard]] std::int32_t num_entries() const noexcept { return static_cast<std::int32_t>(targets_.size()); }

  [[nodiscard]] std::span<const std::int32_t> row_offsets_view() const noexcept { return row_offsets_; }
  [[nodiscard]] std::span<const NodeId> targets_view() const noexcept { return targets_; }
  [[nodiscard]] std::span<const Weight> weights_view() const noexcept { return weights_; }
  [[nodiscard]] std::span<const double> edge_identity_view() const noexcept { return edge_identity_; }

private:
  std::int32_t num_nodes_ {0};
  std::vector<std::int32_t> row_offsets_ {};
  std::vector<NodeId> targets_ {};
  std::vector<Weight> weights_ {};
  std::vector<double> edge_identity_ {};
};

} // namespace bmssp_core
