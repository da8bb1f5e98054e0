/* BMSSP building blocks: pivot finding, bounded base case, recursive driver. */
#pragma once

#include <optional>
#include <span>
#include <vector>

#include "bmssp_core/search_context.hpp"
#include "bmssp_core/types.hpp"

namespace bmssp_core {

struct PivotResult {
  std::vector<NodeId> pivots;   // subset of S
  std::vector<NodeId> explored; // W: superset of S, every extra node has dist < B
};

struct BoundResult {
  double bound {0.0};              // completion bound B' <= B
  std::vector<NodeId> completed;   // nodes proven final by this call
};

// Bounded Bellman-Ford for up to k rounds from S, then pivot selection on the
// tight-edge forest. Returns P = S when the exploration grows beyond k * |S|.
[[nodiscard]] PivotResult find_pivots(SearchContext& ctx, double bound, std::span<const NodeId> sources);

// Dijkstra from x that stops after k pops. Only candidates below `bound` are
// pushed. The returned bound is the key that would have been popped next, or
// `bound` when the heap ran dry; `completed` lists popped nodes in pop order.
[[nodiscard]] BoundResult base_case(SearchContext& ctx, double bound, NodeId x);

// Recursive BMSSP at `level` with exclusive bound B and source set S. Every
// node of S must already hold its final distance. When `target` becomes
// complete the call returns early with a partial result.
[[nodiscard]] BoundResult bmssp_recursive(SearchContext& ctx, std::int32_t level, double bound,
                                          std::span<const NodeId> sources,
                                          std::optional<NodeId> target = std::nullopt);

} // namespace bmssp_core
