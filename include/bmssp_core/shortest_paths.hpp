/* Shortest paths via BMSSP: public entry points and result assembly. */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "bmssp_core/labeled_digraph.hpp"
#include "bmssp_core/search_context.hpp"
#include "bmssp_core/types.hpp"
#include "bmssp_core/weight.hpp"

namespace bmssp_core {

struct BmsspOptions {
  // Stop as soon as this node's distance is final. Other reported distances
  // may then be upper bounds rather than shortest distances.
  std::optional<NodeLabel> target {};
  WeightSpec weight {std::string("weight")};
  // Decimal places kept in reported distances; also scales tie-breaking.
  int precision {0};
  bool with_paths {true};
  bool with_predecessors {false};
};

// Label-keyed results. Unreached nodes are absent from every map.
struct BmsspResult {
  LabelMap<double> distances;
  LabelMap<std::vector<NodeLabel>> paths;    // filled if with_paths
  LabelMap<NodeLabel> predecessors;          // filled if with_predecessors; sources omitted
};

// Multi-source BMSSP over a directed graph.
// Throws ValueError (empty sources, negative weight, negative precision),
// NodeNotFound (unknown source/target), NotImplementedError (undirected graph).
[[nodiscard]] BmsspResult bmssp(const LabeledDiGraph& g,
                                const std::vector<NodeLabel>& sources,
                                const BmsspOptions& opts = {});

// Shortest path source -> target. Throws NoPath when unreachable.
[[nodiscard]] std::vector<NodeLabel> single_source_bmssp_path(
    const LabeledDiGraph& g, const NodeLabel& source, const NodeLabel& target,
    const WeightSpec& weight = std::string("weight"), int precision = 0);

// Shortest path length source -> target; 0 when source == target.
[[nodiscard]] double single_source_bmssp_path_length(
    const LabeledDiGraph& g, const NodeLabel& source, const NodeLabel& target,
    const WeightSpec& weight = std::string("weight"), int precision = 0);

// Paths from the nearest source to every reachable node.
[[nodiscard]] LabelMap<std::vector<NodeLabel>> multi_source_bmssp_path(
    const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
    const WeightSpec& weight = std::string("weight"), int precision = 0);

// Distances from the nearest source to every reachable node.
[[nodiscard]] LabelMap<double> multi_source_bmssp_path_length(
    const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
    const WeightSpec& weight = std::string("weight"), int precision = 0);

// Plain multi-source Dijkstra over the same weight resolution, rounded the
// same way. Reference oracle for cross-checking BMSSP results.
[[nodiscard]] LabelMap<double> dijkstra_path_length_map(
    const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
    const WeightSpec& weight = std::string("weight"), int precision = 0);

// Build label-keyed maps from a finished search: every node with finite dist
// gets its true distance rounded to `precision` and, if requested, its path
// (pred chain walked back to a source) and predecessor.
[[nodiscard]] BmsspResult assemble_result(const LabeledDiGraph& g, const SearchContext& ctx,
                                          int precision, bool with_paths,
                                          bool with_predecessors);

// Round half away from zero to `precision` decimal places. Values whose
// scaled form overflows, or precisions above kMaxPrecisionDigits, are
// returned unchanged.
[[nodiscard]] double round_to_precision(double value, int precision) noexcept;

} // namespace bmssp_core
