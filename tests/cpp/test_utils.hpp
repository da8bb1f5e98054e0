#pragma once

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <random>
#include <set>
#include <span>
#include <utility>
#include <vector>
#include "bmssp_core/labeled_digraph.hpp"
#include "bmssp_core/shortest_paths.hpp"
#include "bmssp_core/types.hpp"

namespace bmssp_core::test {

inline NodeLabel L(std::int64_t v) { return NodeLabel{v}; }

inline std::vector<NodeLabel> labels(std::initializer_list<std::int64_t> ids) {
  std::vector<NodeLabel> out;
  for (auto v : ids) out.emplace_back(v);
  return out;
}

// Graph builders matching Python fixtures

// Directed view of an undirected path 0-1-...-(n-1): arcs in both directions, unit weight.
inline LabeledDiGraph make_bidirectional_path(int n) {
  LabeledDiGraph g;
  for (int i = 0; i < n; ++i) g.add_node(L(i));
  for (int i = 0; i + 1 < n; ++i) {
    g.add_edge(L(i), L(i + 1));
    g.add_edge(L(i + 1), L(i));
  }
  return g;
}

// Directed line 0->1->...->(n-1), unit weight.
inline LabeledDiGraph make_line_graph(int n) {
  LabeledDiGraph g;
  for (int i = 0; i < n; ++i) g.add_node(L(i));
  for (int i = 0; i + 1 < n; ++i) g.add_edge(L(i), L(i + 1), EdgeAttrs{{"weight", 1.0}});
  return g;
}

inline LabeledDiGraph make_grid_graph(int rows, int cols) {
  // Edges going right (weight 1) and down (weight 2)
  LabeledDiGraph g;
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      int node = r * cols + c;
      g.add_node(L(node));
      if (c < cols - 1) g.add_edge(L(node), L(node + 1), EdgeAttrs{{"weight", 1.0}});
      if (r < rows - 1) g.add_edge(L(node), L(node + cols), EdgeAttrs{{"weight", 2.0}});
    }
  }
  return g;
}

// Directed G(n, m) graph without self-loops or repeated pairs; integer
// weights drawn uniformly from [w_lo, w_hi]. Deterministic for a given seed.
inline LabeledDiGraph make_random_digraph(int n, int m, std::uint32_t seed,
                                          int w_lo = 1, int w_hi = 10) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> pick(0, n - 1);
  std::uniform_int_distribution<int> wdist(w_lo, w_hi);
  LabeledDiGraph g;
  for (int i = 0; i < n; ++i) g.add_node(L(i));
  std::set<std::pair<int, int>> used;
  while (static_cast<int>(used.size()) < m) {
    int u = pick(rng);
    int v = pick(rng);
    if (u == v || !used.emplace(u, v).second) continue;
    g.add_edge(L(u), L(v), EdgeAttrs{{"weight", static_cast<double>(wdist(rng))}});
  }
  return g;
}

// Same node set and reachability as the reference Dijkstra, with equal distances.
inline void expect_matches_dijkstra(const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
                                    const LabelMap<double>& got, int precision = 0) {
  auto ref = dijkstra_path_length_map(g, sources, std::string("weight"), precision);
  ASSERT_EQ(got.size(), ref.size());
  for (const auto& [label, d] : ref) {
    auto it = got.find(label);
    ASSERT_NE(it, got.end()) << "missing node " << to_string(label);
    EXPECT_NEAR(it->second, d, 1e-9) << "node " << to_string(label);
  }
}

// Sum of the cheapest "weight" attribute along consecutive pairs of `path`.
inline double path_cost(const LabeledDiGraph& g, const std::vector<NodeLabel>& path) {
  double total = 0.0;
  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    const NodeId u = g.index_of(path[i]);
    const NodeId v = g.index_of(path[i + 1]);
    double best = std::numeric_limits<double>::infinity();
    for (auto e : g.out_edges(u)) {
      if (g.edge_dst(e) != v) continue;
      auto it = g.edge_attrs(e).find("weight");
      double w = it == g.edge_attrs(e).end() ? 1.0 : std::get<double>(it->second);
      best = std::min(best, w);
    }
    total += best;
  }
  return total;
}

} // namespace bmssp_core::test
