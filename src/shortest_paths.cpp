/*
  shortest_paths — BMSSP entry points over a LabeledDiGraph.

  Flow of one call:
    - validate inputs (sources, target, precision, directedness);
    - derive parameters, resolve weights and build the CSR snapshot;
    - seed sources in a fresh SearchContext and run the recursion from the
      top level with an unbounded B;
    - assemble label-keyed distance/path maps from dist/cdist/pred.
  Also provides a plain Dijkstra over the same snapshot for cross-checking.
*/
#include "bmssp_core/shortest_paths.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <queue>
#include <unordered_set>
#include <utility>
#include <vector>

#include "bmssp_core/adjacency.hpp"
#include "bmssp_core/bounded_search.hpp"
#include "bmssp_core/error.hpp"
#include "bmssp_core/params.hpp"

namespace bmssp_core {

namespace {
// Map source labels to ids, dropping duplicates while keeping first-seen order.
std::vector<NodeId> source_ids(const LabeledDiGraph& g, const std::vector<NodeLabel>& sources) {
  if (sources.empty()) {
    throw ValueError("Sources must not be empty");
  }
  std::vector<NodeId> ids;
  std::unordered_set<NodeId> seen;
  ids.reserve(sources.size());
  for (const auto& s : sources) {
    NodeId id = g.index_of(s);
    if (seen.insert(id).second) ids.push_back(id);
  }
  return ids;
}

void require_directed(const LabeledDiGraph& g) {
  if (!g.is_directed()) {
    throw NotImplementedError("BMSSP is not implemented for undirected graphs; "
                              "convert with to_directed() first");
  }
}

void require_precision(int precision) {
  if (precision < 0) {
    throw ValueError("precision must be >= 0, got " + std::to_string(precision));
  }
}
} // namespace

double round_to_precision(double value, int precision) noexcept {
  if (precision > kMaxPrecisionDigits) return value;
  const double scale = std::pow(10.0, static_cast<double>(precision));
  const double scaled = value * scale;
  if (!std::isfinite(scaled)) return value;
  return std::round(scaled) / scale;
}

BmsspResult assemble_result(const LabeledDiGraph& g, const SearchContext& ctx,
                            int precision, bool with_paths, bool with_predecessors) {
  BmsspResult out;
  const auto N = ctx.adj->num_nodes();
  for (NodeId v = 0; v < N; ++v) {
    const auto vi = static_cast<std::size_t>(v);
    if (!std::isfinite(ctx.dist[vi])) continue;
    const auto& label = g.label_of(v);
    out.distances.emplace(label, round_to_precision(ctx.cdist[vi], precision));
    const NodeId p = ctx.pred[vi];
    if (with_predecessors && p != kNoNode) {
      out.predecessors.emplace(label, g.label_of(p));
    }
    if (!with_paths) continue;
    std::vector<NodeLabel> path;
    std::int32_t steps = 0;
    for (NodeId u = v; u != kNoNode; u = ctx.pred[static_cast<std::size_t>(u)]) {
      if (++steps > N) {
        throw RuntimeError("predecessor chain of node " + to_string(label) + " does not reach a source");
      }
      path.push_back(g.label_of(u));
    }
    std::reverse(path.begin(), path.end());
    out.paths.emplace(label, std::move(path));
  }
  return out;
}

BmsspResult bmssp(const LabeledDiGraph& g,
                  const std::vector<NodeLabel>& sources,
                  const BmsspOptions& opts) {
  require_precision(opts.precision);
  require_directed(g);
  const auto src_ids = source_ids(g, sources);
  std::optional<NodeId> target_id;
  if (opts.target) target_id = g.index_of(*opts.target);

  const auto params = derive_params(g.num_nodes(), g.num_edges(), opts.precision);
  const auto adjacency = AdjacencySnapshot::build(g, resolve_weight(g, opts.weight),
                                                  params.edge_adjustment);
  SearchContext ctx(adjacency, params);
  for (auto s : src_ids) ctx.add_source(s);

  (void)bmssp_recursive(ctx, params.levels, std::numeric_limits<double>::infinity(),
                        src_ids, target_id);
  return assemble_result(g, ctx, opts.precision, opts.with_paths, opts.with_predecessors);
}

std::vector<NodeLabel> single_source_bmssp_path(
    const LabeledDiGraph& g, const NodeLabel& source, const NodeLabel& target,
    const WeightSpec& weight, int precision) {
  (void)g.index_of(source);
  (void)g.index_of(target);
  BmsspOptions opts;
  opts.target = target;
  opts.weight = weight;
  opts.precision = precision;
  auto res = bmssp(g, {source}, opts);
  auto it = res.paths.find(target);
  if (it == res.paths.end()) {
    throw NoPath("Node " + to_string(target) + " not reachable from " + to_string(source));
  }
  return std::move(it->second);
}

double single_source_bmssp_path_length(
    const LabeledDiGraph& g, const NodeLabel& source, const NodeLabel& target,
    const WeightSpec& weight, int precision) {
  (void)g.index_of(source);
  if (source == target) return 0.0;
  (void)g.index_of(target);
  BmsspOptions opts;
  opts.target = target;
  opts.weight = weight;
  opts.precision = precision;
  opts.with_paths = false;
  auto res = bmssp(g, {source}, opts);
  auto it = res.distances.find(target);
  if (it == res.distances.end()) {
    throw NoPath("Node " + to_string(target) + " not reachable from " + to_string(source));
  }
  return it->second;
}

LabelMap<std::vector<NodeLabel>> multi_source_bmssp_path(
    const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
    const WeightSpec& weight, int precision) {
  BmsspOptions opts;
  opts.weight = weight;
  opts.precision = precision;
  return std::move(bmssp(g, sources, opts).paths);
}

LabelMap<double> multi_source_bmssp_path_length(
    const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
    const WeightSpec& weight, int precision) {
  BmsspOptions opts;
  opts.weight = weight;
  opts.precision = precision;
  opts.with_paths = false;
  return std::move(bmssp(g, sources, opts).distances);
}

LabelMap<double> dijkstra_path_length_map(
    const LabeledDiGraph& g, const std::vector<NodeLabel>& sources,
    const WeightSpec& weight, int precision) {
  require_precision(precision);
  require_directed(g);
  const auto src_ids = source_ids(g, sources);
  const auto adjacency = AdjacencySnapshot::build(g, resolve_weight(g, weight), 0.0);
  const auto N = adjacency.num_nodes();
  const auto row = adjacency.row_offsets_view();
  const auto col = adjacency.targets_view();
  const auto wgt = adjacency.weights_view();

  std::vector<double> dist(static_cast<std::size_t>(N), std::numeric_limits<double>::infinity());
  using QItem = std::pair<double, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) { return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  for (auto s : src_ids) {
    dist[static_cast<std::size_t>(s)] = 0.0;
    pq.emplace(0.0, s);
  }
  while (!pq.empty()) {
    auto [d_u, u] = pq.top(); pq.pop();
    if (d_u > dist[static_cast<std::size_t>(u)]) continue;
    auto start = static_cast<std::size_t>(row[static_cast<std::size_t>(u)]);
    auto end   = static_cast<std::size_t>(row[static_cast<std::size_t>(u) + 1]);
    for (std::size_t i = start; i < end; ++i) {
      auto v_idx = static_cast<std::size_t>(col[i]);
      double nd = d_u + wgt[i];
      if (nd < dist[v_idx]) { dist[v_idx] = nd; pq.emplace(nd, col[i]); }
    }
  }

  LabelMap<double> out;
  for (NodeId v = 0; v < N; ++v) {
    const double d = dist[static_cast<std::size_t>(v)];
    if (std::isfinite(d)) out.emplace(g.label_of(v), round_to_precision(d, precision));
  }
  return out;
}

} // namespace bmssp_core
