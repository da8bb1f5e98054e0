/*
  Bounded multi-source shortest paths — recursive driver and its helpers.

  Structure per call (level L, bound B, sources S):
    - L == 0: base_case, a Dijkstra from the single source that stops after
      k pops and reports the next key as the tightened bound.
    - L > 0 : find_pivots shrinks S to pivots P; a Frontier seeded with P is
      drained one node at a time. Each popped x is solved by a level L-1 call
      bounded by the next frontier key; the completed nodes' out-edges are
      relaxed and routed back into the frontier (keys in [B_curr, B)) or held
      for batch prepend (keys in [B_new, B_curr)).
  All calls share one SearchContext; only single-threaded use is supported.
*/
#include "bmssp_core/bounded_search.hpp"

#include <algorithm>
#include <limits>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "bmssp_core/error.hpp"
#include "bmssp_core/frontier.hpp"

namespace bmssp_core {

namespace {
// Depth-first walk over the tight-edge forest from root; stops as soon as
// `needed` nodes have been seen.
bool subtree_at_least(NodeId root,
                      const std::unordered_map<NodeId, std::vector<NodeId>>& children,
                      std::int32_t needed) {
  std::vector<NodeId> stack{root};
  std::unordered_set<NodeId> seen{root};
  std::int32_t cnt = 0;
  while (!stack.empty()) {
    NodeId u = stack.back();
    stack.pop_back();
    if (++cnt >= needed) return true;
    auto it = children.find(u);
    if (it == children.end()) continue;
    for (auto v : it->second) {
      if (seen.insert(v).second) stack.push_back(v);
    }
  }
  return false;
}
} // namespace

PivotResult find_pivots(SearchContext& ctx, double bound, std::span<const NodeId> sources) {
  const auto row = ctx.adj->row_offsets_view();
  const auto col = ctx.adj->targets_view();
  const std::int32_t k = ctx.params.k;

  PivotResult out;
  out.explored.assign(sources.begin(), sources.end());
  std::unordered_set<NodeId> in_w(sources.begin(), sources.end());
  const std::size_t width_limit = static_cast<std::size_t>(k) * sources.size();

  std::vector<NodeId> layer;
  for (auto s : sources) {
    if (ctx.dist[static_cast<std::size_t>(s)] < bound) layer.push_back(s);
  }
  std::vector<NodeId> next;
  std::unordered_set<NodeId> in_next;
  for (std::int32_t round = 0; round < k && !layer.empty(); ++round) {
    next.clear();
    in_next.clear();
    for (auto u : layer) {
      auto start = row[static_cast<std::size_t>(u)];
      auto end   = row[static_cast<std::size_t>(u) + 1];
      for (auto i = start; i < end; ++i) {
        const double cand = ctx.candidate(u, i);
        if (!ctx.relax(u, i) || cand >= bound) continue;
        NodeId v = col[static_cast<std::size_t>(i)];
        if (in_next.insert(v).second) next.push_back(v);
        if (in_w.insert(v).second) out.explored.push_back(v);
      }
    }
    if (out.explored.size() > width_limit) {
      // Too wide to benefit from pivot reduction: every source is a pivot.
      out.pivots.assign(sources.begin(), sources.end());
      return out;
    }
    layer.swap(next);
  }

  // Tight-edge forest over W: parent -> children via current predecessors.
  std::unordered_map<NodeId, std::vector<NodeId>> children;
  std::unordered_set<NodeId> has_parent;
  for (auto v : out.explored) {
    NodeId u = ctx.pred[static_cast<std::size_t>(v)];
    if (u == kNoNode || u == v || in_w.find(u) == in_w.end()) continue;
    children[u].push_back(v);
    has_parent.insert(v);
  }
  for (auto s : sources) {
    if (has_parent.find(s) != has_parent.end()) continue;
    if (subtree_at_least(s, children, k)) out.pivots.push_back(s);
  }
  return out;
}

BoundResult base_case(SearchContext& ctx, double bound, NodeId x) {
  const auto row = ctx.adj->row_offsets_view();
  const auto col = ctx.adj->targets_view();
  const auto k = static_cast<std::size_t>(ctx.params.k);

  using QItem = std::pair<double, NodeId>;
  auto cmp = [](const QItem& a, const QItem& b) { return a.first > b.first; };
  std::priority_queue<QItem, std::vector<QItem>, decltype(cmp)> pq(cmp);
  auto live = [&ctx](const QItem& it) {
    return !ctx.is_complete(it.second) && it.first <= ctx.dist[static_cast<std::size_t>(it.second)];
  };

  BoundResult res;
  ctx.mark_complete(x);
  res.completed.push_back(x);
  NodeId u = x;
  while (true) {
    auto start = row[static_cast<std::size_t>(u)];
    auto end   = row[static_cast<std::size_t>(u) + 1];
    for (auto i = start; i < end; ++i) {
      NodeId v = col[static_cast<std::size_t>(i)];
      if (ctx.candidate(u, i) >= bound) continue;  // out-of-bound pruning
      if (ctx.relax(u, i) && !ctx.is_complete(v)) {
        pq.emplace(ctx.dist[static_cast<std::size_t>(v)], v);
      }
    }
    if (res.completed.size() >= k) break;
    while (!pq.empty() && !live(pq.top())) pq.pop();
    if (pq.empty()) break;
    u = pq.top().second;
    pq.pop();
    ctx.mark_complete(u);
    res.completed.push_back(u);
  }
  while (!pq.empty() && !live(pq.top())) pq.pop();
  res.bound = pq.empty() ? bound : std::min(bound, pq.top().first);
  return res;
}

BoundResult bmssp_recursive(SearchContext& ctx, std::int32_t level, double bound,
                            std::span<const NodeId> sources,
                            std::optional<NodeId> target) {
  if (level == 0) {
    if (sources.size() != 1) {
      throw RuntimeError("base case expects exactly one source, got " +
                         std::to_string(sources.size()));
    }
    return base_case(ctx, bound, sources.front());
  }

  const auto row = ctx.adj->row_offsets_view();
  const auto col = ctx.adj->targets_view();

  auto [pivots, explored] = find_pivots(ctx, bound, sources);

  Frontier frontier(ctx);
  double b_comp = bound;
  for (auto p : pivots) {
    const double d = ctx.dist[static_cast<std::size_t>(p)];
    frontier.insert(d, p);
    b_comp = std::min(b_comp, d);
  }

  BoundResult res;
  std::unordered_set<NodeId> in_u;
  auto add_completed = [&](NodeId v) {
    if (in_u.insert(v).second) res.completed.push_back(v);
  };
  const std::int64_t limit = work_limit(ctx.params, level);
  bool exhausted = true;
  std::vector<std::pair<double, NodeId>> prepend;
  while (auto top = frontier.pop_min()) {
    const NodeId x = top->second;
    const double b_curr = std::min(bound, frontier.peek_min_key().value_or(bound));
    const NodeId sub_sources[1] = {x};
    auto sub = bmssp_recursive(ctx, level - 1, b_curr, sub_sources, target);
    // Latest child bound, not a running minimum: later children start above it.
    b_comp = sub.bound;

    prepend.clear();
    for (auto u : sub.completed) {
      add_completed(u);
      auto start = row[static_cast<std::size_t>(u)];
      auto end   = row[static_cast<std::size_t>(u) + 1];
      for (auto i = start; i < end; ++i) {
        NodeId v = col[static_cast<std::size_t>(i)];
        if (!ctx.relax(u, i) || ctx.is_complete(v)) continue;
        const double d = ctx.dist[static_cast<std::size_t>(v)];
        if (d >= b_curr && d < bound) {
          frontier.insert(d, v);
        } else if (d >= sub.bound && d < b_curr) {
          prepend.emplace_back(d, v);
        }
      }
    }
    frontier.batch_prepend(prepend);

    if (target && ctx.is_complete(*target)) { exhausted = false; break; }
    if (static_cast<std::int64_t>(res.completed.size()) >= limit) { exhausted = false; break; }
  }

  b_comp = exhausted ? bound : std::min(b_comp, bound);
  // Sources entered with final distances; explored nodes under the final
  // bound are complete even if never popped.
  for (auto s : sources) {
    ctx.mark_complete(s);
    add_completed(s);
  }
  for (auto w : explored) {
    if (ctx.dist[static_cast<std::size_t>(w)] < b_comp) {
      ctx.mark_complete(w);
      add_completed(w);
    }
  }
  res.bound = b_comp;
  return res;
}

} // namespace bmssp_core
