/* Bounded min-priority frontier with batch prepend, keyed by perturbed distance. */
#pragma once

#include <optional>
#include <queue>
#include <span>
#include <utility>
#include <vector>

#include "bmssp_core/search_context.hpp"
#include "bmssp_core/types.hpp"

namespace bmssp_core {

// Frontier holds (key, node) entries for one recursion level. Entries are
// lazily validated against the shared SearchContext: entries of completed
// nodes are dropped and entries whose key is above the node's current dist
// are re-keyed to that dist.
class Frontier {
public:
  explicit Frontier(const SearchContext& ctx) : ctx_(&ctx) {}

  void insert(double key, NodeId v) { heap_.emplace(key, v); }

  // Insert entries collected during one relaxation pass. They must only
  // become visible after the pass, so callers buffer them and prepend here.
  void batch_prepend(std::span<const std::pair<double, NodeId>> items);

  // Remove and return the live entry with the smallest key.
  [[nodiscard]] std::optional<std::pair<double, NodeId>> pop_min();

  // Smallest live key without removing it.
  [[nodiscard]] std::optional<double> peek_min_key();

private:
  using QItem = std::pair<double, NodeId>;
  struct Greater {
    bool operator()(const QItem& a, const QItem& b) const noexcept {
      return a.first > b.first || (a.first == b.first && a.second > b.second);
    }
  };

  // Drop dead entries at the top until a live one (or nothing) remains.
  void settle_top();

  const SearchContext* ctx_ {nullptr};
  std::priority_queue<QItem, std::vector<QItem>, Greater> heap_;
};

} // namespace bmssp_core
