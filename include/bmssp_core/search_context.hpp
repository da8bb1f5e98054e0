/* Per-invocation mutable search state shared by every BMSSP recursion level. */
#pragma once

#include <cstdint>
#include <vector>

#include "bmssp_core/adjacency.hpp"
#include "bmssp_core/params.hpp"
#include "bmssp_core/types.hpp"

namespace bmssp_core {

// SearchContext owns the scratch arrays of one top-level call and is passed by
// reference into find_pivots/base_case/bmssp_recursive. Deeper calls observe
// and improve distances found by shallower and sibling calls, so a context
// must never be shared between threads.
//
// dist  : perturbed distance (true cost + counter per hop + edge identities)
// cdist : true sum of weights along the path that produced dist
// pred  : predecessor on that path, kNoNode for sources and unreached nodes
// complete : 1 once dist is proven final
struct SearchContext {
  SearchContext(const AdjacencySnapshot& adjacency, const BmsspParams& parameters);

  const AdjacencySnapshot* adj {nullptr};
  BmsspParams params {};
  std::vector<double> dist;
  std::vector<double> cdist;
  std::vector<NodeId> pred;
  std::vector<std::uint8_t> complete;

  // Seed a source at distance 0. Sources are final but are only marked
  // complete once the recursion has expanded them.
  void add_source(NodeId s);

  // Perturbed distance offered to targets[entry] by the CSR entry out of u.
  [[nodiscard]] double candidate(NodeId u, std::int32_t entry) const noexcept;

  // Relax CSR entry `entry` out of u. Writes dist/cdist/pred only when the
  // candidate is < the current dist (dist never increases). Returns true when
  // the candidate is <= the current dist, whether or not it wrote.
  bool relax(NodeId u, std::int32_t entry) noexcept;

  [[nodiscard]] bool is_complete(NodeId v) const noexcept {
    return complete[static_cast<std::size_t>(v)] != 0;
  }
  void mark_complete(NodeId v) noexcept { complete[static_cast<std::size_t>(v)] = 1; }
};

} // namespace bmssp_core
