#include "bmssp_core/search_context.hpp"

#include <limits>

namespace bmssp_core {

SearchContext::SearchContext(const AdjacencySnapshot& adjacency, const BmsspParams& parameters)
    : adj(&adjacency),
      params(parameters),
      dist(static_cast<std::size_t>(adjacency.num_nodes()), std::numeric_limits<double>::infinity()),
      cdist(static_cast<std::size_t>(adjacency.num_nodes()), std::numeric_limits<double>::infinity()),
      pred(static_cast<std::size_t>(adjacency.num_nodes()), kNoNode),
      complete(static_cast<std::size_t>(adjacency.num_nodes()), 0) {}

void SearchContext::add_source(NodeId s) {
  const auto si = static_cast<std::size_t>(s);
  dist[si] = 0.0;
  cdist[si] = 0.0;
  pred[si] = kNoNode;
}

double SearchContext::candidate(NodeId u, std::int32_t entry) const noexcept {
  const auto e = static_cast<std::size_t>(entry);
  return dist[static_cast<std::size_t>(u)] + adj->weights_view()[e] +
         params.counter + adj->edge_identity_view()[e];
}

bool SearchContext::relax(NodeId u, std::int32_t entry) noexcept {
  const auto e = static_cast<std::size_t>(entry);
  const auto vi = static_cast<std::size_t>(adj->targets_view()[e]);
  const double cand = candidate(u, entry);
  if (cand < dist[vi]) {
    dist[vi] = cand;
    cdist[vi] = cdist[static_cast<std::size_t>(u)] + adj->weights_view()[e];
    pred[vi] = u;
    return true;
  }
  // Equal candidate: the perturbation was absorbed by rounding. Keep the
  // existing predecessor so zero-weight cycles cannot close the pred chain.
  return cand == dist[vi];
}

} // namespace bmssp_core
