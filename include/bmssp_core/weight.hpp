/* Weight specification (attribute key or callback) and its resolution. */
#pragma once

#include <functional>
#include <optional>
#include <span>
#include <string>
#include <variant>

#include "bmssp_core/labeled_digraph.hpp"
#include "bmssp_core/types.hpp"

namespace bmssp_core {

// User callback: (u, v, edge attributes) -> weight, or std::nullopt to hide the edge.
using WeightCallback = std::function<std::optional<Weight>(
    const NodeLabel& u, const NodeLabel& v, const EdgeAttrs& attrs)>;

// Either the name of a numeric edge attribute (missing -> 1) or a callback.
using WeightSpec = std::variant<std::string, WeightCallback>;

// Resolved per-pair weight. `parallel` lists every edge u->v (one entry unless
// the graph is a multigraph); the result is the minimum over them, or
// std::nullopt when every edge of the pair is hidden.
using WeightFunction = std::function<std::optional<Weight>(
    NodeId u, NodeId v, std::span<const EdgeId> parallel)>;

// Resolve a WeightSpec against a graph once, before the search starts.
// The returned function throws ValueError for negative or NaN weights and
// TypeError for non-numeric attribute values.
[[nodiscard]] WeightFunction resolve_weight(const LabeledDiGraph& g, const WeightSpec& spec);

} // namespace bmssp_core
