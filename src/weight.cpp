/*
  resolve_weight — turn an attribute key or a callback into a numeric
  per-pair weight function.

  Attribute keys default to 1 when the attribute is absent. For parallel
  edges the minimum resolved weight wins; callbacks may hide an edge by
  returning std::nullopt.
*/
#include "bmssp_core/weight.hpp"

#include <cmath>
#include <string>

#include "bmssp_core/error.hpp"

namespace bmssp_core {

namespace {
Weight checked(Weight w, const LabeledDiGraph& g, NodeId u, NodeId v) {
  if (std::isnan(w) || w < 0.0) {
    throw ValueError("Negative or NaN weight " + std::to_string(w) + " on edge (" +
                     to_string(g.label_of(u)) + ", " + to_string(g.label_of(v)) +
                     "); BMSSP requires non-negative weights");
  }
  return w;
}

Weight attribute_weight(const EdgeAttrs& attrs, const std::string& key) {
  auto it = attrs.find(key);
  if (it == attrs.end()) return 1.0;
  if (const auto* d = std::get_if<double>(&it->second)) return *d;
  throw TypeError("edge attribute '" + key + "' must be numeric");
}
} // namespace

WeightFunction resolve_weight(const LabeledDiGraph& g, const WeightSpec& spec) {
  if (const auto* key = std::get_if<std::string>(&spec)) {
    return [&g, key = *key](NodeId u, NodeId v, std::span<const EdgeId> parallel)
               -> std::optional<Weight> {
      std::optional<Weight> best;
      for (auto e : parallel) {
        Weight w = checked(attribute_weight(g.edge_attrs(e), key), g, u, v);
        if (!best || w < *best) best = w;
      }
      return best;
    };
  }
  const auto& callback = std::get<WeightCallback>(spec);
  if (!callback) {
    throw TypeError("weight callback must not be empty");
  }
  return [&g, callback](NodeId u, NodeId v, std::span<const EdgeId> parallel)
             -> std::optional<Weight> {
    std::optional<Weight> best;
    const auto& lu = g.label_of(u);
    const auto& lv = g.label_of(v);
    for (auto e : parallel) {
      auto w = callback(lu, lv, g.edge_attrs(e));
      if (!w) continue;  // hidden edge
      Weight cw = checked(*w, g, u, v);
      if (!best || cw < *best) best = cw;
    }
    return best;
  };
}

} // namespace bmssp_core
