/* Core type aliases and helper structs.
 *
 * For Python developers:
 * - NodeId/EdgeId: int32 dense indices (matches np.int32)
 * - Weight: double (matches np.float64)
 * - NodeLabel: caller-facing node name, int or str (like a hashable dict key)
 * - std::variant<A, B>: tagged union (like A | B type hint, checked at runtime)
 * - std::optional<T>: nullable value (like T | None)
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>

namespace bmssp_core {

// Node and edge identifiers are signed 32-bit integers assigned in insertion order.
using NodeId = std::int32_t;
using EdgeId = std::int32_t;
using Weight = double;   // Resolved, non-negative edge cost

// Caller-facing node label. Labels are mapped to dense NodeIds by the graph.
using NodeLabel = std::variant<std::int64_t, std::string>;

// Edge/node attribute value: numeric or string (e.g. weight=3, color="red").
using AttrValue = std::variant<double, std::string>;
using AttrMap = std::unordered_map<std::string, AttrValue>;
using EdgeAttrs = AttrMap;
using NodeAttrs = AttrMap;

// Sentinel for "no predecessor" in predecessor arrays.
inline constexpr NodeId kNoNode = -1;

// Human-readable form of a label for error messages.
inline std::string to_string(const NodeLabel& label) {
  if (const auto* i = std::get_if<std::int64_t>(&label)) {
    return std::to_string(*i);
  }
  return std::get<std::string>(label);
}

// Hash for NodeLabel keys (enables use in std::unordered_map).
struct NodeLabelHash {
  std::size_t operator()(const NodeLabel& k) const noexcept {
    std::size_t h = k.index();
    auto combine = [&h](std::size_t v) {
      h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    };
    if (const auto* i = std::get_if<std::int64_t>(&k)) {
      combine(std::hash<std::int64_t>{}(*i));
    } else {
      combine(std::hash<std::string>{}(std::get<std::string>(k)));
    }
    return h;
  }
};

template <typename T>
using LabelMap = std::unordered_map<NodeLabel, T, NodeLabelHash>;

} // namespace bmssp_core
