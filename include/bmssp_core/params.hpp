/* Tuning constants of the BMSSP recursion, derived from graph size. */
#pragma once

#include <cstdint>

namespace bmssp_core {

// k: Bellman-Ford rounds in find_pivots and base-case pop budget.
// t: recursion branching exponent; level L may complete k * 2^(L*t) nodes.
// levels: recursion depth l; 0 means the top-level call is the base case.
// counter: per-relaxation tie-break increment.
// edge_adjustment: per-edge identity increment (edge_identity = index * edge_adjustment).
// Decimal digits beyond what a double resolves. Precision above this is
// treated as this many digits for tie-break scaling and leaves reported
// distances unrounded.
inline constexpr int kMaxPrecisionDigits = 17;

struct BmsspParams {
  std::int32_t k {1};
  std::int32_t t {1};
  std::int32_t levels {0};
  double counter {0.0};
  double edge_adjustment {0.0};
};

// Deterministic function of node count n, edge count m and decimal precision:
//   k = max(1, floor(cbrt(log2 n))), t = max(1, floor(cbrt(log2(n)^2))),
//   l = ceil(log2(n) / t), counter = 1 / (10^(p+1) (2n+1)),
//   edge_adjustment = counter / (2m+1).
// n <= 1 yields k = t = 1, l = 0. p is capped at kMaxPrecisionDigits.
// Throws ValueError for negative inputs.
[[nodiscard]] BmsspParams derive_params(std::int64_t n, std::int64_t m, int precision);

// Number of distinct completions a call at `level` may perform before it
// returns a partial result: k * 2^(level * t), saturated to int64 max.
[[nodiscard]] std::int64_t work_limit(const BmsspParams& p, std::int32_t level) noexcept;

} // namespace bmssp_core
