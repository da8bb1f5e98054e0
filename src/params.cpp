/*
  derive_params — recursion constants for BMSSP.

  The two perturbation scales are chosen so that their total contribution to
  any simple path stays below half a unit of the requested decimal precision:
  at most n-1 relaxations add `counter` each (< 10^-(p+1) / 2), and the edge
  identities along the path add less than counter / 2 in total.
*/
#include "bmssp_core/params.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

#include "bmssp_core/error.hpp"

namespace bmssp_core {

BmsspParams derive_params(std::int64_t n, std::int64_t m, int precision) {
  if (n < 0 || m < 0) {
    throw ValueError("node and edge counts must be >= 0");
  }
  if (precision < 0) {
    throw ValueError("precision must be >= 0, got " + std::to_string(precision));
  }
  BmsspParams p;
  if (n > 1) {
    const double lg = std::log2(static_cast<double>(n));
    p.k = std::max<std::int32_t>(1, static_cast<std::int32_t>(std::floor(std::cbrt(lg))));
    p.t = std::max<std::int32_t>(1, static_cast<std::int32_t>(std::floor(std::cbrt(lg * lg))));
    p.levels = static_cast<std::int32_t>(std::ceil(lg / static_cast<double>(p.t)));
  }
  const int digits = std::min(precision, kMaxPrecisionDigits);
  const double scale = std::pow(10.0, static_cast<double>(digits) + 1.0);
  p.counter = 1.0 / (scale * (2.0 * static_cast<double>(n) + 1.0));
  p.edge_adjustment = p.counter / (2.0 * static_cast<double>(m) + 1.0);
  return p;
}

std::int64_t work_limit(const BmsspParams& p, std::int32_t level) noexcept {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  const std::int64_t shift = static_cast<std::int64_t>(level) * p.t;
  if (shift >= 62) return kMax;
  const std::int64_t base = std::int64_t{1} << shift;
  if (base > kMax / std::max<std::int64_t>(1, p.k)) return kMax;
  return base * p.k;
}

} // namespace bmssp_core
