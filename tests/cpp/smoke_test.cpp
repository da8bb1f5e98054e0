#include <gtest/gtest.h>
#include <span>
#include "bmssp_core/labeled_digraph.hpp"
#include "bmssp_core/shortest_paths.hpp"

using namespace bmssp_core;

TEST(GraphSmoke, ConstructFromArrays) {
  const std::int32_t N = 3;
  std::int32_t src[2] = {0, 1};
  std::int32_t dst[2] = {1, 2};
  double w[2] = {0.5, 1.5};
  auto g = LabeledDiGraph::from_arrays(N,
      std::span<const std::int32_t>(src, 2),
      std::span<const std::int32_t>(dst, 2),
      std::span<const double>(w, 2));
  EXPECT_EQ(g.num_nodes(), N);
  EXPECT_EQ(g.num_edges(), 2);
  auto d = multi_source_bmssp_path_length(g, {NodeLabel{std::int64_t{0}}});
  EXPECT_DOUBLE_EQ(d.at(NodeLabel{std::int64_t{2}}), 2.0);
}
