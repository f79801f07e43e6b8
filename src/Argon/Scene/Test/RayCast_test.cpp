//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <Argon/Testing/GTest.h>

#include <Argon/Scene/RayCast.h>

using argon::scene::FixedQueryResults;
using argon::scene::Intersection;
using argon::scene::NodeHandle;
using argon::scene::SortIntersections;
using argon::scene::VectorQueryResults;

namespace {

constexpr float kNaN = std::numeric_limits<float>::quiet_NaN();

auto Hit(const uint32_t node, const float toi) -> Intersection
{
  return Intersection { .collider = NodeHandle(node, 1), .toi = toi };
}

NOLINT_TEST(SortIntersectionsTest, NaNGoesLastAndOrderIsStable)
{
  // Arrange
  std::vector hits { Hit(0, 3.0F), Hit(1, kNaN), Hit(2, 1.0F), Hit(3, 3.0F),
    Hit(4, kNaN), Hit(5, 2.0F) };

  // Act
  SortIntersections(hits);

  // Assert
  std::vector<uint32_t> order;
  for (const auto& hit : hits) {
    order.push_back(hit.collider.Index());
  }
  EXPECT_EQ(order, (std::vector<uint32_t> { 2, 5, 0, 3, 1, 4 }));
  EXPECT_TRUE(std::isnan(hits[4].toi));
  EXPECT_TRUE(std::isnan(hits[5].toi));
}

NOLINT_TEST(SortIntersectionsTest, InfinityBeforeNaN)
{
  std::vector hits { Hit(0, kNaN), Hit(1, std::numeric_limits<float>::infinity()),
    Hit(2, 0.0F) };

  SortIntersections(hits);

  EXPECT_EQ(hits[0].collider.Index(), 2U);
  EXPECT_EQ(hits[1].collider.Index(), 1U);
  EXPECT_EQ(hits[2].collider.Index(), 0U);
}

NOLINT_TEST(QueryResultsTest, FixedStorageRejectsPastCapacity)
{
  FixedQueryResults<2> results;

  EXPECT_TRUE(results.Push(Hit(0, 2.0F)));
  EXPECT_TRUE(results.Push(Hit(1, 1.0F)));
  EXPECT_FALSE(results.Push(Hit(2, 0.5F)));

  EXPECT_EQ(results.Size(), 2U);
  results.Sort();
  EXPECT_EQ(results[0].collider.Index(), 1U);
  EXPECT_EQ(results.Results().size(), 2U);

  results.Clear();
  EXPECT_EQ(results.Size(), 0U);
  EXPECT_TRUE(results.Push(Hit(3, 0.0F)));
}

NOLINT_TEST(QueryResultsTest, VectorStorageAcceptsEverything)
{
  VectorQueryResults results;

  for (uint32_t i = 0; i < 100; ++i) {
    EXPECT_TRUE(results.Push(Hit(i, static_cast<float>(100 - i))));
  }
  results.Sort();

  EXPECT_EQ(results.Size(), 100U);
  EXPECT_EQ(results[0].collider.Index(), 99U);
}

} // namespace
