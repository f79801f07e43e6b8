//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <array>
#include <vector>

#include <Argon/Testing/GTest.h>

#include <Argon/Physics/Shape.h>

using argon::physics::IsValid;
using argon::physics::Triangulate;

namespace shape = argon::physics::shape;

namespace {

constexpr float kTolerance = 1e-4F;

//=== Geometry ===------------------------------------------------------------//

NOLINT_TEST(ShapeGeometryTest, TriangulateTwoTrianglesPerCell)
{
  const shape::HeightField field {
    .rows = 3,
    .columns = 4,
    .heights = std::vector<float>(12, 1.0F),
    .scale = { 3.0F, 2.0F, 2.0F },
  };

  const auto triangles = Triangulate(field);

  ASSERT_EQ(triangles.size(), 12U);
  EXPECT_GLM_NEAR(triangles.front().a, glm::vec3(-1.5F, 2.0F, -1.0F), kTolerance);
  EXPECT_GLM_NEAR(triangles.back().c, glm::vec3(1.5F, 2.0F, 1.0F), kTolerance);
}

NOLINT_TEST(ShapeGeometryTest, Validity)
{
  EXPECT_TRUE(IsValid(shape::Cuboid {}));
  EXPECT_FALSE(IsValid(shape::Ball { 0.0F }));
  EXPECT_FALSE(IsValid(shape::Cylinder { .half_height = -1.0F }));
  EXPECT_FALSE(IsValid(shape::TriMesh {}));
  EXPECT_FALSE(IsValid(shape::TriMesh {
    .vertices = { glm::vec3(0.0F) },
    .indices = { { 0, 0, 1 } },
  }));
  EXPECT_FALSE(IsValid(shape::HeightField {
    .rows = 2,
    .columns = 2,
    .heights = { 0.0F },
  }));
}

NOLINT_TEST(ShapeGeometryTest, DegenerateShapesAreInvalid)
{
  EXPECT_FALSE(IsValid(shape::Segment { .end = glm::vec3(0.0F) }));
  EXPECT_FALSE(IsValid(shape::Triangle {
    .a = glm::vec3(0.0F), .b = glm::vec3(1.0F), .c = glm::vec3(2.0F) }));
  EXPECT_TRUE(IsValid(shape::Capsule { .end = glm::vec3(0.0F, -0.5F, 0.0F) }));
}

} // namespace
