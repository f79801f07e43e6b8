//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <glm/geometric.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Physics/Shape.h>

using argon::physics::Shape;

namespace shape = argon::physics::shape;

namespace {

constexpr float kEpsilon = 1e-6F;

} // namespace

auto argon::physics::IsValid(const Shape& shape) -> bool
{
  return std::visit(
    argon::Overloads {
      [](const shape::Ball& s) { return s.radius > 0.0F; },
      [](const shape::Cuboid& s) {
        return s.half_extents.x > 0.0F && s.half_extents.y > 0.0F
          && s.half_extents.z > 0.0F;
      },
      [](const shape::Capsule& s) { return s.radius > 0.0F; },
      [](const shape::Cylinder& s) {
        return s.half_height > 0.0F && s.radius > 0.0F;
      },
      [](const shape::RoundCylinder& s) {
        return s.half_height > 0.0F && s.radius > 0.0F
          && s.border_radius >= 0.0F;
      },
      [](const shape::Cone& s) {
        return s.half_height > 0.0F && s.radius > 0.0F;
      },
      [](const shape::Segment& s) {
        return glm::length(s.end - s.begin) > kEpsilon;
      },
      [](const shape::Triangle& s) {
        return glm::length(glm::cross(s.b - s.a, s.c - s.a)) > kEpsilon;
      },
      [](const shape::TriMesh& s) {
        if (s.indices.empty()) {
          return false;
        }
        return std::ranges::all_of(s.indices, [&](const auto& tri) {
          return std::ranges::all_of(
            tri, [&](const uint32_t i) { return i < s.vertices.size(); });
        });
      },
      [](const shape::HeightField& s) {
        return s.rows >= 2 && s.columns >= 2
          && s.heights.size() == static_cast<size_t>(s.rows) * s.columns;
      },
    },
    shape);
}

auto argon::physics::Triangulate(const shape::HeightField& field)
  -> std::vector<shape::Triangle>
{
  std::vector<shape::Triangle> triangles;
  if (field.rows < 2 || field.columns < 2
    || field.heights.size() != static_cast<size_t>(field.rows) * field.columns) {
    return triangles;
  }

  const float dx = field.scale.x / static_cast<float>(field.columns - 1);
  const float dz = field.scale.z / static_cast<float>(field.rows - 1);
  const auto vertex = [&](const uint32_t row, const uint32_t column) {
    return glm::vec3 {
      -0.5F * field.scale.x + static_cast<float>(column) * dx,
      field.heights[static_cast<size_t>(row) * field.columns + column]
        * field.scale.y,
      -0.5F * field.scale.z + static_cast<float>(row) * dz,
    };
  };

  triangles.reserve(
    static_cast<size_t>(field.rows - 1) * (field.columns - 1) * 2);
  for (uint32_t r = 0; r + 1 < field.rows; ++r) {
    for (uint32_t c = 0; c + 1 < field.columns; ++c) {
      const auto v00 = vertex(r, c);
      const auto v01 = vertex(r, c + 1);
      const auto v10 = vertex(r + 1, c);
      const auto v11 = vertex(r + 1, c + 1);
      // counter clockwise seen from +Y
      triangles.push_back({ v00, v10, v01 });
      triangles.push_back({ v01, v10, v11 });
    }
  }
  return triangles;
}
