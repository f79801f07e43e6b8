//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include <Argon/Physics/Types.h>
#include <Argon/Physics/api_export.h>

namespace argon::physics {

//! Collision shapes understood by the simulation, in the local space of the
//! collider. Axis-symmetric shapes are aligned with the local Y axis.
namespace shape {

  struct Ball {
    float radius { 0.5F };
  };

  struct Cuboid {
    glm::vec3 half_extents { 0.5F };
  };

  struct Capsule {
    glm::vec3 begin { 0.0F, -0.5F, 0.0F };
    glm::vec3 end { 0.0F, 0.5F, 0.0F };
    float radius { 0.5F };
  };

  struct Cylinder {
    float half_height { 0.5F };
    float radius { 0.5F };
  };

  //! A cylinder with rounded edges: the Minkowski sum of a cylinder and a ball
  //! of radius `border_radius`.
  struct RoundCylinder {
    float half_height { 0.5F };
    float radius { 0.5F };
    float border_radius { 0.1F };
  };

  //! Apex at `+half_height`, base disk of `radius` at `-half_height`.
  struct Cone {
    float half_height { 0.5F };
    float radius { 0.5F };
  };

  struct Segment {
    glm::vec3 begin { 0.0F };
    glm::vec3 end { 0.0F, 1.0F, 0.0F };
  };

  struct Triangle {
    glm::vec3 a { 0.0F };
    glm::vec3 b { 1.0F, 0.0F, 0.0F };
    glm::vec3 c { 0.0F, 0.0F, 1.0F };
  };

  struct TriMesh {
    std::vector<glm::vec3> vertices;
    std::vector<std::array<uint32_t, 3>> indices;
  };

  //! A grid of `rows` x `columns` heights, row-major, centered on the origin.
  //! It spans `scale.x` along X (columns) and `scale.z` along Z (rows), and
  //! heights are multiplied by `scale.y`.
  struct HeightField {
    uint32_t rows { 0 };
    uint32_t columns { 0 };
    std::vector<float> heights;
    glm::vec3 scale { 1.0F };
  };

} // namespace shape

using Shape = std::variant<shape::Ball, shape::Cuboid, shape::Capsule,
  shape::Cylinder, shape::RoundCylinder, shape::Cone, shape::Segment,
  shape::Triangle, shape::TriMesh, shape::HeightField>;

//! An axis aligned bounding box.
struct Aabb {
  glm::vec3 min { 0.0F };
  glm::vec3 max { 0.0F };
};

//! Checks that the shape dimensions are usable by the simulation: strictly
//! positive radii and extents, consistent mesh indices, a full height grid.
ARGN_PHY_NDAPI auto IsValid(const Shape& shape) -> bool;

//! Triangulates a height field in its local space, two triangles per cell,
//! ordered by row, then column.
ARGN_PHY_NDAPI auto Triangulate(const shape::HeightField& field)
  -> std::vector<shape::Triangle>;

} // namespace argon::physics
