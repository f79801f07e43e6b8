//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! View frustum defined by 6 planes with inward normals.
/*!
 Extracted from a view-projection matrix with the Gribb & Hartmann method,
 for a [-1, 1] clip-space depth range.
 */
struct Frustum {
  //! Plane equation in the form ax + by + cz + d = 0. Points with a positive
  //! distance are on the inner side.
  struct Plane {
    glm::vec3 normal { 0.0F, 0.0F, 1.0F };
    float d = 0.0F;
  };

  // Order: left, right, bottom, top, near, far
  static constexpr int kPlaneCount = 6;
  std::array<Plane, kPlaneCount> planes {};

  ARGN_SCN_NDAPI static auto FromViewProjection(const glm::mat4& view_proj)
    -> Frustum;

  ARGN_SCN_NDAPI auto ContainsPoint(const glm::vec3& point) const -> bool;

  //! Test intersection with an axis-aligned bounding box (world space).
  ARGN_SCN_NDAPI auto IntersectsAabb(
    const glm::vec3& bmin, const glm::vec3& bmax) const -> bool;
};

} // namespace argon::scene
