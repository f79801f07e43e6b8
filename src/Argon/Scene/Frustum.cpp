//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cmath>

#include <glm/geometric.hpp>
#include <glm/vec4.hpp>

#include <Argon/Scene/Frustum.h>

using argon::scene::Frustum;

namespace {

auto MakePlane(const glm::vec4& p) noexcept -> Frustum::Plane
{
  Frustum::Plane plane { glm::vec3(p), p.w };
  const float len = std::sqrt(glm::dot(plane.normal, plane.normal));
  if (len > 0.0F) {
    const float inv = 1.0F / len;
    plane.normal *= inv;
    plane.d *= inv;
  }
  return plane;
}

} // namespace

auto Frustum::FromViewProjection(const glm::mat4& vp) -> Frustum
{
  // GLM stores matrices column-major and uses indexing m[col][row]. Build
  // explicit row vectors first, then form planes as r3 +/- r{0,1,2}.
  const glm::vec4 r0 { vp[0][0], vp[1][0], vp[2][0], vp[3][0] };
  const glm::vec4 r1 { vp[0][1], vp[1][1], vp[2][1], vp[3][1] };
  const glm::vec4 r2 { vp[0][2], vp[1][2], vp[2][2], vp[3][2] };
  const glm::vec4 r3 { vp[0][3], vp[1][3], vp[2][3], vp[3][3] };

  Frustum f {};
  f.planes[0] = MakePlane(r3 + r0); // left
  f.planes[1] = MakePlane(r3 - r0); // right
  f.planes[2] = MakePlane(r3 + r1); // bottom
  f.planes[3] = MakePlane(r3 - r1); // top
  f.planes[4] = MakePlane(r3 + r2); // near
  f.planes[5] = MakePlane(r3 - r2); // far
  return f;
}

auto Frustum::ContainsPoint(const glm::vec3& point) const -> bool
{
  return std::ranges::all_of(planes,
    [&](const Plane& p) { return glm::dot(p.normal, point) + p.d >= 0.0F; });
}

auto Frustum::IntersectsAabb(const glm::vec3& bmin, const glm::vec3& bmax) const
  -> bool
{
  // For each plane, take the box corner furthest along the plane normal. If
  // that corner is outside, the whole box is.
  return std::ranges::all_of(planes, [&](const Plane& p) {
    const glm::vec3 v {
      p.normal.x >= 0.0F ? bmax.x : bmin.x,
      p.normal.y >= 0.0F ? bmax.y : bmin.y,
      p.normal.z >= 0.0F ? bmax.z : bmin.z,
    };
    return glm::dot(p.normal, v) + p.d >= 0.0F;
  });
}
