//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <foundation/PxQuat.h>
#include <foundation/PxTransform.h>
#include <foundation/PxVec3.h>

#include <glm/gtc/quaternion.hpp>
#include <glm/vec3.hpp>

#include <Argon/Physics/Types.h>

namespace argon::physics::detail {

inline auto ToPx(const glm::vec3& v) -> physx::PxVec3
{
  return { v.x, v.y, v.z };
}

inline auto FromPx(const physx::PxVec3& v) -> glm::vec3
{
  return { v.x, v.y, v.z };
}

inline auto ToPx(const glm::quat& q) -> physx::PxQuat
{
  const auto n = glm::normalize(q);
  return { n.x, n.y, n.z, n.w };
}

inline auto FromPx(const physx::PxQuat& q) -> glm::quat
{
  return { q.w, q.x, q.y, q.z };
}

inline auto ToPx(const Isometry& isometry) -> physx::PxTransform
{
  return { ToPx(isometry.translation), ToPx(isometry.rotation) };
}

inline auto FromPx(const physx::PxTransform& transform) -> Isometry
{
  return { .translation = FromPx(transform.p),
    .rotation = FromPx(transform.q) };
}

} // namespace argon::physics::detail
