//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <Argon/Base/Handle.h>
#include <Argon/Physics/api_export.h>

namespace argon::physics {

struct NativeBody;
struct NativeCollider;
struct NativeJoint;

//! Opaque identifiers of the entities owned by a PhysicsWorld.
using BodyHandle = Handle<NativeBody>;
using ColliderHandle = Handle<NativeCollider>;
using JointHandle = Handle<NativeJoint>;

enum class BodyType : uint8_t {
  kDynamic, //!< Moved by gravity, velocities and joints.
  kStatic, //!< Never moves.
  kKinematicPositionBased, //!< Moved only by setting its position.
  kKinematicVelocityBased, //!< Moved by its velocities, ignores gravity.
};

constexpr auto to_string(const BodyType value) noexcept -> const char*
{
  switch (value) {
  case BodyType::kDynamic:
    return "Dynamic";
  case BodyType::kStatic:
    return "Static";
  case BodyType::kKinematicPositionBased:
    return "KinematicPositionBased";
  case BodyType::kKinematicVelocityBased:
    return "KinematicVelocityBased";
  }
  return "__NotSupported__";
}

//! Pairwise filter: two groups interact iff each one's memberships intersect
//! the other one's filter.
struct InteractionGroups {
  uint32_t memberships { 0xFFFF'FFFF };
  uint32_t filter { 0xFFFF'FFFF };

  [[nodiscard]] constexpr auto Test(const InteractionGroups& other) const noexcept
    -> bool
  {
    return (memberships & other.filter) != 0
      && (other.memberships & filter) != 0;
  }

  constexpr auto operator==(const InteractionGroups&) const noexcept
    -> bool = default;
};

//! Identifies the part of a shape that was hit by a ray.
/*!
 Ray hits on triangles, triangle meshes and height fields report the index of
 the triangle that was hit, from either side. Other shapes report an unknown
 feature.
*/
struct FeatureId {
  enum class Kind : uint8_t { kVertex, kEdge, kFace, kUnknown };

  Kind kind { Kind::kUnknown };
  uint32_t index { 0 };

  static constexpr auto Vertex(const uint32_t i) noexcept -> FeatureId
  {
    return { Kind::kVertex, i };
  }
  static constexpr auto Edge(const uint32_t i) noexcept -> FeatureId
  {
    return { Kind::kEdge, i };
  }
  static constexpr auto Face(const uint32_t i) noexcept -> FeatureId
  {
    return { Kind::kFace, i };
  }
  static constexpr auto Unknown() noexcept -> FeatureId { return {}; }

  constexpr auto operator==(const FeatureId&) const noexcept -> bool = default;
};

ARGN_PHY_API auto to_string(const FeatureId& value) -> std::string;

//! A rigid transform: a rotation followed by a translation.
struct Isometry {
  glm::vec3 translation { 0.0F };
  glm::quat rotation { 1.0F, 0.0F, 0.0F, 0.0F };

  [[nodiscard]] auto TransformPoint(const glm::vec3& p) const -> glm::vec3
  {
    return rotation * p + translation;
  }

  [[nodiscard]] auto TransformVector(const glm::vec3& v) const -> glm::vec3
  {
    return rotation * v;
  }

  [[nodiscard]] auto Inverse() const -> Isometry
  {
    const auto inv_rotation = glm::inverse(rotation);
    return { inv_rotation * -translation, inv_rotation };
  }

  [[nodiscard]] ARGN_PHY_API auto ToMatrix() const -> glm::mat4;

  auto operator*(const Isometry& rhs) const -> Isometry
  {
    return { TransformPoint(rhs.translation), rotation * rhs.rotation };
  }
};

struct Ray {
  glm::vec3 origin { 0.0F };
  glm::vec3 direction { 0.0F };

  [[nodiscard]] auto PointAt(const float toi) const -> glm::vec3
  {
    return origin + direction * toi;
  }
};

//! A ray hit against a collider, in world space.
struct RayHit {
  float toi { 0.0F }; //!< Distance along the ray, in units of its direction.
  glm::vec3 normal { 0.0F };
  FeatureId feature {};
};

//! An RGBA color, 8 bits per channel.
struct Color {
  uint8_t r { 0 };
  uint8_t g { 0 };
  uint8_t b { 0 };
  uint8_t a { 255 };

  static constexpr auto Opaque(const uint8_t r, const uint8_t g, const uint8_t b)
    -> Color
  {
    return { r, g, b, 255 };
  }

  constexpr auto operator==(const Color&) const noexcept -> bool = default;
};

} // namespace argon::physics
