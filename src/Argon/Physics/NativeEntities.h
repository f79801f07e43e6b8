//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <optional>
#include <variant>
#include <vector>

#include <glm/vec3.hpp>

#include <Argon/Physics/Shape.h>
#include <Argon/Physics/Types.h>

namespace physx {
class PxJoint;
class PxRigidDynamic;
class PxShape;
} // namespace physx

namespace argon::physics {

//! Density used for colliders that do not specify one.
constexpr float kDefaultDensity = 1.0F;

//! A rigid body as known by the simulation.
/*!
 The description given to PhysicsWorld::InsertBody(). Once inserted, the world
 keeps it in sync with its PhysX actor: pose and velocities are refreshed after
 each step.
*/
struct NativeBody {
  BodyType body_type { BodyType::kDynamic };
  Isometry position {};
  glm::vec3 lin_vel { 0.0F };
  glm::vec3 ang_vel { 0.0F };
  //! Mass added on top of the mass derived from the collider densities.
  float additional_mass { 0.0F };
  float lin_damping { 0.0F };
  float ang_damping { 0.0F };
  //! Rotation locks around the world X, Y and Z axes.
  std::array<bool, 3> rotation_locked { false, false, false };
  bool translation_locked { false };

  //! Colliders attached to this body. Maintained by the PhysicsWorld.
  std::vector<ColliderHandle> colliders {};
  //! Every body is a PhysX dynamic actor, kinematic unless its type is
  //! dynamic. Owned by the PhysicsWorld.
  physx::PxRigidDynamic* px_actor { nullptr };
};

struct NativeCollider {
  Shape shape { shape::Ball {} };
  //! Pose of the collider relative to its parent body.
  Isometry position_wrt_parent {};
  BodyHandle parent {};
  float friction { 0.5F };
  std::optional<float> density {};
  float restitution { 0.0F };
  InteractionGroups collision_groups {};
  InteractionGroups solver_groups {};
  bool is_sensor { false };
  //! Exclusive shape of the parent actor. Owned by the PhysicsWorld.
  physx::PxShape* px_shape { nullptr };

  [[nodiscard]] auto EffectiveDensity() const noexcept -> float
  {
    return density.value_or(kDefaultDensity);
  }
};

//! Joint parameters. Anchors and axes are expressed in the local space of the
//! corresponding body.
namespace joint {

  struct Ball {
    glm::vec3 local_anchor1 { 0.0F };
    glm::vec3 local_anchor2 { 0.0F };
  };

  struct Fixed {
    Isometry local_frame1 {};
    Isometry local_frame2 {};
  };

  struct Prismatic {
    glm::vec3 local_anchor1 { 0.0F };
    glm::vec3 local_axis1 { 1.0F, 0.0F, 0.0F };
    glm::vec3 local_anchor2 { 0.0F };
    glm::vec3 local_axis2 { 1.0F, 0.0F, 0.0F };
  };

  struct Revolute {
    glm::vec3 local_anchor1 { 0.0F };
    glm::vec3 local_axis1 { 0.0F, 1.0F, 0.0F };
    glm::vec3 local_anchor2 { 0.0F };
    glm::vec3 local_axis2 { 0.0F, 1.0F, 0.0F };
  };

} // namespace joint

using JointParams = std::variant<joint::Ball, joint::Fixed, joint::Prismatic,
  joint::Revolute>;

struct NativeJoint {
  BodyHandle body1 {};
  BodyHandle body2 {};
  JointParams params { joint::Ball {} };
  //! Owned by the PhysicsWorld.
  physx::PxJoint* px_joint { nullptr };
};

} // namespace argon::physics
