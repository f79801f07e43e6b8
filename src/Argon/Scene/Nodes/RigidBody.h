//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include <glm/vec3.hpp>

#include <Argon/Base/ChangeSet.h>
#include <Argon/Physics/Types.h>

namespace argon::scene {

//! Fields of a rigid body node waiting to be pushed to the simulation.
enum class RigidBodyChange : uint8_t {
  kBodyType,
  kLinVel,
  kAngVel,
  kMass,
  kLinDamping,
  kAngDamping,
  kRotationLocked,
  kTranslationLocked,

  kCount
};

//! A node backed by a rigid body of the physics world.
/*!
 The native body is created by the graph during its next update. From then
 on, every setter records a change that the graph pushes to the simulation
 once, and the simulation results (position, rotation and velocities) are
 copied back onto the node after each step.

 Editing the local transform of the node directly must be followed by
 MarkTransformModified(), otherwise the next step overwrites it.
*/
class RigidBody {
public:
  RigidBody() = default;

  explicit RigidBody(const physics::BodyType body_type)
    : body_type_(body_type)
  {
  }

  [[nodiscard]] auto GetBodyType() const noexcept { return body_type_; }
  auto SetBodyType(const physics::BodyType body_type) -> void
  {
    body_type_ = body_type;
    changes_.Insert(RigidBodyChange::kBodyType);
  }

  [[nodiscard]] auto GetLinVel() const noexcept -> const glm::vec3&
  {
    return lin_vel_;
  }
  auto SetLinVel(const glm::vec3& lin_vel) -> void
  {
    lin_vel_ = lin_vel;
    changes_.Insert(RigidBodyChange::kLinVel);
  }

  [[nodiscard]] auto GetAngVel() const noexcept -> const glm::vec3&
  {
    return ang_vel_;
  }
  auto SetAngVel(const glm::vec3& ang_vel) -> void
  {
    ang_vel_ = ang_vel;
    changes_.Insert(RigidBodyChange::kAngVel);
  }

  //! Mass added to the mass derived from the collider densities.
  [[nodiscard]] auto GetMass() const noexcept { return mass_; }
  auto SetMass(const float mass) -> void
  {
    mass_ = mass;
    changes_.Insert(RigidBodyChange::kMass);
  }

  [[nodiscard]] auto GetLinDamping() const noexcept { return lin_damping_; }
  auto SetLinDamping(const float damping) -> void
  {
    lin_damping_ = damping;
    changes_.Insert(RigidBodyChange::kLinDamping);
  }

  [[nodiscard]] auto GetAngDamping() const noexcept { return ang_damping_; }
  auto SetAngDamping(const float damping) -> void
  {
    ang_damping_ = damping;
    changes_.Insert(RigidBodyChange::kAngDamping);
  }

  [[nodiscard]] auto IsXRotationLocked() const noexcept
  {
    return x_rotation_locked_;
  }
  [[nodiscard]] auto IsYRotationLocked() const noexcept
  {
    return y_rotation_locked_;
  }
  [[nodiscard]] auto IsZRotationLocked() const noexcept
  {
    return z_rotation_locked_;
  }
  auto LockRotations(const bool x, const bool y, const bool z) -> void
  {
    x_rotation_locked_ = x;
    y_rotation_locked_ = y;
    z_rotation_locked_ = z;
    changes_.Insert(RigidBodyChange::kRotationLocked);
  }

  [[nodiscard]] auto IsTranslationLocked() const noexcept
  {
    return translation_locked_;
  }
  auto SetTranslationLocked(const bool locked) -> void
  {
    translation_locked_ = locked;
    changes_.Insert(RigidBodyChange::kTranslationLocked);
  }

  //=== Simulation link ===---------------------------------------------------//

  [[nodiscard]] auto GetNative() const noexcept { return native_; }
  auto SetNative(const physics::BodyHandle native) noexcept -> void
  {
    native_ = native;
  }

  [[nodiscard]] auto GetChanges() const noexcept
    -> const ChangeSet<RigidBodyChange>&
  {
    return changes_;
  }
  [[nodiscard]] auto GetChanges() noexcept -> ChangeSet<RigidBodyChange>&
  {
    return changes_;
  }

  [[nodiscard]] auto IsTransformModified() const noexcept
  {
    return transform_modified_;
  }
  auto MarkTransformModified() noexcept -> void { transform_modified_ = true; }
  auto ClearTransformModified() noexcept -> void { transform_modified_ = false; }

  //! Values written by the simulation. They do not record changes.
  auto SyncVelocities(const glm::vec3& lin_vel, const glm::vec3& ang_vel) noexcept
    -> void
  {
    lin_vel_ = lin_vel;
    ang_vel_ = ang_vel;
  }

  //! Forgets the native body and the pending changes. Used for copies and
  //! loaded nodes, whose body is created anew.
  auto ResetNative() noexcept -> void
  {
    native_ = physics::BodyHandle::None();
    changes_.Clear();
    transform_modified_ = false;
  }

private:
  physics::BodyType body_type_ { physics::BodyType::kDynamic };
  glm::vec3 lin_vel_ { 0.0F };
  glm::vec3 ang_vel_ { 0.0F };
  float mass_ { 1.0F };
  float lin_damping_ { 0.0F };
  float ang_damping_ { 0.0F };
  bool x_rotation_locked_ { false };
  bool y_rotation_locked_ { false };
  bool z_rotation_locked_ { false };
  bool translation_locked_ { false };

  physics::BodyHandle native_ {};
  ChangeSet<RigidBodyChange> changes_ {};
  bool transform_modified_ { false };
};

} // namespace argon::scene
