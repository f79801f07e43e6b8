//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include <Argon/Base/Macros.h>
#include <Argon/Base/Pool.h>
#include <Argon/Config/PhysicsConfig.h>
#include <Argon/Physics/DrawingContext.h>
#include <Argon/Physics/NativeEntities.h>
#include <Argon/Physics/PerformanceStatistics.h>
#include <Argon/Physics/api_export.h>

namespace physx {
class PxScene;
} // namespace physx

namespace argon::physics {

namespace detail {
  class PhysXSdk;
  struct PhysXGeometry;
} // namespace detail

//! Rigid-body simulation owning bodies, colliders and joints, backed by a
//! PhysX scene.
/*!
 Entities are identified by opaque handles; a stale handle is simply not
 found. The world does not know about scene nodes, the scene keeps its own
 mapping from handles to nodes.

 Each body is a PhysX dynamic actor, made kinematic for every type but
 BodyType::kDynamic. Velocity based kinematic bodies are moved by setting a
 kinematic target from their velocities before each step. Each collider is an
 exclusive shape of its body's actor, with its own material. Collision groups
 filter contact pairs and ray casts, solver groups decide whether detected
 contacts are resolved.

 Triangle meshes and height fields are only simulated on non-dynamic bodies;
 on dynamic bodies they take part in scene queries only.

 The NativeBody, NativeCollider and NativeJoint descriptions returned by the
 getters mirror what the world last pushed or pulled. They are read-only:
 every change goes through a setter so that it reaches PhysX.

 <b>Usage</b>:
 \code
   PhysicsWorld world;
   const auto body = world.InsertBody({ .body_type = BodyType::kDynamic });
   world.InsertCollider({ .shape = shape::Ball { 0.5F } }, body);
   world.Step();
 \endcode
*/
class PhysicsWorld {
public:
  //! Receives each ray hit. Returning false stops the query.
  using RayHitCallback
    = std::function<bool(ColliderHandle collider, const RayHit& hit)>;

  //! Maximum number of hits reported by a single ray cast.
  static constexpr uint32_t kMaxRayHits = 256;

  ARGN_PHY_API explicit PhysicsWorld(PhysicsConfig config = {});
  ARGN_PHY_API ~PhysicsWorld();

  ARGON_MAKE_NON_COPYABLE(PhysicsWorld)
  ARGN_PHY_API PhysicsWorld(PhysicsWorld&& other) noexcept;
  ARGN_PHY_API auto operator=(PhysicsWorld&& other) noexcept -> PhysicsWorld&;

  //=== Bodies ===------------------------------------------------------------//

  ARGN_PHY_NDAPI auto InsertBody(NativeBody body) -> BodyHandle;

  //! Removes the body together with its colliders and the joints attached to
  //! it. Returns the handles of the removed colliders, empty if the body was
  //! not found.
  ARGN_PHY_API auto RemoveBody(BodyHandle handle) -> std::vector<ColliderHandle>;

  [[nodiscard]] auto ContainsBody(const BodyHandle handle) const noexcept
  {
    return bodies_.Contains(handle);
  }

  [[nodiscard]] auto GetBody(const BodyHandle handle) const noexcept
    -> const NativeBody*
  {
    return bodies_.TryBorrow(handle);
  }

  //! Mass of a dynamic body: the mass derived from the densities of its
  //! colliders plus its additional mass. Zero for other bodies and unknown
  //! handles.
  ARGN_PHY_NDAPI auto BodyMass(BodyHandle handle) const -> float;

  [[nodiscard]] auto BodyCount() const noexcept { return bodies_.Size(); }

  //! Teleports the body.
  ARGN_PHY_API auto SetBodyPosition(BodyHandle handle, const Isometry& position)
    -> void;
  ARGN_PHY_API auto SetBodyType(BodyHandle handle, BodyType body_type) -> void;
  ARGN_PHY_API auto SetLinVel(BodyHandle handle, const glm::vec3& lin_vel)
    -> void;
  ARGN_PHY_API auto SetAngVel(BodyHandle handle, const glm::vec3& ang_vel)
    -> void;
  ARGN_PHY_API auto SetAdditionalMass(BodyHandle handle, float mass) -> void;
  ARGN_PHY_API auto SetLinDamping(BodyHandle handle, float damping) -> void;
  ARGN_PHY_API auto SetAngDamping(BodyHandle handle, float damping) -> void;
  ARGN_PHY_API auto SetRotationLocked(
    BodyHandle handle, const std::array<bool, 3>& locked) -> void;
  ARGN_PHY_API auto SetTranslationLocked(BodyHandle handle, bool locked)
    -> void;

  //=== Colliders ===---------------------------------------------------------//

  //! Attaches a new collider to `parent`. Throws std::invalid_argument if the
  //! parent body does not exist or the shape is not valid, and
  //! std::runtime_error if PhysX cannot cook it.
  ARGN_PHY_API auto InsertCollider(NativeCollider collider, BodyHandle parent)
    -> ColliderHandle;

  //! Detaches and destroys the collider. Returns false if it was not found.
  ARGN_PHY_API auto RemoveCollider(ColliderHandle handle) -> bool;

  [[nodiscard]] auto ContainsCollider(const ColliderHandle handle) const noexcept
  {
    return colliders_.Contains(handle);
  }

  [[nodiscard]] auto GetCollider(const ColliderHandle handle) const noexcept
    -> const NativeCollider*
  {
    return colliders_.TryBorrow(handle);
  }

  [[nodiscard]] auto ColliderCount() const noexcept { return colliders_.Size(); }

  //! Sets the pose of the collider relative to its body.
  ARGN_PHY_API auto SetColliderPosition(
    ColliderHandle handle, const Isometry& position_wrt_parent) -> void;

  //! Replaces the shape of the collider. Returns false, leaving the collider
  //! unchanged, if it was not found or the new shape cannot be built.
  ARGN_PHY_NDAPI auto SetColliderShape(ColliderHandle handle, Shape shape)
    -> bool;

  ARGN_PHY_API auto SetFriction(ColliderHandle handle, float friction) -> void;
  ARGN_PHY_API auto SetRestitution(ColliderHandle handle, float restitution)
    -> void;
  ARGN_PHY_API auto SetCollisionGroups(
    ColliderHandle handle, const InteractionGroups& groups) -> void;
  ARGN_PHY_API auto SetSolverGroups(
    ColliderHandle handle, const InteractionGroups& groups) -> void;
  ARGN_PHY_API auto SetSensor(ColliderHandle handle, bool is_sensor) -> void;

  //=== Joints ===------------------------------------------------------------//

  //! Connects two existing bodies. Throws std::invalid_argument if any of
  //! them does not exist, and std::runtime_error if PhysX refuses the joint.
  ARGN_PHY_API auto InsertJoint(
    BodyHandle body1, BodyHandle body2, JointParams params) -> JointHandle;

  ARGN_PHY_API auto RemoveJoint(JointHandle handle) -> bool;

  [[nodiscard]] auto ContainsJoint(const JointHandle handle) const noexcept
  {
    return joints_.Contains(handle);
  }

  [[nodiscard]] auto GetJoint(const JointHandle handle) const noexcept
    -> const NativeJoint*
  {
    return joints_.TryBorrow(handle);
  }

  [[nodiscard]] auto JointCount() const noexcept { return joints_.Size(); }

  //! Recreates the PhysX joint with new parameters, keeping its handle.
  ARGN_PHY_API auto SetJointParams(JointHandle handle, JointParams params)
    -> void;

  //=== Simulation ===--------------------------------------------------------//

  //! Advances the simulation by the configured time step, then refreshes the
  //! pose and velocities of every body.
  ARGN_PHY_API auto Step() -> void;

  //! Casts a world-space ray against every collider whose collision groups
  //! pass `groups`. Hits are reported in no particular order, at most
  //! kMaxRayHits of them. `max_toi` and the reported toi are in units of
  //! `ray.direction`; a zero direction hits nothing.
  ARGN_PHY_API auto CastRay(const Ray& ray, float max_toi,
    InteractionGroups groups, const RayHitCallback& on_hit) -> void;

  //! Emits a transform gizmo per body and a wireframe per collider.
  ARGN_PHY_API auto Draw(DrawingContext& context) const -> void;

  [[nodiscard]] auto GetGravity() const noexcept -> const glm::vec3&
  {
    return config_.gravity;
  }

  ARGN_PHY_API auto SetGravity(const glm::vec3& gravity) -> void;

  [[nodiscard]] auto GetIntegrationParameters() const noexcept
    -> const IntegrationParameters&
  {
    return config_.integration;
  }

  ARGN_PHY_API auto SetIntegrationParameters(const IntegrationParameters& params)
    -> void;

  [[nodiscard]] auto GetPerformance() const noexcept
    -> const PerformanceStatistics&
  {
    return performance_;
  }

  auto ResetPerformance() noexcept -> void { performance_.Reset(); }

private:
  auto Release() noexcept -> void;

  auto AttachShape(NativeBody& body, NativeCollider& collider,
    ColliderHandle handle, const detail::PhysXGeometry& geometry) -> bool;
  auto DetachShape(NativeBody& body, NativeCollider& collider) -> void;
  auto ApplyBodyType(NativeBody& body) -> void;
  auto ApplyActorParameters(NativeBody& body) -> void;
  auto ApplyShapeFlags(const NativeBody& body, NativeCollider& collider) -> void;
  auto ApplyShapePose(NativeCollider& collider) -> void;
  auto UpdateMassProperties(NativeBody& body) -> void;

  std::shared_ptr<detail::PhysXSdk> sdk_;
  physx::PxScene* scene_ { nullptr };
  PhysicsConfig config_;
  Pool<NativeBody> bodies_;
  Pool<NativeCollider> colliders_;
  Pool<NativeJoint> joints_;
  std::unordered_map<const physx::PxShape*, ColliderHandle> shape_colliders_;
  PerformanceStatistics performance_;
};

} // namespace argon::physics
