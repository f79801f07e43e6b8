//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cstdint>
#include <limits>
#include <utility>

#include <glm/geometric.hpp>
#include <glm/matrix.hpp>
#include <loguru.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Scene/Frustum.h>
#include <Argon/Scene/Graph.h>

using argon::Overloads;
using argon::physics::Isometry;
using argon::physics::NativeBody;
using argon::physics::NativeCollider;
using argon::scene::Camera;
using argon::scene::Collider;
using argon::scene::ColliderChange;
using argon::scene::Frustum;
using argon::scene::Graph;
using argon::scene::Intersection;
using argon::scene::Joint;
using argon::scene::JointChange;
using argon::scene::Mesh;
using argon::scene::Node;
using argon::scene::NodeHandle;
using argon::scene::ParticleSystem;
using argon::scene::RigidBody;
using argon::scene::RigidBodyChange;
using argon::scene::Terrain;
using argon::scene::Transform;
using argon::scene::VisibilityCache;

namespace {

auto LocalIsometry(const Transform& transform) -> Isometry
{
  return { .translation = *transform.GetPosition(),
    .rotation = *transform.GetRotation() };
}

} // namespace

//------------------------------------------------------------------------------
// Physics Synchronization Implementation
//------------------------------------------------------------------------------

/*!
 Bodies are synchronized first, then colliders, then joints, so that entities
 created in this pass are found by the ones that depend on them.
*/
auto Graph::SyncNativePhysics() -> void
{
  pool_.ForEach([this](const NodeHandle /*handle*/, Node& node) {
    if (node.Is<RigidBody>()) {
      SyncRigidBody(node);
    }
  });
  pool_.ForEach([this](const NodeHandle handle, Node& node) {
    if (node.Is<Collider>()) {
      SyncCollider(handle, node);
    }
  });
  pool_.ForEach([this](const NodeHandle /*handle*/, Node& node) {
    if (node.Is<Joint>()) {
      SyncJoint(node);
    }
  });
}

auto Graph::SyncRigidBody(Node& node) -> void
{
  auto& body = node.As<RigidBody>();
  if (!physics_.ContainsBody(body.GetNative())) {
    body.SetNative(physics_.InsertBody(NativeBody {
      .body_type = body.GetBodyType(),
      .position = LocalIsometry(node.local_transform_),
      .lin_vel = body.GetLinVel(),
      .ang_vel = body.GetAngVel(),
      .additional_mass = body.GetMass(),
      .lin_damping = body.GetLinDamping(),
      .ang_damping = body.GetAngDamping(),
      .rotation_locked = { body.IsXRotationLocked(), body.IsYRotationLocked(),
        body.IsZRotationLocked() },
      .translation_locked = body.IsTranslationLocked(),
    }));
    body.GetChanges().Clear();
    body.ClearTransformModified();
    LOG_F(INFO, "Native rigid body was created for node '{}'", node.name_);
    return;
  }

  const auto native = body.GetNative();
  if (body.IsTransformModified()) {
    physics_.SetBodyPosition(native, LocalIsometry(node.local_transform_));
    body.ClearTransformModified();
  }

  auto& changes = body.GetChanges();
  if (changes.Take(RigidBodyChange::kBodyType)) {
    physics_.SetBodyType(native, body.GetBodyType());
  }
  if (changes.Take(RigidBodyChange::kLinVel)) {
    physics_.SetLinVel(native, body.GetLinVel());
  }
  if (changes.Take(RigidBodyChange::kAngVel)) {
    physics_.SetAngVel(native, body.GetAngVel());
  }
  if (changes.Take(RigidBodyChange::kMass)) {
    physics_.SetAdditionalMass(native, body.GetMass());
  }
  if (changes.Take(RigidBodyChange::kLinDamping)) {
    physics_.SetLinDamping(native, body.GetLinDamping());
  }
  if (changes.Take(RigidBodyChange::kAngDamping)) {
    physics_.SetAngDamping(native, body.GetAngDamping());
  }
  if (changes.Take(RigidBodyChange::kRotationLocked)) {
    physics_.SetRotationLocked(native,
      { body.IsXRotationLocked(), body.IsYRotationLocked(),
        body.IsZRotationLocked() });
  }
  if (changes.Take(RigidBodyChange::kTranslationLocked)) {
    physics_.SetTranslationLocked(native, body.IsTranslationLocked());
  }
}

/*!
 A collider gets a native collider once its parent is a rigid body with a
 native body. A shape change is kept pending while the new shape cannot be
 built, for example while its source mesh has no geometry yet.
*/
auto Graph::SyncCollider(const NodeHandle handle, Node& node) -> void
{
  auto& collider = node.As<Collider>();
  if (const auto native = collider.GetNative();
    physics_.ContainsCollider(native)) {
    if (collider.IsTransformModified()) {
      physics_.SetColliderPosition(native, LocalIsometry(node.local_transform_));
      collider.ClearTransformModified();
    }

    auto& changes = collider.GetChanges();
    if (changes.Contains(ColliderChange::kShape)) {
      if (auto shape = collider.IntoNativeShape(
            glm::inverse(IsometricGlobalTransform(handle)), *this);
        shape && physics_.SetColliderShape(native, std::move(*shape))) {
        changes.Take(ColliderChange::kShape);
      }
    }
    if (changes.Take(ColliderChange::kRestitution)) {
      physics_.SetRestitution(native, collider.GetRestitution());
    }
    if (changes.Take(ColliderChange::kCollisionGroups)) {
      physics_.SetCollisionGroups(native, collider.GetCollisionGroups());
    }
    if (changes.Take(ColliderChange::kSolverGroups)) {
      physics_.SetSolverGroups(native, collider.GetSolverGroups());
    }
    if (changes.Take(ColliderChange::kFriction)) {
      physics_.SetFriction(native, collider.GetFriction());
    }
    if (changes.Take(ColliderChange::kIsSensor)) {
      physics_.SetSensor(native, collider.IsSensor());
    }
    return;
  }

  const auto* parent = TryGet(node.parent_);
  const auto* body = parent != nullptr ? parent->TryAs<RigidBody>() : nullptr;
  if (body == nullptr || !physics_.ContainsBody(body->GetNative())) {
    return;
  }
  auto shape = collider.IntoNativeShape(
    glm::inverse(IsometricGlobalTransform(handle)), *this);
  if (!shape) {
    return;
  }

  const auto native = physics_.InsertCollider(
    NativeCollider {
      .shape = std::move(*shape),
      .position_wrt_parent = LocalIsometry(node.local_transform_),
      .friction = collider.GetFriction(),
      .density = collider.GetDensity(),
      .restitution = collider.GetRestitution(),
      .collision_groups = collider.GetCollisionGroups(),
      .solver_groups = collider.GetSolverGroups(),
      .is_sensor = collider.IsSensor(),
    },
    body->GetNative());
  collider.SetNative(native);
  collider.GetChanges().Clear();
  collider.ClearTransformModified();
  collider_map_[native] = handle;
  LOG_F(INFO, "Native collider was created for node '{}'", node.name_);
}

auto Graph::SyncJoint(Node& node) -> void
{
  auto& joint = node.As<Joint>();
  if (const auto native = joint.GetNative(); physics_.ContainsJoint(native)) {
    auto& changes = joint.GetChanges();
    if (changes.Take(JointChange::kParams)) {
      physics_.SetJointParams(native, joint.GetParams());
    }
    if (changes.Take(JointChange::kBody1)) {
      LOG_F(ERROR, "joint '{}': changing body1 of a live joint is not supported",
        node.name_);
    }
    if (changes.Take(JointChange::kBody2)) {
      LOG_F(ERROR, "joint '{}': changing body2 of a live joint is not supported",
        node.name_);
    }
    return;
  }

  const auto* node1 = TryGet(joint.GetBody1());
  const auto* node2 = TryGet(joint.GetBody2());
  const auto* body1 = node1 != nullptr ? node1->TryAs<RigidBody>() : nullptr;
  const auto* body2 = node2 != nullptr ? node2->TryAs<RigidBody>() : nullptr;
  if (body1 == nullptr || body2 == nullptr
    || !physics_.ContainsBody(body1->GetNative())
    || !physics_.ContainsBody(body2->GetNative())) {
    return;
  }

  joint.SetNative(physics_.InsertJoint(
    body1->GetNative(), body2->GetNative(), joint.GetParams()));
  joint.GetChanges().Clear();
  LOG_F(INFO, "Native joint was created for node '{}'", node.name_);
}

//------------------------------------------------------------------------------
// Frame Update Implementation
//------------------------------------------------------------------------------

auto Graph::Update(const glm::vec2& frame_size, const float dt) -> void
{
  SyncNativePhysics();
  physics_.Step();
  UpdateHierarchicalData();

  // Nodes may remove themselves, which only frees slots already visited or
  // not yet reached.
  for (uint32_t i = 0; i < Capacity(); ++i) {
    if (const auto handle = HandleFromIndex(i); handle.IsValid()) {
      UpdateNode(handle, frame_size, dt);
    }
  }
}

auto Graph::UpdateNode(
  const NodeHandle handle, const glm::vec2& frame_size, const float dt) -> void
{
  auto& node = (*this)[handle];
  if (node.lifetime_) {
    *node.lifetime_ -= dt;
    if (*node.lifetime_ <= 0.0F) {
      DLOG_F(1, "node '{}' reached the end of its lifetime", node.name_);
      RemoveNode(handle);
      return;
    }
  }

  std::visit(
    Overloads {
      [&](Camera& camera) {
        camera.CalculateMatrices(frame_size, node.global_transform_);
        VisibilityCache cache;
        cache.Update(*this, node.GetGlobalPosition(), camera.GetZNear(),
          camera.GetZFar(),
          Frustum::FromViewProjection(camera.GetViewProjectionMatrix()));
        camera.SetVisibilityCache(std::move(cache));
      },
      [dt](ParticleSystem& particle_system) { particle_system.Update(dt); },
      [](Terrain& terrain) { terrain.Update(); },
      [&](Mesh& mesh) { mesh.Update(*this, node.global_transform_); },
      [&](RigidBody& body) {
        if (const auto* native = physics_.GetBody(body.GetNative())) {
          node.local_transform_.SetPosition(native->position.translation)
            .SetRotation(native->position.rotation);
          body.SyncVelocities(native->lin_vel, native->ang_vel);
        }
      },
      [](auto& /*other*/) {},
    },
    node.kind_);
}

//------------------------------------------------------------------------------
// Ray Casting Implementation
//------------------------------------------------------------------------------

auto Graph::CastRay(
  const RayCastOptions& options, QueryResultsStorage& results) -> void
{
  results.Clear();

  const auto length = glm::length(options.direction);
  const physics::Ray ray {
    .origin = options.origin,
    .direction = length > std::numeric_limits<float>::epsilon()
      ? options.direction / length
      : glm::vec3 { 0.0F },
  };

  physics_.CastRay(ray, options.max_len, options.groups,
    [this, &ray, &results](const physics::ColliderHandle collider,
      const physics::RayHit& hit) {
      const auto it = collider_map_.find(collider);
      if (it == collider_map_.end()) {
        LOG_F(ERROR, "ray hit native collider {} that no node owns",
          to_string(collider));
        return true;
      }
      return results.Push(Intersection {
        .collider = it->second,
        .normal = hit.normal,
        .position = ray.PointAt(hit.toi),
        .feature = hit.feature,
        .toi = hit.toi,
      });
    });

  if (options.sort_results) {
    results.Sort();
  }
}
