//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <utility>

#include <PxPhysicsAPI.h>

#include <glm/geometric.hpp>
#include <glm/gtc/quaternion.hpp>

#include <loguru.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Physics/Detail/PhysXConversions.h>
#include <Argon/Physics/Detail/PhysXGeometry.h>
#include <Argon/Physics/Detail/PhysXSdk.h>
#include <Argon/Physics/PhysicsWorld.h>

using argon::physics::BodyHandle;
using argon::physics::ColliderHandle;
using argon::physics::InteractionGroups;
using argon::physics::JointHandle;
using argon::physics::NativeBody;
using argon::physics::PhysicsWorld;
using argon::physics::detail::BuildGeometry;
using argon::physics::detail::FromPx;
using argon::physics::detail::GeometryOffset;
using argon::physics::detail::IsTriangleBased;
using argon::physics::detail::PhysXGeometry;
using argon::physics::detail::PhysXSdk;
using argon::physics::detail::ToPx;

namespace shape = argon::physics::shape;
namespace joint = argon::physics::joint;

namespace {

using Clock = std::chrono::steady_clock;

constexpr float kEpsilon = 1e-6F;
constexpr uint32_t kDrawSegments = 10;
constexpr argon::physics::Color kDrawColor
  = argon::physics::Color::Opaque(200, 200, 200);

// Simulation filter data: collision groups in word0/word1, solver groups in
// word2/word3. Query filter data: collision groups in word0/word1.
auto SimulationFilterData(const argon::physics::NativeCollider& collider)
  -> physx::PxFilterData
{
  return { collider.collision_groups.memberships,
    collider.collision_groups.filter, collider.solver_groups.memberships,
    collider.solver_groups.filter };
}

auto QueryFilterData(const argon::physics::NativeCollider& collider)
  -> physx::PxFilterData
{
  return { collider.collision_groups.memberships,
    collider.collision_groups.filter, 0, 0 };
}

auto GroupFilterShader(const physx::PxFilterObjectAttributes attributes0,
  const physx::PxFilterData data0,
  const physx::PxFilterObjectAttributes attributes1,
  const physx::PxFilterData data1, physx::PxPairFlags& pair_flags,
  const void* /*constant_block*/, physx::PxU32 /*constant_block_size*/)
  -> physx::PxFilterFlags
{
  const InteractionGroups collision0 { data0.word0, data0.word1 };
  const InteractionGroups collision1 { data1.word0, data1.word1 };
  if (!collision0.Test(collision1)) {
    return physx::PxFilterFlag::eSUPPRESS;
  }

  if (physx::PxFilterObjectIsTrigger(attributes0)
    || physx::PxFilterObjectIsTrigger(attributes1)) {
    pair_flags = physx::PxPairFlag::eTRIGGER_DEFAULT;
    return physx::PxFilterFlag::eDEFAULT;
  }

  const InteractionGroups solver0 { data0.word2, data0.word3 };
  const InteractionGroups solver1 { data1.word2, data1.word3 };
  // contacts failing the solver groups are detected but not resolved
  pair_flags = solver0.Test(solver1)
    ? physx::PxPairFlags(physx::PxPairFlag::eCONTACT_DEFAULT)
    : physx::PxPairFlags(physx::PxPairFlag::eDETECT_DISCRETE_CONTACT);
  return physx::PxFilterFlag::eDEFAULT;
}

//! Keeps the shapes whose collision groups pass the query groups, reporting
//! every hit as a touch.
class GroupQueryFilter final : public physx::PxQueryFilterCallback {
public:
  explicit GroupQueryFilter(const InteractionGroups groups)
    : groups_(groups)
  {
  }

  auto preFilter(const physx::PxFilterData& /*filter_data*/,
    const physx::PxShape* shape, const physx::PxRigidActor* /*actor*/,
    physx::PxHitFlags& /*query_flags*/) -> physx::PxQueryHitType::Enum override
  {
    if (shape == nullptr) {
      return physx::PxQueryHitType::eNONE;
    }
    const auto data = shape->getQueryFilterData();
    return groups_.Test({ data.word0, data.word1 })
      ? physx::PxQueryHitType::eTOUCH
      : physx::PxQueryHitType::eNONE;
  }

  auto postFilter(const physx::PxFilterData& /*filter_data*/,
    const physx::PxQueryHit& /*hit*/, const physx::PxShape* /*shape*/,
    const physx::PxRigidActor* /*actor*/) -> physx::PxQueryHitType::Enum override
  {
    return physx::PxQueryHitType::eTOUCH;
  }

private:
  InteractionGroups groups_;
};

auto IntegrateRotation(const glm::quat& rotation, const glm::vec3& ang_vel,
  const float dt) -> glm::quat
{
  const float speed = glm::length(ang_vel);
  if (speed < kEpsilon) {
    return rotation;
  }
  return glm::normalize(glm::angleAxis(speed * dt, ang_vel / speed) * rotation);
}

// PhysX prismatic and revolute joints act along the X axis of their frames.
auto AxisFrame(const glm::vec3& anchor, const glm::vec3& axis)
  -> physx::PxTransform
{
  const auto direction = glm::length(axis) > kEpsilon ? glm::normalize(axis)
                                                      : glm::vec3(1, 0, 0);
  return { ToPx(anchor),
    physx::PxShortestRotation(physx::PxVec3(1.0F, 0.0F, 0.0F),
      ToPx(direction)) };
}

auto CreateJoint(physx::PxPhysics& physics, physx::PxRigidActor* actor1,
  physx::PxRigidActor* actor2, const argon::physics::JointParams& params)
  -> physx::PxJoint*
{
  return std::visit(
    argon::Overloads {
      [&](const joint::Ball& p) -> physx::PxJoint* {
        return physx::PxSphericalJointCreate(physics, actor1,
          physx::PxTransform(ToPx(p.local_anchor1)), actor2,
          physx::PxTransform(ToPx(p.local_anchor2)));
      },
      [&](const joint::Fixed& p) -> physx::PxJoint* {
        return physx::PxFixedJointCreate(physics, actor1,
          ToPx(p.local_frame1), actor2, ToPx(p.local_frame2));
      },
      [&](const joint::Prismatic& p) -> physx::PxJoint* {
        return physx::PxPrismaticJointCreate(physics, actor1,
          AxisFrame(p.local_anchor1, p.local_axis1), actor2,
          AxisFrame(p.local_anchor2, p.local_axis2));
      },
      [&](const joint::Revolute& p) -> physx::PxJoint* {
        return physx::PxRevoluteJointCreate(physics, actor1,
          AxisFrame(p.local_anchor1, p.local_axis1), actor2,
          AxisFrame(p.local_anchor2, p.local_axis2));
      },
    },
    params);
}

} // namespace

PhysicsWorld::PhysicsWorld(PhysicsConfig config)
  : sdk_(PhysXSdk::Acquire())
  , config_(std::move(config))
{
  physx::PxSceneDesc desc(sdk_->Physics().getTolerancesScale());
  desc.gravity = ToPx(config_.gravity);
  desc.cpuDispatcher = &sdk_->Dispatcher();
  desc.filterShader = GroupFilterShader;
  scene_ = sdk_->Physics().createScene(desc);
  if (scene_ == nullptr) {
    throw std::runtime_error("PhysX scene creation failed");
  }

  LOG_F(INFO, "physics world created (gravity: {}, {}, {})", config_.gravity.x,
    config_.gravity.y, config_.gravity.z);
}

PhysicsWorld::~PhysicsWorld() { Release(); }

PhysicsWorld::PhysicsWorld(PhysicsWorld&& other) noexcept
  : sdk_(std::move(other.sdk_))
  , scene_(std::exchange(other.scene_, nullptr))
  , config_(std::move(other.config_))
  , bodies_(std::move(other.bodies_))
  , colliders_(std::move(other.colliders_))
  , joints_(std::move(other.joints_))
  , shape_colliders_(std::move(other.shape_colliders_))
  , performance_(other.performance_)
{
}

auto PhysicsWorld::operator=(PhysicsWorld&& other) noexcept -> PhysicsWorld&
{
  if (this != &other) {
    Release();
    scene_ = std::exchange(other.scene_, nullptr);
    sdk_ = std::move(other.sdk_);
    config_ = std::move(other.config_);
    bodies_ = std::move(other.bodies_);
    colliders_ = std::move(other.colliders_);
    joints_ = std::move(other.joints_);
    shape_colliders_ = std::move(other.shape_colliders_);
    performance_ = other.performance_;
  }
  return *this;
}

auto PhysicsWorld::Release() noexcept -> void
{
  if (scene_ == nullptr) {
    return;
  }
  joints_.ForEach([](JointHandle /*handle*/, NativeJoint& j) {
    if (j.px_joint != nullptr) {
      j.px_joint->release();
      j.px_joint = nullptr;
    }
  });
  bodies_.ForEach([](BodyHandle /*handle*/, NativeBody& body) {
    if (body.px_actor != nullptr) {
      body.px_actor->release();
      body.px_actor = nullptr;
    }
  });
  scene_->release();
  scene_ = nullptr;
  shape_colliders_.clear();
  DLOG_F(1, "physics world released");
}

//=== Bodies ===--------------------------------------------------------------//

auto PhysicsWorld::InsertBody(NativeBody body) -> BodyHandle
{
  auto* actor = sdk_->Physics().createRigidDynamic(ToPx(body.position));
  if (actor == nullptr) {
    throw std::runtime_error("PhysX actor creation failed");
  }
  // colliders are attached through InsertCollider()
  body.colliders.clear();
  body.px_actor = actor;
  ApplyBodyType(body);
  ApplyActorParameters(body);
  UpdateMassProperties(body);
  if (body.body_type == BodyType::kDynamic) {
    actor->setLinearVelocity(ToPx(body.lin_vel));
    actor->setAngularVelocity(ToPx(body.ang_vel));
  }
  scene_->addActor(*actor);

  const auto handle = bodies_.Spawn(std::move(body));
  DLOG_F(2, "body {} inserted", to_string(handle));
  return handle;
}

auto PhysicsWorld::RemoveBody(const BodyHandle handle)
  -> std::vector<ColliderHandle>
{
  if (!bodies_.Contains(handle)) {
    return {};
  }
  auto body = bodies_.Free(handle);

  // joints go first, they reference the actor
  std::vector<JointHandle> dead_joints;
  joints_.ForEach([&](const JointHandle joint_handle, const NativeJoint& j) {
    if (j.body1 == handle || j.body2 == handle) {
      dead_joints.push_back(joint_handle);
    }
  });
  for (const auto joint_handle : dead_joints) {
    if (auto j = joints_.Free(joint_handle); j.px_joint != nullptr) {
      j.px_joint->release();
    }
  }

  for (const auto collider_handle : body.colliders) {
    if (const auto* collider = colliders_.TryBorrow(collider_handle)) {
      shape_colliders_.erase(collider->px_shape);
    }
    colliders_.Erase(collider_handle);
  }
  // releases the exclusive shapes with the actor
  body.px_actor->release();

  DLOG_F(2, "body {} removed with {} colliders and {} joints", to_string(handle),
    body.colliders.size(), dead_joints.size());
  return std::move(body.colliders);
}

auto PhysicsWorld::BodyMass(const BodyHandle handle) const -> float
{
  const auto* body = bodies_.TryBorrow(handle);
  if (body == nullptr || body->body_type != BodyType::kDynamic) {
    return 0.0F;
  }
  return body->px_actor->getMass();
}

auto PhysicsWorld::SetBodyPosition(
  const BodyHandle handle, const Isometry& position) -> void
{
  auto* body = bodies_.TryBorrow(handle);
  if (body == nullptr) {
    return;
  }
  body->position = position;
  if (body->body_type == BodyType::kKinematicPositionBased) {
    // moves through the step, pushing what it meets
    body->px_actor->setKinematicTarget(ToPx(position));
  } else {
    body->px_actor->setGlobalPose(ToPx(position));
  }
}

auto PhysicsWorld::SetBodyType(const BodyHandle handle, const BodyType body_type)
  -> void
{
  auto* body = bodies_.TryBorrow(handle);
  if (body == nullptr || body->body_type == body_type) {
    return;
  }
  body->body_type = body_type;
  ApplyBodyType(*body);
  UpdateMassProperties(*body);
  if (body_type == BodyType::kDynamic) {
    body->px_actor->setLinearVelocity(ToPx(body->lin_vel));
    body->px_actor->setAngularVelocity(ToPx(body->ang_vel));
  }
  DLOG_F(2, "body {} is now {}", to_string(handle), to_string(body_type));
}

auto PhysicsWorld::SetLinVel(const BodyHandle handle, const glm::vec3& lin_vel)
  -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->lin_vel = lin_vel;
    if (body->body_type == BodyType::kDynamic) {
      body->px_actor->setLinearVelocity(ToPx(lin_vel));
    }
  }
}

auto PhysicsWorld::SetAngVel(const BodyHandle handle, const glm::vec3& ang_vel)
  -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->ang_vel = ang_vel;
    if (body->body_type == BodyType::kDynamic) {
      body->px_actor->setAngularVelocity(ToPx(ang_vel));
    }
  }
}

auto PhysicsWorld::SetAdditionalMass(const BodyHandle handle, const float mass)
  -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->additional_mass = mass;
    UpdateMassProperties(*body);
  }
}

auto PhysicsWorld::SetLinDamping(const BodyHandle handle, const float damping)
  -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->lin_damping = damping;
    body->px_actor->setLinearDamping(damping);
  }
}

auto PhysicsWorld::SetAngDamping(const BodyHandle handle, const float damping)
  -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->ang_damping = damping;
    body->px_actor->setAngularDamping(damping);
  }
}

auto PhysicsWorld::SetRotationLocked(
  const BodyHandle handle, const std::array<bool, 3>& locked) -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->rotation_locked = locked;
    ApplyActorParameters(*body);
  }
}

auto PhysicsWorld::SetTranslationLocked(const BodyHandle handle, const bool locked)
  -> void
{
  if (auto* body = bodies_.TryBorrow(handle)) {
    body->translation_locked = locked;
    ApplyActorParameters(*body);
  }
}

auto PhysicsWorld::ApplyBodyType(NativeBody& body) -> void
{
  const bool kinematic = body.body_type != BodyType::kDynamic;
  // triangle based simulation shapes are refused on non-kinematic actors,
  // so the flags are relaxed before the actor turns dynamic
  if (kinematic) {
    body.px_actor->setRigidBodyFlag(physx::PxRigidBodyFlag::eKINEMATIC, true);
  }
  for (const auto collider_handle : body.colliders) {
    if (auto* collider = colliders_.TryBorrow(collider_handle)) {
      ApplyShapeFlags(body, *collider);
    }
  }
  if (!kinematic) {
    body.px_actor->setRigidBodyFlag(physx::PxRigidBodyFlag::eKINEMATIC, false);
  }
}

auto PhysicsWorld::ApplyActorParameters(NativeBody& body) -> void
{
  auto& actor = *body.px_actor;
  const auto& params = config_.integration;
  actor.setLinearDamping(body.lin_damping);
  actor.setAngularDamping(body.ang_damping);
  actor.setMaxLinearVelocity(params.max_linear_velocity);
  actor.setMaxAngularVelocity(params.max_angular_velocity);
  actor.setSolverIterationCounts(
    params.position_iterations, params.velocity_iterations);

  physx::PxRigidDynamicLockFlags locks;
  if (body.translation_locked) {
    locks |= physx::PxRigidDynamicLockFlag::eLOCK_LINEAR_X;
    locks |= physx::PxRigidDynamicLockFlag::eLOCK_LINEAR_Y;
    locks |= physx::PxRigidDynamicLockFlag::eLOCK_LINEAR_Z;
  }
  if (body.rotation_locked[0]) {
    locks |= physx::PxRigidDynamicLockFlag::eLOCK_ANGULAR_X;
  }
  if (body.rotation_locked[1]) {
    locks |= physx::PxRigidDynamicLockFlag::eLOCK_ANGULAR_Y;
  }
  if (body.rotation_locked[2]) {
    locks |= physx::PxRigidDynamicLockFlag::eLOCK_ANGULAR_Z;
  }
  actor.setRigidDynamicLockFlags(locks);
}

/*!
 The mass of a dynamic body comes from the densities of its simulated
 colliders, then its additional mass is added by scaling the inertia. A body
 left without any mass is given a unit mass.
*/
auto PhysicsWorld::UpdateMassProperties(NativeBody& body) -> void
{
  if (body.body_type != BodyType::kDynamic) {
    return;
  }
  auto& actor = *body.px_actor;

  std::vector<physx::PxShape*> shapes(actor.getNbShapes());
  actor.getShapes(shapes.data(), static_cast<physx::PxU32>(shapes.size()));
  std::vector<physx::PxReal> densities;
  for (const auto* px_shape : shapes) {
    if (!px_shape->getFlags().isSet(physx::PxShapeFlag::eSIMULATION_SHAPE)) {
      continue;
    }
    const auto it = shape_colliders_.find(px_shape);
    const auto* collider
      = it != shape_colliders_.end() ? colliders_.TryBorrow(it->second) : nullptr;
    densities.push_back(
      collider != nullptr ? collider->EffectiveDensity() : kDefaultDensity);
  }

  float shape_mass = 0.0F;
  if (!densities.empty()
    && physx::PxRigidBodyExt::updateMassAndInertia(actor, densities.data(),
      static_cast<physx::PxU32>(densities.size()))) {
    shape_mass = actor.getMass();
  }

  const float total = shape_mass + body.additional_mass;
  if (total < kEpsilon) {
    actor.setMass(1.0F);
    actor.setMassSpaceInertiaTensor(physx::PxVec3(1.0F));
  } else if (shape_mass < kEpsilon) {
    actor.setCMassLocalPose(physx::PxTransform(physx::PxIdentity));
    actor.setMass(total);
    actor.setMassSpaceInertiaTensor(physx::PxVec3(total));
  } else {
    actor.setMass(total);
    actor.setMassSpaceInertiaTensor(
      actor.getMassSpaceInertiaTensor() * (total / shape_mass));
  }
}

//=== Colliders ===-----------------------------------------------------------//

auto PhysicsWorld::InsertCollider(NativeCollider collider,
  const BodyHandle parent) -> ColliderHandle
{
  if (!bodies_.Contains(parent)) {
    throw std::invalid_argument("collider parent body does not exist");
  }
  if (!IsValid(collider.shape)) {
    throw std::invalid_argument("collider shape is not valid");
  }
  const auto geometry = BuildGeometry(collider.shape, sdk_->Physics());
  if (!geometry) {
    throw std::runtime_error("collider shape could not be cooked");
  }

  collider.parent = parent;
  collider.px_shape = nullptr;
  const auto handle = colliders_.Spawn(std::move(collider));
  auto& body = bodies_.ItemAt(parent);
  if (!AttachShape(body, colliders_.ItemAt(handle), handle, *geometry)) {
    colliders_.Erase(handle);
    throw std::runtime_error("PhysX shape creation failed");
  }
  body.colliders.push_back(handle);
  UpdateMassProperties(body);

  DLOG_F(2, "collider {} attached to body {}", to_string(handle),
    to_string(parent));
  return handle;
}

auto PhysicsWorld::RemoveCollider(const ColliderHandle handle) -> bool
{
  if (!colliders_.Contains(handle)) {
    return false;
  }
  auto collider = colliders_.Free(handle);
  if (auto* body = bodies_.TryBorrow(collider.parent)) {
    DetachShape(*body, collider);
    std::erase(body->colliders, handle);
    UpdateMassProperties(*body);
  }
  DLOG_F(2, "collider {} removed", to_string(handle));
  return true;
}

auto PhysicsWorld::AttachShape(NativeBody& body, NativeCollider& collider,
  const ColliderHandle handle, const PhysXGeometry& geometry) -> bool
{
  auto& physics = sdk_->Physics();
  auto* material = physics.createMaterial(
    collider.friction, collider.friction, collider.restitution);
  if (material == nullptr) {
    return false;
  }
  // query only until the flags are resolved below
  auto* px_shape = physx::PxRigidActorExt::createExclusiveShape(*body.px_actor,
    geometry.geometry.any(), *material, physx::PxShapeFlag::eSCENE_QUERY_SHAPE);
  // the shape holds its own reference
  material->release();
  if (px_shape == nullptr) {
    return false;
  }

  collider.px_shape = px_shape;
  shape_colliders_[px_shape] = handle;
  px_shape->setSimulationFilterData(SimulationFilterData(collider));
  px_shape->setQueryFilterData(QueryFilterData(collider));
  ApplyShapePose(collider);
  ApplyShapeFlags(body, collider);
  return true;
}

auto PhysicsWorld::DetachShape(NativeBody& body, NativeCollider& collider)
  -> void
{
  if (collider.px_shape == nullptr) {
    return;
  }
  shape_colliders_.erase(collider.px_shape);
  body.px_actor->detachShape(*collider.px_shape);
  collider.px_shape = nullptr;
}

auto PhysicsWorld::ApplyShapePose(NativeCollider& collider) -> void
{
  collider.px_shape->setLocalPose(
    ToPx(collider.position_wrt_parent * GeometryOffset(collider.shape)));
}

auto PhysicsWorld::ApplyShapeFlags(
  const NativeBody& body, NativeCollider& collider) -> void
{
  const auto type = collider.px_shape->getGeometry().getType();
  const bool triangle_based = IsTriangleBased(type);
  const bool dynamic = body.body_type == BodyType::kDynamic;

  physx::PxShapeFlags flags(physx::PxShapeFlag::eSCENE_QUERY_SHAPE);
  if (collider.is_sensor) {
    if (!triangle_based) {
      flags |= physx::PxShapeFlag::eTRIGGER_SHAPE;
    }
  } else if (!(triangle_based && dynamic)) {
    flags |= physx::PxShapeFlag::eSIMULATION_SHAPE;
  } else {
    LOG_F(WARNING,
      "triangle based collider on a dynamic body only takes part in queries");
  }
  collider.px_shape->setFlags(flags);
}

auto PhysicsWorld::SetColliderPosition(
  const ColliderHandle handle, const Isometry& position_wrt_parent) -> void
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr) {
    return;
  }
  collider->position_wrt_parent = position_wrt_parent;
  ApplyShapePose(*collider);
  if (auto* body = bodies_.TryBorrow(collider->parent)) {
    UpdateMassProperties(*body);
  }
}

auto PhysicsWorld::SetColliderShape(const ColliderHandle handle, Shape shape)
  -> bool
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr) {
    return false;
  }
  auto* body = bodies_.TryBorrow(collider->parent);
  if (body == nullptr) {
    return false;
  }
  const auto geometry = BuildGeometry(shape, sdk_->Physics());
  if (!geometry) {
    LOG_F(WARNING, "collider {} keeps its shape, the new one is not valid",
      to_string(handle));
    return false;
  }

  // the geometry type may change, so the shape is recreated
  DetachShape(*body, *collider);
  collider->shape = std::move(shape);
  if (!AttachShape(*body, *collider, handle, *geometry)) {
    throw std::runtime_error("PhysX shape creation failed");
  }
  UpdateMassProperties(*body);
  return true;
}

auto PhysicsWorld::SetFriction(const ColliderHandle handle, const float friction)
  -> void
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr) {
    return;
  }
  collider->friction = friction;
  physx::PxMaterial* material = nullptr;
  collider->px_shape->getMaterials(&material, 1);
  material->setStaticFriction(friction);
  material->setDynamicFriction(friction);
}

auto PhysicsWorld::SetRestitution(
  const ColliderHandle handle, const float restitution) -> void
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr) {
    return;
  }
  collider->restitution = restitution;
  physx::PxMaterial* material = nullptr;
  collider->px_shape->getMaterials(&material, 1);
  material->setRestitution(restitution);
}

auto PhysicsWorld::SetCollisionGroups(
  const ColliderHandle handle, const InteractionGroups& groups) -> void
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr) {
    return;
  }
  collider->collision_groups = groups;
  collider->px_shape->setSimulationFilterData(SimulationFilterData(*collider));
  collider->px_shape->setQueryFilterData(QueryFilterData(*collider));
  if (const auto* body = bodies_.TryBorrow(collider->parent)) {
    scene_->resetFiltering(*body->px_actor);
  }
}

auto PhysicsWorld::SetSolverGroups(
  const ColliderHandle handle, const InteractionGroups& groups) -> void
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr) {
    return;
  }
  collider->solver_groups = groups;
  collider->px_shape->setSimulationFilterData(SimulationFilterData(*collider));
  if (const auto* body = bodies_.TryBorrow(collider->parent)) {
    scene_->resetFiltering(*body->px_actor);
  }
}

auto PhysicsWorld::SetSensor(const ColliderHandle handle, const bool is_sensor)
  -> void
{
  auto* collider = colliders_.TryBorrow(handle);
  if (collider == nullptr || collider->is_sensor == is_sensor) {
    return;
  }
  collider->is_sensor = is_sensor;
  if (auto* body = bodies_.TryBorrow(collider->parent)) {
    ApplyShapeFlags(*body, *collider);
    UpdateMassProperties(*body);
    scene_->resetFiltering(*body->px_actor);
  }
}

//=== Joints ===--------------------------------------------------------------//

auto PhysicsWorld::InsertJoint(const BodyHandle body1, const BodyHandle body2,
  JointParams params) -> JointHandle
{
  const auto* b1 = bodies_.TryBorrow(body1);
  const auto* b2 = bodies_.TryBorrow(body2);
  if (b1 == nullptr || b2 == nullptr) {
    throw std::invalid_argument("joint bodies must exist");
  }
  auto* px_joint
    = CreateJoint(sdk_->Physics(), b1->px_actor, b2->px_actor, params);
  if (px_joint == nullptr) {
    throw std::runtime_error("PhysX joint creation failed");
  }
  const auto handle = joints_.Spawn(NativeJoint {
    .body1 = body1,
    .body2 = body2,
    .params = std::move(params),
    .px_joint = px_joint,
  });
  DLOG_F(2, "joint {} connects {} and {}", to_string(handle), to_string(body1),
    to_string(body2));
  return handle;
}

auto PhysicsWorld::RemoveJoint(const JointHandle handle) -> bool
{
  if (!joints_.Contains(handle)) {
    return false;
  }
  if (auto j = joints_.Free(handle); j.px_joint != nullptr) {
    j.px_joint->release();
  }
  return true;
}

auto PhysicsWorld::SetJointParams(const JointHandle handle, JointParams params)
  -> void
{
  auto* j = joints_.TryBorrow(handle);
  if (j == nullptr) {
    return;
  }
  const auto* b1 = bodies_.TryBorrow(j->body1);
  const auto* b2 = bodies_.TryBorrow(j->body2);
  if (b1 == nullptr || b2 == nullptr) {
    return;
  }
  // PhysX joints cannot change kind, so the joint is recreated
  auto* px_joint
    = CreateJoint(sdk_->Physics(), b1->px_actor, b2->px_actor, params);
  if (px_joint == nullptr) {
    throw std::runtime_error("PhysX joint creation failed");
  }
  if (j->px_joint != nullptr) {
    j->px_joint->release();
  }
  j->px_joint = px_joint;
  j->params = std::move(params);
}

//=== Simulation ===----------------------------------------------------------//

auto PhysicsWorld::Step() -> void
{
  const float dt = config_.integration.dt;
  if (dt <= 0.0F) {
    LOG_F(WARNING, "physics step skipped, time step is {}", dt);
    return;
  }
  const auto start = Clock::now();

  bodies_.ForEach([&](BodyHandle /*handle*/, NativeBody& body) {
    if (body.body_type != BodyType::kKinematicVelocityBased) {
      return;
    }
    const Isometry target {
      .translation = body.position.translation + body.lin_vel * dt,
      .rotation = IntegrateRotation(body.position.rotation, body.ang_vel, dt),
    };
    body.px_actor->setKinematicTarget(ToPx(target));
  });

  scene_->simulate(dt);
  scene_->fetchResults(true);

  bodies_.ForEach([](BodyHandle /*handle*/, NativeBody& body) {
    body.position = FromPx(body.px_actor->getGlobalPose());
    if (body.body_type == BodyType::kDynamic) {
      body.lin_vel = FromPx(body.px_actor->getLinearVelocity());
      body.ang_vel = FromPx(body.px_actor->getAngularVelocity());
    }
  });

  performance_.step_time
    = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);
}

auto PhysicsWorld::CastRay(const Ray& ray, const float max_toi,
  const InteractionGroups groups, const RayHitCallback& on_hit) -> void
{
  const float length = glm::length(ray.direction);
  if (length < kEpsilon || max_toi <= 0.0F) {
    return;
  }
  const auto start = Clock::now();

  std::vector<physx::PxRaycastHit> touches(kMaxRayHits);
  physx::PxRaycastBuffer buffer(
    touches.data(), static_cast<physx::PxU32>(touches.size()));
  physx::PxQueryFilterData filter_data;
  filter_data.flags = physx::PxQueryFlag::eSTATIC
    | physx::PxQueryFlag::eDYNAMIC | physx::PxQueryFlag::ePREFILTER
    | physx::PxQueryFlag::eNO_BLOCK;
  GroupQueryFilter filter(groups);
  const physx::PxHitFlags hit_flags = physx::PxHitFlag::ePOSITION
    | physx::PxHitFlag::eNORMAL | physx::PxHitFlag::eFACE_INDEX
    | physx::PxHitFlag::eMESH_BOTH_SIDES;

  scene_->raycast(ToPx(ray.origin), ToPx(ray.direction / length),
    max_toi * length, buffer, hit_flags, filter_data, &filter);

  for (physx::PxU32 i = 0; i < buffer.getNbTouches(); ++i) {
    const auto& touch = buffer.getTouch(i);
    const auto it = shape_colliders_.find(touch.shape);
    if (it == shape_colliders_.end()) {
      continue;
    }
    const RayHit hit {
      .toi = touch.distance / length,
      .normal = FromPx(touch.normal),
      .feature = IsTriangleBased(touch.shape->getGeometry().getType())
        ? FeatureId::Face(touch.faceIndex)
        : FeatureId::Unknown(),
    };
    if (!on_hit(it->second, hit)) {
      break;
    }
  }

  performance_.total_ray_cast_time
    += std::chrono::duration_cast<std::chrono::nanoseconds>(
      Clock::now() - start);
}

auto PhysicsWorld::SetGravity(const glm::vec3& gravity) -> void
{
  config_.gravity = gravity;
  scene_->setGravity(ToPx(gravity));
  bodies_.ForEach([](BodyHandle /*handle*/, const NativeBody& body) {
    if (body.body_type == BodyType::kDynamic) {
      body.px_actor->wakeUp();
    }
  });
}

auto PhysicsWorld::SetIntegrationParameters(const IntegrationParameters& params)
  -> void
{
  config_.integration = params;
  bodies_.ForEach([this](BodyHandle /*handle*/, NativeBody& body) {
    ApplyActorParameters(body);
  });
}

auto PhysicsWorld::Draw(DrawingContext& context) const -> void
{
  bodies_.ForEach([&](BodyHandle /*handle*/, const NativeBody& body) {
    context.DrawTransform(body.position.ToMatrix());
  });

  colliders_.ForEach([&](ColliderHandle /*handle*/,
                       const NativeCollider& collider) {
    const auto* body = bodies_.TryBorrow(collider.parent);
    if (body == nullptr) {
      return;
    }
    const auto world_pose = body->position * collider.position_wrt_parent;
    const auto transform = world_pose.ToMatrix();

    const auto draw_triangles
      = [&](const std::vector<shape::Triangle>& triangles) {
          for (const auto& tri : triangles) {
            context.DrawTriangle(world_pose.TransformPoint(tri.a),
              world_pose.TransformPoint(tri.b), world_pose.TransformPoint(tri.c),
              kDrawColor);
          }
        };

    std::visit(
      argon::Overloads {
        [&](const shape::Ball& s) {
          context.DrawSphere(world_pose.translation, kDrawSegments,
            kDrawSegments, s.radius, kDrawColor);
        },
        [&](const shape::Cuboid& s) {
          context.DrawOrientedBox(
            -s.half_extents, s.half_extents, transform, kDrawColor);
        },
        [&](const shape::Capsule& s) {
          context.DrawSegmentCapsule(s.begin, s.end, s.radius, kDrawSegments,
            kDrawSegments, transform, kDrawColor);
        },
        [&](const shape::Cylinder& s) {
          context.DrawCylinder(kDrawSegments, s.radius, 2.0F * s.half_height,
            true, transform, kDrawColor);
        },
        [&](const shape::RoundCylinder& s) {
          context.DrawCylinder(kDrawSegments, s.radius, 2.0F * s.half_height,
            false, transform, kDrawColor);
        },
        [&](const shape::Cone& s) {
          context.DrawCone(kDrawSegments, s.radius, 2.0F * s.half_height,
            transform, kDrawColor);
        },
        [](const shape::Segment&) {},
        [&](const shape::Triangle& s) { draw_triangles({ s }); },
        [&](const shape::TriMesh& s) {
          std::vector<shape::Triangle> triangles;
          triangles.reserve(s.indices.size());
          for (const auto& [i0, i1, i2] : s.indices) {
            triangles.push_back({ s.vertices.at(i0), s.vertices.at(i1),
              s.vertices.at(i2) });
          }
          draw_triangles(triangles);
        },
        [&](const shape::HeightField& s) { draw_triangles(Triangulate(s)); },
      },
      collider.shape);
  });
}
