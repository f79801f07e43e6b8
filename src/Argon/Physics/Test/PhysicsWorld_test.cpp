//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

#include <glm/geometric.hpp>

#include <Argon/Testing/GTest.h>

#include <Argon/Physics/PhysicsWorld.h>

using argon::PhysicsConfig;
using argon::physics::BodyHandle;
using argon::physics::BodyType;
using argon::physics::Color;
using argon::physics::ColliderHandle;
using argon::physics::DrawingContext;
using argon::physics::FeatureId;
using argon::physics::InteractionGroups;
using argon::physics::Isometry;
using argon::physics::NativeBody;
using argon::physics::NativeCollider;
using argon::physics::PerformanceStatistics;
using argon::physics::PhysicsWorld;
using argon::physics::Ray;
using argon::physics::RayHit;

namespace shape = argon::physics::shape;
namespace joint = argon::physics::joint;

using testing::_;

namespace {

constexpr float kTolerance = 1e-4F;

class MockDrawingContext : public DrawingContext {
public:
  MOCK_METHOD(void, DrawTransform, (const glm::mat4&), (override));
  MOCK_METHOD(void, DrawTriangle,
    (const glm::vec3&, const glm::vec3&, const glm::vec3&, Color), (override));
  MOCK_METHOD(void, DrawOrientedBox,
    (const glm::vec3&, const glm::vec3&, const glm::mat4&, Color), (override));
  MOCK_METHOD(void, DrawSphere,
    (const glm::vec3&, uint32_t, uint32_t, float, Color), (override));
  MOCK_METHOD(void, DrawCone, (uint32_t, float, float, const glm::mat4&, Color),
    (override));
  MOCK_METHOD(void, DrawCylinder,
    (uint32_t, float, float, bool, const glm::mat4&, Color), (override));
  MOCK_METHOD(void, DrawSegmentCapsule,
    (const glm::vec3&, const glm::vec3&, float, uint32_t, uint32_t,
      const glm::mat4&, Color),
    (override));
};

class PhysicsWorldTest : public testing::Test {
protected:
  auto AddBody(const glm::vec3& position,
    const BodyType type = BodyType::kDynamic) -> BodyHandle
  {
    return world_.InsertBody(NativeBody {
      .body_type = type,
      .position = Isometry { .translation = position },
    });
  }

  auto StepFor(const int steps) -> void
  {
    for (int i = 0; i < steps; ++i) {
      world_.Step();
    }
  }

  //! A ball of radius 0.5 three meters above a static cuboid whose top face
  //! is at y = 0.5.
  auto DropBallOnGround(NativeCollider ball, NativeCollider ground)
    -> BodyHandle
  {
    ground.shape = shape::Cuboid { glm::vec3(5.0F, 0.5F, 5.0F) };
    ground_collider_ = world_.InsertCollider(
      std::move(ground), AddBody(glm::vec3(0.0F), BodyType::kStatic));
    ball.shape = shape::Ball { 0.5F };
    const auto body = AddBody(glm::vec3(0.0F, 3.0F, 0.0F));
    world_.InsertCollider(std::move(ball), body);
    return body;
  }

  PhysicsWorld world_ { PhysicsConfig {} };
  ColliderHandle ground_collider_ {};
};

//=== Entities ===------------------------------------------------------------//

NOLINT_TEST_F(PhysicsWorldTest, InsertAndRemoveBody)
{
  const auto body = AddBody(glm::vec3(0.0F));
  const auto collider = world_.InsertCollider({}, body);

  EXPECT_TRUE(world_.ContainsBody(body));
  EXPECT_TRUE(world_.ContainsCollider(collider));
  EXPECT_EQ(world_.GetCollider(collider)->parent, body);
  EXPECT_EQ(world_.GetBody(body)->colliders.size(), 1U);

  const auto removed = world_.RemoveBody(body);

  EXPECT_EQ(removed, std::vector { collider });
  EXPECT_FALSE(world_.ContainsBody(body));
  EXPECT_FALSE(world_.ContainsCollider(collider));
  EXPECT_EQ(world_.GetBody(body), nullptr);
  EXPECT_TRUE(world_.RemoveBody(body).empty());
}

NOLINT_TEST_F(PhysicsWorldTest, RemovingBodyRemovesItsJoints)
{
  const auto a = AddBody(glm::vec3(0.0F));
  const auto b = AddBody(glm::vec3(1.0F));
  const auto ball_joint = world_.InsertJoint(a, b, joint::Ball {});

  world_.RemoveBody(b);

  EXPECT_FALSE(world_.ContainsJoint(ball_joint));
  EXPECT_EQ(world_.JointCount(), 0U);
}

NOLINT_TEST_F(PhysicsWorldTest, RemoveColliderDetachesFromBody)
{
  const auto body = AddBody(glm::vec3(0.0F));
  const auto collider = world_.InsertCollider({}, body);

  EXPECT_TRUE(world_.RemoveCollider(collider));
  EXPECT_FALSE(world_.RemoveCollider(collider));
  EXPECT_TRUE(world_.GetBody(body)->colliders.empty());
}

NOLINT_TEST_F(PhysicsWorldTest, InvalidParentsAreRejected)
{
  const auto body = AddBody(glm::vec3(0.0F));
  world_.RemoveBody(body);

  NOLINT_EXPECT_THROW(world_.InsertCollider({}, body), std::invalid_argument);
  NOLINT_EXPECT_THROW(
    world_.InsertJoint(body, body, joint::Fixed {}), std::invalid_argument);
}

NOLINT_TEST_F(PhysicsWorldTest, MassFromDensityAndAdditionalMass)
{
  const auto body = AddBody(glm::vec3(0.0F));
  world_.SetAdditionalMass(body, 2.0F);
  world_.InsertCollider(
    { .shape = shape::Cuboid { glm::vec3(0.5F) }, .density = 3.0F }, body);

  EXPECT_NEAR(world_.BodyMass(body), 5.0F, kTolerance);
}

NOLINT_TEST_F(PhysicsWorldTest, MasslessDynamicBodyGetsUnitMass)
{
  const auto body = AddBody(glm::vec3(0.0F));
  const auto fixed = AddBody(glm::vec3(0.0F), BodyType::kStatic);

  EXPECT_NEAR(world_.BodyMass(body), 1.0F, kTolerance);
  EXPECT_EQ(world_.BodyMass(fixed), 0.0F);
}

NOLINT_TEST_F(PhysicsWorldTest, InvalidShapesAreRejected)
{
  const auto body = AddBody(glm::vec3(0.0F));
  const auto collider = world_.InsertCollider({}, body);

  NOLINT_EXPECT_THROW(world_.InsertCollider(
                        { .shape = shape::Ball { 0.0F } }, body),
    std::invalid_argument);
  EXPECT_FALSE(world_.SetColliderShape(collider, shape::TriMesh {}));
  EXPECT_TRUE(std::holds_alternative<shape::Ball>(
    world_.GetCollider(collider)->shape));

  EXPECT_TRUE(world_.SetColliderShape(collider, shape::Cuboid {}));
  EXPECT_TRUE(std::holds_alternative<shape::Cuboid>(
    world_.GetCollider(collider)->shape));
  EXPECT_EQ(world_.ColliderCount(), 1U);
}

//=== Simulation ===----------------------------------------------------------//

NOLINT_TEST_F(PhysicsWorldTest, DynamicBodyFallsUnderGravity)
{
  const auto body = AddBody(glm::vec3(0.0F, 10.0F, 0.0F));
  const auto dt = world_.GetIntegrationParameters().dt;

  world_.Step();

  const auto* native = world_.GetBody(body);
  EXPECT_NEAR(native->lin_vel.y, -9.81F * dt, kTolerance);
  EXPECT_NEAR(native->position.translation.y, 10.0F - 9.81F * dt * dt,
    kTolerance);
}

NOLINT_TEST_F(PhysicsWorldTest, StaticAndPositionBasedBodiesDoNotMove)
{
  const auto fixed = AddBody(glm::vec3(1.0F), BodyType::kStatic);
  const auto kinematic
    = AddBody(glm::vec3(2.0F), BodyType::kKinematicPositionBased);
  world_.SetLinVel(kinematic, glm::vec3(1.0F));

  world_.Step();

  EXPECT_GLM_NEAR(world_.GetBody(fixed)->position.translation, glm::vec3(1.0F),
    kTolerance);
  EXPECT_GLM_NEAR(world_.GetBody(kinematic)->position.translation,
    glm::vec3(2.0F), kTolerance);
}

NOLINT_TEST_F(PhysicsWorldTest, VelocityBasedBodyIgnoresGravity)
{
  const auto body
    = AddBody(glm::vec3(0.0F), BodyType::kKinematicVelocityBased);
  world_.SetLinVel(body, glm::vec3(1.0F, 0.0F, 0.0F));
  const auto dt = world_.GetIntegrationParameters().dt;

  world_.Step();

  EXPECT_GLM_NEAR(world_.GetBody(body)->position.translation,
    glm::vec3(dt, 0.0F, 0.0F), kTolerance);
}

NOLINT_TEST_F(PhysicsWorldTest, LocksZeroVelocities)
{
  const auto body = AddBody(glm::vec3(0.0F));
  world_.SetTranslationLocked(body, true);
  world_.SetRotationLocked(body, { true, false, true });
  world_.SetAngVel(body, glm::vec3(1.0F, 2.0F, 3.0F));

  world_.Step();

  const auto* native = world_.GetBody(body);
  EXPECT_GLM_NEAR(native->lin_vel, glm::vec3(0.0F), kTolerance);
  EXPECT_GLM_NEAR(native->ang_vel, glm::vec3(0.0F, 2.0F, 0.0F), 1e-3F);
  EXPECT_GLM_NEAR(native->position.translation, glm::vec3(0.0F), kTolerance);
}

NOLINT_TEST_F(PhysicsWorldTest, VelocityIsClamped)
{
  auto params = world_.GetIntegrationParameters();
  params.max_linear_velocity = 2.0F;
  world_.SetIntegrationParameters(params);
  world_.SetGravity(glm::vec3(0.0F));
  const auto body = AddBody(glm::vec3(0.0F));
  world_.SetLinVel(body, glm::vec3(100.0F, 0.0F, 0.0F));

  world_.Step();

  EXPECT_NEAR(glm::length(world_.GetBody(body)->lin_vel), 2.0F, 1e-3F);
}

NOLINT_TEST_F(PhysicsWorldTest, BallJointPullsDynamicBodyToStaticAnchor)
{
  world_.SetGravity(glm::vec3(0.0F));
  const auto anchor = AddBody(glm::vec3(0.0F), BodyType::kStatic);
  const auto bob = AddBody(glm::vec3(3.0F, 0.0F, 0.0F));
  world_.InsertJoint(anchor, bob,
    joint::Ball { .local_anchor1 = glm::vec3(1.0F, 0.0F, 0.0F) });

  StepFor(60);

  // the static body never moves, the dynamic one converges to the anchor
  EXPECT_GLM_NEAR(world_.GetBody(anchor)->position.translation,
    glm::vec3(0.0F), kTolerance);
  EXPECT_GLM_NEAR(world_.GetBody(bob)->position.translation,
    glm::vec3(1.0F, 0.0F, 0.0F), 1e-2F);
}

NOLINT_TEST_F(PhysicsWorldTest, PrismaticJointLeavesAxisFree)
{
  world_.SetGravity(glm::vec3(0.0F));
  const auto base = AddBody(glm::vec3(0.0F), BodyType::kStatic);
  const auto slider = AddBody(glm::vec3(5.0F, 2.0F, 0.0F));
  world_.InsertJoint(base, slider, joint::Prismatic {});

  StepFor(60);

  const auto& position = world_.GetBody(slider)->position.translation;
  EXPECT_NEAR(position.x, 5.0F, 1e-2F);
  EXPECT_NEAR(position.y, 0.0F, 1e-2F);
}

NOLINT_TEST_F(PhysicsWorldTest, JointParamsCanChangeKind)
{
  world_.SetGravity(glm::vec3(0.0F));
  const auto anchor = AddBody(glm::vec3(0.0F), BodyType::kStatic);
  const auto bob = AddBody(glm::vec3(0.0F, 2.0F, 0.0F));
  const auto handle = world_.InsertJoint(anchor, bob, joint::Prismatic {});

  world_.SetJointParams(handle,
    joint::Ball { .local_anchor1 = glm::vec3(0.0F, 2.0F, 0.0F) });
  world_.SetLinVel(bob, glm::vec3(0.0F, 0.0F, 1.0F));
  StepFor(10);

  EXPECT_TRUE(std::holds_alternative<joint::Ball>(
    world_.GetJoint(handle)->params));
  EXPECT_GLM_NEAR(world_.GetBody(bob)->position.translation,
    glm::vec3(0.0F, 2.0F, 0.0F), 1e-2F);
}

//=== Contacts ===------------------------------------------------------------//

NOLINT_TEST_F(PhysicsWorldTest, DynamicBallRestsOnStaticCuboid)
{
  const auto ball = DropBallOnGround({}, {});

  StepFor(120);

  const auto& position = world_.GetBody(ball)->position.translation;
  EXPECT_NEAR(position.y, 1.0F, 0.05F);
  EXPECT_NEAR(position.x, 0.0F, 1e-3F);
}

NOLINT_TEST_F(PhysicsWorldTest, DisjointSolverGroupsLetBallThrough)
{
  const auto ball = DropBallOnGround(
    { .solver_groups = InteractionGroups { .memberships = 0b01, .filter = 0b01 } },
    { .solver_groups
      = InteractionGroups { .memberships = 0b10, .filter = 0b10 } });

  StepFor(120);

  EXPECT_LT(world_.GetBody(ball)->position.translation.y, 0.0F);
}

NOLINT_TEST_F(PhysicsWorldTest, DisjointCollisionGroupsLetBallThrough)
{
  const auto ball = DropBallOnGround(
    { .collision_groups
      = InteractionGroups { .memberships = 0b01, .filter = 0b01 } },
    {});
  world_.SetCollisionGroups(ground_collider_,
    InteractionGroups { .memberships = 0b10, .filter = 0b10 });

  StepFor(120);

  EXPECT_LT(world_.GetBody(ball)->position.translation.y, 0.0F);
}

NOLINT_TEST_F(PhysicsWorldTest, SensorGroundLetsBallThrough)
{
  const auto ball = DropBallOnGround({}, {});
  world_.SetSensor(ground_collider_, true);

  StepFor(120);

  EXPECT_LT(world_.GetBody(ball)->position.translation.y, 0.0F);
}

NOLINT_TEST_F(PhysicsWorldTest, RemovedGroundLetsBallThrough)
{
  const auto ball = DropBallOnGround({}, {});
  StepFor(120);
  ASSERT_NEAR(world_.GetBody(ball)->position.translation.y, 1.0F, 0.05F);

  world_.RemoveCollider(ground_collider_);
  StepFor(60);

  EXPECT_LT(world_.GetBody(ball)->position.translation.y, 0.0F);
}

NOLINT_TEST_F(PhysicsWorldTest, RestitutionMakesBallBounce)
{
  const auto drop = [&](const float x, const float restitution) {
    world_.InsertCollider(
      { .shape = shape::Cuboid { glm::vec3(2.0F, 0.5F, 2.0F) },
        .restitution = restitution },
      AddBody(glm::vec3(x, 0.0F, 0.0F), BodyType::kStatic));
    const auto body = AddBody(glm::vec3(x, 3.0F, 0.0F));
    world_.InsertCollider(
      { .shape = shape::Ball { 0.5F }, .restitution = restitution }, body);
    return body;
  };
  const auto bouncy = drop(-5.0F, 1.0F);
  const auto dead = drop(5.0F, 0.0F);

  // both balls land after about 40 steps
  StepFor(50);
  float bouncy_max = 0.0F;
  float dead_max = 0.0F;
  for (int i = 0; i < 40; ++i) {
    world_.Step();
    bouncy_max
      = std::max(bouncy_max, world_.GetBody(bouncy)->position.translation.y);
    dead_max = std::max(dead_max, world_.GetBody(dead)->position.translation.y);
  }

  EXPECT_GT(bouncy_max, dead_max + 0.5F);
}

NOLINT_TEST_F(PhysicsWorldTest, MovedWorldKeepsSimulating)
{
  const auto ball = DropBallOnGround({}, {});

  PhysicsWorld moved { std::move(world_) };
  for (int i = 0; i < 120; ++i) {
    moved.Step();
  }

  ASSERT_TRUE(moved.ContainsBody(ball));
  EXPECT_NEAR(moved.GetBody(ball)->position.translation.y, 1.0F, 0.05F);
}

NOLINT_TEST_F(PhysicsWorldTest, MaterialSettersUpdateDescription)
{
  DropBallOnGround({}, {});

  world_.SetFriction(ground_collider_, 0.25F);
  world_.SetRestitution(ground_collider_, 0.75F);

  EXPECT_FLOAT_EQ(world_.GetCollider(ground_collider_)->friction, 0.25F);
  EXPECT_FLOAT_EQ(world_.GetCollider(ground_collider_)->restitution, 0.75F);
}

//=== Queries ===-------------------------------------------------------------//

NOLINT_TEST_F(PhysicsWorldTest, CastRayReportsWorldSpaceHits)
{
  const auto near_body = AddBody(glm::vec3(5.0F, 0.0F, 0.0F), BodyType::kStatic);
  const auto far_body = AddBody(glm::vec3(10.0F, 0.0F, 0.0F), BodyType::kStatic);
  const auto near_collider
    = world_.InsertCollider({ .shape = shape::Ball { 1.0F } }, near_body);
  const auto far_collider
    = world_.InsertCollider({ .shape = shape::Cuboid {} }, far_body);

  std::vector<std::pair<ColliderHandle, RayHit>> hits;
  world_.CastRay(Ray { .origin = glm::vec3(0.0F),
                   .direction = glm::vec3(1.0F, 0.0F, 0.0F) },
    100.0F, InteractionGroups {},
    [&](const ColliderHandle collider, const RayHit& hit) {
      hits.emplace_back(collider, hit);
      return true;
    });

  ASSERT_EQ(hits.size(), 2U);
  for (const auto& [collider, hit] : hits) {
    if (collider == near_collider) {
      EXPECT_NEAR(hit.toi, 4.0F, 1e-3F);
      EXPECT_GLM_NEAR(hit.normal, glm::vec3(-1.0F, 0.0F, 0.0F), 1e-3F);
    } else {
      EXPECT_EQ(collider, far_collider);
      EXPECT_NEAR(hit.toi, 9.5F, 1e-3F);
    }
  }
}

NOLINT_TEST(PhysicsWorldRayTest, EveryShapeKindIsHit)
{
  struct Case {
    const char* name;
    argon::physics::Shape shape;
    Ray ray;
    float toi;
    bool triangle_based;
  };
  const Ray along_x { .origin = glm::vec3(0.0F, 0.0F, 0.1F),
    .direction = glm::vec3(1.0F, 0.0F, 0.0F) };
  const shape::Triangle upright {
    .a = glm::vec3(0.0F, -1.0F, -1.0F),
    .b = glm::vec3(0.0F, -1.0F, 1.0F),
    .c = glm::vec3(0.0F, 1.0F, 0.0F),
  };
  const std::vector<Case> cases {
    { "ball", shape::Ball { 1.0F }, along_x, 4.0F, false },
    { "cuboid", shape::Cuboid { glm::vec3(1.0F) }, along_x, 4.0F, false },
    { "capsule",
      shape::Capsule { .begin = glm::vec3(0.0F, -1.0F, 0.0F),
        .end = glm::vec3(0.0F, 1.0F, 0.0F),
        .radius = 1.0F },
      along_x, 4.0F, false },
    { "cylinder", shape::Cylinder { 1.0F, 1.0F }, along_x, 4.0F, false },
    { "round cylinder", shape::RoundCylinder { 1.0F, 0.8F, 0.2F }, along_x,
      4.0F, false },
    // half way up, the cone is half as wide
    { "cone", shape::Cone { 1.0F, 1.0F }, along_x, 4.5F, false },
    { "segment",
      shape::Segment { .begin = glm::vec3(0.0F, -1.0F, 0.0F),
        .end = glm::vec3(0.0F, 1.0F, 0.0F) },
      Ray { .origin = glm::vec3(0.0F, 0.1F, 0.0F),
        .direction = glm::vec3(1.0F, 0.0F, 0.0F) },
      5.0F, false },
    { "triangle", upright, along_x, 5.0F, true },
    { "trimesh",
      shape::TriMesh { .vertices = { upright.a, upright.b, upright.c },
        .indices = { { 0U, 1U, 2U } } },
      along_x, 5.0F, true },
    { "height field",
      shape::HeightField { .rows = 3,
        .columns = 3,
        .heights = std::vector<float>(9, 0.0F),
        .scale = glm::vec3(4.0F, 1.0F, 4.0F) },
      Ray { .origin = glm::vec3(5.1F, 5.0F, 0.1F),
        .direction = glm::vec3(0.0F, -1.0F, 0.0F) },
      5.0F, true },
  };

  for (const auto& test_case : cases) {
    SCOPED_TRACE(test_case.name);
    PhysicsWorld world;
    const auto body = world.InsertBody(NativeBody {
      .body_type = BodyType::kStatic,
      .position = Isometry { .translation = glm::vec3(5.0F, 0.0F, 0.0F) },
    });
    const auto collider
      = world.InsertCollider({ .shape = test_case.shape }, body);

    std::vector<RayHit> hits;
    world.CastRay(test_case.ray, 100.0F, InteractionGroups {},
      [&](const ColliderHandle hit_collider, const RayHit& hit) {
        EXPECT_EQ(hit_collider, collider);
        hits.push_back(hit);
        return true;
      });

    ASSERT_EQ(hits.size(), 1U);
    EXPECT_NEAR(hits.front().toi, test_case.toi, 0.05F);
    EXPECT_EQ(hits.front().feature.kind,
      test_case.triangle_based ? FeatureId::Kind::kFace
                               : FeatureId::Kind::kUnknown);
  }
}

NOLINT_TEST_F(PhysicsWorldTest, CastRayScalesToiWithDirection)
{
  world_.InsertCollider({ .shape = shape::Ball { 1.0F } },
    AddBody(glm::vec3(5.0F, 0.0F, 0.0F), BodyType::kStatic));
  const Ray ray { .origin = glm::vec3(0.0F),
    .direction = glm::vec3(2.0F, 0.0F, 0.0F) };

  std::vector<float> tois;
  const auto collect = [&](ColliderHandle, const RayHit& hit) {
    tois.push_back(hit.toi);
    return true;
  };
  world_.CastRay(ray, 1.5F, InteractionGroups {}, collect);
  EXPECT_TRUE(tois.empty());

  world_.CastRay(ray, 10.0F, InteractionGroups {}, collect);
  ASSERT_EQ(tois.size(), 1U);
  EXPECT_NEAR(tois.front(), 2.0F, 1e-3F);

  world_.CastRay(Ray { .origin = glm::vec3(0.0F) }, 10.0F,
    InteractionGroups {}, collect);
  EXPECT_EQ(tois.size(), 1U);
}

NOLINT_TEST_F(PhysicsWorldTest, CastRayHonorsGroupsAndRemovals)
{
  const auto a = AddBody(glm::vec3(5.0F, 0.0F, 0.0F), BodyType::kStatic);
  const auto b = AddBody(glm::vec3(10.0F, 0.0F, 0.0F), BodyType::kStatic);
  world_.InsertCollider(
    { .collision_groups = InteractionGroups { .memberships = 0b01 } }, a);
  const auto hidden = world_.InsertCollider(
    { .collision_groups = InteractionGroups { .memberships = 0b10 } }, b);

  const auto count_hits = [&](const InteractionGroups groups) {
    int count = 0;
    world_.CastRay(Ray { .origin = glm::vec3(0.0F),
                     .direction = glm::vec3(1.0F, 0.0F, 0.0F) },
      100.0F, groups, [&](ColliderHandle, const RayHit&) {
        ++count;
        return true;
      });
    return count;
  };

  EXPECT_EQ(count_hits(InteractionGroups {}), 2);
  EXPECT_EQ(count_hits(InteractionGroups { .filter = 0b01 }), 1);

  world_.RemoveCollider(hidden);
  EXPECT_EQ(count_hits(InteractionGroups {}), 1);
}

NOLINT_TEST_F(PhysicsWorldTest, CastRayStopsWhenCallbackRefuses)
{
  for (int i = 1; i <= 3; ++i) {
    world_.InsertCollider({},
      AddBody(glm::vec3(static_cast<float>(i) * 5.0F, 0.0F, 0.0F),
        BodyType::kStatic));
  }

  int count = 0;
  world_.CastRay(Ray { .origin = glm::vec3(0.0F),
                   .direction = glm::vec3(1.0F, 0.0F, 0.0F) },
    100.0F, InteractionGroups {}, [&](ColliderHandle, const RayHit&) {
      ++count;
      return false;
    });

  EXPECT_EQ(count, 1);
}

//=== Statistics ===----------------------------------------------------------//

NOLINT_TEST_F(PhysicsWorldTest, PerformanceStatisticsAccumulateAndReset)
{
  world_.InsertCollider({}, AddBody(glm::vec3(2.0F, 0.0F, 0.0F)));
  world_.Step();
  world_.CastRay(Ray { .direction = glm::vec3(1.0F, 0.0F, 0.0F) }, 10.0F,
    InteractionGroups {}, [](ColliderHandle, const RayHit&) { return true; });

  EXPECT_GT(world_.GetPerformance().total_ray_cast_time.count(), 0);

  world_.ResetPerformance();
  EXPECT_EQ(world_.GetPerformance().step_time.count(), 0);
  EXPECT_EQ(world_.GetPerformance().total_ray_cast_time.count(), 0);
}

NOLINT_TEST(PerformanceStatisticsTest, ToString)
{
  const PerformanceStatistics stats {
    .step_time = std::chrono::microseconds(1500),
    .total_ray_cast_time = std::chrono::microseconds(250),
  };

  EXPECT_EQ(to_string(stats),
    "Physics Step Time: 1.500ms\nPhysics Ray Cast Time: 0.250ms");
}

//=== Debug draw ===----------------------------------------------------------//

NOLINT_TEST_F(PhysicsWorldTest, DrawEmitsGizmoPerBodyAndShapePerCollider)
{
  const auto body = AddBody(glm::vec3(1.0F, 2.0F, 3.0F));
  world_.InsertCollider({ .shape = shape::Ball { 0.5F } }, body);
  world_.InsertCollider({ .shape = shape::Cuboid {} }, body);
  world_.InsertCollider({ .shape = shape::Cylinder {} }, body);
  world_.InsertCollider({ .shape = shape::RoundCylinder {} }, body);
  world_.InsertCollider({ .shape = shape::Cone {} }, body);
  world_.InsertCollider({ .shape = shape::Capsule {} }, body);
  world_.InsertCollider(
    { .shape = shape::HeightField { .rows = 2,
        .columns = 3,
        .heights = std::vector<float>(6, 0.0F) } },
    body);
  const auto grey = Color::Opaque(200, 200, 200);

  MockDrawingContext context;
  EXPECT_CALL(context, DrawTransform(_)).Times(1);
  EXPECT_CALL(context,
    DrawSphere(glm::vec3(1.0F, 2.0F, 3.0F), _, _, 0.5F, grey))
    .Times(1);
  EXPECT_CALL(context, DrawOrientedBox(_, _, _, grey)).Times(1);
  EXPECT_CALL(context, DrawCylinder(_, _, _, true, _, grey)).Times(1);
  EXPECT_CALL(context, DrawCylinder(_, _, _, false, _, grey)).Times(1);
  EXPECT_CALL(context, DrawCone(_, _, _, _, grey)).Times(1);
  EXPECT_CALL(context, DrawSegmentCapsule(_, _, _, _, _, _, grey)).Times(1);
  EXPECT_CALL(context, DrawTriangle(_, _, _, grey)).Times(4);

  world_.Draw(context);
}

} // namespace
