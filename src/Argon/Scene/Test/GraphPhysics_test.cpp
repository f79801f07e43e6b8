//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <utility>
#include <variant>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <Argon/Testing/GTest.h>

#include <Argon/Scene/Graph.h>

using argon::physics::BodyType;
using argon::physics::InteractionGroups;
using argon::scene::Collider;
using argon::scene::ColliderChange;
using argon::scene::FixedQueryResults;
using argon::scene::Graph;
using argon::scene::Joint;
using argon::scene::JointChange;
using argon::scene::Node;
using argon::scene::NodeHandle;
using argon::scene::Pivot;
using argon::scene::RayCastOptions;
using argon::scene::RigidBody;
using argon::scene::VectorQueryResults;

namespace shape = argon::physics::shape;
namespace joint = argon::physics::joint;

namespace {

constexpr float kTolerance = 1e-4F;
const glm::vec2 kFrameSize { 800.0F, 600.0F };
constexpr float kDt = 1.0F / 60.0F;

class GraphPhysicsTest : public testing::Test {
protected:
  auto AddBody(const glm::vec3& position,
    const BodyType body_type = BodyType::kStatic) -> NodeHandle
  {
    auto node = Node(RigidBody(body_type), "body");
    node.GetLocalTransform().SetPosition(position);
    return graph_.AddNode(std::move(node));
  }

  auto AddCollider(const NodeHandle body, const float radius = 1.0F)
    -> NodeHandle
  {
    const auto collider
      = graph_.AddNode(Node(Collider(shape::Ball { radius }), "collider"));
    graph_.LinkNodes(collider, body);
    return collider;
  }

  auto Body(const NodeHandle handle) -> RigidBody&
  {
    return graph_[handle].As<RigidBody>();
  }

  auto Update() -> void { graph_.Update(kFrameSize, kDt); }

  Graph graph_;
};

//=== Synchronization ===-----------------------------------------------------//

NOLINT_TEST_F(GraphPhysicsTest, UpdateCreatesNativeEntities)
{
  // Arrange
  const auto body = AddBody({ 0.0F, 0.0F, 5.0F });
  const auto collider = AddCollider(body);
  EXPECT_EQ(graph_.GetPhysics().BodyCount(), 0U);

  // Act
  Update();

  // Assert
  const auto native_body = Body(body).GetNative();
  const auto native_collider = graph_[collider].As<Collider>().GetNative();
  EXPECT_TRUE(graph_.GetPhysics().ContainsBody(native_body));
  EXPECT_TRUE(graph_.GetPhysics().ContainsCollider(native_collider));
  EXPECT_EQ(graph_.FindColliderNode(native_collider), collider);
  EXPECT_GLM_NEAR(graph_.GetPhysics().GetBody(native_body)->position.translation,
    glm::vec3(0.0F, 0.0F, 5.0F), kTolerance);
}

NOLINT_TEST_F(GraphPhysicsTest, ColliderOutsideOfBodyHasNoNative)
{
  const auto collider
    = graph_.AddNode(Node(Collider(shape::Ball { 1.0F }), "loose"));

  Update();

  EXPECT_FALSE(graph_.GetPhysics().ContainsCollider(
    graph_[collider].As<Collider>().GetNative()));
  EXPECT_EQ(graph_.GetPhysics().ColliderCount(), 0U);
}

NOLINT_TEST_F(GraphPhysicsTest, UnlinkedColliderLosesItsNative)
{
  // Arrange
  const auto body = AddBody({ 0.0F, 0.0F, 0.0F });
  const auto collider = AddCollider(body);
  Update();
  const auto native = graph_[collider].As<Collider>().GetNative();

  // Act
  graph_.UnlinkNode(collider);

  // Assert
  EXPECT_FALSE(graph_.GetPhysics().ContainsCollider(native));
  EXPECT_TRUE(graph_.FindColliderNode(native).IsNone());

  // Linking it again recreates it on the next update
  graph_.LinkNodes(collider, body);
  Update();
  EXPECT_EQ(graph_.GetPhysics().ColliderCount(), 1U);
}

NOLINT_TEST_F(GraphPhysicsTest, JointWaitsForBothBodies)
{
  // Arrange
  const auto body1 = AddBody({ 0.0F, 0.0F, 0.0F });
  auto [ticket, node] = graph_.TakeReserve(AddBody({ 1.0F, 0.0F, 0.0F }));
  const auto body2 = ticket.GetHandle();
  const auto joint = graph_.AddNode(
    Node(Joint(joint::Ball {}, body1, body2), "joint"));

  // Act
  Update();

  // Assert
  EXPECT_EQ(graph_.GetPhysics().JointCount(), 0U);

  graph_.PutBack(std::move(ticket), std::move(node));
  Update();
  EXPECT_EQ(graph_.GetPhysics().JointCount(), 1U);
  EXPECT_TRUE(graph_.GetPhysics().ContainsJoint(
    graph_[joint].As<Joint>().GetNative()));
}

NOLINT_TEST_F(GraphPhysicsTest, ChangedBodiesOfLiveJointAreIgnored)
{
  // Arrange
  const auto body1 = AddBody({ 0.0F, 0.0F, 0.0F });
  const auto body2 = AddBody({ 1.0F, 0.0F, 0.0F });
  const auto body3 = AddBody({ 2.0F, 0.0F, 0.0F });
  const auto joint = graph_.AddNode(
    Node(Joint(joint::Ball {}, body1, body2), "joint"));
  Update();
  const auto native = graph_[joint].As<Joint>().GetNative();

  // Act
  graph_[joint].As<Joint>().SetBody2(body3);
  Update();

  // Assert
  const auto& joint_node = graph_[joint].As<Joint>();
  EXPECT_FALSE(joint_node.GetChanges().Contains(JointChange::kBody2));
  EXPECT_EQ(joint_node.GetNative(), native);
  EXPECT_EQ(graph_.GetPhysics().GetJoint(native)->body2,
    Body(body2).GetNative());
}

NOLINT_TEST_F(GraphPhysicsTest, RemoveNodeReleasesNativeEntities)
{
  // Arrange
  const auto body1 = AddBody({ 0.0F, 0.0F, 0.0F });
  const auto body2 = AddBody({ 1.0F, 0.0F, 0.0F });
  const auto collider = AddCollider(body1);
  graph_.AddNode(Node(Joint(joint::Ball {}, body1, body2), "joint"));
  Update();
  const auto native_collider = graph_[collider].As<Collider>().GetNative();

  // Act
  graph_.RemoveNode(body1);

  // Assert
  EXPECT_EQ(graph_.GetPhysics().BodyCount(), 1U);
  EXPECT_EQ(graph_.GetPhysics().ColliderCount(), 0U);
  EXPECT_EQ(graph_.GetPhysics().JointCount(), 0U);
  EXPECT_TRUE(graph_.FindColliderNode(native_collider).IsNone());
}

NOLINT_TEST_F(GraphPhysicsTest, NodeChangesArePushedOnce)
{
  // Arrange
  const auto body = AddBody({ 0.0F, 0.0F, 0.0F });
  const auto collider = AddCollider(body);
  Update();

  // Act
  Body(body).SetMass(3.0F);
  graph_[collider].As<Collider>().SetFriction(0.25F);
  graph_[collider].As<Collider>().SetCollisionGroups(
    InteractionGroups { .memberships = 0b10 });
  Update();

  // Assert
  const auto& physics = graph_.GetPhysics();
  EXPECT_FLOAT_EQ(physics.GetBody(Body(body).GetNative())->additional_mass, 3.0F);
  const auto& collider_node = graph_[collider].As<Collider>();
  const auto* native = physics.GetCollider(collider_node.GetNative());
  EXPECT_FLOAT_EQ(native->friction, 0.25F);
  EXPECT_EQ(native->collision_groups.memberships, 0b10U);
  EXPECT_TRUE(collider_node.GetChanges().IsEmpty());
  EXPECT_TRUE(Body(body).GetChanges().IsEmpty());
}

NOLINT_TEST_F(GraphPhysicsTest, ShapeChangeIsApplied)
{
  const auto body = AddBody({ 0.0F, 0.0F, 0.0F });
  const auto collider = AddCollider(body);
  Update();

  graph_[collider].As<Collider>().SetShape(shape::Cuboid {});
  Update();

  const auto& collider_node = graph_[collider].As<Collider>();
  EXPECT_FALSE(collider_node.GetChanges().Contains(ColliderChange::kShape));
  EXPECT_TRUE(std::holds_alternative<shape::Cuboid>(
    graph_.GetPhysics().GetCollider(collider_node.GetNative())->shape));
}

NOLINT_TEST_F(GraphPhysicsTest, SimulationResultsAreCopiedBack)
{
  // Arrange
  const auto body = AddBody({ 0.0F, 10.0F, 0.0F }, BodyType::kDynamic);
  AddCollider(body);

  // Act
  for (int i = 0; i < 10; ++i) {
    Update();
  }

  // Assert
  const auto& node = graph_[body];
  EXPECT_LT((*node.GetLocalTransform().GetPosition()).y, 10.0F);
  EXPECT_LT(Body(body).GetLinVel().y, 0.0F);
  // pulling the simulation results is not an edit
  EXPECT_FALSE(Body(body).IsTransformModified());
  EXPECT_TRUE(Body(body).GetChanges().IsEmpty());
}

NOLINT_TEST_F(GraphPhysicsTest, TransformEditIsPushedToSimulation)
{
  // Arrange
  const auto body = AddBody({ 0.0F, 0.0F, 0.0F });
  Update();

  // Act
  auto& node = graph_[body];
  node.GetLocalTransform().SetPosition({ 3.0F, 0.0F, 0.0F });
  node.MarkTransformModified();
  Update();

  // Assert
  EXPECT_GLM_NEAR(
    graph_.GetPhysics().GetBody(Body(body).GetNative())->position.translation,
    glm::vec3(3.0F, 0.0F, 0.0F), kTolerance);
}

NOLINT_TEST_F(GraphPhysicsTest, TranslationLockIsPushedOnce)
{
  // Arrange
  const auto body = AddBody({ 0.0F, 10.0F, 0.0F }, BodyType::kDynamic);
  AddCollider(body);
  Update();

  // Act
  Body(body).SetTranslationLocked(true);
  EXPECT_TRUE(Body(body).GetChanges().Contains(
    argon::scene::RigidBodyChange::kTranslationLocked));
  Update();
  const float locked_y = (*graph_[body].GetLocalTransform().GetPosition()).y;
  for (int i = 0; i < 10; ++i) {
    Update();
  }

  // Assert
  EXPECT_TRUE(
    graph_.GetPhysics().GetBody(Body(body).GetNative())->translation_locked);
  EXPECT_TRUE(Body(body).GetChanges().IsEmpty());
  EXPECT_NEAR(
    (*graph_[body].GetLocalTransform().GetPosition()).y, locked_y, kTolerance);
}

NOLINT_TEST_F(GraphPhysicsTest, DynamicBallLandsOnStaticGround)
{
  // Arrange
  const auto ground = AddBody({ 0.0F, 0.0F, 0.0F });
  graph_.LinkNodes(graph_.AddNode(Node(
                     Collider(shape::Cuboid { glm::vec3(5.0F, 0.5F, 5.0F) }),
                     "ground collider")),
    ground);
  const auto ball = AddBody({ 0.0F, 3.0F, 0.0F }, BodyType::kDynamic);
  AddCollider(ball, 0.5F);

  // Act
  for (int i = 0; i < 120; ++i) {
    Update();
  }

  // Assert
  EXPECT_NEAR((*graph_[ball].GetLocalTransform().GetPosition()).y, 1.0F, 0.05F);
}

//=== Ray casts ===-----------------------------------------------------------//

class GraphRayCastTest : public GraphPhysicsTest {
protected:
  void SetUp() override
  {
    far_ = AddCollider(AddBody({ 0.0F, 0.0F, 10.0F }));
    near_ = AddCollider(AddBody({ 0.0F, 0.0F, 5.0F }));
    Update();
  }

  NodeHandle near_;
  NodeHandle far_;
};

NOLINT_TEST_F(GraphRayCastTest, HitsAreSortedAndMappedToNodes)
{
  // Arrange
  VectorQueryResults results;

  // Act
  graph_.CastRay(RayCastOptions { .direction = { 0.0F, 0.0F, 2.0F } }, results);

  // Assert
  ASSERT_EQ(results.Size(), 2U);
  EXPECT_EQ(results[0].collider, near_);
  EXPECT_NEAR(results[0].toi, 4.0F, kTolerance);
  EXPECT_GLM_NEAR(results[0].position, glm::vec3(0.0F, 0.0F, 4.0F), kTolerance);
  EXPECT_EQ(results[1].collider, far_);
  EXPECT_NEAR(results[1].toi, 9.0F, kTolerance);
}

NOLINT_TEST_F(GraphRayCastTest, MaxLengthLimitsHits)
{
  VectorQueryResults results;

  graph_.CastRay(
    RayCastOptions { .direction = { 0.0F, 0.0F, 1.0F }, .max_len = 6.0F },
    results);

  ASSERT_EQ(results.Size(), 1U);
  EXPECT_EQ(results[0].collider, near_);
}

NOLINT_TEST_F(GraphRayCastTest, FixedStorageStopsWhenFull)
{
  FixedQueryResults<1> results;

  graph_.CastRay(RayCastOptions { .direction = { 0.0F, 0.0F, 1.0F } }, results);

  EXPECT_EQ(results.Size(), 1U);
}

NOLINT_TEST_F(GraphRayCastTest, DegenerateDirectionHitsNothing)
{
  VectorQueryResults results;
  graph_.CastRay(RayCastOptions { .direction = { 0.0F, 0.0F, 1.0F } }, results);
  ASSERT_EQ(results.Size(), 2U);

  graph_.CastRay(RayCastOptions { .direction = glm::vec3 { 0.0F } }, results);

  EXPECT_EQ(results.Size(), 0U);
}

NOLINT_TEST_F(GraphRayCastTest, RemovedColliderIsNotHit)
{
  VectorQueryResults results;

  graph_.RemoveNode(near_);
  graph_.CastRay(RayCastOptions { .direction = { 0.0F, 0.0F, 1.0F } }, results);

  ASSERT_EQ(results.Size(), 1U);
  EXPECT_EQ(results[0].collider, far_);
}

} // namespace
