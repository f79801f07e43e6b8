//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec4.hpp>

#include <Argon/Testing/GTest.h>

#include <Argon/Scene/TemplateVariable.h>
#include <Argon/Scene/Transform.h>

using argon::scene::TemplateVariable;
using argon::scene::Transform;

namespace {

constexpr float kTolerance = 1e-5F;

auto Apply(const glm::mat4& matrix, const glm::vec3& point) -> glm::vec3
{
  return glm::vec3(matrix * glm::vec4(point, 1.0F));
}

//=== TemplateVariable ===----------------------------------------------------//

NOLINT_TEST(TemplateVariableTest, SyncFromTemplateSkipsCustomValues)
{
  TemplateVariable<int> inherited { 1 };
  TemplateVariable<int> custom { 1 };
  custom.Set(2);

  EXPECT_TRUE(inherited.SyncFromTemplate(5));
  EXPECT_FALSE(custom.SyncFromTemplate(5));

  EXPECT_EQ(*inherited, 5);
  EXPECT_FALSE(inherited.IsCustom());
  EXPECT_EQ(*custom, 2);
  EXPECT_TRUE(custom.IsCustom());
}

NOLINT_TEST(TemplateVariableTest, RestoreKeepsGivenFlag)
{
  TemplateVariable<int> variable;

  variable.Restore(7, false);
  EXPECT_FALSE(variable.IsCustom());
  variable.Restore(8, true);

  EXPECT_EQ(variable.Get(), 8);
  EXPECT_TRUE(variable.IsCustom());
}

//=== Transform ===-----------------------------------------------------------//

NOLINT_TEST(TransformTest, DefaultIsIdentity)
{
  const Transform transform;

  EXPECT_EQ(transform.Matrix(), glm::mat4 { 1.0F });
  EXPECT_FALSE(transform.GetPosition().IsCustom());
  EXPECT_FALSE(transform.GetScale().IsCustom());
}

NOLINT_TEST(TransformTest, MatrixAppliesScaleThenRotationThenTranslation)
{
  // Arrange
  Transform transform;
  transform.SetPosition({ 1.0F, 0.0F, 0.0F })
    .SetRotation(glm::angleAxis(glm::half_pi<float>(), glm::vec3(0, 1, 0)))
    .SetScale({ 2.0F, 2.0F, 2.0F });

  // Act
  const auto point = Apply(transform.Matrix(), { 1.0F, 0.0F, 0.0F });

  // Assert
  EXPECT_GLM_NEAR(point, glm::vec3(1.0F, 0.0F, -2.0F), kTolerance);
}

NOLINT_TEST(TransformTest, ScalingPivotIsAFixedPoint)
{
  Transform transform;
  transform.SetScale({ 3.0F, 3.0F, 3.0F }).SetScalingPivot({ 1.0F, 1.0F, 1.0F });

  EXPECT_GLM_NEAR(Apply(transform.Matrix(), { 1.0F, 1.0F, 1.0F }),
    glm::vec3(1.0F, 1.0F, 1.0F), kTolerance);
  EXPECT_GLM_NEAR(Apply(transform.Matrix(), { 2.0F, 1.0F, 1.0F }),
    glm::vec3(4.0F, 1.0F, 1.0F), kTolerance);
}

NOLINT_TEST(TransformTest, RotationPivotIsAFixedPoint)
{
  Transform transform;
  transform
    .SetRotation(glm::angleAxis(glm::pi<float>(), glm::vec3(0, 0, 1)))
    .SetRotationPivot({ 1.0F, 0.0F, 0.0F });

  EXPECT_GLM_NEAR(Apply(transform.Matrix(), { 1.0F, 0.0F, 0.0F }),
    glm::vec3(1.0F, 0.0F, 0.0F), kTolerance);
  EXPECT_GLM_NEAR(Apply(transform.Matrix(), { 2.0F, 0.0F, 0.0F }),
    glm::vec3(0.0F, 0.0F, 0.0F), kTolerance);
}

NOLINT_TEST(TransformTest, OffsetsAreTranslations)
{
  Transform transform;
  transform.SetRotationOffset({ 0.0F, 1.0F, 0.0F })
    .SetScalingOffset({ 0.0F, 0.0F, 1.0F });

  EXPECT_GLM_NEAR(Apply(transform.Matrix(), glm::vec3 { 0.0F }),
    glm::vec3(0.0F, 1.0F, 1.0F), kTolerance);
}

NOLINT_TEST(TransformTest, IsometricMatrixIgnoresScale)
{
  Transform transform;
  transform.SetPosition({ 0.0F, 2.0F, 0.0F }).SetScale({ 5.0F, 5.0F, 5.0F });

  EXPECT_GLM_NEAR(Apply(transform.IsometricMatrix(), { 1.0F, 0.0F, 0.0F }),
    glm::vec3(1.0F, 2.0F, 0.0F), kTolerance);
}

NOLINT_TEST(TransformTest, OffsetMovesPosition)
{
  Transform transform;
  transform.SetPosition({ 1.0F, 1.0F, 1.0F }).Offset({ 1.0F, 0.0F, -1.0F });

  EXPECT_EQ(*transform.GetPosition(), glm::vec3(2.0F, 1.0F, 0.0F));
}

NOLINT_TEST(TransformTest, SyncFromTemplateKeepsEditedComponents)
{
  // Arrange
  Transform source;
  source.SetPosition({ 1.0F, 2.0F, 3.0F }).SetScale({ 4.0F, 4.0F, 4.0F });
  Transform instance;
  instance.SetScale({ 0.5F, 0.5F, 0.5F });

  // Act
  instance.SyncFromTemplate(source);

  // Assert
  EXPECT_EQ(*instance.GetPosition(), glm::vec3(1.0F, 2.0F, 3.0F));
  EXPECT_FALSE(instance.GetPosition().IsCustom());
  EXPECT_EQ(*instance.GetScale(), glm::vec3(0.5F));
}

NOLINT_TEST(TransformTest, ForEachComponentVisitsAllComponents)
{
  const Transform transform;
  int count = 0;

  transform.ForEachComponent(
    [&count](const char* /*name*/, const auto& /*variable*/) { ++count; });

  EXPECT_EQ(count, 9);
}

} // namespace
