//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/gtc/matrix_transform.hpp>

#include <Argon/Scene/Transform.h>

using argon::scene::Transform;

auto Transform::SetPosition(const Vec3& position) -> Transform&
{
  position_.Set(position);
  return *this;
}

auto Transform::SetRotation(const Quat& rotation) -> Transform&
{
  rotation_.Set(rotation);
  return *this;
}

auto Transform::SetScale(const Vec3& scale) -> Transform&
{
  scale_.Set(scale);
  return *this;
}

auto Transform::SetPreRotation(const Quat& pre_rotation) -> Transform&
{
  pre_rotation_.Set(pre_rotation);
  return *this;
}

auto Transform::SetPostRotation(const Quat& post_rotation) -> Transform&
{
  post_rotation_.Set(post_rotation);
  return *this;
}

auto Transform::SetRotationOffset(const Vec3& offset) -> Transform&
{
  rotation_offset_.Set(offset);
  return *this;
}

auto Transform::SetRotationPivot(const Vec3& pivot) -> Transform&
{
  rotation_pivot_.Set(pivot);
  return *this;
}

auto Transform::SetScalingOffset(const Vec3& offset) -> Transform&
{
  scaling_offset_.Set(offset);
  return *this;
}

auto Transform::SetScalingPivot(const Vec3& pivot) -> Transform&
{
  scaling_pivot_.Set(pivot);
  return *this;
}

auto Transform::Offset(const Vec3& offset) -> Transform&
{
  position_.Set(*position_ + offset);
  return *this;
}

auto Transform::SyncFromTemplate(const Transform& source) -> void
{
  position_.SyncFromTemplate(*source.position_);
  rotation_.SyncFromTemplate(*source.rotation_);
  scale_.SyncFromTemplate(*source.scale_);
  pre_rotation_.SyncFromTemplate(*source.pre_rotation_);
  post_rotation_.SyncFromTemplate(*source.post_rotation_);
  rotation_offset_.SyncFromTemplate(*source.rotation_offset_);
  rotation_pivot_.SyncFromTemplate(*source.rotation_pivot_);
  scaling_offset_.SyncFromTemplate(*source.scaling_offset_);
  scaling_pivot_.SyncFromTemplate(*source.scaling_pivot_);
}

auto Transform::ClearCustomFlags() -> void
{
  ForEachComponent([](const char* /*name*/, auto& variable) {
    variable.Restore(*variable, false);
  });
}

auto Transform::Matrix() const -> Mat4
{
  constexpr Mat4 identity { 1.0F };

  const Mat4 translation = glm::translate(identity, *position_);
  const Mat4 rotation_offset = glm::translate(identity, *rotation_offset_);
  const Mat4 rotation_pivot = glm::translate(identity, *rotation_pivot_);
  const Mat4 inv_rotation_pivot = glm::translate(identity, -*rotation_pivot_);
  const Mat4 pre_rotation = glm::mat4_cast(*pre_rotation_);
  const Mat4 rotation = glm::mat4_cast(*rotation_);
  const Mat4 inv_post_rotation = glm::mat4_cast(glm::inverse(*post_rotation_));
  const Mat4 scaling_offset = glm::translate(identity, *scaling_offset_);
  const Mat4 scaling_pivot = glm::translate(identity, *scaling_pivot_);
  const Mat4 inv_scaling_pivot = glm::translate(identity, -*scaling_pivot_);
  const Mat4 scale = glm::scale(identity, *scale_);

  return translation * rotation_offset * rotation_pivot * pre_rotation
    * rotation * inv_post_rotation * inv_rotation_pivot * scaling_offset
    * scaling_pivot * scale * inv_scaling_pivot;
}

auto Transform::IsometricMatrix() const -> Mat4
{
  return glm::translate(Mat4 { 1.0F }, *position_)
    * glm::mat4_cast(*pre_rotation_) * glm::mat4_cast(*rotation_)
    * glm::mat4_cast(glm::inverse(*post_rotation_));
}
