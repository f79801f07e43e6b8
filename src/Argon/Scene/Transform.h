//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <Argon/Scene/TemplateVariable.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! Local transform of a node, with the compound pivots used by modeling tools.
/*!
 Besides the usual translation, rotation and scale, the transform carries the
 pre/post rotations, rotation offset/pivot, and scaling offset/pivot found in
 assets authored with DCC tools. The local matrix is composed as:

 \code
   T * Roff * Rp * Rpre * R * Rpost^-1 * Rp^-1 * Soff * Sp * S * Sp^-1
 \endcode

 With all the extra components at identity, this reduces to the usual
 `T * R * S`.

 Every component is a TemplateVariable: setters mark it as custom, so that
 SyncFromTemplate() leaves it alone.
*/
class Transform {
public:
  using Vec3 = glm::vec3;
  using Quat = glm::quat;
  using Mat4 = glm::mat4;

  Transform() = default;

  //=== Getters ===-----------------------------------------------------------//

  [[nodiscard]] auto GetPosition() const noexcept -> const TemplateVariable<Vec3>&
  {
    return position_;
  }
  [[nodiscard]] auto GetRotation() const noexcept -> const TemplateVariable<Quat>&
  {
    return rotation_;
  }
  [[nodiscard]] auto GetScale() const noexcept -> const TemplateVariable<Vec3>&
  {
    return scale_;
  }
  [[nodiscard]] auto GetPreRotation() const noexcept
    -> const TemplateVariable<Quat>&
  {
    return pre_rotation_;
  }
  [[nodiscard]] auto GetPostRotation() const noexcept
    -> const TemplateVariable<Quat>&
  {
    return post_rotation_;
  }
  [[nodiscard]] auto GetRotationOffset() const noexcept
    -> const TemplateVariable<Vec3>&
  {
    return rotation_offset_;
  }
  [[nodiscard]] auto GetRotationPivot() const noexcept
    -> const TemplateVariable<Vec3>&
  {
    return rotation_pivot_;
  }
  [[nodiscard]] auto GetScalingOffset() const noexcept
    -> const TemplateVariable<Vec3>&
  {
    return scaling_offset_;
  }
  [[nodiscard]] auto GetScalingPivot() const noexcept
    -> const TemplateVariable<Vec3>&
  {
    return scaling_pivot_;
  }

  //=== Setters ===-----------------------------------------------------------//

  ARGN_SCN_API auto SetPosition(const Vec3& position) -> Transform&;
  ARGN_SCN_API auto SetRotation(const Quat& rotation) -> Transform&;
  ARGN_SCN_API auto SetScale(const Vec3& scale) -> Transform&;
  ARGN_SCN_API auto SetPreRotation(const Quat& pre_rotation) -> Transform&;
  ARGN_SCN_API auto SetPostRotation(const Quat& post_rotation) -> Transform&;
  ARGN_SCN_API auto SetRotationOffset(const Vec3& offset) -> Transform&;
  ARGN_SCN_API auto SetRotationPivot(const Vec3& pivot) -> Transform&;
  ARGN_SCN_API auto SetScalingOffset(const Vec3& offset) -> Transform&;
  ARGN_SCN_API auto SetScalingPivot(const Vec3& pivot) -> Transform&;

  //! Moves the position by `offset`, in parent space.
  ARGN_SCN_API auto Offset(const Vec3& offset) -> Transform&;

  //! Takes every non-custom component from `source`.
  ARGN_SCN_API auto SyncFromTemplate(const Transform& source) -> void;

  //! Marks every component as inherited, keeping the current values.
  ARGN_SCN_API auto ClearCustomFlags() -> void;

  //=== Matrices ===----------------------------------------------------------//

  //! The full local matrix.
  ARGN_SCN_NDAPI auto Matrix() const -> Mat4;

  //! The local matrix without scale, offsets and pivots: translation and
  //! rotations only. Used where a rigid (non sheared) transform is needed.
  ARGN_SCN_NDAPI auto IsometricMatrix() const -> Mat4;

  //! Calls `fn(name, variable)` for each component, in a fixed order.
  template <typename Fn> auto ForEachComponent(Fn&& fn) -> void
  {
    fn("position", position_);
    fn("rotation", rotation_);
    fn("scale", scale_);
    fn("pre_rotation", pre_rotation_);
    fn("post_rotation", post_rotation_);
    fn("rotation_offset", rotation_offset_);
    fn("rotation_pivot", rotation_pivot_);
    fn("scaling_offset", scaling_offset_);
    fn("scaling_pivot", scaling_pivot_);
  }

  template <typename Fn> auto ForEachComponent(Fn&& fn) const -> void
  {
    fn("position", position_);
    fn("rotation", rotation_);
    fn("scale", scale_);
    fn("pre_rotation", pre_rotation_);
    fn("post_rotation", post_rotation_);
    fn("rotation_offset", rotation_offset_);
    fn("rotation_pivot", rotation_pivot_);
    fn("scaling_offset", scaling_offset_);
    fn("scaling_pivot", scaling_pivot_);
  }

private:
  TemplateVariable<Vec3> position_ { Vec3 { 0.0F } };
  TemplateVariable<Quat> rotation_ { Quat { 1.0F, 0.0F, 0.0F, 0.0F } };
  TemplateVariable<Vec3> scale_ { Vec3 { 1.0F } };
  TemplateVariable<Quat> pre_rotation_ { Quat { 1.0F, 0.0F, 0.0F, 0.0F } };
  TemplateVariable<Quat> post_rotation_ { Quat { 1.0F, 0.0F, 0.0F, 0.0F } };
  TemplateVariable<Vec3> rotation_offset_ { Vec3 { 0.0F } };
  TemplateVariable<Vec3> rotation_pivot_ { Vec3 { 0.0F } };
  TemplateVariable<Vec3> scaling_offset_ { Vec3 { 0.0F } };
  TemplateVariable<Vec3> scaling_pivot_ { Vec3 { 0.0F } };
};

} // namespace argon::scene
