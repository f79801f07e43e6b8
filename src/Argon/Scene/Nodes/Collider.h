//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include <glm/mat4x4.hpp>

#include <Argon/Base/ChangeSet.h>
#include <Argon/Physics/Shape.h>
#include <Argon/Physics/Types.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

class Graph;

//! A node of the graph providing geometry to a collider.
struct GeometrySource {
  NodeHandle node {};

  auto operator==(const GeometrySource&) const -> bool = default;
};

//! Triangle mesh built from the surfaces of one or more Mesh nodes.
struct TrimeshShape {
  std::vector<GeometrySource> sources {};
};

//! Height field built from a Terrain node.
struct HeightfieldShape {
  GeometrySource geometry_source {};
};

//! Shape of a collider node. Primitive shapes are given directly in the
//! collider space, mesh-based shapes refer to other nodes of the graph.
using ColliderShape = std::variant<physics::shape::Ball,
  physics::shape::Cylinder, physics::shape::RoundCylinder,
  physics::shape::Cone, physics::shape::Cuboid, physics::shape::Capsule,
  physics::shape::Segment, physics::shape::Triangle, TrimeshShape,
  HeightfieldShape>;

//! Fields of a collider node waiting to be pushed to the simulation.
enum class ColliderChange : uint8_t {
  kShape,
  kRestitution,
  kCollisionGroups,
  kSolverGroups,
  kFriction,
  kIsSensor,

  kCount
};

//! A node backed by a collider of the physics world.
/*!
 A collider only exists in the simulation while it is a direct child of a
 RigidBody node whose native body exists. Unlinking the collider from its
 body destroys the native collider; linking it again recreates it during the
 next update.
*/
class Collider {
public:
  Collider() = default;

  explicit Collider(ColliderShape shape)
    : shape_(std::move(shape))
  {
  }

  [[nodiscard]] auto GetShape() const noexcept -> const ColliderShape&
  {
    return shape_;
  }

  auto SetShape(ColliderShape shape) -> void
  {
    shape_ = std::move(shape);
    changes_.Insert(ColliderChange::kShape);
  }

  //! Mutable access to the shape. Records a shape change.
  [[nodiscard]] auto ShapeMut() -> ColliderShape&
  {
    changes_.Insert(ColliderChange::kShape);
    return shape_;
  }

  [[nodiscard]] auto GetFriction() const noexcept { return friction_; }
  auto SetFriction(const float friction) -> void
  {
    friction_ = friction;
    changes_.Insert(ColliderChange::kFriction);
  }

  //! Only taken into account when the native collider is created.
  [[nodiscard]] auto GetDensity() const noexcept { return density_; }
  auto SetDensity(const std::optional<float> density) noexcept -> void
  {
    density_ = density;
  }

  [[nodiscard]] auto GetRestitution() const noexcept { return restitution_; }
  auto SetRestitution(const float restitution) -> void
  {
    restitution_ = restitution;
    changes_.Insert(ColliderChange::kRestitution);
  }

  [[nodiscard]] auto GetCollisionGroups() const noexcept
    -> const physics::InteractionGroups&
  {
    return collision_groups_;
  }
  auto SetCollisionGroups(const physics::InteractionGroups& groups) -> void
  {
    collision_groups_ = groups;
    changes_.Insert(ColliderChange::kCollisionGroups);
  }

  [[nodiscard]] auto GetSolverGroups() const noexcept
    -> const physics::InteractionGroups&
  {
    return solver_groups_;
  }
  auto SetSolverGroups(const physics::InteractionGroups& groups) -> void
  {
    solver_groups_ = groups;
    changes_.Insert(ColliderChange::kSolverGroups);
  }

  [[nodiscard]] auto IsSensor() const noexcept { return is_sensor_; }
  auto SetIsSensor(const bool is_sensor) -> void
  {
    is_sensor_ = is_sensor;
    changes_.Insert(ColliderChange::kIsSensor);
  }

  //! Converts the shape to a native one, in the space of the collider.
  /*!
   Mesh-based shapes are baked from their source nodes: trimesh vertices are
   brought into the collider space with `inv_global_transform`, the inverse of
   the collider global isometric transform. Returns nullopt, after logging
   an error, when the shape has invalid dimensions or no usable geometry.
  */
  ARGN_SCN_NDAPI auto IntoNativeShape(const glm::mat4& inv_global_transform,
    const Graph& graph) const -> std::optional<physics::Shape>;

  //=== Simulation link ===---------------------------------------------------//

  [[nodiscard]] auto GetNative() const noexcept { return native_; }
  auto SetNative(const physics::ColliderHandle native) noexcept -> void
  {
    native_ = native;
  }

  [[nodiscard]] auto GetChanges() const noexcept
    -> const ChangeSet<ColliderChange>&
  {
    return changes_;
  }
  [[nodiscard]] auto GetChanges() noexcept -> ChangeSet<ColliderChange>&
  {
    return changes_;
  }

  [[nodiscard]] auto IsTransformModified() const noexcept
  {
    return transform_modified_;
  }
  auto MarkTransformModified() noexcept -> void { transform_modified_ = true; }
  auto ClearTransformModified() noexcept -> void { transform_modified_ = false; }

  auto ResetNative() noexcept -> void
  {
    native_ = physics::ColliderHandle::None();
    changes_.Clear();
    transform_modified_ = false;
  }

private:
  ColliderShape shape_ { physics::shape::Ball {} };
  float friction_ { 0.5F };
  std::optional<float> density_ {};
  float restitution_ { 0.0F };
  physics::InteractionGroups collision_groups_ {};
  physics::InteractionGroups solver_groups_ {};
  bool is_sensor_ { false };

  physics::ColliderHandle native_ {};
  ChangeSet<ColliderChange> changes_ {};
  bool transform_modified_ { false };
};

} // namespace argon::scene
