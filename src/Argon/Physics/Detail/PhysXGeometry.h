//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <optional>

#include <PxPhysicsAPI.h>

#include <Argon/Physics/Shape.h>
#include <Argon/Physics/Types.h>

namespace argon::physics::detail {

struct PxReleaser {
  auto operator()(physx::PxRefCounted* object) const noexcept -> void
  {
    object->release();
  }
};

//! A PhysX geometry built from a collider shape.
struct PhysXGeometry {
  physx::PxGeometryHolder geometry {};
  //! Cooked mesh or height field referenced by the geometry. Shapes created
  //! from the geometry hold their own reference.
  std::unique_ptr<physx::PxRefCounted, PxReleaser> cooked {};
};

//! Number of segments used to approximate round shapes with convex meshes.
constexpr int kConvexRoundSegments = 16;

//! Radius of the thin capsule standing for a segment.
constexpr float kSegmentRadius = 1e-3F;

/*!
 Converts a shape to a PhysX geometry, cooking meshes, convex hulls and height
 fields on the fly. Cylinders, round cylinders and cones become convex meshes;
 triangles become single triangle meshes; segments become thin capsules.

 Returns nullopt when the shape is not valid or cooking fails.
*/
auto BuildGeometry(const Shape& shape, physx::PxPhysics& physics)
  -> std::optional<PhysXGeometry>;

//! Pose of the PhysX geometry in the local space of the shape. Identity except
//! for capsules and segments, whose PhysX axis is X, and for height fields,
//! whose PhysX origin is a corner.
auto GeometryOffset(const Shape& shape) -> Isometry;

//! Triangle meshes and height fields can only be simulated on kinematic or
//! static actors, and cannot be triggers.
[[nodiscard]] inline auto IsTriangleBased(
  const physx::PxGeometryType::Enum type) noexcept -> bool
{
  return type == physx::PxGeometryType::eTRIANGLEMESH
    || type == physx::PxGeometryType::eHEIGHTFIELD;
}

} // namespace argon::physics::detail
