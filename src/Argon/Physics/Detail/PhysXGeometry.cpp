//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

#include <cooking/PxCooking.h>
#include <foundation/PxMathUtils.h>

#include <glm/geometric.hpp>
#include <glm/gtc/constants.hpp>
#include <loguru.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Physics/Detail/PhysXConversions.h>
#include <Argon/Physics/Detail/PhysXGeometry.h>

using argon::physics::Isometry;
using argon::physics::Shape;
using argon::physics::detail::FromPx;
using argon::physics::detail::PhysXGeometry;
using argon::physics::detail::ToPx;

namespace shape = argon::physics::shape;

namespace {

constexpr float kEpsilon = 1e-6F;

auto MakeGeometry(const physx::PxGeometry& geometry) -> PhysXGeometry
{
  PhysXGeometry result;
  result.geometry.storeAny(geometry);
  return result;
}

// Two rings of `radius` at heights `y0` and `y1`.
auto AppendRings(std::vector<physx::PxVec3>& points, const float radius,
  const float y0, const float y1) -> void
{
  for (int i = 0; i < argon::physics::detail::kConvexRoundSegments; ++i) {
    const float angle = glm::two_pi<float>() * static_cast<float>(i)
      / static_cast<float>(argon::physics::detail::kConvexRoundSegments);
    const float x = radius * std::cos(angle);
    const float z = radius * std::sin(angle);
    points.emplace_back(x, y0, z);
    if (y1 != y0) {
      points.emplace_back(x, y1, z);
    }
  }
}

auto CookConvex(const std::vector<physx::PxVec3>& points,
  physx::PxPhysics& physics) -> std::optional<PhysXGeometry>
{
  physx::PxConvexMeshDesc desc;
  desc.points.count = static_cast<physx::PxU32>(points.size());
  desc.points.stride = sizeof(physx::PxVec3);
  desc.points.data = points.data();
  desc.flags = physx::PxConvexFlag::eCOMPUTE_CONVEX;

  const physx::PxCookingParams params(physics.getTolerancesScale());
  auto* mesh = PxCreateConvexMesh(
    params, desc, physics.getPhysicsInsertionCallback());
  if (mesh == nullptr) {
    LOG_F(ERROR, "convex mesh cooking failed ({} points)", points.size());
    return std::nullopt;
  }
  auto result = MakeGeometry(physx::PxConvexMeshGeometry(mesh));
  result.cooked.reset(mesh);
  return result;
}

auto CookTriangles(const std::vector<glm::vec3>& vertices,
  const std::vector<std::array<uint32_t, 3>>& indices,
  physx::PxPhysics& physics) -> std::optional<PhysXGeometry>
{
  physx::PxTriangleMeshDesc desc;
  desc.points.count = static_cast<physx::PxU32>(vertices.size());
  desc.points.stride = sizeof(glm::vec3);
  desc.points.data = vertices.data();
  desc.triangles.count = static_cast<physx::PxU32>(indices.size());
  desc.triangles.stride = sizeof(std::array<uint32_t, 3>);
  desc.triangles.data = indices.data();

  const physx::PxCookingParams params(physics.getTolerancesScale());
  auto* mesh = PxCreateTriangleMesh(
    params, desc, physics.getPhysicsInsertionCallback());
  if (mesh == nullptr) {
    LOG_F(ERROR, "triangle mesh cooking failed ({} triangles)", indices.size());
    return std::nullopt;
  }
  auto result = MakeGeometry(physx::PxTriangleMeshGeometry(mesh));
  result.cooked.reset(mesh);
  return result;
}

// Our grid has its rows along Z and its columns along X. PhysX has its rows
// along X and its columns along Z, with 16 bits quantized heights.
auto CookHeightField(const shape::HeightField& field, physx::PxPhysics& physics)
  -> std::optional<PhysXGeometry>
{
  float max_height = 0.0F;
  for (const float h : field.heights) {
    max_height = std::max(max_height, std::abs(h * field.scale.y));
  }
  const float height_scale = max_height > kEpsilon
    ? max_height / static_cast<float>(INT16_MAX)
    : 1.0F;

  std::vector<physx::PxHeightFieldSample> samples(field.heights.size());
  for (uint32_t c = 0; c < field.columns; ++c) {
    for (uint32_t r = 0; r < field.rows; ++r) {
      const float h
        = field.heights[static_cast<size_t>(r) * field.columns + c]
        * field.scale.y;
      auto& sample = samples[static_cast<size_t>(c) * field.rows + r];
      sample.height
        = static_cast<physx::PxI16>(std::lround(h / height_scale));
      sample.materialIndex0 = 0;
      sample.materialIndex1 = 0;
    }
  }

  physx::PxHeightFieldDesc desc;
  desc.format = physx::PxHeightFieldFormat::eS16_TM;
  desc.nbRows = field.columns;
  desc.nbColumns = field.rows;
  desc.samples.data = samples.data();
  desc.samples.stride = sizeof(physx::PxHeightFieldSample);

  auto* height_field
    = PxCreateHeightField(desc, physics.getPhysicsInsertionCallback());
  if (height_field == nullptr) {
    LOG_F(ERROR, "height field cooking failed ({}x{})", field.rows,
      field.columns);
    return std::nullopt;
  }
  auto result = MakeGeometry(physx::PxHeightFieldGeometry(height_field,
    physx::PxMeshGeometryFlags(), height_scale,
    field.scale.x / static_cast<float>(field.columns - 1),
    field.scale.z / static_cast<float>(field.rows - 1)));
  result.cooked.reset(height_field);
  return result;
}

auto AlongX(const glm::vec3& begin, const glm::vec3& end) -> Isometry
{
  const auto axis = glm::normalize(end - begin);
  return { .translation = 0.5F * (begin + end),
    .rotation = FromPx(
      physx::PxShortestRotation(physx::PxVec3(1.0F, 0.0F, 0.0F), ToPx(axis))) };
}

} // namespace

auto argon::physics::detail::BuildGeometry(const Shape& shape,
  physx::PxPhysics& physics) -> std::optional<PhysXGeometry>
{
  if (!IsValid(shape)) {
    return std::nullopt;
  }

  return std::visit(
    argon::Overloads {
      [](const shape::Ball& s) -> std::optional<PhysXGeometry> {
        return MakeGeometry(physx::PxSphereGeometry(s.radius));
      },
      [](const shape::Cuboid& s) -> std::optional<PhysXGeometry> {
        return MakeGeometry(physx::PxBoxGeometry(ToPx(s.half_extents)));
      },
      [](const shape::Capsule& s) -> std::optional<PhysXGeometry> {
        const float half_height = 0.5F * glm::length(s.end - s.begin);
        if (half_height < kEpsilon) {
          return MakeGeometry(physx::PxSphereGeometry(s.radius));
        }
        return MakeGeometry(physx::PxCapsuleGeometry(s.radius, half_height));
      },
      [](const shape::Segment& s) -> std::optional<PhysXGeometry> {
        return MakeGeometry(physx::PxCapsuleGeometry(
          kSegmentRadius, 0.5F * glm::length(s.end - s.begin)));
      },
      [&](const shape::Cylinder& s) {
        std::vector<physx::PxVec3> points;
        AppendRings(points, s.radius, -s.half_height, s.half_height);
        return CookConvex(points, physics);
      },
      [&](const shape::RoundCylinder& s) {
        // hull of the rounded edges, sampled at the end of their quarter arcs
        std::vector<physx::PxVec3> points;
        AppendRings(points, s.radius + s.border_radius, -s.half_height,
          s.half_height);
        AppendRings(points, s.radius, -s.half_height - s.border_radius,
          s.half_height + s.border_radius);
        return CookConvex(points, physics);
      },
      [&](const shape::Cone& s) {
        std::vector<physx::PxVec3> points { physx::PxVec3(
          0.0F, s.half_height, 0.0F) };
        AppendRings(points, s.radius, -s.half_height, -s.half_height);
        return CookConvex(points, physics);
      },
      [&](const shape::Triangle& s) {
        return CookTriangles({ s.a, s.b, s.c }, { { 0U, 1U, 2U } }, physics);
      },
      [&](const shape::TriMesh& s) {
        return CookTriangles(s.vertices, s.indices, physics);
      },
      [&](const shape::HeightField& s) { return CookHeightField(s, physics); },
    },
    shape);
}

auto argon::physics::detail::GeometryOffset(const Shape& shape) -> Isometry
{
  return std::visit(
    argon::Overloads {
      [](const shape::Capsule& s) {
        return glm::length(s.end - s.begin) < 2.0F * kEpsilon
          ? Isometry { .translation = 0.5F * (s.begin + s.end) }
          : AlongX(s.begin, s.end);
      },
      [](const shape::Segment& s) { return AlongX(s.begin, s.end); },
      [](const shape::HeightField& s) {
        return Isometry { .translation
          = glm::vec3(-0.5F * s.scale.x, 0.0F, -0.5F * s.scale.z) };
      },
      [](const auto& /*other*/) { return Isometry {}; },
    },
    shape);
}
