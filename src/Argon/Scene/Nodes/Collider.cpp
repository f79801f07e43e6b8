//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/vec4.hpp>

#include <loguru.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Scene/Graph.h>
#include <Argon/Scene/Nodes/Collider.h>

using argon::scene::Collider;

namespace shape = argon::physics::shape;

namespace {

auto BakeTrimesh(const argon::scene::TrimeshShape& trimesh,
  const glm::mat4& inv_global_transform, const argon::scene::Graph& graph)
  -> shape::TriMesh
{
  shape::TriMesh result;
  for (const auto& source : trimesh.sources) {
    const auto* node = graph.TryGet(source.node);
    const auto* mesh = node ? node->TryAs<argon::scene::Mesh>() : nullptr;
    if (mesh == nullptr) {
      LOG_F(WARNING, "trimesh source {} is not a mesh node, skipped",
        to_string(source.node));
      continue;
    }
    const auto transform = inv_global_transform * node->GetGlobalTransform();
    for (const auto& surface : mesh->GetSurfaces()) {
      if (!surface.data) {
        continue;
      }
      const auto base = static_cast<uint32_t>(result.vertices.size());
      for (const auto& p : surface.data->positions) {
        result.vertices.emplace_back(transform * glm::vec4(p, 1.0F));
      }
      for (const auto& [a, b, c] : surface.data->triangles) {
        result.indices.push_back({ base + a, base + b, base + c });
      }
    }
  }
  return result;
}

} // namespace

auto Collider::IntoNativeShape(const glm::mat4& inv_global_transform,
  const Graph& graph) const -> std::optional<physics::Shape>
{
  auto native = std::visit(
    Overloads {
      [](const shape::Ball& s) -> std::optional<physics::Shape> { return s; },
      [](const shape::Cylinder& s) -> std::optional<physics::Shape> {
        return s;
      },
      [](const shape::RoundCylinder& s) -> std::optional<physics::Shape> {
        return s;
      },
      [](const shape::Cone& s) -> std::optional<physics::Shape> { return s; },
      [](const shape::Cuboid& s) -> std::optional<physics::Shape> {
        return s;
      },
      [](const shape::Capsule& s) -> std::optional<physics::Shape> {
        return s;
      },
      [](const shape::Segment& s) -> std::optional<physics::Shape> {
        return s;
      },
      [](const shape::Triangle& s) -> std::optional<physics::Shape> {
        return s;
      },
      [&](const TrimeshShape& s) -> std::optional<physics::Shape> {
        auto trimesh = BakeTrimesh(s, inv_global_transform, graph);
        if (trimesh.indices.empty()) {
          return std::nullopt;
        }
        return trimesh;
      },
      [&](const HeightfieldShape& s) -> std::optional<physics::Shape> {
        const auto* node = graph.TryGet(s.geometry_source.node);
        const auto* terrain = node ? node->TryAs<Terrain>() : nullptr;
        if (terrain == nullptr) {
          return std::nullopt;
        }
        return terrain->ToHeightField();
      },
    },
    shape_);

  if (!native) {
    LOG_F(ERROR, "collider shape has no usable source geometry");
    return std::nullopt;
  }
  if (!physics::IsValid(*native)) {
    LOG_F(ERROR, "collider shape has invalid dimensions");
    return std::nullopt;
  }
  return native;
}
