//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <Argon/Physics/Shape.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

class Graph;

//! Geometry of a surface, shared between every copy of the surface.
struct SurfaceData {
  std::vector<glm::vec3> positions;
  std::vector<std::array<uint32_t, 3>> triangles;
};

//! A part of a mesh. A skinned surface lists the nodes acting as its bones.
struct Surface {
  std::shared_ptr<SurfaceData> data {};
  std::vector<NodeHandle> bones {};
};

class Mesh {
public:
  Mesh() = default;

  explicit Mesh(std::vector<Surface> surfaces)
    : surfaces_(std::move(surfaces))
  {
  }

  [[nodiscard]] auto GetSurfaces() const noexcept
    -> const std::vector<Surface>&
  {
    return surfaces_;
  }

  [[nodiscard]] auto GetSurfaces() noexcept -> std::vector<Surface>&
  {
    return surfaces_;
  }

  auto AddSurface(Surface surface) -> void
  {
    surfaces_.push_back(std::move(surface));
  }

  auto ClearSurfaces() noexcept -> void { surfaces_.clear(); }

  //! Bounds of every surface vertex, in the local space of the mesh. An empty
  //! mesh has a degenerate box at the origin.
  ARGN_SCN_NDAPI auto ComputeLocalBoundingBox() const -> physics::Aabb;

  //! World-space bounds computed by the last Update().
  [[nodiscard]] auto GetWorldBoundingBox() const noexcept
    -> const physics::Aabb&
  {
    return world_bounding_box_;
  }

  //! Refreshes the world bounds. Skinned surfaces are deformed by their bones,
  //! so the bounds also enclose the bone positions.
  ARGN_SCN_API auto Update(const Graph& graph, const glm::mat4& global_transform)
    -> void;

private:
  std::vector<Surface> surfaces_ {};
  physics::Aabb world_bounding_box_ {};
};

} // namespace argon::scene
