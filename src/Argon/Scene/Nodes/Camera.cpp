//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <glm/geometric.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <loguru.hpp>

#include <Argon/Scene/Graph.h>
#include <Argon/Scene/Nodes/Camera.h>

using argon::scene::Camera;
using argon::scene::SkyBox;
using argon::scene::VisibilityCache;

auto VisibilityCache::Update(const Graph& graph, const glm::vec3& observer,
  const float /*z_near*/, const float z_far, const Frustum& frustum) -> void
{
  map_.clear();
  graph.ForEachNode([&](const NodeHandle handle, const Node& node) {
    bool visible = false;
    if (const auto* mesh = node.TryAs<Mesh>()) {
      const auto& box = mesh->GetWorldBoundingBox();
      const auto closest = glm::clamp(observer, box.min, box.max);
      visible = glm::distance(observer, closest) <= z_far
        && frustum.IntersectsAabb(box.min, box.max);
    } else {
      const auto position = node.GetGlobalPosition();
      visible = glm::distance(observer, position) <= z_far
        && frustum.ContainsPoint(position);
    }
    map_.emplace(handle, visible);
  });
}

auto SkyBox::CreateCubemap() -> bool
{
  const bool complete = std::ranges::all_of(
    faces_, [](const auto& face) { return face.has_value(); });
  if (!complete) {
    LOG_F(WARNING, "sky box cube map not created: some faces are missing");
  }
  cubemap_ready_ = complete;
  return complete;
}

auto Camera::CalculateMatrices(
  const glm::vec2& frame_size, const glm::mat4& global_transform) -> void
{
  const glm::vec3 position { global_transform[3] };
  const auto look = glm::normalize(glm::vec3(global_transform[2]));
  const auto up = glm::normalize(glm::vec3(global_transform[1]));
  view_ = glm::lookAt(position, position + look, up);

  const float width = std::max(viewport_.width * frame_size.x, 1.0F);
  const float height = std::max(viewport_.height * frame_size.y, 1.0F);
  projection_ = glm::perspective(fov_, width / height, z_near_, z_far_);

  view_projection_ = projection_ * view_;
}
