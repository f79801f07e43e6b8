//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <limits>

#include <glm/common.hpp>
#include <glm/vec4.hpp>

#include <Argon/Scene/Graph.h>
#include <Argon/Scene/Nodes/Mesh.h>

using argon::physics::Aabb;
using argon::scene::Mesh;

auto Mesh::ComputeLocalBoundingBox() const -> Aabb
{
  constexpr float kMax = std::numeric_limits<float>::max();
  Aabb box { glm::vec3 { kMax }, glm::vec3 { -kMax } };
  bool empty = true;
  for (const auto& surface : surfaces_) {
    if (!surface.data) {
      continue;
    }
    for (const auto& p : surface.data->positions) {
      box.min = glm::min(box.min, p);
      box.max = glm::max(box.max, p);
      empty = false;
    }
  }
  return empty ? Aabb {} : box;
}

auto Mesh::Update(const Graph& graph, const glm::mat4& global_transform) -> void
{
  const auto local = ComputeLocalBoundingBox();

  constexpr float kMax = std::numeric_limits<float>::max();
  Aabb world { glm::vec3 { kMax }, glm::vec3 { -kMax } };
  auto enclose = [&world](const glm::vec3& p) {
    world.min = glm::min(world.min, p);
    world.max = glm::max(world.max, p);
  };

  for (int i = 0; i < 8; ++i) {
    const glm::vec3 corner {
      (i & 1) != 0 ? local.max.x : local.min.x,
      (i & 2) != 0 ? local.max.y : local.min.y,
      (i & 4) != 0 ? local.max.z : local.min.z,
    };
    enclose(glm::vec3(global_transform * glm::vec4(corner, 1.0F)));
  }

  for (const auto& surface : surfaces_) {
    for (const auto bone : surface.bones) {
      if (const auto* node = graph.TryGet(bone)) {
        enclose(node->GetGlobalPosition());
      }
    }
  }

  world_bounding_box_ = world;
}
