//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/gtc/matrix_transform.hpp>

#include <fmt/format.h>

#include <Argon/Physics/Types.h>

using argon::physics::FeatureId;
using argon::physics::Isometry;

auto argon::physics::to_string(const FeatureId& value) -> std::string
{
  switch (value.kind) {
  case FeatureId::Kind::kVertex:
    return fmt::format("Vertex({})", value.index);
  case FeatureId::Kind::kEdge:
    return fmt::format("Edge({})", value.index);
  case FeatureId::Kind::kFace:
    return fmt::format("Face({})", value.index);
  case FeatureId::Kind::kUnknown:
    return "Unknown";
  }
  return "__NotSupported__";
}

auto Isometry::ToMatrix() const -> glm::mat4
{
  return glm::translate(glm::mat4 { 1.0F }, translation)
    * glm::mat4_cast(rotation);
}
