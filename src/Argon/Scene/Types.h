//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <Argon/Base/Handle.h>

namespace argon::scene {

class Node;

using NodeHandle = Handle<Node>;

//! Old-to-new node mapping produced by the copy operations.
using NodeHandleMap = std::unordered_map<NodeHandle, NodeHandle>;

//! Value of a user property. A NodeHandle value is remapped when the node
//! holding it is copied together with the referenced node.
using PropertyValue
  = std::variant<bool, int64_t, double, std::string, NodeHandle>;

struct Property {
  std::string name;
  PropertyValue value;

  auto operator==(const Property&) const -> bool = default;
};

//! Objects shown while the camera distance, normalized by its far plane, is
//! within `[begin, end)`.
struct LodControlledObjects {
  float begin { 0.0F };
  float end { 1.0F };
  std::vector<NodeHandle> objects {};
};

struct LodGroup {
  std::vector<LodControlledObjects> levels {};
};

} // namespace argon::scene
