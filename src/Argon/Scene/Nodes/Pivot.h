//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

namespace argon::scene {

//! A plain node, only used for its transform and as a parent of other nodes.
struct Pivot {
  auto operator==(const Pivot&) const -> bool = default;
};

} // namespace argon::scene
