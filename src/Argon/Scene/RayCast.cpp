//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cmath>

#include <Argon/Scene/RayCast.h>

auto argon::scene::SortIntersections(std::span<Intersection> intersections)
  -> void
{
  // NaN is equivalent to NaN and greater than any real value, which keeps a
  // strict weak ordering.
  std::ranges::stable_sort(
    intersections, [](const Intersection& a, const Intersection& b) {
      if (std::isnan(a.toi)) {
        return false;
      }
      if (std::isnan(b.toi)) {
        return true;
      }
      return a.toi < b.toi;
    });
}
