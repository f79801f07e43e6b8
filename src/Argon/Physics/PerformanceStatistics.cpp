//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <Argon/Physics/PerformanceStatistics.h>

auto argon::physics::to_string(const PerformanceStatistics& stats)
  -> std::string
{
  using Millis = std::chrono::duration<double, std::milli>;
  return fmt::format("Physics Step Time: {:.3}\nPhysics Ray Cast Time: {:.3}",
    Millis { stats.step_time }, Millis { stats.total_ray_cast_time });
}
