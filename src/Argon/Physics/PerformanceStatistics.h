//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <string>

#include <Argon/Physics/api_export.h>

namespace argon::physics {

//! Timings collected by a PhysicsWorld.
struct PerformanceStatistics {
  //! Duration of the last simulation step.
  std::chrono::nanoseconds step_time { 0 };
  //! Time spent in ray casts since the last reset.
  std::chrono::nanoseconds total_ray_cast_time { 0 };

  auto Reset() noexcept -> void
  {
    step_time = std::chrono::nanoseconds::zero();
    total_ray_cast_time = std::chrono::nanoseconds::zero();
  }
};

ARGN_PHY_NDAPI auto to_string(const PerformanceStatistics& stats)
  -> std::string;

} // namespace argon::physics
