//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include <glm/vec3.hpp>

namespace argon {

//! Parameters controlling a single simulation step.
struct IntegrationParameters {
  float dt { 1.0F / 60.0F }; //!< Duration of one step, in seconds.
  float max_linear_velocity { 1000.0F }; //!< Clamp, in m/s.
  float max_angular_velocity { 1000.0F }; //!< Clamp, in rad/s.
  uint32_t position_iterations { 4 }; //!< Solver position iterations per body.
  uint32_t velocity_iterations { 1 }; //!< Solver velocity iterations per body.
};

struct PhysicsConfig {
  glm::vec3 gravity { 0.0F, -9.81F, 0.0F };
  IntegrationParameters integration {};
};

} // namespace argon
