//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <vector>

#include <glm/vec3.hpp>

#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! Spawns particles at a constant rate, at a point of the system.
struct Emitter {
  glm::vec3 position { 0.0F }; //!< In the local space of the system.
  float spawn_rate { 10.0F }; //!< Particles per second.
  uint32_t max_particles { 100 }; //!< Maximum alive at any time.
  float particle_lifetime { 1.0F }; //!< Seconds.
  glm::vec3 initial_velocity { 0.0F, 1.0F, 0.0F };

  //! Fraction of a particle carried over between updates.
  float spawn_accumulator { 0.0F };
};

struct Particle {
  glm::vec3 position { 0.0F };
  glm::vec3 velocity { 0.0F };
  float age { 0.0F };
  float lifetime { 1.0F };
  uint32_t emitter { 0 };
};

class ParticleSystem {
public:
  ParticleSystem() = default;

  explicit ParticleSystem(std::vector<Emitter> emitters)
    : emitters_(std::move(emitters))
  {
  }

  //! Ages, moves and retires the alive particles, then lets every emitter
  //! spawn the particles due for `dt` seconds. Disabled systems do not spawn.
  ARGN_SCN_API auto Update(float dt) -> void;

  [[nodiscard]] auto GetEmitters() const noexcept -> const std::vector<Emitter>&
  {
    return emitters_;
  }

  auto AddEmitter(Emitter emitter) -> void
  {
    emitters_.push_back(std::move(emitter));
  }

  [[nodiscard]] auto GetParticles() const noexcept
    -> const std::vector<Particle>&
  {
    return particles_;
  }

  auto ClearParticles() noexcept -> void { particles_.clear(); }

  //! Constant acceleration applied to every particle, in local space.
  [[nodiscard]] auto GetAcceleration() const noexcept -> const glm::vec3&
  {
    return acceleration_;
  }
  auto SetAcceleration(const glm::vec3& acceleration) noexcept -> void
  {
    acceleration_ = acceleration;
  }

  [[nodiscard]] auto IsEnabled() const noexcept { return enabled_; }
  auto SetEnabled(const bool enabled) noexcept -> void { enabled_ = enabled; }

private:
  std::vector<Emitter> emitters_ {};
  std::vector<Particle> particles_ {};
  glm::vec3 acceleration_ { 0.0F, -9.81F, 0.0F };
  bool enabled_ { true };
};

} // namespace argon::scene
