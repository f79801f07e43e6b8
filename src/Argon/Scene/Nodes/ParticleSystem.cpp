//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cmath>

#include <Argon/Scene/Nodes/ParticleSystem.h>

using argon::scene::ParticleSystem;

auto ParticleSystem::Update(const float dt) -> void
{
  std::erase_if(particles_, [dt](auto& particle) {
    particle.age += dt;
    return particle.age >= particle.lifetime;
  });

  for (auto& particle : particles_) {
    particle.velocity += acceleration_ * dt;
    particle.position += particle.velocity * dt;
  }

  if (!enabled_) {
    return;
  }

  for (uint32_t index = 0; index < emitters_.size(); ++index) {
    auto& emitter = emitters_[index];
    emitter.spawn_accumulator += emitter.spawn_rate * dt;
    const float due = std::floor(emitter.spawn_accumulator);
    emitter.spawn_accumulator -= due;

    const auto alive = static_cast<uint32_t>(std::ranges::count_if(
      particles_, [index](const auto& p) { return p.emitter == index; }));
    const auto room
      = emitter.max_particles > alive ? emitter.max_particles - alive : 0U;
    const auto count = std::min(static_cast<uint32_t>(due), room);

    for (uint32_t i = 0; i < count; ++i) {
      particles_.push_back(Particle {
        .position = emitter.position,
        .velocity = emitter.initial_velocity,
        .age = 0.0F,
        .lifetime = emitter.particle_lifetime,
        .emitter = index,
      });
    }
  }
}
