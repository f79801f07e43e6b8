//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include <glm/gtc/constants.hpp>
#include <glm/vec3.hpp>

namespace argon::scene {

enum class LightKind : uint8_t { kPoint, kSpot, kDirectional };

constexpr auto to_string(const LightKind value) noexcept -> const char*
{
  switch (value) {
  case LightKind::kPoint:
    return "Point";
  case LightKind::kSpot:
    return "Spot";
  case LightKind::kDirectional:
    return "Directional";
  }
  return "__NotSupported__";
}

//! A light source. Spot and directional lights shine along the -Y axis of
//! their node.
class Light {
public:
  Light() = default;

  explicit Light(const LightKind kind)
    : kind_(kind)
  {
  }

  [[nodiscard]] auto GetKind() const noexcept { return kind_; }
  auto SetKind(const LightKind kind) noexcept -> void { kind_ = kind; }

  [[nodiscard]] auto GetColor() const noexcept -> const glm::vec3&
  {
    return color_;
  }
  auto SetColor(const glm::vec3& color) noexcept -> void { color_ = color; }

  [[nodiscard]] auto GetIntensity() const noexcept { return intensity_; }
  auto SetIntensity(const float intensity) noexcept -> void
  {
    intensity_ = intensity;
  }

  //! Range of point and spot lights.
  [[nodiscard]] auto GetRadius() const noexcept { return radius_; }
  auto SetRadius(const float radius) noexcept -> void { radius_ = radius; }

  [[nodiscard]] auto GetHotspotConeAngle() const noexcept
  {
    return hotspot_cone_angle_;
  }
  auto SetHotspotConeAngle(const float angle) noexcept -> void
  {
    hotspot_cone_angle_ = angle;
  }

  //! Angle, added to the hotspot angle, over which a spot light fades out.
  [[nodiscard]] auto GetFalloffAngleDelta() const noexcept
  {
    return falloff_angle_delta_;
  }
  auto SetFalloffAngleDelta(const float delta) noexcept -> void
  {
    falloff_angle_delta_ = delta;
  }

  //! Full spot angle: hotspot plus falloff.
  [[nodiscard]] auto GetFullConeAngle() const noexcept
  {
    return hotspot_cone_angle_ + falloff_angle_delta_;
  }

  [[nodiscard]] auto CastsShadows() const noexcept { return cast_shadows_; }
  auto SetCastShadows(const bool cast) noexcept -> void { cast_shadows_ = cast; }

private:
  LightKind kind_ { LightKind::kPoint };
  glm::vec3 color_ { 1.0F };
  float intensity_ { 1.0F };
  float radius_ { 10.0F };
  float hotspot_cone_angle_ { glm::quarter_pi<float>() };
  float falloff_angle_delta_ { glm::pi<float>() / 24.0F };
  bool cast_shadows_ { true };
};

} // namespace argon::scene
