//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include <glm/gtc/constants.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <Argon/Scene/Frustum.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

class Graph;

//! Normalized rectangle of the frame a camera renders to.
struct Viewport {
  float x { 0.0F };
  float y { 0.0F };
  float width { 1.0F };
  float height { 1.0F };

  auto operator==(const Viewport&) const -> bool = default;
};

//! Per-node visibility, as seen from a camera during the last update.
class VisibilityCache {
public:
  //! Recomputes the visibility of every node of `graph`. A node is visible
  //! when it is within `z_far` of the observer and inside the frustum; meshes
  //! are tested with their world bounding box, other nodes with their position.
  ARGN_SCN_API auto Update(const Graph& graph, const glm::vec3& observer,
    float z_near, float z_far, const Frustum& frustum) -> void;

  //! False for nodes unknown to the cache.
  [[nodiscard]] auto IsVisible(const NodeHandle node) const -> bool
  {
    const auto it = map_.find(node);
    return it != map_.end() && it->second;
  }

  [[nodiscard]] auto Size() const noexcept { return map_.size(); }

  auto Clear() noexcept -> void { map_.clear(); }

private:
  std::unordered_map<NodeHandle, bool> map_ {};
};

enum class SkyBoxFace : uint8_t {
  kFront,
  kBack,
  kLeft,
  kRight,
  kTop,
  kBottom,

  kCount
};

//! Six textures, referenced by name, composing the sky around a camera.
class SkyBox {
public:
  auto SetFace(SkyBoxFace face, std::string texture) -> void
  {
    faces_[static_cast<size_t>(face)] = std::move(texture);
    cubemap_ready_ = false;
  }

  [[nodiscard]] auto GetFace(SkyBoxFace face) const
    -> const std::optional<std::string>&
  {
    return faces_[static_cast<size_t>(face)];
  }

  //! Builds the cube map from the six faces. Fails when a face is missing.
  ARGN_SCN_NDAPI auto CreateCubemap() -> bool;

  [[nodiscard]] auto IsCubemapReady() const noexcept { return cubemap_ready_; }

private:
  std::array<std::optional<std::string>, static_cast<size_t>(SkyBoxFace::kCount)>
    faces_ {};
  bool cubemap_ready_ { false };
};

class Camera {
public:
  static constexpr float kDefaultFov = glm::quarter_pi<float>();
  static constexpr float kDefaultZNear = 0.025F;
  static constexpr float kDefaultZFar = 2048.0F;

  //! Recomputes the view and projection matrices for a frame of `frame_size`
  //! pixels. The camera looks along the +Z axis of its global transform.
  ARGN_SCN_API auto CalculateMatrices(
    const glm::vec2& frame_size, const glm::mat4& global_transform) -> void;

  [[nodiscard]] auto GetFov() const noexcept { return fov_; }
  auto SetFov(const float fov) noexcept -> void { fov_ = fov; }

  [[nodiscard]] auto GetZNear() const noexcept { return z_near_; }
  auto SetZNear(const float z_near) noexcept -> void { z_near_ = z_near; }

  [[nodiscard]] auto GetZFar() const noexcept { return z_far_; }
  auto SetZFar(const float z_far) noexcept -> void { z_far_ = z_far; }

  [[nodiscard]] auto GetViewport() const noexcept -> const Viewport&
  {
    return viewport_;
  }
  auto SetViewport(const Viewport& viewport) noexcept -> void
  {
    viewport_ = viewport;
  }

  [[nodiscard]] auto IsEnabled() const noexcept { return enabled_; }
  auto SetEnabled(const bool enabled) noexcept -> void { enabled_ = enabled; }

  [[nodiscard]] auto GetViewMatrix() const noexcept -> const glm::mat4&
  {
    return view_;
  }
  [[nodiscard]] auto GetProjectionMatrix() const noexcept -> const glm::mat4&
  {
    return projection_;
  }
  [[nodiscard]] auto GetViewProjectionMatrix() const noexcept
    -> const glm::mat4&
  {
    return view_projection_;
  }

  [[nodiscard]] auto GetSkyBox() noexcept -> SkyBox*
  {
    return skybox_ ? &*skybox_ : nullptr;
  }
  [[nodiscard]] auto GetSkyBox() const noexcept -> const SkyBox*
  {
    return skybox_ ? &*skybox_ : nullptr;
  }
  auto SetSkyBox(std::optional<SkyBox> skybox) -> void
  {
    skybox_ = std::move(skybox);
  }

  [[nodiscard]] auto GetVisibilityCache() const noexcept
    -> const VisibilityCache&
  {
    return visibility_cache_;
  }
  auto SetVisibilityCache(VisibilityCache cache) -> void
  {
    visibility_cache_ = std::move(cache);
  }

private:
  float fov_ { kDefaultFov };
  float z_near_ { kDefaultZNear };
  float z_far_ { kDefaultZFar };
  Viewport viewport_ {};
  bool enabled_ { true };
  glm::mat4 view_ { 1.0F };
  glm::mat4 projection_ { 1.0F };
  glm::mat4 view_projection_ { 1.0F };
  std::optional<SkyBox> skybox_ {};
  VisibilityCache visibility_cache_ {};
};

} // namespace argon::scene
