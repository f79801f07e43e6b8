//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <Argon/Base/Macros.h>
#include <Argon/Scene/Nodes/Camera.h>
#include <Argon/Scene/Nodes/Collider.h>
#include <Argon/Scene/Nodes/Joint.h>
#include <Argon/Scene/Nodes/Light.h>
#include <Argon/Scene/Nodes/Mesh.h>
#include <Argon/Scene/Nodes/ParticleSystem.h>
#include <Argon/Scene/Nodes/Pivot.h>
#include <Argon/Scene/Nodes/RigidBody.h>
#include <Argon/Scene/Nodes/Terrain.h>
#include <Argon/Scene/Transform.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

struct Model;

namespace detail {
  struct GraphJsonAccess;
} // namespace detail

//! The closed set of node kinds. Adding a kind here makes every exhaustive
//! visit over it fail to compile until the new kind is handled.
using NodeKind = std::variant<Pivot, Mesh, Camera, Light, ParticleSystem,
  Terrain, RigidBody, Collider, Joint>;

ARGN_SCN_NDAPI auto to_string(const NodeKind& kind) -> const char*;

//! An element of a scene Graph.
/*!
 Every node carries the state common to all kinds: a name, its place in the
 hierarchy, a local transform, visibility, an optional lifetime, the link to
 the template it was instantiated from, user properties, and an optional LOD
 group. The kind-specific state lives in a NodeKind variant.

 The hierarchy links (parent and children) and the cached global transform and
 visibility are owned by the Graph, and can only be read from the node. Global
 values are only meaningful after Graph::UpdateHierarchicalData().

 Nodes are move-only; RawCopy() makes an explicit, detached copy.
*/
class Node {
public:
  Node() = default;

  ARGN_SCN_API explicit Node(NodeKind kind, std::string name = {});

  ~Node() = default;

  ARGON_DEFAULT_MOVABLE(Node)

  // Copies are made with RawCopy(), which resets the hierarchy links.
  auto operator=(const Node&) -> Node& = delete;

  //=== Kind ===--------------------------------------------------------------//

  [[nodiscard]] auto GetKind() const noexcept -> const NodeKind&
  {
    return kind_;
  }
  [[nodiscard]] auto GetKind() noexcept -> NodeKind& { return kind_; }

  template <typename K> [[nodiscard]] auto Is() const noexcept -> bool
  {
    return std::holds_alternative<K>(kind_);
  }

  //! Pointer to the kind-specific state, or nullptr for another kind.
  template <typename K> [[nodiscard]] auto TryAs() noexcept -> K*
  {
    return std::get_if<K>(&kind_);
  }
  template <typename K> [[nodiscard]] auto TryAs() const noexcept -> const K*
  {
    return std::get_if<K>(&kind_);
  }

  //! The kind-specific state. Throws std::bad_variant_access for another kind.
  template <typename K> [[nodiscard]] auto As() -> K&
  {
    return std::get<K>(kind_);
  }
  template <typename K> [[nodiscard]] auto As() const -> const K&
  {
    return std::get<K>(kind_);
  }

  //=== Common state ===------------------------------------------------------//

  [[nodiscard]] auto GetName() const noexcept -> const std::string&
  {
    return name_;
  }
  auto SetName(std::string name) -> void { name_ = std::move(name); }

  [[nodiscard]] auto GetTag() const noexcept -> const std::string&
  {
    return tag_;
  }
  auto SetTag(std::string tag) -> void { tag_ = std::move(tag); }

  [[nodiscard]] auto GetParent() const noexcept { return parent_; }

  [[nodiscard]] auto GetChildren() const noexcept
    -> const std::vector<NodeHandle>&
  {
    return children_;
  }

  [[nodiscard]] auto GetLocalTransform() const noexcept -> const Transform&
  {
    return local_transform_;
  }
  [[nodiscard]] auto GetLocalTransform() noexcept -> Transform&
  {
    return local_transform_;
  }

  //! Tells a RigidBody or Collider node that its local transform was edited
  //! and must be pushed to the simulation. Does nothing for other kinds.
  ARGN_SCN_API auto MarkTransformModified() noexcept -> void;

  [[nodiscard]] auto GetGlobalTransform() const noexcept -> const glm::mat4&
  {
    return global_transform_;
  }

  [[nodiscard]] auto GetGlobalPosition() const noexcept -> glm::vec3
  {
    return glm::vec3 { global_transform_[3] };
  }

  [[nodiscard]] auto GetVisibility() const noexcept { return visibility_; }
  auto SetVisibility(const bool visibility) noexcept -> void
  {
    visibility_ = visibility;
  }

  [[nodiscard]] auto GetGlobalVisibility() const noexcept
  {
    return global_visibility_;
  }

  //! Remaining seconds before the node removes itself, if limited.
  [[nodiscard]] auto GetLifetime() const noexcept { return lifetime_; }
  auto SetLifetime(const std::optional<float> lifetime) noexcept -> void
  {
    lifetime_ = lifetime;
  }

  //=== Template link ===-----------------------------------------------------//

  [[nodiscard]] auto GetResource() const noexcept
    -> const std::shared_ptr<Model>&
  {
    return resource_;
  }
  auto SetResource(std::shared_ptr<Model> resource) -> void
  {
    resource_ = std::move(resource);
  }

  //! Handle of the node this one was instantiated from, in the template graph.
  [[nodiscard]] auto GetOriginalHandleInResource() const noexcept
  {
    return original_handle_in_resource_;
  }
  auto SetOriginalHandleInResource(const NodeHandle handle) noexcept -> void
  {
    original_handle_in_resource_ = handle;
  }

  [[nodiscard]] auto IsResourceInstanceRoot() const noexcept
  {
    return is_resource_instance_root_;
  }
  auto SetResourceInstanceRoot(const bool is_root) noexcept -> void
  {
    is_resource_instance_root_ = is_root;
  }

  [[nodiscard]] auto GetInvBindPoseTransform() const noexcept
    -> const glm::mat4&
  {
    return inv_bind_pose_transform_;
  }
  auto SetInvBindPoseTransform(const glm::mat4& transform) noexcept -> void
  {
    inv_bind_pose_transform_ = transform;
  }

  //=== User data ===---------------------------------------------------------//

  [[nodiscard]] auto GetProperties() const noexcept
    -> const std::vector<Property>&
  {
    return properties_;
  }
  [[nodiscard]] auto GetProperties() noexcept -> std::vector<Property>&
  {
    return properties_;
  }

  //! First property named `name`, or nullptr.
  ARGN_SCN_NDAPI auto FindProperty(std::string_view name) const
    -> const Property*;

  [[nodiscard]] auto GetLodGroup() const noexcept
    -> const std::optional<LodGroup>&
  {
    return lod_group_;
  }
  [[nodiscard]] auto GetLodGroup() noexcept -> std::optional<LodGroup>&
  {
    return lod_group_;
  }
  auto SetLodGroup(std::optional<LodGroup> lod_group) -> void
  {
    lod_group_ = std::move(lod_group);
  }

  //=== Copy ===--------------------------------------------------------------//

  //! Copies the node without its hierarchy links.
  /*!
   The copy keeps its model and its original handle in that model, so a copy
   of an instance is resolved like the instance itself. Links to the
   simulation are reset: a copied body, collider or joint
   gets its own native entity during the next graph update. Handles held by
   the copy (bones, joint bodies, properties) still refer to the same nodes as
   the original's; Graph::RemapHandles() fixes them after a subtree copy.
  */
  ARGN_SCN_NDAPI auto RawCopy() const -> Node;

private:
  friend class Graph;
  friend struct detail::GraphJsonAccess;

  Node(const Node&) = default;

  std::string name_ {};
  std::string tag_ {};
  NodeHandle parent_ {};
  std::vector<NodeHandle> children_ {};
  Transform local_transform_ {};
  glm::mat4 global_transform_ { 1.0F };
  bool visibility_ { true };
  bool global_visibility_ { true };
  std::optional<float> lifetime_ {};
  std::shared_ptr<Model> resource_ {};
  NodeHandle original_handle_in_resource_ {};
  bool is_resource_instance_root_ { false };
  glm::mat4 inv_bind_pose_transform_ { 1.0F };
  std::vector<Property> properties_ {};
  std::optional<LodGroup> lod_group_ {};
  NodeKind kind_ { Pivot {} };
};

} // namespace argon::scene
