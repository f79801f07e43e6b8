//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include <glm/gtc/quaternion.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <Argon/Base/Macros.h>
#include <Argon/Base/Pool.h>
#include <Argon/Config/PhysicsConfig.h>
#include <Argon/Physics/PhysicsWorld.h>
#include <Argon/Scene/Node.h>
#include <Argon/Scene/RayCast.h>
#include <Argon/Scene/SubGraph.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! Decides whether a descendant node is included in a copy.
using NodeFilter = std::function<bool(NodeHandle, const Node&)>;

using NodePredicate = std::function<bool(const Node&)>;

//! Outcome of Graph::Resolve().
struct ResolveStats {
  //! Number of template instances found in the graph.
  std::size_t instance_count { 0 };
  //! Number of nodes added back to instances missing them.
  std::size_t restored_count { 0 };
};

//! The scene graph: a tree of nodes, and the physics world they drive.
/*!
 Nodes are stored in a generation-checked pool and referred to by NodeHandle.
 Structural edits never move nodes visibly: a handle stays valid until its node
 is removed, and a removed node's handle never aliases a new node.

 Every live node except the root is reachable from the root, and has exactly
 one parent that lists it exactly once among its children. Linking always
 detaches first, so this holds by construction. Linking a node under one of
 its own descendants is not checked, and must not be done.

 Each frame, Update() runs, in this order:
  1. push the node state changed by the user to the physics world;
  2. step the simulation;
  3. recompute the global transforms and visibility;
  4. per node: lifetime, cameras, particle systems, terrains, meshes, and the
     rigid body state pulled back from the simulation.

 Physics entities are owned by the graph's PhysicsWorld and are created
 lazily from the node state, so a graph can be built, copied or loaded without
 any simulation state.

 The graph is not thread safe. Ray casts must not run concurrently with
 structural edits.
*/
class Graph {
public:
  //! Creates a graph with a single root node.
  ARGN_SCN_API explicit Graph(PhysicsConfig config = {});

  //! Creates a graph without any node, not even a root. Used as the target of
  //! Clone() and persistence.
  ARGN_SCN_NDAPI static auto MakeEmpty(PhysicsConfig config = {}) -> Graph;

  ARGN_SCN_API ~Graph();

  ARGON_MAKE_NON_COPYABLE(Graph)
  ARGON_DEFAULT_MOVABLE(Graph)

  static constexpr std::string_view kRootName = "__ROOT__";

  //=== Structure ===---------------------------------------------------------//

  //! Moves `node` into the graph, under the root.
  /*!
   Children already listed by the node are linked again under it once it is
   inserted, so a pre-built subtree becomes reachable in a single call.
  */
  ARGN_SCN_API auto AddNode(Node node) -> NodeHandle;

  //! Detaches `child` from its parent, then appends it to `parent`'s children.
  ARGN_SCN_API auto LinkNodes(NodeHandle child, NodeHandle parent) -> void;

  //! Moves the node under the root, and resets its local position to the
  //! origin.
  ARGN_SCN_API auto UnlinkNode(NodeHandle handle) -> void;

  //! Removes the node and all its descendants, with their physics entities.
  /*!
   References to the removed nodes held elsewhere (properties, LOD groups,
   joints) are left as they are; they simply go stale.
  */
  ARGN_SCN_API auto RemoveNode(NodeHandle handle) -> void;

  [[nodiscard]] auto GetRoot() const noexcept { return root_; }

  //=== Access ===------------------------------------------------------------//

  //! Aborts if the handle does not refer to a live node.
  ARGN_SCN_NDAPI auto operator[](NodeHandle handle) -> Node&;
  ARGN_SCN_NDAPI auto operator[](NodeHandle handle) const -> const Node&;

  [[nodiscard]] auto TryGet(const NodeHandle handle) noexcept -> Node*
  {
    return pool_.TryBorrow(handle);
  }
  [[nodiscard]] auto TryGet(const NodeHandle handle) const noexcept
    -> const Node*
  {
    return pool_.TryBorrow(handle);
  }

  //! Borrows several distinct nodes mutably at the same time. Fails with
  //! BorrowError::kAliasedHandles when a handle is given twice, and with
  //! BorrowError::kInvalidHandle when a handle is not valid.
  [[nodiscard]] auto GetTwoMut(const NodeHandle a, const NodeHandle b)
    -> std::expected<std::tuple<Node&, Node&>, BorrowError>
  {
    return pool_.BorrowMut(a, b);
  }
  [[nodiscard]] auto GetThreeMut(
    const NodeHandle a, const NodeHandle b, const NodeHandle c)
    -> std::expected<std::tuple<Node&, Node&, Node&>, BorrowError>
  {
    return pool_.BorrowMut(a, b, c);
  }
  [[nodiscard]] auto GetFourMut(const NodeHandle a, const NodeHandle b,
    const NodeHandle c, const NodeHandle d)
    -> std::expected<std::tuple<Node&, Node&, Node&, Node&>, BorrowError>
  {
    return pool_.BorrowMut(a, b, c, d);
  }

  [[nodiscard]] auto IsValidHandle(const NodeHandle handle) const noexcept
  {
    return pool_.Contains(handle);
  }

  //! Number of live nodes.
  [[nodiscard]] auto NodeCount() const noexcept { return pool_.Size(); }

  //! Number of slots of the node pool. Indices in `[0, Capacity())` can be
  //! turned into handles with HandleFromIndex().
  [[nodiscard]] auto Capacity() const noexcept { return pool_.Capacity(); }

  //! Handle of the node at `index`, or None if that slot holds no live node.
  [[nodiscard]] auto HandleFromIndex(const uint32_t index) const noexcept
  {
    return pool_.HandleFromIndex(index);
  }

  //! Calls `fn(handle, node)` for every live node, in slot order. This is a
  //! linear walk of the pool, not a tree traversal. `fn` must not add or
  //! remove nodes.
  template <typename Fn> auto ForEachNode(Fn&& fn) -> void
  {
    pool_.ForEach(std::forward<Fn>(fn));
  }
  template <typename Fn> auto ForEachNode(Fn&& fn) const -> void
  {
    pool_.ForEach(std::forward<Fn>(fn));
  }

  //=== Queries ===-----------------------------------------------------------//

  //! First node, in depth-first pre-order from `from`, that satisfies `pred`.
  //! None if there is none.
  ARGN_SCN_NDAPI auto Find(NodeHandle from, const NodePredicate& pred) const
    -> NodeHandle;

  ARGN_SCN_NDAPI auto FindByName(NodeHandle from, std::string_view name) const
    -> NodeHandle;

  [[nodiscard]] auto FindFromRoot(const NodePredicate& pred) const
  {
    return Find(root_, pred);
  }

  [[nodiscard]] auto FindByNameFromRoot(const std::string_view name) const
  {
    return FindByName(root_, name);
  }

  //! The node under `root` (inclusive) that was instantiated from `original`,
  //! a node of the template graph. None if there is none.
  ARGN_SCN_NDAPI auto FindCopyOf(NodeHandle root, NodeHandle original) const
    -> NodeHandle;

  //! Handles of `from` and its descendants, depth first. The children of a
  //! node are visited last to first.
  ARGN_SCN_NDAPI auto TraverseHandles(NodeHandle from) const
    -> std::vector<NodeHandle>;

  //=== Copy ===--------------------------------------------------------------//

  //! Deep copies a node and its descendants into `dest`.
  /*!
   `filter` is called for each descendant and excludes it, with its own
   descendants, when it returns false. The copy root is added under the root
   of `dest`. Handles held by copied nodes that refer to other copied nodes
   are remapped to the copies.

   This is a heavy operation, not meant to run every frame.

   @return the handle of the copy, and the old-to-new handle mapping.
  */
  ARGN_SCN_API auto CopyNode(NodeHandle handle, Graph& dest,
    const NodeFilter& filter = AcceptAll) const
    -> std::pair<NodeHandle, NodeHandleMap>;

  //! Same as CopyNode(), with this graph as destination.
  ARGN_SCN_API auto CopyNodeInplace(
    NodeHandle handle, const NodeFilter& filter = AcceptAll)
    -> std::pair<NodeHandle, NodeHandleMap>;

  //! Copies a single node, detached from everything: no parent, no children,
  //! and no bones, so a skinned mesh copy is no longer skinned.
  ARGN_SCN_NDAPI auto CopySingleNode(NodeHandle handle) const -> Node;

  //! Rewrites the handles held by the mapped nodes: mesh bones, mesh-based
  //! collider sources, joint bodies, node properties and LOD objects. LOD
  //! objects missing from the mapping are dropped, other handles are kept.
  ARGN_SCN_API auto RemapHandles(const NodeHandleMap& old_new_mapping) -> void;

  //! Deep copies the whole graph. The copy has the same physics configuration
  //! and no physics entities.
  ARGN_SCN_NDAPI auto Clone(const NodeFilter& filter = AcceptAll) const
    -> std::pair<Graph, NodeHandleMap>;

  //=== Reservation ===-------------------------------------------------------//

  //! Takes a node out of the graph, keeping its handle reserved. The node is
  //! detached from its parent; its children are left as they are.
  ARGN_SCN_API auto TakeReserve(NodeHandle handle)
    -> std::pair<Ticket<Node>, Node>;

  //! Puts a reserved node back, under the root, with its former handle.
  ARGN_SCN_API auto PutBack(Ticket<Node>&& ticket, Node node) -> NodeHandle;

  //! Releases a reserved handle for good.
  ARGN_SCN_API auto ForgetTicket(Ticket<Node>&& ticket) -> void;

  //! Takes out a node and all its descendants, keeping their handles
  //! reserved. The root of the sub-graph is detached from its parent.
  ARGN_SCN_NDAPI auto TakeReserveSubGraph(NodeHandle root) -> SubGraph;

  //! Puts a sub-graph back under the root. Every handle to its nodes is valid
  //! again. Returns the handle of its root.
  ARGN_SCN_API auto PutSubGraphBack(SubGraph sub_graph) -> NodeHandle;

  //! Releases the handles of a sub-graph for good.
  ARGN_SCN_API auto ForgetSubGraph(SubGraph sub_graph) -> void;

  //=== Hierarchy ===---------------------------------------------------------//

  //! Recomputes the global transform and visibility of every node, top-down.
  /*!
   Called by Update(). Call it directly to read global values of a freshly
   built hierarchy before the first update.
  */
  ARGN_SCN_API auto UpdateHierarchicalData() -> void;

  //! Local matrix of the node, with its scale ignored.
  ARGN_SCN_NDAPI auto LocalTransformNoScale(NodeHandle node) const -> glm::mat4;
  //! World matrix of the node, with the scale of every ancestor ignored.
  ARGN_SCN_NDAPI auto GlobalTransformNoScale(NodeHandle node) const
    -> glm::mat4;
  //! Translation and rotations only, see Transform::IsometricMatrix().
  ARGN_SCN_NDAPI auto IsometricLocalTransform(NodeHandle node) const
    -> glm::mat4;
  ARGN_SCN_NDAPI auto IsometricGlobalTransform(NodeHandle node) const
    -> glm::mat4;
  ARGN_SCN_NDAPI auto GlobalScaleMatrix(NodeHandle node) const -> glm::mat4;
  ARGN_SCN_NDAPI auto GlobalRotation(NodeHandle node) const -> glm::quat;
  ARGN_SCN_NDAPI auto IsometricGlobalRotation(NodeHandle node) const
    -> glm::quat;
  ARGN_SCN_NDAPI auto GlobalRotationPositionNoScale(NodeHandle node) const
    -> std::pair<glm::quat, glm::vec3>;
  ARGN_SCN_NDAPI auto IsometricGlobalRotationPosition(NodeHandle node) const
    -> std::pair<glm::quat, glm::vec3>;
  ARGN_SCN_NDAPI auto GlobalScale(NodeHandle node) const -> glm::vec3;

  //=== Templates ===---------------------------------------------------------//

  //! Reconciles template instances with their templates.
  /*!
   Run after loading or instantiating, once every referenced Model is loaded.
   Resolving while a Model is still pending is a contract violation and
   aborts.

   1. Each node with a resource is matched to its template node (by name or by
      original handle, depending on the Model's NodeMapping). Its non-custom
      transform components are taken from the template node, and a mesh gets
      the template surfaces.
   2. Template nodes missing from an instance are copied back in, under the
      matching parent, or the instance root if there is none.
   3. Bones of instantiated meshes are remapped to the instance nodes; bones
      that cannot be found are dropped.
   4. Sky boxes of cameras build their cube maps.

   Heavy operation, not meant to run every frame.
  */
  ARGN_SCN_API auto Resolve() -> ResolveStats;

  //=== Physics and frame update ===------------------------------------------//

  //! Advances the graph by one frame of `dt` seconds. `frame_size` is the
  //! size in pixels of the frame rendered by the cameras.
  ARGN_SCN_API auto Update(const glm::vec2& frame_size, float dt) -> void;

  //! Casts a ray against the colliders, streaming the hits into `results`.
  /*!
   `results` is cleared first. The query stops at the first hit the storage
   rejects. Hits against native colliders unknown to the graph are logged and
   skipped.
  */
  ARGN_SCN_API auto CastRay(
    const RayCastOptions& options, QueryResultsStorage& results) -> void;

  [[nodiscard]] auto GetPhysics() noexcept -> physics::PhysicsWorld&
  {
    return physics_;
  }
  [[nodiscard]] auto GetPhysics() const noexcept -> const physics::PhysicsWorld&
  {
    return physics_;
  }

  //! The Collider node backed by `native`, or None.
  ARGN_SCN_NDAPI auto FindColliderNode(physics::ColliderHandle native) const
    -> NodeHandle;

  static auto AcceptAll(NodeHandle /*handle*/, const Node& /*node*/) -> bool
  {
    return true;
  }

private:
  friend struct detail::GraphJsonAccess;

  struct EmptyTag { };
  Graph(PhysicsConfig config, EmptyTag);

  auto UnlinkInternal(NodeHandle handle) -> void;
  auto ReleaseNativeEntities(Node& node) -> void;

  auto CopyNodeRaw(NodeHandle root, Graph& dest, NodeHandleMap& mapping,
    const NodeFilter& filter) const -> NodeHandle;

  [[nodiscard]] auto FindModelRoot(NodeHandle from) const -> NodeHandle;
  auto ResolveOriginals() -> void;
  auto RestoreIntegrity() -> ResolveStats;
  auto RemapBones() -> void;

  auto SyncNativePhysics() -> void;
  auto SyncRigidBody(Node& node) -> void;
  auto SyncCollider(NodeHandle handle, Node& node) -> void;
  auto SyncJoint(Node& node) -> void;
  auto UpdateNode(NodeHandle handle, const glm::vec2& frame_size, float dt)
    -> void;

  physics::PhysicsWorld physics_;
  std::unordered_map<physics::ColliderHandle, NodeHandle> collider_map_ {};
  NodeHandle root_ {};
  Pool<Node> pool_ {};
};

} // namespace argon::scene
