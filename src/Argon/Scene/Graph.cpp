//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>
#include <utility>
#include <vector>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <loguru.hpp>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Scene/Graph.h>

using argon::Overloads;
using argon::Ticket;
using argon::scene::Collider;
using argon::scene::Graph;
using argon::scene::Joint;
using argon::scene::Node;
using argon::scene::NodeHandle;
using argon::scene::Pivot;
using argon::scene::RigidBody;
using argon::scene::SubGraph;

//------------------------------------------------------------------------------
// Construction
//------------------------------------------------------------------------------

Graph::Graph(const PhysicsConfig config, EmptyTag /*tag*/)
  : physics_(config)
{
}

Graph::Graph(const PhysicsConfig config)
  : Graph(config, EmptyTag {})
{
  root_ = pool_.Spawn(Node(Pivot {}, std::string { kRootName }));
}

Graph::~Graph() = default;

auto Graph::MakeEmpty(const PhysicsConfig config) -> Graph
{
  return { config, EmptyTag {} };
}

//------------------------------------------------------------------------------
// Access
//------------------------------------------------------------------------------

auto Graph::operator[](const NodeHandle handle) -> Node&
{
  auto* node = pool_.TryBorrow(handle);
  CHECK_NOTNULL_F(node, "invalid node handle {}", to_string(handle));
  return *node;
}

auto Graph::operator[](const NodeHandle handle) const -> const Node&
{
  const auto* node = pool_.TryBorrow(handle);
  CHECK_NOTNULL_F(node, "invalid node handle {}", to_string(handle));
  return *node;
}

//------------------------------------------------------------------------------
// Structure
//------------------------------------------------------------------------------

/*!
 The node is spawned detached, then linked under the root when the graph has
 one. Children the node was carrying are linked back under it, which lets a
 subtree taken out with TakeReserve() be inserted again as a whole.
*/
auto Graph::AddNode(Node node) -> NodeHandle
{
  auto children = std::exchange(node.children_, {});
  node.parent_ = NodeHandle::None();

  const auto handle = pool_.Spawn(std::move(node));
  if (IsValidHandle(root_)) {
    LinkNodes(handle, root_);
  }
  for (const auto child : children) {
    LinkNodes(child, handle);
  }
  return handle;
}

auto Graph::LinkNodes(const NodeHandle child, const NodeHandle parent) -> void
{
  UnlinkInternal(child);
  (*this)[child].parent_ = parent;
  (*this)[parent].children_.push_back(child);
}

auto Graph::UnlinkNode(const NodeHandle handle) -> void
{
  LinkNodes(handle, root_);
  (*this)[handle].local_transform_.SetPosition(glm::vec3 { 0.0F });
}

/*!
 Detaches the node from its parent. A collider loses its native collider,
 which belonged to the body of the former parent; a new one is created during
 the next update if the node ends up under a rigid body again.
*/
auto Graph::UnlinkInternal(const NodeHandle handle) -> void
{
  auto& node = (*this)[handle];
  const auto parent = std::exchange(node.parent_, NodeHandle::None());
  if (auto* parent_node = pool_.TryBorrow(parent)) {
    std::erase(parent_node->children_, handle);
  }

  if (auto* collider = node.TryAs<Collider>()) {
    if (const auto native = collider->GetNative();
      physics_.ContainsCollider(native)) {
      physics_.RemoveCollider(native);
      collider_map_.erase(native);
      collider->ResetNative();
    }
  }
}

auto Graph::RemoveNode(const NodeHandle handle) -> void
{
  UnlinkInternal(handle);

  std::vector stack { handle };
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();

    auto node = pool_.Free(current);
    stack.insert(stack.end(), node.children_.begin(), node.children_.end());
    ReleaseNativeEntities(node);
    if (current == root_) {
      root_ = NodeHandle::None();
    }
  }
}

auto Graph::ReleaseNativeEntities(Node& node) -> void
{
  std::visit(Overloads {
               [this](RigidBody& body) {
                 for (const auto collider : physics_.RemoveBody(body.GetNative())) {
                   collider_map_.erase(collider);
                 }
                 body.ResetNative();
               },
               [this](Collider& collider) {
                 collider_map_.erase(collider.GetNative());
                 physics_.RemoveCollider(collider.GetNative());
                 collider.ResetNative();
               },
               [this](Joint& joint) {
                 physics_.RemoveJoint(joint.GetNative());
                 joint.ResetNative();
               },
               [](auto& /*other*/) {},
             },
    node.GetKind());
}

//------------------------------------------------------------------------------
// Queries
//------------------------------------------------------------------------------

auto Graph::Find(const NodeHandle from, const NodePredicate& pred) const
  -> NodeHandle
{
  const auto* node = TryGet(from);
  if (node == nullptr) {
    return NodeHandle::None();
  }
  if (pred(*node)) {
    return from;
  }
  for (const auto child : node->children_) {
    if (const auto found = Find(child, pred); found.IsValid()) {
      return found;
    }
  }
  return NodeHandle::None();
}

auto Graph::FindByName(const NodeHandle from, const std::string_view name) const
  -> NodeHandle
{
  return Find(from, [name](const Node& node) { return node.GetName() == name; });
}

auto Graph::FindCopyOf(const NodeHandle root, const NodeHandle original) const
  -> NodeHandle
{
  return Find(root, [original](const Node& node) {
    return node.GetOriginalHandleInResource() == original;
  });
}

auto Graph::TraverseHandles(const NodeHandle from) const
  -> std::vector<NodeHandle>
{
  std::vector<NodeHandle> handles;
  std::vector stack { from };
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();
    if (const auto* node = TryGet(current)) {
      handles.push_back(current);
      stack.insert(stack.end(), node->children_.begin(), node->children_.end());
    }
  }
  return handles;
}

auto Graph::FindColliderNode(const physics::ColliderHandle native) const
  -> NodeHandle
{
  const auto it = collider_map_.find(native);
  return it != collider_map_.end() ? it->second : NodeHandle::None();
}

//------------------------------------------------------------------------------
// Reservation
//------------------------------------------------------------------------------

auto Graph::TakeReserve(const NodeHandle handle)
  -> std::pair<Ticket<Node>, Node>
{
  UnlinkInternal(handle);
  return pool_.TakeReserve(handle);
}

auto Graph::PutBack(Ticket<Node>&& ticket, Node node) -> NodeHandle
{
  const auto handle = pool_.PutBack(std::move(ticket), std::move(node));
  LinkNodes(handle, root_);
  return handle;
}

auto Graph::ForgetTicket(Ticket<Node>&& ticket) -> void
{
  pool_.ForgetTicket(std::move(ticket));
}

/*!
 Descendants are taken out first, while the hierarchy can still be walked
 through the pool, then the root is detached and taken out.
*/
auto Graph::TakeReserveSubGraph(const NodeHandle root) -> SubGraph
{
  std::vector<SubGraph::Entry> descendants;
  auto stack = (*this)[root].children_;
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();

    auto entry = pool_.TakeReserve(current);
    const auto& children = entry.second.children_;
    stack.insert(stack.end(), children.begin(), children.end());
    descendants.push_back(std::move(entry));
  }

  auto root_entry = TakeReserve(root);
  DLOG_F(1, "sub-graph {} taken out with {} descendants", to_string(root),
    descendants.size());
  return { std::move(root_entry), std::move(descendants) };
}

auto Graph::PutSubGraphBack(SubGraph sub_graph) -> NodeHandle
{
  for (auto& [ticket, node] : sub_graph.descendants) {
    pool_.PutBack(std::move(ticket), std::move(node));
  }
  auto& [ticket, node] = sub_graph.root;
  return PutBack(std::move(ticket), std::move(node));
}

/*!
 The simulation entities of the forgotten nodes are released too, as nothing
 can refer to them anymore.
*/
auto Graph::ForgetSubGraph(SubGraph sub_graph) -> void
{
  for (auto& [ticket, node] : sub_graph.descendants) {
    ReleaseNativeEntities(node);
    pool_.ForgetTicket(std::move(ticket));
  }
  auto& [ticket, node] = sub_graph.root;
  ReleaseNativeEntities(node);
  pool_.ForgetTicket(std::move(ticket));
}

//------------------------------------------------------------------------------
// Hierarchy
//------------------------------------------------------------------------------

auto Graph::UpdateHierarchicalData() -> void
{
  if (!IsValidHandle(root_)) {
    return;
  }

  std::vector stack { root_ };
  while (!stack.empty()) {
    const auto current = stack.back();
    stack.pop_back();

    auto& node = (*this)[current];
    if (const auto* parent = TryGet(node.parent_)) {
      node.global_transform_
        = parent->global_transform_ * node.local_transform_.Matrix();
      node.global_visibility_
        = node.visibility_ && parent->global_visibility_;
    } else {
      node.global_transform_ = node.local_transform_.Matrix();
      node.global_visibility_ = node.visibility_;
    }
    stack.insert(stack.end(), node.children_.begin(), node.children_.end());
  }
}

auto Graph::LocalTransformNoScale(const NodeHandle node) const -> glm::mat4
{
  auto transform = (*this)[node].local_transform_;
  transform.SetScale(glm::vec3 { 1.0F });
  return transform.Matrix();
}

auto Graph::GlobalTransformNoScale(const NodeHandle node) const -> glm::mat4
{
  const auto local = LocalTransformNoScale(node);
  if (const auto parent = (*this)[node].parent_; IsValidHandle(parent)) {
    return GlobalTransformNoScale(parent) * local;
  }
  return local;
}

auto Graph::IsometricLocalTransform(const NodeHandle node) const -> glm::mat4
{
  return (*this)[node].local_transform_.IsometricMatrix();
}

auto Graph::IsometricGlobalTransform(const NodeHandle node) const -> glm::mat4
{
  const auto local = IsometricLocalTransform(node);
  if (const auto parent = (*this)[node].parent_; IsValidHandle(parent)) {
    return IsometricGlobalTransform(parent) * local;
  }
  return local;
}

auto Graph::GlobalScaleMatrix(const NodeHandle node) const -> glm::mat4
{
  const auto& n = (*this)[node];
  const auto local
    = glm::scale(glm::mat4 { 1.0F }, *n.local_transform_.GetScale());
  if (IsValidHandle(n.parent_)) {
    return GlobalScaleMatrix(n.parent_) * local;
  }
  return local;
}

auto Graph::GlobalRotation(const NodeHandle node) const -> glm::quat
{
  return glm::quat_cast(glm::mat3 { GlobalTransformNoScale(node) });
}

auto Graph::IsometricGlobalRotation(const NodeHandle node) const -> glm::quat
{
  return glm::quat_cast(glm::mat3 { IsometricGlobalTransform(node) });
}

auto Graph::GlobalRotationPositionNoScale(const NodeHandle node) const
  -> std::pair<glm::quat, glm::vec3>
{
  const auto transform = GlobalTransformNoScale(node);
  return { glm::quat_cast(glm::mat3 { transform }), glm::vec3 { transform[3] } };
}

auto Graph::IsometricGlobalRotationPosition(const NodeHandle node) const
  -> std::pair<glm::quat, glm::vec3>
{
  const auto transform = IsometricGlobalTransform(node);
  return { glm::quat_cast(glm::mat3 { transform }), glm::vec3 { transform[3] } };
}

auto Graph::GlobalScale(const NodeHandle node) const -> glm::vec3
{
  const auto m = GlobalScaleMatrix(node);
  return { m[0][0], m[1][1], m[2][2] };
}
