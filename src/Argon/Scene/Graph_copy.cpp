//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <utility>
#include <variant>
#include <vector>

#include <loguru.hpp>

#include <Argon/Scene/Graph.h>

using argon::PhysicsConfig;
using argon::scene::Collider;
using argon::scene::Graph;
using argon::scene::HeightfieldShape;
using argon::scene::Joint;
using argon::scene::Mesh;
using argon::scene::Node;
using argon::scene::NodeFilter;
using argon::scene::NodeHandle;
using argon::scene::NodeHandleMap;
using argon::scene::TrimeshShape;

//------------------------------------------------------------------------------
// Scene Graph Copy Implementation
//------------------------------------------------------------------------------

/*!
 Copies `root` into `dest`, then its children that pass the filter, each one
 recursively. The children list is captured before anything is added, as
 `dest` may be this very graph and adding to it may relocate its nodes.
*/
auto Graph::CopyNodeRaw(const NodeHandle root, Graph& dest,
  NodeHandleMap& mapping, const NodeFilter& filter) const -> NodeHandle
{
  const auto children = (*this)[root].children_;
  const auto copy = dest.AddNode((*this)[root].RawCopy());
  mapping.emplace(root, copy);

  for (const auto child : children) {
    if (filter(child, (*this)[child])) {
      const auto child_copy = CopyNodeRaw(child, dest, mapping, filter);
      dest.LinkNodes(child_copy, copy);
    }
  }
  return copy;
}

auto Graph::CopyNode(const NodeHandle handle, Graph& dest,
  const NodeFilter& filter) const -> std::pair<NodeHandle, NodeHandleMap>
{
  NodeHandleMap mapping;
  const auto copy = CopyNodeRaw(handle, dest, mapping, filter);
  dest.RemapHandles(mapping);
  DLOG_F(1, "node {} copied with {} nodes", to_string(handle), mapping.size());
  return { copy, std::move(mapping) };
}

auto Graph::CopyNodeInplace(const NodeHandle handle, const NodeFilter& filter)
  -> std::pair<NodeHandle, NodeHandleMap>
{
  NodeHandleMap mapping;
  const auto copy = CopyNodeRaw(handle, *this, mapping, filter);
  RemapHandles(mapping);
  return { copy, std::move(mapping) };
}

auto Graph::CopySingleNode(const NodeHandle handle) const -> Node
{
  auto copy = (*this)[handle].RawCopy();
  if (auto* mesh = copy.TryAs<Mesh>()) {
    for (auto& surface : mesh->GetSurfaces()) {
      surface.bones.clear();
    }
  }
  return copy;
}

/*!
 Handles are rewritten only in the nodes that are values of the mapping, that
 is the copies. A handle that is not a key of the mapping refers to a node
 outside of the copied subtree, and is kept as is, except for LOD objects,
 which must belong to the group's subtree and are dropped.
*/
auto Graph::RemapHandles(const NodeHandleMap& old_new_mapping) -> void
{
  const auto remap = [&old_new_mapping](NodeHandle& handle) {
    if (const auto it = old_new_mapping.find(handle);
      it != old_new_mapping.end()) {
      handle = it->second;
    }
  };

  for (const auto& [original, copy] : old_new_mapping) {
    auto& node = (*this)[copy];

    if (auto* mesh = node.TryAs<Mesh>()) {
      for (auto& surface : mesh->GetSurfaces()) {
        for (auto& bone : surface.bones) {
          remap(bone);
        }
      }
    }

    if (auto* collider = node.TryAs<Collider>()) {
      if (const auto* trimesh
        = std::get_if<TrimeshShape>(&collider->GetShape())) {
        auto shape = *trimesh;
        for (auto& source : shape.sources) {
          remap(source.node);
        }
        collider->SetShape(std::move(shape));
      } else if (const auto* heightfield
        = std::get_if<HeightfieldShape>(&collider->GetShape())) {
        auto shape = *heightfield;
        remap(shape.geometry_source.node);
        collider->SetShape(shape);
      }
    }

    if (auto* joint = node.TryAs<Joint>()) {
      if (const auto it = old_new_mapping.find(joint->GetBody1());
        it != old_new_mapping.end()) {
        joint->SetBody1(it->second);
      }
      if (const auto it = old_new_mapping.find(joint->GetBody2());
        it != old_new_mapping.end()) {
        joint->SetBody2(it->second);
      }
    }

    for (auto& property : node.GetProperties()) {
      if (auto* handle = std::get_if<NodeHandle>(&property.value)) {
        remap(*handle);
      }
    }

    if (auto& lod_group = node.GetLodGroup()) {
      for (auto& level : lod_group->levels) {
        std::vector<NodeHandle> objects;
        objects.reserve(level.objects.size());
        for (const auto object : level.objects) {
          if (const auto it = old_new_mapping.find(object);
            it != old_new_mapping.end()) {
            objects.push_back(it->second);
          }
        }
        level.objects = std::move(objects);
      }
    }
  }
}

auto Graph::Clone(const NodeFilter& filter) const
  -> std::pair<Graph, NodeHandleMap>
{
  auto copy = MakeEmpty(PhysicsConfig {
    .gravity = physics_.GetGravity(),
    .integration = physics_.GetIntegrationParameters(),
  });
  if (!IsValidHandle(root_)) {
    return { std::move(copy), NodeHandleMap {} };
  }

  auto [root, mapping] = CopyNode(root_, copy, filter);
  copy.root_ = root;
  return { std::move(copy), std::move(mapping) };
}
