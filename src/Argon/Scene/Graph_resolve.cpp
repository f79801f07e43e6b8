//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include <loguru.hpp>

#include <Argon/Scene/Graph.h>
#include <Argon/Scene/Model.h>

using argon::scene::Camera;
using argon::scene::Graph;
using argon::scene::Mesh;
using argon::scene::Node;
using argon::scene::NodeHandle;
using argon::scene::NodeMapping;
using argon::scene::ResolveStats;
using argon::scene::ResourceState;

//------------------------------------------------------------------------------
// Template Resolution Implementation
//------------------------------------------------------------------------------

auto Graph::Resolve() -> ResolveStats
{
  LOG_SCOPE_FUNCTION(INFO);

  UpdateHierarchicalData();
  ResolveOriginals();
  const auto stats = RestoreIntegrity();
  RemapBones();

  pool_.ForEach([](const NodeHandle /*handle*/, Node& node) {
    auto* camera = node.TryAs<Camera>();
    if (camera == nullptr) {
      return;
    }
    if (auto* sky_box = camera->GetSkyBox();
      sky_box != nullptr && !sky_box->CreateCubemap()) {
      LOG_F(WARNING, "sky box of camera '{}' could not be created",
        node.GetName());
    }
  });

  return stats;
}

/*!
 Walks up from `from` to the closest instance root, or to the top of the
 hierarchy if the node is not part of an instance.
*/
auto Graph::FindModelRoot(const NodeHandle from) const -> NodeHandle
{
  auto current = from;
  while (true) {
    const auto& node = (*this)[current];
    if (node.is_resource_instance_root_ || !IsValidHandle(node.parent_)) {
      return current;
    }
    current = node.parent_;
  }
}

/*!
 Matches every instantiated node with its template node, then takes from the
 template what the user did not customize: transform components, the inverse
 bind pose, and the surfaces of meshes.
*/
auto Graph::ResolveOriginals() -> void
{
  LOG_SCOPE_F(INFO, "Resolving originals");

  pool_.ForEach([](const NodeHandle handle, Node& node) {
    const auto model = node.resource_;
    if (!model) {
      return;
    }
    CHECK_F(model->state != ResourceState::kPending,
      "node '{}' resolved while its model '{}' is still pending", node.name_,
      model->path);
    if (model->state == ResourceState::kLoadError) {
      DLOG_F(1, "model '{}' failed to load, node '{}' left as is", model->path,
        node.name_);
      return;
    }

    const auto& templ = model->scene;
    auto original = NodeHandle::None();
    switch (model->mapping) {
    case NodeMapping::kUseNames:
      original = templ.FindByNameFromRoot(node.name_);
      break;
    case NodeMapping::kUseHandles:
      original = node.original_handle_in_resource_;
      break;
    }

    const auto* source = templ.TryGet(original);
    if (source == nullptr) {
      LOG_F(WARNING, "node '{}' ({}) has no match in model '{}'", node.name_,
        to_string(handle), model->path);
      return;
    }

    node.original_handle_in_resource_ = original;
    node.inv_bind_pose_transform_ = source->inv_bind_pose_transform_;
    node.local_transform_.SyncFromTemplate(source->local_transform_);

    auto* mesh = node.TryAs<Mesh>();
    const auto* source_mesh = source->TryAs<Mesh>();
    if (mesh != nullptr && source_mesh != nullptr) {
      mesh->GetSurfaces() = source_mesh->GetSurfaces();
    }
  });
}

/*!
 Nodes added to a template after it was instantiated are copied into every
 instance. A missing node is looked up by name under the instance root, and
 its copy is attached under the node named like its template parent, or under
 the instance root when there is no such node.
*/
auto Graph::RestoreIntegrity() -> ResolveStats
{
  LOG_SCOPE_F(INFO, "Restoring integrity");

  std::vector<NodeHandle> instances;
  pool_.ForEach([&instances](const NodeHandle handle, const Node& node) {
    if (node.is_resource_instance_root_ && node.resource_) {
      instances.push_back(handle);
    }
  });

  ResolveStats stats { .instance_count = instances.size() };
  for (const auto instance : instances) {
    const auto model = (*this)[instance].resource_;
    if (model->state != ResourceState::kOk) {
      continue;
    }

    const auto& templ = model->scene;
    const auto original = (*this)[instance].original_handle_in_resource_;
    if (!templ.IsValidHandle(original)) {
      LOG_F(WARNING, "instance root '{}' has no original node in model '{}'",
        (*this)[instance].name_, model->path);
      continue;
    }

    for (const auto templ_handle : templ.TraverseHandles(original)) {
      if (templ_handle == original) {
        continue;
      }
      const auto& templ_node = templ[templ_handle];
      if (FindByName(instance, templ_node.name_).IsValid()) {
        continue;
      }

      const auto [copy, mapping] = templ.CopyNode(templ_handle, *this);
      for (const auto& [source, restored] : mapping) {
        auto& node = (*this)[restored];
        node.resource_ = model;
        node.original_handle_in_resource_ = source;
      }

      auto parent = NodeHandle::None();
      if (const auto* templ_parent = templ.TryGet(templ_node.parent_)) {
        parent = FindByName(instance, templ_parent->name_);
      }
      LinkNodes(copy, parent.IsValid() ? parent : instance);

      DLOG_F(1, "node '{}' restored in instance '{}'", templ_node.name_,
        (*this)[instance].name_);
      stats.restored_count += mapping.size();
    }
  }

  LOG_F(INFO, "Integrity restored for {} instances! {} new nodes were added!",
    stats.instance_count, stats.restored_count);
  return stats;
}

/*!
 Bones of instantiated meshes are rebuilt from the bones of their template
 mesh, each one replaced by its copy in the same instance. New bone lists are
 computed for every mesh first, and applied afterwards, so that lookups never
 see a half-remapped graph. Bones without a copy are dropped.
*/
auto Graph::RemapBones() -> void
{
  LOG_SCOPE_F(INFO, "Remapping bones");

  using SurfaceBones = std::vector<std::vector<NodeHandle>>;
  std::vector<std::pair<NodeHandle, SurfaceBones>> remapped;

  pool_.ForEach([this, &remapped](const NodeHandle handle, const Node& node) {
    if (!node.Is<Mesh>() || !node.resource_
      || node.resource_->state != ResourceState::kOk) {
      return;
    }
    const auto* source = node.resource_->scene.TryGet(
      node.original_handle_in_resource_);
    const auto* source_mesh
      = source != nullptr ? source->TryAs<Mesh>() : nullptr;
    if (source_mesh == nullptr) {
      return;
    }

    const auto model_root = FindModelRoot(handle);
    const auto& source_surfaces = source_mesh->GetSurfaces();
    const auto count
      = std::min(source_surfaces.size(), node.As<Mesh>().GetSurfaces().size());

    SurfaceBones surface_bones(count);
    for (std::size_t i = 0; i < count; ++i) {
      for (const auto bone : source_surfaces[i].bones) {
        if (const auto copy = FindCopyOf(model_root, bone); copy.IsValid()) {
          surface_bones[i].push_back(copy);
        } else {
          LOG_F(ERROR, "bone {} of mesh '{}' has no copy in its instance, "
                       "dropped",
            to_string(bone), node.name_);
        }
      }
    }
    remapped.emplace_back(handle, std::move(surface_bones));
  });

  for (auto& [handle, surface_bones] : remapped) {
    auto& surfaces = (*this)[handle].As<Mesh>().GetSurfaces();
    for (std::size_t i = 0; i < surface_bones.size(); ++i) {
      surfaces[i].bones = std::move(surface_bones[i]);
    }
  }
}
