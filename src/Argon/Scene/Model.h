//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <Argon/Scene/Graph.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

enum class ResourceState : uint8_t {
  kPending, //!< Still loading.
  kOk,
  kLoadError,
};

constexpr auto to_string(const ResourceState value) noexcept -> const char*
{
  switch (value) {
  case ResourceState::kPending:
    return "Pending";
  case ResourceState::kOk:
    return "Ok";
  case ResourceState::kLoadError:
    return "LoadError";
  }
  return "__NotSupported__";
}

//! How instance nodes are matched with the nodes of their template.
enum class NodeMapping : uint8_t {
  kUseNames, //!< By node name. Survives edits of the template.
  kUseHandles, //!< By original handle in the template graph.
};

constexpr auto to_string(const NodeMapping value) noexcept -> const char*
{
  switch (value) {
  case NodeMapping::kUseNames:
    return "UseNames";
  case NodeMapping::kUseHandles:
    return "UseHandles";
  }
  return "__NotSupported__";
}

//! A template graph, shared by the nodes instantiated from it.
/*!
 Loading is the asset system's job: the model is created pending, filled,
 then marked kOk or kLoadError. Graph::Resolve() must not run while any
 referenced model is pending.
*/
struct Model {
  explicit Model(std::string model_path = {}, Graph model_scene = Graph {})
    : path(std::move(model_path))
    , scene(std::move(model_scene))
  {
  }

  std::string path;
  ResourceState state { ResourceState::kPending };
  NodeMapping mapping { NodeMapping::kUseNames };
  Graph scene;
};

//! Copies the template root of `model`, and its descendants, under the root of
//! `dest`, and links the copies to their template nodes.
/*!
 @return the handle of the instance root.
*/
ARGN_SCN_API auto InstantiateModel(
  const std::shared_ptr<Model>& model, Graph& dest) -> NodeHandle;

} // namespace argon::scene
