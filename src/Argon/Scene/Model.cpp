//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <loguru.hpp>

#include <Argon/Scene/Model.h>

auto argon::scene::InstantiateModel(
  const std::shared_ptr<Model>& model, Graph& dest) -> NodeHandle
{
  CHECK_NOTNULL_F(model.get(), "cannot instantiate a null model");
  const auto& source = model->scene;

  auto [root, mapping] = source.CopyNode(source.GetRoot(), dest);
  for (const auto& [original, copy] : mapping) {
    auto& node = dest[copy];
    node.SetResource(model);
    node.SetOriginalHandleInResource(original);
    node.GetLocalTransform().ClearCustomFlags();
  }
  dest[root].SetResourceInstanceRoot(true);

  LOG_F(INFO, "model '{}' instantiated with {} nodes", model->path,
    mapping.size());
  return root;
}
