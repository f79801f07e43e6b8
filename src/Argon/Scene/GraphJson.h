//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <Argon/Scene/Graph.h>
#include <Argon/Scene/Model.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! Version written by SaveGraph(), and the only one LoadGraph() accepts.
constexpr int kGraphFormatVersion = 1;

//! Gives the Model for a persisted resource path, or nullptr if unknown.
using ModelResolver
  = std::function<std::shared_ptr<Model>(std::string_view path)>;

//! Writes the root handle and every slot of the node pool.
/*!
 Slots are written in index order, with their generation, so that every
 handle stays valid across a save and load. Physics entities and cached
 values (global transforms, visibility caches, particles) are not written;
 they are rebuilt by the next update. Resources are written as their path.
*/
ARGN_SCN_NDAPI auto SaveGraph(const Graph& graph) -> nlohmann::json;

//! Rebuilds a graph written by SaveGraph().
/*!
 `graph` must have no slot at all, such as a graph made with
 Graph::MakeEmpty(); loading into anything else aborts. Malformed data leaves
 the graph untouched and is reported as an error.

 Resource paths are turned into models with `resolver`. Without one, or when
 it returns nullptr, each distinct path gets a pending placeholder Model for
 the asset system to fill before the graph is resolved.
*/
ARGN_SCN_NDAPI auto LoadGraph(const nlohmann::json& data, Graph& graph,
  const ModelResolver& resolver = {}) -> std::expected<void, std::string>;

} // namespace argon::scene
