//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <utility>
#include <vector>

#include <Argon/Base/Macros.h>
#include <Argon/Base/Pool.h>
#include <Argon/Scene/Node.h>

namespace argon::scene {

//! A subtree taken out of a graph, owning its nodes.
/*!
 The slots of the extracted nodes stay reserved in the graph, so no handle to
 them is ever reused while the sub-graph is out. This lets an editor keep an
 undone edit (for example a loaded model) aside, and redo it later with every
 handle to its nodes still valid.

 A sub-graph must be given back to the graph it came from, either with
 Graph::PutSubGraphBack() or Graph::ForgetSubGraph().
*/
struct SubGraph {
  using Entry = std::pair<Ticket<Node>, Node>;

  SubGraph(Entry root_entry, std::vector<Entry> descendant_entries)
    : root(std::move(root_entry))
    , descendants(std::move(descendant_entries))
  {
  }

  ~SubGraph() = default;

  ARGON_MAKE_MOVE_ONLY(SubGraph)

  //! The root of the subtree, detached from its former parent.
  Entry root;

  //! Every descendant of the root, with its hierarchy links intact.
  std::vector<Entry> descendants;
};

} // namespace argon::scene
