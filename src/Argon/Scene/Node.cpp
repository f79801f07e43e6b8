//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <Argon/Base/VariantHelpers.h>
#include <Argon/Scene/Node.h>

using argon::scene::Node;
using argon::scene::NodeKind;
using argon::scene::Property;

auto argon::scene::to_string(const NodeKind& kind) -> const char*
{
  return std::visit(
    Overloads {
      [](const Pivot&) { return "Pivot"; },
      [](const Mesh&) { return "Mesh"; },
      [](const Camera&) { return "Camera"; },
      [](const Light&) { return "Light"; },
      [](const ParticleSystem&) { return "ParticleSystem"; },
      [](const Terrain&) { return "Terrain"; },
      [](const RigidBody&) { return "RigidBody"; },
      [](const Collider&) { return "Collider"; },
      [](const Joint&) { return "Joint"; },
    },
    kind);
}

Node::Node(NodeKind kind, std::string name)
  : name_(std::move(name))
  , kind_(std::move(kind))
{
}

auto Node::MarkTransformModified() noexcept -> void
{
  if (auto* body = TryAs<RigidBody>()) {
    body->MarkTransformModified();
  } else if (auto* collider = TryAs<Collider>()) {
    collider->MarkTransformModified();
  }
}

auto Node::FindProperty(const std::string_view name) const -> const Property*
{
  const auto it = std::ranges::find(properties_, name, &Property::name);
  return it != properties_.end() ? &*it : nullptr;
}

auto Node::RawCopy() const -> Node
{
  Node copy(*this);
  copy.parent_ = NodeHandle::None();
  copy.children_.clear();
  std::visit(
    Overloads {
      [](RigidBody& body) { body.ResetNative(); },
      [](Collider& collider) { collider.ResetNative(); },
      [](Joint& joint) { joint.ResetNative(); },
      [](auto&) {},
    },
    copy.kind_);
  return copy;
}
