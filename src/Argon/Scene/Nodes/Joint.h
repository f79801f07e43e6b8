//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include <Argon/Base/ChangeSet.h>
#include <Argon/Physics/NativeEntities.h>
#include <Argon/Scene/Types.h>

namespace argon::scene {

enum class JointChange : uint8_t {
  kParams,
  kBody1,
  kBody2,

  kCount
};

//! A node constraining two RigidBody nodes.
/*!
 The native joint is created during the first update where both bodies have
 a native body. Once it exists, its bodies cannot be changed: the update
 reports body changes on a live joint as unsupported and discards them.
*/
class Joint {
public:
  Joint() = default;

  Joint(physics::JointParams params, const NodeHandle body1,
    const NodeHandle body2)
    : params_(std::move(params))
    , body1_(body1)
    , body2_(body2)
  {
  }

  [[nodiscard]] auto GetParams() const noexcept -> const physics::JointParams&
  {
    return params_;
  }
  auto SetParams(physics::JointParams params) -> void
  {
    params_ = std::move(params);
    changes_.Insert(JointChange::kParams);
  }

  [[nodiscard]] auto GetBody1() const noexcept { return body1_; }
  auto SetBody1(const NodeHandle body) -> void
  {
    body1_ = body;
    changes_.Insert(JointChange::kBody1);
  }

  [[nodiscard]] auto GetBody2() const noexcept { return body2_; }
  auto SetBody2(const NodeHandle body) -> void
  {
    body2_ = body;
    changes_.Insert(JointChange::kBody2);
  }

  //=== Simulation link ===---------------------------------------------------//

  [[nodiscard]] auto GetNative() const noexcept { return native_; }
  auto SetNative(const physics::JointHandle native) noexcept -> void
  {
    native_ = native;
  }

  [[nodiscard]] auto GetChanges() const noexcept
    -> const ChangeSet<JointChange>&
  {
    return changes_;
  }
  [[nodiscard]] auto GetChanges() noexcept -> ChangeSet<JointChange>&
  {
    return changes_;
  }

  auto ResetNative() noexcept -> void
  {
    native_ = physics::JointHandle::None();
    changes_.Clear();
  }

private:
  physics::JointParams params_ { physics::joint::Ball {} };
  NodeHandle body1_ {};
  NodeHandle body2_ {};

  physics::JointHandle native_ {};
  ChangeSet<JointChange> changes_ {};
};

} // namespace argon::scene
