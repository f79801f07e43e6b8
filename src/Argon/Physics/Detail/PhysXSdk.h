//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <memory>

#include <Argon/Base/Macros.h>

namespace physx {
class PxFoundation;
class PxPhysics;
class PxDefaultCpuDispatcher;
} // namespace physx

namespace argon::physics::detail {

//! The PhysX foundation, physics and CPU dispatcher shared by every world.
/*!
 PhysX accepts a single foundation per process. Each PhysicsWorld holds a
 reference on the shared instance, which is created on first use and released
 with the last world.

 The dispatcher has no worker thread: simulation tasks run on the thread that
 steps the world.
*/
class PhysXSdk {
public:
  //! Returns the shared instance, creating it if needed. Throws
  //! std::runtime_error if PhysX cannot be initialized.
  static auto Acquire() -> std::shared_ptr<PhysXSdk>;

  ~PhysXSdk();

  ARGON_MAKE_NON_COPYABLE(PhysXSdk)
  ARGON_MAKE_NON_MOVEABLE(PhysXSdk)

  [[nodiscard]] auto Physics() const noexcept -> physx::PxPhysics&
  {
    return *physics_;
  }

  [[nodiscard]] auto Dispatcher() const noexcept
    -> physx::PxDefaultCpuDispatcher&
  {
    return *dispatcher_;
  }

private:
  PhysXSdk();

  physx::PxFoundation* foundation_ { nullptr };
  physx::PxPhysics* physics_ { nullptr };
  physx::PxDefaultCpuDispatcher* dispatcher_ { nullptr };
};

} // namespace argon::physics::detail
