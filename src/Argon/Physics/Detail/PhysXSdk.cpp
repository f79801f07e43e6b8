//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <mutex>
#include <stdexcept>

#include <PxPhysicsAPI.h>

#include <loguru.hpp>

#include <Argon/Physics/Detail/PhysXSdk.h>

using argon::physics::detail::PhysXSdk;

namespace {

//! Routes the PhysX diagnostics to the log.
class LogErrorCallback final : public physx::PxErrorCallback {
public:
  auto reportError(physx::PxErrorCode::Enum code, const char* message,
    const char* file, int line) -> void override
  {
    switch (code) {
    case physx::PxErrorCode::eNO_ERROR:
      return;
    case physx::PxErrorCode::eDEBUG_INFO:
      DLOG_F(1, "PhysX: {} ({}:{})", message, file, line);
      return;
    case physx::PxErrorCode::eDEBUG_WARNING:
    case physx::PxErrorCode::ePERF_WARNING:
      LOG_F(WARNING, "PhysX: {} ({}:{})", message, file, line);
      return;
    case physx::PxErrorCode::eABORT:
      ABORT_F("PhysX: {} ({}:{})", message, file, line);
    default:
      LOG_F(ERROR, "PhysX: {} ({}:{})", message, file, line);
      return;
    }
  }
};

physx::PxDefaultAllocator g_allocator;
LogErrorCallback g_error_callback;

std::mutex g_sdk_mutex;
std::weak_ptr<PhysXSdk> g_sdk;

} // namespace

auto PhysXSdk::Acquire() -> std::shared_ptr<PhysXSdk>
{
  std::scoped_lock lock(g_sdk_mutex);
  auto sdk = g_sdk.lock();
  if (!sdk) {
    sdk = std::shared_ptr<PhysXSdk>(new PhysXSdk());
    g_sdk = sdk;
  }
  return sdk;
}

PhysXSdk::PhysXSdk()
{
  foundation_
    = PxCreateFoundation(PX_PHYSICS_VERSION, g_allocator, g_error_callback);
  if (foundation_ == nullptr) {
    throw std::runtime_error("PxCreateFoundation failed");
  }

  physics_ = PxCreatePhysics(
    PX_PHYSICS_VERSION, *foundation_, physx::PxTolerancesScale(), false);
  if (physics_ == nullptr) {
    foundation_->release();
    throw std::runtime_error("PxCreatePhysics failed");
  }

  // joints live in the extensions library
  if (!PxInitExtensions(*physics_, nullptr)) {
    physics_->release();
    foundation_->release();
    throw std::runtime_error("PxInitExtensions failed");
  }

  dispatcher_ = physx::PxDefaultCpuDispatcherCreate(0);
  if (dispatcher_ == nullptr) {
    PxCloseExtensions();
    physics_->release();
    foundation_->release();
    throw std::runtime_error("PxDefaultCpuDispatcherCreate failed");
  }

  LOG_F(INFO, "PhysX {}.{}.{} initialized", PX_PHYSICS_VERSION_MAJOR,
    PX_PHYSICS_VERSION_MINOR, PX_PHYSICS_VERSION_BUGFIX);
}

PhysXSdk::~PhysXSdk()
{
  dispatcher_->release();
  PxCloseExtensions();
  physics_->release();
  foundation_->release();
  DLOG_F(1, "PhysX released");
}
