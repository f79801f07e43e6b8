//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

#include <Argon/Base/Macros.h>
#include <Argon/Physics/Types.h>

namespace argon::physics {

//! Receiver of debug draw commands.
/*!
 The simulation describes its content as primitives; rasterizing them is the
 business of the implementation (typically a line renderer). Primitives given
 with a `transform` are expressed in their local space, the others are in
 world space.
*/
class DrawingContext {
public:
  DrawingContext() = default;
  virtual ~DrawingContext() = default;

  ARGON_DEFAULT_COPYABLE(DrawingContext)
  ARGON_DEFAULT_MOVABLE(DrawingContext)

  //! Draws the three axes of a coordinate frame.
  virtual auto DrawTransform(const glm::mat4& transform) -> void = 0;

  virtual auto DrawTriangle(const glm::vec3& a, const glm::vec3& b,
    const glm::vec3& c, Color color) -> void = 0;

  virtual auto DrawOrientedBox(const glm::vec3& min, const glm::vec3& max,
    const glm::mat4& transform, Color color) -> void = 0;

  virtual auto DrawSphere(const glm::vec3& center, uint32_t slices,
    uint32_t stacks, float radius, Color color) -> void = 0;

  //! Cone along the local Y axis, apex up.
  virtual auto DrawCone(uint32_t sides, float radius, float height,
    const glm::mat4& transform, Color color) -> void = 0;

  //! Cylinder along the local Y axis, centered on the origin.
  virtual auto DrawCylinder(uint32_t sides, float radius, float height,
    bool caps, const glm::mat4& transform, Color color) -> void = 0;

  virtual auto DrawSegmentCapsule(const glm::vec3& begin, const glm::vec3& end,
    float radius, uint32_t v_segments, uint32_t h_segments,
    const glm::mat4& transform, Color color) -> void = 0;
};

} // namespace argon::physics
