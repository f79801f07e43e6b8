//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <vector>

#include <Argon/Physics/Shape.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! A height map of `rows` x `columns` samples, `cell_size` apart.
/*!
 Columns run along the local X axis and rows along the local Z axis. The grid
 is centered on the node origin. Heights are stored row-major.
*/
class Terrain {
public:
  Terrain() = default;

  ARGN_SCN_API Terrain(uint32_t rows, uint32_t columns, float cell_size);

  [[nodiscard]] auto GetRows() const noexcept { return rows_; }
  [[nodiscard]] auto GetColumns() const noexcept { return columns_; }
  [[nodiscard]] auto GetCellSize() const noexcept { return cell_size_; }

  [[nodiscard]] auto GetHeights() const noexcept -> const std::vector<float>&
  {
    return heights_;
  }

  //! Throws std::out_of_range for a sample outside of the grid.
  ARGN_SCN_NDAPI auto GetHeight(uint32_t row, uint32_t column) const -> float;

  //! Throws std::out_of_range for a sample outside of the grid.
  ARGN_SCN_API auto SetHeight(uint32_t row, uint32_t column, float height)
    -> void;

  //! Local bounds of the height map, as of the last Update().
  [[nodiscard]] auto GetBoundingBox() const noexcept -> const physics::Aabb&
  {
    return bounding_box_;
  }

  //! Refreshes the bounding box if heights changed since the last update.
  ARGN_SCN_API auto Update() -> void;

  //! The equivalent height field, for collision.
  ARGN_SCN_NDAPI auto ToHeightField() const -> physics::shape::HeightField;

private:
  [[nodiscard]] auto SampleIndex(uint32_t row, uint32_t column) const -> size_t;

  uint32_t rows_ { 0 };
  uint32_t columns_ { 0 };
  float cell_size_ { 1.0F };
  std::vector<float> heights_ {};
  physics::Aabb bounding_box_ {};
  bool dirty_ { true };
};

} // namespace argon::scene
