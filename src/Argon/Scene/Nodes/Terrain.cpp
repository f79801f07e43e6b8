//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include <Argon/Scene/Nodes/Terrain.h>

using argon::scene::Terrain;

Terrain::Terrain(
  const uint32_t rows, const uint32_t columns, const float cell_size)
  : rows_(rows)
  , columns_(columns)
  , cell_size_(cell_size)
  , heights_(static_cast<size_t>(rows) * columns, 0.0F)
{
}

auto Terrain::SampleIndex(const uint32_t row, const uint32_t column) const
  -> size_t
{
  if (row >= rows_ || column >= columns_) {
    throw std::out_of_range(fmt::format(
      "terrain sample ({}, {}) outside of a {}x{} grid", row, column, rows_,
      columns_));
  }
  return static_cast<size_t>(row) * columns_ + column;
}

auto Terrain::GetHeight(const uint32_t row, const uint32_t column) const
  -> float
{
  return heights_[SampleIndex(row, column)];
}

auto Terrain::SetHeight(
  const uint32_t row, const uint32_t column, const float height) -> void
{
  heights_[SampleIndex(row, column)] = height;
  dirty_ = true;
}

auto Terrain::Update() -> void
{
  if (!dirty_) {
    return;
  }
  dirty_ = false;

  const float half_x
    = 0.5F * cell_size_ * static_cast<float>(columns_ > 0 ? columns_ - 1 : 0);
  const float half_z
    = 0.5F * cell_size_ * static_cast<float>(rows_ > 0 ? rows_ - 1 : 0);
  float min_height = 0.0F;
  float max_height = 0.0F;
  if (!heights_.empty()) {
    const auto [lo, hi] = std::ranges::minmax_element(heights_);
    min_height = *lo;
    max_height = *hi;
  }
  bounding_box_ = physics::Aabb {
    .min = { -half_x, min_height, -half_z },
    .max = { half_x, max_height, half_z },
  };
}

auto Terrain::ToHeightField() const -> physics::shape::HeightField
{
  return physics::shape::HeightField {
    .rows = rows_,
    .columns = columns_,
    .heights = heights_,
    .scale = {
      cell_size_ * static_cast<float>(columns_ > 0 ? columns_ - 1 : 0),
      1.0F,
      cell_size_ * static_cast<float>(rows_ > 0 ? rows_ - 1 : 0),
    },
  };
}
