//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <limits>
#include <span>
#include <vector>

#include <glm/vec3.hpp>

#include <Argon/Base/Macros.h>
#include <Argon/Physics/Types.h>
#include <Argon/Scene/Types.h>
#include <Argon/Scene/api_export.h>

namespace argon::scene {

//! A ray hit, reported against the Collider node that was hit.
struct Intersection {
  NodeHandle collider {};
  glm::vec3 normal { 0.0F }; //!< World space.
  glm::vec3 position { 0.0F }; //!< World space.
  physics::FeatureId feature {};
  float toi { 0.0F }; //!< Distance from the ray origin.
};

struct RayCastOptions {
  glm::vec3 origin { 0.0F };
  //! Normalized before casting. A degenerate direction becomes a zero vector,
  //! which hits nothing.
  glm::vec3 direction { 0.0F };
  float max_len { std::numeric_limits<float>::max() };
  physics::InteractionGroups groups {};
  //! Sort the results by ascending toi.
  bool sort_results { true };
};

//! Sorts intersections by ascending toi. NaN values come after every real
//! value, and equal values keep their relative order.
ARGN_SCN_API auto SortIntersections(std::span<Intersection> intersections)
  -> void;

//! Receives the intersections of a ray cast.
class QueryResultsStorage {
public:
  QueryResultsStorage() = default;
  virtual ~QueryResultsStorage() = default;

  ARGON_DEFAULT_COPYABLE(QueryResultsStorage)
  ARGON_DEFAULT_MOVABLE(QueryResultsStorage)

  //! Returns false when the intersection was rejected, which stops the query.
  virtual auto Push(const Intersection& intersection) -> bool = 0;
  virtual auto Clear() -> void = 0;
  //! Orders the stored intersections with SortIntersections().
  virtual auto Sort() -> void = 0;
};

//! Unbounded storage.
class VectorQueryResults final : public QueryResultsStorage {
public:
  auto Push(const Intersection& intersection) -> bool override
  {
    results_.push_back(intersection);
    return true;
  }

  auto Clear() -> void override { results_.clear(); }

  auto Sort() -> void override { SortIntersections(results_); }

  [[nodiscard]] auto Results() const noexcept -> std::span<const Intersection>
  {
    return results_;
  }

  [[nodiscard]] auto Size() const noexcept { return results_.size(); }

  [[nodiscard]] auto operator[](const size_t index) const -> const Intersection&
  {
    return results_[index];
  }

private:
  std::vector<Intersection> results_ {};
};

//! Storage for at most `N` intersections, without allocation. Intersections
//! past the capacity are rejected.
template <std::size_t N> class FixedQueryResults final : public QueryResultsStorage {
public:
  auto Push(const Intersection& intersection) -> bool override
  {
    if (size_ == N) {
      return false;
    }
    results_[size_++] = intersection;
    return true;
  }

  auto Clear() -> void override { size_ = 0; }

  auto Sort() -> void override
  {
    SortIntersections(std::span(results_.data(), size_));
  }

  [[nodiscard]] auto Results() const noexcept -> std::span<const Intersection>
  {
    return { results_.data(), size_ };
  }

  [[nodiscard]] auto Size() const noexcept { return size_; }

  [[nodiscard]] static constexpr auto Capacity() noexcept { return N; }

  [[nodiscard]] auto operator[](const size_t index) const -> const Intersection&
  {
    return results_[index];
  }

private:
  std::array<Intersection, N> results_ {};
  std::size_t size_ { 0 };
};

} // namespace argon::scene
