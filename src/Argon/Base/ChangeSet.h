//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <bitset>
#include <cstddef>
#include <initializer_list>
#include <type_traits>

namespace argon {

//! Concept for enums usable as change tags: scoped, with a trailing `kCount`.
template <typename E>
concept ChangeKind = std::is_enum_v<E> && requires { E::kCount; };

//! A set of pending change tags of one closed kind.
/*!
 Entities that mirror their state into another system record each field they
 modify as a tag in a ChangeSet, and the synchronization pass drains the set
 one tag at a time with Take(). Tags that were never inserted are left alone by
 the synchronization.

 ```cpp
 enum class BodyChange : uint8_t { kMass, kLinVel, kCount };
 ChangeSet<BodyChange> changes;
 changes.Insert(BodyChange::kMass);
 if (changes.Take(BodyChange::kMass)) { ... } // now clear
 ```
*/
template <ChangeKind E> class ChangeSet {
  static constexpr auto kSize = static_cast<std::size_t>(E::kCount);

public:
  constexpr ChangeSet() noexcept = default;

  ChangeSet(std::initializer_list<E> tags) noexcept
  {
    for (const auto tag : tags) {
      Insert(tag);
    }
  }

  auto Insert(const E tag) noexcept -> ChangeSet&
  {
    bits_.set(Position(tag));
    return *this;
  }

  auto Remove(const E tag) noexcept -> ChangeSet&
  {
    bits_.reset(Position(tag));
    return *this;
  }

  [[nodiscard]] auto Contains(const E tag) const noexcept -> bool
  {
    return bits_.test(Position(tag));
  }

  //! Removes `tag` from the set, and returns whether it was there.
  [[nodiscard]] auto Take(const E tag) noexcept -> bool
  {
    const bool present = Contains(tag);
    Remove(tag);
    return present;
  }

  [[nodiscard]] auto IsEmpty() const noexcept -> bool { return bits_.none(); }

  [[nodiscard]] auto Count() const noexcept -> std::size_t
  {
    return bits_.count();
  }

  auto Clear() noexcept -> void { bits_.reset(); }

  auto operator==(const ChangeSet&) const noexcept -> bool = default;

private:
  static constexpr auto Position(const E tag) noexcept -> std::size_t
  {
    return static_cast<std::size_t>(tag);
  }

  std::bitset<kSize> bits_ {};
};

} // namespace argon
