//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <utility>

namespace argon::scene {

//! A value that can be inherited from a template and overridden locally.
/*!
 Nodes instantiated from a Model keep loosely in sync with the template they
 came from. Every field that the template may update is held in a
 TemplateVariable, which remembers whether the user ever changed it. Set()
 marks the value as custom; SyncFromTemplate() only updates values that are
 not custom, so hand edits survive template updates.
*/
template <typename T> class TemplateVariable {
public:
  constexpr TemplateVariable() = default;

  constexpr explicit TemplateVariable(T value)
    : value_(std::move(value))
  {
  }

  //! Assigns a user value, which template updates will no longer overwrite.
  auto Set(T value) -> void
  {
    value_ = std::move(value);
    custom_ = true;
  }

  //! Takes the template value, unless the user has overridden this one.
  //! Returns true if the value was taken.
  auto SyncFromTemplate(const T& value) -> bool
  {
    if (custom_) {
      return false;
    }
    value_ = value;
    return true;
  }

  //! Assigns the value without touching the custom flag. Used when restoring
  //! persisted state.
  auto Restore(T value, const bool custom) -> void
  {
    value_ = std::move(value);
    custom_ = custom;
  }

  [[nodiscard]] constexpr auto Get() const noexcept -> const T&
  {
    return value_;
  }

  [[nodiscard]] constexpr auto IsCustom() const noexcept { return custom_; }

  [[nodiscard]] constexpr auto operator*() const noexcept -> const T&
  {
    return value_;
  }

  constexpr auto operator->() const noexcept -> const T* { return &value_; }

private:
  T value_ {};
  bool custom_ { false };
};

} // namespace argon::scene
