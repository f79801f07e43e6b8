//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace argon {

/*
A typed, generation-checked reference to a slot in a Pool<T>.

The handle is used as an alternative to pointers to achieve several things:

1. Items live in a contiguous block of memory owned by the pool, and can be
   moved around by the pool without invalidating the handles held outside.
2. A stale handle (one whose slot was freed and possibly reused since) is
   reliably detected, because every time a slot is freed its generation is
   incremented, and lookups require the generations to match.

The handle is a 64-bit value, so there is no additional overhead compared to a
pointer on 64-bit platforms. The value is laid out so that sorting orders by
generation first, then by index.

```
               32                                 32
    <---------- generation ----------> <------------ index ------------->
    ........ ........ ........ ........ ........ ........ ........ ........
```

Generations handed out by a pool start at 1. The sentinel `Handle<T>::None()`
has the invalid index and generation 0, so it never matches a live slot.

The type parameter is only a tag: `Handle<Node>` and `Handle<Body>` cannot be
mixed up, but share the same representation.
*/
template <typename T> class Handle {
public:
  using HandleT = uint64_t;
  using IndexT = uint32_t;
  using GenerationT = uint32_t;

private:
  static constexpr uint8_t kIndexBits { 32 };
  static constexpr HandleT kIndexMask = (HandleT { 1 } << kIndexBits) - 1;

public:
  static constexpr IndexT kInvalidIndex = static_cast<IndexT>(kIndexMask);
  static constexpr GenerationT kNoGeneration = 0;

  constexpr Handle() noexcept = default;

  constexpr Handle(const IndexT index, const GenerationT generation) noexcept
    : handle_(static_cast<HandleT>(generation) << kIndexBits | index)
  {
  }

  ~Handle() = default;

  constexpr Handle(const Handle&) noexcept = default;
  constexpr auto operator=(const Handle&) noexcept -> Handle& = default;
  constexpr Handle(Handle&&) noexcept = default;
  constexpr auto operator=(Handle&&) noexcept -> Handle& = default;

  //! The sentinel handle, always invalid.
  [[nodiscard]] static constexpr auto None() noexcept -> Handle { return {}; }

  constexpr auto operator==(const Handle& rhs) const noexcept -> bool
  {
    return handle_ == rhs.handle_;
  }

  constexpr auto operator<(const Handle& rhs) const noexcept -> bool
  {
    return handle_ < rhs.handle_;
  }

  [[nodiscard]] constexpr auto Value() const noexcept -> HandleT
  {
    return handle_;
  }

  //! True when the handle is not the sentinel. Says nothing about whether the
  //! slot it refers to is still alive; only the pool can tell that.
  [[nodiscard]] constexpr auto IsValid() const noexcept -> bool
  {
    return Index() != kInvalidIndex;
  }

  [[nodiscard]] constexpr auto IsNone() const noexcept -> bool
  {
    return !IsValid();
  }

  constexpr auto Invalidate() noexcept -> void { handle_ = kNoneValue; }

  [[nodiscard]] constexpr auto Index() const noexcept -> IndexT
  {
    return static_cast<IndexT>(handle_ & kIndexMask);
  }

  [[nodiscard]] constexpr auto Generation() const noexcept -> GenerationT
  {
    return static_cast<GenerationT>(handle_ >> kIndexBits);
  }

private:
  static constexpr HandleT kNoneValue = kIndexMask;

  HandleT handle_ { kNoneValue };
};

template <typename T>
auto to_string(const Handle<T>& value) -> std::string
{
  if (!value.IsValid()) {
    return "H(None)";
  }
  return std::string("H(i:") + std::to_string(value.Index())
    + ", g:" + std::to_string(value.Generation()) + ")";
}

} // namespace argon

template <typename T> struct std::hash<argon::Handle<T>> {
  auto operator()(const argon::Handle<T>& handle) const noexcept -> size_t
  {
    return std::hash<typename argon::Handle<T>::HandleT> {}(handle.Value());
  }
};
