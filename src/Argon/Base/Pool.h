//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <Argon/Base/Handle.h>
#include <Argon/Base/Macros.h>

namespace argon {

//! Reasons a simultaneous mutable borrow of several pool items is refused.
enum class BorrowError : uint8_t {
    kInvalidHandle, //!< One of the handles is stale, vacant or reserved.
    kAliasedHandles, //!< The same handle was requested more than once.
};

constexpr auto to_string(const BorrowError value) noexcept -> const char*
{
    switch (value) {
    case BorrowError::kInvalidHandle:
        return "InvalidHandle";
    case BorrowError::kAliasedHandles:
        return "AliasedHandles";
    }
    return "__NotSupported__";
}

template <typename T>
class Pool;

//! Capability proving that its holder owns the reservation of a pool slot.
/*!
 A ticket is obtained from Pool::TakeReserve() and must be given back with
 either Pool::PutBack() (the item returns to the very same slot, with the same
 generation, so every outstanding handle to it becomes valid again) or
 Pool::ForgetTicket() (the slot is released for good, and all handles to it go
 stale). A ticket is move-only; a moved-from ticket is empty.

 Dropping a ticket without returning it leaves its slot reserved forever.
*/
template <typename T>
class Ticket {
public:
    ~Ticket() = default;

    ARGON_MAKE_NON_COPYABLE(Ticket)

    Ticket(Ticket&& other) noexcept
        : handle_(std::exchange(other.handle_, Handle<T>::None()))
    {
    }

    auto operator=(Ticket&& other) noexcept -> Ticket&
    {
        if (this != &other) {
            handle_ = std::exchange(other.handle_, Handle<T>::None());
        }
        return *this;
    }

    //! The handle of the reserved slot.
    [[nodiscard]] auto GetHandle() const noexcept -> Handle<T> { return handle_; }

    [[nodiscard]] auto IsEmpty() const noexcept { return !handle_.IsValid(); }

private:
    friend class Pool<T>;

    explicit Ticket(const Handle<T> handle) noexcept
        : handle_(handle)
    {
    }

    Handle<T> handle_ {};
};

/*
Generation-checked slot pool, giving stable handles to items that can be freed,
reserved and put back without relocating anything visible from the outside.

The pool uses two sets. The sparse set (the slots) is an array with holes,
indexed directly by the handle index. Each slot records its generation and its
state:

  - Vacant: no item; the slot's index field links it in the freelist.
  - Reserved: no item, but the slot cannot be reused. Its item was taken out
    with TakeReserve() and the holder of the matching Ticket decides whether it
    comes back (PutBack) or not (ForgetTicket).
  - Occupied: the slot's index field points to the item in the dense set.

The dense set stores the items themselves, tightly packed for traversals. A
third set, the meta set, links each dense item back to its slot so that
removal can use the "swap and pop" trick in constant time.

The freelist is consumed from its front and extended at its back, so recently
freed slots are reused as late as possible. Every time a slot is freed (or its
ticket forgotten), its generation is incremented, so stale handles never alias
a new occupant. Generations start at 1 and never wrap: a slot whose generation
reaches kRetiredGeneration is retired, it stays vacant and is never handed out
again. Persisted slots follow the same rule when the pool is rebuilt.

Inspired by ID Lookup in the stingray core.
http://bitsquid.blogspot.com/2011/09/managing-decoupling-part-4-id-lookup.html
*/
template <typename T>
class Pool {
    template <typename>
    using RefTo = T&;

public:
    using HandleType = Handle<T>;
    using IndexT = typename HandleType::IndexT;
    using GenerationT = typename HandleType::GenerationT;

    enum class SlotState : uint8_t { kVacant, kReserved, kOccupied };

    //! Generation of a slot that can no longer be reused.
    static constexpr GenerationT kRetiredGeneration
        = std::numeric_limits<GenerationT>::max();

    //! The generation a slot gets when its current occupant goes away.
    [[nodiscard]] static constexpr auto NextGeneration(
        const GenerationT generation) noexcept -> GenerationT
    {
        return generation >= kRetiredGeneration - 1 ? kRetiredGeneration
                                                    : generation + 1;
    }

    struct Slot {
        GenerationT generation { 1 };
        SlotState state { SlotState::kVacant };
        // dense index when occupied, next vacant slot when vacant
        IndexT index { HandleType::kInvalidIndex };
    };

    //! A slot as persisted: its generation, and its item if it was occupied.
    struct RestoredSlot {
        GenerationT generation { 1 };
        std::optional<T> item {};
    };

    explicit Pool(const size_t reserve_count = 0)
    {
        slots_.reserve(reserve_count);
        items_.reserve(reserve_count);
        meta_.reserve(reserve_count);
    }

    ~Pool() = default;

    ARGON_MAKE_NON_COPYABLE(Pool)
    ARGON_DEFAULT_MOVABLE(Pool)

    // -- Element access -------------------------------------------------------

    [[nodiscard]] auto Contains(const HandleType& handle) const noexcept -> bool;

    //! Returns the item for `handle`. Throws std::invalid_argument if the handle
    //! is stale, vacant or reserved, and std::out_of_range if its index was
    //! never allocated.
    [[nodiscard]] auto ItemAt(const HandleType& handle) -> T&
    {
        return items_[GetInnerIndex(handle)];
    }

    [[nodiscard]] auto ItemAt(const HandleType& handle) const -> const T&
    {
        return items_[GetInnerIndex(handle)];
    }

    //! Returns a pointer to the item, or nullptr if the handle does not refer
    //! to an occupied slot. Never throws.
    [[nodiscard]] auto TryBorrow(const HandleType& handle) noexcept -> T*
    {
        return Contains(handle) ? &items_[slots_[handle.Index()].index] : nullptr;
    }

    [[nodiscard]] auto TryBorrow(const HandleType& handle) const noexcept
        -> const T*
    {
        return Contains(handle) ? &items_[slots_[handle.Index()].index] : nullptr;
    }

    //! Borrows several distinct items mutably at the same time.
    /*!
     Every handle must refer to an occupied slot, and no handle may be given
     twice. The check for aliasing comes first, so a request naming the same
     stale handle twice reports kAliasedHandles.
    */
    template <typename... H>
        requires(sizeof...(H) >= 2 && (std::is_same_v<H, HandleType> && ...))
    [[nodiscard]] auto BorrowMut(const H&... handles)
        -> std::expected<std::tuple<RefTo<H>...>, BorrowError>
    {
        const std::array<HandleType, sizeof...(H)> requested { handles... };
        for (size_t i = 0; i < requested.size(); ++i) {
            for (size_t j = i + 1; j < requested.size(); ++j) {
                if (requested[i] == requested[j]) {
                    return std::unexpected(BorrowError::kAliasedHandles);
                }
            }
        }
        for (const auto& handle : requested) {
            if (!Contains(handle)) {
                return std::unexpected(BorrowError::kInvalidHandle);
            }
        }
        return std::tuple<RefTo<H>...>(items_[slots_[handles.Index()].index]...);
    }

    /*
    Direct access to the dense set for iterating over the items with no
    modification of the pool. The order is unrelated to handle indices.
    */
    [[nodiscard]] auto Items() const noexcept -> std::span<const T>
    {
        return items_;
    }

    // -- Capacity -------------------------------------------------------------

    //! Number of occupied slots.
    [[nodiscard]] auto Size() const noexcept
    {
        return static_cast<uint32_t>(items_.size());
    }

    [[nodiscard]] auto IsEmpty() const noexcept { return items_.empty(); }

    //! Number of slots ever allocated, whatever their state. Valid indices for
    //! HandleFromIndex() are `[0, Capacity())`.
    [[nodiscard]] auto Capacity() const noexcept
    {
        return static_cast<uint32_t>(slots_.size());
    }

    //! Makes a handle for the slot at `index`, or None if the index is out of
    //! range or the slot is not occupied.
    [[nodiscard]] auto HandleFromIndex(const IndexT index) const noexcept
        -> HandleType
    {
        if (index >= slots_.size()
            || slots_[index].state != SlotState::kOccupied) {
            return HandleType::None();
        }
        return HandleType { index, slots_[index].generation };
    }

    [[nodiscard]] auto SlotAt(const IndexT index) const -> const Slot&
    {
        if (index >= slots_.size()) {
            throw std::out_of_range("slot index out of range");
        }
        return slots_[index];
    }

    // -- Iteration ------------------------------------------------------------

    //! Calls `fn(handle, item)` for every occupied slot, in index order. The
    //! callback must not spawn or free items.
    template <typename Fn>
    auto ForEach(Fn&& fn) -> void
    {
        for (IndexT i = 0; i < Capacity(); ++i) {
            if (const auto& slot = slots_[i]; slot.state == SlotState::kOccupied) {
                fn(HandleType { i, slot.generation }, items_[slot.index]);
            }
        }
    }

    template <typename Fn>
    auto ForEach(Fn&& fn) const -> void
    {
        for (IndexT i = 0; i < Capacity(); ++i) {
            if (const auto& slot = slots_[i]; slot.state == SlotState::kOccupied) {
                fn(HandleType { i, slot.generation },
                    static_cast<const T&>(items_[slot.index]));
            }
        }
    }

    // -- Modifiers ------------------------------------------------------------

    template <typename URef = T>
        requires std::is_same_v<std::remove_cvref_t<URef>, T>
    auto Spawn(URef&& item) -> HandleType;

    /**
     * Constructs the item in place at the position chosen by the pool.
     */
    template <typename... Params>
    auto Emplace(Params&&... args) -> HandleType
    {
        return Spawn(T { std::forward<Params>(args)... });
    }

    //! Removes the item and returns it. Throws like ItemAt() if the handle is
    //! not valid: freeing an invalid handle is a programming error.
    auto Free(const HandleType& handle) -> T;

    //! Returns 1 if the item was found and erased; 0 otherwise.
    auto Erase(const HandleType& handle) -> size_t
    {
        if (!Contains(handle)) {
            return 0;
        }
        [[maybe_unused]] auto item = Free(handle);
        return 1;
    }

    //! Moves the item out, keeping its slot reserved. Throws like ItemAt() if
    //! the handle is not valid.
    auto TakeReserve(const HandleType& handle) -> std::pair<Ticket<T>, T>;

    //! Puts an item back in the slot reserved by `ticket`, restoring the exact
    //! handle it had. Throws std::invalid_argument if the ticket does not match
    //! a reserved slot.
    auto PutBack(Ticket<T>&& ticket, T item) -> HandleType;

    //! Releases the slot reserved by `ticket`. Handles to it go stale.
    auto ForgetTicket(Ticket<T>&& ticket) -> void;

    /*
    Rebuilds the pool from persisted slots, reproducing their exact indices and
    generations. Vacant slots at kRetiredGeneration stay retired. Only valid on
    a pool that never allocated a slot; throws std::logic_error otherwise, and
    std::invalid_argument if an occupied slot carries kRetiredGeneration.
    */
    auto Rebuild(std::vector<RestoredSlot> slots) -> void;

private:
    [[nodiscard]] auto GetInnerIndex(const HandleType& handle) const -> IndexT;

    [[nodiscard]] auto IsFreeListEmpty() const noexcept
    {
        // Having the front at the invalid index means the freelist is empty.
        return freelist_front_ == HandleType::kInvalidIndex;
    }

    [[nodiscard]] auto CheckTicket(const Ticket<T>& ticket) const -> IndexT;

    auto RemoveDense(IndexT inner_index) -> T;
    auto PushDense(IndexT outer_index, T&& item) -> IndexT;
    auto Vacate(IndexT outer_index) noexcept -> void;
    auto PushFreeList(IndexT outer_index) noexcept -> void;

    // Index of the first slot in the freelist
    IndexT freelist_front_ { HandleType::kInvalidIndex };
    // Index of the last slot in the freelist
    IndexT freelist_back_ { HandleType::kInvalidIndex };

    std::vector<Slot> slots_;
    std::vector<T> items_;
    // Reverse index from the dense set to the slots.
    std::vector<IndexT> meta_;
};

// -----------------------------------------------------------------------------

template <typename T>
auto Pool<T>::Contains(const HandleType& handle) const noexcept -> bool
{
    // quick bailout before starting the lookup
    if (handle.Index() >= slots_.size()) {
        return false;
    }
    const auto& slot = slots_[handle.Index()];
    return slot.state == SlotState::kOccupied
        && slot.generation == handle.Generation();
}

template <typename T>
auto Pool<T>::GetInnerIndex(const HandleType& handle) const -> IndexT
{
    const auto outer_index = handle.Index();
    if (outer_index >= slots_.size()) {
        throw std::out_of_range("handle index out of range");
    }
    const auto& slot = slots_[outer_index];
    if (slot.state != SlotState::kOccupied
        || slot.generation != handle.Generation()) {
        throw std::invalid_argument("stale, vacant or reserved handle");
    }
    return slot.index;
}

template <typename T>
template <typename URef>
    requires std::is_same_v<std::remove_cvref_t<URef>, T>
auto Pool<T>::Spawn(URef&& item) -> HandleType
{
    IndexT outer_index;
    if (IsFreeListEmpty()) {
        outer_index = static_cast<IndexT>(slots_.size());
        if (outer_index == HandleType::kInvalidIndex) {
            throw std::length_error("pool is full");
        }
        slots_.push_back(Slot {});
    } else {
        outer_index = freelist_front_;
        // the index of a vacant slot refers to the next vacant slot
        freelist_front_ = slots_[outer_index].index;
        if (IsFreeListEmpty()) {
            freelist_back_ = HandleType::kInvalidIndex;
        }
    }

    T value(std::forward<URef>(item));
    auto& slot = slots_[outer_index];
    slot.index = PushDense(outer_index, std::move(value));
    slot.state = SlotState::kOccupied;
    return HandleType { outer_index, slot.generation };
}

template <typename T>
auto Pool<T>::Free(const HandleType& handle) -> T
{
    auto item = RemoveDense(GetInnerIndex(handle));

    // increment generation so remaining outer handles go stale
    Vacate(handle.Index());
    return item;
}

template <typename T>
auto Pool<T>::TakeReserve(const HandleType& handle) -> std::pair<Ticket<T>, T>
{
    auto item = RemoveDense(GetInnerIndex(handle));

    auto& slot = slots_[handle.Index()];
    slot.state = SlotState::kReserved;
    slot.index = HandleType::kInvalidIndex;

    return { Ticket<T>(handle), std::move(item) };
}

template <typename T>
auto Pool<T>::CheckTicket(const Ticket<T>& ticket) const -> IndexT
{
    const auto handle = ticket.GetHandle();
    if (!handle.IsValid() || handle.Index() >= slots_.size()) {
        throw std::invalid_argument("empty or foreign ticket");
    }
    const auto& slot = slots_[handle.Index()];
    if (slot.state != SlotState::kReserved
        || slot.generation != handle.Generation()) {
        throw std::invalid_argument("ticket does not match a reserved slot");
    }
    return handle.Index();
}

template <typename T>
auto Pool<T>::PutBack(Ticket<T>&& ticket, T item) -> HandleType
{
    const auto outer_index = CheckTicket(ticket);
    auto& slot = slots_[outer_index];
    slot.index = PushDense(outer_index, std::move(item));
    slot.state = SlotState::kOccupied;

    const auto handle = ticket.GetHandle();
    ticket.handle_.Invalidate();
    return handle;
}

template <typename T>
auto Pool<T>::ForgetTicket(Ticket<T>&& ticket) -> void
{
    Vacate(CheckTicket(ticket));
    ticket.handle_.Invalidate();
}

template <typename T>
auto Pool<T>::Rebuild(std::vector<RestoredSlot> slots) -> void
{
    if (!slots_.empty()) {
        throw std::logic_error("pool must be empty to be rebuilt");
    }
    for (const auto& restored : slots) {
        if (restored.item.has_value()
            && restored.generation == kRetiredGeneration) {
            throw std::invalid_argument("occupied slot with a retired generation");
        }
    }

    slots_.reserve(slots.size());
    for (IndexT i = 0; i < slots.size(); ++i) {
        auto& restored = slots[i];
        slots_.push_back(Slot { .generation = restored.generation });
        if (restored.item.has_value()) {
            slots_[i].index = PushDense(i, std::move(*restored.item));
            slots_[i].state = SlotState::kOccupied;
        } else if (restored.generation != kRetiredGeneration) {
            PushFreeList(i);
        }
    }
}

template <typename T>
auto Pool<T>::Vacate(const IndexT outer_index) noexcept -> void
{
    auto& slot = slots_[outer_index];
    slot.state = SlotState::kVacant;
    slot.index = HandleType::kInvalidIndex;
    slot.generation = NextGeneration(slot.generation);
    if (slot.generation != kRetiredGeneration) {
        PushFreeList(outer_index);
    }
}

template <typename T>
auto Pool<T>::PushDense(const IndexT outer_index, T&& item) -> IndexT
{
    const auto inner_index = static_cast<IndexT>(items_.size());
    items_.push_back(std::move(item));
    meta_.push_back(outer_index);
    return inner_index;
}

template <typename T>
auto Pool<T>::RemoveDense(const IndexT inner_index) -> T
{
    T item = std::move(items_[inner_index]);

    // fill the hole with the last item, then pop_back
    if (inner_index != items_.size() - 1) {
        items_[inner_index] = std::move(items_.back());
        meta_[inner_index] = meta_.back();
        // fix the dense index of the moved item
        slots_[meta_[inner_index]].index = inner_index;
    }

    items_.pop_back();
    meta_.pop_back();

    return item;
}

template <typename T>
auto Pool<T>::PushFreeList(const IndexT outer_index) noexcept -> void
{
    // max value represents the end of the freelist
    slots_[outer_index].index = HandleType::kInvalidIndex;

    if (IsFreeListEmpty()) {
        // if the freelist was empty, it now starts (and ends) at this index
        freelist_front_ = outer_index;
        freelist_back_ = outer_index;
    } else {
        // previous back of the freelist points to new back
        slots_[freelist_back_].index = outer_index;
        freelist_back_ = outer_index;
    }
}

} // namespace argon
