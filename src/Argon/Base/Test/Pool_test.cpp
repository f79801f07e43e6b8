//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Argon/Testing/GTest.h>

#include <Argon/Base/Pool.h>

using argon::BorrowError;
using argon::Pool;

namespace {

struct Item {
  std::string value;

  explicit Item(std::string str)
    : value(std::move(str))
  {
  }
};

using ItemPool = Pool<Item>;
using ItemHandle = ItemPool::HandleType;

//=== Basic operations ===----------------------------------------------------//

NOLINT_TEST(PoolBasicTest, EmptyPool)
{
  const ItemPool pool;
  EXPECT_TRUE(pool.IsEmpty());
  EXPECT_EQ(pool.Size(), 0U);
  EXPECT_EQ(pool.Capacity(), 0U);
}

NOLINT_TEST(PoolBasicTest, SpawnAndAccess)
{
  ItemPool pool;

  const auto a = pool.Spawn(Item("a"));
  const auto b = pool.Emplace("b");

  EXPECT_EQ(pool.Size(), 2U);
  EXPECT_TRUE(pool.Contains(a));
  EXPECT_TRUE(pool.Contains(b));
  EXPECT_EQ(pool.ItemAt(a).value, "a");
  EXPECT_EQ(pool.ItemAt(b).value, "b");
  // generations start at 1
  EXPECT_EQ(a.Generation(), 1U);
}

NOLINT_TEST(PoolBasicTest, FreeReturnsItemAndBumpsGeneration)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");

  const auto item = pool.Free(a);

  EXPECT_EQ(item.value, "a");
  EXPECT_FALSE(pool.Contains(a));
  EXPECT_EQ(pool.TryBorrow(a), nullptr);
  EXPECT_EQ(pool.SlotAt(a.Index()).generation, a.Generation() + 1);
}

NOLINT_TEST(PoolBasicTest, ReusedSlotGetsGreaterGeneration)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  pool.Erase(a);

  const auto b = pool.Emplace("b");

  EXPECT_EQ(b.Index(), a.Index());
  EXPECT_GT(b.Generation(), a.Generation());
  EXPECT_FALSE(pool.Contains(a));
  EXPECT_TRUE(pool.Contains(b));
}

NOLINT_TEST(PoolBasicTest, FreeListReusesOldestSlotFirst)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  const auto b = pool.Emplace("b");
  pool.Emplace("c");
  pool.Erase(b);
  pool.Erase(a);

  const auto d = pool.Emplace("d");
  const auto e = pool.Emplace("e");

  EXPECT_EQ(d.Index(), b.Index());
  EXPECT_EQ(e.Index(), a.Index());
  EXPECT_EQ(pool.Capacity(), 3U);
}

NOLINT_TEST(PoolBasicTest, InvalidHandleThrows)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  pool.Erase(a);

  NOLINT_EXPECT_THROW([[maybe_unused]] auto& i = pool.ItemAt(a),
    std::invalid_argument);
  NOLINT_EXPECT_THROW(pool.Free(a), std::invalid_argument);
  NOLINT_EXPECT_THROW([[maybe_unused]] auto& i = pool.ItemAt(ItemHandle(99, 1)),
    std::out_of_range);
  EXPECT_EQ(pool.Erase(a), 0U);
}

NOLINT_TEST(PoolBasicTest, HandleFromIndex)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  const auto b = pool.Emplace("b");
  pool.Erase(a);

  EXPECT_TRUE(pool.HandleFromIndex(a.Index()).IsNone());
  EXPECT_EQ(pool.HandleFromIndex(b.Index()), b);
  EXPECT_TRUE(pool.HandleFromIndex(1000).IsNone());
}

NOLINT_TEST(PoolBasicTest, ForEachVisitsOccupiedSlotsInIndexOrder)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  const auto b = pool.Emplace("b");
  const auto c = pool.Emplace("c");
  // swap and pop moves "c" to the dense position of "a"
  pool.Erase(a);

  std::vector<ItemHandle> visited;
  std::vector<std::string> values;
  pool.ForEach([&](const ItemHandle handle, const Item& item) {
    visited.push_back(handle);
    values.push_back(item.value);
  });

  EXPECT_EQ(visited, (std::vector { b, c }));
  EXPECT_EQ(values, (std::vector<std::string> { "b", "c" }));
}

NOLINT_TEST(PoolBasicTest, SwapAndPopKeepsHandlesValid)
{
  ItemPool pool;
  std::vector<ItemHandle> handles;
  for (int i = 0; i < 8; ++i) {
    handles.push_back(pool.Emplace(std::to_string(i)));
  }

  for (int i = 0; i < 8; i += 2) {
    pool.Erase(handles[i]);
  }

  for (int i = 1; i < 8; i += 2) {
    ASSERT_TRUE(pool.Contains(handles[i]));
    EXPECT_EQ(pool.ItemAt(handles[i]).value, std::to_string(i));
  }
}

//=== Reservation ===---------------------------------------------------------//

NOLINT_TEST(PoolReservationTest, ReservedSlotIsNotReused)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");

  auto [ticket, item] = pool.TakeReserve(a);
  const auto b = pool.Emplace("b");

  EXPECT_EQ(item.value, "a");
  EXPECT_FALSE(pool.Contains(a));
  EXPECT_NE(b.Index(), a.Index());
  EXPECT_EQ(pool.SlotAt(a.Index()).state, ItemPool::SlotState::kReserved);
  EXPECT_EQ(ticket.GetHandle(), a);

  pool.ForgetTicket(std::move(ticket));
}

NOLINT_TEST(PoolReservationTest, PutBackRestoresSameHandle)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");

  auto [ticket, item] = pool.TakeReserve(a);
  item.value = "modified";
  const auto restored = pool.PutBack(std::move(ticket), std::move(item));

  EXPECT_EQ(restored, a);
  EXPECT_TRUE(pool.Contains(a));
  EXPECT_EQ(pool.ItemAt(a).value, "modified");
  EXPECT_TRUE(ticket.IsEmpty()); // NOLINT(bugprone-use-after-move)
}

NOLINT_TEST(PoolReservationTest, ForgetTicketFreesSlotForGood)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");

  auto [ticket, item] = pool.TakeReserve(a);
  pool.ForgetTicket(std::move(ticket));
  const auto b = pool.Emplace("b");

  EXPECT_FALSE(pool.Contains(a));
  EXPECT_EQ(b.Index(), a.Index());
  EXPECT_GT(b.Generation(), a.Generation());
}

NOLINT_TEST(PoolReservationTest, EmptyTicketIsRejected)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  auto [ticket, item] = pool.TakeReserve(a);
  auto moved = std::move(ticket);

  NOLINT_EXPECT_THROW(pool.PutBack(std::move(ticket), Item("x")),
    std::invalid_argument);
  EXPECT_EQ(pool.PutBack(std::move(moved), std::move(item)), a);
}

NOLINT_TEST(PoolReservationTest, ReservedHandleCannotBeTakenAgain)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  auto [ticket, item] = pool.TakeReserve(a);

  NOLINT_EXPECT_THROW(pool.TakeReserve(a), std::invalid_argument);
  pool.ForgetTicket(std::move(ticket));
}

//=== Generation exhaustion ===-----------------------------------------------//

//! A pool whose only slot holds "last" at the last usable generation.
auto PoolAtLastGeneration() -> ItemPool
{
  std::vector<ItemPool::RestoredSlot> slots;
  slots.push_back(
    { .generation = ItemPool::kRetiredGeneration - 1, .item = Item("last") });
  ItemPool pool;
  pool.Rebuild(std::move(slots));
  return pool;
}

NOLINT_TEST(PoolGenerationTest, NextGenerationSaturatesAtRetired)
{
  EXPECT_EQ(ItemPool::NextGeneration(1), 2U);
  EXPECT_EQ(ItemPool::NextGeneration(ItemPool::kRetiredGeneration - 1),
    ItemPool::kRetiredGeneration);
  EXPECT_EQ(ItemPool::NextGeneration(ItemPool::kRetiredGeneration),
    ItemPool::kRetiredGeneration);
}

NOLINT_TEST(PoolGenerationTest, FreeRetiresExhaustedSlot)
{
  auto pool = PoolAtLastGeneration();
  const auto last = ItemHandle(0, ItemPool::kRetiredGeneration - 1);

  EXPECT_EQ(pool.Free(last).value, "last");
  const auto next = pool.Emplace("next");

  EXPECT_FALSE(pool.Contains(last));
  EXPECT_EQ(next.Index(), 1U);
  EXPECT_EQ(pool.SlotAt(0).generation, ItemPool::kRetiredGeneration);
  EXPECT_EQ(pool.SlotAt(0).state, ItemPool::SlotState::kVacant);
}

NOLINT_TEST(PoolGenerationTest, ForgetTicketRetiresExhaustedSlot)
{
  auto pool = PoolAtLastGeneration();
  const auto last = ItemHandle(0, ItemPool::kRetiredGeneration - 1);

  auto [ticket, item] = pool.TakeReserve(last);
  pool.ForgetTicket(std::move(ticket));
  const auto next = pool.Emplace("next");

  EXPECT_EQ(next.Index(), 1U);
  EXPECT_EQ(pool.SlotAt(0).generation, ItemPool::kRetiredGeneration);
}

//=== Multiple borrows ===----------------------------------------------------//

NOLINT_TEST(PoolBorrowTest, BorrowsDistinctItems)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  const auto b = pool.Emplace("b");
  const auto c = pool.Emplace("c");

  auto result = pool.BorrowMut(a, b, c);

  ASSERT_TRUE(result.has_value());
  auto& [ia, ib, ic] = *result;
  ia.value = "A";
  ib.value = "B";
  EXPECT_EQ(ic.value, "c");
  EXPECT_EQ(pool.ItemAt(a).value, "A");
  EXPECT_EQ(pool.ItemAt(b).value, "B");
}

NOLINT_TEST(PoolBorrowTest, AliasedHandlesAreReported)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  const auto b = pool.Emplace("b");

  EXPECT_EQ(pool.BorrowMut(a, a).error(), BorrowError::kAliasedHandles);
  EXPECT_EQ(pool.BorrowMut(a, b, a).error(), BorrowError::kAliasedHandles);
  EXPECT_EQ(pool.BorrowMut(a, b, ItemHandle::None(), b).error(),
    BorrowError::kAliasedHandles);
}

NOLINT_TEST(PoolBorrowTest, InvalidHandleIsReported)
{
  ItemPool pool;
  const auto a = pool.Emplace("a");
  const auto b = pool.Emplace("b");
  pool.Erase(b);

  EXPECT_EQ(pool.BorrowMut(a, b).error(), BorrowError::kInvalidHandle);
  EXPECT_EQ(pool.BorrowMut(a, ItemHandle::None()).error(),
    BorrowError::kInvalidHandle);
}

//=== Rebuild ===-------------------------------------------------------------//

NOLINT_TEST(PoolRebuildTest, RestoresIndicesAndGenerations)
{
  std::vector<ItemPool::RestoredSlot> slots;
  slots.push_back({ .generation = 3, .item = Item("a") });
  slots.push_back({ .generation = 5, .item = std::nullopt });
  slots.push_back({ .generation = 1, .item = Item("c") });

  ItemPool pool;
  pool.Rebuild(std::move(slots));

  EXPECT_EQ(pool.Size(), 2U);
  EXPECT_EQ(pool.Capacity(), 3U);
  EXPECT_EQ(pool.ItemAt(ItemHandle(0, 3)).value, "a");
  EXPECT_EQ(pool.ItemAt(ItemHandle(2, 1)).value, "c");
  // the vacant slot is the first one reused
  const auto d = pool.Emplace("d");
  EXPECT_EQ(d, ItemHandle(1, 5));
}

NOLINT_TEST(PoolRebuildTest, RetiredSlotStaysVacant)
{
  std::vector<ItemPool::RestoredSlot> slots;
  slots.push_back(
    { .generation = ItemPool::kRetiredGeneration, .item = std::nullopt });

  ItemPool pool;
  pool.Rebuild(std::move(slots));
  const auto a = pool.Emplace("a");

  EXPECT_EQ(a, ItemHandle(1, 1));
  EXPECT_EQ(pool.Capacity(), 2U);
}

NOLINT_TEST(PoolRebuildTest, RejectsOccupiedRetiredSlot)
{
  std::vector<ItemPool::RestoredSlot> slots;
  slots.push_back({ .generation = 1, .item = Item("a") });
  slots.push_back(
    { .generation = ItemPool::kRetiredGeneration, .item = Item("b") });

  ItemPool pool;
  NOLINT_EXPECT_THROW(pool.Rebuild(std::move(slots)), std::invalid_argument);
  EXPECT_EQ(pool.Capacity(), 0U);
}

NOLINT_TEST(PoolRebuildTest, RejectsUsedPool)
{
  ItemPool pool;
  pool.Emplace("a");

  NOLINT_EXPECT_THROW(pool.Rebuild({}), std::logic_error);
}

} // namespace
