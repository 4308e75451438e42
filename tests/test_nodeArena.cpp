#include <gtest/gtest.h>
#include <dbvh/containers/nodeArena.hpp>
#include <dbvh/core/errors.hpp>

namespace dbvh {
namespace test {

struct Slot {
  int value = 0;
};

TEST(NodeArenaTest, CapacityIsPowerOfTwo) {
  EXPECT_EQ(NodeArena<Slot>(0).Capacity(), 1u);
  EXPECT_EQ(NodeArena<Slot>(10).Capacity(), 16u);
  EXPECT_EQ(NodeArena<Slot>(64).Capacity(), 64u);
}

TEST(NodeArenaTest, AllocatesSequentiallyThenReusesLifo) {
  NodeArena<Slot> arena(4);
  const int a = arena.Allocate(Slot{ 1 });
  const int b = arena.Allocate(Slot{ 2 });
  const int c = arena.Allocate(Slot{ 3 });
  EXPECT_EQ(a, 0);
  EXPECT_EQ(b, 1);
  EXPECT_EQ(c, 2);
  EXPECT_EQ(arena.PeakIndex(), 3);

  arena.Free(a);
  arena.Free(c);
  EXPECT_EQ(arena.LiveCount(), 1u);

  // Último liberado sai primeiro
  EXPECT_EQ(arena.Allocate(Slot{ 4 }), c);
  EXPECT_EQ(arena.Allocate(Slot{ 5 }), a);
  EXPECT_EQ(arena.PeakIndex(), 3);
  EXPECT_EQ(arena[c].value, 4);
}

TEST(NodeArenaTest, GrowthPreservesContents) {
  NodeArena<Slot> arena(2);
  for (int i = 0; i < 100; ++i)
    ASSERT_EQ(arena.Allocate(Slot{ i * 10 }), i);

  EXPECT_EQ(arena.Capacity(), 128u);
  for (int i = 0; i < 100; ++i)
    EXPECT_EQ(arena[i].value, i * 10);
}

TEST(NodeArenaTest, DoubleFreeThrows) {
  NodeArena<Slot> arena;
  const int index = arena.Allocate(Slot{ 7 });
  arena.Free(index);
  EXPECT_THROW(arena.Free(index), InvariantViolation);
  EXPECT_EQ(arena.LiveCount(), 0u);
}

TEST(NodeArenaTest, AccessToFreeOrOutOfRangeSlotThrows) {
  NodeArena<Slot> arena;
  const int index = arena.Allocate(Slot{});
  arena.Free(index);

  EXPECT_THROW(arena[index], InvariantViolation);
  EXPECT_THROW(arena[-1], InvariantViolation);
  EXPECT_THROW(arena[1000], InvariantViolation);
  EXPECT_FALSE(arena.IsAllocated(index));
}

TEST(NodeArenaTest, ResetKeepsCapacity) {
  NodeArena<Slot> arena(4);
  for (int i = 0; i < 20; ++i)
    arena.Allocate(Slot{ i });
  const size_t capacity = arena.Capacity();

  arena.Reset();
  EXPECT_EQ(arena.Capacity(), capacity);
  EXPECT_EQ(arena.LiveCount(), 0u);
  EXPECT_EQ(arena.PeakIndex(), 0);
  EXPECT_EQ(arena.FreeCount(), capacity);
  EXPECT_EQ(arena.Allocate(Slot{}), 0);
}

TEST(NodeArenaTest, EnsureFreeGrowsOnlyWhenNeeded) {
  NodeArena<Slot> arena(4);
  arena.Allocate(Slot{});
  arena.Allocate(Slot{});
  arena.Allocate(Slot{});

  arena.EnsureFree(1);
  EXPECT_EQ(arena.Capacity(), 4u);

  arena.EnsureFree(2);
  EXPECT_GE(arena.FreeCount(), 2u);
  EXPECT_EQ(arena.Capacity(), 8u);
}

} // namespace test
} // namespace dbvh
