#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <vector>

#include "enumkit/common/internal_error.hpp"
#include "enumkit/registry/value_arena.hpp"

namespace enumkit::registry {
namespace {

class ValueArenaTest : public ::testing::Test {};

TEST_F(ValueArenaTest, AllocateCopiesValues) {
  ValueArena arena(16);
  std::vector<int64_t> values = {-5, 0, 10};
  ValueHandle handle = arena.Allocate(values);
  ASSERT_TRUE(handle.IsValid());
  EXPECT_EQ(handle.length, 3U);

  values[0] = 99;
  auto view = arena.View(handle);
  ASSERT_EQ(view.size(), 3U);
  EXPECT_EQ(view[0], -5);
  EXPECT_EQ(view[1], 0);
  EXPECT_EQ(view[2], 10);
}

TEST_F(ValueArenaTest, SmallTablesShareABlock) {
  ValueArena arena(8);
  std::vector<int64_t> three = {1, 2, 3};
  ValueHandle a = arena.Allocate(three);
  ValueHandle b = arena.Allocate(three);
  EXPECT_EQ(arena.BlockCount(), 1U);
  EXPECT_EQ(a.block, b.block);
  EXPECT_EQ(b.offset, 3U);
  EXPECT_EQ(arena.UsedWords(), 6U);

  // Does not fit the remaining two words.
  ValueHandle c = arena.Allocate(three);
  EXPECT_EQ(arena.BlockCount(), 2U);
  EXPECT_NE(c.block, a.block);
}

TEST_F(ValueArenaTest, OversizedTableGetsOwnBlock) {
  ValueArena arena(4);
  std::vector<int64_t> small = {1};
  std::vector<int64_t> large(10, 7);
  ValueHandle a = arena.Allocate(small);
  ValueHandle big = arena.Allocate(large);
  ValueHandle b = arena.Allocate(small);
  EXPECT_EQ(arena.View(big).size(), 10U);
  // The open block keeps receiving small tables.
  EXPECT_EQ(a.block, b.block);
  EXPECT_NE(big.block, a.block);
}

TEST_F(ValueArenaTest, ViewsStayValidAcrossGrowth) {
  ValueArena arena(2);
  std::vector<int64_t> first = {41, 42};
  std::span<const int64_t> view = arena.View(arena.Allocate(first));
  const int64_t* data = view.data();
  for (int i = 0; i < 100; ++i) {
    std::vector<int64_t> more = {i, i + 1};
    arena.Allocate(more);
  }
  EXPECT_EQ(data[0], 41);
  EXPECT_EQ(data[1], 42);
}

TEST_F(ValueArenaTest, EmptyTableIsRejected) {
  ValueArena arena;
  std::vector<int64_t> empty;
  EXPECT_THROW(arena.Allocate(empty), common::InternalError);
}

TEST_F(ValueArenaTest, ForeignHandleIsRejected) {
  ValueArena arena;
  EXPECT_THROW(arena.View(ValueHandle::Invalid()), common::InternalError);
  EXPECT_THROW(
      arena.View(ValueHandle{.block = 3, .offset = 0, .length = 1}),
      common::InternalError);

  std::vector<int64_t> values = {1, 2};
  ValueHandle handle = arena.Allocate(values);
  handle.length = 50;
  EXPECT_THROW(arena.View(handle), common::InternalError);
}

TEST_F(ValueArenaTest, ReleaseInvalidatesHandles) {
  ValueArena arena;
  std::vector<int64_t> values = {1};
  ValueHandle handle = arena.Allocate(values);
  arena.Release();
  EXPECT_EQ(arena.BlockCount(), 0U);
  EXPECT_EQ(arena.UsedWords(), 0U);
  EXPECT_THROW(arena.View(handle), common::InternalError);

  ValueHandle fresh = arena.Allocate(values);
  EXPECT_EQ(arena.View(fresh)[0], 1);
}

}  // namespace
}  // namespace enumkit::registry
