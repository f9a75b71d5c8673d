#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "enumkit/registry/registry_error.hpp"
#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/type_record.hpp"
#include "enumkit/registry/type_registry.hpp"

namespace enumkit::registry {
namespace {

class TypeRegistryTest : public ::testing::Test {
 protected:
  static auto Scalar(std::string name, std::vector<uint64_t> values)
      -> TypeDescriptor {
    return TypeDescriptor{
        .name = std::move(name),
        .size = 4,
        .raw_values = std::move(values),
    };
  }

  static auto Names(const TypeRegistry& registry) -> std::vector<std::string> {
    std::vector<std::string> names;
    registry.ForEachRecord(
        [&](const TypeRecord& record) { names.emplace_back(record.Name()); });
    return names;
  }

  TypeRegistry registry_;
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(TypeRegistryTest, StartsEmpty) {
  EXPECT_FALSE(registry_.IsInitialized());
  EXPECT_EQ(registry_.Size(), 1U);
  EXPECT_TRUE(Names(registry_).empty());
  EXPECT_EQ(registry_.AllocatedSlots(), 0U);
}

TEST_F(TypeRegistryTest, FirstRecordGetsIndexOne) {
  auto index = registry_.GetOrCreateRecord(Scalar("Color", {0, 1, 2}));
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(index->value, 1U);
  EXPECT_TRUE(registry_.IsInitialized());
  EXPECT_EQ(registry_.Size(), 2U);

  const TypeRecord& record = registry_.GetRecord(*index);
  EXPECT_EQ(record.Name(), "Color");
  EXPECT_EQ(record.Length(), 3);
}

TEST_F(TypeRegistryTest, RegistrationIsIdempotent) {
  auto first = registry_.GetOrCreateRecord(Scalar("Color", {0, 1, 2}));
  auto second = registry_.GetOrCreateRecord(Scalar("Color", {0, 1, 2}));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(registry_.Size(), 2U);
}

TEST_F(TypeRegistryTest, DistinctTypesGetDistinctIndices) {
  auto a = registry_.GetOrCreateRecord(Scalar("A", {1}));
  auto b = registry_.GetOrCreateRecord(Scalar("B", {1}));
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_NE(*a, *b);
  EXPECT_EQ(Names(registry_), (std::vector<std::string>{"A", "B"}));
}

TEST_F(TypeRegistryTest, ExplicitIdentityOverridesName) {
  TypeDescriptor desc = Scalar("Named", {1});
  desc.identity = 77;
  auto index = registry_.GetOrCreateRecord(desc);
  ASSERT_TRUE(index.has_value());
  EXPECT_EQ(registry_.LookupIndex(77), *index);
  EXPECT_FALSE(registry_.LookupIndex(HashTypeName("Named")).IsValid());
}

TEST_F(TypeRegistryTest, InvalidDescriptorPublishesNothing) {
  auto index = registry_.GetOrCreateRecord(Scalar("Empty", {}));
  ASSERT_FALSE(index.has_value());
  EXPECT_EQ(index.error().kind, RegistryErrorKind::kInvalidTypeDescriptor);
  EXPECT_EQ(registry_.Size(), 1U);
  EXPECT_FALSE(registry_.LookupIndex(HashTypeName("Empty")).IsValid());
}

TEST_F(TypeRegistryTest, KeepsGrowingPastManyTypes) {
  constexpr int kTypes = 1100;
  for (int i = 0; i < kTypes; ++i) {
    auto index =
        registry_.GetOrCreateRecord(Scalar(fmt::format("E{}", i), {0, 1, 2}));
    ASSERT_TRUE(index.has_value()) << "E" << i << ": " << index.error().detail;
    EXPECT_EQ(index->value, static_cast<uint32_t>(i + 1));
  }
  EXPECT_EQ(registry_.Size(), static_cast<uint32_t>(kTypes + 1));

  // Spot check records on both sides of segment boundaries.
  for (int i : {0, 62, 63, 64, 190, 191, 1023, 1099}) {
    std::string name = fmt::format("E{}", i);
    TypeIndex index = registry_.LookupIndex(HashTypeName(name));
    EXPECT_EQ(index.value, static_cast<uint32_t>(i + 1));
    EXPECT_EQ(registry_.GetRecord(index).Name(), name);
    EXPECT_EQ(registry_.GetRecord(index).Length(), 3);
  }
}

TEST_F(TypeRegistryTest, SegmentsDoubleInSize) {
  TypeRegistry small(RegistryOptions{.segment_records = 2});
  EXPECT_EQ(small.AllocatedSlots(), 0U);

  // Slots 0-1, 2-5, 6-13: the sentinel position occupies slot 0.
  ASSERT_TRUE(small.GetOrCreateRecord(Scalar("A", {1})).has_value());
  EXPECT_EQ(small.AllocatedSlots(), 2U);
  ASSERT_TRUE(small.GetOrCreateRecord(Scalar("B", {1})).has_value());
  EXPECT_EQ(small.AllocatedSlots(), 6U);
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(
        small.GetOrCreateRecord(Scalar(fmt::format("C{}", i), {1}))
            .has_value());
  }
  EXPECT_EQ(small.AllocatedSlots(), 14U);
  EXPECT_EQ(Names(small).size(), 6U);
  EXPECT_EQ(small.GetRecord(TypeIndex{2}).Name(), "B");
  EXPECT_EQ(small.GetRecord(TypeIndex{6}).Name(), "C3");
}

TEST_F(TypeRegistryTest, ZeroSegmentSizeStillRegisters) {
  TypeRegistry tiny(RegistryOptions{.segment_records = 0});
  EXPECT_TRUE(tiny.GetOrCreateRecord(Scalar("Only", {1})).has_value());
  EXPECT_TRUE(tiny.GetOrCreateRecord(Scalar("Next", {1})).has_value());
  EXPECT_EQ(tiny.GetRecord(TypeIndex{2}).Name(), "Next");
}

// =============================================================================
// Sentinel
// =============================================================================

TEST_F(TypeRegistryTest, UnknownLookupsYieldSentinel) {
  EXPECT_EQ(registry_.LookupIndex(HashTypeName("Missing")),
            TypeIndex::Sentinel());
  EXPECT_TRUE(registry_.GetRecord(TypeIndex::Sentinel()).IsSentinel());
  EXPECT_TRUE(registry_.GetRecord(TypeIndex{500}).IsSentinel());
  EXPECT_EQ(registry_.GetRecord(TypeIndex{0}).Data()[0], 0);
}

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(TypeRegistryTest, TeardownOnFreshRegistryIsNoOp) {
  uint64_t generation = registry_.Generation();
  registry_.Teardown();
  EXPECT_EQ(registry_.Generation(), generation);
  EXPECT_FALSE(registry_.IsInitialized());
}

TEST_F(TypeRegistryTest, TeardownForgetsRecordsAndAllowsReuse) {
  auto before = registry_.GetOrCreateRecord(Scalar("Color", {0, 1}));
  ASSERT_TRUE(before.has_value());
  uint64_t generation = registry_.Generation();

  registry_.Teardown();
  EXPECT_FALSE(registry_.IsInitialized());
  EXPECT_EQ(registry_.Size(), 1U);
  EXPECT_NE(registry_.Generation(), generation);
  EXPECT_FALSE(registry_.LookupIndex(HashTypeName("Color")).IsValid());
  EXPECT_TRUE(registry_.GetRecord(*before).IsSentinel());
  EXPECT_EQ(registry_.AllocatedSlots(), 0U);

  auto after = registry_.GetOrCreateRecord(Scalar("Other", {5}));
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->value, 1U);
  EXPECT_EQ(registry_.GetRecord(*after).Min(), 5);
}

TEST_F(TypeRegistryTest, GlobalIsASingleInstance) {
  EXPECT_EQ(&TypeRegistry::Global(), &TypeRegistry::Global());
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(TypeRegistryTest, ConcurrentRegistrationOfSameTypePublishesOnce) {
  constexpr int kThreads = 8;
  std::vector<std::thread> threads;
  std::vector<uint32_t> indices(kThreads, 0);
  std::atomic<bool> go{false};

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      while (!go.load(std::memory_order_acquire)) {
        std::this_thread::yield();
      }
      auto index = registry_.GetOrCreateRecord(Scalar("Raced", {1, 2, 3}));
      indices[t] = index ? index->value : 0;
    });
  }
  go.store(true, std::memory_order_release);
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(registry_.Size(), 2U);
  for (uint32_t index : indices) {
    EXPECT_EQ(index, 1U);
  }
}

TEST_F(TypeRegistryTest, ReadersSeeOnlyCompleteRecords) {
  constexpr int kTypes = 200;
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread reader([&] {
    while (!done.load(std::memory_order_acquire)) {
      registry_.ForEachRecord([&](const TypeRecord& record) {
        if (record.IsSentinel() || record.Length() != 2 ||
            record.Max() - record.Min() != 1) {
          torn.fetch_add(1);
        }
      });
    }
  });

  for (int i = 0; i < kTypes; ++i) {
    auto base = static_cast<uint64_t>(i * 10);
    auto index = registry_.GetOrCreateRecord(
        Scalar(fmt::format("Type{}", i), {base, base + 1}));
    EXPECT_TRUE(index.has_value());
  }
  done.store(true, std::memory_order_release);
  reader.join();

  EXPECT_EQ(torn.load(), 0);
  EXPECT_EQ(Names(registry_).size(), static_cast<size_t>(kTypes));
}

}  // namespace
}  // namespace enumkit::registry
