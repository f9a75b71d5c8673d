#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>

#include "absl/container/flat_hash_map.h"
#include "enumkit/registry/registry_error.hpp"
#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/type_record.hpp"
#include "enumkit/registry/value_arena.hpp"

namespace enumkit::registry {

// Position of a record in the registry. Position 0 is the sentinel.
struct TypeIndex {
  uint32_t value = 0;

  static constexpr auto Sentinel() -> TypeIndex {
    return {0};
  }
  [[nodiscard]] constexpr auto IsValid() const -> bool {
    return value != 0;
  }

  auto operator==(const TypeIndex&) const -> bool = default;
};

struct RegistryOptions {
  // Records in the first table segment. Each later segment doubles.
  uint32_t segment_records = 64;
  uint32_t arena_block_words = ValueArena::kDefaultBlockWords;
};

// Append-only store of TypeRecords keyed by TypeIdentity.
//
// Concurrency: GetOrCreateRecord builds the draft without holding any lock,
// then serializes publication. GetRecord and ForEachRecord are lock-free:
// records live in segments of doubling size that never move once allocated,
// and the published size is released after the segment pointer and the
// record are written. LookupIndex takes a shared lock on the identity map.
// Teardown must not overlap any other call.
class TypeRegistry final {
 public:
  explicit TypeRegistry(RegistryOptions options = {});
  ~TypeRegistry();

  TypeRegistry(const TypeRegistry&) = delete;
  auto operator=(const TypeRegistry&) -> TypeRegistry& = delete;
  TypeRegistry(TypeRegistry&&) = delete;
  auto operator=(TypeRegistry&&) -> TypeRegistry& = delete;

  // Process-scoped instance used by the typed query API. Created on first
  // use, torn down at exit or by an explicit Teardown().
  static auto Global() -> TypeRegistry&;

  // Idempotent registration. The first call for an identity builds and
  // publishes the record; later calls return the cached index.
  auto GetOrCreateRecord(const TypeDescriptor& desc)
      -> std::expected<TypeIndex, RegistryError>;

  // Sentinel for index 0 or any index not yet published.
  [[nodiscard]] auto GetRecord(TypeIndex index) const -> const TypeRecord&;

  // Sentinel index when the identity was never registered.
  [[nodiscard]] auto LookupIndex(TypeIdentity identity) const -> TypeIndex;

  // Visit published records in index order, sentinel excluded. Records
  // published while iterating are not visited.
  template <typename Fn>
  void ForEachRecord(Fn&& fn) const {
    uint32_t size = Size();
    for (uint32_t i = 1; i < size; ++i) {
      fn(GetRecord(TypeIndex{i}));
    }
  }

  // Published positions, sentinel included.
  [[nodiscard]] auto Size() const -> uint32_t {
    return size_.load(std::memory_order_acquire);
  }

  // Records that fit without allocating another segment, sentinel
  // included.
  [[nodiscard]] auto AllocatedSlots() const -> uint64_t;

  // Changes on every teardown that released state.
  [[nodiscard]] auto Generation() const -> uint64_t {
    return generation_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto IsInitialized() const -> bool {
    return initialized_.load(std::memory_order_acquire);
  }

  // Release every value table and forget every record. No-op on a registry
  // that never registered anything. The registry is reusable afterwards.
  void Teardown();

 private:
  // Segment k holds segment_records << k slots, so 33 segments cover every
  // uint32_t position even with one-record first segments.
  static constexpr size_t kMaxSegments = 33;

  struct SlotPosition {
    size_t segment;
    uint64_t offset;
  };

  [[nodiscard]] auto Locate(uint32_t position) const -> SlotPosition;

  // All three require publish_mutex_ to be held.
  void EnsureInitialized();
  auto SlotFor(uint32_t position) -> TypeRecord&;
  auto ReleaseLocked() -> uint32_t;

  RegistryOptions options_;
  std::array<std::atomic<TypeRecord*>, kMaxSegments> segments_{};
  std::array<std::unique_ptr<TypeRecord[]>, kMaxSegments> owned_segments_;
  std::atomic<uint32_t> size_{1};
  std::atomic<uint64_t> generation_{1};
  std::atomic<bool> initialized_{false};

  ValueArena arena_;
  absl::flat_hash_map<TypeIdentity, TypeIndex> index_map_;

  mutable std::shared_mutex map_mutex_;
  std::mutex publish_mutex_;
};

}  // namespace enumkit::registry
