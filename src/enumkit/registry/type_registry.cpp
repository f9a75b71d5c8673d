#include "enumkit/registry/type_registry.hpp"

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <utility>

#include <spdlog/spdlog.h>

#include "enumkit/common/internal_error.hpp"
#include "enumkit/registry/type_record.hpp"

namespace enumkit::registry {

namespace {

auto SentinelRecord() -> const TypeRecord& {
  static const TypeRecord sentinel;
  return sentinel;
}

}  // namespace

TypeRegistry::TypeRegistry(RegistryOptions options)
    : options_(options), arena_(options.arena_block_words) {
  options_.segment_records = std::max<uint32_t>(options_.segment_records, 1);
}

TypeRegistry::~TypeRegistry() {
  std::lock_guard publish_lock(publish_mutex_);
  ReleaseLocked();
}

auto TypeRegistry::Global() -> TypeRegistry& {
  static TypeRegistry registry;
  return registry;
}

void TypeRegistry::EnsureInitialized() {
  if (initialized_.load(std::memory_order_relaxed)) {
    return;
  }
  initialized_.store(true, std::memory_order_release);
}

// Segment k starts at segment_records * (2^k - 1).
auto TypeRegistry::Locate(uint32_t position) const -> SlotPosition {
  uint64_t base = options_.segment_records;
  uint64_t group = (position / base) + 1;
  auto segment = static_cast<size_t>(std::bit_width(group) - 1);
  uint64_t start = base * ((uint64_t{1} << segment) - 1);
  return {.segment = segment, .offset = position - start};
}

auto TypeRegistry::SlotFor(uint32_t position) -> TypeRecord& {
  SlotPosition slot = Locate(position);
  TypeRecord* segment = segments_[slot.segment].load(std::memory_order_relaxed);
  if (segment == nullptr) {
    uint64_t slots = uint64_t{options_.segment_records} << slot.segment;
    owned_segments_[slot.segment] = std::make_unique<TypeRecord[]>(slots);
    segment = owned_segments_[slot.segment].get();
    segments_[slot.segment].store(segment, std::memory_order_release);
    spdlog::debug(
        "registry allocated segment {} ({} records)", slot.segment, slots);
  }
  return segment[slot.offset];
}

auto TypeRegistry::AllocatedSlots() const -> uint64_t {
  uint64_t slots = 0;
  for (size_t k = 0; k < kMaxSegments; ++k) {
    if (segments_[k].load(std::memory_order_acquire) == nullptr) {
      break;
    }
    slots += uint64_t{options_.segment_records} << k;
  }
  return slots;
}

auto TypeRegistry::GetOrCreateRecord(const TypeDescriptor& desc)
    -> std::expected<TypeIndex, RegistryError> {
  TypeIdentity identity = desc.ResolvedIdentity();
  if (TypeIndex existing = LookupIndex(identity); existing.IsValid()) {
    return existing;
  }

  auto draft = BuildRecordDraft(desc);
  if (!draft) {
    spdlog::warn("enum registration failed: {}", draft.error().detail);
    return std::unexpected(std::move(draft.error()));
  }

  std::lock_guard publish_lock(publish_mutex_);
  EnsureInitialized();

  // Another thread may have published the same type while we were building.
  if (TypeIndex existing = LookupIndex(identity); existing.IsValid()) {
    return existing;
  }

  uint32_t position = size_.load(std::memory_order_relaxed);
  if (position == UINT32_MAX) {
    common::ThrowInternalError(
        "TypeRegistry::GetOrCreateRecord", "type index space exhausted");
  }

  ValueHandle handle = arena_.Allocate(draft->values);
  std::span<const int64_t> table = arena_.View(handle);
  TypeRecord& record = SlotFor(position);
  record = TypeRecord(std::move(*draft), handle, table.data());

  // Size first: an index found through the map must already be readable.
  size_.store(position + 1, std::memory_order_release);
  {
    std::unique_lock map_lock(map_mutex_);
    index_map_.emplace(identity, TypeIndex{position});
  }

  spdlog::debug(
      "registered enum '{}' at index {}: {} values, class {}, sum {:#x}",
      record.Name(), position, record.Length(),
      ToString(record.Classification()), record.Sum());
  return TypeIndex{position};
}

auto TypeRegistry::GetRecord(TypeIndex index) const -> const TypeRecord& {
  if (!index.IsValid() || index.value >= Size()) {
    return SentinelRecord();
  }
  SlotPosition slot = Locate(index.value);
  return segments_[slot.segment].load(std::memory_order_acquire)[slot.offset];
}

auto TypeRegistry::LookupIndex(TypeIdentity identity) const -> TypeIndex {
  std::shared_lock map_lock(map_mutex_);
  auto it = index_map_.find(identity);
  if (it == index_map_.end()) {
    return TypeIndex::Sentinel();
  }
  return it->second;
}

void TypeRegistry::Teardown() {
  std::lock_guard publish_lock(publish_mutex_);
  if (!initialized_.load(std::memory_order_relaxed)) {
    spdlog::debug("registry teardown skipped: never initialized");
    return;
  }
  uint32_t released = ReleaseLocked();
  spdlog::debug(
      "registry teardown released {} records, generation now {}", released,
      Generation());
}

auto TypeRegistry::ReleaseLocked() -> uint32_t {
  if (!initialized_.load(std::memory_order_relaxed)) {
    return 0;
  }
  uint32_t released = size_.load(std::memory_order_relaxed) - 1;
  {
    std::unique_lock map_lock(map_mutex_);
    index_map_.clear();
  }
  size_.store(1, std::memory_order_release);
  for (size_t k = 0; k < kMaxSegments; ++k) {
    segments_[k].store(nullptr, std::memory_order_release);
    owned_segments_[k].reset();
  }
  arena_.Release();
  initialized_.store(false, std::memory_order_release);
  generation_.fetch_add(1, std::memory_order_acq_rel);
  return released;
}

}  // namespace enumkit::registry
