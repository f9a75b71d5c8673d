#pragma once

// Typed queries over C++ enumerations.
//
// Registry-backed operations require an EnumTraits<E> specialization and
// register E with TypeRegistry::Global() on first use. The flag helpers at
// the bottom work on any enumeration and never touch the registry.

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <string_view>
#include <utility>

#include "enumkit/common/bit_utils.hpp"
#include "enumkit/common/branchless.hpp"
#include "enumkit/flags/flag_iterator.hpp"
#include "enumkit/query/query.hpp"
#include "enumkit/registry/registry_error.hpp"
#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/type_record.hpp"
#include "enumkit/registry/type_registry.hpp"

namespace enumkit::query {

using common::Enumeration;
using registry::RegisteredEnum;

// ============================================================================
// Registration
// ============================================================================

template <RegisteredEnum E>
auto Register() -> std::expected<registry::TypeIndex, registry::RegistryError> {
  return registry::TypeRegistry::Global().GetOrCreateRecord(
      registry::DescribeEnum<E>());
}

// Index of E in the global registry, registering it on first use. The index
// is cached per type and revalidated against the registry generation, so a
// teardown forces re-registration. Throws RegistryException if E cannot be
// registered.
template <RegisteredEnum E>
auto IndexFor() -> registry::TypeIndex {
  // generation (high 32 bits) | index (low 32 bits)
  static std::atomic<uint64_t> cached{0};

  auto& reg = registry::TypeRegistry::Global();
  uint64_t generation = reg.Generation() & 0xFFFFFFFFULL;
  uint64_t packed = cached.load(std::memory_order_acquire);
  if ((packed >> 32) == generation) {
    return registry::TypeIndex{static_cast<uint32_t>(packed)};
  }

  auto index = Register<E>();
  if (!index) {
    throw registry::RegistryException(std::move(index.error()));
  }
  cached.store((generation << 32) | index->value, std::memory_order_release);
  return *index;
}

template <RegisteredEnum E>
auto RecordFor() -> const registry::TypeRecord& {
  return registry::TypeRegistry::Global().GetRecord(IndexFor<E>());
}

template <RegisteredEnum E>
constexpr auto ToValue(E value) -> EnumValue {
  return EnumValue{
      .identity = registry::IdentityOf<E>(),
      .size = static_cast<uint32_t>(sizeof(E)),
      .mask = common::ToMask(value),
  };
}

// ============================================================================
// Queries
// ============================================================================

template <RegisteredEnum E>
auto IsValid(const registry::TypeRecord& record, E value) -> bool {
  return IsValid(record, ToValue(value));
}

template <RegisteredEnum E>
auto IndexOf(const registry::TypeRecord& record, E value) -> int32_t {
  return IndexOf(record, ToValue(value));
}

template <RegisteredEnum E>
auto IsValid(E value) -> bool {
  return IsValid(RecordFor<E>(), ToValue(value));
}

template <RegisteredEnum E>
auto IndexOf(E value) -> int32_t {
  return IndexOf(RecordFor<E>(), ToValue(value));
}

template <RegisteredEnum E>
auto ValueAt(int32_t index) -> E {
  return common::FromMask<E>(
      static_cast<uint64_t>(ValueAt(RecordFor<E>(), index)));
}

template <RegisteredEnum E>
auto Next(E value) -> E {
  return ValueAt<E>(IndexOf(value) + 1);
}

template <RegisteredEnum E>
auto Last(E value) -> E {
  return ValueAt<E>(IndexOf(value) - 1);
}

template <RegisteredEnum E>
auto NameOf(E value) -> std::string_view {
  return NameOf(RecordFor<E>(), ToValue(value));
}

// Union of every legal bit.
template <RegisteredEnum E>
auto All() -> E {
  return common::FromMask<E>(RecordFor<E>().All());
}

template <RegisteredEnum E>
auto Default() -> E {
  return common::FromMask<E>(
      static_cast<uint64_t>(RecordFor<E>().Default()));
}

template <RegisteredEnum E>
auto Length() -> int32_t {
  return RecordFor<E>().Length();
}

template <RegisteredEnum E>
auto IsFlag() -> bool {
  return RecordFor<E>().IsFlag();
}

template <RegisteredEnum E>
auto IsSigned() -> bool {
  return RecordFor<E>().IsSigned();
}

// Legal values of E in ascending order, read straight from the record.
template <RegisteredEnum E>
class EnumValues {
 public:
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = E;
    using difference_type = std::ptrdiff_t;
    using pointer = const E*;
    using reference = E;

    Iterator() = default;
    explicit Iterator(const int64_t* position) : position_(position) {
    }

    auto operator*() const -> E {
      return common::FromMask<E>(static_cast<uint64_t>(*position_));
    }

    auto operator++() -> Iterator& {
      ++position_;
      return *this;
    }

    auto operator++(int) -> Iterator {
      Iterator copy = *this;
      ++position_;
      return copy;
    }

    auto operator==(const Iterator&) const -> bool = default;

   private:
    const int64_t* position_ = nullptr;
  };

  explicit EnumValues(const registry::TypeRecord& record) : record_(&record) {
  }

  [[nodiscard]] auto begin() const -> Iterator {
    return Iterator(record_->Data());
  }

  [[nodiscard]] auto end() const -> Iterator {
    return Iterator(record_->Data() + record_->Length());
  }

  [[nodiscard]] auto size() const -> size_t {
    return static_cast<size_t>(record_->Length());
  }

  auto operator[](int32_t index) const -> E {
    return common::FromMask<E>(
        static_cast<uint64_t>(ValueAt(*record_, index)));
  }

 private:
  const registry::TypeRecord* record_;
};

template <RegisteredEnum E>
auto Values() -> EnumValues<E> {
  return EnumValues<E>(RecordFor<E>());
}

// ============================================================================
// Flag helpers
// ============================================================================

template <Enumeration E>
constexpr auto BitFlags(E value) -> flags::FlagIterator {
  return flags::FlagIterator(common::ToMask(value));
}

template <Enumeration E>
constexpr auto BitCount(E value) -> int {
  return std::popcount(common::ToMask(value));
}

// Any bit of flag set in value.
template <Enumeration E>
constexpr auto Match(E value, E flag) -> bool {
  return (common::ToMask(value) & common::ToMask(flag)) != 0;
}

// Number of bits of flag set in value; 0 is no match.
template <Enumeration E>
constexpr auto MatchCount(E value, E flag) -> int {
  return std::popcount(common::ToMask(value) & common::ToMask(flag));
}

// Every bit of flag set in value.
template <Enumeration E>
constexpr auto Exact(E value, E flag) -> bool {
  uint64_t check = common::ToMask(flag);
  return (common::ToMask(value) & check) == check;
}

template <Enumeration E>
constexpr void Toggle(E& value, E flag, bool on) {
  uint64_t m = common::ToMask(value);
  uint64_t f = common::ToMask(flag);
  value = common::FromMask<E>(
      common::branchless::IfElse(common::branchless::Binary(on), m | f, m & ~f));
}

template <Enumeration E>
constexpr auto Equal(E a, E b) -> bool {
  return common::ToMask(a) == common::ToMask(b);
}

// Three-way comparison of the unsigned masks: -1, 0 or 1.
template <Enumeration E>
constexpr auto Compare(E a, E b) -> int {
  namespace bl = common::branchless;
  uint64_t ma = common::ToMask(a);
  uint64_t mb = common::ToMask(b);
  return static_cast<int>(bl::IsGreaterThan(ma, mb)) -
         static_cast<int>(bl::IsLessThan(ma, mb));
}

// Highest set bit of value. Returns false (and the zero value) when no bit is
// set.
template <Enumeration E>
constexpr auto TryGetMaxSetFlag(E value, E& max_flag) -> bool {
  flags::FlagIterator bits = BitFlags(value);
  int count = bits.Count();
  max_flag = common::FromMask<E>(bits[count - 1]);
  return count > 0;
}

template <Enumeration E>
constexpr auto TryGetMinSetFlag(E value, E& min_flag) -> bool {
  flags::FlagIterator bits = BitFlags(value);
  min_flag = common::FromMask<E>(bits[0]);
  return bits.Count() > 0;
}

}  // namespace enumkit::query
