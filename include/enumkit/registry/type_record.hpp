#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "enumkit/registry/registry_error.hpp"
#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/value_arena.hpp"

namespace enumkit::registry {

// Classification bits of a record.
enum class TypeClass : uint8_t {
  kNone = 0,
  kFlag = 1 << 0,    // Declared as a bit-flag enumeration
  kSigned = 1 << 1,  // Native storage is signed
  kZero = 1 << 2,    // 0 is a legal value
  kGaps = 1 << 3,    // Legal values are not one contiguous run
};

constexpr auto operator|(TypeClass a, TypeClass b) -> TypeClass {
  return static_cast<TypeClass>(
      static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

constexpr auto operator&(TypeClass a, TypeClass b) -> TypeClass {
  return static_cast<TypeClass>(
      static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr auto HasClass(TypeClass set, TypeClass bit) -> bool {
  return (static_cast<uint8_t>(set) & static_cast<uint8_t>(bit)) != 0;
}

// "flag|signed|zero|gaps" style rendering; "none" when empty.
auto ToString(TypeClass classification) -> std::string;

// Validated, sorted contents of a record that has not been published yet.
struct RecordDraft {
  std::string name;
  TypeIdentity identity = kSentinelIdentity;
  uint32_t size = 0;
  TypeClass classification = TypeClass::kNone;
  uint64_t sum = 0;
  std::vector<int64_t> values;
  std::vector<std::string> value_names;
};

// Validate a descriptor, convert its values to 64-bit form, sort, deduplicate
// and classify. Fails with kInvalidTypeDescriptor on:
//   - no values
//   - size not in {1, 2, 4, 8}
//   - a raw value that does not fit size
//   - distinct raw values that collapse to one 64-bit value
//   - value_names present with a different count than raw_values
// A raw value declared more than once is an alias and keeps its first name.
auto BuildRecordDraft(const TypeDescriptor& desc)
    -> std::expected<RecordDraft, RegistryError>;

// Immutable description of one enumerated type. The value table is borrowed
// from the owning registry's arena; a default-constructed record is the
// sentinel and reports every query as not found.
class TypeRecord {
 public:
  TypeRecord() = default;

  // Takes the table location resolved by the registry; values must point at
  // draft.values.size() entries with the same contents.
  TypeRecord(RecordDraft draft, ValueHandle handle, const int64_t* values);

  [[nodiscard]] auto IsSentinel() const -> bool {
    return identity_ == kSentinelIdentity;
  }

  [[nodiscard]] auto Values() const -> std::span<const int64_t> {
    return {values_, length_};
  }

  // Raw table pointer. Always readable at index 0, even for the sentinel.
  [[nodiscard]] auto Data() const -> const int64_t* {
    return values_;
  }

  [[nodiscard]] auto Length() const -> int32_t {
    return static_cast<int32_t>(length_);
  }

  [[nodiscard]] auto Min() const -> int64_t;
  [[nodiscard]] auto Max() const -> int64_t;

  [[nodiscard]] auto Sum() const -> uint64_t {
    return sum_;
  }

  [[nodiscard]] auto Identity() const -> TypeIdentity {
    return identity_;
  }

  [[nodiscard]] auto Size() const -> uint32_t {
    return size_;
  }

  [[nodiscard]] auto Classification() const -> TypeClass {
    return classification_;
  }

  [[nodiscard]] auto IsFlag() const -> bool {
    return HasClass(classification_, TypeClass::kFlag);
  }
  [[nodiscard]] auto IsSigned() const -> bool {
    return HasClass(classification_, TypeClass::kSigned);
  }
  [[nodiscard]] auto HasZero() const -> bool {
    return HasClass(classification_, TypeClass::kZero);
  }
  [[nodiscard]] auto HasGaps() const -> bool {
    return HasClass(classification_, TypeClass::kGaps);
  }

  // 0 when zero is legal, otherwise the smallest legal value.
  [[nodiscard]] auto Default() const -> int64_t;

  // Union of all legal bits.
  [[nodiscard]] auto All() const -> uint64_t {
    return sum_;
  }

  [[nodiscard]] auto Name() const -> std::string_view {
    return name_;
  }

  // Display name of the i-th value; empty when out of range or unnamed.
  [[nodiscard]] auto NameAt(int32_t index) const -> std::string_view;

  [[nodiscard]] auto Handle() const -> ValueHandle {
    return handle_;
  }

 private:
  static constexpr int64_t kSentinelValue = 0;

  const int64_t* values_ = &kSentinelValue;
  uint32_t length_ = 0;
  uint64_t sum_ = 0;
  TypeIdentity identity_ = kSentinelIdentity;
  uint32_t size_ = 0;
  TypeClass classification_ = TypeClass::kNone;
  ValueHandle handle_;
  std::string name_;
  std::vector<std::string> value_names_;
};

}  // namespace enumkit::registry
