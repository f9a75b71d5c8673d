#include "enumkit/query/query.hpp"

#include <bit>
#include <cstdint>
#include <string_view>

#include "enumkit/common/bit_utils.hpp"
#include "enumkit/common/branchless.hpp"
#include "enumkit/query/binary_search.hpp"

namespace enumkit::query {

namespace bl = common::branchless;
using registry::TypeRecord;

auto MakeValue(const TypeRecord& record, uint64_t raw) -> EnumValue {
  return EnumValue{
      .identity = record.Identity(),
      .size = record.Size(),
      .mask = common::CanonicalizeRaw(raw, record.Size(), record.IsSigned()),
  };
}

auto IsMatchingType(const TypeRecord& record, const EnumValue& value)
    -> bool {
  return !record.IsSentinel() && record.Identity() == value.identity &&
         record.Size() == value.size;
}

auto IsValid(const TypeRecord& record, const EnumValue& value) -> bool {
  if (!IsMatchingType(record, value)) {
    return false;
  }

  uint64_t mask = value.mask;
  if (record.IsFlag()) {
    return (record.Sum() & mask) == mask;
  }

  auto key = static_cast<int64_t>(mask);
  if (!record.HasGaps()) {
    return (bl::IsGreaterOrEqualThan(key, record.Min()) &
            bl::IsGreaterOrEqualThan(record.Max(), key))
        .ToBool();
  }

  return BranchlessBinarySearch(record.Data(), record.Length(), key) != -1;
}

auto IndexOf(const TypeRecord& record, const EnumValue& value) -> int32_t {
  if (!IsMatchingType(record, value)) {
    return -1;
  }

  uint64_t mask = value.mask;
  auto key = static_cast<int64_t>(mask);
  if (!record.HasGaps()) {
    if (record.IsFlag()) {
      // Contiguous single bits: the ordinal is the distance from the lowest.
      int32_t position =
          std::countr_zero(mask) -
          std::countr_zero(static_cast<uint64_t>(record.Min()));
      bl::Binary legal =
          bl::IsNotZero(mask) & bl::IsZero(mask & ~record.Sum());
      return bl::IfElse(legal, position, -1);
    }
    bl::Binary in_range = bl::IsGreaterOrEqualThan(key, record.Min()) &
                          bl::IsGreaterOrEqualThan(record.Max(), key);
    auto offset = static_cast<int32_t>(
        mask - static_cast<uint64_t>(record.Min()));
    return bl::IfElse(in_range, offset, -1);
  }

  return BranchlessBinarySearch(record.Data(), record.Length(), key);
}

auto ValueAt(const TypeRecord& record, int32_t index) -> int64_t {
  int32_t last = bl::Max<int32_t>(record.Length() - 1, 0);
  return record.Data()[bl::Clamp<int32_t>(index, 0, last)];
}

auto Next(const TypeRecord& record, const EnumValue& value) -> int64_t {
  return ValueAt(record, IndexOf(record, value) + 1);
}

auto Last(const TypeRecord& record, const EnumValue& value) -> int64_t {
  return ValueAt(record, IndexOf(record, value) - 1);
}

auto NameOf(const TypeRecord& record, const EnumValue& value)
    -> std::string_view {
  return record.NameAt(IndexOf(record, value));
}

}  // namespace enumkit::query
