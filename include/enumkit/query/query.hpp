#pragma once

#include <cstdint>
#include <string_view>

#include "enumkit/registry/type_descriptor.hpp"
#include "enumkit/registry/type_record.hpp"

namespace enumkit::query {

// A value tagged with the type it belongs to. mask is the canonical 64-bit
// form (sign-extended for signed storage).
struct EnumValue {
  registry::TypeIdentity identity = registry::kSentinelIdentity;
  uint32_t size = 0;
  uint64_t mask = 0;
};

// Tag raw native bits as a value of the record's own type.
auto MakeValue(const registry::TypeRecord& record, uint64_t raw) -> EnumValue;

// Same identity and storage width, and not the sentinel.
auto IsMatchingType(
    const registry::TypeRecord& record, const EnumValue& value) -> bool;

// Flags: every bit of value is a legal bit (0 included).
// Scalars: value is one of the legal values.
// False on type mismatch.
auto IsValid(const registry::TypeRecord& record, const EnumValue& value)
    -> bool;

// Position of value among the legal values, -1 when absent or mismatched.
// For contiguous flags a combination reports the position of its lowest bit.
auto IndexOf(const registry::TypeRecord& record, const EnumValue& value)
    -> int32_t;

// Legal value at index, with index clamped into [0, length - 1]. The sentinel
// yields 0.
auto ValueAt(const registry::TypeRecord& record, int32_t index) -> int64_t;

// Following legal value; the maximum is its own successor.
auto Next(const registry::TypeRecord& record, const EnumValue& value)
    -> int64_t;

// Preceding legal value; the minimum is its own predecessor.
auto Last(const registry::TypeRecord& record, const EnumValue& value)
    -> int64_t;

// Display name of value, empty when unnamed or absent.
auto NameOf(const registry::TypeRecord& record, const EnumValue& value)
    -> std::string_view;

}  // namespace enumkit::query
