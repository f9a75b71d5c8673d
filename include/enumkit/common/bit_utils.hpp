#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace enumkit::common {

template <typename T>
concept Enumeration = std::is_enum_v<T>;

// Make bit mask with safety for 64-bit width
constexpr auto MakeBitMask(uint32_t bit_width) -> uint64_t {
  return (bit_width >= 64) ? ~0ULL : (1ULL << bit_width) - 1;
}

// Sign-extend a truncated unsigned integer to a full int64_t
constexpr auto SignExtend(uint64_t value, std::size_t bit_width) -> int64_t {
  if (bit_width == 0 || bit_width >= 64) {
    return static_cast<int64_t>(value);  // no-op
  }
  uint64_t sign_bit = 1ULL << (bit_width - 1);
  return static_cast<int64_t>((value ^ sign_bit) - sign_bit);
}

// Native storage widths an enumeration may have, in bytes.
constexpr auto IsSupportedWidth(uint32_t size_bytes) -> bool {
  return size_bytes == 1 || size_bytes == 2 || size_bytes == 4 ||
         size_bytes == 8;
}

// Whether a raw native bit pattern is representable in the given storage.
// Accepts the truncated form (upper bits clear) and, for signed storage, the
// already sign-extended form.
constexpr auto FitsWidth(uint64_t raw, uint32_t size_bytes, bool is_signed)
    -> bool {
  uint32_t bits = size_bytes * 8;
  uint64_t truncated = raw & MakeBitMask(bits);
  if (raw == truncated) {
    return true;
  }
  return is_signed &&
         static_cast<uint64_t>(SignExtend(truncated, bits)) == raw;
}

// Width-aware conversion of a native bit pattern to the 64-bit mask form
// stored in value tables: sign-extended for signed storage, zero-extended
// otherwise.
constexpr auto CanonicalizeRaw(
    uint64_t raw, uint32_t size_bytes, bool is_signed) -> uint64_t {
  uint32_t bits = size_bytes * 8;
  uint64_t truncated = raw & MakeBitMask(bits);
  return is_signed ? static_cast<uint64_t>(SignExtend(truncated, bits))
                   : truncated;
}

// Enumeration value to its canonical 64-bit mask.
template <Enumeration E>
constexpr auto ToMask(E value) -> uint64_t {
  using U = std::underlying_type_t<E>;
  return static_cast<uint64_t>(static_cast<int64_t>(static_cast<U>(value)));
}

// Canonical 64-bit mask back to the enumeration (truncates to native width).
template <Enumeration E>
constexpr auto FromMask(uint64_t mask) -> E {
  using U = std::underlying_type_t<E>;
  return static_cast<E>(static_cast<U>(mask));
}

}  // namespace enumkit::common
