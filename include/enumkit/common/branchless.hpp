#pragma once

// Integer arithmetic without data-dependent branches.
//
// Every function here executes the same instruction sequence for every input
// of a given type. Compile-time dispatch (if constexpr on signedness) is the
// only form of selection used. Comparisons are computed from sign bits of
// overflow-free expressions, so they hold over the full range of the type.
//
// Narrow types are widened to 64 bits (sign-extended when signed) before any
// bit trick, which keeps integer promotion out of the formulas.

#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

#include "enumkit/common/bit_utils.hpp"

namespace enumkit::common::branchless {

template <typename T>
concept Integer = std::integral<T> && !std::same_as<T, bool>;

namespace detail {

template <Integer T>
using Wide = std::conditional_t<std::is_signed_v<T>, int64_t, uint64_t>;

template <Integer T>
constexpr int kBits = std::numeric_limits<std::make_unsigned_t<T>>::digits;

template <Integer T>
constexpr auto Widen(T value) -> uint64_t {
  return static_cast<uint64_t>(static_cast<Wide<T>>(value));
}

constexpr auto TopBit(uint64_t value) -> uint8_t {
  return static_cast<uint8_t>(value >> 63);
}

}  // namespace detail

// Boolean with a guaranteed 0/1 encoding.
class Binary {
 public:
  constexpr Binary() = default;

  constexpr explicit Binary(bool value) : value_(static_cast<uint8_t>(value)) {
  }

  template <Integer T>
  constexpr explicit Binary(T value) : value_(NotZero(value)) {
  }

  [[nodiscard]] constexpr auto Value() const -> uint8_t {
    return value_;
  }

  [[nodiscard]] constexpr auto ToBool() const -> bool {
    return value_ != 0;
  }

  constexpr operator int() const {
    return value_;
  }

  constexpr auto operator!() const -> Binary {
    return Binary(1 - value_);
  }

  constexpr auto operator==(const Binary&) const -> bool = default;

  friend constexpr auto operator&(Binary a, Binary b) -> Binary {
    return Binary(a.value_ & b.value_);
  }
  friend constexpr auto operator|(Binary a, Binary b) -> Binary {
    return Binary(a.value_ | b.value_);
  }
  friend constexpr auto operator^(Binary a, Binary b) -> Binary {
    return Binary(a.value_ ^ b.value_);
  }

 private:
  template <Integer T>
  static constexpr auto NotZero(T value) -> uint8_t {
    uint64_t u = detail::Widen(value);
    return detail::TopBit(u | (~u + 1));
  }

  uint8_t value_ = 0;
};

template <Integer T>
constexpr auto IsNotZero(T value) -> Binary {
  return Binary(value);
}

template <Integer T>
constexpr auto IsZero(T value) -> Binary {
  return !Binary(value);
}

template <Integer T>
constexpr auto IsEven(T value) -> Binary {
  return IsZero(detail::Widen(value) & 1U);
}

template <Integer T>
constexpr auto IsNegative(T value) -> Binary {
  if constexpr (std::is_signed_v<T>) {
    return Binary(detail::TopBit(detail::Widen(value)));
  } else {
    return Binary(false);
  }
}

// Greater than or equal to zero.
template <Integer T>
constexpr auto IsPositive(T value) -> Binary {
  return !IsNegative(value);
}

template <Integer T>
constexpr auto IsLessThan(T x, T y) -> Binary {
  uint64_t ux = detail::Widen(x);
  uint64_t uy = detail::Widen(y);
  if constexpr (std::is_signed_v<T>) {
    uint64_t diff = ux - uy;
    return Binary(detail::TopBit(diff ^ ((ux ^ uy) & (diff ^ ux))));
  } else {
    return Binary(detail::TopBit((~ux & uy) | ((~ux | uy) & (ux - uy))));
  }
}

template <Integer T>
constexpr auto IsGreaterThan(T x, T y) -> Binary {
  return IsLessThan(y, x);
}

template <Integer T>
constexpr auto IsGreaterOrEqualThan(T x, T y) -> Binary {
  return !IsLessThan(x, y);
}

// when_true * cond + when_false * (1 - cond), in unsigned arithmetic.
template <Integer T>
constexpr auto IfElse(Binary cond, T when_true, T when_false) -> T {
  using U = std::make_unsigned_t<T>;
  auto pick = static_cast<U>(cond.Value());
  auto skip = static_cast<U>(1 - cond.Value());
  return static_cast<T>(
      static_cast<U>(static_cast<U>(when_true) * pick) +
      static_cast<U>(static_cast<U>(when_false) * skip));
}

template <Integer T, Integer U>
constexpr auto IfElse(Binary cond, T when_true, U when_false)
    -> std::common_type_t<T, U> {
  using C = std::common_type_t<T, U>;
  return IfElse<C>(
      cond, static_cast<C>(when_true), static_cast<C>(when_false));
}

// Enumerations select on their canonical mask.
template <Enumeration E>
constexpr auto IfElse(Binary cond, E when_true, E when_false) -> E {
  return FromMask<E>(IfElse(cond, ToMask(when_true), ToMask(when_false)));
}

// Abs(min) wraps to min, as in two's complement negation.
template <Integer T>
constexpr auto Abs(T value) -> T {
  if constexpr (std::is_signed_v<T>) {
    using U = std::make_unsigned_t<T>;
    auto mask = static_cast<U>(value >> (detail::kBits<T> - 1));
    return static_cast<T>(
        static_cast<U>(static_cast<U>(static_cast<U>(value) + mask) ^ mask));
  } else {
    return value;
  }
}

// 1 for positive, 0 for zero, -1 for negative.
template <Integer T>
constexpr auto Sign(T value) -> int {
  return -static_cast<int>(IsNegative(value)) |
         static_cast<int>(IsNotZero(value));
}

// Moves the magnitude of value by delta, keeping its sign. Zero is scaled as
// if it were positive.
template <Integer T>
constexpr auto Scale(T value, T delta) -> T {
  int sign = Sign(value);
  return static_cast<T>(
      value + static_cast<T>(sign) * delta +
      static_cast<T>(static_cast<int>(IsZero(sign))) * delta);
}

template <Integer T>
constexpr auto Min(T x, T y) -> T {
  return IfElse(IsLessThan(x, y), x, y);
}

template <Integer T>
constexpr auto Max(T x, T y) -> T {
  return IfElse(IsLessThan(x, y), y, x);
}

// Requires lo <= hi.
template <Integer T>
constexpr auto Clamp(T value, T lo, T hi) -> T {
  return Min(Max(value, lo), hi);
}

// Zero counts as a power of two.
template <Integer T>
constexpr auto IsPowerOfTwo(T value) -> Binary {
  using U = std::make_unsigned_t<T>;
  auto u = static_cast<U>(value);
  return IsZero(static_cast<U>(u & static_cast<U>(u - 1)));
}

// Smallest power of two strictly greater than value. Overflows for inputs
// whose highest bit is the type's top bit.
template <Integer T>
constexpr auto ClosestPowerOfTwoGreaterThan(T value) -> T {
  using U = std::make_unsigned_t<T>;
  auto u = static_cast<U>(value);
  for (int shift = 1; shift < detail::kBits<T>; shift <<= 1) {
    u = static_cast<U>(u | static_cast<U>(u >> shift));
  }
  return static_cast<T>(static_cast<U>(u + 1));
}

// Nearest multiple of divisor. On a tie the candidate further from zero wins.
template <Integer T>
constexpr auto ClosestDivisibleBy(T value, T divisor) -> T {
  T quotient = value / divisor;
  T toward_zero = static_cast<T>(divisor * quotient);
  Binary same_sign = IsZero(Sign(value) * Sign(divisor) - 1);
  T away = static_cast<T>(
      divisor * IfElse(same_sign, static_cast<T>(quotient + 1),
                       static_cast<T>(quotient - 1)));
  Binary keep = IsGreaterThan(
      static_cast<T>(
          Abs(static_cast<T>(value - away)) -
          Abs(static_cast<T>(value - toward_zero))),
      static_cast<T>(0));
  return IfElse(keep, toward_zero, away);
}

// Strictly inside (a, b) or (b, a).
template <Integer T>
constexpr auto WithinRange(T value, T a, T b) -> Binary {
  return (IsGreaterThan(value, a) & IsLessThan(value, b)) |
         (IsGreaterThan(value, b) & IsLessThan(value, a));
}

// Linear remap. Requires in_max != in_min; division truncates toward zero.
template <Integer T>
constexpr auto Remap(T value, T in_min, T in_max, T out_min, T out_max) -> T {
  return static_cast<T>(
      (value - in_min) * (out_max - out_min) / (in_max - in_min) + out_min);
}

}  // namespace enumkit::common::branchless
