#pragma once

#include <bit>
#include <cstdint>
#include <iterator>
#include <optional>

#include "enumkit/common/branchless.hpp"

namespace enumkit::flags {

// The set bits of a 64-bit mask as a restartable sequence of single-bit masks,
// lowest bit first. Holds two words and never allocates.
//
// Cursor protocol: Reset() moves before the first bit; Advance() moves to the
// next set bit and reports whether there was one; Current() is the bit found
// by the last successful Advance(). Once exhausted, Advance() keeps returning
// false and Current() keeps the last bit until Reset().
class FlagIterator {
 public:
  class Iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = uint64_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const uint64_t*;
    using reference = uint64_t;

    constexpr Iterator() = default;
    constexpr explicit Iterator(uint64_t remaining) : remaining_(remaining) {
    }

    constexpr auto operator*() const -> uint64_t {
      return remaining_ & (~remaining_ + 1);
    }

    constexpr auto operator++() -> Iterator& {
      remaining_ &= remaining_ - 1;
      return *this;
    }

    constexpr auto operator++(int) -> Iterator {
      Iterator copy = *this;
      ++*this;
      return copy;
    }

    constexpr auto operator==(const Iterator&) const -> bool = default;

   private:
    uint64_t remaining_ = 0;
  };

  constexpr FlagIterator() = default;
  constexpr explicit FlagIterator(uint64_t mask) : mask_(mask) {
  }

  [[nodiscard]] constexpr auto Mask() const -> uint64_t {
    return mask_;
  }

  [[nodiscard]] constexpr auto Count() const -> int {
    return std::popcount(mask_);
  }

  // Mask of the i-th set bit (0-based, ascending). Out of range gives 0.
  // Rank select in six fixed halving steps, whatever i is.
  [[nodiscard]] constexpr auto operator[](int i) const -> uint64_t {
    namespace bl = common::branchless;
    bl::Binary in_range =
        bl::IsPositive(i) & bl::IsLessThan(i, Count());
    int rank = bl::IfElse(in_range, i, 0);
    int position = 0;
    for (int width = 32; width > 0; width >>= 1) {
      uint64_t low_half = (mask_ >> position) & ((uint64_t{1} << width) - 1);
      int below = std::popcount(low_half);
      bl::Binary upper = bl::IsGreaterOrEqualThan(rank, below);
      position += bl::IfElse(upper, width, 0);
      rank -= bl::IfElse(upper, below, 0);
    }
    return bl::IfElse(in_range, uint64_t{1} << position, uint64_t{0});
  }

  constexpr auto Advance() -> bool {
    namespace bl = common::branchless;
    uint64_t below = (current_ | (current_ - 1)) &
                     (0 - static_cast<uint64_t>(bl::IsNotZero(current_)));
    uint64_t remaining = mask_ & ~below;
    bl::Binary found = bl::IsNotZero(remaining);
    current_ = bl::IfElse(found, remaining & (~remaining + 1), current_);
    return found.ToBool();
  }

  [[nodiscard]] constexpr auto Current() const -> uint64_t {
    return current_;
  }

  constexpr void Reset() {
    current_ = 0;
  }

  constexpr auto TryTakeNext() -> std::optional<uint64_t> {
    if (!Advance()) {
      return std::nullopt;
    }
    return current_;
  }

  // Any bit of `bit` present. Independent of the cursor.
  [[nodiscard]] constexpr auto Contains(uint64_t bit) const -> bool {
    return (mask_ & bit) != 0;
  }

  constexpr void Toggle(uint64_t flag, bool on) {
    mask_ = common::branchless::IfElse(
        common::branchless::Binary(on), mask_ | flag, mask_ & ~flag);
  }

  [[nodiscard]] constexpr auto begin() const -> Iterator {
    return Iterator(mask_);
  }

  [[nodiscard]] constexpr auto end() const -> Iterator {
    return Iterator(0);
  }

 private:
  uint64_t mask_ = 0;
  uint64_t current_ = 0;
};

}  // namespace enumkit::flags
