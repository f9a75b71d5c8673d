#pragma once

#include <cstdint>

#include "enumkit/common/branchless.hpp"

namespace enumkit::query {

// Position of key in an ascending table, or -1.
//
// The window [find, find + length) always contains the first element not
// less than key. Each step halves it by moving find with a select instead of
// a branch, so the loop runs ceil(log2(length)) identical iterations. Reads
// never leave [0, length). A table of length 0 must still have a readable
// element 0 (the sentinel record guarantees this).
constexpr auto BranchlessBinarySearch(
    const int64_t* data, int32_t length, int64_t key) -> int32_t {
  namespace bl = common::branchless;
  bl::Binary non_empty = bl::IsGreaterThan(length, 0);
  int32_t find = 0;
  while (length > 1) {
    int32_t half = length >> 1;
    length -= half;
    int64_t element = data[find + half - 1];
    find += bl::IfElse(bl::IsLessThan(element, key), half, 0);
  }
  bl::Binary found = bl::IsZero(data[find] ^ key) & non_empty;
  return bl::IfElse(found, find, -1);
}

}  // namespace enumkit::query
