#include "enumkit/registry/value_arena.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <span>

#include <fmt/format.h>

#include "enumkit/common/internal_error.hpp"

namespace enumkit::registry {

ValueArena::ValueArena(uint32_t block_words)
    : block_words_(std::max<uint32_t>(block_words, 1)) {
}

auto ValueArena::AppendBlock(uint32_t capacity) -> uint32_t {
  blocks_.push_back(
      Block{
          .data = std::make_unique<int64_t[]>(capacity),
          .capacity = capacity,
          .used = 0,
      });
  return static_cast<uint32_t>(blocks_.size() - 1);
}

auto ValueArena::Allocate(std::span<const int64_t> values) -> ValueHandle {
  if (values.empty()) {
    common::ThrowInternalError(
        "ValueArena::Allocate", "value tables must not be empty");
  }
  if (values.size() > UINT32_MAX) {
    common::ThrowInternalError(
        "ValueArena::Allocate",
        fmt::format("value table of {} entries is too large", values.size()));
  }
  auto length = static_cast<uint32_t>(values.size());

  uint32_t block_index = 0;
  if (length > block_words_) {
    block_index = AppendBlock(length);
  } else {
    if (open_block_ == UINT32_MAX ||
        blocks_[open_block_].capacity - blocks_[open_block_].used < length) {
      open_block_ = AppendBlock(block_words_);
    }
    block_index = open_block_;
  }

  Block& block = blocks_[block_index];
  ValueHandle handle{
      .block = block_index,
      .offset = block.used,
      .length = length,
  };
  std::ranges::copy(values, block.data.get() + block.used);
  block.used += length;
  return handle;
}

auto ValueArena::View(ValueHandle handle) const -> std::span<const int64_t> {
  if (!handle.IsValid() || handle.block >= blocks_.size()) {
    throw common::InternalError(
        "ValueArena::View",
        fmt::format(
            "block {} out of range (blocks {})", handle.block,
            blocks_.size()));
  }
  const Block& block = blocks_[handle.block];
  if (static_cast<uint64_t>(handle.offset) + handle.length > block.used) {
    throw common::InternalError(
        "ValueArena::View",
        fmt::format(
            "range [{}, {}) exceeds block {} usage {}", handle.offset,
            handle.offset + handle.length, handle.block, block.used));
  }
  return {block.data.get() + handle.offset, handle.length};
}

auto ValueArena::UsedWords() const -> size_t {
  size_t total = 0;
  for (const Block& block : blocks_) {
    total += block.used;
  }
  return total;
}

void ValueArena::Release() {
  blocks_.clear();
  blocks_.shrink_to_fit();
  open_block_ = UINT32_MAX;
}

}  // namespace enumkit::registry
