#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace enumkit::registry {

// Location of one value table inside a ValueArena.
struct ValueHandle {
  uint32_t block = UINT32_MAX;
  uint32_t offset = 0;
  uint32_t length = 0;

  static constexpr auto Invalid() -> ValueHandle {
    return {};
  }
  [[nodiscard]] constexpr auto IsValid() const -> bool {
    return block != UINT32_MAX;
  }

  auto operator==(const ValueHandle&) const -> bool = default;
};

// Block allocator for value tables. Blocks are never moved or resized, so a
// pointer obtained through View() stays valid until Release().
class ValueArena final {
 public:
  static constexpr uint32_t kDefaultBlockWords = 4096;

  explicit ValueArena(uint32_t block_words = kDefaultBlockWords);
  ~ValueArena() = default;

  ValueArena(const ValueArena&) = delete;
  auto operator=(const ValueArena&) -> ValueArena& = delete;

  ValueArena(ValueArena&&) = default;
  auto operator=(ValueArena&&) -> ValueArena& = default;

  // Copy values into the arena. Tables larger than a block get a block of
  // their own. Throws InternalError on an empty table.
  auto Allocate(std::span<const int64_t> values) -> ValueHandle;

  // Throws InternalError if the handle does not belong to this arena.
  [[nodiscard]] auto View(ValueHandle handle) const
      -> std::span<const int64_t>;

  [[nodiscard]] auto BlockCount() const -> size_t {
    return blocks_.size();
  }

  [[nodiscard]] auto UsedWords() const -> size_t;

  // Free every block. All handles and views become invalid.
  void Release();

 private:
  struct Block {
    std::unique_ptr<int64_t[]> data;
    uint32_t capacity = 0;
    uint32_t used = 0;
  };

  auto AppendBlock(uint32_t capacity) -> uint32_t;

  uint32_t block_words_;
  std::vector<Block> blocks_;
  // Index of the block that receives small tables.
  uint32_t open_block_ = UINT32_MAX;
};

}  // namespace enumkit::registry
