#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace wsv {

// Bump allocator for short-lived cell text. Storage is a list of blocks, so
// views handed out stay valid until reset() even when the arena grows.
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 4096);

  std::string_view copy(std::string_view s);

  // Drops all text; the first block is kept for reuse.
  void reset() noexcept;

  std::size_t used() const noexcept { return used_; }
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept { return high_water_; }

private:
  char* alloc(std::size_t n);

  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size;
  };

  std::size_t block_bytes_;
  std::vector<Block> blocks_;
  std::size_t head_{0};  // offset into blocks_.back()
  std::size_t used_{0};
  std::size_t high_water_{0};
};

}
