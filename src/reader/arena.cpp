#include "wsv/arena.hpp"
#include <algorithm>
#include <cstring>

namespace wsv {

Arena::Arena(std::size_t block_bytes) : block_bytes_(std::max<std::size_t>(block_bytes, 64)) {}

char* Arena::alloc(std::size_t n) {
  if (blocks_.empty() || head_ + n > blocks_.back().size) {
    // Oversized requests get a block of their own.
    const std::size_t size = std::max(n, block_bytes_);
    blocks_.push_back(Block{std::unique_ptr<char[]>(new char[size]), size});
    head_ = 0;
  }
  char* p = blocks_.back().data.get() + head_;
  head_ += n;
  used_ += n;
  if (used_ > high_water_) high_water_ = used_;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  if (s.empty()) return {};
  char* p = alloc(s.size());
  std::memcpy(p, s.data(), s.size());
  return std::string_view(p, s.size());
}

void Arena::reset() noexcept {
  if (blocks_.size() > 1) blocks_.erase(blocks_.begin() + 1, blocks_.end());
  head_ = 0;
  used_ = 0;
}

std::size_t Arena::capacity() const noexcept {
  std::size_t total = 0;
  for (const auto& b : blocks_) total += b.size;
  return total;
}

}
