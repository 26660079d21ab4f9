#pragma once
#include <cstddef>

namespace wsv {

// Cursor position in the source. Line and column are 1-based and count
// Unicode code points; byte_offset is only tracked by the eager tokenizer
// and stays 0 when scanning a CharSource.
struct Location {
  std::size_t line = 1;
  std::size_t column = 1;
  std::size_t byte_offset = 0;
};

inline bool operator==(const Location& a, const Location& b) noexcept {
  return a.line == b.line && a.column == b.column && a.byte_offset == b.byte_offset;
}
inline bool operator!=(const Location& a, const Location& b) noexcept { return !(a == b); }

class LocationTracker {
public:
  // `width` is the encoded size of `consumed` in bytes (0 when unknown).
  void advance(char32_t consumed, std::size_t width) noexcept;
  Location snapshot() const noexcept { return loc_; }
  const Location& current() const noexcept { return loc_; }

private:
  Location loc_;
};

}
