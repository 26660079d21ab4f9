#include "wsv/location.hpp"
#include "wsv/unicode.hpp"

namespace wsv {

void LocationTracker::advance(char32_t consumed, std::size_t width) noexcept {
  if (consumed == kLineFeed) {
    ++loc_.line;
    loc_.column = 1;
  } else {
    ++loc_.column;
  }
  loc_.byte_offset += width;
}

}
