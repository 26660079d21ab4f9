#include "wsv/char_source.hpp"
#include "wsv/unicode.hpp"

#include <istream>

namespace wsv {

std::optional<char32_t> StringCharSource::next() {
  if (pos_ >= text_.size()) return std::nullopt;
  std::size_t width = 1;
  const char32_t c = decode_utf8(text_, pos_, width);
  pos_ += width;
  return c;
}

std::optional<char32_t> StreamCharSource::next() {
  const int b = in_.get();
  if (b == std::istream::traits_type::eof()) return std::nullopt;

  unsigned char seq[4] = {static_cast<unsigned char>(b), 0, 0, 0};
  const std::size_t len = utf8_sequence_length(seq[0]);
  if (len == 0) return kReplacement;
  if (len == 1) return char32_t(seq[0]);

  // Only take bytes that continue the sequence; anything else starts the
  // next code point.
  for (std::size_t i = 1; i < len; ++i) {
    const int nb = in_.peek();
    if (nb == std::istream::traits_type::eof() || (nb & 0xC0) != 0x80) return kReplacement;
    seq[i] = static_cast<unsigned char>(in_.get());
  }
  char32_t c = 0;
  if (!decode_utf8_sequence(seq, len, c)) return kReplacement;
  return c;
}

}
