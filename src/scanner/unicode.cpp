#include "wsv/unicode.hpp"

namespace wsv {

bool is_whitespace(char32_t c) noexcept {
  switch (c) {
    case 0x0009: case 0x000B: case 0x000C: case 0x000D: case 0x0020:
    case 0x0085: case 0x00A0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

std::size_t utf8_sequence_length(unsigned char lead) noexcept {
  if (lead < 0x80) return 1;
  if (lead >= 0xC2 && lead <= 0xDF) return 2;
  if (lead >= 0xE0 && lead <= 0xEF) return 3;
  if (lead >= 0xF0 && lead <= 0xF4) return 4;
  return 0; // continuation byte or invalid lead
}

bool decode_utf8_sequence(const unsigned char* p, std::size_t len, char32_t& out) noexcept {
  for (std::size_t i = 1; i < len; ++i) {
    if ((p[i] & 0xC0) != 0x80) return false;
  }
  char32_t c = 0;
  switch (len) {
    case 1:
      out = p[0];
      return true;
    case 2:
      out = (char32_t(p[0] & 0x1F) << 6) | char32_t(p[1] & 0x3F);
      return true;
    case 3:
      c = (char32_t(p[0] & 0x0F) << 12) | (char32_t(p[1] & 0x3F) << 6) | char32_t(p[2] & 0x3F);
      if (c < 0x800 || (c >= 0xD800 && c <= 0xDFFF)) return false;
      out = c;
      return true;
    case 4:
      c = (char32_t(p[0] & 0x07) << 18) | (char32_t(p[1] & 0x3F) << 12) |
          (char32_t(p[2] & 0x3F) << 6) | char32_t(p[3] & 0x3F);
      if (c < 0x10000 || c > 0x10FFFF) return false;
      out = c;
      return true;
    default:
      return false;
  }
}

char32_t decode_utf8(std::string_view s, std::size_t pos, std::size_t& width) noexcept {
  const auto* p = reinterpret_cast<const unsigned char*>(s.data()) + pos;
  const std::size_t len = utf8_sequence_length(p[0]);
  char32_t c = 0;
  if (len == 0 || pos + len > s.size() || !decode_utf8_sequence(p, len, c)) {
    width = 1;
    return kReplacement;
  }
  width = len;
  return c;
}

void append_utf8(std::string& out, char32_t c) {
  if (c < 0x80) {
    out.push_back(static_cast<char>(c));
  } else if (c < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (c >> 6)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (c >> 12)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else if (c <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (c >> 18)));
    out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
  } else {
    append_utf8(out, kReplacement);
  }
}

std::size_t utf8_width(char32_t c) noexcept {
  if (c < 0x80) return 1;
  if (c < 0x800) return 2;
  if (c < 0x10000) return 3;
  if (c <= 0x10FFFF) return 4;
  return 3; // written as U+FFFD
}

std::size_t count_code_points(std::string_view s) noexcept {
  std::size_t n = 0;
  for (std::size_t i = 0; i < s.size();) {
    std::size_t w = 1;
    (void)decode_utf8(s, i, w);
    i += w;
    ++n;
  }
  return n;
}

}
