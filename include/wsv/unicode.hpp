#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace wsv {

constexpr char32_t kLineFeed    = U'\n';
constexpr char32_t kQuote       = U'"';
constexpr char32_t kHash        = U'#';
constexpr char32_t kSlash       = U'/';
constexpr char32_t kReplacement = 0xFFFD;

// WSV whitespace. Line feed is not whitespace; it separates rows.
bool is_whitespace(char32_t c) noexcept;

// Expected sequence length from a UTF-8 lead byte, 0 if `lead` cannot start one.
std::size_t utf8_sequence_length(unsigned char lead) noexcept;

// Decode the code point starting at s[pos]. `width` receives the number of
// bytes consumed (>= 1). Malformed input yields kReplacement with width 1.
char32_t decode_utf8(std::string_view s, std::size_t pos, std::size_t& width) noexcept;

// Decode `len` bytes whose length came from utf8_sequence_length(p[0]).
// False for bad continuation bytes, overlong forms, surrogates and values
// past U+10FFFF.
bool decode_utf8_sequence(const unsigned char* p, std::size_t len, char32_t& out) noexcept;

void append_utf8(std::string& out, char32_t c);
std::size_t utf8_width(char32_t c) noexcept;

std::size_t count_code_points(std::string_view s) noexcept;

}
