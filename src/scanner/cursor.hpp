#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "wsv/char_source.hpp"
#include "wsv/location.hpp"
#include "wsv/token.hpp"
#include "wsv/unicode.hpp"

// Character cursors for the scanner: one-slot lookahead, location tracking
// and span extraction. BufferCursor slices the source; StreamCursor copies.

namespace wsv {

class BufferCursor {
public:
  using Text = std::string_view;
  class ValueBuilder;

  explicit BufferCursor(std::string_view src) : src_(src) {}

  std::optional<char32_t> peek() {
    if (!peeked_ && pos_ < src_.size()) peeked_ = decode_utf8(src_, pos_, peeked_width_);
    return peeked_;
  }

  template <class Pred>
  std::optional<char32_t> consume_if(Pred&& pred) {
    const auto c = peek();
    if (!c || !pred(*c)) return std::nullopt;
    pos_ += peeked_width_;
    loc_.advance(*c, peeked_width_);
    peeked_.reset();
    return c;
  }

  template <class Pred>
  std::optional<std::string_view> consume_while(Pred&& pred) {
    const std::size_t start = pos_;
    while (consume_if(pred)) {}
    if (pos_ == start) return std::nullopt;
    return src_.substr(start, pos_ - start);
  }

  template <class Pred>
  void skip_while(Pred&& pred) {
    while (consume_if(pred)) {}
  }

  std::size_t mark() const noexcept { return pos_; }
  std::string_view slice(std::size_t begin, std::size_t end) const {
    return src_.substr(begin, end - begin);
  }
  const Location& location() const noexcept { return loc_.current(); }

private:
  std::string_view src_;
  std::size_t pos_{0};
  std::optional<char32_t> peeked_;
  std::size_t peeked_width_{0};
  LocationTracker loc_;
};

// Quoted value over a buffer: literal runs stay slices of the source until
// the first escape, after which text is collected in `owned_`.
class BufferCursor::ValueBuilder {
public:
  explicit ValueBuilder(const BufferCursor& cur) : cur_(cur), start_(cur.mark()) {}

  void verbatim(char32_t) {}

  void escape(std::size_t before, std::string_view replacement, std::size_t after) {
    owned_.append(cur_.slice(start_, before));
    owned_.append(replacement);
    escaped_ = true;
    start_ = after;
  }

  Token finish(std::size_t before, const Location& at) {
    const std::string_view tail = cur_.slice(start_, before);
    if (!escaped_) return Token::borrowed(TokenKind::Value, tail, at);
    owned_.append(tail);
    return Token::owned(TokenKind::Value, std::move(owned_), at);
  }

private:
  const BufferCursor& cur_;
  std::size_t start_;
  std::string owned_;
  bool escaped_{false};
};

class StreamCursor {
public:
  using Text = std::string;
  class ValueBuilder;

  explicit StreamCursor(CharSource& src) : src_(src) {}

  std::optional<char32_t> peek() {
    if (!peeked_ && !eof_) {
      peeked_ = src_.next();
      eof_ = !peeked_;
    }
    return peeked_;
  }

  template <class Pred>
  std::optional<char32_t> consume_if(Pred&& pred) {
    const auto c = peek();
    if (!c || !pred(*c)) return std::nullopt;
    loc_.advance(*c, 0);
    peeked_.reset();
    return c;
  }

  template <class Pred>
  std::optional<std::string> consume_while(Pred&& pred) {
    std::string out;
    bool any = false;
    while (const auto c = consume_if(pred)) {
      append_utf8(out, *c);
      any = true;
    }
    if (!any) return std::nullopt;
    return out;
  }

  template <class Pred>
  void skip_while(Pred&& pred) {
    while (consume_if(pred)) {}
  }

  // No backing buffer: marks carry no information.
  std::size_t mark() const noexcept { return 0; }
  const Location& location() const noexcept { return loc_.current(); }

private:
  CharSource& src_;
  std::optional<char32_t> peeked_;
  bool eof_{false};
  LocationTracker loc_;
};

class StreamCursor::ValueBuilder {
public:
  explicit ValueBuilder(const StreamCursor&) {}

  void verbatim(char32_t c) { append_utf8(out_, c); }
  void escape(std::size_t, std::string_view replacement, std::size_t) { out_.append(replacement); }
  Token finish(std::size_t, const Location& at) {
    return Token::owned(TokenKind::Value, std::move(out_), at);
  }

private:
  std::string out_;
};

}
