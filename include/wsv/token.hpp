#pragma once
#include <string>
#include <string_view>
#include <utility>

#include "wsv/location.hpp"

namespace wsv {

enum class TokenKind { LineBreak, Null, Value, Comment };

// One scanned token. Value/Comment text is either borrowed from the source
// buffer (eager tokenizer, no escapes) or owned by the token. A borrowed
// token is only valid while the source buffer is alive.
class Token {
public:
  Token() = default;

  static Token line_break(const Location& at) { return Token(TokenKind::LineBreak, at); }
  static Token null(const Location& at) { return Token(TokenKind::Null, at); }
  static Token borrowed(TokenKind kind, std::string_view text, const Location& at);
  static Token owned(TokenKind kind, std::string text, const Location& at);

  TokenKind kind() const noexcept { return kind_; }
  const Location& location() const noexcept { return loc_; }

  bool is_line_break() const noexcept { return kind_ == TokenKind::LineBreak; }
  bool is_null() const noexcept { return kind_ == TokenKind::Null; }
  bool is_value() const noexcept { return kind_ == TokenKind::Value; }
  bool is_comment() const noexcept { return kind_ == TokenKind::Comment; }

  // Empty for LineBreak/Null.
  std::string_view text() const noexcept { return is_owned_ ? std::string_view(owned_) : view_; }
  bool borrowed() const noexcept { return !is_owned_; }

  // Moves the owned text out, or copies the borrowed one.
  std::string take_text();

private:
  Token(TokenKind kind, const Location& at) : kind_(kind), loc_(at) {}

  TokenKind kind_ = TokenKind::LineBreak;
  Location loc_;
  std::string_view view_;
  std::string owned_;
  bool is_owned_ = false;
};

const char* to_string(TokenKind kind) noexcept;

}
