#include "wsv/token.hpp"
#include <string>
#include <utility>

namespace wsv {

Token Token::borrowed(TokenKind kind, std::string_view text, const Location& at) {
  Token t(kind, at);
  t.view_ = text;
  return t;
}

Token Token::owned(TokenKind kind, std::string text, const Location& at) {
  Token t(kind, at);
  t.owned_ = std::move(text);
  t.is_owned_ = true;
  return t;
}

std::string Token::take_text() {
  if (is_owned_) return std::move(owned_);
  return std::string(view_);
}

const char* to_string(TokenKind kind) noexcept {
  switch (kind) {
    case TokenKind::LineBreak: return "LineBreak";
    case TokenKind::Null:      return "Null";
    case TokenKind::Value:     return "Value";
    case TokenKind::Comment:   return "Comment";
  }
  return "?";
}

}
