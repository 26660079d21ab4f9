#include "wsv/tokenizer.hpp"
#include "wsv/char_source.hpp"
#include "wsv/unicode.hpp"
#include "cursor.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace wsv {

namespace {

bool is_quote(char32_t c) { return c == kQuote; }
bool is_hash(char32_t c)  { return c == kHash; }
bool is_slash(char32_t c) { return c == kSlash; }
bool is_lf(char32_t c)    { return c == kLineFeed; }
bool not_lf(char32_t c)   { return c != kLineFeed; }
bool any_char(char32_t)   { return true; }

bool is_bare_char(char32_t c) {
  return c != kLineFeed && c != kQuote && c != kHash && !is_whitespace(c);
}

Token text_token(TokenKind kind, std::string_view text, const Location& at) {
  return Token::borrowed(kind, text, at);
}
Token text_token(TokenKind kind, std::string&& text, const Location& at) {
  return Token::owned(kind, std::move(text), at);
}

// The WSV token state machine, shared by both tokenizers. Between calls it
// keeps only the cursor, a deferred error and the terminal flag.
template <class Cursor>
class Scanner {
public:
  template <class Arg>
  explicit Scanner(Arg&& arg) : cur_(std::forward<Arg>(arg)) {}

  bool next(Token& out) {
    if (failed_) return false;
    if (pending_) {
      const Error deferred = *pending_;
      pending_.reset();
      return fail(deferred);
    }

    cur_.skip_while(is_whitespace);
    const Location start = cur_.location();

    if (cur_.consume_if(is_quote)) return scan_quoted(start, out);

    if (cur_.consume_if(is_hash)) {
      auto text = cur_.consume_while(not_lf);
      out = text_token(TokenKind::Comment, text ? std::move(*text) : typename Cursor::Text{}, start);
      return true;
    }

    if (cur_.consume_if(is_lf)) {
      out = Token::line_break(start);
      return true;
    }

    if (auto text = cur_.consume_while(is_bare_char)) {
      if (*text == "-") {
        out = Token::null(start);
        return true;
      }
      if (cur_.peek() == kQuote) pending_ = Error(ErrorKind::InvalidDoubleQuoteAfterValue, cur_.location());
      out = text_token(TokenKind::Value, std::move(*text), start);
      return true;
    }

    return false; // end of input
  }

  const std::optional<Error>& error() const noexcept { return error_; }
  const Location& location() const noexcept { return cur_.location(); }

private:
  // Opening quote already consumed.
  bool scan_quoted(const Location& start, Token& out) {
    typename Cursor::ValueBuilder value(cur_);
    for (;;) {
      const std::size_t before = cur_.mark();
      if (cur_.consume_if(is_quote)) {
        if (cur_.consume_if(is_quote)) {
          value.escape(before, "\"", cur_.mark());
          continue;
        }
        if (cur_.consume_if(is_slash)) {
          if (!cur_.consume_if(is_quote)) return fail(Error(ErrorKind::InvalidStringLineBreak, cur_.location()));
          value.escape(before, "\n", cur_.mark());
          continue;
        }
        out = value.finish(before, start);
        const auto after = cur_.peek();
        if (after && *after != kLineFeed && *after != kHash && !is_whitespace(*after))
          pending_ = Error(ErrorKind::InvalidCharacterAfterString, cur_.location());
        return true;
      }

      const auto c = cur_.peek();
      if (!c || *c == kLineFeed) return fail(Error(ErrorKind::StringNotClosed, cur_.location()));
      cur_.consume_if(any_char);
      value.verbatim(*c);
    }
  }

  bool fail(const Error& e) {
    error_ = e;
    failed_ = true;
    return false;
  }

  Cursor cur_;
  std::optional<Error> pending_;
  std::optional<Error> error_;
  bool failed_{false};
};

}

struct Tokenizer::Impl {
  Scanner<BufferCursor> scanner;
  explicit Impl(std::string_view text) : scanner(text) {}
};

Tokenizer::Tokenizer(std::string_view text) : p_(new Impl(text)) {}
Tokenizer::~Tokenizer() { delete p_; }

bool Tokenizer::next(Token& out) { return p_->scanner.next(out); }
const std::optional<Error>& Tokenizer::error() const noexcept { return p_->scanner.error(); }
const Location& Tokenizer::location() const noexcept { return p_->scanner.location(); }

struct StreamTokenizer::Impl {
  Scanner<StreamCursor> scanner;
  explicit Impl(CharSource& source) : scanner(source) {}
};

StreamTokenizer::StreamTokenizer(CharSource& source) : p_(new Impl(source)) {}
StreamTokenizer::~StreamTokenizer() { delete p_; }

bool StreamTokenizer::next(Token& out) { return p_->scanner.next(out); }
const std::optional<Error>& StreamTokenizer::error() const noexcept { return p_->scanner.error(); }
const Location& StreamTokenizer::location() const noexcept { return p_->scanner.location(); }

}
