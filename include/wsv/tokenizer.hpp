#pragma once
#include <optional>
#include <string_view>

#include "wsv/error.hpp"
#include "wsv/location.hpp"
#include "wsv/token.hpp"

namespace wsv {

class CharSource;

// Eager tokenizer over a UTF-8 buffer owned by the caller. Values without
// escapes and comments are returned as views into `text`.
//
// next() returns false at end of input or on error; error() tells the two
// apart. Errors are terminal. Some errors are detected while producing a
// token and reported by the following next() call, after that token.
class Tokenizer {
public:
  explicit Tokenizer(std::string_view text);
  ~Tokenizer();
  Tokenizer(Tokenizer&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }
  Tokenizer(const Tokenizer&) = delete;
  Tokenizer& operator=(const Tokenizer&) = delete;

  bool next(Token& out);
  const std::optional<Error>& error() const noexcept;
  const Location& location() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Same algorithm over a CharSource; every token owns its text. The source
// must outlive the tokenizer.
class StreamTokenizer {
public:
  explicit StreamTokenizer(CharSource& source);
  ~StreamTokenizer();
  StreamTokenizer(StreamTokenizer&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }
  StreamTokenizer(const StreamTokenizer&) = delete;
  StreamTokenizer& operator=(const StreamTokenizer&) = delete;

  bool next(Token& out);
  const std::optional<Error>& error() const noexcept;
  const Location& location() const noexcept;

private:
  struct Impl; Impl* p_;
};

inline Tokenizer tokenize(std::string_view text) { return Tokenizer(text); }
inline StreamTokenizer tokenize_stream(CharSource& source) { return StreamTokenizer(source); }

}
