#pragma once
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <utility>

namespace wsv {

// Pull source of Unicode code points for the streaming tokenizer. next() is
// called once per character and may block; it returns nullopt at end.
class CharSource {
public:
  virtual ~CharSource() = default;
  virtual std::optional<char32_t> next() = 0;
};

// UTF-8 text held by the caller.
class StringCharSource : public CharSource {
public:
  explicit StringCharSource(std::string_view text) : text_(text) {}
  std::optional<char32_t> next() override;

private:
  std::string_view text_;
  std::size_t pos_{0};
};

// UTF-8 bytes pulled one at a time from a std::istream.
class StreamCharSource : public CharSource {
public:
  explicit StreamCharSource(std::istream& in) : in_(in) {}
  std::optional<char32_t> next() override;

private:
  std::istream& in_;
};

// Code points produced by a callable, e.g. synthetic or unbounded input.
class GeneratorCharSource : public CharSource {
public:
  using Generator = std::function<std::optional<char32_t>()>;
  explicit GeneratorCharSource(Generator gen) : gen_(std::move(gen)) {}
  std::optional<char32_t> next() override { return gen_ ? gen_() : std::nullopt; }

private:
  Generator gen_;
};

}
