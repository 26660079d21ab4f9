#pragma once
#include <string>
#include <string_view>

#include "wsv/location.hpp"

namespace wsv {

enum class ErrorKind {
  StringNotClosed,
  InvalidDoubleQuoteAfterValue,
  InvalidCharacterAfterString,
  InvalidStringLineBreak,
};

// Title used in diagnostics, e.g. "String Not Closed".
std::string_view to_string(ErrorKind kind) noexcept;

class Error {
public:
  Error(ErrorKind kind, const Location& at) : kind_(kind), loc_(at) {}

  ErrorKind kind() const noexcept { return kind_; }
  const Location& location() const noexcept { return loc_; }

  // "(line: 4, column: 36) String Not Closed"
  std::string message() const;

private:
  ErrorKind kind_;
  Location loc_;
};

inline bool operator==(const Error& a, const Error& b) noexcept {
  return a.kind() == b.kind() && a.location() == b.location();
}

}
