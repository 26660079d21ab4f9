#include "wsv/error.hpp"
#include <string>

namespace wsv {

std::string_view to_string(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::StringNotClosed:              return "String Not Closed";
    case ErrorKind::InvalidDoubleQuoteAfterValue: return "Invalid Double Quote After Value";
    case ErrorKind::InvalidCharacterAfterString:  return "Invalid Character After String";
    case ErrorKind::InvalidStringLineBreak:       return "Invalid String Line Break";
  }
  return "Unknown Error";
}

std::string Error::message() const {
  std::string out = "(line: ";
  out += std::to_string(loc_.line);
  out += ", column: ";
  out += std::to_string(loc_.column);
  out += ") ";
  out += to_string(kind_);
  return out;
}

}
