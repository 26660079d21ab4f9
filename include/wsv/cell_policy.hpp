#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wsv/row.hpp"

namespace wsv {

// Numeric reads of cell text. Every conversion yields nullopt for a null
// cell, for a cell is_null() accepts, and for text that does not convert
// in full.
struct CellPolicy {
  // Extra spellings treated as null besides the `-` null cell, e.g. "NA".
  std::vector<std::string> null_tokens;

  bool is_null(const Cell& cell) const;

  // Floating point via fast_float; the whole text must be a number.
  std::optional<double> to_number(const Cell& cell) const;
  std::optional<double> to_number(std::string_view text) const;

  std::optional<std::int64_t> to_integer(const Cell& cell) const;
  std::optional<std::int64_t> to_integer(std::string_view text) const;
};

}
