#include "wsv/cell_policy.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>

#include <fast_float/fast_float.h>

namespace wsv {

bool CellPolicy::is_null(const Cell& cell) const {
  if (!cell) return true;
  return std::find(null_tokens.begin(), null_tokens.end(), *cell) != null_tokens.end();
}

std::optional<double> CellPolicy::to_number(const Cell& cell) const {
  if (is_null(cell)) return std::nullopt;
  return to_number(std::string_view(*cell));
}

std::optional<double> CellPolicy::to_number(std::string_view s) const {
  if (s.empty()) return std::nullopt;
  double out;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<std::int64_t> CellPolicy::to_integer(const Cell& cell) const {
  if (is_null(cell)) return std::nullopt;
  return to_integer(std::string_view(*cell));
}

std::optional<std::int64_t> CellPolicy::to_integer(std::string_view s) const {
  // std::from_chars rejects a leading '+'.
  if (!s.empty() && s.front() == '+') {
    s.remove_prefix(1);
    if (!s.empty() && s.front() == '-') return std::nullopt;
  }
  if (s.empty()) return std::nullopt;
  std::int64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

}
