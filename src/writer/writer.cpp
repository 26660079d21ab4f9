#include "wsv/writer.hpp"
#include "wsv/unicode.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace wsv {

bool needs_quotes(std::string_view text, bool quote_reserved) noexcept {
  if (text.empty()) return true;
  if (quote_reserved && text == "-") return true;
  for (std::size_t i = 0; i < text.size();) {
    std::size_t width = 1;
    const char32_t c = decode_utf8(text, i, width);
    if (c == kLineFeed || c == kQuote || c == kHash || is_whitespace(c)) return true;
    i += width;
  }
  return false;
}

void render_cell(const Cell& cell, bool quote_reserved, std::string& out) {
  if (!cell) {
    out.push_back('-');
    return;
  }
  const std::string& text = *cell;
  if (!needs_quotes(text, quote_reserved)) {
    out.append(text);
    return;
  }
  out.push_back('"');
  for (char ch : text) {
    if (ch == '"')       out.append("\"\"");
    else if (ch == '\n') out.append("\"/\"");
    else                 out.push_back(ch);
  }
  out.push_back('"');
}

std::string render_cell(const Cell& cell, bool quote_reserved) {
  std::string out;
  render_cell(cell, quote_reserved, out);
  return out;
}

std::size_t rendered_width(const Cell& cell, bool quote_reserved) {
  if (!cell) return 1;
  const std::string& text = *cell;
  std::size_t width = count_code_points(text);
  if (!needs_quotes(text, quote_reserved)) return width;
  width += 2;
  for (char ch : text) {
    if (ch == '"') width += 1;       // ""
    else if (ch == '\n') width += 2; // "/"
  }
  return width;
}

namespace {

void pad(std::string& out, std::size_t n) { out.append(n, ' '); }

std::string write_packed(const Document& rows, bool quote_reserved) {
  std::string out;
  for (std::size_t r = 0; r < rows.size(); ++r) {
    if (r) out.push_back('\n');
    const Row& row = rows[r];
    for (std::size_t c = 0; c < row.size(); ++c) {
      if (c) out.push_back(' ');
      render_cell(row[c], quote_reserved, out);
    }
  }
  return out;
}

// Two passes: render every cell and find each column's widest cell, then
// emit with padding. Short rows simply have fewer cells.
std::string write_aligned(const Document& rows, Alignment alignment, bool quote_reserved) {
  struct Rendered {
    std::string text;
    std::size_t width;
  };
  std::vector<std::vector<Rendered>> cells;
  std::vector<std::size_t> col_width;
  cells.reserve(rows.size());

  for (const Row& row : rows) {
    std::vector<Rendered> line;
    line.reserve(row.size());
    for (std::size_t c = 0; c < row.size(); ++c) {
      std::string text = render_cell(row[c], quote_reserved);
      const std::size_t width = count_code_points(text);
      if (c >= col_width.size()) col_width.push_back(width);
      else col_width[c] = std::max(col_width[c], width);
      line.push_back(Rendered{std::move(text), width});
    }
    cells.push_back(std::move(line));
  }

  std::string out;
  for (std::size_t r = 0; r < cells.size(); ++r) {
    if (r) out.push_back('\n');
    const auto& line = cells[r];
    for (std::size_t c = 0; c < line.size(); ++c) {
      if (c) out.push_back(' ');
      const std::size_t fill = col_width[c] - line[c].width;
      if (alignment == Alignment::Right) pad(out, fill);
      out.append(line[c].text);
      if (alignment == Alignment::Left) pad(out, fill);
    }
  }
  return out;
}

}

std::string write(const Document& rows, Alignment alignment) {
  WriteConfig cfg;
  cfg.alignment = alignment;
  return write(rows, cfg);
}

std::string write(const Document& rows, const WriteConfig& cfg) {
  if (cfg.alignment == Alignment::Packed) return write_packed(rows, cfg.quote_reserved);
  return write_aligned(rows, cfg.alignment, cfg.quote_reserved);
}

}
