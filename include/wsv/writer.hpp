#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "wsv/row.hpp"

namespace wsv {

// Packed: one space between cells, no padding. Lazy (see PackedWriter).
// Left/Right: cells padded to the widest rendered cell of their column.
// Computing the widths needs every row up front, so use Packed for output
// that does not fit in memory.
enum class Alignment { Packed, Left, Right };

struct WriteConfig {
  Alignment alignment = Alignment::Packed;
  // Quote a cell whose text is exactly "-" so it does not read back as null.
  bool quote_reserved = true;
};

// True when `text` must be written quoted: it is empty, contains whitespace,
// '#', '"' or a line feed, or is the reserved "-" (with quote_reserved).
bool needs_quotes(std::string_view text, bool quote_reserved = true) noexcept;

// Printed form of one cell: "-" for null, otherwise the text, quoted with
// '"' doubled and line feeds written as "/" when needed.
std::string render_cell(const Cell& cell, bool quote_reserved = true);
void render_cell(const Cell& cell, bool quote_reserved, std::string& out);

// Width of render_cell(cell) in code points, used for column alignment.
std::size_t rendered_width(const Cell& cell, bool quote_reserved = true);

// Rows are joined by a line feed; no line feed follows the last row.
std::string write(const Document& rows, Alignment alignment = Alignment::Packed);
std::string write(const Document& rows, const WriteConfig& cfg);

// Packed output produced one code point at a time, pulling one row at a
// time from `rows`. Nothing beyond the current row is held in memory.
class PackedWriter {
public:
  explicit PackedWriter(RowSource rows, bool quote_reserved = true);
  ~PackedWriter();
  PackedWriter(PackedWriter&& other) noexcept : p_(other.p_) { other.p_ = nullptr; }
  PackedWriter(const PackedWriter&) = delete;
  PackedWriter& operator=(const PackedWriter&) = delete;

  std::optional<char32_t> next();

  // Drains the writer into `out` as UTF-8; returns out.good(). A RowSource
  // that stops early looks like the end of input here, so when it comes from
  // RowReader::as_source() check the reader's error() as well.
  bool write_to(std::ostream& out);

  std::uint64_t rows_written() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
