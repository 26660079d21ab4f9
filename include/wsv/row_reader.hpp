#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "wsv/error.hpp"
#include "wsv/row.hpp"

namespace wsv {

class CharSource;

struct ReadConfig {
  std::size_t column_hint = 0;  // cells reserved per new row
};

// Groups the tokens of a StreamTokenizer into rows, dropping comments.
//
// A line feed ends a row, even an empty one, so a line holding nothing but
// a comment reads as an empty row (parse_all and parse_rows skip such
// lines). At end of input the pending row is delivered only if it has
// cells, so a trailing line feed adds no row.
// When the tokenizer fails, a non-empty pending row is delivered first and
// the error surfaces on the next call. After the error no rows follow.
class RowReader {
public:
  using RowCallback = std::function<void(Row&)>;

  explicit RowReader(CharSource& source, ReadConfig cfg = {});
  ~RowReader();
  // Not movable: as_source() hands out callables bound to this reader.
  RowReader(RowReader&&) = delete;
  RowReader(const RowReader&) = delete;
  RowReader& operator=(const RowReader&) = delete;

  bool next(Row& out);
  const std::optional<Error>& error() const noexcept;
  std::uint64_t rows() const noexcept { return rows_; }

  // Drains the reader; false iff it ended on an error.
  bool for_each(const RowCallback& on_row);

  // Adapter for PackedWriter: pulls rows from this reader, which must
  // outlive the returned source.
  RowSource as_source();

private:
  struct Impl; Impl* p_;
  std::uint64_t rows_{0};
};

inline RowReader parse_stream(CharSource& source, ReadConfig cfg = {}) {
  return RowReader(source, cfg);
}

}
