#pragma once
#include <functional>
#include <optional>
#include <string_view>

#include "wsv/error.hpp"
#include "wsv/record_view.hpp"
#include "wsv/row.hpp"
#include "wsv/row_reader.hpp"

namespace wsv {

// Parses a whole UTF-8 document. A line holding only a comment adds no row;
// a blank line adds an empty one. On error `out` is left empty, `*err`
// (when given) receives the error and false is returned.
bool parse_all(std::string_view text, Document& out, std::optional<Error>* err = nullptr,
               const ReadConfig& cfg = {});

// Zero-copy row loop over a UTF-8 buffer. Each row is handed to `on_row`
// as a RowView whose cells are only valid during the call. Rows delivered
// before an error stay delivered and, as with RowReader, a partial row is
// flushed before the error is reported; the function then returns false.
using RowViewCallback = std::function<void(const RowView&)>;
bool parse_rows(std::string_view text, const RowViewCallback& on_row,
                std::optional<Error>* err = nullptr);

}
