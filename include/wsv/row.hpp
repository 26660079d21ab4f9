#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace wsv {

// A cell is null (`-` in the text) or a string. Rows may have any length.
using Cell     = std::optional<std::string>;
using Row      = std::vector<Cell>;
using Document = std::vector<Row>;

// Pull source of rows for the writers: fills `out` and returns true, or
// returns false when exhausted.
using RowSource = std::function<bool(Row& out)>;

}
