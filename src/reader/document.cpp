#include "wsv/document.hpp"
#include "wsv/arena.hpp"
#include "wsv/token.hpp"
#include "wsv/tokenizer.hpp"

#include <utility>
#include <vector>

namespace wsv {

bool parse_all(std::string_view text, Document& out, std::optional<Error>* err,
               const ReadConfig& cfg) {
  out.clear();
  Tokenizer tokenizer(text);
  Document doc;
  Row row;
  row.reserve(cfg.column_hint);

  bool commented = false;
  Token tok;
  while (tokenizer.next(tok)) {
    switch (tok.kind()) {
      case TokenKind::Comment:
        commented = true;
        break;
      case TokenKind::LineBreak:
        if (std::exchange(commented, false) && row.empty()) break;
        doc.push_back(std::move(row));
        row = Row();
        row.reserve(cfg.column_hint);
        break;
      case TokenKind::Null:
        row.emplace_back();
        break;
      case TokenKind::Value:
        row.emplace_back(tok.take_text());
        break;
    }
  }

  if (tokenizer.error()) {
    if (err) *err = tokenizer.error();
    return false;
  }
  // A trailing line feed leaves an empty pending row; it is not a row.
  if (!row.empty()) doc.push_back(std::move(row));
  out = std::move(doc);
  return true;
}

bool parse_rows(std::string_view text, const RowViewCallback& on_row,
                std::optional<Error>* err) {
  Tokenizer tokenizer(text);
  Arena arena;  // escaped cells of the current row
  std::vector<RowView::CellView> cells;
  std::size_t line = 1;
  bool commented = false;

  auto flush = [&]() {
    on_row(RowView(&cells, line));
    cells.clear();
    arena.reset();
  };

  Token tok;
  while (tokenizer.next(tok)) {
    switch (tok.kind()) {
      case TokenKind::Comment:
        commented = true;
        break;
      case TokenKind::LineBreak:
        if (!(std::exchange(commented, false) && cells.empty())) flush();
        ++line;
        break;
      case TokenKind::Null:
        cells.emplace_back();
        break;
      case TokenKind::Value:
        cells.emplace_back(tok.borrowed() ? tok.text() : arena.copy(tok.text()));
        break;
    }
  }

  if (!cells.empty()) flush();
  if (tokenizer.error()) {
    if (err) *err = tokenizer.error();
    return false;
  }
  return true;
}

}
