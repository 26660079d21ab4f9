#include "wsv/row_reader.hpp"
#include "wsv/token.hpp"
#include "wsv/tokenizer.hpp"

#include <utility>

namespace wsv {

struct RowReader::Impl {
  StreamTokenizer tokenizer;
  ReadConfig cfg;
  std::optional<Error> deferred;  // error held back behind a partial row
  std::optional<Error> error;
  bool done{false};

  Impl(CharSource& source, const ReadConfig& c) : tokenizer(source), cfg(c) {}

  bool next(Row& out) {
    if (deferred) {
      error = std::move(deferred);
      deferred.reset();
      return false;
    }
    if (done) return false;

    Row row;
    row.reserve(cfg.column_hint);
    Token tok;
    for (;;) {
      if (!tokenizer.next(tok)) {
        done = true;
        if (tokenizer.error()) {
          if (row.empty()) {
            error = tokenizer.error();
            return false;
          }
          deferred = tokenizer.error();
        } else if (row.empty()) {
          return false;
        }
        out = std::move(row);
        return true;
      }

      switch (tok.kind()) {
        case TokenKind::Comment:
          break;
        case TokenKind::LineBreak:
          out = std::move(row);
          return true;
        case TokenKind::Null:
          row.emplace_back();
          break;
        case TokenKind::Value:
          row.emplace_back(tok.take_text());
          break;
      }
    }
  }
};

RowReader::RowReader(CharSource& source, ReadConfig cfg)
  : p_(new Impl(source, cfg)) {}

RowReader::~RowReader() { delete p_; }

bool RowReader::next(Row& out) {
  if (!p_->next(out)) return false;
  ++rows_;
  return true;
}

const std::optional<Error>& RowReader::error() const noexcept { return p_->error; }

bool RowReader::for_each(const RowCallback& on_row) {
  Row row;
  while (next(row)) on_row(row);
  return !p_->error;
}

RowSource RowReader::as_source() {
  return [this](Row& out) { return next(out); };
}

}
