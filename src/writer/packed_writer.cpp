#include "wsv/writer.hpp"
#include "wsv/unicode.hpp"

#include <deque>
#include <ostream>
#include <string>
#include <utility>

namespace wsv {

struct PackedWriter::Impl {
  RowSource rows;
  bool quote_reserved;

  std::deque<char32_t> pending;  // rendered code points not yet handed out
  std::string scratch;
  Row row;
  std::size_t cell{0};
  bool in_row{false};
  bool exhausted{false};
  std::uint64_t written{0};

  Impl(RowSource src, bool qr) : rows(std::move(src)), quote_reserved(qr) {}

  void queue(std::string_view text) {
    for (std::size_t i = 0; i < text.size();) {
      std::size_t width = 1;
      pending.push_back(decode_utf8(text, i, width));
      i += width;
    }
  }

  std::optional<char32_t> next() {
    for (;;) {
      if (!pending.empty()) {
        const char32_t c = pending.front();
        pending.pop_front();
        return c;
      }

      if (in_row && cell < row.size()) {
        if (cell) pending.push_back(U' ');
        scratch.clear();
        render_cell(row[cell], quote_reserved, scratch);
        queue(scratch);
        ++cell;
        continue;
      }

      in_row = false;
      if (exhausted || !rows) return std::nullopt;
      row.clear();
      if (!rows(row)) {
        exhausted = true;
        return std::nullopt;
      }
      if (written) pending.push_back(kLineFeed);
      ++written;
      cell = 0;
      in_row = true;
    }
  }
};

PackedWriter::PackedWriter(RowSource rows, bool quote_reserved)
  : p_(new Impl(std::move(rows), quote_reserved)) {}

PackedWriter::~PackedWriter() { delete p_; }

std::optional<char32_t> PackedWriter::next() { return p_->next(); }

bool PackedWriter::write_to(std::ostream& out) {
  constexpr std::size_t kFlushBytes = 64 * 1024;
  std::string buf;
  buf.reserve(kFlushBytes + 4);
  while (const auto c = next()) {
    append_utf8(buf, *c);
    if (buf.size() >= kFlushBytes) {
      out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
      buf.clear();
    }
  }
  out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
  return out.good();
}

std::uint64_t PackedWriter::rows_written() const noexcept { return p_->written; }

}
