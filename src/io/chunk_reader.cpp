#include "wsv/chunk_reader.hpp"
#include "wsv/unicode.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string_view>
#include <utility>
#include <vector>

namespace wsv {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  std::FILE* f{nullptr};
  bool eof{false};
  int last_errno{0};
  std::uint64_t bytes{0};

  std::vector<char> buf;
  std::size_t pos{0};  // next unread byte
  std::size_t len{0};  // valid bytes in buf

  void open() {
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; eof = true; return; }
    // A whole UTF-8 sequence must fit next to a carried tail.
    buf.resize(std::max<std::size_t>(cfg.chunk_bytes, 8));
  }

  void close() {
    if (f) { std::fclose(f); f = nullptr; }
  }

  // Moves the unread tail (at most an incomplete sequence) to the front and
  // reads the next chunk behind it.
  bool refill() {
    if (eof) return false;
    const std::size_t carry = len - pos;
    if (carry && pos) std::memmove(buf.data(), buf.data() + pos, carry);
    pos = 0;
    len = carry;

    const std::size_t n = std::fread(buf.data() + len, 1, buf.size() - len, f);
    if (n == 0) {
      if (std::ferror(f)) last_errno = errno ? errno : EIO;
      eof = true;
      close();
      return false;
    }
    bytes += n;
    len += n;
    return true;
  }

  std::optional<char32_t> next() {
    if (pos == len && !refill()) return std::nullopt;

    const std::size_t need = utf8_sequence_length(static_cast<unsigned char>(buf[pos]));
    while (need > 1 && len - pos < need && refill()) {}

    std::size_t width = 1;
    const char32_t c = decode_utf8(std::string_view(buf.data() + pos, len - pos), 0, width);
    pos += width;
    return c;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) { p_->open(); }

ChunkReader::~ChunkReader() { p_->close(); delete p_; }

std::optional<char32_t> ChunkReader::next() { return p_->next(); }
bool ChunkReader::ok() const noexcept { return p_->last_errno == 0; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }

}
