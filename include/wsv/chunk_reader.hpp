#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "wsv/char_source.hpp"

namespace wsv {

// Reads a UTF-8 file in fixed-size chunks and hands out code points one at
// a time. Sequences split across chunk boundaries are carried over.
class ChunkReader : public CharSource {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024;  // 512 KiB
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader() override;

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  std::optional<char32_t> next() override;

  // False once opening or reading the file failed; see last_error().
  bool ok() const noexcept;
  int  last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
