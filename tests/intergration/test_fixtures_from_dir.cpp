#include "wsv/chunk_reader.hpp"
#include "wsv/document.hpp"
#include "wsv/row_reader.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <cctype>
#include <cstdint>
#include <cstring>

namespace fs = std::filesystem;

static bool ieq_ext(const std::string& s, const char* ext) {
  if (s.size() != std::strlen(ext)) return false;
  for (size_t i = 0; i < s.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(ext[i]))) return false;
  return true;
}

static bool expected_ok_for(const fs::path& p) {
  return p.filename().string().rfind("bad_", 0) != 0;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

struct Res {
  bool ok{true};
  wsv::Document rows;
  std::uint64_t bytes{0};
  std::optional<wsv::Error> err;
};

static Res run_eager(const fs::path& f) {
  Res r;
  const std::string text = slurp(f);
  r.bytes = text.size();
  r.ok = wsv::parse_all(text, r.rows, &r.err);
  return r;
}

// Small chunks so multi-byte sequences straddle refills.
static Res run_stream(const fs::path& f) {
  Res r;
  wsv::ChunkReader reader(f.string(), wsv::ChunkReader::Config{16});
  wsv::RowReader rows(reader);
  r.ok = rows.for_each([&](wsv::Row& row) { r.rows.push_back(row); });
  r.err = rows.error();
  r.bytes = reader.bytes_read();
  if (!reader.ok()) r.ok = false;
  return r;
}

// Comment-only lines stream as empty rows but are skipped by parse_all, so
// the two paths are compared on their non-empty rows.
static wsv::Document with_cells(const wsv::Document& rows) {
  wsv::Document out;
  for (const auto& row : rows)
    if (!row.empty()) out.push_back(row);
  return out;
}

static bool same_error(const std::optional<wsv::Error>& a, const std::optional<wsv::Error>& b) {
  if (!a || !b) return !a && !b;
  // The stream side does not track byte offsets.
  return a->kind() == b->kind() &&
         a->location().line == b->location().line &&
         a->location().column == b->location().column;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (!ieq_ext(p.extension().string(), ".wsv")) continue;

    const Res eager = run_eager(p);
    const Res stream = run_stream(p);
    const bool expect_ok = expected_ok_for(p);

    // Streaming keeps rows read before an error; parse_all drops them.
    const bool rows_agree = !expect_ok ||
        (with_cells(eager.rows) == with_cells(stream.rows) && stream.rows.size() >= eager.rows.size());
    const bool verdict = eager.ok == expect_ok && stream.ok == expect_ok &&
                         rows_agree && same_error(eager.err, stream.err) &&
                         (!expect_ok || eager.bytes == stream.bytes);

    ++total; verdict ? ++passed : ++failed;

    std::cout << (verdict ? "[PASS] " : "[FAIL] ") << p.filename().string()
              << "  rows=" << stream.rows.size()
              << "  bytes=" << stream.bytes
              << "  expected_ok=" << (expect_ok?"true":"false");
    if (!verdict) {
      std::cout << "  eager_ok=" << (eager.ok?"true":"false")
                << "  stream_ok=" << (stream.ok?"true":"false")
                << "  rows_agree=" << (rows_agree?"true":"false");
    }
    std::cout << "\n";
    if (eager.err) std::cout << "       eager:  " << eager.err->message() << "\n";
    if (!verdict && stream.err) std::cout << "       stream: " << stream.err->message() << "\n";
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return (failed == 0 && total > 0) ? 0 : 1;
}
