#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "wsv/chunk_reader.hpp"
#include "wsv/document.hpp"
#include "wsv/row_reader.hpp"
#include "wsv/writer.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

// Mix of bare, null, quoted and escaped cells with a comment every 100 rows.
static std::string make_synth_wsv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "wsv_bench_synth.wsv";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      if (c) out << ' ';
      switch ((r + c) % 5) {
        case 0: out << (r%10) << "." << (c*37%1000); break;
        case 1: out << '-'; break;
        case 2: out << "\"two words\""; break;
        case 3: out << "\"say \"\"hi\"\"\""; break;
        default: out << "\xE2\x82\xAC" << c; break;
      }
    }
    if (r % 100 == 0) out << " # row " << r;
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--wsv") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: wsv_bench_tokenizer [--wsv=path] [--rows=N] [--cols=M] [--iters=K]\n"
        "If the path is omitted, a synthetic WSV file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static std::string slurp(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void report(const char* tag, int k, std::uint64_t nrec, std::uint64_t bytes,
                   clk::time_point t0, clk::time_point t1) {
  const double sec = std::chrono::duration<double>(t1-t0).count();
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  " << tag << " iter " << k
            << ": rows=" << nrec
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (mib/sec) << " MiB/s"
            << "  rows/s=" << (nrec/sec) << "\n";
}

static void bench_buffer(const std::string& path, int iters) {
  const std::string text = slurp(path);
  std::cout << "\n[buffer] file=" << path << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    std::uint64_t nrec = 0;
    std::optional<wsv::Error> err;
    auto t0 = clk::now();
    const bool ok = wsv::parse_rows(text, [&](const wsv::RowView&){ ++nrec; }, &err);
    auto t1 = clk::now();
    if (!ok) std::cerr << "[WARN] " << err->message() << "\n";
    report("parse_rows", k, nrec, text.size(), t0, t1);

    wsv::Document doc;
    t0 = clk::now();
    if (!wsv::parse_all(text, doc)) std::cerr << "[WARN] parse_all failed\n";
    t1 = clk::now();
    report("parse_all ", k, doc.size(), text.size(), t0, t1);

    t0 = clk::now();
    const std::string out = wsv::write(doc);
    t1 = clk::now();
    report("write     ", k, doc.size(), out.size(), t0, t1);
  }
}

static void bench_stream(const std::string& path, int iters) {
  std::cout << "\n[stream] file=" << path << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    wsv::ChunkReader rd(path);
    wsv::RowReader rows(rd);
    std::uint64_t nrec = 0;

    auto t0 = clk::now();
    const bool ok = rows.for_each([&](wsv::Row&){ ++nrec; });
    auto t1 = clk::now();
    if (!ok) std::cerr << "[WARN] " << rows.error()->message() << "\n";
    report("row_reader", k, nrec, rd.bytes_read(), t0, t1);
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_wsv(a.rows, a.cols);
  bench_buffer(path, a.iters);
  bench_stream(path, a.iters);
  return 0;
}
