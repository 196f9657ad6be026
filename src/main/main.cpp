#include "step_chunker/chunker.hpp"
#include "step_chunker/chunk_writer.hpp"
#include "step_chunker/csv_fields.hpp"
#include "step_chunker/jsonl_fields.hpp"
#include "step_chunker/line_reader.hpp"
#include "step_chunker/metrics.hpp"
#include "step_chunker/path_utils.hpp"
#include "step_chunker/run_report.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum ExitCode { kOk = 0, kUsage = 1, kIo = 2, kParse = 3, kMismatch = 4 };

struct Cli {
  sc::ChunkParams params;
  bool have_size = false;
  std::string input = "-";
  std::string format = "auto";      // auto|text|csv|jsonl
  std::string column;               // csv, by header name
  std::optional<std::size_t> column_index;
  std::string field;                // jsonl key
  char delimiter = ',';
  bool header = true;
  bool lenient = false;             // jsonl: accept non-object lines
  bool materialize = false;
  bool verify = false;
  bool typed = false;
  bool quiet = false;
  std::string out_path;             // empty -> stdout
  std::string report_path;
};

void usage(std::ostream& o) {
  o <<
    "Usage: step-chunker --size=N [--step=N] [--start=N] [--stop=N] [--tail]\n"
    "                    [--format=auto|text|csv|jsonl] [--column=NAME|--column-index=I]\n"
    "                    [--field=KEY] [--delimiter=C] [--no-header] [--lenient]\n"
    "                    [--materialize] [--verify] [--typed]\n"
    "                    [--out=FILE] [--report=FILE] [--quiet] [<input>|-]\n";
}

// Throws std::invalid_argument / std::out_of_range on malformed numbers.
bool parse_cli(int argc, char** argv, Cli& c, std::string& err) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, std::int64_t* out){
      if (a.rfind(pfx, 0) != 0) return false;
      const std::string v = a.substr(std::string(pfx).size());
      std::size_t pos = 0;
      *out = std::stoll(v, &pos);
      if (pos != v.size()) throw std::invalid_argument("trailing characters in " + a);
      return true;
    };
    auto eat_opt = [&](const char* pfx, std::optional<std::int64_t>* out){
      std::int64_t v = 0;
      if (!eat_i(pfx, &v)) return false;
      *out = v;
      return true;
    };
    std::string delim;
    std::int64_t col = 0;
    if (eat_i("--size=", &c.params.chunk_size)) { c.have_size = true; continue; }
    if (eat_opt("--step=", &c.params.chunk_step)) continue;
    if (eat_opt("--start=", &c.params.start_at)) continue;
    if (eat_opt("--stop=", &c.params.stop_at)) continue;
    if (a == "--tail") { c.params.return_tail = true; continue; }
    if (eat("--format=", &c.format)) continue;
    if (eat("--column=", &c.column)) continue;
    if (eat_i("--column-index=", &col)) {
      if (col < 0) { err = "--column-index must not be negative"; return false; }
      c.column_index = static_cast<std::size_t>(col);
      continue;
    }
    if (eat("--field=", &c.field)) continue;
    if (eat("--delimiter=", &delim)) {
      if (delim == "\\t") delim = "\t";
      if (delim.size() != 1) { err = "--delimiter takes a single character"; return false; }
      c.delimiter = delim[0];
      continue;
    }
    if (a == "--no-header")   { c.header = false; continue; }
    if (a == "--lenient")     { c.lenient = true; continue; }
    if (a == "--materialize") { c.materialize = true; continue; }
    if (a == "--verify")      { c.verify = true; continue; }
    if (a == "--typed")       { c.typed = true; continue; }
    if (a == "--quiet")       { c.quiet = true; continue; }
    if (eat("--out=", &c.out_path)) continue;
    if (eat("--report=", &c.report_path)) continue;
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(kOk); }
    if (a == "-" || a.rfind("--", 0) != 0) { c.input = a; continue; }
    err = "unknown option: " + a;
    return false;
  }
  if (!c.have_size) { err = "--size is required"; return false; }
  return true;
}

// Elements of the input (lines, a CSV column or a JSONL field) as a cursor source.
class InputSource {
public:
  using value_type = std::string;

  InputSource(const Cli& cli, sc::FileFormat fmt) {
    sc::LineReader::Config rcfg;
    lines_ = (cli.input == "-")
      ? std::make_unique<sc::LineReader>(stdin, rcfg)
      : std::make_unique<sc::LineReader>(cli.input, rcfg);

    if (fmt == sc::FileFormat::CSV) {
      sc::CsvConfig ccfg;
      ccfg.delimiter = cli.delimiter;
      ccfg.header = cli.header;
      auto sel = cli.column_index ? sc::FieldSelector::by_index(*cli.column_index)
                                  : sc::FieldSelector::by_name(cli.column);
      csv_ = std::make_unique<sc::CsvFieldCursor>(*lines_, ccfg, sel);
    } else if (fmt == sc::FileFormat::JSONL) {
      sc::JsonlConfig jcfg;
      jcfg.strict = !cli.lenient;
      jsonl_ = std::make_unique<sc::JsonlFieldCursor>(*lines_, jcfg, sc::FieldSelector::by_name(cli.field));
    }
  }

  bool next(std::string& out) {
    bool got = csv_   ? csv_->next(out)
             : jsonl_ ? jsonl_->next(out)
             : lines_->next(out);
    if (got) ++count_;
    return got;
  }

  // Malformed record (exit code 3).
  std::string parse_error() const {
    if (csv_) return csv_->error();
    if (jsonl_) return jsonl_->error();
    return {};
  }
  bool io_failed() const { return !lines_->ok(); }
  int io_errno() const { return lines_->last_error(); }

  std::uint64_t elements() const noexcept { return count_; }
  std::uint64_t bytes_read() const noexcept { return lines_->bytes_read(); }

private:
  std::unique_ptr<sc::LineReader> lines_;
  std::unique_ptr<sc::CsvFieldCursor> csv_;
  std::unique_ptr<sc::JsonlFieldCursor> jsonl_;
  std::uint64_t count_{0};
};

int source_status(const InputSource& src, const std::string& input) {
  if (src.io_failed()) {
    std::cerr << "[chunk] read error on " << input << ": errno " << src.io_errno() << "\n";
    return kIo;
  }
  auto perr = src.parse_error();
  if (!perr.empty()) {
    std::cerr << "[chunk] " << input << ": " << perr << "\n";
    return kParse;
  }
  return kOk;
}

int run(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  sc::ChunkWindow w;
  std::string perr;
  if (!sc::try_normalize(cli.params, &w, &perr)) {
    std::cerr << "[chunk] invalid parameter: " << perr << "\n";
    return kUsage;
  }

  sc::FileFormat fmt = sc::FileFormat::Text;
  if (cli.format == "auto") {
    fmt = (cli.input == "-") ? sc::FileFormat::Text : sc::detect_format(cli.input);
  } else if (!sc::parse_format(cli.format, &fmt)) {
    std::cerr << "[chunk] unknown format: " << cli.format << "\n";
    return kUsage;
  }
  if (fmt == sc::FileFormat::CSV && cli.column.empty() && !cli.column_index) {
    std::cerr << "[chunk] csv input needs --column=NAME or --column-index=I\n";
    return kUsage;
  }
  if (fmt == sc::FileFormat::CSV && !cli.header && !cli.column_index) {
    std::cerr << "[chunk] --column=NAME needs a header row; use --column-index=I with --no-header\n";
    return kUsage;
  }
  if (fmt == sc::FileFormat::JSONL && cli.field.empty()) {
    std::cerr << "[chunk] jsonl input needs --field=KEY\n";
    return kUsage;
  }

  std::ofstream file_out;
  if (!cli.out_path.empty()) {
    if (!sc::ensure_parent_dirs(cli.out_path)) {
      std::cerr << "[chunk] cannot create directory for output: " << cli.out_path << "\n";
      return kIo;
    }
    file_out.open(cli.out_path, std::ios::binary | std::ios::trunc);
    if (!file_out) { std::cerr << "[chunk] cannot open output: " << cli.out_path << "\n"; return kIo; }
  }
  std::ostream& out = cli.out_path.empty() ? std::cout : file_out;

  sc::ChunkWriter::Config wcfg;
  wcfg.typed = cli.typed;
  sc::ChunkWriter writer(out, wcfg);
  sc::MetricsRegistry metrics;

  InputSource src(cli, fmt);
  bool write_ok = true;
  bool verified = false;
  std::string strategy;

  auto emit = [&](const std::vector<std::string>& c) {
    metrics.add_chunk(c.size(), w.chunk_size);
    write_ok = writer.write(c);
    return write_ok;
  };

  if (cli.materialize || cli.verify) {
    strategy = "indexed";
    std::vector<std::string> elems;
    {
      sc::StageTimer st(metrics, "read");
      std::string e;
      while (src.next(e)) elems.push_back(std::move(e));
    }
    if (int rc = source_status(src, cli.input)) return rc;

    sc::IndexedChunker<const std::vector<std::string>&> indexed(elems, w);

    if (!cli.verify) {
      sc::StageTimer st(metrics, "chunk");
      indexed.for_each(emit);
    } else {
      // Second, independent pass through the cursor strategy: a fresh read
      // of the file, or the buffered elements when the input was a stream.
      std::unique_ptr<InputSource> again;
      std::unique_ptr<sc::ChunkStream<std::string>> cursor;
      if (cli.input != "-") {
        again = std::make_unique<InputSource>(cli, fmt);
        cursor = std::make_unique<sc::CursorChunker<InputSource&>>(*again, w);
      } else {
        cursor = std::make_unique<sc::CursorChunker<sc::IteratorCursor<std::vector<std::string>::const_iterator>>>(
          sc::make_cursor(elems.cbegin(), elems.cend()), w);
      }

      sc::StageTimer st(metrics, "verify");
      std::vector<std::string> a, b;
      std::size_t n = 0;
      verified = true;
      while (true) {
        bool ha = indexed.next(a);
        bool hb = cursor->next(b);
        if (ha != hb || (ha && a != b)) {
          std::cerr << "[verify] strategies diverge at chunk " << n
                    << " (indexed " << (ha ? std::to_string(a.size()) + " elements" : std::string("ended"))
                    << ", cursor " << (hb ? std::to_string(b.size()) + " elements" : std::string("ended")) << ")\n";
          verified = false;
          break;
        }
        if (!ha) break;
        ++n;
        if (!emit(a)) break;
      }
      if (again) {
        if (int rc = source_status(*again, cli.input)) return rc;
      }
      if (!verified) return kMismatch;
      if (!cli.quiet) std::cerr << "[verify] ok: " << n << " chunks identical across strategies\n";
    }
  } else {
    strategy = "cursor";
    auto stream = sc::chunk(src, cli.params);
    sc::StageTimer st(metrics, "chunk");
    stream.for_each(emit);
  }

  if (int rc = source_status(src, cli.input)) return rc;
  out.flush();
  if (!write_ok || !out) {
    std::cerr << "[chunk] write failed: " << (cli.out_path.empty() ? "<stdout>" : cli.out_path) << "\n";
    return kIo;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  metrics.add_elements(src.elements());
  metrics.set_bytes_in(src.bytes_read());
  metrics.set_bytes_out(writer.bytes_written());
  sc::RunStats stats = metrics.snapshot(wall_ms);

  if (!cli.quiet) {
    std::cerr << "[chunk] ok: " << (cli.input == "-" ? "<stdin>" : cli.input)
              << " -> " << (stats.full_chunks + stats.tail_chunks) << " chunks ("
              << stats.full_chunks << " full, " << stats.tail_chunks << " tail) "
              << "from " << stats.elements << " elements, " << sc::describe(w)
              << ", " << strategy << ", " << wall_ms << " ms\n";
  }

  if (!cli.report_path.empty()) {
    sc::RunReport r;
    r.stats = stats;
    r.params = w;
    r.strategy = strategy;
    r.verified = verified;
    r.filename = cli.input;
    r.content_type = sc::content_type(fmt);
    std::string err;
    if (!sc::RunReportWriter::write_file(r, cli.report_path, &err)) {
      std::cerr << "[report] " << err << "\n";
      return kIo;
    }
    if (!cli.quiet) std::cerr << "[report] wrote " << cli.report_path << "\n";
  }
  return kOk;
}

}

int main(int argc, char** argv) {
  Cli cli;
  std::string err;
  try {
    if (!parse_cli(argc, argv, cli, err)) {
      std::cerr << "[chunk] " << err << "\n";
      usage(std::cerr);
      return kUsage;
    }
  } catch (const std::logic_error& e) {
    std::cerr << "[chunk] bad numeric option: " << e.what() << "\n";
    usage(std::cerr);
    return kUsage;
  }
  return run(cli);
}
