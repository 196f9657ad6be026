#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <simdjson.h>

namespace fs = std::filesystem;

#ifndef SC_CHUNKER_BIN_DEFAULT
#define SC_CHUNKER_BIN_DEFAULT "step-chunker"
#endif

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

static int run(const std::string& bin, const std::string& args, const fs::path& log) {
  std::string cmd = "\"" + bin + "\" " + args + " 2>\"" + log.string() + "\"";
  int rc = std::system(cmd.c_str());
  if (rc == -1 || !WIFEXITED(rc)) return -1;
  return WEXITSTATUS(rc);
}

int main() {
  std::string bin = env_or("SC_CHUNKER_BIN", SC_CHUNKER_BIN_DEFAULT);

  fs::path dir = fs::temp_directory_path() / ("sc-it-" + std::to_string(std::time(nullptr)));
  fs::create_directories(dir);
  fs::path in = dir / "series.csv";
  {
    std::ofstream out(in, std::ios::binary);
    out << "t,v\n";
    for (int i = 1; i <= 16; ++i) out << i << "," << (i * 10) << "\n";
  }
  fs::path log = dir / "run.log";

  // materialized + verified run with a report
  fs::path out1 = dir / "verified.ndjson";
  fs::path report = dir / "report" / "run.json";
  int rc = run(bin, "--size=3 --step=1 --start=2 --stop=5 --tail --column=v --verify --typed"
                    " --out=\"" + out1.string() + "\" --report=\"" + report.string() + "\" \"" + in.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] verified run returned " << rc << "\n" << slurp(log); return 1; }

  const std::string got = slurp(out1);
  const std::string expect = "[30,40,50]\n[40,50]\n[50]\n";
  if (got != expect) { std::cerr << "[FAIL] output:\n" << got << "expected:\n" << expect; return 1; }

  // streaming run over the same input yields the same bytes
  fs::path out2 = dir / "streamed.ndjson";
  rc = run(bin, "--size=3 --step=1 --start=2 --stop=5 --tail --column=v --typed --quiet"
                " --out=\"" + out2.string() + "\" \"" + in.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] streaming run returned " << rc << "\n" << slurp(log); return 1; }
  if (slurp(out2) != got) { std::cerr << "[FAIL] streaming output differs from verified output\n"; return 1; }

  // report contents
  uint64_t chunks = 0, tails = 0, elems = 0;
  std::string strategy;
  bool verified = false;
  try {
    simdjson::ondemand::parser p;
    auto json = simdjson::padded_string::load(report.string());
    simdjson::ondemand::document doc = p.iterate(json);
    chunks   = doc["chunks"].get_uint64();
    tails    = doc["tail_chunks"].get_uint64();
    elems    = doc["elements"].get_uint64();
    strategy = std::string(std::string_view(doc["strategy"].get_string()));
    verified = doc["verified"].get_bool();
  } catch (const simdjson::simdjson_error& e) {
    std::cerr << "[FAIL] cannot read report " << report << ": " << e.what() << "\n";
    return 1;
  }

  bool ok = true;
  if (chunks != 3) { std::cerr << "[FAIL] chunks=" << chunks << " in report\n"; ok = false; }
  if (tails != 2)  { std::cerr << "[FAIL] tail_chunks=" << tails << " in report\n"; ok = false; }
  if (elems != 16) { std::cerr << "[FAIL] elements=" << elems << " in report\n"; ok = false; }
  if (strategy != "indexed") { std::cerr << "[FAIL] strategy=" << strategy << "\n"; ok = false; }
  if (!verified) { std::cerr << "[FAIL] report not marked verified\n"; ok = false; }

  // malformed parameters are a usage error
  rc = run(bin, "--size=0 \"" + in.string() + "\" --column=v", log);
  if (rc != 1) { std::cerr << "[FAIL] --size=0 returned " << rc << ", expected 1\n"; ok = false; }
  if (slurp(log).find("chunk_size") == std::string::npos) {
    std::cerr << "[FAIL] --size=0 message does not name chunk_size\n"; ok = false;
  }

  // missing input is an I/O error
  rc = run(bin, "--size=2 \"" + (dir / "nope.txt").string() + "\"", log);
  if (rc != 2) { std::cerr << "[FAIL] missing input returned " << rc << ", expected 2\n"; ok = false; }

  // numbers with trailing junk are rejected, not truncated
  rc = run(bin, "--size=3x --column=v \"" + in.string() + "\"", log);
  if (rc != 1) { std::cerr << "[FAIL] --size=3x returned " << rc << ", expected 1\n"; ok = false; }

  // a column name without a header row is a usage error
  rc = run(bin, "--size=2 --column=v --no-header \"" + in.string() + "\"", log);
  if (rc != 1) { std::cerr << "[FAIL] --column with --no-header returned " << rc << ", expected 1\n"; ok = false; }
  if (slurp(log).find("header") == std::string::npos) {
    std::cerr << "[FAIL] --no-header message does not mention the header\n"; ok = false;
  }

  // text input: default cursor run and --materialize agree
  fs::path text = dir / "lines.txt";
  {
    std::ofstream o(text, std::ios::binary);
    for (int i = 0; i < 10; ++i) o << "l" << i << "\n";
  }
  fs::path streamed = dir / "text_cursor.ndjson";
  fs::path materialized = dir / "text_indexed.ndjson";
  rc = run(bin, "--size=4 --step=3 --tail --quiet --out=\"" + streamed.string() + "\" \"" + text.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] text cursor run returned " << rc << "\n" << slurp(log); ok = false; }
  rc = run(bin, "--size=4 --step=3 --tail --quiet --materialize --out=\"" + materialized.string() + "\" \""
                + text.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] text materialized run returned " << rc << "\n" << slurp(log); ok = false; }
  const std::string text_expect =
    "[\"l0\",\"l1\",\"l2\",\"l3\"]\n"
    "[\"l3\",\"l4\",\"l5\",\"l6\"]\n"
    "[\"l6\",\"l7\",\"l8\",\"l9\"]\n"
    "[\"l9\"]\n";
  if (slurp(streamed) != text_expect) { std::cerr << "[FAIL] text cursor output:\n" << slurp(streamed); ok = false; }
  if (slurp(materialized) != slurp(streamed)) { std::cerr << "[FAIL] --materialize output differs from cursor output\n"; ok = false; }

  // jsonl input selected by field
  fs::path jl = dir / "events.jsonl";
  {
    std::ofstream o(jl, std::ios::binary);
    const char* names[] = {"a", "b", "c", "d", "e"};
    for (int i = 0; i < 5; ++i) o << "{\"id\":" << i << ",\"name\":\"" << names[i] << "\"}\n";
  }
  fs::path jl_out = dir / "events.ndjson";
  rc = run(bin, "--size=2 --tail --field=name --quiet --out=\"" + jl_out.string() + "\" \"" + jl.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] jsonl run returned " << rc << "\n" << slurp(log); ok = false; }
  if (slurp(jl_out) != "[\"a\",\"b\"]\n[\"c\",\"d\"]\n[\"e\"]\n") {
    std::cerr << "[FAIL] jsonl output:\n" << slurp(jl_out); ok = false;
  }

  // scalar lines: elements with --lenient, a parse error (exit 3) without it
  fs::path mixed = dir / "mixed.jsonl";
  {
    std::ofstream o(mixed, std::ios::binary);
    o << "{\"name\":\"a\"}\n7\n\"b\"\n{\"name\":\"c\"}\n";
  }
  fs::path mixed_out = dir / "mixed.ndjson";
  rc = run(bin, "--size=2 --field=name --lenient --typed --quiet --out=\"" + mixed_out.string() + "\" \""
                + mixed.string() + "\"", log);
  if (rc != 0) { std::cerr << "[FAIL] lenient jsonl run returned " << rc << "\n" << slurp(log); ok = false; }
  if (slurp(mixed_out) != "[\"a\",7]\n[\"b\",\"c\"]\n") {
    std::cerr << "[FAIL] lenient jsonl output:\n" << slurp(mixed_out); ok = false;
  }
  rc = run(bin, "--size=2 --field=name --quiet \"" + mixed.string() + "\" >/dev/null", log);
  if (rc != 3) { std::cerr << "[FAIL] strict jsonl with a scalar line returned " << rc << ", expected 3\n"; ok = false; }
  if (slurp(log).find("non-object") == std::string::npos) {
    std::cerr << "[FAIL] strict jsonl message:\n" << slurp(log); ok = false;
  }

  // unterminated quote in csv is a parse error
  fs::path bad_csv = dir / "bad.csv";
  {
    std::ofstream o(bad_csv, std::ios::binary);
    o << "t,v\n1,10\n2,\"20\n3,30\n";
  }
  rc = run(bin, "--size=2 --column=v --quiet \"" + bad_csv.string() + "\" >/dev/null", log);
  if (rc != 3) { std::cerr << "[FAIL] malformed csv returned " << rc << ", expected 3\n"; ok = false; }
  rc = run(bin, "--size=2 --column=v --materialize --quiet \"" + bad_csv.string() + "\" >/dev/null", log);
  if (rc != 3) { std::cerr << "[FAIL] malformed csv (materialized) returned " << rc << ", expected 3\n"; ok = false; }

  std::error_code ec;
  fs::remove_all(dir, ec);
  if (!ok) return 1;
  std::cout << "[PASS] end-to-end CLI: chunks=" << chunks << " verified\n";
  return 0;
}
