#include "step_chunker/run_report.hpp"
#include "step_chunker/chunk_writer.hpp"
#include "step_chunker/path_utils.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace sc {

static void esc(std::ostringstream& o, const std::string& s) {
  std::string tmp;
  append_json_string(tmp, s);
  o << tmp;
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunReportWriter::to_json(const RunReport& r) {
  const RunStats& s = r.stats;
  std::ostringstream o;
  o << "{";
  o << "\"elements\":" << s.elements << ",";
  o << "\"chunks\":" << (s.full_chunks + s.tail_chunks) << ",";
  o << "\"full_chunks\":" << s.full_chunks << ",";
  o << "\"tail_chunks\":" << s.tail_chunks << ",";
  o << "\"bytes_in\":" << s.bytes_in << ",";
  o << "\"bytes_out\":" << s.bytes_out << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"chunks_per_sec\":" << safe_num(s.chunks_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << safe_num(s.stages[i].duration_ms) << "}";
  }
  o << "],";

  o << "\"params\":{"
    << "\"chunk_size\":" << r.params.chunk_size << ","
    << "\"chunk_step\":" << r.params.chunk_step << ","
    << "\"start_at\":" << r.params.start_at << ","
    << "\"stop_at\":";
  if (r.params.stop_at) o << *r.params.stop_at; else o << "null";
  o << ",\"return_tail\":" << (r.params.return_tail ? "true" : "false") << "},";

  o << "\"strategy\":";     esc(o, r.strategy);     o << ",";
  o << "\"verified\":" << (r.verified ? "true" : "false") << ",";
  o << "\"filename\":";     esc(o, r.filename);     o << ",";
  o << "\"content_type\":"; esc(o, r.content_type);

  o << "}";
  return o.str();
}

bool RunReportWriter::write_file(const RunReport& r, const std::string& path, std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create parent directory for " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (err_out) *err_out = "cannot open " + path;
    return false;
  }
  out << to_json(r) << "\n";
  out.flush();
  if (!out) {
    if (err_out) *err_out = "write failed: " + path;
    return false;
  }
  return true;
}

}
