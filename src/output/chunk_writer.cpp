#include "step_chunker/chunk_writer.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <utility>

namespace sc {

void append_json_string(std::string& o, std::string_view s) {
  o.push_back('"');
  for (char c : s) {
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      case '\b': o += "\\b";  break;
      case '\f': o += "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char tmp[8];
          std::snprintf(tmp, sizeof(tmp), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += tmp;
        } else {
          o.push_back(c);
        }
        break;
    }
  }
  o.push_back('"');
}

bool is_json_number(std::string_view s) {
  size_t i = 0, n = s.size();
  auto digit = [&](size_t k){ return k < n && std::isdigit(static_cast<unsigned char>(s[k])); };
  if (i < n && s[i] == '-') ++i;
  if (!digit(i)) return false;
  if (s[i] == '0') ++i; else while (digit(i)) ++i;
  if (i < n && s[i] == '.') {
    ++i;
    if (!digit(i)) return false;
    while (digit(i)) ++i;
  }
  if (i < n && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
    if (!digit(i)) return false;
    while (digit(i)) ++i;
  }
  return i == n;
}

ChunkWriter::ChunkWriter(std::ostream& out, Config cfg)
  : out_(out), cfg_(std::move(cfg)) {}

void ChunkWriter::element(std::string& line, std::string_view s) const {
  if (!cfg_.typed) { append_json_string(line, s); return; }

  switch (cfg_.policy.classify(s)) {
    case ElementKind::Null:
      line += "null";
      return;
    case ElementKind::Bool:
      line += *cfg_.policy.parse_bool(s) ? "true" : "false";
      return;
    case ElementKind::Number: {
      if (is_json_number(s)) { line.append(s.data(), s.size()); return; }
      double x = *cfg_.policy.parse_number(s);
      if (!std::isfinite(x)) break;   // inf has no JSON form; keep the text
      char tmp[64];
      int n = std::snprintf(tmp, sizeof(tmp), "%.17g", x);
      line.append(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
      return;
    }
    case ElementKind::String:
      break;
  }
  append_json_string(line, s);
}

bool ChunkWriter::write(const std::vector<std::string>& chunk) {
  line_.clear();
  line_.push_back('[');
  for (size_t i = 0; i < chunk.size(); ++i) {
    if (i) line_.push_back(',');
    element(line_, chunk[i]);
  }
  line_ += "]\n";
  out_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
  if (!out_) return false;
  ++chunks_;
  bytes_ += line_.size();
  return true;
}

}
