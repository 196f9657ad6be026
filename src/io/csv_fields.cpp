#include "step_chunker/csv_fields.hpp"
#include "step_chunker/line_reader.hpp"

namespace sc {

bool split_csv_line(std::string_view line, const CsvConfig& cfg, std::vector<std::string>& fields) {
  fields.clear();
  std::string cur;

  enum class Mode { Unquoted, Quoted, QuoteEscape } mode = Mode::Unquoted;
  const char* s = line.data();
  const char* e = s + line.size();
  for (const char* p = s; p <= e; ++p) {
    const bool at_end = (p == e);
    const char c = at_end ? cfg.delimiter : *p; // sentinel delimiter at end
    switch (mode) {
      case Mode::Unquoted:
        if (c == cfg.delimiter) {
          fields.push_back(std::move(cur));
          cur.clear();
        } else if (c == cfg.quote && cur.empty()) {
          mode = Mode::Quoted;
        } else {
          cur.push_back(c);
        }
        break;
      case Mode::Quoted:
        if (at_end) return false;             // unterminated quote
        if (c == cfg.quote) mode = Mode::QuoteEscape;
        else cur.push_back(c);
        break;
      case Mode::QuoteEscape:
        if (c == cfg.quote && !at_end) {
          cur.push_back(c);                   // escaped quote
          mode = Mode::Quoted;
        } else if (c == cfg.delimiter) {
          fields.push_back(std::move(cur));
          cur.clear();
          mode = Mode::Unquoted;
        } else {
          return false;                       // text after closing quote
        }
        break;
    }
  }
  return true;
}

CsvFieldCursor::CsvFieldCursor(LineReader& lines, const CsvConfig& cfg, FieldSelector sel)
  : lines_(lines), cfg_(cfg), sel_(std::move(sel)) {}

bool CsvFieldCursor::resolve_column() {
  if (sel_.index) { column_ = *sel_.index; return true; }
  if (!cfg_.header) { err_ = "CSV column by name requires a header row"; return false; }
  for (std::size_t i = 0; i < header_.size(); ++i) {
    if (header_[i] == sel_.name) { column_ = i; return true; }
  }
  err_ = "CSV column not found in header: " + sel_.name;
  return false;
}

bool CsvFieldCursor::next(std::string& out) {
  if (failed_) return false;

  while (lines_.next(line_)) {
    if (line_.empty()) continue;
    if (!split_csv_line(line_, cfg_, fields_)) {
      err_ = "CSV parse error (quoted field mismatch) at line " + std::to_string(lines_.lines_read());
      failed_ = true;
      return false;
    }

    if (!started_) {
      started_ = true;
      if (cfg_.header) header_ = fields_;
      if (!resolve_column()) { failed_ = true; return false; }
      if (cfg_.header) continue;
    }

    ++rows_;
    if (column_ < fields_.size()) out = std::move(fields_[column_]);
    else out.clear();
    return true;
  }

  if (!lines_.ok()) {
    err_ = "read error (errno " + std::to_string(lines_.last_error()) + ")";
    failed_ = true;
  }
  return false;
}

}
