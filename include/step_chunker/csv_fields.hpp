#pragma once
#include "step_chunker/field_selector.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sc {

class LineReader;

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool header    = true;
};

// Splits one CSV line into fields; doubled quotes inside a quoted field are
// unescaped. Returns false on a malformed quoted field.
bool split_csv_line(std::string_view line, const CsvConfig& cfg, std::vector<std::string>& fields);

// Cursor over one column of a CSV file. Quoted fields spanning lines are not supported.
class CsvFieldCursor {
public:
  using value_type = std::string;

  CsvFieldCursor(LineReader& lines, const CsvConfig& cfg, FieldSelector sel);

  bool next(std::string& out);

  const std::vector<std::string>& header() const { return header_; }
  const std::string& error() const { return err_; }
  std::uint64_t rows() const { return rows_; }

private:
  bool resolve_column();

  LineReader& lines_;
  CsvConfig cfg_;
  FieldSelector sel_;
  std::vector<std::string> header_;
  std::vector<std::string> fields_;
  std::string line_;
  std::size_t column_{0};
  bool started_{false};
  bool failed_{false};
  std::uint64_t rows_{0};
  std::string err_;
};

}
