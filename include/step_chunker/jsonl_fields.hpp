#pragma once
#include "step_chunker/field_selector.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace sc {

class LineReader;

struct JsonlConfig {
  bool   strict = true;                       // object-only in strict mode
  size_t cap_nested_value_bytes = 32 * 1024;  // cap for arrays/objects raw storage
};

// Cursor over one field of each JSONL record (simdjson On-Demand).
// Strings are unescaped; numbers and booleans keep their JSON text; null or a
// missing key yields an empty element; nested values yield capped raw JSON.
class JsonlFieldCursor {
public:
  using value_type = std::string;

  JsonlFieldCursor(LineReader& lines, const JsonlConfig& cfg, FieldSelector sel);
  ~JsonlFieldCursor();
  JsonlFieldCursor(const JsonlFieldCursor&) = delete;
  JsonlFieldCursor& operator=(const JsonlFieldCursor&) = delete;

  bool next(std::string& out);

  const std::string& error() const { return err_; }
  std::uint64_t records() const { return records_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t records_{0};
  std::string err_;
};

}
