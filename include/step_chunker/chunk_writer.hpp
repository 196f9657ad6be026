#pragma once
#include "step_chunker/element_policy.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sc {

// Writes chunks of textual elements as NDJSON: one JSON array per line.
class ChunkWriter {
public:
  struct Config {
    bool typed = false;      // render numbers/bools/nulls per ElementPolicy
    ElementPolicy policy;
  };

  ChunkWriter(std::ostream& out, Config cfg);

  bool write(const std::vector<std::string>& chunk);

  std::uint64_t chunks_written() const noexcept { return chunks_; }
  std::uint64_t bytes_written() const noexcept { return bytes_; }

private:
  void element(std::string& line, std::string_view s) const;

  std::ostream& out_;
  Config cfg_;
  std::string line_;
  std::uint64_t chunks_{0};
  std::uint64_t bytes_{0};
};

// JSON string literal (quoted, escaped) appended to `o`.
void append_json_string(std::string& o, std::string_view s);

// True when `s` matches the JSON number grammar exactly.
bool is_json_number(std::string_view s);

}
