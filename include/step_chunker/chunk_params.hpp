#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sc {

// Thrown for non-positive chunk_size/chunk_step or negative offsets.
class InvalidParameter : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Caller-facing parameters. Unset optionals take their defaults in normalize().
struct ChunkParams {
  std::int64_t chunk_size = 0;
  std::optional<std::int64_t> chunk_step;   // defaults to chunk_size
  std::optional<std::int64_t> start_at;     // inclusive, defaults to 0
  std::optional<std::int64_t> stop_at;      // exclusive, defaults to end of source
  bool return_tail = false;
};

// Validated parameters shared by both strategies.
struct ChunkWindow {
  std::size_t chunk_size = 0;
  std::size_t chunk_step = 0;
  std::size_t start_at   = 0;
  std::optional<std::size_t> stop_at;
  bool return_tail = false;

  // Exclusive stop for a source of known length.
  std::size_t resolve_stop(std::size_t length) const noexcept {
    return stop_at ? std::min(*stop_at, length) : length;
  }
};

ChunkWindow normalize(const ChunkParams& p);

// Non-throwing variant; fills *err_out on failure.
bool try_normalize(const ChunkParams& p, ChunkWindow* out, std::string* err_out = nullptr);

std::string describe(const ChunkWindow& w);

}
