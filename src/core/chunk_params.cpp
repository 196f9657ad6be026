#include "step_chunker/chunk_params.hpp"
#include <sstream>

namespace sc {

static void require_positive(const char* name, std::int64_t v) {
  if (v <= 0) {
    throw InvalidParameter(std::string(name) + " must be a positive integer, got " + std::to_string(v));
  }
}

static void require_non_negative(const char* name, std::int64_t v) {
  if (v < 0) {
    throw InvalidParameter(std::string(name) + " must not be negative, got " + std::to_string(v));
  }
}

ChunkWindow normalize(const ChunkParams& p) {
  require_positive("chunk_size", p.chunk_size);
  if (p.chunk_step) require_positive("chunk_step", *p.chunk_step);
  if (p.start_at)   require_non_negative("start_at", *p.start_at);
  if (p.stop_at)    require_non_negative("stop_at", *p.stop_at);

  ChunkWindow w;
  w.chunk_size  = static_cast<std::size_t>(p.chunk_size);
  w.chunk_step  = p.chunk_step ? static_cast<std::size_t>(*p.chunk_step) : w.chunk_size;
  w.start_at    = p.start_at ? static_cast<std::size_t>(*p.start_at) : 0;
  if (p.stop_at) w.stop_at = static_cast<std::size_t>(*p.stop_at);
  w.return_tail = p.return_tail;
  return w;
}

bool try_normalize(const ChunkParams& p, ChunkWindow* out, std::string* err_out) {
  try {
    *out = normalize(p);
    return true;
  } catch (const InvalidParameter& e) {
    if (err_out) *err_out = e.what();
    return false;
  }
}

std::string describe(const ChunkWindow& w) {
  std::ostringstream o;
  o << "size=" << w.chunk_size << " step=" << w.chunk_step << " start=" << w.start_at
    << " stop=";
  if (w.stop_at) o << *w.stop_at; else o << "end";
  o << " tail=" << (w.return_tail ? "yes" : "no");
  return o.str();
}

}
