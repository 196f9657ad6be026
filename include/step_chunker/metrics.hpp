#pragma once
#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sc {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t elements = 0;
  std::uint64_t full_chunks = 0;
  std::uint64_t tail_chunks = 0;
  std::uint64_t bytes_in = 0;
  std::uint64_t bytes_out = 0;
  double wall_time_ms = 0.0;
  double chunks_per_sec = 0.0;

  std::vector<StageTiming> stages;   // in first-start order
};

class MetricsRegistry {
public:
  void add_elements(std::uint64_t n) noexcept { elements_ += n; }
  void add_chunk(std::size_t len, std::size_t chunk_size) noexcept {
    if (len == chunk_size) ++full_; else ++tail_;
  }
  void set_bytes_in(std::uint64_t b) noexcept { bytes_in_ = b; }
  void set_bytes_out(std::uint64_t b) noexcept { bytes_out_ = b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  std::uint64_t chunks() const noexcept { return full_ + tail_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t elements_{0};
  std::uint64_t full_{0};
  std::uint64_t tail_{0};
  std::uint64_t bytes_in_{0};
  std::uint64_t bytes_out_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times a stage for the lifetime of the guard.
class StageTimer {
public:
  StageTimer(MetricsRegistry& m, std::string_view name) : m_(m), name_(name) { m_.start_stage(name_); }
  ~StageTimer() { m_.end_stage(name_); }
  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry& m_;
  std::string name_;
};

}
