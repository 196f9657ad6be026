#include "step_chunker/metrics.hpp"
#include <chrono>

namespace sc {

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (stage_accum_ms_.find(key) == stage_accum_ms_.end()) {
    stage_accum_ms_[key] = 0.0;
    stage_order_.push_back(key);
  }
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration<double, std::milli>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += ms;
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.elements = elements_;
  r.full_chunks = full_;
  r.tail_chunks = tail_;
  r.bytes_in = bytes_in_;
  r.bytes_out = bytes_out_;
  r.wall_time_ms = wall_ms;
  r.chunks_per_sec = (wall_ms > 0.0) ? (full_ + tail_) / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return r;
}

}
