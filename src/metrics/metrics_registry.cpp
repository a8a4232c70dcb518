#include "segmented_reader/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace sr {

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (std::find(stage_order_.begin(), stage_order_.end(), key) == stage_order_.end())
    stage_order_.push_back(key);
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
  r.segments = segments_;
  r.bytes = bytes_;
  r.pulls = pulls_;
  r.polls = polls_;
  r.largest_segment = largest_;
  r.wall_time_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  // Stages in first-start order; unfinished ones are left out.
  r.stages.reserve(stage_order_.size());
  for (const auto& name : stage_order_) {
    auto it = stage_accum_ms_.find(name);
    if (it != stage_accum_ms_.end()) r.stages.push_back(StageTiming{name, it->second});
  }
  return r;
}

}
