#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sr {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t segments = 0;
  std::uint64_t bytes = 0;
  std::uint64_t pulls = 0;
  std::uint64_t polls = 0;
  std::uint64_t largest_segment = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;
};

class MetricsRegistry {
public:
  void add_segment(std::uint64_t b) noexcept {
    ++segments_;
    bytes_ += b;
    if (b > largest_) largest_ = b;
  }
  void add_pull() noexcept { ++pulls_; }
  void add_poll() noexcept { ++polls_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t segments_{0};
  std::uint64_t bytes_{0};
  std::uint64_t pulls_{0};
  std::uint64_t polls_{0};
  std::uint64_t largest_{0};
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
