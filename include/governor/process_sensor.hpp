#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>

namespace replyd::governor {

struct ProcessUsage {
  std::uint64_t rss_bytes{0};
  float cpu_percent{0.0F};
  bool cpu_valid{false};
};

// Reads resident memory from /proc/self/status and cumulative CPU time from
// /proc/self/stat. CPU percent is the utime+stime delta between two calls
// divided by the wall-clock delta, so the first call only records a baseline.
class ProcessSensor {
 public:
  using Clock = std::chrono::steady_clock;

  ProcessSensor();
  ProcessSensor(std::FILE* stat, std::FILE* status, bool owns_files = false, long ticks_per_second = 100);
  ~ProcessSensor();

  ProcessSensor(const ProcessSensor&) = delete;
  ProcessSensor& operator=(const ProcessSensor&) = delete;

  bool sample(Clock::time_point now, ProcessUsage& usage) noexcept;
  void reset_baseline() noexcept;

  [[nodiscard]] bool has_baseline() const noexcept;
  [[nodiscard]] Clock::time_point baseline_time() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 1024;

  bool read_cpu_ticks(std::uint64_t& ticks) noexcept;
  bool read_rss_bytes(std::uint64_t& bytes) noexcept;

  std::FILE* stat_{nullptr};
  std::FILE* status_{nullptr};
  bool owns_files_{true};
  long ticks_per_second_{100};
  std::uint64_t prev_ticks_{0};
  Clock::time_point prev_time_{};
  bool has_prev_{false};
};

}  // namespace replyd::governor
