#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>

#include "governor/power.hpp"
#include "governor/process_sensor.hpp"

namespace replyd::governor {

struct ResourceSample {
  std::uint64_t memory_bytes{0};
  float cpu_percent{0.0F};
  bool valid{false};
};

struct GovernorOptions {
  // CPU percent is averaged over at least this window.
  std::chrono::milliseconds cpu_window{250};
};

struct GovernorStats {
  std::uint64_t samples{0};
  std::uint64_t sample_failures{0};
  std::uint64_t low_power_entries{0};
  std::uint64_t normal_power_entries{0};
  std::uint64_t power_failures{0};
  std::uint64_t reclaim_passes{0};
};

class ResourceGovernor {
 public:
  explicit ResourceGovernor(GovernorOptions options = {},
                            std::unique_ptr<PowerController> power = make_posix_power_controller(),
                            std::unique_ptr<ProcessSensor> sensor = std::make_unique<ProcessSensor>());

  ResourceGovernor(const ResourceGovernor&) = delete;
  ResourceGovernor& operator=(const ResourceGovernor&) = delete;

  void enter_low_power();
  void enter_normal_power();

  ResourceSample sample();
  [[nodiscard]] ResourceSample last_sample() const;

  // Returns freed heap pages to the OS. Best-effort.
  bool reclaim_memory();

  [[nodiscard]] bool low_power() const;
  [[nodiscard]] GovernorStats stats() const;

 private:
  GovernorOptions options_;
  std::unique_ptr<PowerController> power_;
  std::unique_ptr<ProcessSensor> sensor_;

  mutable std::mutex mutex_;
  ResourceSample last_sample_{};
  GovernorStats stats_{};
  bool low_power_{false};
  bool power_was_ok_{true};
};

}  // namespace replyd::governor
