#include "governor/resource_governor.hpp"

#include <iostream>
#include <thread>
#include <utility>

#include <malloc.h>

namespace replyd::governor {

ResourceGovernor::ResourceGovernor(GovernorOptions options, std::unique_ptr<PowerController> power,
                                   std::unique_ptr<ProcessSensor> sensor)
    : options_(options), power_(std::move(power)), sensor_(std::move(sensor)) {
  if (power_ == nullptr) {
    power_ = make_noop_power_controller();
  }
  std::cerr << "[governor] power controller: " << power_->name() << '\n';
}

void ResourceGovernor::enter_low_power() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool ok = power_->enter_low_power();
  ++stats_.low_power_entries;
  low_power_ = true;
  if (!ok) {
    ++stats_.power_failures;
    if (power_was_ok_) {
      std::cerr << "[governor] low power hints not fully applied; continuing without them\n";
    }
  } else {
    std::cerr << "[governor] entered low power mode\n";
  }
  power_was_ok_ = ok;
}

void ResourceGovernor::enter_normal_power() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool ok = power_->enter_normal_power();
  ++stats_.normal_power_entries;
  low_power_ = false;
  if (!ok) {
    ++stats_.power_failures;
    if (power_was_ok_) {
      std::cerr << "[governor] normal power hints not fully applied; continuing without them\n";
    }
  } else {
    std::cerr << "[governor] restored normal power mode\n";
  }
  power_was_ok_ = ok;
}

ResourceSample ResourceGovernor::sample() {
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.samples;

  ResourceSample result{};
  if (sensor_ == nullptr) {
    ++stats_.sample_failures;
    last_sample_ = result;
    return result;
  }

  // Take a fresh baseline when the previous reading is stale so the CPU
  // figure always covers a short, recent window.
  auto now = ProcessSensor::Clock::now();
  ProcessUsage usage{};
  if (!sensor_->has_baseline() || now - sensor_->baseline_time() > 4 * options_.cpu_window) {
    sensor_->reset_baseline();
    (void)sensor_->sample(now, usage);
    if (options_.cpu_window.count() > 0) {
      std::this_thread::sleep_for(options_.cpu_window);
    }
    now = ProcessSensor::Clock::now();
  } else if (now - sensor_->baseline_time() < options_.cpu_window) {
    std::this_thread::sleep_for(options_.cpu_window - (now - sensor_->baseline_time()));
    now = ProcessSensor::Clock::now();
  }

  const bool ok = sensor_->sample(now, usage);
  if (!ok) {
    ++stats_.sample_failures;
  }

  result.memory_bytes = usage.rss_bytes;
  result.cpu_percent = usage.cpu_valid ? usage.cpu_percent : 0.0F;
  result.valid = ok && usage.cpu_valid;
  last_sample_ = result;
  return result;
}

ResourceSample ResourceGovernor::last_sample() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_sample_;
}

bool ResourceGovernor::reclaim_memory() {
  const bool released = ::malloc_trim(0) != 0;
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.reclaim_passes;
  return released;
}

bool ResourceGovernor::low_power() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return low_power_;
}

GovernorStats ResourceGovernor::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace replyd::governor
