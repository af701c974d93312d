#include <chrono>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>

#include <unistd.h>

#include "governor/power.hpp"
#include "governor/process_sensor.hpp"
#include "governor/resource_governor.hpp"

using replyd::governor::GovernorOptions;
using replyd::governor::PowerController;
using replyd::governor::ProcessSensor;
using replyd::governor::ProcessUsage;
using replyd::governor::ResourceGovernor;
using replyd::governor::ResourceSample;

namespace {

bool almost_equal(float a, float b, float eps = 1e-3F) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool write_temp_file(std::FILE* file, const std::string& content) {
  if (file == nullptr) {
    return false;
  }
  const int fd = fileno(file);
  if (fd < 0 || ftruncate(fd, 0) != 0) {
    return false;
  }
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }
  if (!content.empty() && std::fwrite(content.data(), 1, content.size(), file) != content.size()) {
    return false;
  }
  std::fflush(file);
  return std::fseek(file, 0L, SEEK_SET) == 0;
}

std::string stat_line(const char* comm, unsigned utime, unsigned stime) {
  return "4242 (" + std::string(comm) + ") S 1 4242 4242 0 -1 4194560 120 0 0 0 " + std::to_string(utime) + " " +
         std::to_string(stime) + " 0 0 20 0 3 0 100 0 0\n";
}

std::string status_text(unsigned rss_kb) {
  return "Name:\treplyd\nState:\tS (sleeping)\nVmPeak:\t  900000 kB\nVmRSS:\t  " + std::to_string(rss_kb) +
         " kB\nThreads:\t3\n";
}

class RecordingPowerController final : public PowerController {
 public:
  RecordingPowerController(int* low_calls, int* normal_calls, bool succeed)
      : low_calls_(low_calls), normal_calls_(normal_calls), succeed_(succeed) {}

  bool enter_low_power() override {
    ++*low_calls_;
    return succeed_;
  }
  bool enter_normal_power() override {
    ++*normal_calls_;
    return succeed_;
  }
  const char* name() const override { return "recording"; }

 private:
  int* low_calls_;
  int* normal_calls_;
  bool succeed_;
};

int test_process_sensor_rss_and_cpu_delta() {
  std::FILE* stat = std::tmpfile();
  std::FILE* status = std::tmpfile();
  if (!write_temp_file(stat, stat_line("replyd", 100, 50)) || !write_temp_file(status, status_text(2048))) {
    return fail("test_process_sensor_rss_and_cpu_delta", "failed writing temp proc files");
  }

  ProcessSensor sensor(stat, status, true, 100);
  const auto t0 = ProcessSensor::Clock::now();
  ProcessUsage usage{};
  if (!sensor.sample(t0, usage)) {
    return fail("test_process_sensor_rss_and_cpu_delta", "baseline sample should succeed");
  }
  if (usage.rss_bytes != 2048ULL * 1024ULL) {
    return fail("test_process_sensor_rss_and_cpu_delta", "VmRSS should be parsed in bytes");
  }
  if (usage.cpu_valid || !sensor.has_baseline()) {
    return fail("test_process_sensor_rss_and_cpu_delta", "first sample should only record a baseline");
  }

  // 100 ticks over two seconds at 100 ticks/s is half a core.
  if (!write_temp_file(stat, stat_line("replyd", 150, 100))) {
    return fail("test_process_sensor_rss_and_cpu_delta", "failed rewriting stat");
  }
  if (!sensor.sample(t0 + std::chrono::seconds(2), usage) || !usage.cpu_valid) {
    return fail("test_process_sensor_rss_and_cpu_delta", "second sample should produce cpu percent");
  }
  if (!almost_equal(usage.cpu_percent, 50.0F)) {
    return fail("test_process_sensor_rss_and_cpu_delta", "cpu percent mismatch");
  }
  return 0;
}

int test_process_sensor_comm_with_spaces_and_counter_reset() {
  std::FILE* stat = std::tmpfile();
  std::FILE* status = std::tmpfile();
  if (!write_temp_file(stat, stat_line("llama (worker) 1", 500, 500)) || !write_temp_file(status, status_text(10))) {
    return fail("test_process_sensor_comm_with_spaces_and_counter_reset", "failed writing temp proc files");
  }

  ProcessSensor sensor(stat, status, true, 100);
  const auto t0 = ProcessSensor::Clock::now();
  ProcessUsage usage{};
  (void)sensor.sample(t0, usage);

  if (!write_temp_file(stat, stat_line("llama (worker) 1", 520, 480))) {
    return fail("test_process_sensor_comm_with_spaces_and_counter_reset", "failed rewriting stat");
  }
  if (!sensor.sample(t0 + std::chrono::seconds(1), usage) || !almost_equal(usage.cpu_percent, 0.0F)) {
    return fail("test_process_sensor_comm_with_spaces_and_counter_reset", "equal tick totals should read as idle");
  }

  if (!write_temp_file(stat, stat_line("llama (worker) 1", 10, 10))) {
    return fail("test_process_sensor_comm_with_spaces_and_counter_reset", "failed rewriting stat");
  }
  if (!sensor.sample(t0 + std::chrono::seconds(2), usage) || usage.cpu_percent != 0.0F) {
    return fail("test_process_sensor_comm_with_spaces_and_counter_reset", "counter going backwards must not underflow");
  }
  return 0;
}

int test_process_sensor_missing_rss_reports_failure() {
  std::FILE* stat = std::tmpfile();
  std::FILE* status = std::tmpfile();
  if (!write_temp_file(stat, stat_line("replyd", 1, 1)) || !write_temp_file(status, "Name:\treplyd\nThreads:\t1\n")) {
    return fail("test_process_sensor_missing_rss_reports_failure", "failed writing temp proc files");
  }

  ProcessSensor sensor(stat, status, true, 100);
  ProcessUsage usage{};
  if (sensor.sample(ProcessSensor::Clock::now(), usage)) {
    return fail("test_process_sensor_missing_rss_reports_failure", "missing VmRSS must fail the sample");
  }
  if (usage.rss_bytes != 0 || !sensor.has_baseline()) {
    return fail("test_process_sensor_missing_rss_reports_failure", "cpu baseline should still be recorded");
  }

  ProcessSensor unreadable(nullptr, nullptr, false, 100);
  if (unreadable.sample(ProcessSensor::Clock::now(), usage)) {
    return fail("test_process_sensor_missing_rss_reports_failure", "null files must fail the sample");
  }
  return 0;
}

int test_governor_sample_covers_cpu_window() {
  std::FILE* stat = std::tmpfile();
  std::FILE* status = std::tmpfile();
  if (!write_temp_file(stat, stat_line("replyd", 7, 3)) || !write_temp_file(status, status_text(4096))) {
    return fail("test_governor_sample_covers_cpu_window", "failed writing temp proc files");
  }

  GovernorOptions options{};
  options.cpu_window = std::chrono::milliseconds(5);
  ResourceGovernor governor(options, replyd::governor::make_noop_power_controller(),
                            std::make_unique<ProcessSensor>(stat, status, true, 100));

  const ResourceSample sample = governor.sample();
  if (!sample.valid) {
    return fail("test_governor_sample_covers_cpu_window", "sample with readable files should be valid");
  }
  if (sample.memory_bytes != 4096ULL * 1024ULL || sample.cpu_percent != 0.0F) {
    return fail("test_governor_sample_covers_cpu_window", "sample values mismatch");
  }

  if (!write_temp_file(status, status_text(8192))) {
    return fail("test_governor_sample_covers_cpu_window", "failed rewriting status");
  }
  const ResourceSample second = governor.sample();
  if (!second.valid || second.memory_bytes != 8192ULL * 1024ULL) {
    return fail("test_governor_sample_covers_cpu_window", "second sample should see the new rss");
  }
  if (governor.last_sample().memory_bytes != second.memory_bytes || governor.stats().samples != 2) {
    return fail("test_governor_sample_covers_cpu_window", "last sample and counters should track sample()");
  }
  return 0;
}

int test_governor_without_sensor_reports_invalid() {
  ResourceGovernor governor(GovernorOptions{}, replyd::governor::make_noop_power_controller(), nullptr);
  const ResourceSample sample = governor.sample();
  if (sample.valid || governor.stats().sample_failures != 1) {
    return fail("test_governor_without_sensor_reports_invalid", "missing sensor must yield an invalid sample");
  }
  return 0;
}

int test_governor_power_modes_are_best_effort() {
  int low_calls = 0;
  int normal_calls = 0;
  ResourceGovernor governor(GovernorOptions{},
                            std::make_unique<RecordingPowerController>(&low_calls, &normal_calls, false), nullptr);

  governor.enter_low_power();
  if (!governor.low_power() || low_calls != 1) {
    return fail("test_governor_power_modes_are_best_effort", "low power should be entered even when hints fail");
  }
  governor.enter_normal_power();
  if (governor.low_power() || normal_calls != 1) {
    return fail("test_governor_power_modes_are_best_effort", "normal power should be restored");
  }

  const auto stats = governor.stats();
  if (stats.low_power_entries != 1 || stats.normal_power_entries != 1 || stats.power_failures != 2) {
    return fail("test_governor_power_modes_are_best_effort", "power counters mismatch");
  }

  (void)governor.reclaim_memory();
  if (governor.stats().reclaim_passes != 1) {
    return fail("test_governor_power_modes_are_best_effort", "reclaim pass should be counted");
  }
  return 0;
}

int test_governor_null_power_falls_back_to_noop() {
  ResourceGovernor governor(GovernorOptions{}, nullptr, nullptr);
  governor.enter_low_power();
  governor.enter_normal_power();
  if (governor.stats().power_failures != 0) {
    return fail("test_governor_null_power_falls_back_to_noop", "noop controller should always succeed");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_process_sensor_rss_and_cpu_delta(); rc != 0) return rc;
  if (int rc = test_process_sensor_comm_with_spaces_and_counter_reset(); rc != 0) return rc;
  if (int rc = test_process_sensor_missing_rss_reports_failure(); rc != 0) return rc;
  if (int rc = test_governor_sample_covers_cpu_window(); rc != 0) return rc;
  if (int rc = test_governor_without_sensor_reports_invalid(); rc != 0) return rc;
  if (int rc = test_governor_power_modes_are_best_effort(); rc != 0) return rc;
  if (int rc = test_governor_null_power_falls_back_to_noop(); rc != 0) return rc;

  std::cout << "[PASS] governor unit tests\n";
  return 0;
}
