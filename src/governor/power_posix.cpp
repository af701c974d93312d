#include "governor/power.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <sched.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>

namespace replyd::governor {
namespace {

constexpr int kLowPowerNice = 19;
constexpr int kNormalNice = 0;

// Linux applies nice values and affinity per thread, so every task of the
// process is visited; threads spawned afterwards inherit from their creator.
std::vector<pid_t> process_tasks() {
  std::vector<pid_t> tasks;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/task", ec)) {
    char* end = nullptr;
    const std::string name = entry.path().filename().string();
    const long tid = std::strtol(name.c_str(), &end, 10);
    if (end != name.c_str() && *end == '\0' && tid > 0) {
      tasks.push_back(static_cast<pid_t>(tid));
    }
  }
  if (tasks.empty()) {
    tasks.push_back(0);
  }
  return tasks;
}

class PosixPowerController final : public PowerController {
 public:
  PosixPowerController() {
    CPU_ZERO(&original_mask_);
    has_original_mask_ = ::sched_getaffinity(0, sizeof(original_mask_), &original_mask_) == 0;
    if (!has_original_mask_) {
      std::cerr << "[governor] sched_getaffinity failed: " << std::strerror(errno) << '\n';
    }
  }

  bool enter_low_power() override {
    bool ok = apply_nice(kLowPowerNice);

    if (has_original_mask_) {
      cpu_set_t single{};
      CPU_ZERO(&single);
      for (int cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
        if (CPU_ISSET(cpu, &original_mask_)) {
          CPU_SET(cpu, &single);
          break;
        }
      }
      ok = apply_affinity(single) && ok;
    }
    return ok;
  }

  bool enter_normal_power() override {
    bool ok = apply_nice(kNormalNice);
    if (has_original_mask_) {
      ok = apply_affinity(original_mask_) && ok;
    }
    return ok;
  }

  const char* name() const override { return "posix"; }

 private:
  static bool apply_nice(const int nice_value) {
    bool ok = true;
    for (const pid_t tid : process_tasks()) {
      if (::setpriority(PRIO_PROCESS, static_cast<id_t>(tid), nice_value) != 0) {
        std::cerr << "[governor] setpriority(" << nice_value << ") failed for task " << tid << ": "
                  << std::strerror(errno) << '\n';
        ok = false;
      }
    }
    return ok;
  }

  static bool apply_affinity(const cpu_set_t& mask) {
    bool ok = true;
    for (const pid_t tid : process_tasks()) {
      if (::sched_setaffinity(tid, sizeof(mask), &mask) != 0) {
        std::cerr << "[governor] sched_setaffinity failed for task " << tid << ": " << std::strerror(errno) << '\n';
        ok = false;
      }
    }
    return ok;
  }

  cpu_set_t original_mask_{};
  bool has_original_mask_{false};
};

}  // namespace

std::unique_ptr<PowerController> make_posix_power_controller() { return std::make_unique<PosixPowerController>(); }

}  // namespace replyd::governor
