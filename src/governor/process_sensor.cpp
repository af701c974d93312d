#include "governor/process_sensor.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace replyd::governor {

ProcessSensor::ProcessSensor()
    : stat_(std::fopen("/proc/self/stat", "r")),
      status_(std::fopen("/proc/self/status", "r")),
      owns_files_(true),
      ticks_per_second_(::sysconf(_SC_CLK_TCK)) {
  if (ticks_per_second_ <= 0) {
    ticks_per_second_ = 100;
  }
}

ProcessSensor::ProcessSensor(std::FILE* stat, std::FILE* status, const bool owns_files, const long ticks_per_second)
    : stat_(stat), status_(status), owns_files_(owns_files), ticks_per_second_(ticks_per_second > 0 ? ticks_per_second : 100) {}

ProcessSensor::~ProcessSensor() {
  if (owns_files_ && stat_ != nullptr) {
    std::fclose(stat_);
    stat_ = nullptr;
  }
  if (owns_files_ && status_ != nullptr) {
    std::fclose(status_);
    status_ = nullptr;
  }
}

bool ProcessSensor::sample(const Clock::time_point now, ProcessUsage& usage) noexcept {
  usage.cpu_valid = false;
  usage.cpu_percent = 0.0F;

  const bool rss_ok = read_rss_bytes(usage.rss_bytes);
  if (!rss_ok) {
    usage.rss_bytes = 0;
  }

  std::uint64_t ticks = 0;
  if (!read_cpu_ticks(ticks)) {
    return false;
  }

  if (!has_prev_) {
    has_prev_ = true;
    prev_ticks_ = ticks;
    prev_time_ = now;
    return rss_ok;
  }

  const std::uint64_t tick_delta = ticks >= prev_ticks_ ? (ticks - prev_ticks_) : 0;
  const auto wall = std::chrono::duration_cast<std::chrono::duration<double>>(now - prev_time_).count();

  prev_ticks_ = ticks;
  prev_time_ = now;

  if (wall <= 0.0) {
    return rss_ok;
  }

  const double cpu_seconds = static_cast<double>(tick_delta) / static_cast<double>(ticks_per_second_);
  usage.cpu_percent = static_cast<float>((cpu_seconds / wall) * 100.0);
  usage.cpu_valid = true;
  return rss_ok;
}

void ProcessSensor::reset_baseline() noexcept {
  has_prev_ = false;
  prev_ticks_ = 0;
}

bool ProcessSensor::has_baseline() const noexcept { return has_prev_; }

ProcessSensor::Clock::time_point ProcessSensor::baseline_time() const noexcept { return prev_time_; }

bool ProcessSensor::read_cpu_ticks(std::uint64_t& ticks) noexcept {
  if (stat_ == nullptr) {
    return false;
  }

  if (std::fseek(stat_, 0L, SEEK_SET) != 0) {
    return false;
  }

  char buffer[kReadBufferSize]{};
  if (std::fgets(buffer, static_cast<int>(sizeof(buffer)), stat_) == nullptr) {
    std::clearerr(stat_);
    return false;
  }

  // comm may contain spaces and parentheses; fields resume after the last ')'.
  const char* cursor = std::strrchr(buffer, ')');
  if (cursor == nullptr) {
    return false;
  }
  ++cursor;

  // Fields after comm start at 3 (state); utime is 14 and stime is 15.
  constexpr int kUtimeIndex = 11;
  constexpr int kStimeIndex = 12;
  std::uint64_t utime = 0;
  std::uint64_t stime = 0;
  for (int field = 0; field <= kStimeIndex; ++field) {
    while (*cursor == ' ') {
      ++cursor;
    }
    if (*cursor == '\0' || *cursor == '\n') {
      return false;
    }

    if (field == kUtimeIndex || field == kStimeIndex) {
      char* end = nullptr;
      errno = 0;
      const unsigned long long parsed = std::strtoull(cursor, &end, 10);
      if (errno != 0 || end == cursor) {
        return false;
      }
      (field == kUtimeIndex ? utime : stime) = parsed;
      cursor = end;
      continue;
    }

    while (*cursor != ' ' && *cursor != '\0' && *cursor != '\n') {
      ++cursor;
    }
  }

  ticks = utime + stime;
  return true;
}

bool ProcessSensor::read_rss_bytes(std::uint64_t& bytes) noexcept {
  if (status_ == nullptr) {
    return false;
  }

  if (std::fseek(status_, 0L, SEEK_SET) != 0) {
    return false;
  }

  bool found = false;
  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), status_) != nullptr) {
    if (std::strncmp(buffer, "VmRSS:", 6) != 0) {
      continue;
    }
    unsigned long long kb = 0;
    if (std::sscanf(buffer + 6, " %llu", &kb) == 1) {
      bytes = kb * 1024ULL;
      found = true;
    }
    break;
  }

  if (std::ferror(status_) != 0) {
    std::clearerr(status_);
    return false;
  }

  return found;
}

}  // namespace replyd::governor
