#pragma once

#include <chrono>
#include <cstdint>

namespace replyd::core {

inline std::uint64_t monotonic_timestamp_now_ns() {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

// Row timestamps in the store are whole unix seconds.
inline std::int64_t unix_timestamp_now_s() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace replyd::core
