#pragma once

#include <algorithm>

namespace replyd::core {

inline constexpr double clamp_unit_weight(const double value) noexcept {
  return std::clamp(value, -1.0, 1.0);
}

}  // namespace replyd::core
