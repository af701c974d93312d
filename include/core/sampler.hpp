#pragma once

#include <cstdint>

namespace replyd::core {

class Sampler {
 public:
  Sampler() = default;

  [[nodiscard]] std::uint64_t tick() const noexcept;

  [[nodiscard]] bool should_sample_every(std::uint64_t every_n_ticks) const noexcept;

  // Round-robin slot for the current tick; 0 when there are no slots.
  [[nodiscard]] std::uint64_t rotation_slot(std::uint64_t slot_count) const noexcept;

  void advance() noexcept;

 private:
  std::uint64_t tick_count_{0};
};

}  // namespace replyd::core
