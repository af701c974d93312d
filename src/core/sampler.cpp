#include "core/sampler.hpp"

namespace replyd::core {

std::uint64_t Sampler::tick() const noexcept { return tick_count_; }

bool Sampler::should_sample_every(const std::uint64_t every_n_ticks) const noexcept {
  if (every_n_ticks == 0) {
    return false;
  }
  return (tick_count_ % every_n_ticks) == 0;
}

std::uint64_t Sampler::rotation_slot(const std::uint64_t slot_count) const noexcept {
  if (slot_count == 0) {
    return 0;
  }
  return tick_count_ % slot_count;
}

void Sampler::advance() noexcept { ++tick_count_; }

}  // namespace replyd::core
