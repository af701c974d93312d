#pragma once

#include <memory>

namespace replyd::governor {

// OS priority/affinity hints. Implementations are best-effort: a false return
// means at least one hint could not be applied, never that the process is in
// an unusable state.
class PowerController {
 public:
  virtual bool enter_low_power() = 0;
  virtual bool enter_normal_power() = 0;
  virtual const char* name() const = 0;
  virtual ~PowerController() = default;
};

std::unique_ptr<PowerController> make_posix_power_controller();
std::unique_ptr<PowerController> make_noop_power_controller();

}  // namespace replyd::governor
