#include "governor/power.hpp"

#include <memory>

namespace replyd::governor {
namespace {

class NoopPowerController final : public PowerController {
 public:
  bool enter_low_power() override { return true; }
  bool enter_normal_power() override { return true; }
  const char* name() const override { return "noop"; }
};

}  // namespace

std::unique_ptr<PowerController> make_noop_power_controller() { return std::make_unique<NoopPowerController>(); }

}  // namespace replyd::governor
