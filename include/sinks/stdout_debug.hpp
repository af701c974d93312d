#pragma once

#include <cstdio>

#include "telemetry/service_frame.hpp"

namespace replyd::sinks {

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) : out_(out) {}

  void publish(const telemetry::service_frame& frame) const;

 private:
  std::FILE* out_;
};

}  // namespace replyd::sinks
