#include "sinks/stdout_debug.hpp"

namespace replyd::sinks {
namespace {

const char* slot_name(const telemetry::slot_state state) {
  switch (state) {
    case telemetry::slot_state::UNLOADED:
      return "unloaded";
    case telemetry::slot_state::LOADING:
      return "loading";
    case telemetry::slot_state::LOADED:
      return "loaded";
    case telemetry::slot_state::EVICTING:
      return "evicting";
  }
  return "unknown";
}

const char* health_name(const telemetry::storage_health health) {
  switch (health) {
    case telemetry::storage_health::HEALTHY:
      return "healthy";
    case telemetry::storage_health::WARNING:
      return "warning";
    case telemetry::storage_health::CRITICAL:
      return "critical";
  }
  return "unknown";
}

}  // namespace

void StdoutDebugSink::publish(const telemetry::service_frame& frame) const {
  std::fprintf(out_,
               "[frame] model=%s gen=%llu idle_s=%.1f unload_in_s=%.1f rss_mb=%.1f cpu_pct=%.2f "
               "storage=%s usage_pct=%.2f samples=%u pairs=%u learning_runs=%u\n",
               slot_name(frame.slot), static_cast<unsigned long long>(frame.load_generation), frame.idle_s,
               frame.unload_in_s, frame.rss_mb, frame.cpu_pct, health_name(frame.storage), frame.storage_usage_pct,
               frame.samples, frame.training_pairs, frame.learning_runs);
  std::fflush(out_);
}

}  // namespace replyd::sinks
