#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/sampler.hpp"
#include "governor/resource_governor.hpp"
#include "learning/background_scheduler.hpp"
#include "llm/lifecycle_manager.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "store/persistence_store.hpp"
#include "telemetry/service_frame.hpp"

namespace replyd::core {

struct ServiceStats {
  std::size_t ticks_executed{0};
  std::size_t model_cycles{0};
  std::size_t resource_cycles{0};
  std::size_t storage_cycles{0};
  std::size_t sink_cycles{0};
};

struct ServiceDependencies {
  llm::BackendFactory backend_factory{};
  std::unique_ptr<governor::PowerController> power{};
  std::unique_ptr<governor::ProcessSensor> sensor{};
};

// Owns every component and drives the telemetry loop. The HTTP layer talks
// to the components through the accessors.
class Service {
 public:
  static constexpr std::uint64_t kResourceEveryTicks = 5;
  static constexpr std::uint64_t kStorageEveryTicks = 10;

  Service(ServiceConfig config, ServiceDependencies deps);
  ~Service();

  Service(const Service&) = delete;
  Service& operator=(const Service&) = delete;

  ServiceStats run_for_ticks(std::size_t total_ticks);

  // Records the incoming email as a pattern, then generates. A missing retry
  // prompt is derived from the start of the email.
  llm::GenerationResult generate_reply(const std::string& email, const std::string& prompt,
                                       llm::GenerationParams params = {});

  void shutdown();

  [[nodiscard]] llm::ModelLifecycleManager& model() noexcept { return manager_; }
  [[nodiscard]] store::PersistenceStore& store() noexcept { return store_; }
  [[nodiscard]] learning::BackgroundLearningScheduler& learning() noexcept { return scheduler_; }
  [[nodiscard]] governor::ResourceGovernor& resources() noexcept { return governor_; }
  [[nodiscard]] const telemetry::service_frame& frame() const noexcept { return frame_; }

 private:
  void collect_model(ServiceStats& stats);
  void collect_resources(ServiceStats& stats);
  void collect_storage(ServiceStats& stats);
  void publish_sinks(ServiceStats& stats);
  void update_agent_health(float actual_period_ms, float compute_time_ms);

  ServiceConfig config_;
  governor::ResourceGovernor governor_;
  store::PersistenceStore store_;
  llm::ModelLifecycleManager manager_;
  learning::BackgroundLearningScheduler scheduler_;

  std::chrono::milliseconds tick_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::optional<std::chrono::steady_clock::time_point> previous_cycle_start_{};
  Sampler sampler_{};
  telemetry::service_frame frame_{};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
  bool storage_was_ok_{true};
  bool stopped_{false};
};

}  // namespace replyd::core
