#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include <nlohmann/json.hpp>

#include "core/sampler.hpp"
#include "governor/resource_governor.hpp"
#include "llm/lifecycle_manager.hpp"
#include "store/persistence_store.hpp"

namespace replyd::learning {

enum class LearningTask : std::uint8_t {
  PatternAnalysis = 0,
  StorageCleanup = 1,
  FeedbackAggregation = 2,
  SummaryWarmup = 3,
};

inline constexpr std::uint64_t kLearningTaskCount = 4;

const char* to_string(LearningTask task) noexcept;

enum class SlotOutcome : std::uint8_t {
  Ran = 0,
  SkippedModelActive,
  SkippedResources,
  Failed,
};

const char* to_string(SlotOutcome outcome) noexcept;

struct SlotResult {
  LearningTask task{LearningTask::PatternAnalysis};
  SlotOutcome outcome{SlotOutcome::Ran};
};

struct SchedulerOptions {
  // Full rotation; each task gets one quarter of it.
  std::chrono::milliseconds period{std::chrono::seconds(120)};
  std::uint64_t max_memory_bytes{100ULL * 1024ULL * 1024ULL};
  float max_cpu_percent{2.0F};
};

struct SchedulerStats {
  std::uint64_t runs{0};
  std::uint64_t skipped_model_active{0};
  std::uint64_t skipped_resources{0};
  std::uint64_t failures{0};
};

using ModelStateProbe = std::function<llm::SlotState()>;

// Runs maintenance and analysis over the store on a fixed cadence, only
// while the model is unloaded and the process is quiet. A skipped slot is
// dropped, never queued.
class BackgroundLearningScheduler {
 public:
  BackgroundLearningScheduler(SchedulerOptions options, store::PersistenceStore& store,
                              governor::ResourceGovernor& governor, ModelStateProbe model_state);
  ~BackgroundLearningScheduler();

  BackgroundLearningScheduler(const BackgroundLearningScheduler&) = delete;
  BackgroundLearningScheduler& operator=(const BackgroundLearningScheduler&) = delete;

  void start();
  void stop();
  [[nodiscard]] bool running() const;

  // Executes the next slot of the rotation immediately.
  SlotResult run_once();

  [[nodiscard]] SchedulerStats stats() const;
  [[nodiscard]] nlohmann::json latest_insights() const;
  [[nodiscard]] std::chrono::milliseconds slot_period() const noexcept;

 private:
  void loop();
  void run_task(LearningTask task);

  SchedulerOptions options_;
  store::PersistenceStore& store_;
  governor::ResourceGovernor& governor_;
  ModelStateProbe model_state_;

  std::mutex run_mutex_;
  core::Sampler rotation_{};

  mutable std::mutex data_mutex_;
  SchedulerStats stats_{};
  nlohmann::json insights_ = nlohmann::json::object();

  std::thread worker_;
  mutable std::mutex worker_mutex_;
  std::condition_variable worker_cv_;
  bool stop_requested_{false};
};

}  // namespace replyd::learning
