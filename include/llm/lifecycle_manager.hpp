#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "governor/resource_governor.hpp"
#include "llm/backend.hpp"
#include "llm/model_locator.hpp"

namespace replyd::llm {

enum class SlotState : std::uint8_t {
  Unloaded = 0,
  Loading = 1,
  Loaded = 2,
  Evicting = 3,
};

const char* to_string(SlotState state) noexcept;

enum class EvictReason : std::uint8_t {
  Explicit,
  Idle,
  Reload,
  Shutdown,
};

struct ManagerOptions {
  LoadProfile profile{};
  std::chrono::milliseconds idle_unload{std::chrono::seconds(60)};
  std::chrono::milliseconds soft_idle{std::chrono::seconds(30)};
  std::chrono::milliseconds monitor_interval{std::chrono::seconds(15)};
  std::uint64_t max_idle_memory_bytes{500ULL * 1024ULL * 1024ULL};
  float max_idle_cpu_percent{5.0F};
  std::chrono::milliseconds throttle_pause{std::chrono::seconds(2)};
  std::size_t min_reply_chars{5};
};

struct LoadResult {
  bool ok{false};
  ModelError error{ModelError::None};
  std::string message{};
};

struct GenerationResult {
  std::string text{};
  std::chrono::milliseconds elapsed{0};
  ModelError error{ModelError::None};
  std::string message{};
  bool retried{false};

  [[nodiscard]] bool ok() const noexcept { return error == ModelError::None; }
};

struct ManagerStatus {
  bool model_loaded{false};
  SlotState state{SlotState::Unloaded};
  std::uint64_t load_generation{0};
  std::uint64_t memory_bytes{0};
  float cpu_percent{0.0F};
  double idle_seconds{0.0};
  double will_unload_in_seconds{0.0};
};

struct ManagerStats {
  std::uint64_t loads_attempted{0};
  std::uint64_t loads_succeeded{0};
  std::uint64_t loads_failed{0};
  std::uint64_t evictions_idle{0};
  std::uint64_t evictions_explicit{0};
  std::uint64_t evictions_reload{0};
  std::uint64_t inferences{0};
  std::uint64_t inference_failures{0};
  std::uint64_t retries{0};
  std::uint64_t reclaim_passes{0};
  std::uint64_t throttle_pauses{0};
};

// Owns the single model slot. ensure_loaded, generate, force_reload and
// unload all serialize on one slot mutex, so the backend is never entered
// concurrently and at most one load is in flight. The idle monitor reads the
// state tag and last-used time atomically and only try-locks the slot to
// evict, so it never waits behind an inference.
class ModelLifecycleManager {
 public:
  ModelLifecycleManager(ManagerOptions options, ModelLocator locator, BackendFactory factory,
                        governor::ResourceGovernor& governor);
  ~ModelLifecycleManager();

  ModelLifecycleManager(const ModelLifecycleManager&) = delete;
  ModelLifecycleManager& operator=(const ModelLifecycleManager&) = delete;

  bool ensure_loaded();
  GenerationResult generate(const std::string& prompt, const GenerationParams& params = {});
  LoadResult force_reload();
  void unload();

  // Evicts and joins the idle monitor. Safe to call more than once.
  void shutdown();

  ManagerStatus status();

  [[nodiscard]] SlotState state() const noexcept;
  [[nodiscard]] std::uint64_t load_generation() const noexcept;
  [[nodiscard]] ManagerStats stats() const;
  [[nodiscard]] LoadResult last_load_result() const;

 private:
  using Clock = std::chrono::steady_clock;

  LoadResult ensure_loaded_locked(std::uint64_t observed_attempts);
  LoadResult load_locked();
  void evict_locked(EvictReason reason);

  void start_monitor_locked();
  void join_monitor();
  void monitor_loop(std::uint64_t generation);
  bool wait_for_stop(std::chrono::milliseconds timeout);

  void touch() noexcept;
  [[nodiscard]] std::chrono::milliseconds idle_for() const noexcept;

  ManagerOptions options_;
  ModelLocator locator_;
  BackendFactory factory_;
  governor::ResourceGovernor& governor_;

  std::mutex slot_mutex_;
  std::unique_ptr<InferenceBackend> handle_;
  std::atomic<SlotState> state_{SlotState::Unloaded};
  std::atomic<std::int64_t> last_used_ns_{0};
  std::atomic<std::uint64_t> load_generation_{0};
  std::atomic<std::uint64_t> load_attempts_{0};

  mutable std::mutex stats_mutex_;
  ManagerStats stats_{};
  LoadResult last_load_{};

  std::thread monitor_;
  std::mutex monitor_mutex_;
  std::condition_variable monitor_cv_;
  bool monitor_stop_{false};
};

}  // namespace replyd::llm
