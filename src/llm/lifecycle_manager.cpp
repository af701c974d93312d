#include "llm/lifecycle_manager.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <utility>

namespace replyd::llm {
namespace {

std::string trim_ws(const std::string& value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return value.substr(begin, end - begin);
}

double to_seconds(const std::chrono::milliseconds value) {
  return std::chrono::duration_cast<std::chrono::duration<double>>(value).count();
}

}  // namespace

const char* to_string(const ModelError error) noexcept {
  switch (error) {
    case ModelError::None:
      return "none";
    case ModelError::ModelUnavailable:
      return "model_unavailable";
    case ModelError::ModelLoadFailed:
      return "model_load_failed";
    case ModelError::ContextWindowExceeded:
      return "context_window_exceeded";
    case ModelError::InferenceFailed:
      return "inference_failed";
  }
  return "unknown";
}

const char* to_string(const SlotState state) noexcept {
  switch (state) {
    case SlotState::Unloaded:
      return "unloaded";
    case SlotState::Loading:
      return "loading";
    case SlotState::Loaded:
      return "loaded";
    case SlotState::Evicting:
      return "evicting";
  }
  return "unknown";
}

ModelLifecycleManager::ModelLifecycleManager(ManagerOptions options, ModelLocator locator, BackendFactory factory,
                                             governor::ResourceGovernor& governor)
    : options_(std::move(options)), locator_(std::move(locator)), factory_(std::move(factory)), governor_(governor) {}

ModelLifecycleManager::~ModelLifecycleManager() { shutdown(); }

bool ModelLifecycleManager::ensure_loaded() {
  const std::uint64_t observed = load_attempts_.load();
  std::lock_guard<std::mutex> lock(slot_mutex_);
  return ensure_loaded_locked(observed).ok;
}

GenerationResult ModelLifecycleManager::generate(const std::string& prompt, const GenerationParams& params) {
  GenerationResult result{};
  if (trim_ws(prompt).empty()) {
    result.error = ModelError::InferenceFailed;
    result.message = "empty prompt";
    return result;
  }

  const std::uint64_t observed = load_attempts_.load();
  std::lock_guard<std::mutex> lock(slot_mutex_);

  const LoadResult load = ensure_loaded_locked(observed);
  if (!load.ok) {
    result.error = load.error;
    result.message = load.message;
    return result;
  }

  const auto start = Clock::now();
  try {
    result.text = trim_ws(handle_->infer(prompt, params));

    if (result.text.size() < options_.min_reply_chars && !params.retry_prompt.empty()) {
      GenerationParams retry = params;
      retry.max_tokens = params.retry_max_tokens;
      retry.temperature = params.retry_temperature;
      retry.stop = {"\n"};
      result.retried = true;
      {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        ++stats_.retries;
      }
      // The first reply stands if the retry fails.
      try {
        const std::string second = trim_ws(handle_->infer(params.retry_prompt, retry));
        if (second.size() >= options_.min_reply_chars) {
          result.text = second;
        }
      } catch (const std::exception& ex) {
        std::cerr << "[model] retry failed; keeping first reply: " << ex.what() << '\n';
      }
    }
  } catch (const ContextWindowError& ex) {
    result.error = ModelError::ContextWindowExceeded;
    result.message = ex.what();
    std::cerr << "[model] context window exceeded: " << ex.what() << '\n';
  } catch (const std::exception& ex) {
    result.error = ModelError::InferenceFailed;
    result.message = ex.what();
    std::cerr << "[model] inference failed: " << ex.what() << '\n';
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
  touch();

  std::lock_guard<std::mutex> stats_lock(stats_mutex_);
  ++stats_.inferences;
  if (!result.ok()) {
    ++stats_.inference_failures;
  }
  return result;
}

LoadResult ModelLifecycleManager::force_reload() {
  std::lock_guard<std::mutex> lock(slot_mutex_);
  evict_locked(EvictReason::Reload);
  return load_locked();
}

void ModelLifecycleManager::unload() {
  std::lock_guard<std::mutex> lock(slot_mutex_);
  evict_locked(EvictReason::Explicit);
}

void ModelLifecycleManager::shutdown() {
  {
    std::lock_guard<std::mutex> lock(slot_mutex_);
    evict_locked(EvictReason::Shutdown);
  }
  join_monitor();
}

ManagerStatus ModelLifecycleManager::status() {
  const governor::ResourceSample sample = governor_.sample();

  ManagerStatus status{};
  status.state = state_.load();
  status.model_loaded = status.state == SlotState::Loaded;
  status.load_generation = load_generation_.load();
  status.memory_bytes = sample.memory_bytes;
  status.cpu_percent = sample.cpu_percent;

  if (last_used_ns_.load() != 0) {
    const auto idle = idle_for();
    status.idle_seconds = to_seconds(idle);
    if (status.model_loaded) {
      status.will_unload_in_seconds = std::max(0.0, to_seconds(options_.idle_unload - idle));
    }
  }
  return status;
}

SlotState ModelLifecycleManager::state() const noexcept { return state_.load(); }

std::uint64_t ModelLifecycleManager::load_generation() const noexcept { return load_generation_.load(); }

ManagerStats ModelLifecycleManager::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

LoadResult ModelLifecycleManager::last_load_result() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return last_load_;
}

LoadResult ModelLifecycleManager::ensure_loaded_locked(const std::uint64_t observed_attempts) {
  if (state_.load() == SlotState::Loaded && handle_ != nullptr) {
    touch();
    return LoadResult{true, ModelError::None, {}};
  }

  // A load finished while this caller waited on the slot: share its failure
  // instead of starting a second attempt.
  if (load_attempts_.load() != observed_attempts) {
    LoadResult previous = last_load_result();
    if (!previous.ok) {
      return previous;
    }
  }

  return load_locked();
}

LoadResult ModelLifecycleManager::load_locked() {
  LoadResult result{};
  {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    ++stats_.loads_attempted;
  }

  const auto path = locator_.resolve();
  if (!path.has_value()) {
    result.error = ModelError::ModelUnavailable;
    result.message = "model not found at " + locator_.expected_path().string();
    std::cerr << "[model] " << result.message << '\n';
  } else {
    state_.store(SlotState::Loading);
    std::cerr << "[model] loading " << path->string() << " (ctx=" << options_.profile.context_size
              << " threads=" << options_.profile.threads << ")\n";
    try {
      handle_ = factory_(path->string(), options_.profile);
      if (handle_ == nullptr) {
        throw ModelLoadError("backend factory returned no instance");
      }
      result.ok = true;
    } catch (const std::exception& ex) {
      handle_.reset();
      result.error = ModelError::ModelLoadFailed;
      result.message = ex.what();
      std::cerr << "[model] load failed: " << ex.what() << '\n';
    }
  }

  if (result.ok) {
    ++load_generation_;
    touch();
    state_.store(SlotState::Loaded);
    std::cerr << "[model] loaded (generation " << load_generation_.load() << ")\n";
    governor_.enter_low_power();
    start_monitor_locked();
  } else {
    state_.store(SlotState::Unloaded);
  }

  {
    std::lock_guard<std::mutex> stats_lock(stats_mutex_);
    if (result.ok) {
      ++stats_.loads_succeeded;
    } else {
      ++stats_.loads_failed;
    }
    last_load_ = result;
  }
  ++load_attempts_;
  return result;
}

void ModelLifecycleManager::evict_locked(const EvictReason reason) {
  if (state_.load() != SlotState::Loaded || handle_ == nullptr) {
    return;
  }

  state_.store(SlotState::Evicting);
  handle_.reset();
  ++load_generation_;
  state_.store(SlotState::Unloaded);

  {
    std::lock_guard<std::mutex> monitor_lock(monitor_mutex_);
    monitor_stop_ = true;
  }
  monitor_cv_.notify_all();

  governor_.enter_normal_power();

  std::lock_guard<std::mutex> stats_lock(stats_mutex_);
  switch (reason) {
    case EvictReason::Idle:
      ++stats_.evictions_idle;
      std::cerr << "[model] idle threshold reached; model unloaded\n";
      break;
    case EvictReason::Explicit:
      ++stats_.evictions_explicit;
      std::cerr << "[model] model unloaded on request\n";
      break;
    case EvictReason::Reload:
      ++stats_.evictions_reload;
      std::cerr << "[model] model unloaded for reload\n";
      break;
    case EvictReason::Shutdown:
      std::cerr << "[model] model unloaded at shutdown\n";
      break;
  }
}

void ModelLifecycleManager::start_monitor_locked() {
  join_monitor();
  {
    std::lock_guard<std::mutex> monitor_lock(monitor_mutex_);
    monitor_stop_ = false;
  }
  const std::uint64_t generation = load_generation_.load();
  monitor_ = std::thread([this, generation]() { monitor_loop(generation); });
}

void ModelLifecycleManager::join_monitor() {
  {
    std::lock_guard<std::mutex> monitor_lock(monitor_mutex_);
    monitor_stop_ = true;
  }
  monitor_cv_.notify_all();
  if (monitor_.joinable() && monitor_.get_id() != std::this_thread::get_id()) {
    monitor_.join();
  }
}

void ModelLifecycleManager::monitor_loop(const std::uint64_t generation) {
  const auto still_current = [this, generation]() {
    return load_generation_.load() == generation && state_.load() == SlotState::Loaded;
  };

  while (true) {
    if (wait_for_stop(options_.monitor_interval) || !still_current()) {
      return;
    }

    const auto idle = idle_for();
    if (idle > options_.idle_unload) {
      std::unique_lock<std::mutex> slot(slot_mutex_, std::try_to_lock);
      if (!slot.owns_lock()) {
        // Someone holds the slot, so the model is in use.
        continue;
      }
      if (!still_current()) {
        return;
      }
      if (idle_for() <= options_.idle_unload) {
        continue;
      }
      std::cerr << "[model] idle for " << to_seconds(idle_for()) << "s\n";
      evict_locked(EvictReason::Idle);
      return;
    }

    if (idle <= options_.soft_idle) {
      continue;
    }

    const governor::ResourceSample sample = governor_.sample();
    if (sample.memory_bytes > options_.max_idle_memory_bytes) {
      std::cerr << "[model] idle memory " << (sample.memory_bytes / (1024ULL * 1024ULL)) << "MB above ceiling; reclaiming\n";
      (void)governor_.reclaim_memory();
      std::lock_guard<std::mutex> stats_lock(stats_mutex_);
      ++stats_.reclaim_passes;
    }
    if (sample.cpu_percent > options_.max_idle_cpu_percent) {
      std::cerr << "[model] idle cpu " << sample.cpu_percent << "% above ceiling; throttling\n";
      {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        ++stats_.throttle_pauses;
      }
      if (wait_for_stop(options_.throttle_pause)) {
        return;
      }
    }
  }
}

bool ModelLifecycleManager::wait_for_stop(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(monitor_mutex_);
  return monitor_cv_.wait_for(lock, timeout, [this]() { return monitor_stop_; });
}

void ModelLifecycleManager::touch() noexcept {
  last_used_ns_.store(std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch()).count());
}

std::chrono::milliseconds ModelLifecycleManager::idle_for() const noexcept {
  const auto now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now().time_since_epoch()).count();
  const auto last = last_used_ns_.load();
  if (last == 0 || now_ns <= last) {
    return std::chrono::milliseconds(0);
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(now_ns - last));
}

}  // namespace replyd::llm
