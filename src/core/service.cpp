#include "core/service.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include "core/timestamp.hpp"
#include "store/text.hpp"

namespace replyd::core {
namespace {

constexpr std::uint64_t kBytesPerMb = 1024ULL * 1024ULL;
constexpr std::size_t kRetryEmailChars = 100;

governor::GovernorOptions governor_options(const ServiceConfig& config) {
  governor::GovernorOptions options{};
  options.cpu_window = config.limits.cpu_window;
  return options;
}

store::StoreOptions store_options(const ServiceConfig& config) {
  store::StoreOptions options{};
  options.path = config.store.path;
  options.max_size_bytes = config.store.max_size_mb * kBytesPerMb;
  options.max_samples = config.store.max_samples;
  options.max_training_pairs = config.store.max_training_pairs;
  options.max_interactions = config.store.max_interactions;
  options.max_email_patterns = config.store.max_email_patterns;
  return options;
}

llm::ManagerOptions manager_options(const ServiceConfig& config) {
  llm::ManagerOptions options{};
  options.profile.context_size = config.model.context_size;
  options.profile.threads = config.model.threads;
  options.profile.batch = config.model.batch;
  options.idle_unload = config.lifecycle.idle_unload;
  options.soft_idle = config.lifecycle.soft_idle;
  options.monitor_interval = config.lifecycle.monitor_interval;
  options.max_idle_memory_bytes = config.limits.max_idle_memory_mb * kBytesPerMb;
  options.max_idle_cpu_percent = config.limits.max_idle_cpu_percent;
  return options;
}

llm::ModelLocator model_locator(const ServiceConfig& config) {
  llm::LocatorOptions options{};
  options.explicit_path = config.model.path;
  options.filename = config.model.filename;
  options.search_dirs = config.model.search_dirs;
  options.min_size_bytes = config.model.min_size_bytes;
  return llm::ModelLocator(std::move(options));
}

learning::SchedulerOptions scheduler_options(const ServiceConfig& config) {
  learning::SchedulerOptions options{};
  options.period = config.learning.period;
  options.max_memory_bytes = config.learning.max_memory_mb * kBytesPerMb;
  options.max_cpu_percent = config.learning.max_cpu_percent;
  return options;
}

llm::BackendFactory require_factory(llm::BackendFactory factory) {
  if (!factory) {
    throw std::invalid_argument("service requires an inference backend factory");
  }
  return factory;
}

std::unique_ptr<governor::ProcessSensor> sensor_or_default(std::unique_ptr<governor::ProcessSensor> sensor) {
  return sensor != nullptr ? std::move(sensor) : std::make_unique<governor::ProcessSensor>();
}

std::unique_ptr<governor::PowerController> power_or_default(std::unique_ptr<governor::PowerController> power) {
  return power != nullptr ? std::move(power) : governor::make_posix_power_controller();
}

telemetry::slot_state to_frame(const llm::SlotState state) {
  return static_cast<telemetry::slot_state>(static_cast<std::uint8_t>(state));
}

telemetry::storage_health to_frame(const store::HealthTier tier) {
  return static_cast<telemetry::storage_health>(static_cast<std::uint8_t>(tier));
}

std::uint32_t narrow(const std::uint64_t value) {
  return value > 0xFFFFFFFFULL ? 0xFFFFFFFFU : static_cast<std::uint32_t>(value);
}

}  // namespace

Service::Service(ServiceConfig config, ServiceDependencies deps)
    : config_(std::move(config)),
      governor_(governor_options(config_), power_or_default(std::move(deps.power)), sensor_or_default(std::move(deps.sensor))),
      store_(store_options(config_)),
      manager_(manager_options(config_), model_locator(config_), require_factory(std::move(deps.backend_factory)), governor_),
      scheduler_(scheduler_options(config_), store_, governor_, [this]() { return manager_.state(); }),
      tick_interval_(config_.tick_interval) {
  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.publish_health = config_.publish_health;
    options.enabled_metrics = config_.redis.metrics;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        options.unix_socket.empty() ? options.host + ":" + std::to_string(options.port) : "unix://" + options.unix_socket;
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[service] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[service] redis connectivity check failed at " << address << '\n';
    }
  }

  if (config_.learning.enabled) {
    scheduler_.start();
  } else {
    std::cerr << "[service] background learning disabled\n";
  }
}

Service::~Service() { shutdown(); }

void Service::shutdown() {
  if (stopped_) {
    return;
  }
  stopped_ = true;
  scheduler_.stop();
  manager_.shutdown();
}

llm::GenerationResult Service::generate_reply(const std::string& email, const std::string& prompt,
                                              llm::GenerationParams params) {
  try {
    const store::WriteStatus recorded = store_.record_email_pattern(email);
    if (recorded == store::WriteStatus::StorageCritical) {
      std::cerr << "[service] email pattern not recorded: storage critical\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << "[service] email pattern not recorded: " << ex.what() << '\n';
  }

  if (params.retry_prompt.empty()) {
    params.retry_prompt = "Reply to: " + store::truncate_utf8(email, kRetryEmailChars);
  }
  return manager_.generate(prompt, params);
}

ServiceStats Service::run_for_ticks(const std::size_t total_ticks) {
  ServiceStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    const auto cycle_start = std::chrono::steady_clock::now();
    frame_.monotonic_ns = monotonic_timestamp_now_ns();

    collect_model(stats);
    if (sampler_.should_sample_every(kResourceEveryTicks)) {
      collect_resources(stats);
    }
    if (sampler_.should_sample_every(kStorageEveryTicks)) {
      collect_storage(stats);
    }
    publish_sinks(stats);

    const auto cycle_end = std::chrono::steady_clock::now();
    const auto actual_period_ms =
        previous_cycle_start_.has_value()
            ? std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_start - *previous_cycle_start_).count()
            : 0.0F;
    const auto compute_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_end - cycle_start).count();
    update_agent_health(actual_period_ms, compute_ms);
    previous_cycle_start_ = cycle_start;

    ++stats.ticks_executed;
    sampler_.advance();

    next_wakeup_ += tick_interval_;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

void Service::collect_model(ServiceStats& stats) {
  ++stats.model_cycles;
  const llm::ManagerStats manager = manager_.stats();
  frame_.slot = to_frame(manager_.state());
  frame_.load_generation = manager_.load_generation();
  frame_.loads_failed = narrow(manager.loads_failed);
  frame_.inferences = narrow(manager.inferences);

  const learning::SchedulerStats learning = scheduler_.stats();
  frame_.learning_runs = narrow(learning.runs);
  frame_.learning_skips = narrow(learning.skipped_model_active + learning.skipped_resources);
}

void Service::collect_resources(ServiceStats& stats) {
  ++stats.resource_cycles;
  const llm::ManagerStatus status = manager_.status();
  frame_.rss_mb = static_cast<float>(static_cast<double>(status.memory_bytes) / static_cast<double>(kBytesPerMb));
  frame_.cpu_pct = status.cpu_percent;
  frame_.idle_s = static_cast<float>(status.idle_seconds);
  frame_.unload_in_s = static_cast<float>(status.will_unload_in_seconds);
  frame_.low_power = governor_.low_power() ? 1.0F : 0.0F;
}

void Service::collect_storage(ServiceStats& stats) {
  ++stats.storage_cycles;
  try {
    const store::StorageStatus status = store_.status();
    frame_.storage_mb = static_cast<float>(static_cast<double>(status.size_bytes) / static_cast<double>(kBytesPerMb));
    frame_.storage_usage_pct = static_cast<float>(status.usage_percent);
    frame_.storage = to_frame(status.health);
    frame_.samples = narrow(status.samples);
    frame_.training_pairs = narrow(status.training_pairs);
    frame_.interactions = narrow(status.interactions);
    frame_.email_patterns = narrow(status.email_patterns);
    if (!storage_was_ok_) {
      std::cerr << "[store] status recovered\n";
      storage_was_ok_ = true;
    }
  } catch (const store::SqliteError& ex) {
    if (storage_was_ok_) {
      std::cerr << "[store] status failed: " << ex.what() << '\n';
      storage_was_ok_ = false;
    }
  }
}

void Service::publish_sinks(ServiceStats& stats) {
  ++stats.sink_cycles;
  frame_.agent.redis_errors = 0;

  if (config_.stdout_debug) {
    stdout_sink_.publish(frame_);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(frame_);
    if (!ok) {
      ++frame_.agent.redis_errors;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

void Service::update_agent_health(const float actual_period_ms, const float compute_time_ms) {
  if (!config_.publish_health) {
    return;
  }

  const auto tick_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(tick_interval_).count();
  frame_.agent.loop_jitter_ms = actual_period_ms > 0.0F ? std::fabs(actual_period_ms - tick_ms) : 0.0F;
  frame_.agent.compute_time_ms = compute_time_ms;
  frame_.agent.heartbeat_ms = unix_timestamp_now_ns() / 1'000'000ULL;
  if (compute_time_ms > tick_ms) {
    ++frame_.agent.missed_cycles;
  }
}

}  // namespace replyd::core
