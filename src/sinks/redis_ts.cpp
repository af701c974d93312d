#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace replyd::sinks {
namespace {

struct MetricSpec {
  const char* suffix;
  bool health;
  double (*read)(const telemetry::service_frame&);
};

double finite(const float value) { return std::isfinite(value) ? static_cast<double>(value) : 0.0; }

// Publication order is the order of this table.
const std::vector<MetricSpec>& metric_specs() {
  using Frame = telemetry::service_frame;
  static const std::vector<MetricSpec> kSpecs = {
      {"model:slot", false, [](const Frame& f) { return static_cast<double>(static_cast<std::uint8_t>(f.slot)); }},
      {"model:load_generation", false, [](const Frame& f) { return static_cast<double>(f.load_generation); }},
      {"model:idle_s", false, [](const Frame& f) { return finite(f.idle_s); }},
      {"model:unload_in_s", false, [](const Frame& f) { return finite(f.unload_in_s); }},
      {"model:loads_failed", false, [](const Frame& f) { return static_cast<double>(f.loads_failed); }},
      {"model:inferences", false, [](const Frame& f) { return static_cast<double>(f.inferences); }},
      {"resource:rss_mb", false, [](const Frame& f) { return finite(f.rss_mb); }},
      {"resource:cpu_pct", false, [](const Frame& f) { return finite(f.cpu_pct); }},
      {"resource:low_power", false, [](const Frame& f) { return finite(f.low_power); }},
      {"storage:size_mb", false, [](const Frame& f) { return finite(f.storage_mb); }},
      {"storage:usage_pct", false, [](const Frame& f) { return finite(f.storage_usage_pct); }},
      {"storage:health", false, [](const Frame& f) { return static_cast<double>(static_cast<std::uint8_t>(f.storage)); }},
      {"storage:samples", false, [](const Frame& f) { return static_cast<double>(f.samples); }},
      {"storage:training_pairs", false, [](const Frame& f) { return static_cast<double>(f.training_pairs); }},
      {"storage:interactions", false, [](const Frame& f) { return static_cast<double>(f.interactions); }},
      {"storage:email_patterns", false, [](const Frame& f) { return static_cast<double>(f.email_patterns); }},
      {"learning:runs", false, [](const Frame& f) { return static_cast<double>(f.learning_runs); }},
      {"learning:skips", false, [](const Frame& f) { return static_cast<double>(f.learning_skips); }},
      {"agent:heartbeat", true, [](const Frame& f) { return static_cast<double>(f.agent.heartbeat_ms); }},
      {"agent:loop_jitter", true, [](const Frame& f) { return finite(f.agent.loop_jitter_ms); }},
      {"agent:compute_time", true, [](const Frame& f) { return finite(f.agent.compute_time_ms); }},
      {"agent:redis_latency", true, [](const Frame& f) { return finite(f.agent.redis_latency_ms); }},
      {"agent:redis_errors", true, [](const Frame& f) { return static_cast<double>(f.agent.redis_errors); }},
      {"agent:missed_cycles", true, [](const Frame& f) { return static_cast<double>(f.agent.missed_cycles); }},
  };
  return kSpecs;
}

bool reply_error_contains(const redisReply* reply, const char* needle) {
  return reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && std::strstr(reply->str, needle) != nullptr;
}

// Runs a setup command and reports whether Redis accepted it.
bool run_simple(redisContext* context, const std::vector<std::string>& args, const char* what) {
  std::vector<const char*> argv;
  std::vector<std::size_t> argv_len;
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
    argv_len.push_back(arg.size());
  }
  auto* reply = static_cast<redisReply*>(
      redisCommandArgv(context, static_cast<int>(argv.size()), argv.data(), argv_len.data()));
  if (reply == nullptr) {
    std::cerr << "[redis] " << what << " failed: " << context->errstr << '\n';
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] " << what << " rejected: " << (reply->str != nullptr ? reply->str : "unknown") << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace

bool is_known_metric(const std::string& suffix) {
  for (const auto& spec : metric_specs()) {
    if (suffix == spec.suffix) {
      return true;
    }
  }
  return false;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {
  if (options_.enabled_metrics.empty()) {
    for (const auto& spec : metric_specs()) {
      enabled_metrics_.emplace_back(spec.suffix);
    }
  } else {
    enabled_metrics_ = options_.enabled_metrics;
  }
  enabled_metric_set_ = std::unordered_set<std::string>(enabled_metrics_.begin(), enabled_metrics_.end());
  reserve_command_buffers();
}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::check_connectivity() { return ensure_connected(); }

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = options_.unix_socket.empty()
                          ? redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout)
                          : redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  if (raw == nullptr) {
    std::cerr << "[redis] connect failed: out of memory\n";
    return false;
  }
  context_.reset(raw);
  if (context_->err != REDIS_OK) {
    std::cerr << "[redis] connect failed: " << context_->errstr << '\n';
    context_.reset();
    return false;
  }

  if (!authenticate() || !select_db() || !ensure_schema()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }
  return run_simple(context_.get(), {"AUTH", options_.password}, "AUTH");
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }
  return run_simple(context_.get(), {"SELECT", std::to_string(options_.db)}, "SELECT");
}

bool RedisTsSink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& suffix : enabled_metrics_) {
    const std::string key = options_.key_prefix + ":" + suffix;
    const std::string area = suffix.substr(0, suffix.find(':'));
    auto* reply = static_cast<redisReply*>(redisCommand(
        context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST LABELS service replyd area %s", key.c_str(), area.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool exists = reply_error_contains(reply, "already exists");
    const bool unknown_command = reply_error_contains(reply, "unknown command");
    const bool ok = reply->type != REDIS_REPLY_ERROR || exists;
    const std::string message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not loaded; telemetry publication disabled\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] TS.CREATE " << key << " failed: " << message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisTsSink::publish(telemetry::service_frame& frame) {
  if (!ensure_connected()) {
    return false;
  }
  if (publish_impl(frame)) {
    return true;
  }
  // One reconnect per frame; the next tick tries again.
  return reconnect() && publish_impl(frame);
}

bool RedisTsSink::publish_impl(telemetry::service_frame& frame) {
  const std::string timestamp = std::to_string(core::unix_timestamp_now_ns() / 1'000'000ULL);

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  for (const auto& spec : metric_specs()) {
    if (spec.health && !options_.publish_health) {
      continue;
    }
    if (enabled_metric_set_.find(spec.suffix) == enabled_metric_set_.end()) {
      continue;
    }
    command_args_.emplace_back(options_.key_prefix + ":" + spec.suffix);
    command_args_.emplace_back(timestamp);
    command_args_.emplace_back(std::to_string(spec.read(frame)));
  }
  if (command_args_.size() == 1) {
    return true;
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto start = std::chrono::steady_clock::now();
  auto* reply = static_cast<redisReply*>(redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()),
                                                          command_argv_.data(), command_argv_len_.data()));
  frame.agent.redis_latency_ms =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(std::chrono::steady_clock::now() - start)
          .count();
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

void RedisTsSink::reserve_command_buffers() {
  const std::size_t max_args = 1 + metric_specs().size() * 3;
  command_args_.reserve(max_args);
  command_argv_.reserve(max_args);
  command_argv_len_.reserve(max_args);
}

}  // namespace replyd::sinks
