#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "telemetry/service_frame.hpp"

struct redisContext;

namespace replyd::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"replyd:node"};
  std::uint32_t connect_timeout_ms{1000};
  bool publish_health{true};
  // Metric suffixes to publish; empty publishes all of them.
  std::vector<std::string> enabled_metrics{};
};

// True when suffix names a metric the sink can publish.
bool is_known_metric(const std::string& suffix);

class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(telemetry::service_frame& frame);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(telemetry::service_frame& frame);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::vector<std::string> enabled_metrics_;
  std::unordered_set<std::string> enabled_metric_set_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace replyd::sinks
