#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace replyd::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  bool enabled{false};
  // Metric suffixes to publish; empty publishes all of them.
  std::vector<std::string> metrics{};
};

struct ModelConfig {
  std::string path{};
  std::string filename{"Llama-3.2-3B-Instruct-Q4_K_M.gguf"};
  std::vector<std::string> search_dirs{"/opt/replyd/models", "models"};
  std::uint64_t min_size_bytes{1000};
  std::int32_t context_size{256};
  std::int32_t threads{1};
  std::int32_t batch{32};
};

struct LifecycleConfig {
  std::chrono::milliseconds idle_unload{std::chrono::seconds(60)};
  std::chrono::milliseconds soft_idle{std::chrono::seconds(30)};
  std::chrono::milliseconds monitor_interval{std::chrono::seconds(15)};
};

struct LimitsConfig {
  std::uint64_t max_idle_memory_mb{500};
  float max_idle_cpu_percent{5.0F};
  std::chrono::milliseconds cpu_window{250};
};

struct StoreConfig {
  std::string path{"personalization.db"};
  std::uint64_t max_size_mb{5120};
  std::uint32_t max_samples{50000};
  std::uint32_t max_training_pairs{25000};
  std::uint32_t max_interactions{100000};
  std::uint32_t max_email_patterns{100};
};

struct LearningConfig {
  bool enabled{true};
  std::chrono::milliseconds period{std::chrono::seconds(120)};
  std::uint64_t max_memory_mb{100};
  float max_cpu_percent{2.0F};
};

struct ServiceConfig {
  std::chrono::milliseconds tick_interval{1000};
  bool publish_health{true};
  bool stdout_debug{false};
  ModelConfig model{};
  LifecycleConfig lifecycle{};
  LimitsConfig limits{};
  StoreConfig store{};
  LearningConfig learning{};
  RedisConfig redis{};
};

ServiceConfig load_service_config(const std::string& path);

}  // namespace replyd::core
