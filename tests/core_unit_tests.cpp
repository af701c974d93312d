#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/math.hpp"
#include "core/sampler.hpp"
#include "llm/model_locator.hpp"

using replyd::core::Sampler;
using replyd::core::ServiceConfig;
using replyd::core::load_service_config;
using replyd::llm::LocatorOptions;
using replyd::llm::ModelLocator;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_config(const std::string& name, const std::string& body) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << body;
  return path;
}

bool config_throws(const std::string& name, const std::string& body) {
  const auto path = write_config(name, body);
  bool threw = false;
  try {
    (void)load_service_config(path.string());
  } catch (const std::exception&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_sampler_should_sample_every() {
  Sampler sampler;
  if (!sampler.should_sample_every(1) || !sampler.should_sample_every(5)) {
    return fail("test_sampler_should_sample_every", "tick 0 should sample every cadence");
  }
  if (sampler.should_sample_every(0)) {
    return fail("test_sampler_should_sample_every", "every 0 must never sample");
  }

  sampler.advance();
  if (sampler.should_sample_every(5)) {
    return fail("test_sampler_should_sample_every", "tick 1 should not sample every 5");
  }

  for (int i = 0; i < 4; ++i) {
    sampler.advance();
  }
  if (!sampler.should_sample_every(5)) {
    return fail("test_sampler_should_sample_every", "tick 5 should sample every 5");
  }
  return 0;
}

int test_sampler_rotation_slot_cycles() {
  Sampler sampler;
  const std::uint64_t expected[] = {0, 1, 2, 3, 0, 1, 2, 3, 0};
  for (const auto slot : expected) {
    if (sampler.rotation_slot(4) != slot) {
      return fail("test_sampler_rotation_slot_cycles", "rotation slot out of order");
    }
    sampler.advance();
  }
  if (sampler.rotation_slot(0) != 0) {
    return fail("test_sampler_rotation_slot_cycles", "zero slots must map to slot 0");
  }
  return 0;
}

int test_clamp_unit_weight() {
  if (replyd::core::clamp_unit_weight(2.5) != 1.0 || replyd::core::clamp_unit_weight(-4.0) != -1.0 ||
      replyd::core::clamp_unit_weight(0.25) != 0.25) {
    return fail("test_clamp_unit_weight", "weight must clamp into [-1, 1]");
  }
  return 0;
}

int test_config_defaults_and_full_file() {
  const auto path = write_config("replyd_full.yaml",
                                 "# full config\n"
                                 "tick_rate_hz: 4\n"
                                 "model:\n"
                                 "  filename: tiny.gguf\n"
                                 "  search_dirs: /srv/models, ./models\n"
                                 "  context_size: 512\n"
                                 "lifecycle:\n"
                                 "  idle_unload_s: 10\n"
                                 "  soft_idle_s: 2.5\n"
                                 "  monitor_interval_s: 1\n"
                                 "limits:\n"
                                 "  max_idle_memory_mb: 300\n"
                                 "  cpu_window_ms: 50\n"
                                 "store:\n"
                                 "  path: /tmp/replyd_full.db\n"
                                 "  max_size_mb: 64\n"
                                 "  max_samples: 500\n"
                                 "learning:\n"
                                 "  enabled: no\n"
                                 "  period_s: 8\n"
                                 "agent:\n"
                                 "  stdout_debug: true\n");

  ServiceConfig config{};
  try {
    config = load_service_config(path.string());
  } catch (const std::exception& ex) {
    std::filesystem::remove(path);
    std::cerr << ex.what() << '\n';
    return fail("test_config_defaults_and_full_file", "valid config should load");
  }
  std::filesystem::remove(path);

  if (config.tick_interval != std::chrono::milliseconds(250)) {
    return fail("test_config_defaults_and_full_file", "tick_rate_hz should map to tick interval");
  }
  if (config.model.filename != "tiny.gguf" || config.model.search_dirs.size() != 2 ||
      config.model.search_dirs[1] != "./models" || config.model.context_size != 512) {
    return fail("test_config_defaults_and_full_file", "model section parsed incorrectly");
  }
  if (config.model.threads != 1 || config.model.batch != 32) {
    return fail("test_config_defaults_and_full_file", "unset model keys should keep minimal profile");
  }
  if (config.lifecycle.idle_unload != std::chrono::seconds(10) ||
      config.lifecycle.soft_idle != std::chrono::milliseconds(2500) ||
      config.lifecycle.monitor_interval != std::chrono::seconds(1)) {
    return fail("test_config_defaults_and_full_file", "lifecycle section parsed incorrectly");
  }
  if (config.limits.max_idle_memory_mb != 300 || config.limits.max_idle_cpu_percent != 5.0F ||
      config.limits.cpu_window != std::chrono::milliseconds(50)) {
    return fail("test_config_defaults_and_full_file", "limits section parsed incorrectly");
  }
  if (config.store.path != "/tmp/replyd_full.db" || config.store.max_size_mb != 64 || config.store.max_samples != 500 ||
      config.store.max_training_pairs != 25000 || config.store.max_email_patterns != 100) {
    return fail("test_config_defaults_and_full_file", "store section parsed incorrectly");
  }
  if (config.learning.enabled || config.learning.period != std::chrono::seconds(8)) {
    return fail("test_config_defaults_and_full_file", "learning section parsed incorrectly");
  }
  if (!config.stdout_debug || !config.publish_health || config.redis.enabled) {
    return fail("test_config_defaults_and_full_file", "agent and redis defaults parsed incorrectly");
  }
  return 0;
}

int test_config_parsing_edge_cases() {
  if (!config_throws("replyd_bad_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_parsing_edge_cases", "bad redis port should throw");
  }
  if (!config_throws("replyd_bad_number.yaml", "lifecycle:\n  idle_unload_s: soon\n")) {
    return fail("test_config_parsing_edge_cases", "non-numeric duration should throw");
  }
  if (!config_throws("replyd_bad_percent.yaml", "limits:\n  max_idle_cpu_percent: 150\n")) {
    return fail("test_config_parsing_edge_cases", "cpu percent above 100 should throw");
  }
  if (!config_throws("replyd_zero_store.yaml", "store:\n  max_size_mb: 0\n")) {
    return fail("test_config_parsing_edge_cases", "zero storage budget should throw");
  }
  if (!config_throws("replyd_soft_idle.yaml", "lifecycle:\n  idle_unload_s: 30\n  soft_idle_s: 30\n")) {
    return fail("test_config_parsing_edge_cases", "soft idle must be below idle unload");
  }
  if (!config_throws("replyd_learning_cpu.yaml", "learning:\n  max_cpu_percent: 10\n")) {
    return fail("test_config_parsing_edge_cases", "learning cpu ceiling above idle ceiling should throw");
  }
  bool missing_threw = false;
  try {
    (void)load_service_config((std::filesystem::temp_directory_path() / "replyd_no_such_config.yaml").string());
  } catch (const std::exception&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_parsing_edge_cases", "missing config file should throw");
  }

  const auto unix_socket = write_config("replyd_unix_redis.yaml", "redis:\n  address: unix:///var/run/redis/redis.sock\n");
  const auto unix_config = load_service_config(unix_socket.string());
  std::filesystem::remove(unix_socket);
  if (!unix_config.redis.enabled || unix_config.redis.unix_socket != "/var/run/redis/redis.sock") {
    return fail("test_config_parsing_edge_cases", "unix socket redis address should parse");
  }

  const auto tcp = write_config("replyd_tcp_redis.yaml", "redis:\n  address: 10.0.0.5:6380\n");
  const auto tcp_config = load_service_config(tcp.string());
  std::filesystem::remove(tcp);
  if (!tcp_config.redis.enabled || tcp_config.redis.host != "10.0.0.5" || tcp_config.redis.port != 6380) {
    return fail("test_config_parsing_edge_cases", "tcp redis address should parse");
  }
  if (!tcp_config.redis.metrics.empty()) {
    return fail("test_config_parsing_edge_cases", "metric filter should default to every metric");
  }

  const auto filtered = write_config("replyd_redis_metrics.yaml",
                                     "redis:\n  address: 10.0.0.5:6380\n  metrics: model:slot, resource:rss_mb\n");
  const auto filtered_config = load_service_config(filtered.string());
  std::filesystem::remove(filtered);
  if (filtered_config.redis.metrics.size() != 2 || filtered_config.redis.metrics[0] != "model:slot" ||
      filtered_config.redis.metrics[1] != "resource:rss_mb") {
    return fail("test_config_parsing_edge_cases", "redis metric filter should parse as a list");
  }
  if (!config_throws("replyd_redis_bad_metric.yaml", "redis:\n  metrics: model:slot, gpu:temp\n")) {
    return fail("test_config_parsing_edge_cases", "unknown redis metric should throw");
  }
  return 0;
}

int test_model_locator_prefers_explicit_and_skips_truncated() {
  const auto dir = std::filesystem::temp_directory_path() / "replyd_locator_test";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir / "a");
  std::filesystem::create_directories(dir / "b");

  {
    std::ofstream truncated(dir / "a" / "model.gguf", std::ios::binary);
    truncated << "tiny";
    std::ofstream full(dir / "b" / "model.gguf", std::ios::binary);
    full << std::string(2048, 'w');
  }

  LocatorOptions options{};
  options.filename = "model.gguf";
  options.search_dirs = {(dir / "a").string(), (dir / "b").string()};
  ModelLocator locator(options);

  const auto resolved = locator.resolve();
  if (!resolved.has_value() || *resolved != dir / "b" / "model.gguf") {
    std::filesystem::remove_all(dir);
    return fail("test_model_locator_prefers_explicit_and_skips_truncated", "truncated weights should be skipped");
  }
  if (locator.expected_path() != dir / "a" / "model.gguf") {
    std::filesystem::remove_all(dir);
    return fail("test_model_locator_prefers_explicit_and_skips_truncated", "expected path should be first candidate");
  }

  options.explicit_path = (dir / "missing.gguf").string();
  ModelLocator explicit_locator(options);
  if (explicit_locator.expected_path() != dir / "missing.gguf") {
    std::filesystem::remove_all(dir);
    return fail("test_model_locator_prefers_explicit_and_skips_truncated", "explicit path should be reported first");
  }
  if (!explicit_locator.resolve().has_value()) {
    std::filesystem::remove_all(dir);
    return fail("test_model_locator_prefers_explicit_and_skips_truncated", "search dirs should back up a missing explicit path");
  }

  std::filesystem::remove_all(dir);
  if (locator.resolve().has_value()) {
    return fail("test_model_locator_prefers_explicit_and_skips_truncated", "nothing should resolve once files are gone");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_sampler_should_sample_every(); rc != 0) return rc;
  if (int rc = test_sampler_rotation_slot_cycles(); rc != 0) return rc;
  if (int rc = test_clamp_unit_weight(); rc != 0) return rc;
  if (int rc = test_config_defaults_and_full_file(); rc != 0) return rc;
  if (int rc = test_config_parsing_edge_cases(); rc != 0) return rc;
  if (int rc = test_model_locator_prefers_explicit_and_skips_truncated(); rc != 0) return rc;

  std::cout << "[PASS] core unit tests\n";
  return 0;
}
