#include <csignal>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

#include "core/config.hpp"
#include "core/service.hpp"
#include "llm/llama_backend.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const replyd::core::ServiceConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[service] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | model=" << (config.model.path.empty() ? config.model.filename : config.model.path)
         << " | idle_unload_s=" << config.lifecycle.idle_unload.count() / 1000
         << " | max_idle_memory_mb=" << config.limits.max_idle_memory_mb
         << " | max_idle_cpu_percent=" << config.limits.max_idle_cpu_percent
         << " | store=" << config.store.path
         << " | store_budget_mb=" << config.store.max_size_mb
         << " | learning=" << (config.learning.enabled ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/replyd.yaml";

  replyd::core::ServiceConfig config{};
  try {
    config = replyd::core::load_service_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    replyd::core::ServiceDependencies deps{};
    deps.backend_factory = replyd::llm::make_llama_backend_factory();
    replyd::core::Service service{config, std::move(deps)};

    while (g_shutdown_requested == 0) {
      service.run_for_ticks(1);
    }

    std::cerr << "[service] shutdown signal received; exiting cleanly\n";
    service.shutdown();
  } catch (const std::exception& ex) {
    std::cerr << "[service] fatal: " << ex.what() << '\n';
    return 1;
  }

  return 0;
}
