#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "sinks/redis_ts.hpp"

namespace replyd::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint64_t parse_positive(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return static_cast<std::uint64_t>(parsed);
}

float parse_percent(const std::string& key, const std::string& value) {
  const float parsed = std::stof(value);
  if (parsed <= 0.0F || parsed > 100.0F) {
    throw std::runtime_error(key + " must be in range (0, 100]");
  }
  return parsed;
}

std::chrono::milliseconds parse_seconds(const std::string& key, const std::string& value) {
  const double parsed = std::stod(value);
  if (parsed <= 0.0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(static_cast<std::int64_t>(parsed * 1000.0));
}

std::vector<std::string> parse_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

void apply_model_key(ModelConfig& model, const std::string& key, const std::string& value) {
  if (key == "model.path") {
    model.path = value;
  } else if (key == "model.filename") {
    model.filename = value;
  } else if (key == "model.search_dirs") {
    model.search_dirs = parse_list(value);
  } else if (key == "model.min_size_bytes") {
    model.min_size_bytes = parse_positive(key, value);
  } else if (key == "model.context_size") {
    model.context_size = static_cast<std::int32_t>(parse_positive(key, value));
  } else if (key == "model.threads") {
    model.threads = static_cast<std::int32_t>(parse_positive(key, value));
  } else if (key == "model.batch") {
    model.batch = static_cast<std::int32_t>(parse_positive(key, value));
  }
}

void apply_store_key(StoreConfig& store, const std::string& key, const std::string& value) {
  if (key == "store.path") {
    if (value.empty()) {
      throw std::runtime_error("store.path must not be empty");
    }
    store.path = value;
  } else if (key == "store.max_size_mb") {
    store.max_size_mb = parse_positive(key, value);
  } else if (key == "store.max_samples") {
    store.max_samples = static_cast<std::uint32_t>(parse_positive(key, value));
  } else if (key == "store.max_training_pairs") {
    store.max_training_pairs = static_cast<std::uint32_t>(parse_positive(key, value));
  } else if (key == "store.max_interactions") {
    store.max_interactions = static_cast<std::uint32_t>(parse_positive(key, value));
  } else if (key == "store.max_email_patterns") {
    store.max_email_patterns = static_cast<std::uint32_t>(parse_positive(key, value));
  }
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(ServiceConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key.rfind("model.", 0) == 0) {
    apply_model_key(config.model, key, value);
    return;
  }

  if (key == "lifecycle.idle_unload_s") {
    config.lifecycle.idle_unload = parse_seconds(key, value);
    return;
  }

  if (key == "lifecycle.soft_idle_s") {
    config.lifecycle.soft_idle = parse_seconds(key, value);
    return;
  }

  if (key == "lifecycle.monitor_interval_s") {
    config.lifecycle.monitor_interval = parse_seconds(key, value);
    return;
  }

  if (key == "limits.max_idle_memory_mb") {
    config.limits.max_idle_memory_mb = parse_positive(key, value);
    return;
  }

  if (key == "limits.max_idle_cpu_percent") {
    config.limits.max_idle_cpu_percent = parse_percent(key, value);
    return;
  }

  if (key == "limits.cpu_window_ms") {
    config.limits.cpu_window = std::chrono::milliseconds(parse_positive(key, value));
    return;
  }

  if (key.rfind("store.", 0) == 0) {
    apply_store_key(config.store, key, value);
    return;
  }

  if (key == "learning.enabled") {
    config.learning.enabled = parse_bool(value);
    return;
  }

  if (key == "learning.period_s") {
    config.learning.period = parse_seconds(key, value);
    return;
  }

  if (key == "learning.max_memory_mb") {
    config.learning.max_memory_mb = parse_positive(key, value);
    return;
  }

  if (key == "learning.max_cpu_percent") {
    config.learning.max_cpu_percent = parse_percent(key, value);
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.metrics") {
    config.redis.metrics = parse_list(value);
    for (const auto& metric : config.redis.metrics) {
      if (!sinks::is_known_metric(metric)) {
        throw std::runtime_error("redis.metrics has unknown metric: " + metric);
      }
    }
  }
}

void validate(const ServiceConfig& config) {
  if (config.lifecycle.soft_idle >= config.lifecycle.idle_unload) {
    throw std::runtime_error("lifecycle.soft_idle_s must be smaller than lifecycle.idle_unload_s");
  }
  if (config.learning.max_cpu_percent > config.limits.max_idle_cpu_percent) {
    throw std::runtime_error("learning.max_cpu_percent must not exceed limits.max_idle_cpu_percent");
  }
  if (config.learning.max_memory_mb > config.limits.max_idle_memory_mb) {
    throw std::runtime_error("learning.max_memory_mb must not exceed limits.max_idle_memory_mb");
  }
}

}  // namespace

ServiceConfig load_service_config(const std::string& path) {
  ServiceConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate(config);
  return config;
}

}  // namespace replyd::core
