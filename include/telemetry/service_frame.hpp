#pragma once

#include <cstdint>
#include <type_traits>

namespace replyd::telemetry {

enum class slot_state : std::uint8_t {
    UNLOADED = 0,
    LOADING = 1,
    LOADED = 2,
    EVICTING = 3,
};

enum class storage_health : std::uint8_t {
    HEALTHY = 0,
    WARNING = 1,
    CRITICAL = 2,
};

// ABI frame shared across modules.
// POD layout: one timestamp + tightly packed signals.
struct service_frame {
    struct AgentHealth {
        std::uint64_t heartbeat_ms;
        float loop_jitter_ms;
        float compute_time_ms;
        float redis_latency_ms;
        std::uint32_t redis_errors;
        std::uint32_t missed_cycles;
    };

    std::uint64_t monotonic_ns;

    // Model slot.
    slot_state slot;
    std::uint64_t load_generation;
    float idle_s;
    float unload_in_s;
    std::uint32_t loads_failed;
    std::uint32_t inferences;

    // Process resources.
    float rss_mb;
    float cpu_pct;
    float low_power;

    // Persistence store.
    float storage_mb;
    float storage_usage_pct;
    storage_health storage;
    std::uint32_t samples;
    std::uint32_t training_pairs;
    std::uint32_t interactions;
    std::uint32_t email_patterns;

    // Background learning.
    std::uint32_t learning_runs;
    std::uint32_t learning_skips;

    AgentHealth agent;
};

static_assert(std::is_standard_layout_v<service_frame>, "service_frame must be standard layout");
static_assert(std::is_trivial_v<service_frame>, "service_frame must be trivial");

} // namespace replyd::telemetry
