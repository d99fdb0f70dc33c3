#pragma once

#include "strata/timeline/engine_telemetry_registry.hpp"

#include <chrono>
#include <string>

namespace strata::timeline {

struct EngineMetricsSnapshot final {
    TimelineTelemetrySnapshot timelines{};
    PageCacheTelemetrySnapshot page_cache{};
    double page_cache_hit_ratio = 0.0;
};

EngineMetricsSnapshot collect_engine_metrics(const EngineTelemetryRegistry& registry);

std::string engine_metrics_to_openmetrics(const EngineMetricsSnapshot& snapshot,
                                          std::chrono::system_clock::time_point wall_now = std::chrono::system_clock::now());

}  // namespace strata::timeline
