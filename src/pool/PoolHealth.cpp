// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/pool/PoolHealth.h>

#include <spdlog/fmt/fmt.h>

#include <iterator>

namespace corral::pool {

nlohmann::json toJson(const PoolHealth& health) {
    const auto& m = health.metrics;
    return nlohmann::json{
        {"model", health.model},
        {"kind", health.kind},
        {"status", std::string(healthStatusName(health.status))},
        {"breaker", std::string(breakerStateName(health.breaker))},
        {"queue_depth", health.queueDepth},
        {"min_workers", health.minWorkers},
        {"max_workers", health.maxWorkers},
        {"workers",
         {{"total", health.workers.total},
          {"spawning", health.workers.spawning},
          {"ready", health.workers.ready},
          {"busy", health.workers.busy},
          {"idle", health.workers.idle},
          {"retiring", health.workers.retiring}}},
        {"requests",
         {{"total", m.requestsTotal},
          {"succeeded", m.requestsSucceeded},
          {"failed", m.requestsFailed},
          {"abandoned", m.requestsAbandoned},
          {"backpressure", m.backpressureRejections},
          {"circuit_rejections", m.circuitRejections},
          {"wait_timeouts", m.waitTimeouts}}},
        {"lifecycle",
         {{"spawned", m.workersSpawned},
          {"evicted", m.workersEvicted},
          {"unresponsive", m.workersUnresponsive},
          {"spawn_failures", m.spawnFailures}}},
        {"latency_ms",
         {{"mean", m.meanLatencyMs()}, {"min", m.latencyMinMs}, {"max", m.latencyMaxMs}}},
    };
}

nlohmann::json toJson(const RegistryHealth& health) {
    nlohmann::json pools = nlohmann::json::array();
    for (const auto& pool : health.pools) {
        pools.push_back(toJson(pool));
    }
    const auto& mem = health.memory;
    return nlohmann::json{
        {"status", std::string(healthStatusName(health.status))},
        {"memory",
         {{"budget_mb", mem.budgetMb},
          {"reserved_mb", mem.reservedMb},
          {"available_mb", mem.availableMb},
          {"peak_reserved_mb", mem.peakReservedMb},
          {"live_allocations", mem.liveAllocations},
          {"rejected_allocations", mem.rejectedAllocations},
          {"utilization", mem.utilization},
          {"pressure", std::string(memoryPressureName(mem.pressure))}}},
        {"pools", std::move(pools)},
    };
}

std::string toPrometheus(const RegistryHealth& health) {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "# HELP corral_memory_budget_mb Configured logical memory budget\n");
    fmt::format_to(it, "# TYPE corral_memory_budget_mb gauge\n");
    fmt::format_to(it, "corral_memory_budget_mb {}\n", health.memory.budgetMb);
    fmt::format_to(it, "# HELP corral_memory_reserved_mb Budget held by live workers\n");
    fmt::format_to(it, "# TYPE corral_memory_reserved_mb gauge\n");
    fmt::format_to(it, "corral_memory_reserved_mb {}\n", health.memory.reservedMb);
    fmt::format_to(it, "# HELP corral_memory_pressure Pressure level (0=low .. 3=critical)\n");
    fmt::format_to(it, "# TYPE corral_memory_pressure gauge\n");
    fmt::format_to(it, "corral_memory_pressure {}\n",
                   static_cast<int>(health.memory.pressure));

    if (health.pools.empty()) {
        return out;
    }

    fmt::format_to(it, "# TYPE corral_pool_requests_total counter\n");
    fmt::format_to(it, "# TYPE corral_pool_requests_failed_total counter\n");
    fmt::format_to(it, "# TYPE corral_pool_backpressure_total counter\n");
    fmt::format_to(it, "# TYPE corral_pool_circuit_rejections_total counter\n");
    fmt::format_to(it, "# TYPE corral_pool_workers gauge\n");
    fmt::format_to(it, "# TYPE corral_pool_workers_busy gauge\n");
    fmt::format_to(it, "# TYPE corral_pool_latency_ms_avg gauge\n");
    fmt::format_to(it, "# TYPE corral_pool_circuit_open gauge\n");
    for (const auto& pool : health.pools) {
        const auto labels = fmt::format("model=\"{}\",kind=\"{}\"", pool.model, pool.kind);
        const auto& m = pool.metrics;
        fmt::format_to(it, "corral_pool_requests_total{{{}}} {}\n", labels, m.requestsTotal);
        fmt::format_to(it, "corral_pool_requests_failed_total{{{}}} {}\n", labels,
                       m.requestsFailed);
        fmt::format_to(it, "corral_pool_backpressure_total{{{}}} {}\n", labels,
                       m.backpressureRejections);
        fmt::format_to(it, "corral_pool_circuit_rejections_total{{{}}} {}\n", labels,
                       m.circuitRejections);
        fmt::format_to(it, "corral_pool_workers{{{}}} {}\n", labels, pool.workers.total);
        fmt::format_to(it, "corral_pool_workers_busy{{{}}} {}\n", labels, pool.workers.busy);
        fmt::format_to(it, "corral_pool_latency_ms_avg{{{}}} {:.3f}\n", labels,
                       m.meanLatencyMs());
        fmt::format_to(it, "corral_pool_circuit_open{{{}}} {}\n", labels,
                       pool.breaker == BreakerState::Open ? 1 : 0);
    }
    return out;
}

} // namespace corral::pool
