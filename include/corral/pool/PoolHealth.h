// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/pool/CircuitBreaker.h>
#include <corral/pool/MemoryGovernor.h>
#include <corral/pool/PoolMetrics.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace corral::pool {

enum class HealthStatus : std::uint8_t { Healthy = 0, Degraded = 1, Unhealthy = 2 };

constexpr std::string_view healthStatusName(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
    }
    return "unknown";
}

struct WorkerCounts {
    std::size_t total = 0; ///< Live workers (Spawning, Ready, Busy, Idle)
    std::size_t spawning = 0;
    std::size_t ready = 0;
    std::size_t busy = 0;
    std::size_t idle = 0;
    std::size_t retiring = 0; ///< Evicting/Unresponsive/Dead awaiting reap
};

struct PoolHealth {
    std::string model;
    std::string kind;
    HealthStatus status = HealthStatus::Healthy;
    WorkerCounts workers{};
    std::size_t queueDepth = 0;
    std::size_t minWorkers = 0;
    std::size_t maxWorkers = 0;
    BreakerState breaker = BreakerState::Closed;
    PoolMetrics::Snapshot metrics{};
};

struct RegistryHealth {
    HealthStatus status = HealthStatus::Healthy;
    MemoryStats memory{};
    std::vector<PoolHealth> pools;
};

nlohmann::json toJson(const PoolHealth& health);
nlohmann::json toJson(const RegistryHealth& health);

/// Prometheus text exposition for every pool plus the shared budget.
std::string toPrometheus(const RegistryHealth& health);

} // namespace corral::pool
