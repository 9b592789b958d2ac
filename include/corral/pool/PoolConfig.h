// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>
#include <corral/pool/Capability.h>
#include <corral/pool/CircuitBreaker.h>

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace corral::pool {

/// Per-capability pool settings
struct PoolConfig {
    std::uint64_t memoryPerWorkerMb = 1024;       ///< Logical cost claimed by each worker
    std::size_t minWorkers = 0;                   ///< Kept alive whenever memory allows
    std::size_t maxWorkers = 4;                   ///< Hard cap on live workers
    std::size_t preWarmCount = 2;                 ///< Workers requested on cold start
    std::size_t queueCapacity = 32;               ///< Per-worker accepted-request limit
    std::chrono::milliseconds idleTimeout{300000}; ///< Idle age before eviction
    std::chrono::milliseconds healthProbeInterval{10000}; ///< Maintenance cadence
    std::chrono::milliseconds healthStaleAfter{30000};    ///< Minimum probe staleness window
    std::chrono::milliseconds loadTimeout{120000};        ///< Spawning longer than this is abandoned
    std::chrono::milliseconds waitForWorkersTimeout{30000};
    CircuitBreakerConfig breaker{};
    DeviceConfig device{};

    Result<void> validate() const {
        if (maxWorkers == 0) {
            return Error{ErrorCode::InvalidArgument, "maxWorkers must be at least 1"};
        }
        if (minWorkers > maxWorkers) {
            return Error{ErrorCode::InvalidArgument, "minWorkers exceeds maxWorkers"};
        }
        if (queueCapacity == 0) {
            return Error{ErrorCode::InvalidArgument, "queueCapacity must be at least 1"};
        }
        if (idleTimeout.count() <= 0 || healthProbeInterval.count() <= 0 ||
            healthStaleAfter.count() <= 0 || loadTimeout.count() <= 0 ||
            waitForWorkersTimeout.count() <= 0) {
            return Error{ErrorCode::InvalidArgument, "durations must be positive"};
        }
        if (!(breaker.failureRatio > 0.0 && breaker.failureRatio <= 1.0)) {
            return Error{ErrorCode::InvalidArgument, "breaker failureRatio must be in (0, 1]"};
        }
        if (breaker.cooldown.count() <= 0 || breaker.window.count() <= 0) {
            return Error{ErrorCode::InvalidArgument, "breaker window and cooldown must be positive"};
        }
        return {};
    }
};

} // namespace corral::pool
