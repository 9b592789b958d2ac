// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/atomic_utils.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace corral::pool {

/// Lock-free per-pool counters. Updated from dispatchers, worker threads and
/// the maintenance loop.
class PoolMetrics {
public:
    struct Snapshot {
        std::uint64_t requestsTotal = 0;
        std::uint64_t requestsSucceeded = 0;
        std::uint64_t requestsFailed = 0;
        std::uint64_t requestsAbandoned = 0;
        std::uint64_t backpressureRejections = 0;
        std::uint64_t circuitRejections = 0;
        std::uint64_t waitTimeouts = 0;
        std::uint64_t workersSpawned = 0;
        std::uint64_t workersEvicted = 0;
        std::uint64_t workersUnresponsive = 0;
        std::uint64_t spawnFailures = 0;
        std::uint64_t latencyCount = 0;
        std::uint64_t latencySumMs = 0;
        std::uint64_t latencyMinMs = 0;
        std::uint64_t latencyMaxMs = 0;

        double meanLatencyMs() const {
            return latencyCount == 0 ? 0.0
                                     : static_cast<double>(latencySumMs) /
                                           static_cast<double>(latencyCount);
        }
    };

    void recordRequest() noexcept { requestsTotal_.fetch_add(1, std::memory_order_relaxed); }
    void recordBackpressure() noexcept { backpressure_.fetch_add(1, std::memory_order_relaxed); }
    void recordCircuitRejection() noexcept { circuit_.fetch_add(1, std::memory_order_relaxed); }
    void recordWaitTimeout() noexcept { waitTimeouts_.fetch_add(1, std::memory_order_relaxed); }
    void recordSpawn() noexcept { spawned_.fetch_add(1, std::memory_order_relaxed); }
    void recordEviction() noexcept { evicted_.fetch_add(1, std::memory_order_relaxed); }
    void recordUnresponsive() noexcept { unresponsive_.fetch_add(1, std::memory_order_relaxed); }
    void recordSpawnFailure() noexcept { spawnFailures_.fetch_add(1, std::memory_order_relaxed); }

    void recordCompletion(bool succeeded, bool abandoned, std::chrono::milliseconds latency) noexcept {
        if (abandoned) {
            abandoned_.fetch_add(1, std::memory_order_relaxed);
        }
        if (succeeded) {
            succeeded_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
        const auto ms = static_cast<std::uint64_t>(latency.count() < 0 ? 0 : latency.count());
        latencyCount_.fetch_add(1, std::memory_order_relaxed);
        latencySum_.fetch_add(ms, std::memory_order_relaxed);
        core::atomic_max(latencyMax_, ms);
        core::atomic_min(latencyMin_, ms);
    }

    Snapshot snapshot() const noexcept {
        Snapshot s;
        s.requestsTotal = requestsTotal_.load(std::memory_order_relaxed);
        s.requestsSucceeded = succeeded_.load(std::memory_order_relaxed);
        s.requestsFailed = failed_.load(std::memory_order_relaxed);
        s.requestsAbandoned = abandoned_.load(std::memory_order_relaxed);
        s.backpressureRejections = backpressure_.load(std::memory_order_relaxed);
        s.circuitRejections = circuit_.load(std::memory_order_relaxed);
        s.waitTimeouts = waitTimeouts_.load(std::memory_order_relaxed);
        s.workersSpawned = spawned_.load(std::memory_order_relaxed);
        s.workersEvicted = evicted_.load(std::memory_order_relaxed);
        s.workersUnresponsive = unresponsive_.load(std::memory_order_relaxed);
        s.spawnFailures = spawnFailures_.load(std::memory_order_relaxed);
        s.latencyCount = latencyCount_.load(std::memory_order_relaxed);
        s.latencySumMs = latencySum_.load(std::memory_order_relaxed);
        s.latencyMaxMs = latencyMax_.load(std::memory_order_relaxed);
        const auto min = latencyMin_.load(std::memory_order_relaxed);
        s.latencyMinMs = min == std::numeric_limits<std::uint64_t>::max() ? 0 : min;
        return s;
    }

private:
    std::atomic<std::uint64_t> requestsTotal_{0};
    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> abandoned_{0};
    std::atomic<std::uint64_t> backpressure_{0};
    std::atomic<std::uint64_t> circuit_{0};
    std::atomic<std::uint64_t> waitTimeouts_{0};
    std::atomic<std::uint64_t> spawned_{0};
    std::atomic<std::uint64_t> evicted_{0};
    std::atomic<std::uint64_t> unresponsive_{0};
    std::atomic<std::uint64_t> spawnFailures_{0};
    std::atomic<std::uint64_t> latencyCount_{0};
    std::atomic<std::uint64_t> latencySum_{0};
    std::atomic<std::uint64_t> latencyMax_{0};
    std::atomic<std::uint64_t> latencyMin_{std::numeric_limits<std::uint64_t>::max()};
};

} // namespace corral::pool
