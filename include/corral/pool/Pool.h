// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>
#include <corral/pool/Capability.h>
#include <corral/pool/CapabilityKey.h>
#include <corral/pool/CircuitBreaker.h>
#include <corral/pool/MemoryGovernor.h>
#include <corral/pool/PoolConfig.h>
#include <corral/pool/PoolHealth.h>
#include <corral/pool/PoolMetrics.h>
#include <corral/pool/ResponseStream.h>
#include <corral/pool/Worker.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace corral::pool {

struct MaintenanceReport {
    std::size_t probed = 0;
    std::size_t unresponsive = 0;
    std::size_t stalledLoads = 0; ///< Spawning workers abandoned past loadTimeout
    std::size_t evicted = 0;
    std::size_t reaped = 0;
    std::size_t spawned = 0;
};

/**
 * Dynamic worker set for one capability key.
 *
 * Readers (dispatch) load an immutable snapshot of the worker list through an
 * atomic shared_ptr and never lock. Writers (spawn, evict, reap) hold
 * structureMutex_, build a new list and publish it, so at most one structural
 * change is in flight.
 */
class Pool : public WorkerObserver {
public:
    using WorkerList = std::vector<std::shared_ptr<Worker>>;
    using TimePoint = std::chrono::steady_clock::time_point;

    Pool(CapabilityKey key, PoolConfig config, CapabilityLoader loader,
         std::shared_ptr<MemoryGovernor> governor);
    ~Pool() override;

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    /// Cold start: pre-warm up to preWarmCount (at least minWorkers), taking
    /// whatever the budget grants; MemoryExhausted only when nothing fits.
    /// Warm: tops up to minWorkers, then adds one worker when every live
    /// worker is Busy and maxWorkers allows.
    Result<void> ensureCapacity();

    /// Blocks until a worker has finished loading and is serving (Ready, Busy
    /// or Idle). SpawnFailed when every spawned worker died while loading,
    /// Timeout when the bound elapses.
    Result<void> waitForWorkers(std::chrono::milliseconds timeout);

    /// Power-of-Two-Choices among Ready/Idle workers; nullptr if none.
    std::shared_ptr<Worker> selectWorker() const;

    /// Select and enqueue, retrying selection once on a full queue.
    Result<ResponseStream> submit(const GenerationRequest& request);

    /// One maintenance pass: health probes, load deadlines, idle eviction,
    /// reaping, min top-up.
    MaintenanceReport runMaintenance(TimePoint now = std::chrono::steady_clock::now());

    /// Stops admission and tears every worker down. Idempotent.
    void shutdown();

    const CapabilityKey& key() const noexcept { return key_; }
    const PoolConfig& config() const noexcept { return config_; }
    CircuitBreaker& circuitBreaker() noexcept { return breaker_; }
    const CircuitBreaker& circuitBreaker() const noexcept { return breaker_; }
    PoolMetrics& metrics() noexcept { return metrics_; }
    const PoolMetrics& metrics() const noexcept { return metrics_; }

    /// Current published worker list (includes workers still Spawning).
    std::shared_ptr<const WorkerList> workers() const {
        return workers_.load(std::memory_order_acquire);
    }
    std::size_t liveWorkerCount() const;
    WorkerCounts workerCounts() const;
    PoolHealth health() const;

    // WorkerObserver
    void onWorkerReady(Worker& worker) override;
    void onWorkerSpawnFailed(Worker& worker, const Error& error) override;
    void onRequestFinished(Worker& worker, const RequestOutcome& outcome) override;
    void onWorkerExited(Worker& worker) override;

private:
    // All of these require structureMutex_.
    std::size_t spawnLocked(std::size_t count, WorkerList& next);
    void publishLocked(WorkerList next);
    std::size_t reapLocked(WorkerList& next);
    void retireLocked(const std::shared_ptr<Worker>& worker, WorkerList& next);

    std::shared_ptr<Worker> selectBusyWorker() const;
    void recordSpawnFailure(const Error& error);
    void notifyWaiters();

    const CapabilityKey key_;
    const PoolConfig config_;
    CapabilityLoader loader_;
    std::shared_ptr<MemoryGovernor> governor_;
    CircuitBreaker breaker_;
    PoolMetrics metrics_;

    std::atomic<std::shared_ptr<const WorkerList>> workers_;
    std::atomic<bool> shuttingDown_{false};
    std::atomic<std::uint64_t> nextWorkerId_{1};

    std::mutex structureMutex_;
    WorkerList retired_; // Evicting/abandoned workers whose threads have not exited

    mutable std::mutex readyMutex_;
    std::condition_variable readyCv_;
    std::optional<Error> lastSpawnError_;
};

} // namespace corral::pool
