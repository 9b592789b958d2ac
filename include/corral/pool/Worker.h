// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>
#include <corral/pool/Capability.h>
#include <corral/pool/CapabilityKey.h>
#include <corral/pool/MemoryGovernor.h>
#include <corral/pool/ResponseStream.h>
#include <corral/pool/WorkerQueue.h>
#include <corral/pool/WorkerState.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace corral::pool {

class Worker;

struct RequestOutcome {
    bool succeeded = false;
    bool abandoned = false; ///< Consumer dropped the stream before the end
    ErrorCode error = ErrorCode::Success;
    std::chrono::milliseconds latency{0};
    std::size_t chunks = 0;
};

/// Lifecycle notifications, delivered on the worker's own thread. Handlers
/// must not block on pool structure changes.
class WorkerObserver {
public:
    virtual ~WorkerObserver() = default;
    virtual void onWorkerReady(Worker& worker) = 0;
    virtual void onWorkerSpawnFailed(Worker& worker, const Error& error) = 0;
    virtual void onRequestFinished(Worker& worker, const RequestOutcome& outcome) = 0;
    virtual void onWorkerExited(Worker& worker) = 0;
};

struct WorkerOptions {
    std::size_t queueCapacity = 32;             ///< Accepted-but-unfinished request limit
    DeviceConfig device{};
    std::chrono::milliseconds pollInterval{50}; ///< Idle wake-up for probe replies
};

enum class ProbeVerdict : std::uint8_t { Healthy, Pending, Stale };

/**
 * One loaded capability instance with its own thread and inbound queue.
 *
 * The thread loads the capability (Spawning), then processes queued requests
 * strictly in arrival order. The allocation guard is owned here and released
 * on every exit path: load failure, eviction, shutdown or abandonment.
 *
 * When owned by a shared_ptr the thread holds a reference to its worker, so an
 * abandoned worker stuck inside its capability outlives the pool that gave it up.
 */
class Worker : public std::enable_shared_from_this<Worker> {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    Worker(std::uint64_t id, CapabilityKey key, CapabilityLoader loader,
           AllocationGuard allocation, WorkerOptions options, WorkerObserver* observer = nullptr);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// Launches the worker thread. Loading happens there.
    void start();

    /// Enqueue only; completion is observed through the returned stream.
    /// QueueFull when the concurrency limit is reached, InvalidState when the
    /// worker is not serving.
    Result<ResponseStream> submit(const GenerationRequest& request);

    /// Non-blocking request/acknowledge exchange. Healthy when the previous
    /// probe was answered (a new one is issued), Pending while waiting, Stale
    /// when neither an answer nor streaming progress happened within
    /// max(staleAfter, 2 x mean request latency).
    ProbeVerdict healthProbe(TimePoint now, std::chrono::milliseconds staleAfter);

    /// Idle eviction: Ready/Idle with nothing in flight -> Evicting.
    bool beginEviction();

    /// Shutdown: any live state -> Evicting, queue closed, remaining work drained.
    void stop();

    /// Forced removal of an unresponsive worker: fails queued and in-flight
    /// streams with WorkerUnresponsive, releases memory, marks Dead. Detaches
    /// the observer; once this returns no further callbacks are delivered.
    void abandon(const std::string& reason);

    /// Waits for the worker thread to exit. No-op from the worker thread itself.
    void join();

    std::uint64_t id() const noexcept { return id_; }
    const CapabilityKey& key() const noexcept { return key_; }
    WorkerState state() const noexcept { return state_.load(); }
    TimePoint createdAt() const noexcept { return createdAt_; }
    TimePoint lastUsedAt() const noexcept;
    std::uint32_t activeRequests() const noexcept { return active_.load(std::memory_order_acquire); }
    std::size_t queueDepth() const { return queue_.size(); }
    std::size_t concurrencyLimit() const noexcept { return queue_.capacity(); }
    std::uint64_t completedRequests() const noexcept { return completed_.load(); }
    std::uint64_t failedRequests() const noexcept { return failed_.load(); }
    std::uint64_t allocationMb() const noexcept { return allocation_.sizeMb(); }
    std::chrono::milliseconds meanLatency() const noexcept;
    bool exited() const noexcept { return exited_.load(std::memory_order_acquire); }
    bool abandoned() const noexcept { return abandoned_.load(std::memory_order_acquire); }
    std::string label() const;

private:
    struct PendingRequest {
        GenerationRequest request;
        ChunkSink sink;
        TimePoint enqueuedAt;
    };

    void run(std::stop_token stop);
    bool load();
    void process(PendingRequest& item);
    void acknowledgeProbe() noexcept;
    void noteProgress() noexcept;
    void finish();
    template <typename Fn> void notify(Fn&& fn);

    const std::uint64_t id_;
    const CapabilityKey key_;
    CapabilityLoader loader_;
    AllocationGuard allocation_;
    const WorkerOptions options_;
    std::mutex observerMutex_;
    WorkerObserver* observer_;
    const TimePoint createdAt_;

    AtomicWorkerState state_{WorkerState::Spawning};
    WorkerQueue<PendingRequest> queue_;
    std::unique_ptr<ICapability> capability_;

    std::atomic<std::uint32_t> active_{0};
    std::atomic<std::int64_t> lastUsedNs_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::int64_t> meanLatencyUs_{0};
    std::atomic<bool> abandoned_{false};
    std::atomic<bool> exited_{false};

    // Probe exchange
    std::atomic<std::uint64_t> probeSeq_{0};
    std::atomic<std::uint64_t> ackSeq_{0};
    std::atomic<std::int64_t> probeSentNs_{0};
    std::atomic<std::int64_t> lastActivityNs_{0};

    std::mutex inflightMutex_;
    std::optional<ChunkSink> inflight_;

    std::jthread thread_;
};

} // namespace corral::pool
