// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/pool/LoadBalancer.h>
#include <corral/pool/Pool.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace corral::pool {

namespace {

struct LiveCounts {
    std::size_t live = 0;
    std::size_t spawning = 0;
    std::size_t dispatchable = 0;
    std::size_t serving = 0;
};

LiveCounts countLive(const Pool::WorkerList& workers) {
    LiveCounts c;
    for (const auto& w : workers) {
        const auto s = w->state();
        if (isLive(s))
            ++c.live;
        if (s == WorkerState::Spawning)
            ++c.spawning;
        if (isDispatchable(s))
            ++c.dispatchable;
        if (isServing(s))
            ++c.serving;
    }
    return c;
}

} // namespace

Pool::Pool(CapabilityKey key, PoolConfig config, CapabilityLoader loader,
           std::shared_ptr<MemoryGovernor> governor)
    : key_(std::move(key)), config_(std::move(config)), loader_(std::move(loader)),
      governor_(std::move(governor)), breaker_(key_.toString(), config_.breaker),
      workers_(std::make_shared<const WorkerList>()) {
    spdlog::info("[Pool] {} created (min={}, max={}, pre-warm={}, {} MB/worker)",
                 key_.toString(), config_.minWorkers, config_.maxWorkers, config_.preWarmCount,
                 config_.memoryPerWorkerMb);
}

Pool::~Pool() {
    shutdown();
}

// ============================================================================
// Structural changes (structureMutex_ held)
// ============================================================================

std::size_t Pool::spawnLocked(std::size_t count, WorkerList& next) {
    std::size_t spawned = 0;
    for (std::size_t i = 0; i < count; ++i) {
        auto allocation = governor_->tryAllocate(config_.memoryPerWorkerMb);
        if (!allocation) {
            spdlog::debug("[Pool] {} cannot spawn: {}", key_.toString(),
                          allocation.error().message);
            break;
        }
        WorkerOptions options;
        options.queueCapacity = config_.queueCapacity;
        options.device = config_.device;
        auto worker = std::make_shared<Worker>(nextWorkerId_.fetch_add(1), key_, loader_,
                                               std::move(allocation).value(), options, this);
        next.push_back(worker);
        worker->start();
        metrics_.recordSpawn();
        ++spawned;
        spdlog::info("[Pool] {} spawning worker #{} ({} MB reserved, {} MB available)",
                     key_.toString(), worker->id(), config_.memoryPerWorkerMb,
                     governor_->availableMb());
    }
    return spawned;
}

void Pool::publishLocked(WorkerList next) {
    workers_.store(std::make_shared<const WorkerList>(std::move(next)), std::memory_order_release);
    notifyWaiters();
}

void Pool::retireLocked(const std::shared_ptr<Worker>& worker, WorkerList& next) {
    auto it = std::find(next.begin(), next.end(), worker);
    if (it != next.end()) {
        next.erase(it);
    }
    retired_.push_back(worker);
}

std::size_t Pool::reapLocked(WorkerList& next) {
    std::size_t reaped = 0;
    for (auto it = next.begin(); it != next.end();) {
        if ((*it)->state() == WorkerState::Dead) {
            retired_.push_back(*it);
            it = next.erase(it);
        } else {
            ++it;
        }
    }
    for (auto it = retired_.begin(); it != retired_.end();) {
        if ((*it)->exited()) {
            spdlog::debug("[Pool] {} reaped worker #{}", key_.toString(), (*it)->id());
            it = retired_.erase(it);
            ++reaped;
        } else {
            ++it;
        }
    }
    return reaped;
}

// ============================================================================
// Capacity
// ============================================================================

Result<void> Pool::ensureCapacity() {
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::SystemShutdown, fmt::format("pool {} is shut down", key_.toString())};
    }

    {
        const auto snapshot = workers();
        const auto c = countLive(*snapshot);
        if (c.live > 0 && c.live >= config_.minWorkers &&
            (c.dispatchable > 0 || c.spawning > 0 || c.live >= config_.maxWorkers)) {
            return {};
        }
    }

    std::lock_guard<std::mutex> lock(structureMutex_);
    auto next = *workers();
    reapLocked(next);
    const auto c = countLive(next);

    if (c.live == 0) {
        const auto target = std::clamp<std::size_t>(
            std::max(config_.preWarmCount, config_.minWorkers), 1, config_.maxWorkers);
        const auto spawned = spawnLocked(target, next);
        publishLocked(std::move(next));
        if (spawned == 0) {
            return Error{ErrorCode::MemoryExhausted,
                         fmt::format("{} needs {} MB per worker, {} MB available",
                                     key_.toString(), config_.memoryPerWorkerMb,
                                     governor_->availableMb())};
        }
        if (spawned < target) {
            spdlog::warn("[Pool] {} pre-warmed {} of {} workers (memory budget)", key_.toString(),
                         spawned, target);
        }
        return {};
    }

    if (c.live < config_.minWorkers) {
        spawnLocked(config_.minWorkers - c.live, next);
    } else if (c.dispatchable == 0 && c.spawning == 0 && c.live < config_.maxWorkers) {
        if (spawnLocked(1, next) == 1) {
            spdlog::info("[Pool] {} scaling up: all {} workers busy", key_.toString(), c.live);
        }
    }
    publishLocked(std::move(next));
    return {};
}

void Pool::notifyWaiters() {
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
    }
    readyCv_.notify_all();
}

Result<void> Pool::waitForWorkers(std::chrono::milliseconds timeout) {
    Result<void> verdict;
    std::unique_lock<std::mutex> lock(readyMutex_);
    const bool settled = readyCv_.wait_for(lock, timeout, [&] {
        if (shuttingDown_.load(std::memory_order_acquire)) {
            verdict = Error{ErrorCode::SystemShutdown};
            return true;
        }
        const auto snapshot = workers();
        const auto c = countLive(*snapshot);
        if (c.serving > 0) {
            verdict = Result<void>{};
            return true;
        }
        if (c.spawning == 0) {
            // A worker that failed to load is Dead before its error is recorded.
            if (!lastSpawnError_ &&
                std::any_of(snapshot->begin(), snapshot->end(), [](const auto& w) {
                    return w->state() == WorkerState::Dead && !w->exited();
                })) {
                return false;
            }
            verdict = lastSpawnError_
                          ? *lastSpawnError_
                          : Error{ErrorCode::NoWorkerAvailable,
                                  fmt::format("pool {} has no workers", key_.toString())};
            return true;
        }
        return false;
    });

    if (!settled) {
        metrics_.recordWaitTimeout();
        return Error{ErrorCode::Timeout, fmt::format("no worker for {} became ready within {}ms",
                                                     key_.toString(), timeout.count())};
    }
    return verdict;
}

// ============================================================================
// Dispatch
// ============================================================================

std::shared_ptr<Worker> Pool::selectWorker() const {
    const auto snapshot = workers();
    WorkerList candidates;
    candidates.reserve(snapshot->size());
    for (const auto& w : *snapshot) {
        if (isDispatchable(w->state())) {
            candidates.push_back(w);
        }
    }
    return pool::selectWorker(candidates);
}

std::shared_ptr<Worker> Pool::selectBusyWorker() const {
    const auto snapshot = workers();
    WorkerList candidates;
    for (const auto& w : *snapshot) {
        if (w->state() == WorkerState::Busy) {
            candidates.push_back(w);
        }
    }
    return pool::selectWorker(candidates);
}

Result<ResponseStream> Pool::submit(const GenerationRequest& request) {
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::SystemShutdown, fmt::format("pool {} is shut down", key_.toString())};
    }

    Error last{ErrorCode::NoWorkerAvailable,
               fmt::format("pool {} has no serving worker", key_.toString())};
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto worker = selectWorker();
        if (!worker) {
            auto ensured = ensureCapacity();
            if (!ensured) {
                return ensured.error();
            }
            worker = selectWorker();
        }
        if (!worker) {
            worker = selectBusyWorker();
        }
        if (!worker) {
            break;
        }

        auto stream = worker->submit(request);
        if (stream) {
            metrics_.recordRequest();
            return stream;
        }
        last = stream.error();
        if (last.code == ErrorCode::QueueFull) {
            metrics_.recordBackpressure();
            spdlog::debug("[Pool] {} worker #{} queue full (attempt {})", key_.toString(),
                          worker->id(), attempt + 1);
            continue;
        }
        if (last.code != ErrorCode::InvalidState) {
            return last;
        }
    }
    if (last.code == ErrorCode::InvalidState) {
        last = Error{ErrorCode::NoWorkerAvailable, last.message};
    }
    return last;
}

// ============================================================================
// Maintenance
// ============================================================================

MaintenanceReport Pool::runMaintenance(TimePoint now) {
    MaintenanceReport report;
    if (shuttingDown_.load(std::memory_order_acquire)) {
        return report;
    }

    // Probes touch only atomics; no structural lock needed.
    WorkerList stale;
    WorkerList stalledLoads;
    for (const auto& w : *workers()) {
        const auto state = w->state();
        if (state == WorkerState::Spawning) {
            if (now - w->createdAt() > config_.loadTimeout) {
                stalledLoads.push_back(w);
            }
            continue;
        }
        if (!isServing(state)) {
            continue;
        }
        ++report.probed;
        if (w->healthProbe(now, config_.healthStaleAfter) == ProbeVerdict::Stale) {
            stale.push_back(w);
        }
    }

    std::lock_guard<std::mutex> lock(structureMutex_);
    auto next = *workers();

    for (const auto& w : stale) {
        if (std::find(next.begin(), next.end(), w) == next.end()) {
            continue;
        }
        w->abandon(fmt::format("no probe reply within {}ms", config_.healthStaleAfter.count()));
        retireLocked(w, next);
        metrics_.recordUnresponsive();
        breaker_.recordFailure();
        ++report.unresponsive;
    }

    for (const auto& w : stalledLoads) {
        if (w->state() != WorkerState::Spawning ||
            std::find(next.begin(), next.end(), w) == next.end()) {
            continue;
        }
        w->abandon(fmt::format("still loading after {}ms", config_.loadTimeout.count()));
        retireLocked(w, next);
        recordSpawnFailure(Error{ErrorCode::SpawnFailed,
                                 fmt::format("{} worker #{} did not load within {}ms",
                                             key_.toString(), w->id(),
                                             config_.loadTimeout.count())});
        ++report.stalledLoads;
    }

    std::size_t live = countLive(next).live;
    WorkerList idle;
    for (const auto& w : next) {
        if (isDispatchable(w->state()) && w->activeRequests() == 0 &&
            now - w->lastUsedAt() >= config_.idleTimeout) {
            idle.push_back(w);
        }
    }
    std::sort(idle.begin(), idle.end(),
              [](const auto& a, const auto& b) { return a->lastUsedAt() < b->lastUsedAt(); });
    for (const auto& w : idle) {
        if (live <= config_.minWorkers) {
            break;
        }
        if (w->beginEviction()) {
            retireLocked(w, next);
            metrics_.recordEviction();
            --live;
            ++report.evicted;
        }
    }

    report.reaped = reapLocked(next);
    live = countLive(next).live;
    if (live < config_.minWorkers) {
        report.spawned = spawnLocked(config_.minWorkers - live, next);
    }
    publishLocked(std::move(next));

    const auto mem = governor_->stats();
    spdlog::debug("[Pool] {} maintenance: probed={} unresponsive={} stalled-loads={} evicted={} "
                  "reaped={} spawned={} memory {}/{} MB ({})",
                  key_.toString(), report.probed, report.unresponsive, report.stalledLoads,
                  report.evicted, report.reaped, report.spawned, mem.reservedMb, mem.budgetMb,
                  memoryPressureName(mem.pressure));
    return report;
}

void Pool::shutdown() {
    if (shuttingDown_.exchange(true)) {
        return;
    }

    WorkerList all;
    {
        std::lock_guard<std::mutex> lock(structureMutex_);
        all = *workers();
        all.insert(all.end(), retired_.begin(), retired_.end());
        retired_.clear();
        workers_.store(std::make_shared<const WorkerList>(), std::memory_order_release);
    }
    notifyWaiters();

    for (const auto& w : all) {
        w->stop();
    }
    std::size_t detached = 0;
    for (const auto& w : all) {
        // An abandoned worker may never return from its capability; its thread
        // keeps the worker alive and it has no path back to this pool.
        if (w->abandoned()) {
            ++detached;
            continue;
        }
        w->join();
    }
    spdlog::info("[Pool] {} shut down ({} workers stopped, {} abandoned left running)",
                 key_.toString(), all.size() - detached, detached);
}

// ============================================================================
// Observer callbacks (worker threads)
// ============================================================================

void Pool::onWorkerReady(Worker& worker) {
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        lastSpawnError_.reset();
    }
    readyCv_.notify_all();
    spdlog::debug("[Pool] {} worker #{} ready", key_.toString(), worker.id());
}

void Pool::onWorkerSpawnFailed(Worker& worker, const Error& error) {
    recordSpawnFailure(error);
    spdlog::warn("[Pool] {} worker #{} spawn failed: {}", key_.toString(), worker.id(),
                 error.message);
}

void Pool::recordSpawnFailure(const Error& error) {
    metrics_.recordSpawnFailure();
    breaker_.recordFailure();
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        lastSpawnError_ = error;
    }
    readyCv_.notify_all();
}

void Pool::onRequestFinished(Worker& worker, const RequestOutcome& outcome) {
    metrics_.recordCompletion(outcome.succeeded, outcome.abandoned, outcome.latency);
    if (outcome.abandoned) {
        breaker_.recordNeutral();
    } else if (outcome.succeeded) {
        breaker_.recordSuccess();
    } else {
        breaker_.recordFailure();
        spdlog::debug("[Pool] {} worker #{} request failed: {}", key_.toString(), worker.id(),
                      outcome.error);
    }
}

void Pool::onWorkerExited(Worker& worker) {
    notifyWaiters();
    spdlog::debug("[Pool] {} worker #{} exited", key_.toString(), worker.id());
}

// ============================================================================
// Introspection
// ============================================================================

std::size_t Pool::liveWorkerCount() const {
    return countLive(*workers()).live;
}

WorkerCounts Pool::workerCounts() const {
    WorkerCounts counts;
    for (const auto& w : *workers()) {
        switch (w->state()) {
            case WorkerState::Spawning:
                ++counts.spawning;
                break;
            case WorkerState::Ready:
                ++counts.ready;
                break;
            case WorkerState::Busy:
                ++counts.busy;
                break;
            case WorkerState::Idle:
                ++counts.idle;
                break;
            default:
                ++counts.retiring;
                break;
        }
    }
    counts.total = counts.spawning + counts.ready + counts.busy + counts.idle;
    return counts;
}

PoolHealth Pool::health() const {
    PoolHealth h;
    h.model = key_.modelId;
    h.kind = std::string(capabilityKindName(key_.kind));
    h.workers = workerCounts();
    for (const auto& w : *workers()) {
        h.queueDepth += w->queueDepth();
    }
    h.minWorkers = config_.minWorkers;
    h.maxWorkers = config_.maxWorkers;
    h.breaker = breaker_.state();
    h.metrics = metrics_.snapshot();

    bool spawnBroken = false;
    {
        std::lock_guard<std::mutex> lock(readyMutex_);
        spawnBroken = lastSpawnError_.has_value() && h.workers.total == 0;
    }
    if (h.breaker == BreakerState::Open || spawnBroken) {
        h.status = HealthStatus::Unhealthy;
    } else if (h.breaker == BreakerState::HalfOpen ||
               (h.workers.total > 0 && h.workers.ready + h.workers.idle == 0)) {
        h.status = HealthStatus::Degraded;
    }
    return h;
}

} // namespace corral::pool
