// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/core/atomic_utils.h>
#include <corral/pool/Worker.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace corral::pool {

namespace {

std::int64_t toNs(std::chrono::steady_clock::time_point tp) noexcept {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

std::chrono::steady_clock::time_point fromNs(std::int64_t ns) noexcept {
    return std::chrono::steady_clock::time_point(
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::nanoseconds(ns)));
}

constexpr const char* kRetryElsewhere = "retry on another worker";

} // namespace

Worker::Worker(std::uint64_t id, CapabilityKey key, CapabilityLoader loader,
               AllocationGuard allocation, WorkerOptions options, WorkerObserver* observer)
    : id_(id), key_(std::move(key)), loader_(std::move(loader)),
      allocation_(std::move(allocation)), options_(std::move(options)), observer_(observer),
      createdAt_(std::chrono::steady_clock::now()), queue_(options_.queueCapacity) {
    lastUsedNs_.store(toNs(createdAt_));
    lastActivityNs_.store(toNs(createdAt_));
}

Worker::~Worker() {
    queue_.close();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            // The thread released the last reference on its way out.
            thread_.detach();
        } else {
            thread_.request_stop();
            thread_.join();
        }
    }
    allocation_.release();
}

template <typename Fn> void Worker::notify(Fn&& fn) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    if (observer_) {
        fn(*observer_);
    }
}

std::string Worker::label() const {
    return fmt::format("{}#{}", key_.toString(), id_);
}

void Worker::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::jthread(
        [this, self = weak_from_this().lock()](std::stop_token stop) { run(stop); });
}

Worker::TimePoint Worker::lastUsedAt() const noexcept {
    return fromNs(lastUsedNs_.load(std::memory_order_acquire));
}

std::chrono::milliseconds Worker::meanLatency() const noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::microseconds(meanLatencyUs_.load(std::memory_order_relaxed)));
}

// ============================================================================
// Request path
// ============================================================================

Result<ResponseStream> Worker::submit(const GenerationRequest& request) {
    const auto current = state_.load();
    if (!isServing(current)) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("worker {} is {}", label(), workerStateName(current))};
    }

    const auto limit = static_cast<std::uint32_t>(queue_.capacity());
    if (!core::increment_if_below(active_, limit)) {
        return Error{ErrorCode::QueueFull,
                     fmt::format("worker {} at concurrency limit {}", label(), limit)};
    }

    // Eviction may have won the race between the check above and the increment.
    if (!isServing(state_.load())) {
        core::decrement_if_positive(active_);
        return Error{ErrorCode::InvalidState, fmt::format("worker {} stopped accepting", label())};
    }

    auto [sink, stream] = makeResponseChannel();
    const auto now = std::chrono::steady_clock::now();
    if (!queue_.tryPush(PendingRequest{request, std::move(sink), now})) {
        core::decrement_if_positive(active_);
        return Error{ErrorCode::InvalidState, fmt::format("worker {} queue closed", label())};
    }
    lastUsedNs_.store(toNs(now), std::memory_order_release);
    spdlog::debug("[Worker] {} accepted request (active={})", label(), active_.load());
    return std::move(stream);
}

ProbeVerdict Worker::healthProbe(TimePoint now, std::chrono::milliseconds staleAfter) {
    const auto sent = probeSeq_.load(std::memory_order_acquire);
    const auto acked = ackSeq_.load(std::memory_order_acquire);
    if (acked >= sent) {
        probeSentNs_.store(toNs(now), std::memory_order_release);
        probeSeq_.store(sent + 1, std::memory_order_release);
        queue_.wake();
        return ProbeVerdict::Healthy;
    }

    const auto window = std::max<std::chrono::milliseconds>(staleAfter, meanLatency() * 2);
    const auto reference = std::max(probeSentNs_.load(std::memory_order_acquire),
                                    lastActivityNs_.load(std::memory_order_acquire));
    if (now - fromNs(reference) > window) {
        return ProbeVerdict::Stale;
    }
    return ProbeVerdict::Pending;
}

void Worker::acknowledgeProbe() noexcept {
    ackSeq_.store(probeSeq_.load(std::memory_order_acquire), std::memory_order_release);
    lastActivityNs_.store(toNs(std::chrono::steady_clock::now()), std::memory_order_release);
}

void Worker::noteProgress() noexcept {
    acknowledgeProbe();
}

// ============================================================================
// Lifecycle control
// ============================================================================

bool Worker::beginEviction() {
    if (active_.load(std::memory_order_acquire) != 0) {
        return false;
    }
    if (!state_.transition(WorkerState::Idle, WorkerState::Evicting) &&
        !state_.transition(WorkerState::Ready, WorkerState::Evicting)) {
        return false;
    }
    queue_.close();
    spdlog::info("[Worker] {} evicting after idle timeout", label());
    return true;
}

void Worker::stop() {
    if (auto previous = state_.advance(WorkerState::Evicting)) {
        spdlog::debug("[Worker] {} stopping from {}", label(), workerStateName(*previous));
    }
    queue_.close();
}

void Worker::abandon(const std::string& reason) {
    if (abandoned_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(observerMutex_);
        observer_ = nullptr;
    }
    state_.advance(WorkerState::Unresponsive);
    queue_.close();

    const auto message = fmt::format("worker {} unresponsive ({}); {}", label(), reason,
                                     kRetryElsewhere);
    for (auto& pending : queue_.drain()) {
        pending.sink.fail(ErrorCode::WorkerUnresponsive, message);
        core::decrement_if_positive(active_);
    }
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        if (inflight_) {
            inflight_->fail(ErrorCode::WorkerUnresponsive, message);
        }
    }
    allocation_.release();
    state_.advance(WorkerState::Dead);
    spdlog::warn("[Worker] {} abandoned: {}", label(), reason);
}

void Worker::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

// ============================================================================
// Worker thread
// ============================================================================

void Worker::run(std::stop_token stop) {
    if (!load()) {
        return;
    }

    while (!queue_.finished()) {
        auto item = queue_.popWait(options_.pollInterval);
        acknowledgeProbe();
        if (item) {
            process(*item);
        } else if (stop.stop_requested() && queue_.closed()) {
            break;
        }
    }
    finish();
}

bool Worker::load() {
    spdlog::debug("[Worker] {} loading on {}", label(), options_.device.device);
    Result<std::unique_ptr<ICapability>> loaded = [&]() -> Result<std::unique_ptr<ICapability>> {
        try {
            return loader_(options_.device);
        } catch (const std::exception& e) {
            return Error{ErrorCode::SpawnFailed, e.what()};
        }
    }();

    if (!loaded || !loaded.value()) {
        const Error error{ErrorCode::SpawnFailed,
                          fmt::format("{} failed to load: {}", label(),
                                      loaded ? std::string("loader returned no instance")
                                             : loaded.error().message)};
        spdlog::error("[Worker] {}", error.message);
        queue_.close();
        allocation_.release();
        state_.advance(WorkerState::Dead);
        notify([&](WorkerObserver& o) { o.onWorkerSpawnFailed(*this, error); });
        exited_.store(true, std::memory_order_release);
        return false;
    }

    capability_ = std::move(loaded).value();
    const auto now = std::chrono::steady_clock::now();
    lastUsedNs_.store(toNs(now), std::memory_order_release);
    acknowledgeProbe();

    if (!state_.transition(WorkerState::Spawning, WorkerState::Ready)) {
        // Stopped while loading.
        finish();
        return false;
    }
    spdlog::info("[Worker] {} ready ({} in {}ms)", label(), capability_->name(),
                 std::chrono::duration_cast<std::chrono::milliseconds>(now - createdAt_).count());
    notify([&](WorkerObserver& o) { o.onWorkerReady(*this); });
    return true;
}

void Worker::process(PendingRequest& item) {
    if (abandoned_.load(std::memory_order_acquire)) {
        item.sink.fail(ErrorCode::WorkerUnresponsive,
                       fmt::format("worker {} unresponsive; {}", label(), kRetryElsewhere));
        core::decrement_if_positive(active_);
        return;
    }

    if (!state_.transition(WorkerState::Ready, WorkerState::Busy)) {
        state_.transition(WorkerState::Idle, WorkerState::Busy);
    }
    const auto started = std::chrono::steady_clock::now();
    lastUsedNs_.store(toNs(started), std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        inflight_ = item.sink;
    }
    item.sink.onProgress([this] { noteProgress(); });

    Result<void> generated;
    try {
        generated = capability_->generate(item.request, item.sink);
    } catch (const std::exception& e) {
        generated = Error{ErrorCode::InternalError, e.what()};
    }

    if (!generated) {
        item.sink.fail(generated.error().code, generated.error().message);
    } else if (!item.sink.terminated() && !item.sink.consumerGone()) {
        item.sink.fail(ErrorCode::InternalError, "capability ended without a terminal chunk");
    }
    {
        std::lock_guard<std::mutex> lock(inflightMutex_);
        inflight_.reset();
    }

    const auto finished = std::chrono::steady_clock::now();
    RequestOutcome outcome;
    outcome.succeeded = item.sink.succeeded();
    outcome.abandoned = item.sink.consumerGone();
    outcome.error = outcome.succeeded ? ErrorCode::Success
                    : generated       ? ErrorCode::RequestFailed
                                      : generated.error().code;
    outcome.latency = std::chrono::duration_cast<std::chrono::milliseconds>(finished - started);
    outcome.chunks = item.sink.chunksSent();

    if (outcome.succeeded) {
        completed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        failed_.fetch_add(1, std::memory_order_relaxed);
    }
    const auto sampleUs =
        std::chrono::duration_cast<std::chrono::microseconds>(finished - started).count();
    const auto previousUs = meanLatencyUs_.load(std::memory_order_relaxed);
    meanLatencyUs_.store(previousUs == 0 ? sampleUs : (previousUs * 4 + sampleUs) / 5,
                         std::memory_order_relaxed);

    lastUsedNs_.store(toNs(finished), std::memory_order_release);
    core::decrement_if_positive(active_);
    if (active_.load(std::memory_order_acquire) == 0) {
        state_.transition(WorkerState::Busy, WorkerState::Idle);
    }
    acknowledgeProbe();

    if (outcome.abandoned) {
        spdlog::debug("[Worker] {} consumer abandoned stream after {} chunks", label(),
                      outcome.chunks);
    }
    notify([&](WorkerObserver& o) { o.onRequestFinished(*this, outcome); });
}

void Worker::finish() {
    capability_.reset();
    allocation_.release();
    if (!state_.advance(WorkerState::Dead)) {
        state_.advance(WorkerState::Evicting);
        state_.advance(WorkerState::Dead);
    }
    spdlog::info("[Worker] {} stopped (completed={}, failed={})", label(), completed_.load(),
                 failed_.load());
    exited_.store(true, std::memory_order_release);
    notify([&](WorkerObserver& o) { o.onWorkerExited(*this); });
}

} // namespace corral::pool
