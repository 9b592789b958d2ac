// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/pool/CircuitBreaker.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace corral::pool {

CircuitBreaker::CircuitBreaker(std::string name, Config config)
    : name_(std::move(name)), config_(config) {
    if (config_.window.count() <= 0) {
        config_.window = std::chrono::milliseconds{1000};
    }
    config_.halfOpenMaxTrials = std::max<std::uint32_t>(1, config_.halfOpenMaxTrials);
    bucketWidth_ = std::max<std::chrono::nanoseconds>(
        std::chrono::nanoseconds{1},
        std::chrono::duration_cast<std::chrono::nanoseconds>(config_.window) /
            static_cast<std::int64_t>(kBuckets));
}

std::int64_t CircuitBreaker::slotFor(TimePoint now) const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count() /
           bucketWidth_.count();
}

CircuitBreaker::Bucket& CircuitBreaker::bucketFor(TimePoint now) {
    const auto slot = slotFor(now);
    auto& bucket = buckets_[static_cast<std::size_t>(slot % static_cast<std::int64_t>(kBuckets))];
    if (bucket.slot != slot) {
        bucket = Bucket{slot, 0, 0};
    }
    return bucket;
}

void CircuitBreaker::windowTotals(TimePoint now, std::uint64_t& requests,
                                  std::uint64_t& failures) const {
    const auto current = slotFor(now);
    const auto oldest = current - static_cast<std::int64_t>(kBuckets) + 1;
    requests = 0;
    failures = 0;
    for (const auto& bucket : buckets_) {
        if (bucket.slot >= oldest && bucket.slot <= current) {
            requests += bucket.requests;
            failures += bucket.failures;
        }
    }
}

void CircuitBreaker::clearWindow() {
    buckets_.fill(Bucket{});
}

void CircuitBreaker::tripOpen(TimePoint now, std::string_view reason) {
    openedAt_ = now;
    trialsInFlight_ = 0;
    ++timesOpened_;
    state_.store(static_cast<std::uint8_t>(BreakerState::Open), std::memory_order_release);
    spdlog::warn("[CircuitBreaker] {} opened: {} (cooldown {}ms)", name_, reason,
                 config_.cooldown.count());
}

bool CircuitBreaker::allowRequest(TimePoint now) {
    if (state() == BreakerState::Closed) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    switch (state()) {
        case BreakerState::Closed:
            return true;
        case BreakerState::Open:
            if (now - openedAt_ < config_.cooldown) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            state_.store(static_cast<std::uint8_t>(BreakerState::HalfOpen),
                         std::memory_order_release);
            trialsInFlight_ = 1;
            spdlog::info("[CircuitBreaker] {} half-open, admitting trial requests", name_);
            return true;
        case BreakerState::HalfOpen:
            if (trialsInFlight_ >= config_.halfOpenMaxTrials) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            ++trialsInFlight_;
            return true;
    }
    return false;
}

Result<void> CircuitBreaker::admit(TimePoint now) {
    if (allowRequest(now)) {
        return {};
    }
    return Error{ErrorCode::ServiceDegraded,
                 fmt::format("circuit breaker for '{}' is {}", name_, breakerStateName(state()))};
}

void CircuitBreaker::recordSuccess(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state() == BreakerState::HalfOpen) {
        clearWindow();
        trialsInFlight_ = 0;
        state_.store(static_cast<std::uint8_t>(BreakerState::Closed), std::memory_order_release);
        spdlog::info("[CircuitBreaker] {} closed after successful trial", name_);
        return;
    }
    ++bucketFor(now).requests;
}

void CircuitBreaker::recordFailure(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state()) {
        case BreakerState::HalfOpen:
            clearWindow();
            tripOpen(now, "trial request failed");
            return;
        case BreakerState::Open:
            // Late completions from before the trip; already failing fast.
            return;
        case BreakerState::Closed:
            break;
    }

    auto& bucket = bucketFor(now);
    ++bucket.requests;
    ++bucket.failures;

    std::uint64_t requests = 0;
    std::uint64_t failures = 0;
    windowTotals(now, requests, failures);
    if (requests < config_.minimumRequests) {
        return;
    }
    const double ratio = static_cast<double>(failures) / static_cast<double>(requests);
    if (ratio >= config_.failureRatio) {
        tripOpen(now, fmt::format("{}/{} failures in window", failures, requests));
    }
}

void CircuitBreaker::recordNeutral() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state() == BreakerState::HalfOpen && trialsInFlight_ > 0) {
        --trialsInFlight_;
    }
}

CircuitBreaker::Stats CircuitBreaker::stats(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats s;
    s.state = state();
    windowTotals(now, s.windowRequests, s.windowFailures);
    s.failureRatio = s.windowRequests == 0 ? 0.0
                                           : static_cast<double>(s.windowFailures) /
                                                 static_cast<double>(s.windowRequests);
    s.timesOpened = timesOpened_;
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.trialsInFlight = trialsInFlight_;
    return s;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    clearWindow();
    trialsInFlight_ = 0;
    state_.store(static_cast<std::uint8_t>(BreakerState::Closed), std::memory_order_release);
}

} // namespace corral::pool
