// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>

namespace corral::pool {

/// Configuration for CircuitBreaker
struct CircuitBreakerConfig {
    double failureRatio = 0.5;                       ///< Trip when failures/requests >= this
    std::uint32_t minimumRequests = 5;               ///< Ignore the ratio below this many samples
    std::chrono::milliseconds window{30000};         ///< Rolling window length
    std::chrono::milliseconds cooldown{60000};       ///< Open -> HalfOpen delay
    std::uint32_t halfOpenMaxTrials = 3;             ///< Concurrent trials while HalfOpen
};

enum class BreakerState : std::uint8_t { Closed = 0, Open = 1, HalfOpen = 2 };

constexpr std::string_view breakerStateName(BreakerState state) noexcept {
    switch (state) {
        case BreakerState::Closed:
            return "Closed";
        case BreakerState::Open:
            return "Open";
        case BreakerState::HalfOpen:
            return "HalfOpen";
    }
    return "Unknown";
}

/// Per-pool fail-fast gate driven by a rolling failure ratio.
///
/// The window is split into fixed buckets keyed by time slot; stale buckets
/// are zeroed lazily when their slot comes around again. All time-dependent
/// calls take an explicit `now` so behaviour can be driven deterministically.
class CircuitBreaker {
public:
    using Config = CircuitBreakerConfig;
    using TimePoint = std::chrono::steady_clock::time_point;

    static constexpr std::size_t kBuckets = 10;

    struct Stats {
        BreakerState state = BreakerState::Closed;
        std::uint64_t windowRequests = 0;
        std::uint64_t windowFailures = 0;
        double failureRatio = 0.0;
        std::uint64_t timesOpened = 0;
        std::uint64_t rejected = 0;
        std::uint32_t trialsInFlight = 0;
    };

    explicit CircuitBreaker(std::string name, Config config = {});

    /// Admission check. Closed admits; Open rejects until the cooldown has
    /// elapsed, then flips to HalfOpen; HalfOpen admits up to the trial cap.
    bool allowRequest(TimePoint now = std::chrono::steady_clock::now());

    void recordSuccess(TimePoint now = std::chrono::steady_clock::now());
    void recordFailure(TimePoint now = std::chrono::steady_clock::now());

    /// Admitted request ended without a verdict (backpressure, timeout,
    /// caller abandoned). Frees a HalfOpen trial slot; no effect otherwise.
    void recordNeutral();

    /// Gate plus a ServiceDegraded error naming the breaker.
    Result<void> admit(TimePoint now = std::chrono::steady_clock::now());

    BreakerState state() const noexcept {
        return static_cast<BreakerState>(state_.load(std::memory_order_acquire));
    }

    Stats stats(TimePoint now = std::chrono::steady_clock::now()) const;
    const Config& config() const noexcept { return config_; }

    /// Back to Closed with an empty window (for testing)
    void reset();

private:
    struct Bucket {
        std::int64_t slot = -1;
        std::uint64_t requests = 0;
        std::uint64_t failures = 0;
    };

    std::int64_t slotFor(TimePoint now) const;
    Bucket& bucketFor(TimePoint now);
    void windowTotals(TimePoint now, std::uint64_t& requests, std::uint64_t& failures) const;
    void clearWindow();
    void tripOpen(TimePoint now, std::string_view reason);

    std::string name_;
    Config config_;
    std::chrono::nanoseconds bucketWidth_;

    std::atomic<std::uint8_t> state_{static_cast<std::uint8_t>(BreakerState::Closed)};
    std::atomic<std::uint64_t> rejected_{0};

    mutable std::mutex mutex_;
    std::array<Bucket, kBuckets> buckets_{};
    TimePoint openedAt_{};
    std::uint32_t trialsInFlight_ = 0;
    std::uint64_t timesOpened_ = 0;
};

} // namespace corral::pool
