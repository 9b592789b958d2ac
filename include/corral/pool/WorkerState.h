// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string_view>

namespace corral::pool {

// ============================================================================
// Worker lifecycle
// ============================================================================
//
//   Spawning -> Ready <-> Busy <-> Idle -> Evicting -> Dead
//   (any live state) -> Unresponsive -> Dead
//
// Spawning may also go straight to Dead when the capability fails to load.

enum class WorkerState : std::uint8_t {
    Spawning = 0,
    Ready = 1,
    Busy = 2,
    Idle = 3,
    Evicting = 4,
    Unresponsive = 5,
    Dead = 6
};

constexpr std::string_view workerStateName(WorkerState state) noexcept {
    switch (state) {
        case WorkerState::Spawning:
            return "Spawning";
        case WorkerState::Ready:
            return "Ready";
        case WorkerState::Busy:
            return "Busy";
        case WorkerState::Idle:
            return "Idle";
        case WorkerState::Evicting:
            return "Evicting";
        case WorkerState::Unresponsive:
            return "Unresponsive";
        case WorkerState::Dead:
            return "Dead";
    }
    return "Unknown";
}

constexpr bool isLegalTransition(WorkerState from, WorkerState to) noexcept {
    using S = WorkerState;
    switch (from) {
        case S::Spawning:
            return to == S::Ready || to == S::Evicting || to == S::Unresponsive || to == S::Dead;
        case S::Ready:
            return to == S::Busy || to == S::Idle || to == S::Evicting || to == S::Unresponsive;
        case S::Busy:
            return to == S::Idle || to == S::Evicting || to == S::Unresponsive;
        case S::Idle:
            return to == S::Busy || to == S::Evicting || to == S::Unresponsive;
        case S::Evicting:
            return to == S::Dead || to == S::Unresponsive;
        case S::Unresponsive:
            return to == S::Dead;
        case S::Dead:
            return false;
    }
    return false;
}

/// Finished loading and still serving.
constexpr bool isServing(WorkerState s) noexcept {
    return s == WorkerState::Ready || s == WorkerState::Busy || s == WorkerState::Idle;
}

/// Candidate for the load balancer's primary selection.
constexpr bool isDispatchable(WorkerState s) noexcept {
    return s == WorkerState::Ready || s == WorkerState::Idle;
}

/// Counts toward the pool's live worker total.
constexpr bool isLive(WorkerState s) noexcept {
    return s == WorkerState::Spawning || isServing(s);
}

/// Integer-backed lifecycle field updated only through compare-and-swap.
class AtomicWorkerState {
public:
    explicit AtomicWorkerState(WorkerState initial = WorkerState::Spawning) noexcept
        : value_(static_cast<std::uint8_t>(initial)) {}

    [[nodiscard]] WorkerState load() const noexcept {
        return static_cast<WorkerState>(value_.load(std::memory_order_acquire));
    }

    /// Moves `from` -> `to` if the current state is `from` and the edge is legal.
    bool transition(WorkerState from, WorkerState to) noexcept {
        if (!isLegalTransition(from, to)) {
            return false;
        }
        auto expected = static_cast<std::uint8_t>(from);
        return value_.compare_exchange_strong(expected, static_cast<std::uint8_t>(to),
                                              std::memory_order_acq_rel,
                                              std::memory_order_acquire);
    }

    /// Moves from whatever the current state is to `to` when that edge is legal.
    /// Returns the state that was replaced, or nullopt if the edge is illegal.
    std::optional<WorkerState> advance(WorkerState to) noexcept {
        auto current = value_.load(std::memory_order_acquire);
        while (true) {
            const auto from = static_cast<WorkerState>(current);
            if (!isLegalTransition(from, to)) {
                return std::nullopt;
            }
            if (value_.compare_exchange_weak(current, static_cast<std::uint8_t>(to),
                                             std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
                return from;
            }
        }
    }

private:
    std::atomic<std::uint8_t> value_;
};

} // namespace corral::pool
