// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/runtime/WorkCoordinator.h>

#include <utility>  // std::exchange, needed by boost/asio/awaitable.hpp (Boost 1.74)

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>

namespace corral::pool {

class Pool;

/// Periodic health-probe and eviction driver for one pool. Runs as a
/// coroutine on a strand of the shared coordinator; holds the pool weakly.
/// The coroutine owns its timer and flags through a shared State, so the
/// loop object may be destroyed while a tick is still running.
class MaintenanceLoop {
public:
    MaintenanceLoop(std::weak_ptr<Pool> pool, runtime::WorkCoordinator& coordinator,
                    std::chrono::milliseconds interval,
                    std::chrono::milliseconds stopGrace = std::chrono::seconds(5));
    ~MaintenanceLoop();

    MaintenanceLoop(const MaintenanceLoop&) = delete;
    MaintenanceLoop& operator=(const MaintenanceLoop&) = delete;

    void start();

    /// Cancels the timer and waits up to interval + stopGrace for the coroutine.
    void stop();

    bool running() const noexcept { return state_->running.load(); }
    std::uint64_t cycles() const noexcept { return state_->cycles.load(); }

private:
    struct State {
        State(std::weak_ptr<Pool> p, runtime::WorkCoordinator::Strand& strand,
              std::chrono::milliseconds every)
            : pool(std::move(p)), interval(every), timer(strand) {}

        std::weak_ptr<Pool> pool;
        std::chrono::milliseconds interval;
        boost::asio::steady_timer timer;
        std::atomic<bool> running{false};
        std::atomic<std::uint64_t> cycles{0};
    };

    static boost::asio::awaitable<void> loop(std::shared_ptr<State> state);
    static void tickOnce(State& state);

    runtime::WorkCoordinator::Strand strand_;
    std::chrono::milliseconds stopGrace_;
    std::shared_ptr<State> state_;
    std::future<void> future_;
};

} // namespace corral::pool
