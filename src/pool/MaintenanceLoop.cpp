// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/pool/MaintenanceLoop.h>
#include <corral/pool/Pool.h>

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

namespace corral::pool {

MaintenanceLoop::MaintenanceLoop(std::weak_ptr<Pool> pool, runtime::WorkCoordinator& coordinator,
                                 std::chrono::milliseconds interval,
                                 std::chrono::milliseconds stopGrace)
    : strand_(coordinator.makeStrand()), stopGrace_(stopGrace),
      state_(std::make_shared<State>(std::move(pool), strand_, interval)) {}

MaintenanceLoop::~MaintenanceLoop() {
    stop();
}

void MaintenanceLoop::start() {
    if (state_->running.exchange(true))
        return;
    future_ = boost::asio::co_spawn(strand_, loop(state_), boost::asio::use_future);
}

void MaintenanceLoop::stop() {
    if (!state_->running.exchange(false))
        return;

    boost::asio::post(strand_, [state = state_] { state->timer.cancel(); });
    try {
        if (future_.valid()) {
            if (future_.wait_for(state_->interval + stopGrace_) !=
                std::future_status::ready) {
                // The coroutine keeps its own State; it exits after the current tick.
                spdlog::warn("[Maintenance] loop did not stop in time; leaving it to finish");
                return;
            }
            future_.get();
        }
    } catch (const std::exception& e) {
        spdlog::debug("[Maintenance] loop stop wait error: {}", e.what());
    }
}

boost::asio::awaitable<void> MaintenanceLoop::loop(std::shared_ptr<State> state) {
    spdlog::debug("[Maintenance] loop started (interval {}ms)", state->interval.count());

    while (state->running.load()) {
        boost::system::error_code ec;
        state->timer.expires_after(state->interval);
        co_await state->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (!state->running.load()) {
            break;
        }
        try {
            tickOnce(*state);
        } catch (const std::exception& e) {
            spdlog::warn("[Maintenance] tick error: {}", e.what());
        }
    }

    spdlog::debug("[Maintenance] loop exiting");
}

void MaintenanceLoop::tickOnce(State& state) {
    auto pool = state.pool.lock();
    if (!pool) {
        state.running.store(false);
        return;
    }
    const auto report = pool->runMaintenance();
    state.cycles.fetch_add(1, std::memory_order_relaxed);
    if (report.evicted > 0 || report.unresponsive > 0 || report.stalledLoads > 0) {
        spdlog::info("[Maintenance] {}: evicted {} idle, removed {} unresponsive, {} stalled loads",
                     pool->key().toString(), report.evicted, report.unresponsive,
                     report.stalledLoads);
    }
}

} // namespace corral::pool
