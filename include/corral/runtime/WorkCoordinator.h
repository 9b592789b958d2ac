// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace corral::runtime {

/**
 * @brief Shared executor for registry-level background work.
 *
 * One io_context driven by a fixed set of threads. Maintenance loops run
 * here as coroutines, each on its own strand; worker request loops do not
 * (every worker owns a dedicated thread).
 *
 * Lifecycle: construct → start() → (use executors) → stop() → join().
 * The destructor performs stop() + join() when still running.
 */
class WorkCoordinator {
public:
    using Executor = boost::asio::io_context::executor_type;
    using Strand = boost::asio::strand<Executor>;

    WorkCoordinator();
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;

    /// @throws std::runtime_error if already started
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    /// Releases the work guard and stops the io_context. Non-blocking, idempotent.
    void stop();

    /// Waits for every runner thread. Call stop() first.
    void join();

    [[nodiscard]] Executor getExecutor() const noexcept;
    [[nodiscard]] Strand makeStrand() const;
    [[nodiscard]] bool isRunning() const noexcept { return started_.load(); }
    [[nodiscard]] std::size_t threadCount() const noexcept { return threads_.size(); }

private:
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::optional<boost::asio::executor_work_guard<Executor>> workGuard_;
    std::vector<std::jthread> threads_;
    std::atomic<bool> started_{false};
};

} // namespace corral::runtime
