// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/runtime/WorkCoordinator.h>

#include <spdlog/spdlog.h>

#include <boost/asio/detail/concurrency_hint.hpp>

#include <algorithm>
#include <stdexcept>

namespace corral::runtime {

WorkCoordinator::WorkCoordinator()
    : ioContext_(std::make_shared<boost::asio::io_context>(BOOST_ASIO_CONCURRENCY_HINT_SAFE)) {}

WorkCoordinator::~WorkCoordinator() {
    if (started_.load()) {
        stop();
        join();
    }
}

void WorkCoordinator::start(std::optional<std::size_t> numThreads) {
    if (started_.exchange(true)) {
        throw std::runtime_error("WorkCoordinator already started");
    }

    if (ioContext_->stopped()) {
        ioContext_->restart();
    }
    workGuard_.emplace(boost::asio::make_work_guard(*ioContext_));

    const std::size_t count =
        std::max<std::size_t>(1, numThreads.value_or(std::thread::hardware_concurrency()));
    threads_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        threads_.emplace_back([ctx = ioContext_, i] {
            spdlog::trace("[WorkCoordinator] runner {} entering io_context", i);
            ctx->run();
            spdlog::trace("[WorkCoordinator] runner {} left io_context", i);
        });
    }
    spdlog::debug("[WorkCoordinator] Started with {} threads", count);
}

void WorkCoordinator::stop() {
    if (!started_.load()) {
        return;
    }
    workGuard_.reset();
    ioContext_->stop();
}

void WorkCoordinator::join() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
    started_.store(false);
    spdlog::debug("[WorkCoordinator] All runners joined");
}

WorkCoordinator::Executor WorkCoordinator::getExecutor() const noexcept {
    return ioContext_->get_executor();
}

WorkCoordinator::Strand WorkCoordinator::makeStrand() const {
    return boost::asio::make_strand(ioContext_->get_executor());
}

} // namespace corral::runtime
