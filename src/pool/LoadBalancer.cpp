// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/pool/LoadBalancer.h>
#include <corral/pool/Worker.h>

#include <functional>
#include <thread>

namespace corral::pool {

namespace {

std::minstd_rand& threadRng() {
    thread_local std::minstd_rand rng(static_cast<std::minstd_rand::result_type>(
        std::random_device{}() ^ std::hash<std::thread::id>{}(std::this_thread::get_id())));
    return rng;
}

} // namespace

std::shared_ptr<Worker> selectWorker(const std::vector<std::shared_ptr<Worker>>& candidates) {
    auto index = selectPowerOfTwo(
        candidates.size(), [&](std::size_t i) { return candidates[i]->activeRequests(); },
        [&](std::size_t i) { return candidates[i]->id(); }, threadRng());
    if (!index) {
        return nullptr;
    }
    return candidates[*index];
}

} // namespace corral::pool
