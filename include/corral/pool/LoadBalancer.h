// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace corral::pool {

class Worker;

/**
 * Power-of-Two-Choices over `count` candidates.
 *
 * Samples two distinct indices (the same one when count == 1) and keeps the
 * one with the lower load; equal loads resolve to the lower id. Loads and ids
 * come from accessors so the policy can be exercised without workers.
 */
template <typename LoadFn, typename IdFn, typename Rng>
    requires std::invocable<LoadFn, std::size_t> && std::invocable<IdFn, std::size_t> &&
             std::uniform_random_bit_generator<Rng>
std::optional<std::size_t> selectPowerOfTwo(std::size_t count, LoadFn&& loadOf, IdFn&& idOf,
                                            Rng& rng) {
    if (count == 0) {
        return std::nullopt;
    }
    if (count == 1) {
        return std::size_t{0};
    }

    std::uniform_int_distribution<std::size_t> first(0, count - 1);
    std::uniform_int_distribution<std::size_t> second(0, count - 2);
    const std::size_t a = first(rng);
    std::size_t b = second(rng);
    if (b >= a) {
        ++b;
    }

    const auto loadA = loadOf(a);
    const auto loadB = loadOf(b);
    if (loadA != loadB) {
        return loadA < loadB ? a : b;
    }
    return idOf(a) < idOf(b) ? a : b;
}

/// Worker-level wrapper using a per-thread generator; no shared state.
std::shared_ptr<Worker> selectWorker(const std::vector<std::shared_ptr<Worker>>& candidates);

} // namespace corral::pool
