// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file atomic_utils.h
 * @brief Lock-free helpers for bounded atomic counters.
 *
 * Counters such as reserved budget, active requests and peak usage are updated
 * from many threads without a shared lock. Every helper is a compare-and-swap
 * loop that never lets an unsigned counter wrap or exceed its bound.
 */

#include <atomic>
#include <cstdint>
#include <type_traits>

namespace corral::core {

/**
 * @brief Subtracts `delta` from an atomic counter, clamping at zero.
 *
 * @return The value before subtraction
 */
template <typename T>
    requires std::is_unsigned_v<T>
T saturating_sub(std::atomic<T>& counter, T delta) noexcept {
    T current = counter.load(std::memory_order_relaxed);
    while (true) {
        const T next = (current <= delta) ? T{0} : (current - delta);
        if (counter.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            return current;
        }
    }
}

/**
 * @brief Adds `delta` to an atomic counter only when the result stays within `limit`.
 *
 * All-or-nothing: either the whole delta is applied or the counter is untouched.
 *
 * @param counter The atomic counter to modify
 * @param delta Amount to add
 * @param limit Inclusive upper bound for the resulting value
 * @return true if the delta was applied
 */
template <typename T>
    requires std::is_unsigned_v<T>
bool add_if_within(std::atomic<T>& counter, T delta, T limit) noexcept {
    T current = counter.load(std::memory_order_relaxed);
    while (true) {
        if (current > limit || delta > limit - current) {
            return false;
        }
        if (counter.compare_exchange_weak(current, current + delta, std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            return true;
        }
    }
}

/**
 * @brief Increments an atomic counter only while it is below `limit`.
 *
 * @return true if the counter was incremented
 */
template <typename T>
    requires std::is_unsigned_v<T>
bool increment_if_below(std::atomic<T>& counter, T limit) noexcept {
    T current = counter.load(std::memory_order_relaxed);
    while (current < limit) {
        if (counter.compare_exchange_weak(current, current + T{1}, std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Decrements an atomic counter unless it is already zero.
 *
 * @return true if the counter was decremented
 */
template <typename T>
    requires std::is_unsigned_v<T>
bool decrement_if_positive(std::atomic<T>& counter) noexcept {
    T current = counter.load(std::memory_order_relaxed);
    while (current > T{0}) {
        if (counter.compare_exchange_weak(current, current - T{1}, std::memory_order_acq_rel,
                                          std::memory_order_relaxed)) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Raises a high-water mark to `value` if it is larger.
 *
 * @return The previous value of the counter
 */
template <typename T>
    requires std::is_arithmetic_v<T>
T atomic_max(std::atomic<T>& counter, T value) noexcept {
    T current = counter.load(std::memory_order_relaxed);
    while (current < value) {
        if (counter.compare_exchange_weak(current, value, std::memory_order_relaxed,
                                          std::memory_order_relaxed)) {
            return current;
        }
    }
    return current;
}

/**
 * @brief Lowers a low-water mark to `value` if it is smaller.
 *
 * @return The previous value of the counter
 */
template <typename T>
    requires std::is_arithmetic_v<T>
T atomic_min(std::atomic<T>& counter, T value) noexcept {
    T current = counter.load(std::memory_order_relaxed);
    while (current > value) {
        if (counter.compare_exchange_weak(current, value, std::memory_order_relaxed,
                                          std::memory_order_relaxed)) {
            return current;
        }
    }
    return current;
}

} // namespace corral::core
