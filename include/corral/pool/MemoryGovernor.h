// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

// MemoryGovernor
// --------------
// Tracks a logical memory budget (MB) shared by every pool in the process.
// Workers claim their configured cost up front through tryAllocate() and hold
// the returned AllocationGuard for their whole lifetime. The budget counter is
// updated with compare-and-swap only, so pools never block each other.
//
// The governor never looks at host memory; costs are whatever the pool
// configuration says a worker needs.

#include <corral/core/types.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>

namespace corral::pool {

class MemoryGovernor;

// ============================================================================
// Pressure Levels
// ============================================================================

/// Budget utilization bands, used for logging and health reporting
enum class MemoryPressure : std::uint8_t {
    Low = 0,     // < 50% reserved
    Normal = 1,  // 50-70%
    High = 2,    // 70-85%
    Critical = 3 // >= 85%
};

constexpr std::string_view memoryPressureName(MemoryPressure level) noexcept {
    switch (level) {
        case MemoryPressure::Low:
            return "Low";
        case MemoryPressure::Normal:
            return "Normal";
        case MemoryPressure::High:
            return "High";
        case MemoryPressure::Critical:
            return "Critical";
    }
    return "Unknown";
}

constexpr MemoryPressure pressureForUtilization(double utilization) noexcept {
    if (utilization < 0.50)
        return MemoryPressure::Low;
    if (utilization < 0.70)
        return MemoryPressure::Normal;
    if (utilization < 0.85)
        return MemoryPressure::High;
    return MemoryPressure::Critical;
}

struct MemoryStats {
    std::uint64_t budgetMb{0};
    std::uint64_t reservedMb{0};
    std::uint64_t availableMb{0};
    std::uint64_t peakReservedMb{0};
    std::uint64_t liveAllocations{0};
    std::uint64_t rejectedAllocations{0};
    double utilization{0.0}; // reserved / budget (0.0-1.0)
    MemoryPressure pressure{MemoryPressure::Low};
};

// ============================================================================
// AllocationGuard
// ============================================================================

/// Scoped claim on part of the budget. Move-only; returns its size to the
/// governor on destruction or on the first call to release().
class AllocationGuard {
public:
    AllocationGuard() = default;
    ~AllocationGuard();

    AllocationGuard(AllocationGuard&& other) noexcept;
    AllocationGuard& operator=(AllocationGuard&& other) noexcept;

    AllocationGuard(const AllocationGuard&) = delete;
    AllocationGuard& operator=(const AllocationGuard&) = delete;

    /// Safe to call concurrently and repeatedly; only the first call returns budget.
    void release() noexcept;

    [[nodiscard]] bool valid() const noexcept { return held_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t sizeMb() const noexcept { return sizeMb_.load(); }

private:
    friend class MemoryGovernor;
    AllocationGuard(std::shared_ptr<MemoryGovernor> governor, std::uint64_t sizeMb);

    std::shared_ptr<MemoryGovernor> governor_;
    std::atomic<std::uint64_t> sizeMb_{0};
    std::atomic<bool> held_{false};
};

// ============================================================================
// MemoryGovernor
// ============================================================================

class MemoryGovernor : public std::enable_shared_from_this<MemoryGovernor> {
public:
    /// Governors are always shared: outstanding guards keep them alive.
    static std::shared_ptr<MemoryGovernor> create(std::uint64_t budgetMb);

    MemoryGovernor(const MemoryGovernor&) = delete;
    MemoryGovernor& operator=(const MemoryGovernor&) = delete;

    /// Reserve `sizeMb` if it fits in the remaining budget; fails immediately
    /// with MemoryExhausted otherwise. Never reserves partially.
    Result<AllocationGuard> tryAllocate(std::uint64_t sizeMb);

    [[nodiscard]] std::uint64_t budgetMb() const noexcept { return budgetMb_; }
    [[nodiscard]] std::uint64_t reservedMb() const noexcept {
        return reservedMb_.load(std::memory_order_acquire);
    }
    [[nodiscard]] std::uint64_t availableMb() const noexcept;
    [[nodiscard]] bool canAllocate(std::uint64_t sizeMb) const noexcept {
        return sizeMb <= availableMb();
    }
    [[nodiscard]] MemoryPressure pressure() const noexcept;
    [[nodiscard]] MemoryStats stats() const noexcept;

private:
    explicit MemoryGovernor(std::uint64_t budgetMb);
    friend class AllocationGuard;
    void release(std::uint64_t sizeMb) noexcept;
    void updatePressure(std::uint64_t reservedMb) noexcept;

    const std::uint64_t budgetMb_;
    std::atomic<std::uint64_t> reservedMb_{0};
    std::atomic<std::uint64_t> peakReservedMb_{0};
    std::atomic<std::uint64_t> liveAllocations_{0};
    std::atomic<std::uint64_t> rejectedAllocations_{0};
    std::atomic<MemoryPressure> pressureLevel_{MemoryPressure::Low};
};

} // namespace corral::pool
