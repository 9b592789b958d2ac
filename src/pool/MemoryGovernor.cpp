// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/core/atomic_utils.h>
#include <corral/pool/MemoryGovernor.h>

#include <spdlog/spdlog.h>

namespace corral::pool {

// ============================================================================
// AllocationGuard
// ============================================================================

AllocationGuard::AllocationGuard(std::shared_ptr<MemoryGovernor> governor, std::uint64_t sizeMb)
    : governor_(std::move(governor)), sizeMb_(sizeMb), held_(true) {}

AllocationGuard::~AllocationGuard() {
    release();
}

AllocationGuard::AllocationGuard(AllocationGuard&& other) noexcept
    : governor_(std::move(other.governor_)), sizeMb_(other.sizeMb_.exchange(0)),
      held_(other.held_.exchange(false)) {}

AllocationGuard& AllocationGuard::operator=(AllocationGuard&& other) noexcept {
    if (this != &other) {
        release();
        governor_ = std::move(other.governor_);
        sizeMb_.store(other.sizeMb_.exchange(0));
        held_.store(other.held_.exchange(false));
    }
    return *this;
}

void AllocationGuard::release() noexcept {
    if (!held_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    const auto size = sizeMb_.exchange(0, std::memory_order_acq_rel);
    if (governor_) {
        governor_->release(size);
    }
}

// ============================================================================
// MemoryGovernor
// ============================================================================

std::shared_ptr<MemoryGovernor> MemoryGovernor::create(std::uint64_t budgetMb) {
    return std::shared_ptr<MemoryGovernor>(new MemoryGovernor(budgetMb));
}

MemoryGovernor::MemoryGovernor(std::uint64_t budgetMb) : budgetMb_(budgetMb) {
    spdlog::debug("[MemoryGovernor] Budget {} MB", budgetMb_);
}

Result<AllocationGuard> MemoryGovernor::tryAllocate(std::uint64_t sizeMb) {
    if (!core::add_if_within(reservedMb_, sizeMb, budgetMb_)) {
        rejectedAllocations_.fetch_add(1, std::memory_order_relaxed);
        const auto reserved = reservedMb_.load(std::memory_order_relaxed);
        spdlog::debug("[MemoryGovernor] Rejected {} MB (reserved {} / {} MB)", sizeMb, reserved,
                      budgetMb_);
        return Error{ErrorCode::MemoryExhausted,
                     fmt::format("requested {} MB, available {} MB of {} MB", sizeMb,
                                 reserved >= budgetMb_ ? 0 : budgetMb_ - reserved, budgetMb_)};
    }

    const auto reserved = reservedMb_.load(std::memory_order_relaxed);
    core::atomic_max(peakReservedMb_, reserved);
    liveAllocations_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[MemoryGovernor] Reserved {} MB (reserved {} / {} MB)", sizeMb, reserved,
                  budgetMb_);
    updatePressure(reserved);
    return AllocationGuard(shared_from_this(), sizeMb);
}

void MemoryGovernor::release(std::uint64_t sizeMb) noexcept {
    const auto before = core::saturating_sub(reservedMb_, sizeMb);
    const auto reserved = before <= sizeMb ? 0 : before - sizeMb;
    core::decrement_if_positive(liveAllocations_);
    spdlog::debug("[MemoryGovernor] Released {} MB (reserved {} / {} MB)", sizeMb, reserved,
                  budgetMb_);
    updatePressure(reserved);
}

void MemoryGovernor::updatePressure(std::uint64_t reservedMb) noexcept {
    const auto level = budgetMb_ == 0
                           ? MemoryPressure::Critical
                           : pressureForUtilization(static_cast<double>(reservedMb) /
                                                    static_cast<double>(budgetMb_));
    const auto previous = pressureLevel_.exchange(level, std::memory_order_acq_rel);
    if (previous == level) {
        return;
    }
    const auto severity = level > previous && level >= MemoryPressure::High
                              ? spdlog::level::warn
                              : spdlog::level::info;
    spdlog::log(severity, "[MemoryGovernor] Pressure level: {} -> {} (reserved {} / {} MB)",
                memoryPressureName(previous), memoryPressureName(level), reservedMb, budgetMb_);
}

std::uint64_t MemoryGovernor::availableMb() const noexcept {
    const auto reserved = reservedMb_.load(std::memory_order_acquire);
    return reserved >= budgetMb_ ? 0 : budgetMb_ - reserved;
}

MemoryPressure MemoryGovernor::pressure() const noexcept {
    if (budgetMb_ == 0) {
        return MemoryPressure::Critical;
    }
    return pressureForUtilization(static_cast<double>(reservedMb()) /
                                  static_cast<double>(budgetMb_));
}

MemoryStats MemoryGovernor::stats() const noexcept {
    const auto reserved = reservedMb();
    const double utilization =
        budgetMb_ == 0 ? 1.0 : static_cast<double>(reserved) / static_cast<double>(budgetMb_);
    return MemoryStats{
        .budgetMb = budgetMb_,
        .reservedMb = reserved,
        .availableMb = reserved >= budgetMb_ ? 0 : budgetMb_ - reserved,
        .peakReservedMb = peakReservedMb_.load(std::memory_order_relaxed),
        .liveAllocations = liveAllocations_.load(std::memory_order_relaxed),
        .rejectedAllocations = rejectedAllocations_.load(std::memory_order_relaxed),
        .utilization = utilization,
        .pressure = pressureForUtilization(utilization),
    };
}

} // namespace corral::pool
