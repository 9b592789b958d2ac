// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>
#include <corral/pool/Capability.h>
#include <corral/pool/CapabilityKey.h>
#include <corral/pool/MemoryGovernor.h>
#include <corral/pool/PoolConfig.h>
#include <corral/pool/PoolHealth.h>
#include <corral/pool/ResponseStream.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace corral::runtime {
class WorkCoordinator;
}

namespace corral::pool {

class MaintenanceLoop;
class Pool;

struct RegistryConfig {
    std::uint64_t memoryBudgetMb = 8192;
    std::size_t maintenanceThreads = 1;
    bool enableMaintenance = true;
    PoolConfig defaultPool{}; ///< Starting point for registrations without their own config
};

struct CapabilityRegistration {
    CapabilityLoader loader;
    PoolConfig config{};
};

/**
 * Capability key → Pool map and the single dispatch entry point.
 *
 * The process-wide instance is created on first use from ConfigResolver
 * (file + environment) and lives until exit; there is no teardown API.
 * Separate instances can be constructed for tests and tools.
 */
class Registry {
public:
    static Registry& instance();

    explicit Registry(RegistryConfig config = {});
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Associates a loader and pool settings with a key. Must happen before
    /// the key's pool exists; InvalidState for duplicates.
    Result<void> registerCapability(const CapabilityKey& key, CapabilityRegistration registration);

    /// Registers with the registry's default pool settings.
    Result<void> registerCapability(const CapabilityKey& key, CapabilityLoader loader);

    /// Idempotent; concurrent first calls for one key create exactly one Pool.
    /// NotFound for keys that were never registered.
    Result<std::shared_ptr<Pool>> getOrCreatePool(const CapabilityKey& key);

    /// getOrCreatePool → circuit breaker → ensureCapacity → waitForWorkers → submit.
    Result<ResponseStream> dispatch(const CapabilityKey& key, const GenerationRequest& request);

    std::shared_ptr<Pool> findPool(const CapabilityKey& key) const;
    std::size_t poolCount() const;
    std::uint64_t poolsCreated() const noexcept { return poolsCreated_.load(); }
    bool isRegistered(const CapabilityKey& key) const;

    MemoryGovernor& governor() noexcept { return *governor_; }
    std::shared_ptr<MemoryGovernor> governorHandle() const noexcept { return governor_; }
    const RegistryConfig& config() const noexcept { return config_; }

    RegistryHealth health() const;
    std::string prometheusText() const;

    /// Stops maintenance and every pool. Used by standalone instances and at exit.
    void shutdown();

private:
    struct Entry {
        std::shared_ptr<Pool> pool;
        std::unique_ptr<MaintenanceLoop> maintenance;
    };

    RegistryConfig config_;
    std::shared_ptr<MemoryGovernor> governor_;
    std::unique_ptr<runtime::WorkCoordinator> coordinator_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<CapabilityKey, CapabilityRegistration> registrations_;
    std::unordered_map<CapabilityKey, Entry> pools_;
    std::atomic<std::uint64_t> poolsCreated_{0};
    std::atomic<bool> shutdown_{false};
};

} // namespace corral::pool
