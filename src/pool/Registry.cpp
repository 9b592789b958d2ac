// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/config/ConfigResolver.h>
#include <corral/pool/MaintenanceLoop.h>
#include <corral/pool/Pool.h>
#include <corral/pool/Registry.h>
#include <corral/runtime/WorkCoordinator.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace corral::pool {

Registry& Registry::instance() {
    static Registry registry(config::ConfigResolver::loadRegistryConfig());
    return registry;
}

Registry::Registry(RegistryConfig config)
    : config_(std::move(config)), governor_(MemoryGovernor::create(config_.memoryBudgetMb)) {
    if (config_.enableMaintenance) {
        coordinator_ = std::make_unique<runtime::WorkCoordinator>();
        coordinator_->start(std::max<std::size_t>(1, config_.maintenanceThreads));
    }
    spdlog::info("[Registry] Initialized (budget {} MB, maintenance {})", config_.memoryBudgetMb,
                 config_.enableMaintenance ? "on" : "off");
}

Registry::~Registry() {
    shutdown();
}

Result<void> Registry::registerCapability(const CapabilityKey& key,
                                          CapabilityRegistration registration) {
    if (!registration.loader) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("no loader given for {}", key.toString())};
    }
    if (auto valid = registration.config.validate(); !valid) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("{}: {}", key.toString(), valid.error().message)};
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (pools_.contains(key)) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("{} already has a running pool", key.toString())};
    }
    auto [it, inserted] = registrations_.try_emplace(key, std::move(registration));
    if (!inserted) {
        return Error{ErrorCode::InvalidState,
                     fmt::format("{} is already registered", key.toString())};
    }
    spdlog::debug("[Registry] Registered {}", key.toString());
    return {};
}

Result<void> Registry::registerCapability(const CapabilityKey& key, CapabilityLoader loader) {
    return registerCapability(key, CapabilityRegistration{std::move(loader), config_.defaultPool});
}

Result<std::shared_ptr<Pool>> Registry::getOrCreatePool(const CapabilityKey& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (auto it = pools_.find(key); it != pools_.end()) {
            return it->second.pool;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (shutdown_.load(std::memory_order_acquire)) {
        return Error{ErrorCode::SystemShutdown, "registry is shut down"};
    }
    auto reg = registrations_.find(key);
    if (reg == registrations_.end()) {
        return Error{ErrorCode::NotFound,
                     fmt::format("no capability registered for {}", key.toString())};
    }

    auto [it, inserted] = pools_.try_emplace(key);
    if (!inserted) {
        return it->second.pool;
    }

    auto& entry = it->second;
    entry.pool = std::make_shared<Pool>(key, reg->second.config, reg->second.loader, governor_);
    if (coordinator_) {
        entry.maintenance = std::make_unique<MaintenanceLoop>(
            entry.pool, *coordinator_, entry.pool->config().healthProbeInterval);
        entry.maintenance->start();
    }
    poolsCreated_.fetch_add(1, std::memory_order_relaxed);
    return entry.pool;
}

Result<ResponseStream> Registry::dispatch(const CapabilityKey& key,
                                          const GenerationRequest& request) {
    auto found = getOrCreatePool(key);
    if (!found) {
        return found.error();
    }
    const auto& pool = found.value();
    auto& breaker = pool->circuitBreaker();

    if (auto admitted = breaker.admit(); !admitted) {
        pool->metrics().recordCircuitRejection();
        spdlog::debug("[Registry] {} rejected: {}", key.toString(), admitted.error().message);
        return admitted.error();
    }

    if (auto ensured = pool->ensureCapacity(); !ensured) {
        breaker.recordNeutral();
        spdlog::warn("[Registry] {} capacity: {}", key.toString(), ensured.error().message);
        return ensured.error();
    }

    if (auto ready = pool->waitForWorkers(pool->config().waitForWorkersTimeout); !ready) {
        breaker.recordNeutral();
        spdlog::warn("[Registry] {} not ready: {}", key.toString(), ready.error().message);
        return ready.error();
    }

    auto stream = pool->submit(request);
    if (!stream) {
        breaker.recordNeutral();
        spdlog::debug("[Registry] {} submit failed: {}", key.toString(), stream.error().message);
    }
    return stream;
}

std::shared_ptr<Pool> Registry::findPool(const CapabilityKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = pools_.find(key);
    return it == pools_.end() ? nullptr : it->second.pool;
}

std::size_t Registry::poolCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pools_.size();
}

bool Registry::isRegistered(const CapabilityKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return registrations_.contains(key);
}

RegistryHealth Registry::health() const {
    RegistryHealth out;
    out.memory = governor_->stats();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.pools.reserve(pools_.size());
        for (const auto& [key, entry] : pools_) {
            out.pools.push_back(entry.pool->health());
        }
    }
    std::sort(out.pools.begin(), out.pools.end(), [](const auto& a, const auto& b) {
        return a.model != b.model ? a.model < b.model : a.kind < b.kind;
    });
    for (const auto& pool : out.pools) {
        out.status = std::max(out.status, pool.status);
    }
    return out;
}

std::string Registry::prometheusText() const {
    return toPrometheus(health());
}

void Registry::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    std::unordered_map<CapabilityKey, Entry> entries;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        entries.swap(pools_);
    }
    for (auto& [key, entry] : entries) {
        if (entry.maintenance) {
            entry.maintenance->stop();
        }
    }
    for (auto& [key, entry] : entries) {
        entry.pool->shutdown();
    }
    entries.clear();

    if (coordinator_) {
        coordinator_->stop();
        coordinator_->join();
    }
    spdlog::info("[Registry] Shut down");
}

} // namespace corral::pool
