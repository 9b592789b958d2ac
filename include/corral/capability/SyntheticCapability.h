// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/pool/Capability.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace corral::capability {

// ============================================================================
// Synthetic capability for tests and load generation
// ============================================================================

/// Holds generation until opened. Lets tests park a worker mid-request.
class StallGate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void waitOpen() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        cv_.wait(lock, [this] { return open_; });
        --waiting_;
    }

    std::size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    std::size_t waiting_ = 0;
};

struct SyntheticOptions {
    std::chrono::milliseconds loadDelay{0};
    std::chrono::milliseconds tokenDelay{0};
    bool failLoad = false;
    std::string failPrefix = "!fail"; ///< Prompts starting with this end in an error
    std::uint32_t tokenCap = 4096;    ///< Hard limit; longer requests finish with Length
    std::shared_ptr<StallGate> stall; ///< Optional; generation waits on it before the first token
    std::shared_ptr<std::atomic<std::uint64_t>> loadCounter; ///< Optional; bumped on every load
};

/// Deterministic text generator: echoes prompt words, one per chunk.
class SyntheticCapability final : public pool::ICapability {
public:
    SyntheticCapability(SyntheticOptions options, pool::DeviceConfig device);

    std::string_view name() const override { return "synthetic"; }

    Result<void> generate(const pool::GenerationRequest& request, pool::ChunkSink& sink) override;

    std::uint64_t requestCount() const noexcept { return requests_.load(); }

private:
    SyntheticOptions options_;
    pool::DeviceConfig device_;
    std::atomic<std::uint64_t> requests_{0};
};

pool::CapabilityLoader makeSyntheticLoader(SyntheticOptions options = {});

} // namespace corral::capability
