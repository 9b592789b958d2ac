// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <corral/core/types.h>
#include <corral/pool/ResponseStream.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace corral::pool {

// ============================================================================
// Request model
// ============================================================================

struct GenerationConfig {
    float temperature = 0.7f;
    float topP = 0.9f;
    std::uint32_t topK = 40;
    std::uint64_t seed = 0;
    std::vector<std::string> stop;
};

struct GenerationRequest {
    std::string prompt;
    std::uint32_t maxTokens = 256;
    GenerationConfig config;
};

/// Where and how a capability instance is loaded.
struct DeviceConfig {
    std::string device = "cpu";
    std::uint32_t threads = 0; // 0 = backend default
    std::string dtype = "f32";
};

// ============================================================================
// Capability contract
// ============================================================================

/**
 * A loaded model instance hosted by exactly one worker.
 *
 * generate() is only ever called from the owning worker's thread, one request
 * at a time. Implementations push Text chunks through the sink and finish with
 * a Complete chunk carrying token usage. When send() returns false the caller
 * has gone away and generation should stop early. Returning an error without
 * having sent a terminal chunk makes the worker emit the Error chunk.
 */
class ICapability {
public:
    virtual ~ICapability() = default;

    virtual std::string_view name() const = 0;

    virtual Result<void> generate(const GenerationRequest& request, ChunkSink& sink) = 0;
};

/// Loads a capability instance under a device configuration. Called on the
/// worker's own thread while it is Spawning.
using CapabilityLoader =
    std::function<Result<std::unique_ptr<ICapability>>(const DeviceConfig& device)>;

} // namespace corral::pool
