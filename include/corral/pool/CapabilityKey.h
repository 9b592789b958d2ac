// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace corral::pool {

enum class CapabilityKind : std::uint8_t { TextGeneration = 0, Embedding = 1, Reranking = 2 };

constexpr std::string_view capabilityKindName(CapabilityKind kind) noexcept {
    switch (kind) {
        case CapabilityKind::TextGeneration:
            return "text-generation";
        case CapabilityKind::Embedding:
            return "embedding";
        case CapabilityKind::Reranking:
            return "reranking";
    }
    return "unknown";
}

/// Pool lookup key: a model plus the function it serves.
struct CapabilityKey {
    std::string modelId;
    CapabilityKind kind = CapabilityKind::TextGeneration;

    std::string toString() const {
        std::string out = modelId;
        out += ':';
        out += capabilityKindName(kind);
        return out;
    }

    bool operator==(const CapabilityKey& other) const = default;
};

} // namespace corral::pool

template <> struct std::hash<corral::pool::CapabilityKey> {
    std::size_t operator()(const corral::pool::CapabilityKey& key) const noexcept {
        const auto h1 = std::hash<std::string>{}(key.modelId);
        const auto h2 = std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(key.kind));
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
