// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <corral/capability/SyntheticCapability.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <thread>
#include <vector>

namespace corral::capability {

namespace {

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

SyntheticCapability::SyntheticCapability(SyntheticOptions options, pool::DeviceConfig device)
    : options_(std::move(options)), device_(std::move(device)) {}

Result<void> SyntheticCapability::generate(const pool::GenerationRequest& request,
                                           pool::ChunkSink& sink) {
    requests_.fetch_add(1, std::memory_order_relaxed);

    if (options_.stall) {
        options_.stall->waitOpen();
    }
    if (!options_.failPrefix.empty() && request.prompt.starts_with(options_.failPrefix)) {
        return Error{ErrorCode::RequestFailed, "synthetic failure requested by prompt"};
    }

    const auto words = splitWords(request.prompt);
    const auto budget = std::min(request.maxTokens, options_.tokenCap);
    std::uint32_t produced = 0;
    for (; produced < budget; ++produced) {
        if (options_.tokenDelay.count() > 0) {
            std::this_thread::sleep_for(options_.tokenDelay);
        }
        std::string token = words.empty() ? fmt::format("tok{}", produced)
                                          : words[produced % words.size()];
        if (produced > 0) {
            token.insert(token.begin(), ' ');
        }
        if (!sink.send(pool::CompletionChunk::token(std::move(token)))) {
            spdlog::debug("[SyntheticCapability] consumer gone after {} tokens", produced);
            return {};
        }
    }

    pool::TokenUsage usage;
    usage.inputTokens = static_cast<std::uint32_t>(words.size());
    usage.outputTokens = produced;
    const auto reason =
        request.maxTokens > options_.tokenCap ? pool::FinishReason::Length : pool::FinishReason::Stop;
    if (!sink.send(pool::CompletionChunk::complete(usage, reason))) {
        spdlog::debug("[SyntheticCapability] consumer gone before completion");
    }
    return {};
}

pool::CapabilityLoader makeSyntheticLoader(SyntheticOptions options) {
    return [options = std::move(options)](
               const pool::DeviceConfig& device) -> Result<std::unique_ptr<pool::ICapability>> {
        if (options.loadCounter) {
            options.loadCounter->fetch_add(1);
        }
        if (options.loadDelay.count() > 0) {
            std::this_thread::sleep_for(options.loadDelay);
        }
        if (options.failLoad) {
            return Error{ErrorCode::SpawnFailed, "synthetic load failure"};
        }
        spdlog::debug("[SyntheticCapability] loaded on {} ({} threads)", device.device,
                      device.threads);
        return std::unique_ptr<pool::ICapability>(
            std::make_unique<SyntheticCapability>(options, device));
    };
}

} // namespace corral::capability
