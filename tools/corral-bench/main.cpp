// Copyright (c) 2025 Corral Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <corral/capability/SyntheticCapability.h>
#include <corral/config/ConfigResolver.h>
#include <corral/logging/Logging.h>
#include <corral/pool/PoolHealth.h>
#include <corral/pool/Registry.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

struct BenchOptions {
    std::uint64_t budgetMb = 0; // 0 = from config
    std::uint64_t workerMb = 512;
    std::size_t maxWorkers = 4;
    std::size_t minWorkers = 0;
    std::size_t requests = 200;
    std::size_t concurrency = 8;
    std::uint32_t tokens = 32;
    std::uint32_t tokenDelayMs = 0;
    std::string configPath;
    std::string logLevel = "warn";
};

struct BenchResult {
    std::mutex mutex;
    std::vector<double> latenciesMs;
    std::map<corral::ErrorCode, std::size_t> errors;
};

std::string makePrompt(std::uint32_t words) {
    std::string prompt;
    for (std::uint32_t i = 0; i < words; ++i) {
        if (i > 0)
            prompt += ' ';
        prompt += fmt::format("w{}", i);
    }
    return prompt;
}

double percentile(std::vector<double>& sorted, double p) {
    if (sorted.empty())
        return 0.0;
    const auto idx = static_cast<std::size_t>(p * static_cast<double>(sorted.size() - 1));
    return sorted[idx];
}

int runBench(const BenchOptions& opts) {
    using namespace corral;

    config::FlatConfig flat;
    const auto path =
        opts.configPath.empty() ? config::ConfigResolver::resolveDefaultConfigPath()
                                : std::filesystem::path(opts.configPath);
    if (!path.empty()) {
        flat = config::ConfigResolver::readFlatConfig(path);
    }

    auto logCfg = config::ConfigResolver::resolveLoggingConfig(flat);
    logCfg.level = opts.logLevel;
    if (auto configured = logging::configure(logCfg); !configured) {
        spdlog::error("Logging setup failed: {}", configured.error().message);
        return 1;
    }

    auto regCfg = config::ConfigResolver::resolveRegistryConfig(flat);
    if (opts.budgetMb > 0) {
        regCfg.memoryBudgetMb = opts.budgetMb;
    }
    pool::PoolConfig poolCfg = regCfg.defaultPool;
    poolCfg.memoryPerWorkerMb = opts.workerMb;
    poolCfg.maxWorkers = opts.maxWorkers;
    poolCfg.minWorkers = opts.minWorkers;

    pool::Registry registry(regCfg);
    const pool::CapabilityKey key{"bench-synthetic"};
    capability::SyntheticOptions synth;
    synth.tokenDelay = std::chrono::milliseconds(opts.tokenDelayMs);
    if (auto reg = registry.registerCapability(
            key, pool::CapabilityRegistration{capability::makeSyntheticLoader(synth), poolCfg});
        !reg) {
        spdlog::error("Registration failed: {}", reg.error().message);
        return 1;
    }

    const auto prompt = makePrompt(opts.tokens);
    BenchResult result;
    std::atomic<std::size_t> next{0};

    const auto started = std::chrono::steady_clock::now();
    {
        std::vector<std::jthread> clients;
        clients.reserve(opts.concurrency);
        for (std::size_t c = 0; c < opts.concurrency; ++c) {
            clients.emplace_back([&] {
                while (next.fetch_add(1) < opts.requests) {
                    pool::GenerationRequest request;
                    request.prompt = prompt;
                    request.maxTokens = opts.tokens;

                    const auto t0 = std::chrono::steady_clock::now();
                    auto stream = registry.dispatch(key, request);
                    Result<pool::Completion> completion =
                        stream ? stream.value().collect(std::chrono::seconds(60))
                               : Result<pool::Completion>(stream.error());
                    const auto ms = std::chrono::duration<double, std::milli>(
                                        std::chrono::steady_clock::now() - t0)
                                        .count();

                    std::lock_guard<std::mutex> lock(result.mutex);
                    if (completion) {
                        result.latenciesMs.push_back(ms);
                    } else {
                        ++result.errors[completion.error().code];
                    }
                }
            });
        }
    }
    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started);

    auto& lat = result.latenciesMs;
    std::sort(lat.begin(), lat.end());
    std::size_t failed = 0;
    for (const auto& [code, count] : result.errors) {
        failed += count;
    }

    fmt::print("requests:    {}\n", opts.requests);
    fmt::print("succeeded:   {}\n", lat.size());
    fmt::print("failed:      {}\n", failed);
    for (const auto& [code, count] : result.errors) {
        fmt::print("  {:<28} {}\n", fmt::format("{}", code), count);
    }
    fmt::print("elapsed:     {:.3f}s ({:.1f} req/s)\n", elapsed.count(),
               elapsed.count() > 0 ? static_cast<double>(lat.size()) / elapsed.count() : 0.0);
    fmt::print("latency ms:  p50={:.2f} p95={:.2f} p99={:.2f} max={:.2f}\n",
               percentile(lat, 0.50), percentile(lat, 0.95), percentile(lat, 0.99),
               lat.empty() ? 0.0 : lat.back());
    fmt::print("{}\n", pool::toJson(registry.health()).dump(2));

    registry.shutdown();
    return failed == 0 ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    BenchOptions opts;
    CLI::App app{"Drive concurrent requests through a synthetic capability pool", "corral-bench"};
    app.add_option("--budget-mb", opts.budgetMb, "Shared memory budget in MB (0 = config)");
    app.add_option("--worker-mb", opts.workerMb, "Logical memory per worker in MB")
        ->check(CLI::PositiveNumber);
    app.add_option("--max-workers", opts.maxWorkers, "Pool maximum worker count")
        ->check(CLI::PositiveNumber);
    app.add_option("--min-workers", opts.minWorkers, "Pool minimum worker count");
    app.add_option("--requests", opts.requests, "Total requests to issue");
    app.add_option("--concurrency", opts.concurrency, "Concurrent client threads")
        ->check(CLI::PositiveNumber);
    app.add_option("--tokens", opts.tokens, "Prompt words and max tokens per request");
    app.add_option("--token-delay-ms", opts.tokenDelayMs, "Synthetic per-token delay");
    app.add_option("--config", opts.configPath, "Path to config.toml");
    app.add_option("--log-level", opts.logLevel, "trace|debug|info|warn|error|off");

    CLI11_PARSE(app, argc, argv);

    try {
        return runBench(opts);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
