#include <gtest/gtest.h>

#include <corral/capability/SyntheticCapability.h>
#include <corral/pool/Pool.h>

#include "test_helpers.h"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>

namespace corral::pool::test {

using namespace std::chrono_literals;
using corral::tests::wait_until;

namespace {

PoolConfig smallConfig() {
    PoolConfig config;
    config.memoryPerWorkerMb = 1024;
    config.minWorkers = 0;
    config.maxWorkers = 4;
    config.preWarmCount = 2;
    config.queueCapacity = 8;
    config.idleTimeout = 100ms;
    config.waitForWorkersTimeout = 5s;
    return config;
}

GenerationRequest prompt(std::string text, std::uint32_t maxTokens = 4) {
    GenerationRequest r;
    r.prompt = std::move(text);
    r.maxTokens = maxTokens;
    return r;
}

} // namespace

class PoolTest : public ::testing::Test {
protected:
    std::unique_ptr<Pool> makePool(PoolConfig config, capability::SyntheticOptions opts = {},
                                   std::uint64_t budgetMb = 4096) {
        governor_ = MemoryGovernor::create(budgetMb);
        return std::make_unique<Pool>(CapabilityKey{"pool-test"}, config,
                                      capability::makeSyntheticLoader(std::move(opts)), governor_);
    }

    std::shared_ptr<MemoryGovernor> governor_;
};

// ----------------------------------------------------------------------------
// Cold start
// ----------------------------------------------------------------------------

TEST_F(PoolTest, ColdStartPreWarms) {
    auto pool = makePool(smallConfig());
    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 2u);
    EXPECT_EQ(governor_->reservedMb(), 2048u);
    ASSERT_TRUE(pool->waitForWorkers(5s));
    EXPECT_EQ(pool->metrics().snapshot().workersSpawned, 2u);
}

TEST_F(PoolTest, ColdStartTakesWhatTheBudgetAllows) {
    auto pool = makePool(smallConfig(), {}, 1536);
    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 1u);
    EXPECT_EQ(governor_->reservedMb(), 1024u);
    EXPECT_TRUE(pool->waitForWorkers(5s));
}

TEST_F(PoolTest, ColdStartWithoutBudgetIsMemoryExhausted) {
    auto pool = makePool(smallConfig(), {}, 512);
    auto r = pool->ensureCapacity();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MemoryExhausted);
    EXPECT_EQ(pool->liveWorkerCount(), 0u);
    EXPECT_EQ(governor_->reservedMb(), 0u);
}

TEST_F(PoolTest, ColdStartHonoursMinWorkersAboveWarmCount) {
    auto config = smallConfig();
    config.minWorkers = 3;
    config.preWarmCount = 1;
    auto pool = makePool(config);
    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 3u);
}

TEST_F(PoolTest, WarmPoolDoesNotSpawnAgain) {
    auto pool = makePool(smallConfig());
    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().ready == 2; }));
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(pool->ensureCapacity());
    }
    EXPECT_EQ(pool->liveWorkerCount(), 2u);
    EXPECT_EQ(pool->metrics().snapshot().workersSpawned, 2u);
}

// ----------------------------------------------------------------------------
// Waiting for workers
// ----------------------------------------------------------------------------

TEST_F(PoolTest, SpawnFailureSurfacesOnWait) {
    capability::SyntheticOptions opts;
    opts.failLoad = true;
    auto pool = makePool(smallConfig(), opts);
    ASSERT_TRUE(pool->ensureCapacity());

    auto r = pool->waitForWorkers(5s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SpawnFailed);
    ASSERT_TRUE(wait_until([&] { return governor_->reservedMb() == 0; }));
    ASSERT_TRUE(wait_until([&] { return pool->metrics().snapshot().spawnFailures == 2; }));
    EXPECT_EQ(pool->liveWorkerCount(), 0u);
    EXPECT_EQ(pool->health().status, HealthStatus::Unhealthy);
}

TEST_F(PoolTest, WaitTimesOutWhileLoading) {
    capability::SyntheticOptions opts;
    opts.loadDelay = 500ms;
    auto pool = makePool(smallConfig(), opts);
    ASSERT_TRUE(pool->ensureCapacity());

    auto r = pool->waitForWorkers(20ms);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(pool->metrics().snapshot().waitTimeouts, 1u);

    EXPECT_TRUE(pool->waitForWorkers(5s));
}

TEST_F(PoolTest, WaitOnEmptyPoolReportsNoWorker) {
    auto pool = makePool(smallConfig());
    auto r = pool->waitForWorkers(50ms);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NoWorkerAvailable);
}

// ----------------------------------------------------------------------------
// Dispatch and scaling
// ----------------------------------------------------------------------------

TEST_F(PoolTest, SubmitStreamsFromAWorker) {
    auto pool = makePool(smallConfig());
    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));

    auto stream = pool->submit(prompt("one two", 2));
    ASSERT_TRUE(stream) << stream.error().message;
    auto result = stream.value().collect(5s);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().text, "one two");

    ASSERT_TRUE(wait_until([&] { return pool->metrics().snapshot().requestsSucceeded == 1; }));
    EXPECT_EQ(pool->metrics().snapshot().requestsTotal, 1u);
    EXPECT_EQ(pool->circuitBreaker().state(), BreakerState::Closed);
}

TEST_F(PoolTest, ScalesUpWhenEveryWorkerIsBusy) {
    auto config = smallConfig();
    config.preWarmCount = 1;
    config.maxWorkers = 3;
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    EXPECT_EQ(pool->liveWorkerCount(), 1u);

    auto busy = pool->submit(prompt("hold"));
    ASSERT_TRUE(busy);
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().busy == 1; }));

    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 2u);

    // The new worker is spawning or dispatchable, so no further growth.
    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 2u);

    opts.stall->open();
    EXPECT_TRUE(busy.value().collect(5s));
}

TEST_F(PoolTest, NeverExceedsMaxWorkers) {
    auto config = smallConfig();
    config.preWarmCount = 1;
    config.maxWorkers = 1;
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto first = pool->submit(prompt("a"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().busy == 1; }));

    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 1u);

    // Busy fallback: the request queues behind the one in flight.
    auto second = pool->submit(prompt("b"));
    ASSERT_TRUE(second) << second.error().message;

    opts.stall->open();
    EXPECT_TRUE(first.value().collect(5s));
    EXPECT_TRUE(second.value().collect(5s));
}

TEST_F(PoolTest, FullQueuesReportBackpressure) {
    auto config = smallConfig();
    config.preWarmCount = 1;
    config.maxWorkers = 1;
    config.queueCapacity = 1;
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto first = pool->submit(prompt("a"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().busy == 1; }));

    auto rejected = pool->submit(prompt("b"));
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().code, ErrorCode::QueueFull);
    EXPECT_GE(pool->metrics().snapshot().backpressureRejections, 1u);

    opts.stall->open();
    EXPECT_TRUE(first.value().collect(5s));
}

// ----------------------------------------------------------------------------
// Maintenance
// ----------------------------------------------------------------------------

TEST_F(PoolTest, IdleEvictionKeepsMinimum) {
    auto config = smallConfig();
    config.minWorkers = 1;
    config.preWarmCount = 3;
    config.maxWorkers = 3;
    auto pool = makePool(config);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().ready == 3; }));
    EXPECT_EQ(governor_->reservedMb(), 3072u);

    auto report = pool->runMaintenance(std::chrono::steady_clock::now() + 1s);
    EXPECT_EQ(report.evicted, 2u);
    EXPECT_EQ(pool->liveWorkerCount(), 1u);
    ASSERT_TRUE(wait_until([&] { return governor_->reservedMb() == 1024; }));
    EXPECT_EQ(pool->metrics().snapshot().workersEvicted, 2u);

    // Evicted workers leave the retired list once their threads are gone.
    std::size_t reaped = report.reaped;
    ASSERT_TRUE(wait_until([&] {
        if (reaped < 2)
            reaped += pool->runMaintenance().reaped;
        return reaped == 2;
    }));
    EXPECT_EQ(pool->liveWorkerCount(), 1u);
}

TEST_F(PoolTest, RecentlyUsedWorkersAreNotEvicted) {
    auto config = smallConfig();
    config.idleTimeout = 60s;
    auto pool = makePool(config);
    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().ready == 2; }));

    auto report = pool->runMaintenance();
    EXPECT_EQ(report.evicted, 0u);
    EXPECT_EQ(report.probed, 2u);
    EXPECT_EQ(pool->liveWorkerCount(), 2u);
}

TEST_F(PoolTest, MaintenanceRestoresMinimum) {
    auto config = smallConfig();
    config.minWorkers = 2;
    config.preWarmCount = 2;
    auto pool = makePool(config);
    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(wait_until([&] { return pool->workerCounts().ready == 2; }));

    auto victim = pool->workers()->front();
    ASSERT_TRUE(victim->beginEviction());
    ASSERT_TRUE(wait_until([&] { return victim->exited(); }));

    auto report = pool->runMaintenance();
    EXPECT_EQ(report.spawned, 1u);
    EXPECT_EQ(pool->liveWorkerCount(), 2u);
}

TEST_F(PoolTest, UnresponsiveWorkerIsAbandonedAndReplaced) {
    auto config = smallConfig();
    config.minWorkers = 1;
    config.preWarmCount = 1;
    config.maxWorkers = 2;
    config.healthStaleAfter = 50ms;
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto stuck = pool->submit(prompt("hang"));
    ASSERT_TRUE(stuck);
    ASSERT_TRUE(wait_until([&] { return opts.stall->waiting() == 1; }));

    const auto now = std::chrono::steady_clock::now();
    auto first = pool->runMaintenance(now);
    EXPECT_EQ(first.unresponsive, 0u);

    auto second = pool->runMaintenance(now + 500ms);
    EXPECT_EQ(second.unresponsive, 1u);
    EXPECT_EQ(second.spawned, 1u);
    EXPECT_EQ(pool->metrics().snapshot().workersUnresponsive, 1u);

    auto r = stuck.value().collect(1s);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::WorkerUnresponsive);
    EXPECT_EQ(governor_->reservedMb(), 1024u) << "replacement holds the only allocation";

    opts.stall->open();
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto fresh = pool->submit(prompt("again"));
    ASSERT_TRUE(fresh) << fresh.error().message;
    EXPECT_TRUE(fresh.value().collect(5s));
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

TEST_F(PoolTest, SingleWorkerRoundTripReturnsMemory) {
    auto config = smallConfig();
    config.maxWorkers = 1;
    config.minWorkers = 0;
    config.idleTimeout = 50ms;
    capability::SyntheticOptions opts;
    opts.tokenDelay = 25ms;
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 1u) << "pre-warm is clamped to maxWorkers";
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto worker = pool->workers()->front();

    for (int i = 0; i < 3; ++i) {
        auto stream = pool->submit(prompt("hello big world", 3));
        ASSERT_TRUE(stream);
        EXPECT_TRUE(wait_until([&] {
            return worker->state() == WorkerState::Busy || stream.value().finished();
        }));
        auto result = stream.value().collect(5s);
        ASSERT_TRUE(result);
        EXPECT_EQ(result.value().text, "hello big world");
        ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Idle; }))
            << "request " << i;
    }
    EXPECT_EQ(worker->completedRequests(), 3u);
    EXPECT_EQ(pool->liveWorkerCount(), 1u);

    auto report = pool->runMaintenance(std::chrono::steady_clock::now() + 1s);
    EXPECT_EQ(report.evicted, 1u);
    EXPECT_EQ(pool->liveWorkerCount(), 0u);
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Dead; }));
    ASSERT_TRUE(wait_until([&] { return worker->exited(); }));
    ASSERT_TRUE(wait_until([&] { return governor_->reservedMb() == 0; }));

    // Next request cold-starts again.
    ASSERT_TRUE(pool->ensureCapacity());
    EXPECT_EQ(pool->liveWorkerCount(), 1u);
}

TEST_F(PoolTest, DroppedStreamIsNotABreakerFailure) {
    auto config = smallConfig();
    config.maxWorkers = 1;
    config.preWarmCount = 1;
    capability::SyntheticOptions opts;
    opts.tokenDelay = 20ms;
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    {
        auto dropped = pool->submit(prompt("one two three four five six seven eight", 8));
        ASSERT_TRUE(dropped);
        auto chunk = dropped.value().nextFor(5s);
        ASSERT_TRUE(chunk) << chunk.error().message;
    }

    auto next = pool->submit(prompt("still served", 2));
    ASSERT_TRUE(next) << next.error().message;
    auto result = next.value().collect(5s);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().text, "still served");

    ASSERT_TRUE(wait_until([&] {
        auto s = pool->metrics().snapshot();
        return s.requestsAbandoned == 1 && s.requestsSucceeded == 1;
    }));
    auto snapshot = pool->metrics().snapshot();
    EXPECT_EQ(snapshot.requestsFailed, 1u) << "abandonment is a local failure";
    EXPECT_EQ(snapshot.requestsSucceeded, 1u);
    EXPECT_EQ(pool->circuitBreaker().stats().windowFailures, 0u);
    EXPECT_EQ(pool->circuitBreaker().state(), BreakerState::Closed);
}

TEST_F(PoolTest, StalledLoadIsAbandonedAndRespawned) {
    auto config = smallConfig();
    config.maxWorkers = 1;
    config.preWarmCount = 1;
    config.loadTimeout = 1s;
    auto gate = std::make_shared<capability::StallGate>();
    auto loads = std::make_shared<std::atomic<int>>(0);
    CapabilityLoader loader = [gate, loads, synthetic = capability::makeSyntheticLoader()](
                                  const DeviceConfig& device) {
        if (loads->fetch_add(1) == 0)
            gate->waitOpen();
        return synthetic(device);
    };
    governor_ = MemoryGovernor::create(4096);
    auto pool = std::make_unique<Pool>(CapabilityKey{"pool-test"}, config, loader, governor_);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(wait_until([&] { return gate->waiting() == 1; }));
    auto stuck = pool->workers()->front();
    EXPECT_EQ(stuck->state(), WorkerState::Spawning);

    const auto now = std::chrono::steady_clock::now();
    EXPECT_EQ(pool->runMaintenance(now).stalledLoads, 0u);
    auto late = pool->runMaintenance(now + 5s);
    EXPECT_EQ(late.stalledLoads, 1u);
    EXPECT_EQ(stuck->state(), WorkerState::Dead);
    EXPECT_EQ(pool->liveWorkerCount(), 0u);
    EXPECT_EQ(governor_->reservedMb(), 0u);
    EXPECT_EQ(pool->metrics().snapshot().spawnFailures, 1u);

    auto waited = pool->waitForWorkers(200ms);
    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, ErrorCode::SpawnFailed);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto stream = pool->submit(prompt("after stall", 2));
    ASSERT_TRUE(stream) << stream.error().message;
    EXPECT_TRUE(stream.value().collect(5s));
    EXPECT_EQ(loads->load(), 2);

    gate->open();
    ASSERT_TRUE(wait_until([&] { return stuck->exited(); }));
}

TEST_F(PoolTest, ShutdownLeavesAbandonedWorkerBehind) {
    auto config = smallConfig();
    config.minWorkers = 0;
    config.preWarmCount = 1;
    config.maxWorkers = 1;
    config.healthStaleAfter = 50ms;
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto pool = makePool(config, opts);

    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));
    auto stuck = pool->submit(prompt("hang"));
    ASSERT_TRUE(stuck);
    ASSERT_TRUE(wait_until([&] { return opts.stall->waiting() == 1; }));
    std::weak_ptr<Worker> worker = pool->workers()->front();

    const auto now = std::chrono::steady_clock::now();
    pool->runMaintenance(now);
    EXPECT_EQ(pool->runMaintenance(now + 10s).unresponsive, 1u);
    EXPECT_EQ(governor_->reservedMb(), 0u);

    auto done = std::async(std::launch::async, [&] { pool->shutdown(); });
    const bool returned = done.wait_for(3s) == std::future_status::ready;
    if (!returned)
        opts.stall->open();
    done.get();
    EXPECT_TRUE(returned) << "shutdown waited on a worker stuck in its capability";

    // The worker thread keeps its worker alive after the pool is gone.
    pool.reset();
    EXPECT_FALSE(worker.expired());
    opts.stall->open();
    ASSERT_TRUE(wait_until([&] { return worker.expired(); }));
}

TEST_F(PoolTest, ShutdownStopsEverything) {
    auto pool = makePool(smallConfig());
    ASSERT_TRUE(pool->ensureCapacity());
    ASSERT_TRUE(pool->waitForWorkers(5s));

    pool->shutdown();
    pool->shutdown();
    EXPECT_EQ(governor_->reservedMb(), 0u);
    EXPECT_EQ(pool->liveWorkerCount(), 0u);

    auto ensured = pool->ensureCapacity();
    ASSERT_FALSE(ensured);
    EXPECT_EQ(ensured.error().code, ErrorCode::SystemShutdown);
    auto submitted = pool->submit(prompt("late"));
    ASSERT_FALSE(submitted);
    EXPECT_EQ(submitted.error().code, ErrorCode::SystemShutdown);
    auto waited = pool->waitForWorkers(10ms);
    ASSERT_FALSE(waited);
    EXPECT_EQ(waited.error().code, ErrorCode::SystemShutdown);
}

TEST_F(PoolTest, ConcurrentColdStartSpawnsOnce) {
    auto pool = makePool(smallConfig());
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] { EXPECT_TRUE(pool->ensureCapacity()); });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(pool->liveWorkerCount(), 2u);
    EXPECT_EQ(pool->metrics().snapshot().workersSpawned, 2u);
}

} // namespace corral::pool::test
