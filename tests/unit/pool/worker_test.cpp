#include <gtest/gtest.h>

#include <corral/capability/SyntheticCapability.h>
#include <corral/pool/Worker.h>

#include "test_helpers.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace corral::pool::test {

using namespace std::chrono_literals;
using corral::tests::wait_until;

namespace {

class RecordingObserver : public WorkerObserver {
public:
    void onWorkerReady(Worker&) override { ready.fetch_add(1); }
    void onWorkerSpawnFailed(Worker&, const Error& error) override {
        std::lock_guard<std::mutex> lock(mutex);
        spawnError = error;
        spawnFailed.fetch_add(1);
    }
    void onRequestFinished(Worker&, const RequestOutcome& outcome) override {
        std::lock_guard<std::mutex> lock(mutex);
        outcomes.push_back(outcome);
    }
    void onWorkerExited(Worker&) override { exitedCount.fetch_add(1); }

    std::size_t finished() {
        std::lock_guard<std::mutex> lock(mutex);
        return outcomes.size();
    }

    std::atomic<int> ready{0};
    std::atomic<int> spawnFailed{0};
    std::atomic<int> exitedCount{0};
    std::mutex mutex;
    std::optional<Error> spawnError;
    std::vector<RequestOutcome> outcomes;
};

/// Records prompts in processing order.
class OrderCapability : public ICapability {
public:
    explicit OrderCapability(std::shared_ptr<std::vector<std::string>> seen) : seen_(seen) {}
    std::string_view name() const override { return "order"; }
    Result<void> generate(const GenerationRequest& request, ChunkSink& sink) override {
        seen_->push_back(request.prompt);
        sink.send(CompletionChunk::token(request.prompt));
        sink.send(CompletionChunk::complete({1, 1}));
        return {};
    }

private:
    std::shared_ptr<std::vector<std::string>> seen_;
};

GenerationRequest prompt(std::string text, std::uint32_t maxTokens = 8) {
    GenerationRequest r;
    r.prompt = std::move(text);
    r.maxTokens = maxTokens;
    return r;
}

} // namespace

class WorkerTest : public ::testing::Test {
protected:
    std::unique_ptr<Worker> makeWorker(CapabilityLoader loader, std::size_t queueCapacity = 8) {
        auto allocation = governor_->tryAllocate(kWorkerMb);
        EXPECT_TRUE(allocation);
        WorkerOptions options;
        options.queueCapacity = queueCapacity;
        options.pollInterval = 5ms;
        auto worker = std::make_unique<Worker>(nextId_++, CapabilityKey{"test-model"},
                                               std::move(loader), std::move(allocation).value(),
                                               options, &observer_);
        return worker;
    }

    static constexpr std::uint64_t kWorkerMb = 512;
    std::shared_ptr<MemoryGovernor> governor_ = MemoryGovernor::create(2048);
    RecordingObserver observer_;
    std::uint64_t nextId_ = 1;
};

TEST_F(WorkerTest, LoadsThenServes) {
    auto worker = makeWorker(capability::makeSyntheticLoader());
    EXPECT_EQ(worker->state(), WorkerState::Spawning);
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));
    EXPECT_EQ(observer_.ready.load(), 1);

    auto stream = worker->submit(prompt("alpha beta gamma", 3));
    ASSERT_TRUE(stream) << stream.error().message;
    auto result = stream.value().collect(5s);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().text, "alpha beta gamma");
    EXPECT_EQ(result.value().usage.outputTokens, 3u);

    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Idle; }));
    ASSERT_TRUE(wait_until([&] { return observer_.finished() == 1; }));
    EXPECT_TRUE(observer_.outcomes[0].succeeded);
    EXPECT_EQ(worker->completedRequests(), 1u);
    EXPECT_EQ(worker->activeRequests(), 0u);
}

TEST_F(WorkerTest, SubmitWhileSpawningIsRejected) {
    capability::SyntheticOptions opts;
    opts.loadDelay = 200ms;
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    worker->start();
    auto stream = worker->submit(prompt("early"));
    ASSERT_FALSE(stream);
    EXPECT_EQ(stream.error().code, ErrorCode::InvalidState);
}

TEST_F(WorkerTest, ProcessesInArrivalOrder) {
    auto seen = std::make_shared<std::vector<std::string>>();
    CapabilityLoader loader = [seen](const DeviceConfig&) -> Result<std::unique_ptr<ICapability>> {
        return std::unique_ptr<ICapability>(std::make_unique<OrderCapability>(seen));
    };
    auto worker = makeWorker(loader);
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    std::vector<ResponseStream> streams;
    for (const char* p : {"one", "two", "three", "four"}) {
        auto s = worker->submit(prompt(p));
        ASSERT_TRUE(s);
        streams.push_back(std::move(s).value());
    }
    for (auto& s : streams) {
        ASSERT_TRUE(s.collect(5s));
    }
    EXPECT_EQ(*seen, (std::vector<std::string>{"one", "two", "three", "four"}));
}

TEST_F(WorkerTest, RejectsBeyondConcurrencyLimit) {
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto worker = makeWorker(capability::makeSyntheticLoader(opts), 2);
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    auto a = worker->submit(prompt("a"));
    auto b = worker->submit(prompt("b"));
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    auto c = worker->submit(prompt("c"));
    ASSERT_FALSE(c);
    EXPECT_EQ(c.error().code, ErrorCode::QueueFull);
    EXPECT_EQ(worker->activeRequests(), 2u);

    opts.stall->open();
    EXPECT_TRUE(a.value().collect(5s));
    EXPECT_TRUE(b.value().collect(5s));
    ASSERT_TRUE(wait_until([&] { return worker->activeRequests() == 0; }));
    EXPECT_TRUE(worker->submit(prompt("d")));
}

TEST_F(WorkerTest, LoadFailureReleasesMemory) {
    capability::SyntheticOptions opts;
    opts.failLoad = true;
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    EXPECT_EQ(governor_->reservedMb(), kWorkerMb);
    worker->start();

    ASSERT_TRUE(wait_until([&] { return worker->exited(); }));
    EXPECT_EQ(worker->state(), WorkerState::Dead);
    EXPECT_EQ(governor_->reservedMb(), 0u);
    EXPECT_EQ(observer_.spawnFailed.load(), 1);
    ASSERT_TRUE(observer_.spawnError);
    EXPECT_EQ(observer_.spawnError->code, ErrorCode::SpawnFailed);
    EXPECT_EQ(observer_.ready.load(), 0);

    auto stream = worker->submit(prompt("x"));
    ASSERT_FALSE(stream);
    EXPECT_EQ(stream.error().code, ErrorCode::InvalidState);
}

TEST_F(WorkerTest, FailedRequestEndsWithErrorChunk) {
    auto worker = makeWorker(capability::makeSyntheticLoader());
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    auto stream = worker->submit(prompt("!fail please"));
    ASSERT_TRUE(stream);
    auto result = stream.value().collect(5s);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RequestFailed);
    ASSERT_TRUE(wait_until([&] { return observer_.finished() == 1; }));
    EXPECT_FALSE(observer_.outcomes[0].succeeded);
    EXPECT_EQ(worker->failedRequests(), 1u);
}

TEST_F(WorkerTest, DroppedStreamEndsGenerationEarly) {
    capability::SyntheticOptions opts;
    opts.tokenDelay = 20ms;
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    auto first = worker->submit(prompt("one two three four five six seven eight", 8));
    auto second = worker->submit(prompt("next in line", 3));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    {
        auto dropped = std::move(first).value();
        ASSERT_TRUE(dropped.nextFor(5s));
    }

    auto result = second.value().collect(5s);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result.value().text, "next in line");

    ASSERT_TRUE(wait_until([&] { return observer_.finished() == 2; }));
    std::lock_guard<std::mutex> lock(observer_.mutex);
    EXPECT_TRUE(observer_.outcomes[0].abandoned);
    EXPECT_FALSE(observer_.outcomes[0].succeeded);
    EXPECT_LT(observer_.outcomes[0].chunks, 8u);
    EXPECT_TRUE(observer_.outcomes[1].succeeded);
    EXPECT_FALSE(observer_.outcomes[1].abandoned);
}

TEST_F(WorkerTest, StopDrainsAcceptedWork) {
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    auto a = worker->submit(prompt("first"));
    auto b = worker->submit(prompt("second"));
    ASSERT_TRUE(a && b);
    worker->stop();
    EXPECT_FALSE(worker->submit(prompt("late")));

    opts.stall->open();
    EXPECT_TRUE(a.value().collect(5s));
    EXPECT_TRUE(b.value().collect(5s));
    ASSERT_TRUE(wait_until([&] { return worker->exited(); }));
    EXPECT_EQ(worker->state(), WorkerState::Dead);
    EXPECT_EQ(governor_->reservedMb(), 0u);
    EXPECT_EQ(observer_.exitedCount.load(), 1);
}

TEST_F(WorkerTest, AbandonFailsStreamsAndReleasesMemory) {
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    auto inflight = worker->submit(prompt("stuck"));
    auto queued = worker->submit(prompt("waiting"));
    ASSERT_TRUE(inflight && queued);
    ASSERT_TRUE(wait_until([&] { return opts.stall->waiting() == 1; }));

    worker->abandon("test");
    EXPECT_EQ(worker->state(), WorkerState::Dead);
    EXPECT_EQ(governor_->reservedMb(), 0u) << "memory returns before the thread exits";
    EXPECT_FALSE(worker->exited());

    auto r1 = inflight.value().collect(1s);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code, ErrorCode::WorkerUnresponsive);
    auto r2 = queued.value().collect(1s);
    ASSERT_FALSE(r2);
    EXPECT_EQ(r2.error().code, ErrorCode::WorkerUnresponsive);

    opts.stall->open();
    ASSERT_TRUE(wait_until([&] { return worker->exited(); }));
    EXPECT_EQ(observer_.finished(), 0u);
}

TEST_F(WorkerTest, HealthProbeDetectsStall) {
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    // A responsive worker answers each probe before the next one.
    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(worker->healthProbe(start, 100ms), ProbeVerdict::Healthy);
    ASSERT_TRUE(wait_until([&] {
        return worker->healthProbe(std::chrono::steady_clock::now(), 100ms) ==
               ProbeVerdict::Healthy;
    }));

    auto stream = worker->submit(prompt("hang"));
    ASSERT_TRUE(stream);
    ASSERT_TRUE(wait_until([&] { return opts.stall->waiting() == 1; }));

    // Let any acknowledgement already in flight land, then issue a fresh probe.
    ASSERT_TRUE(wait_until([&] {
        return worker->healthProbe(std::chrono::steady_clock::now(), 100ms) ==
               ProbeVerdict::Healthy;
    }));
    const auto probed = std::chrono::steady_clock::now();
    EXPECT_EQ(worker->healthProbe(probed + 10ms, 100ms), ProbeVerdict::Pending);
    EXPECT_EQ(worker->healthProbe(probed + 500ms, 100ms), ProbeVerdict::Stale);

    opts.stall->open();
    EXPECT_TRUE(stream.value().collect(5s));
}

TEST_F(WorkerTest, EvictionRequiresNoActiveRequests) {
    capability::SyntheticOptions opts;
    opts.stall = std::make_shared<capability::StallGate>();
    auto worker = makeWorker(capability::makeSyntheticLoader(opts));
    worker->start();
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Ready; }));

    auto stream = worker->submit(prompt("busy"));
    ASSERT_TRUE(stream);
    EXPECT_FALSE(worker->beginEviction());

    opts.stall->open();
    ASSERT_TRUE(stream.value().collect(5s));
    ASSERT_TRUE(wait_until([&] { return worker->state() == WorkerState::Idle; }));
    EXPECT_TRUE(worker->beginEviction());
    EXPECT_FALSE(worker->beginEviction());
    ASSERT_TRUE(wait_until([&] { return worker->exited(); }));
    EXPECT_EQ(worker->state(), WorkerState::Dead);
    EXPECT_EQ(governor_->reservedMb(), 0u);
}

} // namespace corral::pool::test
