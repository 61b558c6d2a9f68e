#include <catch2/catch_test_macros.hpp>
#include "core/TransitionService.h"
#include "core/TestChannelEngine.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace segue;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════
// Test helpers
// ═══════════════════════════════════════════════════════════════════

struct CountingObserver : TransitionObserver {
    std::atomic<int> started{0};
    std::mutex mutex;
    std::vector<TransitionResult> finished;

    void onTransitionStarted(const TransitionStrategy&) override { ++started; }

    void onTransitionFinished(TransitionResult result) override
    {
        std::lock_guard<std::mutex> lock(mutex);
        finished.push_back(result);
    }
};

static std::shared_ptr<TestChannelEngine> makeEngine()
{
    auto engine = std::make_shared<TestChannelEngine>();
    engine->addAsset("one.wav");
    engine->addAsset("two.wav");
    engine->addAsset("three.wav");
    return engine;
}

static std::unique_ptr<TransitionService> makeService(std::shared_ptr<TestChannelEngine> engine,
                                                      ServiceConfig config = ServiceConfig{},
                                                      TransitionObserver* observer = nullptr)
{
    std::string error;
    auto service = TransitionService::create(engine, config, error, observer);
    REQUIRE(service != nullptr);
    return service;
}

// ═══════════════════════════════════════════════════════════════════
// Creation
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("TransitionService create rejects an invalid config")
{
    ServiceConfig config;
    config.crossfadeDuration = 0.5;
    std::string error;
    auto service = TransitionService::create(makeEngine(), config, error);
    CHECK(service == nullptr);
    CHECK(error.find("crossfadeDuration") != std::string::npos);
}

TEST_CASE("TransitionService create rejects a missing engine")
{
    std::string error;
    CHECK(TransitionService::create(nullptr, ServiceConfig{}, error) == nullptr);
    CHECK_FALSE(error.empty());
}

TEST_CASE("TransitionService starts stopped and idle")
{
    auto service = makeService(makeEngine());
    CHECK(service->mode() == PlaybackMode::stopped);
    CHECK_FALSE(service->isTransitioning());
    CHECK_FALSE(service->hasPausedTransition());
    CHECK(service->depth() == 0);
    CHECK(service->config().crossfadeDuration == 10.0);
}

// ═══════════════════════════════════════════════════════════════════
// Play / stop
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("TransitionService play starts the asset")
{
    auto engine = makeEngine();
    auto service = makeService(engine);

    Error error;
    REQUIRE(service->play("one.wav", error));
    CHECK(service->mode() == PlaybackMode::playing);
    CHECK(service->state().activeAsset->uri == "one.wav");
    CHECK(engine->activePlaying());
}

TEST_CASE("TransitionService play of a missing asset fails and stays stopped")
{
    auto service = makeService(makeEngine());
    Error error;
    CHECK_FALSE(service->play("missing.wav", error));
    CHECK(error.code == ErrorCode::assetLoadFailed);
    CHECK(service->mode() == PlaybackMode::stopped);
}

TEST_CASE("TransitionService stop halts playback")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));

    REQUIRE(service->stop(error));
    CHECK(service->mode() == PlaybackMode::stopped);
    CHECK(engine->callCount("stopBothChannels") == 1);
    CHECK_FALSE(engine->activePlaying());
}

// ═══════════════════════════════════════════════════════════════════
// Crossfade
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("TransitionService crossfade needs playback")
{
    auto service = makeService(makeEngine());
    Error error;
    CHECK_FALSE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));
    CHECK(error.code == ErrorCode::invalidState);
}

TEST_CASE("TransitionService crossfade runs to completion in the background")
{
    auto engine = makeEngine();
    engine->setAutoComplete(100ms);
    CountingObserver observer;
    auto service = makeService(engine, ServiceConfig{}, &observer);

    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::automaticLoop, error));
    CHECK(observer.started == 1);

    service->waitUntilIdle();
    CHECK_FALSE(service->isTransitioning());
    CHECK(service->state().activeAsset->uri == "two.wav");
    CHECK(service->mode() == PlaybackMode::playing);

    std::lock_guard<std::mutex> lock(observer.mutex);
    REQUIRE(observer.finished.size() == 1);
    CHECK(observer.finished[0] == TransitionResult::completed);
}

TEST_CASE("TransitionService crossfade returns the load error")
{
    auto engine = makeEngine();
    engine->failLoad("bad.wav");
    auto service = makeService(engine);

    Error error;
    REQUIRE(service->play("one.wav", error));
    CHECK_FALSE(service->crossfadeTo("bad.wav", TransitionKind::manualChange, error));
    CHECK(error.code == ErrorCode::assetLoadFailed);
    service->waitUntilIdle();
    CHECK(service->state().activeAsset->uri == "one.wav");
    CHECK_FALSE(service->isTransitioning());
}

TEST_CASE("TransitionService crossfade while paused switches without a fade")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->pause(error));

    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));
    CHECK(service->mode() == PlaybackMode::paused);
    CHECK(service->state().activeAsset->uri == "two.wav");
    CHECK(engine->callCount("performSynchronizedTransition") == 0);
    CHECK_FALSE(engine->activePlaying());
}

// ═══════════════════════════════════════════════════════════════════
// Pause / resume
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("TransitionService pause and resume without a transition")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));

    REQUIRE(service->pause(error));
    CHECK(service->mode() == PlaybackMode::paused);
    CHECK_FALSE(engine->activePlaying());

    // Second pause is a no-op
    REQUIRE(service->pause(error));
    CHECK(engine->callCount("pauseBothChannels") == 1);

    REQUIRE(service->resume(error));
    CHECK(service->mode() == PlaybackMode::playing);
    CHECK(engine->activePlaying());

    // Resume while playing is a no-op
    REQUIRE(service->resume(error));
    CHECK(engine->callCount("startActiveChannel") == 2);
}

TEST_CASE("TransitionService pause and resume when stopped are rejected")
{
    auto service = makeService(makeEngine());
    Error error;
    CHECK_FALSE(service->pause(error));
    CHECK(error.code == ErrorCode::invalidState);
    error.clear();
    CHECK_FALSE(service->resume(error));
    CHECK(error.code == ErrorCode::invalidState);
}

TEST_CASE("TransitionService pause freezes a running crossfade and resume finishes it")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));
    CHECK(service->isTransitioning());

    REQUIRE(service->pause(error));
    CHECK(service->mode() == PlaybackMode::paused);
    CHECK(service->hasPausedTransition());
    CHECK_FALSE(service->isTransitioning());

    REQUIRE(service->resume(error));
    CHECK(service->mode() == PlaybackMode::playing);
    REQUIRE(engine->waitForStreams(2));
    CHECK_FALSE(service->hasPausedTransition());
    CHECK(engine->lastResumeDuration == service->config().quickFinishDuration);

    engine->finishStream();
    service->waitUntilIdle();
    CHECK(service->state().activeAsset->uri == "two.wav");
    CHECK_FALSE(service->state().crossfading);
}

TEST_CASE("TransitionService stop cancels a running crossfade")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));

    REQUIRE(service->stop(error));
    service->waitUntilIdle();
    CHECK(service->mode() == PlaybackMode::stopped);
    CHECK_FALSE(service->isTransitioning());
    CHECK(engine->callCount("cancelTransition") >= 1);
    CHECK(service->state().activeAsset->uri == "one.wav");
    CHECK(service->state().inactiveAsset == nullptr);
}

TEST_CASE("TransitionService stop drops a paused crossfade")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));
    REQUIRE(service->pause(error));

    REQUIRE(service->stop(error));
    CHECK_FALSE(service->hasPausedTransition());
    CHECK(service->mode() == PlaybackMode::stopped);
}

TEST_CASE("TransitionService pause during separate fades leaves the target paused")
{
    auto engine = makeEngine();
    engine->setPosition(58.0, 60.0); // 2s left of a 10s request
    engine->setFadeTime(300ms);
    CountingObserver observer;
    auto service = makeService(engine, ServiceConfig{}, &observer);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));

    REQUIRE(service->pause(error));
    service->waitUntilIdle();

    CHECK(service->mode() == PlaybackMode::paused);
    CHECK_FALSE(service->isTransitioning());
    CHECK_FALSE(service->hasPausedTransition());
    CHECK_FALSE(engine->activePlaying());
    CHECK_FALSE(engine->inactivePlaying());
    CHECK(engine->activeAsset()->uri == "two.wav");
    CHECK(service->state().activeAsset->uri == "two.wav");
    CHECK(service->state().inactiveAsset == nullptr);
    CHECK(engine->inactiveAsset() == nullptr);
    CHECK_FALSE(service->state().crossfading);
    {
        std::lock_guard<std::mutex> lock(observer.mutex);
        REQUIRE(observer.finished.size() == 1);
    }

    REQUIRE(service->resume(error));
    CHECK(service->mode() == PlaybackMode::playing);
    CHECK(engine->activePlaying());
    CHECK(engine->activeGain() == 1.0f);
    CHECK(service->state().activeAsset->uri == "two.wav");
}

TEST_CASE("TransitionService stop during separate fades leaves both sides agreeing")
{
    auto engine = makeEngine();
    engine->setPosition(58.0, 60.0);
    engine->setFadeTime(300ms);
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));

    REQUIRE(service->stop(error));
    service->waitUntilIdle();

    CHECK(service->mode() == PlaybackMode::stopped);
    CHECK_FALSE(service->isTransitioning());
    CHECK_FALSE(engine->activePlaying());
    CHECK_FALSE(engine->inactivePlaying());
    CHECK(engine->activeAsset()->uri == service->state().activeAsset->uri);
    CHECK(engine->activeChannel() == service->state().activeChannel);
    CHECK(service->state().inactiveAsset == nullptr);
    CHECK(engine->inactiveAsset() == nullptr);
    CHECK_FALSE(service->state().crossfading);
}

TEST_CASE("TransitionService second crossfade supersedes the first")
{
    auto engine = makeEngine();
    auto service = makeService(engine);
    Error error;
    REQUIRE(service->play("one.wav", error));
    REQUIRE(service->crossfadeTo("two.wav", TransitionKind::manualChange, error));
    REQUIRE(service->crossfadeTo("three.wav", TransitionKind::manualChange, error));
    REQUIRE(engine->waitForStreams(2));

    CHECK(engine->callCount("rollbackTransition") == 1);
    engine->finishStream();
    service->waitUntilIdle();
    CHECK(service->state().activeAsset->uri == "three.wav");
}

// ═══════════════════════════════════════════════════════════════════
// Queue passthrough
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("TransitionService enqueue runs custom operations on the command queue")
{
    auto service = makeService(makeEngine());
    std::future<int> result;
    Error error;
    REQUIRE(service->enqueue(OperationPriority::low, "custom",
                             [](const CancellationToken&) { return 7; }, result, error));
    CHECK(result.get() == 7);
}

TEST_CASE("TransitionService reports queueFull from a saturated queue")
{
    ServiceConfig config;
    config.maxQueueDepth = 1;
    auto service = makeService(makeEngine(), config);

    std::atomic<bool> entered{false};
    std::atomic<bool> release{false};
    std::future<void> blocker;
    Error error;
    REQUIRE(service->enqueue(OperationPriority::normal, "blocker", [&](const CancellationToken&)
    {
        entered = true;
        while (!release)
            std::this_thread::sleep_for(1ms);
    }, blocker, error));
    while (!entered)
        std::this_thread::sleep_for(1ms);

    CHECK_FALSE(service->play("one.wav", error));
    CHECK(error.code == ErrorCode::queueFull);
    CHECK(error.limit == 1);

    release = true;
    blocker.get();
    service->waitUntilIdle();
}
