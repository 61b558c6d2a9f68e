#include "core/TransitionService.h"
#include "core/Logger.h"

#include <exception>

namespace segue {

static OrchestratorOptions orchestratorOptionsFor(const ServiceConfig& config)
{
    OrchestratorOptions options;
    options.rollbackDuration = config.rollbackDuration;
    options.quickFinishDuration = config.quickFinishDuration;
    options.expectedAssetLoad = Seconds(config.expectedAssetLoad);
    return options;
}

static QueueOptions queueOptionsFor(const ServiceConfig& config)
{
    QueueOptions options;
    options.maxDepth = config.maxQueueDepth;
    options.signalRunningOnPreempt = config.signalRunningOnPreempt;
    return options;
}

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

std::unique_ptr<TransitionService> TransitionService::create(std::shared_ptr<ChannelEngine> engine,
                                                             const ServiceConfig& config,
                                                             std::string& error,
                                                             TransitionObserver* observer)
{
    if (!engine)
    {
        error = "no channel engine";
        SG_ERROR("TransitionService::create: %s", error.c_str());
        return nullptr;
    }

    if (!config.validate(error))
    {
        SG_ERROR("TransitionService::create: invalid config: %s", error.c_str());
        return nullptr;
    }

    return std::unique_ptr<TransitionService>(
        new TransitionService(std::move(engine), config, observer));
}

TransitionService::TransitionService(std::shared_ptr<ChannelEngine> engine,
                                     const ServiceConfig& config,
                                     TransitionObserver* observer)
    : config_(config)
    , engine_(std::move(engine))
    , relay_(*this, observer)
    , orchestrator_(engine_, coordinator_, timeouts_, orchestratorOptionsFor(config), &relay_)
    , queue_(queueOptionsFor(config))
{
    SG_INFO("TransitionService: ready (crossfade=%.1fs curve=%s depth=%d)",
            config_.crossfadeDuration, fadeCurveName(config_.fadeCurve), config_.maxQueueDepth);
}

TransitionService::~TransitionService()
{
    queue_.cancelAll();
    queue_.waitUntilIdle();
    orchestrator_.cancelActiveTransition();
    reapDrivers(true);
    SG_INFO("TransitionService: destroyed");
}

// ═══════════════════════════════════════════════════════════════════
// Command plumbing
// ═══════════════════════════════════════════════════════════════════

bool TransitionService::runCommand(OperationPriority priority, const char* tag,
                                   std::function<Error(const CancellationToken&)> body,
                                   Error& error)
{
    std::future<Error> result;
    if (!queue_.enqueue(priority, tag, std::move(body), result, error))
    {
        SG_WARN("TransitionService: %s not admitted: %s", tag, error.message.c_str());
        return false;
    }

    try
    {
        error = result.get();
    }
    catch (const OperationError& e)
    {
        error = e.error();
    }
    catch (const std::exception& e)
    {
        error.set(ErrorCode::engineFailure, std::string(tag) + ": " + e.what());
    }

    if (error)
    {
        SG_WARN("TransitionService: %s failed (%s): %s", tag, errorCodeName(error.code),
                error.message.c_str());
        return false;
    }
    return true;
}

void TransitionService::StartSignal::fire(const Error& error)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (fired)
        return;
    fired = true;
    promise.set_value(error);
}

Error TransitionService::launchDriver(const char* tag, std::function<bool(Error&)> run)
{
    reapDrivers(false);

    auto signal = std::make_shared<StartSignal>();
    std::future<Error> started = signal->promise.get_future();
    auto done = std::make_shared<std::atomic<bool>>(false);

    {
        std::lock_guard<std::mutex> lock(driverMutex_);
        pendingStart_ = signal;

        std::thread thread([this, tag, run = std::move(run), signal, done]
        {
            Error error;
            if (!run(error))
                SG_WARN("TransitionService: %s driver: %s", tag, error.message.c_str());
            signal->fire(error);
            done->store(true, std::memory_order_release);
        });
        drivers_.push_back({std::move(thread), done});
    }

    return started.get();
}

void TransitionService::signalStarted()
{
    std::shared_ptr<StartSignal> signal;
    {
        std::lock_guard<std::mutex> lock(driverMutex_);
        signal = pendingStart_;
    }
    if (signal)
        signal->fire(Error{});
}

void TransitionService::reapDrivers(bool all)
{
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(driverMutex_);
        for (auto it = drivers_.begin(); it != drivers_.end();)
        {
            if (all || it->done->load(std::memory_order_acquire))
            {
                finished.push_back(std::move(it->thread));
                it = drivers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (auto& thread : finished)
        if (thread.joinable())
            thread.join();
}

void TransitionService::waitUntilIdle()
{
    queue_.waitUntilIdle();
    reapDrivers(true);
}

// ═══════════════════════════════════════════════════════════════════
// Relay
// ═══════════════════════════════════════════════════════════════════

void TransitionService::Relay::onTransitionStarted(const TransitionStrategy& strategy)
{
    if (host_)
        host_->onTransitionStarted(strategy);
    owner_.signalStarted();
}

void TransitionService::Relay::onTransitionProgress(const TransitionProgress& progress)
{
    if (host_)
        host_->onTransitionProgress(progress);
}

void TransitionService::Relay::onTransitionFinished(TransitionResult result)
{
    if (host_)
        host_->onTransitionFinished(result);
}

// ═══════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════

bool TransitionService::play(const std::string& uri, Error& error)
{
    return runCommand(OperationPriority::normal, "play",
                      [this, uri](const CancellationToken&) { return playBody(uri); }, error);
}

bool TransitionService::crossfadeTo(const std::string& uri, TransitionKind kind, Error& error)
{
    return runCommand(OperationPriority::normal, "crossfade",
                      [this, uri, kind](const CancellationToken& token)
                      { return crossfadeBody(uri, kind, token); }, error);
}

bool TransitionService::pause(Error& error)
{
    return runCommand(OperationPriority::high, "pause",
                      [this](const CancellationToken&) { return pauseBody(); }, error);
}

bool TransitionService::resume(Error& error)
{
    return runCommand(OperationPriority::normal, "resume",
                      [this](const CancellationToken& token) { return resumeBody(token); }, error);
}

bool TransitionService::stop(Error& error)
{
    return runCommand(OperationPriority::critical, "stop",
                      [this](const CancellationToken&) { return stopBody(); }, error);
}

// ═══════════════════════════════════════════════════════════════════
// Command bodies (queue worker thread)
// ═══════════════════════════════════════════════════════════════════

Error TransitionService::playBody(const std::string& uri)
{
    Error error;
    if (orchestrator_.switchImmediately(uri, true, error))
        SG_INFO("TransitionService: playing '%s'", uri.c_str());
    return error;
}

Error TransitionService::crossfadeBody(const std::string& uri, TransitionKind kind,
                                       const CancellationToken& token)
{
    Error error;
    if (token.isCancelled())
    {
        error.set(ErrorCode::cancelled, "crossfade to '" + uri + "' cancelled before start");
        return error;
    }

    PlaybackMode mode = coordinator_.mode();
    if (mode == PlaybackMode::paused)
    {
        SG_INFO("TransitionService: paused, switching to '%s' without fade", uri.c_str());
        orchestrator_.switchImmediately(uri, false, error);
        return error;
    }

    if (mode != PlaybackMode::playing)
    {
        error.set(ErrorCode::invalidState,
                  std::string("crossfade needs playback, mode is ") + playbackModeName(mode));
        return error;
    }

    double duration = config_.crossfadeDuration;
    FadeCurve curve = config_.fadeCurve;
    return launchDriver("crossfade", [this, uri, duration, curve, kind](Error& e)
    {
        TransitionResult result = TransitionResult::cancelled;
        if (!orchestrator_.startTransition(uri, duration, curve, kind, result, e))
            return false;
        SG_DEBUG("TransitionService: crossfade to '%s' ended %s", uri.c_str(),
                 transitionResultName(result));
        return true;
    });
}

Error TransitionService::pauseBody()
{
    Error error;
    PlaybackMode mode = coordinator_.mode();
    if (mode == PlaybackMode::paused)
    {
        SG_DEBUG("TransitionService: already paused");
        return error;
    }

    PausedTransitionSnapshot snapshot;
    if (!orchestrator_.pauseTransition(snapshot))
    {
        if (mode != PlaybackMode::playing)
        {
            error.set(ErrorCode::invalidState,
                      std::string("cannot pause, mode is ") + playbackModeName(mode));
            return error;
        }
        engine_->pauseBothChannels();
    }

    coordinator_.setMode(PlaybackMode::paused);
    SG_INFO("TransitionService: paused");
    return error;
}

Error TransitionService::resumeBody(const CancellationToken& token)
{
    Error error;
    if (token.isCancelled())
    {
        error.set(ErrorCode::cancelled, "resume cancelled before start");
        return error;
    }

    if (orchestrator_.hasPausedTransition())
    {
        coordinator_.setMode(PlaybackMode::playing);
        return launchDriver("resume", [this](Error& e)
        {
            if (orchestrator_.resumeTransition())
                return true;
            e.set(ErrorCode::invalidState, "paused transition was discarded");
            return false;
        });
    }

    PlaybackMode mode = coordinator_.mode();
    if (mode == PlaybackMode::playing)
    {
        SG_DEBUG("TransitionService: already playing");
        return error;
    }

    if (mode != PlaybackMode::paused)
    {
        error.set(ErrorCode::invalidState,
                  std::string("cannot resume, mode is ") + playbackModeName(mode));
        return error;
    }

    engine_->startActiveChannel();
    coordinator_.setMode(PlaybackMode::playing);
    SG_INFO("TransitionService: resumed");
    return error;
}

Error TransitionService::stopBody()
{
    orchestrator_.cancelActiveTransition();
    engine_->stopBothChannels();
    coordinator_.setMode(PlaybackMode::stopped);
    SG_INFO("TransitionService: stopped");
    return Error{};
}

} // namespace segue
