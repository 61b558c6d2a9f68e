#include "core/CrossfadeOrchestrator.h"
#include "core/Logger.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <thread>

namespace segue {

ResumeStrategy resumeStrategyFor(double progress)
{
    return progress < 0.5 ? ResumeStrategy::continueFromProgress : ResumeStrategy::quickFinish;
}

RollbackAction rollbackActionFor(double elapsed, double duration)
{
    double p = duration > 0.0 ? elapsed / duration : 1.0;
    if (p < 0.2)
        return RollbackAction::rollback;
    if (p <= 0.9)
        return RollbackAction::fastForward;
    return RollbackAction::letFinish;
}

static const char* assetName(const AssetPtr& asset)
{
    return asset ? asset->uri.c_str() : "(none)";
}

// ═══════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════

CrossfadeOrchestrator::CrossfadeOrchestrator(std::shared_ptr<ChannelEngine> engine,
                                             PlaybackStateCoordinator& state,
                                             TimeoutEstimator& timeouts,
                                             const OrchestratorOptions& options,
                                             TransitionObserver* observer)
    : engine_(std::move(engine))
    , state_(state)
    , timeouts_(timeouts)
    , options_(options)
    , observer_(observer)
{
    SG_INFO("CrossfadeOrchestrator: created (rollback=%.2fs, quickFinish=%.2fs)",
            options_.rollbackDuration, options_.quickFinishDuration);
}

CrossfadeOrchestrator::~CrossfadeOrchestrator()
{
    SG_DEBUG("CrossfadeOrchestrator: destroyed at generation %llu",
             static_cast<unsigned long long>(generation()));
}

// ═══════════════════════════════════════════════════════════════════
// Transition bookkeeping
// ═══════════════════════════════════════════════════════════════════

uint64_t CrossfadeOrchestrator::beginTransition(double duration, FadeCurve curve,
                                                TransitionKind kind, const AssetPtr& from,
                                                double activePosition)
{
    auto transition = std::make_unique<ActiveTransition>();
    transition->startTime = Clock::now();
    transition->duration = duration;
    transition->curve = curve;
    transition->kind = kind;
    transition->from = from;
    transition->startPosition = activePosition;

    std::lock_guard<std::mutex> lock(mutex_);
    transition->generation = ++generation_;
    active_ = std::move(transition);
    return generation_;
}

bool CrossfadeOrchestrator::isCurrent(uint64_t gen) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && active_->generation == gen;
}

void CrossfadeOrchestrator::dropIfCurrent(uint64_t gen)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && active_->generation == gen)
        active_.reset();
}

// ═══════════════════════════════════════════════════════════════════
// Asset loading
// ═══════════════════════════════════════════════════════════════════

namespace {

struct LoadCall {
    std::mutex mutex;
    std::condition_variable done;
    bool finished = false;
    bool ok = false;
    AssetPtr asset;
    std::string error;
};

} // namespace

bool CrossfadeOrchestrator::loadWithDeadline(const std::string& uri, AssetPtr& asset, Error& error)
{
    Seconds expected = options_.expectedAssetLoad;
    Seconds deadline = timeouts_.adaptiveTimeout(kAssetLoadKind, expected);
    auto call = std::make_shared<LoadCall>();
    auto engine = engine_;
    auto started = Clock::now();

    SG_DEBUG("CrossfadeOrchestrator: loading '%s' (deadline %.3fs)", uri.c_str(), deadline.count());

    // The helper outlives a timed-out wait; it only touches shared state.
    std::thread([call, engine, uri]
    {
        AssetPtr loaded;
        std::string loadError;
        bool ok = false;
        try
        {
            ok = engine->loadAsset(uri, loaded, loadError);
        }
        catch (const std::exception& e)
        {
            loadError = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(call->mutex);
            call->finished = true;
            call->ok = ok;
            call->asset = std::move(loaded);
            call->error = std::move(loadError);
        }
        call->done.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(call->mutex);
    if (!call->done.wait_for(lock, deadline, [&call] { return call->finished; }))
    {
        SG_WARN("CrossfadeOrchestrator: load of '%s' exceeded %.3fs", uri.c_str(), deadline.count());
        error.set(ErrorCode::assetLoadTimeout,
                  "asset load timed out after " + std::to_string(deadline.count()) + "s: " + uri);
        return false;
    }

    if (!call->ok || !call->asset)
    {
        std::string reason = call->error.empty() ? std::string("no asset returned") : call->error;
        SG_ERROR("CrossfadeOrchestrator: load of '%s' failed: %s", uri.c_str(), reason.c_str());
        error.set(ErrorCode::assetLoadFailed, "failed to load '" + uri + "': " + reason);
        return false;
    }

    Seconds actual = Clock::now() - started;
    timeouts_.recordDuration(kAssetLoadKind, expected, actual);
    asset = call->asset;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Cleanup helpers
// ═══════════════════════════════════════════════════════════════════

void CrossfadeOrchestrator::completeChannelSwitch()
{
    engine_->switchActiveChannel();
    state_.switchActiveChannel();

    engine_->stopInactiveChannel();
    engine_->resetInactiveMixer();
    engine_->clearInactiveAsset();

    state_.clearInactive();
    state_.setGains(1.0f, 0.0f);
    state_.setCrossfading(false);

    SG_INFO("CrossfadeOrchestrator: now on channel %s (%s)",
            channelName(state_.activeChannel()), assetName(state_.activeAsset()));
}

void CrossfadeOrchestrator::resetInactiveSide()
{
    engine_->stopInactiveChannel();
    engine_->resetInactiveMixer();
    engine_->clearInactiveAsset();

    state_.clearInactive();
    state_.setGains(1.0f, 0.0f);
    state_.setCrossfading(false);
}

void CrossfadeOrchestrator::supersedeActiveTransition()
{
    std::unique_ptr<ActiveTransition> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = std::move(active_);
    }
    if (!previous)
        return;

    double elapsed = previous->elapsed();
    RollbackAction action = rollbackActionFor(elapsed, previous->duration);
    SG_INFO("CrossfadeOrchestrator: superseding transition %llu at %.2f/%.2fs -> %s",
            static_cast<unsigned long long>(previous->generation), elapsed, previous->duration,
            rollbackActionName(action));

    // Separate fades hold cleanupMutex_ while the engine fades; cut it short.
    if (!previous->synchronized)
        engine_->cancelTransition();

    std::lock_guard<std::mutex> cleanup(cleanupMutex_);
    if (!previous->synchronized)
    {
        // Still loading or in separate fades: nothing to ramp, just stop.
        engine_->cancelTransition();
        resetInactiveSide();
        return;
    }

    switch (action)
    {
        case RollbackAction::rollback:
        {
            float from = engine_->rollbackTransition(options_.rollbackDuration);
            SG_DEBUG("CrossfadeOrchestrator: rolled back from active gain %.3f, '%s' resumes at %.2fs",
                     from, assetName(previous->from), previous->startPosition);
            resetInactiveSide();
            break;
        }
        case RollbackAction::fastForward:
            engine_->fastForwardTransition(options_.rollbackDuration);
            completeChannelSwitch();
            break;
        case RollbackAction::letFinish:
            // Natural pace; at most a tenth of the old duration.
            engine_->fastForwardTransition(std::max(0.0, previous->duration - elapsed));
            completeChannelSwitch();
            break;
    }
}

void CrossfadeOrchestrator::discardPausedTransition()
{
    std::unique_ptr<PausedTransition> paused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused = std::move(paused_);
    }
    if (!paused)
        return;

    SG_INFO("CrossfadeOrchestrator: discarding paused transition to '%s' at %.2f",
            assetName(paused->to), paused->progress);

    std::lock_guard<std::mutex> cleanup(cleanupMutex_);
    engine_->cancelTransition();
    resetInactiveSide();
}

void CrossfadeOrchestrator::notifyFinished(TransitionResult result)
{
    SG_DEBUG("CrossfadeOrchestrator: transition finished (%s)", transitionResultName(result));
    if (observer_)
        observer_->onTransitionFinished(result);
}

TransitionResult CrossfadeOrchestrator::awaitStream(const std::shared_ptr<ProgressStream>& stream,
                                                    uint64_t gen)
{
    if (stream)
    {
        TransitionProgress event;
        while (stream->next(event))
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (active_ && active_->generation == gen)
                    active_->progress = event.progress();
            }
            SG_TRACE("CrossfadeOrchestrator: %s %.3f", progressPhaseName(event.phase),
                     event.progress());
            if (observer_)
                observer_->onTransitionProgress(event);
        }
    }
    else
    {
        SG_WARN("CrossfadeOrchestrator: engine returned no progress stream");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (paused_ && paused_->generation == gen)
            return TransitionResult::paused;
        if (!active_ || active_->generation != gen)
            return TransitionResult::cancelled;
        active_.reset();
    }

    std::lock_guard<std::mutex> cleanup(cleanupMutex_);
    completeChannelSwitch();
    return TransitionResult::completed;
}

// ═══════════════════════════════════════════════════════════════════
// startTransition
// ═══════════════════════════════════════════════════════════════════

bool CrossfadeOrchestrator::startTransition(const std::string& targetUri, double duration,
                                            FadeCurve curve, TransitionKind kind,
                                            TransitionResult& result, Error& error)
{
    SG_INFO("CrossfadeOrchestrator: transition to '%s' (%.2fs, %s, %s)", targetUri.c_str(),
            duration, fadeCurveName(curve),
            kind == TransitionKind::automaticLoop ? "automatic" : "manual");

    supersedeActiveTransition();

    AssetPtr from = state_.activeAsset();
    if (!from)
    {
        error.set(ErrorCode::invalidState, "no active asset to transition from");
        return false;
    }

    PlaybackPosition position;
    if (!engine_->getCurrentPosition(position))
    {
        position.position = 0.0;
        position.duration = from->durationSeconds;
    }

    TransitionStrategy strategy = decideTransitionStrategy(position.position, position.duration,
                                                           duration);
    SG_INFO("CrossfadeOrchestrator: %.2fs of %.2fs left, using %s",
            position.duration - position.position, position.duration,
            strategy.describe().c_str());

    discardPausedTransition();

    if (!strategy.isCrossfade())
        return runSeparateFades(targetUri, strategy, curve, kind, from, position.position,
                                result, error);

    uint64_t gen = beginTransition(strategy.duration, curve, kind, from, position.position);

    AssetPtr target;
    if (!loadWithDeadline(targetUri, target, error))
    {
        dropIfCurrent(gen);
        return false;
    }

    bool superseded = false;
    std::shared_ptr<ProgressStream> stream;
    {
        std::lock_guard<std::mutex> cleanup(cleanupMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_ || active_->generation != gen)
                superseded = true;
            else
            {
                active_->to = target;
                active_->synchronized = true;
            }
        }

        if (!superseded)
        {
            state_.loadOnInactive(target);
            engine_->assignInactiveChannel(target);

            state_.setCrossfading(true);
            engine_->prepareInactiveChannel();
            stream = engine_->performSynchronizedTransition(strategy.duration, curve);
        }
    }
    if (superseded)
    {
        SG_INFO("CrossfadeOrchestrator: transition %llu superseded during load",
                static_cast<unsigned long long>(gen));
        result = TransitionResult::cancelled;
        notifyFinished(result);
        return true;
    }

    if (observer_)
        observer_->onTransitionStarted(strategy);

    result = awaitStream(stream, gen);
    notifyFinished(result);
    return true;
}

bool CrossfadeOrchestrator::runSeparateFades(const std::string& targetUri,
                                             const TransitionStrategy& strategy,
                                             FadeCurve curve, TransitionKind kind,
                                             const AssetPtr& from, double position,
                                             TransitionResult& result, Error& error)
{
    uint64_t gen = beginTransition(strategy.fadeOutDuration + strategy.fadeInDuration,
                                   curve, kind, from, position);

    AssetPtr target;
    if (!loadWithDeadline(targetUri, target, error))
    {
        dropIfCurrent(gen);
        return false;
    }

    // Each step below runs under cleanupMutex_ and only while this is still
    // the current transition. Pause, cancel and a newer transition take it
    // out of active_, interrupt the engine fade, then clean up.
    auto advance = [this, gen](double progress, bool switched, bool finished)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_ || active_->generation != gen)
            return false;
        active_->progress = progress;
        active_->switched = switched;
        if (finished)
            active_.reset();
        return true;
    };

    result = TransitionResult::cancelled;
    bool loaded = false;
    {
        std::lock_guard<std::mutex> cleanup(cleanupMutex_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            loaded = active_ && active_->generation == gen;
            if (loaded)
                active_->to = target;
        }
        if (loaded)
        {
            state_.loadOnInactive(target);
            engine_->assignInactiveChannel(target);
            state_.setCrossfading(true);
        }
    }
    if (!loaded)
    {
        notifyFinished(result);
        return true;
    }

    if (observer_)
        observer_->onTransitionStarted(strategy);

    bool swapped = false;
    {
        std::lock_guard<std::mutex> cleanup(cleanupMutex_);
        if (isCurrent(gen))
            engine_->fadeActiveChannel(1.0f, 0.0f, strategy.fadeOutDuration, curve);

        swapped = advance(0.5, true, false);
        if (swapped)
        {
            engine_->switchActiveChannel();
            state_.switchActiveChannel();
            engine_->startActiveChannel();
        }
    }

    if (swapped)
    {
        std::lock_guard<std::mutex> cleanup(cleanupMutex_);
        if (isCurrent(gen))
            engine_->fadeActiveChannel(0.0f, 1.0f, strategy.fadeInDuration, curve);

        if (advance(1.0, true, true))
        {
            engine_->stopInactiveChannel();
            engine_->resetInactiveMixer();
            engine_->clearInactiveAsset();
            state_.clearInactive();
            state_.setGains(1.0f, 0.0f);
            state_.setCrossfading(false);
            result = TransitionResult::completed;
            SG_INFO("CrossfadeOrchestrator: separate fades done, now on '%s'", assetName(target));
        }
    }

    notifyFinished(result);
    return true;
}

void CrossfadeOrchestrator::settleOnTarget(const ActiveTransition& transition)
{
    // Stops a fade in progress; the driver then gives up cleanupMutex_.
    engine_->pauseBothChannels();

    std::lock_guard<std::mutex> cleanup(cleanupMutex_);
    if (!transition.to)
    {
        SG_INFO("CrossfadeOrchestrator: paused before the target was loaded");
        return;
    }

    engine_->pauseBothChannels();
    if (!transition.switched)
    {
        engine_->switchActiveChannel();
        state_.switchActiveChannel();
    }
    engine_->fadeActiveChannel(1.0f, 1.0f, 0.0, FadeCurve::linear);
    resetInactiveSide();

    SG_INFO("CrossfadeOrchestrator: separate fades paused at %.2f, settled on '%s'",
            transition.progress, assetName(transition.to));
}

// ═══════════════════════════════════════════════════════════════════
// Pause / resume / cancel
// ═══════════════════════════════════════════════════════════════════

bool CrossfadeOrchestrator::pauseTransition(PausedTransitionSnapshot& out)
{
    CrossfadeSnapshot engineState;
    std::unique_ptr<ActiveTransition> separate;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_)
        {
            SG_DEBUG("CrossfadeOrchestrator: pause with no active transition");
            return false;
        }
        if (!active_->synchronized)
            separate = std::move(active_);
    }

    if (separate)
    {
        settleOnTarget(*separate);
        return false;
    }

    if (!engine_->getCrossfadeSnapshot(engineState))
    {
        SG_WARN("CrossfadeOrchestrator: engine has no crossfade state, plain pause instead");
        return false;
    }

    auto paused = std::make_unique<PausedTransition>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Completed or superseded while the snapshot was taken
        if (!active_)
            return false;

        paused->generation = active_->generation;
        paused->progress = active_->progress;
        paused->originalDuration = active_->duration;
        paused->curve = active_->curve;
        paused->kind = active_->kind;
        paused->from = active_->from;
        paused->to = active_->to;
        paused->engineState = engineState;
        paused->resumeStrategy = resumeStrategyFor(paused->progress);

        out.fromAsset = paused->from;
        out.toAsset = paused->to;
        out.duration = paused->originalDuration;
        out.curve = paused->curve;
        out.kind = paused->kind;
        out.progress = paused->progress;
        out.resumeStrategy = paused->resumeStrategy;
        out.remainingDuration = paused->originalDuration * (1.0 - paused->progress);
        out.finishDuration = options_.quickFinishDuration;
        out.engineState = engineState;

        paused_ = std::move(paused);
        active_.reset();
    }

    engine_->pauseBothChannels();
    state_.setGains(engineState.activeGain, engineState.inactiveGain);

    SG_INFO("CrossfadeOrchestrator: paused at %.2f (gains %.3f/%.3f), resume via %s",
            out.progress, engineState.activeGain, engineState.inactiveGain,
            resumeStrategyName(out.resumeStrategy));
    return true;
}

bool CrossfadeOrchestrator::resumeTransition()
{
    std::unique_ptr<PausedTransition> paused;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused = std::move(paused_);
    }
    if (!paused)
    {
        SG_DEBUG("CrossfadeOrchestrator: nothing to resume");
        return false;
    }

    if (paused->resumeStrategy == ResumeStrategy::continueFromProgress)
    {
        double remaining = paused->originalDuration * (1.0 - paused->progress);
        SG_INFO("CrossfadeOrchestrator: %.2fs of the crossfade were left, finishing in %.2fs",
                remaining, options_.quickFinishDuration);
    }

    uint64_t gen = beginTransition(options_.quickFinishDuration, paused->curve, paused->kind,
                                   paused->from, paused->engineState.activePosition);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && active_->generation == gen)
        {
            active_->to = paused->to;
            active_->synchronized = true;
        }
    }

    auto stream = engine_->resumeTransition(options_.quickFinishDuration, paused->curve,
                                            paused->engineState.activeGain,
                                            paused->engineState.inactiveGain);
    if (observer_)
        observer_->onTransitionStarted(TransitionStrategy::fullCrossfade(options_.quickFinishDuration));
    TransitionResult result = awaitStream(stream, gen);
    notifyFinished(result);
    return true;
}

void CrossfadeOrchestrator::cancelActiveTransition()
{
    std::unique_ptr<ActiveTransition> active;
    bool hadPaused = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active = std::move(active_);
        hadPaused = paused_ != nullptr;
        paused_.reset();
    }

    if (!active && !hadPaused)
        return;

    SG_INFO("CrossfadeOrchestrator: cancelling %s transition", active ? "active" : "paused");

    if (active && !active->synchronized)
        engine_->cancelTransition();

    std::lock_guard<std::mutex> cleanup(cleanupMutex_);
    engine_->cancelTransition();
    resetInactiveSide();
}

void CrossfadeOrchestrator::clearPausedTransition()
{
    std::lock_guard<std::mutex> lock(mutex_);
    paused_.reset();
}

// ═══════════════════════════════════════════════════════════════════
// Immediate switch
// ═══════════════════════════════════════════════════════════════════

bool CrossfadeOrchestrator::switchImmediately(const std::string& uri, bool startPlayback,
                                              Error& error)
{
    supersedeActiveTransition();
    discardPausedTransition();

    AssetPtr asset;
    if (!loadWithDeadline(uri, asset, error))
        return false;

    std::lock_guard<std::mutex> cleanup(cleanupMutex_);
    engine_->assignInactiveChannel(asset);
    engine_->switchActiveChannel();
    engine_->fadeActiveChannel(1.0f, 1.0f, 0.0, FadeCurve::linear);
    engine_->stopInactiveChannel();
    engine_->resetInactiveMixer();
    engine_->clearInactiveAsset();
    if (startPlayback)
        engine_->startActiveChannel();

    if (!state_.atomicSwitch(asset, !startPlayback))
    {
        error.set(ErrorCode::invalidState, "coordinator rejected switch to '" + uri + "'");
        return false;
    }
    state_.clearInactive();

    SG_INFO("CrossfadeOrchestrator: switched to '%s' without fade", uri.c_str());
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

bool CrossfadeOrchestrator::hasActiveTransition() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ != nullptr;
}

bool CrossfadeOrchestrator::hasPausedTransition() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_ != nullptr;
}

double CrossfadeOrchestrator::activeProgress() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ ? active_->progress : 0.0;
}

double CrossfadeOrchestrator::activeStartPosition() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ ? active_->startPosition : 0.0;
}

uint64_t CrossfadeOrchestrator::generation() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

} // namespace segue
