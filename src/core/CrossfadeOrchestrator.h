#pragma once

#include "core/ChannelEngine.h"
#include "core/FadeCurve.h"
#include "core/PlaybackStateCoordinator.h"
#include "core/TimeoutEstimator.h"
#include "core/TransitionStrategy.h"
#include "core/Types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace segue {

enum class ResumeStrategy { continueFromProgress, quickFinish };

inline const char* resumeStrategyName(ResumeStrategy s)
{
    return s == ResumeStrategy::continueFromProgress ? "continueFromProgress" : "quickFinish";
}

/// continueFromProgress below half way, quickFinish from there on.
ResumeStrategy resumeStrategyFor(double progress);

enum class RollbackAction { rollback, fastForward, letFinish };

inline const char* rollbackActionName(RollbackAction a)
{
    switch (a) {
        case RollbackAction::rollback:    return "rollback";
        case RollbackAction::fastForward: return "fastForward";
        case RollbackAction::letFinish:   return "letFinish";
    }
    return "unknown";
}

/// What to do with a transition that a new one supersedes, by p = elapsed / duration:
///   p < 0.2         rollback to the pre-transition gains
///   0.2 <= p <= 0.9 fast-forward to completion
///   p > 0.9         let it run out
RollbackAction rollbackActionFor(double elapsed, double duration);

/// Caller-facing description of a paused transition.
struct PausedTransitionSnapshot {
    AssetPtr fromAsset;
    AssetPtr toAsset;
    double duration = 0.0;
    FadeCurve curve = FadeCurve::equalPower;
    TransitionKind kind = TransitionKind::manualChange;
    double progress = 0.0;
    ResumeStrategy resumeStrategy = ResumeStrategy::continueFromProgress;
    double remainingDuration = 0.0; // continueFromProgress: duration x (1 - progress)
    double finishDuration = 0.0;    // quickFinish: the fixed completion pass
    CrossfadeSnapshot engineState;
};

/// Injected at construction; callbacks arrive on whichever thread drives
/// the transition.
class TransitionObserver {
public:
    virtual ~TransitionObserver() = default;
    /// The target is loaded and the gain ramp is about to run.
    virtual void onTransitionStarted(const TransitionStrategy& /*strategy*/) {}
    virtual void onTransitionProgress(const TransitionProgress& /*progress*/) {}
    virtual void onTransitionFinished(TransitionResult /*result*/) {}
};

struct OrchestratorOptions {
    double rollbackDuration = 0.3;
    double quickFinishDuration = 1.0;
    Seconds expectedAssetLoad{0.5};
};

class CrossfadeOrchestrator {
public:
    static constexpr const char* kAssetLoadKind = "assetLoad";

    CrossfadeOrchestrator(std::shared_ptr<ChannelEngine> engine,
                          PlaybackStateCoordinator& state,
                          TimeoutEstimator& timeouts,
                          const OrchestratorOptions& options = OrchestratorOptions{},
                          TransitionObserver* observer = nullptr);
    ~CrossfadeOrchestrator();

    CrossfadeOrchestrator(const CrossfadeOrchestrator&) = delete;
    CrossfadeOrchestrator& operator=(const CrossfadeOrchestrator&) = delete;

    /// Blocks until the transition completes, is paused or is superseded.
    /// Returns false (error filled, no transition state left behind) when
    /// there is nothing playing or the target fails to load.
    bool startTransition(const std::string& targetUri, double duration, FadeCurve curve,
                         TransitionKind kind, TransitionResult& result, Error& error);

    /// Freeze the running transition. Returns false when there is no active
    /// transition or the engine cannot report its state; the caller then
    /// does a plain pause. Separate fades have no dual-channel state to
    /// freeze: they are stopped and settled on the target at full gain with
    /// both channels paused, and false is returned.
    bool pauseTransition(PausedTransitionSnapshot& out);

    /// Finish a paused transition. Returns false if there is none.
    bool resumeTransition();

    /// Hard stop, no gain curve.
    void cancelActiveTransition();

    /// Replace the active asset with no fade (paused playback, first play).
    /// startPlayback=true also starts the channel and sets mode playing.
    bool switchImmediately(const std::string& uri, bool startPlayback, Error& error);

    void clearPausedTransition();

    bool hasActiveTransition() const;
    bool hasPausedTransition() const;
    double activeProgress() const;
    /// Active channel position (seconds) when the running transition began.
    double activeStartPosition() const;
    uint64_t generation() const;

private:
    using Clock = std::chrono::steady_clock;

    struct ActiveTransition {
        uint64_t generation = 0;
        Clock::time_point startTime;
        double duration = 0.0;
        FadeCurve curve = FadeCurve::equalPower;
        TransitionKind kind = TransitionKind::manualChange;
        AssetPtr from;
        AssetPtr to;
        double progress = 0.0;
        bool synchronized = false; // engine ramp owns both channels
        bool switched = false;     // separate fades: channels already swapped
        double startPosition = 0.0; // active channel position when it began

        double elapsed() const
        {
            return std::chrono::duration<double>(Clock::now() - startTime).count();
        }
    };

    struct PausedTransition {
        uint64_t generation = 0;
        double progress = 0.0;
        double originalDuration = 0.0;
        FadeCurve curve = FadeCurve::equalPower;
        TransitionKind kind = TransitionKind::manualChange;
        AssetPtr from;
        AssetPtr to;
        CrossfadeSnapshot engineState;
        ResumeStrategy resumeStrategy = ResumeStrategy::continueFromProgress;
    };

    uint64_t beginTransition(double duration, FadeCurve curve, TransitionKind kind,
                             const AssetPtr& from, double activePosition);
    bool isCurrent(uint64_t gen) const;
    void dropIfCurrent(uint64_t gen);

    bool loadWithDeadline(const std::string& uri, AssetPtr& asset, Error& error);

    void supersedeActiveTransition();
    void discardPausedTransition();

    TransitionResult awaitStream(const std::shared_ptr<ProgressStream>& stream, uint64_t gen);
    bool runSeparateFades(const std::string& targetUri, const TransitionStrategy& strategy,
                          FadeCurve curve, TransitionKind kind, const AssetPtr& from,
                          double position, TransitionResult& result, Error& error);

    // Channel swap after a finished crossfade. Caller holds cleanupMutex_.
    void completeChannelSwitch();
    // Back to a single full-gain channel with nothing on the inactive side.
    // Caller holds cleanupMutex_.
    void resetInactiveSide();
    // Paused separate fades: finish the swap to the target without a fade.
    void settleOnTarget(const ActiveTransition& transition);

    void notifyFinished(TransitionResult result);

    std::shared_ptr<ChannelEngine> engine_;
    PlaybackStateCoordinator& state_;
    TimeoutEstimator& timeouts_;
    OrchestratorOptions options_;
    TransitionObserver* observer_;

    mutable std::mutex mutex_;      // guards active_, paused_, generation_
    std::mutex cleanupMutex_;       // serializes channel-switch cleanup
    std::unique_ptr<ActiveTransition> active_;
    std::unique_ptr<PausedTransition> paused_;
    uint64_t generation_ = 0;
};

} // namespace segue
