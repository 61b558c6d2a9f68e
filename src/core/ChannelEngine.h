#pragma once

#include "core/FadeCurve.h"
#include "core/ProgressStream.h"
#include "core/Types.h"

#include <memory>
#include <string>

namespace segue {

struct CrossfadeSnapshot {
    float activeGain = 0.0f;
    float inactiveGain = 0.0f;
    double activePosition = 0.0;
    double inactivePosition = 0.0;
    ChannelId activeChannel = ChannelId::a;
};

struct PlaybackPosition {
    double position = 0.0;
    double duration = 0.0;
};

/// Boundary to the audio rendering layer: two channels (active/inactive),
/// each with its own gain stage. The orchestrator drives it; it never owns
/// playback state.
///
/// Blocking calls (fades, rollback, fast-forward) return once the gain ramp
/// has finished or been interrupted. Streams returned by transition calls
/// are closed by the engine when the ramp ends, is paused or is cancelled.
class ChannelEngine {
public:
    virtual ~ChannelEngine() = default;

    // --- Assets ---

    /// Decode an asset. Must be safe to call from a helper thread and must
    /// not touch channel state. Returns false and fills error on failure.
    virtual bool loadAsset(const std::string& uri, AssetPtr& asset, std::string& error) = 0;

    /// Attach a decoded asset to the inactive channel (stopped, position 0).
    virtual void assignInactiveChannel(AssetPtr asset) = 0;

    /// Cue the inactive channel for a synchronized start at gain 0.
    virtual void prepareInactiveChannel() = 0;

    virtual void clearInactiveAsset() = 0;

    // --- Transitions ---

    /// Start the inactive channel and ramp active 1 -> 0, inactive 0 -> 1.
    virtual std::shared_ptr<ProgressStream> performSynchronizedTransition(
        double duration, FadeCurve curve) = 0;

    /// Ramp from saved gains to the end state (active 0, inactive 1),
    /// restarting both channels if they were paused.
    virtual std::shared_ptr<ProgressStream> resumeTransition(
        double duration, FadeCurve curve, float activeGain, float inactiveGain) = 0;

    /// Freeze both channels and stop the running ramp.
    virtual void pauseBothChannels() = 0;

    /// Stop both channels and rewind them.
    virtual void stopBothChannels() = 0;

    /// Ramp back to the pre-transition state. Returns the active gain the
    /// ramp started from.
    virtual float rollbackTransition(double duration) = 0;

    /// Ramp the running transition to its end state.
    virtual void fastForwardTransition(double duration) = 0;

    /// Stop the running ramp immediately, no gain curve.
    virtual void cancelTransition() = 0;

    // --- Single-channel control ---

    virtual void fadeActiveChannel(float from, float to, double duration, FadeCurve curve) = 0;
    virtual void startActiveChannel() = 0;
    virtual void switchActiveChannel() = 0;
    virtual void stopInactiveChannel() = 0;
    virtual void resetInactiveMixer() = 0;

    // --- Queries ---

    /// False when no transition state is available.
    virtual bool getCrossfadeSnapshot(CrossfadeSnapshot& out) const = 0;

    /// False when nothing is loaded on the active channel.
    virtual bool getCurrentPosition(PlaybackPosition& out) const = 0;
};

} // namespace segue
