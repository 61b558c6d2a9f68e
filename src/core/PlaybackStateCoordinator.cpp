#include "core/PlaybackStateCoordinator.h"
#include "core/Logger.h"

#include <cmath>
#include <utility>

namespace segue {

static constexpr float kSilentGainEpsilon = 1e-4f;

static bool gainInRange(float g)
{
    return !std::isnan(g) && g >= 0.0f && g <= 1.0f;
}

static const char* assetName(const AssetPtr& asset)
{
    return asset ? asset->uri.c_str() : "(none)";
}

bool CoordinatorState::isConsistent() const
{
    if (mode == PlaybackMode::playing && !activeAsset)
    {
        SG_ERROR("CoordinatorState: playing mode without an active asset");
        return false;
    }

    if (!gainInRange(activeGain))
    {
        SG_ERROR("CoordinatorState: active gain %.3f out of [0, 1]", activeGain);
        return false;
    }

    if (!gainInRange(inactiveGain))
    {
        SG_ERROR("CoordinatorState: inactive gain %.3f out of [0, 1]", inactiveGain);
        return false;
    }

    if (!crossfading && inactiveGain > kSilentGainEpsilon)
        SG_WARN("CoordinatorState: inactive gain %.3f while not crossfading", inactiveGain);

    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════

PlaybackStateCoordinator::PlaybackStateCoordinator()
{
    SG_INFO("PlaybackStateCoordinator: initialized (channel A, stopped)");
}

bool PlaybackStateCoordinator::commit(const CoordinatorState& candidate, const char* operation)
{
    if (!candidate.isConsistent())
    {
        SG_ERROR("PlaybackStateCoordinator::%s: rejected inconsistent state, keeping previous",
                 operation);
        return false;
    }
    state_ = candidate;
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Atomic mutations
// ═══════════════════════════════════════════════════════════════════

bool PlaybackStateCoordinator::switchActiveChannel()
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next = state_;
    next.activeChannel = oppositeChannel(state_.activeChannel);
    next.activeAsset = state_.inactiveAsset;
    next.inactiveAsset = state_.activeAsset;
    next.activeGain = state_.inactiveGain;
    next.inactiveGain = state_.activeGain;

    if (!commit(next, "switchActiveChannel"))
        return false;
    SG_DEBUG("PlaybackStateCoordinator: active channel is now %s (%s)",
             channelName(state_.activeChannel), assetName(state_.activeAsset));
    return true;
}

bool PlaybackStateCoordinator::setMode(PlaybackMode mode)
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next = state_;
    next.mode = mode;

    if (!commit(next, "setMode"))
        return false;
    SG_DEBUG("PlaybackStateCoordinator: mode=%s", playbackModeName(mode));
    return true;
}

bool PlaybackStateCoordinator::loadOnInactive(AssetPtr asset)
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next = state_;
    next.inactiveAsset = std::move(asset);

    if (!commit(next, "loadOnInactive"))
        return false;
    SG_DEBUG("PlaybackStateCoordinator: inactive asset=%s", assetName(state_.inactiveAsset));
    return true;
}

bool PlaybackStateCoordinator::clearInactive()
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next = state_;
    next.inactiveAsset.reset();
    next.inactiveGain = 0.0f;

    return commit(next, "clearInactive");
}

bool PlaybackStateCoordinator::setGains(float active, float inactive)
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next = state_;
    next.activeGain = active;
    next.inactiveGain = inactive;

    return commit(next, "setGains");
}

bool PlaybackStateCoordinator::setCrossfading(bool crossfading)
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next = state_;
    next.crossfading = crossfading;

    if (!commit(next, "setCrossfading"))
        return false;
    SG_DEBUG("PlaybackStateCoordinator: crossfading=%d", crossfading ? 1 : 0);
    return true;
}

bool PlaybackStateCoordinator::atomicSwitch(AssetPtr asset, bool preserveMode)
{
    std::lock_guard<std::mutex> lock(mutex_);

    CoordinatorState next;
    next.activeChannel = oppositeChannel(state_.activeChannel);
    next.mode = preserveMode ? state_.mode : PlaybackMode::playing;
    next.activeAsset = std::move(asset);
    next.inactiveAsset = state_.activeAsset;
    next.activeGain = 1.0f;
    next.inactiveGain = 0.0f;
    next.crossfading = false;

    if (!commit(next, "atomicSwitch"))
        return false;
    SG_INFO("PlaybackStateCoordinator: atomic switch, %s = %s",
            channelName(state_.activeChannel), assetName(state_.activeAsset));
    return true;
}

bool PlaybackStateCoordinator::restoreSnapshot(const CoordinatorState& snapshot)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!commit(snapshot, "restoreSnapshot"))
        return false;
    SG_INFO("PlaybackStateCoordinator: snapshot restored");
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

CoordinatorState PlaybackStateCoordinator::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

AssetPtr PlaybackStateCoordinator::activeAsset() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.activeAsset;
}

PlaybackMode PlaybackStateCoordinator::mode() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.mode;
}

ChannelId PlaybackStateCoordinator::activeChannel() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.activeChannel;
}

bool PlaybackStateCoordinator::isCrossfading() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.crossfading;
}

void PlaybackStateCoordinator::logCurrentState() const
{
    CoordinatorState s = snapshot();
    SG_DEBUG("PlaybackStateCoordinator: active=%s mode=%s activeAsset=%s inactiveAsset=%s "
             "gains=%.3f/%.3f crossfading=%d",
             channelName(s.activeChannel), playbackModeName(s.mode),
             assetName(s.activeAsset), assetName(s.inactiveAsset),
             s.activeGain, s.inactiveGain, s.crossfading ? 1 : 0);
}

} // namespace segue
