#pragma once

#include "core/Types.h"

#include <mutex>

namespace segue {

/// Immutable snapshot of everything the player knows about its two channels.
struct CoordinatorState {
    ChannelId activeChannel = ChannelId::a;
    PlaybackMode mode = PlaybackMode::stopped;
    AssetPtr activeAsset;
    AssetPtr inactiveAsset;
    float activeGain = 1.0f;
    float inactiveGain = 0.0f;
    bool crossfading = false;

    /// Hard invariants: playing needs an active asset, gains in [0, 1].
    /// A non-zero inactive gain outside a crossfade is logged, not rejected.
    bool isConsistent() const;
};

/// Single source of truth for channel roles, mode, assets and gains.
/// Every setter builds a candidate snapshot, validates it and either
/// replaces the current one whole or logs and keeps it.
class PlaybackStateCoordinator {
public:
    PlaybackStateCoordinator();

    PlaybackStateCoordinator(const PlaybackStateCoordinator&) = delete;
    PlaybackStateCoordinator& operator=(const PlaybackStateCoordinator&) = delete;

    // --- Atomic mutations (return true if committed) ---
    bool switchActiveChannel();
    bool setMode(PlaybackMode mode);
    bool loadOnInactive(AssetPtr asset);
    bool clearInactive();
    bool setGains(float active, float inactive);
    bool setCrossfading(bool crossfading);

    /// Swap channels with no fade: `asset` becomes active at full gain, the
    /// old active asset moves to the inactive side, crossfading is cleared.
    /// preserveMode=false forces mode to playing.
    bool atomicSwitch(AssetPtr asset, bool preserveMode = true);

    bool restoreSnapshot(const CoordinatorState& snapshot);

    // --- Queries ---
    CoordinatorState snapshot() const;
    AssetPtr activeAsset() const;
    PlaybackMode mode() const;
    ChannelId activeChannel() const;
    bool isCrossfading() const;

    void logCurrentState() const;

private:
    bool commit(const CoordinatorState& candidate, const char* operation);

    mutable std::mutex mutex_;
    CoordinatorState state_;
};

} // namespace segue
