#pragma once

#include <string>

namespace segue {

/// How to get from the current asset to the next one, given how much of the
/// current asset is left. Produced once per request, never mutated.
struct TransitionStrategy {
    enum class Type { fullCrossfade, reducedCrossfade, separateFades };

    Type type = Type::fullCrossfade;
    double duration = 0.0;        // crossfade types
    double fadeOutDuration = 0.0; // separateFades
    double fadeInDuration = 0.0;  // separateFades

    static TransitionStrategy fullCrossfade(double d) { return {Type::fullCrossfade, d, 0.0, 0.0}; }
    static TransitionStrategy reducedCrossfade(double d) { return {Type::reducedCrossfade, d, 0.0, 0.0}; }
    static TransitionStrategy separateFades(double out, double in) { return {Type::separateFades, 0.0, out, in}; }

    bool isCrossfade() const { return type != Type::separateFades; }

    std::string describe() const;

    bool operator==(const TransitionStrategy& other) const
    {
        return type == other.type && duration == other.duration
            && fadeOutDuration == other.fadeOutDuration
            && fadeInDuration == other.fadeInDuration;
    }
    bool operator!=(const TransitionStrategy& other) const { return !(*this == other); }
};

// Shortest fade used when there is (almost) no time left.
constexpr double kMinimumFadeSeconds = 0.1;

/// remaining = duration - position
///   remaining <= 0 or requested <= 0   -> separateFades(0.1, 0.1)
///   remaining >= requested             -> fullCrossfade(requested)
///   remaining >= requested / 2         -> reducedCrossfade(remaining)
///   otherwise                          -> separateFades(max(0.1, remaining) x2)
TransitionStrategy decideTransitionStrategy(double position, double duration, double requested);

} // namespace segue
