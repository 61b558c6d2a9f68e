#pragma once

#include "core/FadeCurve.h"

#include <string>

namespace segue {

struct ServiceConfig {
    double crossfadeDuration = 10.0;   // seconds, [1, 30]
    FadeCurve fadeCurve = FadeCurve::equalPower;
    int maxQueueDepth = 10;
    double rollbackDuration = 0.3;
    double quickFinishDuration = 1.0;
    double expectedAssetLoad = 0.5;    // nominal decode time, scaled by the estimator
    bool signalRunningOnPreempt = true;
    int volume = 100;                  // [0, 100]

    static constexpr double kMinCrossfadeDuration = 1.0;
    static constexpr double kMaxCrossfadeDuration = 30.0;

    /// Returns false and describes the first offending field.
    bool validate(std::string& error) const;
};

} // namespace segue
