#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace segue {

using Seconds = std::chrono::duration<double>;

struct TimeoutStats {
    std::string kind;
    int sampleCount = 0;
    double averageSlowdown = 0.0;
    double maxSlowdown = 0.0;
    double recommendedMultiplier = 0.0;
};

/// Learns how much slower than nominal an operation kind runs on this
/// machine and turns that into a deadline for the next attempt.
class TimeoutEstimator {
public:
    static constexpr int kMaxSamples = 10;
    static constexpr int kRecentSamples = 5;
    static constexpr double kDefaultMultiplier = 2.5;
    static constexpr double kSafetyMargin = 1.5;
    static constexpr double kMinMultiplier = 2.0;
    static constexpr double kMaxMultiplier = 5.0;

    TimeoutEstimator() = default;

    TimeoutEstimator(const TimeoutEstimator&) = delete;
    TimeoutEstimator& operator=(const TimeoutEstimator&) = delete;

    void recordDuration(const std::string& kind, Seconds expected, Seconds actual);

    /// expected x 2.5 without history; otherwise expected x clamp(avg
    /// slowdown of the last 5 samples x 1.5, 2.0, 5.0).
    Seconds adaptiveTimeout(const std::string& kind, Seconds expected) const;

    /// False when the kind has no history.
    bool stats(const std::string& kind, TimeoutStats& out) const;

    int sampleCount(const std::string& kind) const;
    void reset();

private:
    struct Sample {
        Seconds expected;
        Seconds actual;

        double slowdown() const { return actual.count() / expected.count(); }
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<Sample>> history_;
};

} // namespace segue
