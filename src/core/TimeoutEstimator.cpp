#include "core/TimeoutEstimator.h"
#include "core/Logger.h"

#include <algorithm>

namespace segue {

void TimeoutEstimator::recordDuration(const std::string& kind, Seconds expected, Seconds actual)
{
    if (expected.count() <= 0.0 || actual.count() < 0.0)
    {
        SG_WARN("TimeoutEstimator::recordDuration: ignoring sample for '%s' "
                "(expected=%.3fs actual=%.3fs)", kind.c_str(), expected.count(), actual.count());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& samples = history_[kind];
    samples.push_back({expected, actual});
    while (static_cast<int>(samples.size()) > kMaxSamples)
        samples.pop_front();

    SG_DEBUG("TimeoutEstimator: '%s' expected=%.3fs actual=%.3fs slowdown=%.2f (n=%d)",
             kind.c_str(), expected.count(), actual.count(),
             actual.count() / expected.count(), static_cast<int>(samples.size()));
}

Seconds TimeoutEstimator::adaptiveTimeout(const std::string& kind, Seconds expected) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = history_.find(kind);
    if (it == history_.end() || it->second.empty())
        return expected * kDefaultMultiplier;

    const auto& samples = it->second;
    int recent = std::min(kRecentSamples, static_cast<int>(samples.size()));

    double sum = 0.0;
    for (auto s = samples.end() - recent; s != samples.end(); ++s)
        sum += s->slowdown();
    double avgSlowdown = sum / recent;

    double multiplier = std::clamp(avgSlowdown * kSafetyMargin, kMinMultiplier, kMaxMultiplier);
    SG_TRACE("TimeoutEstimator: '%s' avgSlowdown=%.2f multiplier=%.2f",
             kind.c_str(), avgSlowdown, multiplier);
    return expected * multiplier;
}

bool TimeoutEstimator::stats(const std::string& kind, TimeoutStats& out) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = history_.find(kind);
    if (it == history_.end() || it->second.empty())
        return false;

    double sum = 0.0;
    double peak = 0.0;
    for (const auto& s : it->second)
    {
        double f = s.slowdown();
        sum += f;
        peak = std::max(peak, f);
    }

    out.kind = kind;
    out.sampleCount = static_cast<int>(it->second.size());
    out.averageSlowdown = sum / out.sampleCount;
    out.maxSlowdown = peak;
    out.recommendedMultiplier = out.averageSlowdown * kSafetyMargin;
    return true;
}

int TimeoutEstimator::sampleCount(const std::string& kind) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = history_.find(kind);
    return it == history_.end() ? 0 : static_cast<int>(it->second.size());
}

void TimeoutEstimator::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    SG_DEBUG("TimeoutEstimator: history cleared");
}

} // namespace segue
