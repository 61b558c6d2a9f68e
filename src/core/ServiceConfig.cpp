#include "core/ServiceConfig.h"

#include <cmath>
#include <cstdio>

namespace segue {

static std::string format(const char* fmt, double value)
{
    char text[128];
    snprintf(text, sizeof(text), fmt, value);
    return text;
}

bool ServiceConfig::validate(std::string& error) const
{
    if (std::isnan(crossfadeDuration)
        || crossfadeDuration < kMinCrossfadeDuration
        || crossfadeDuration > kMaxCrossfadeDuration)
    {
        error = format("crossfadeDuration %.2f out of range [1, 30]", crossfadeDuration);
        return false;
    }

    if (maxQueueDepth < 1)
    {
        error = format("maxQueueDepth must be at least 1 (got %.0f)", maxQueueDepth);
        return false;
    }

    if (!(rollbackDuration > 0.0))
    {
        error = format("rollbackDuration must be positive (got %.3f)", rollbackDuration);
        return false;
    }

    if (!(quickFinishDuration > 0.0))
    {
        error = format("quickFinishDuration must be positive (got %.3f)", quickFinishDuration);
        return false;
    }

    if (!(expectedAssetLoad > 0.0))
    {
        error = format("expectedAssetLoad must be positive (got %.3f)", expectedAssetLoad);
        return false;
    }

    if (volume < 0 || volume > 100)
    {
        error = format("volume %.0f out of range [0, 100]", volume);
        return false;
    }

    return true;
}

} // namespace segue
