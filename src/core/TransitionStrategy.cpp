#include "core/TransitionStrategy.h"

#include <algorithm>
#include <cstdio>

namespace segue {

std::string TransitionStrategy::describe() const
{
    char text[96] = "";
    switch (type)
    {
        case Type::fullCrossfade:
            snprintf(text, sizeof(text), "fullCrossfade(%.1fs)", duration);
            break;
        case Type::reducedCrossfade:
            snprintf(text, sizeof(text), "reducedCrossfade(%.1fs)", duration);
            break;
        case Type::separateFades:
            snprintf(text, sizeof(text), "separateFades(out: %.1fs, in: %.1fs)",
                     fadeOutDuration, fadeInDuration);
            break;
    }
    return text;
}

TransitionStrategy decideTransitionStrategy(double position, double duration, double requested)
{
    double remaining = duration - position;

    if (remaining <= 0.0 || requested <= 0.0)
        return TransitionStrategy::separateFades(kMinimumFadeSeconds, kMinimumFadeSeconds);

    if (remaining >= requested)
        return TransitionStrategy::fullCrossfade(requested);

    if (remaining >= requested / 2.0)
        return TransitionStrategy::reducedCrossfade(remaining);

    double fade = std::max(kMinimumFadeSeconds, remaining);
    return TransitionStrategy::separateFades(fade, fade);
}

} // namespace segue
