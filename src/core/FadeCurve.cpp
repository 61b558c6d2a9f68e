#include "core/FadeCurve.h"

#include <algorithm>
#include <cmath>

namespace segue {

static constexpr float kHalfPi = 1.57079632679489661923f;

float fadeInGain(FadeCurve curve, float progress)
{
    float p = std::clamp(progress, 0.0f, 1.0f);

    switch (curve)
    {
        case FadeCurve::equalPower:  return std::sin(kHalfPi * p);
        case FadeCurve::linear:      return p;
        case FadeCurve::logarithmic: return std::log10(9.0f * p + 1.0f);
        case FadeCurve::exponential: return p * p;
        case FadeCurve::sCurve:      return 3.0f * p * p - 2.0f * p * p * p;
    }
    return p;
}

float fadeOutGain(FadeCurve curve, float progress)
{
    return fadeInGain(curve, 1.0f - progress);
}

float rampGain(FadeCurve curve, float from, float to, float progress)
{
    // Rising ramps follow the fade-in shape, falling ones the fade-out shape,
    // so a crossfade pair keeps the curve's power characteristic.
    if (from <= to)
        return from + (to - from) * fadeInGain(curve, progress);
    return to + (from - to) * fadeOutGain(curve, progress);
}

int fadeStepsPerSecond(double durationSeconds)
{
    if (durationSeconds < 1.0)  return 100;
    if (durationSeconds < 5.0)  return 50;
    if (durationSeconds < 15.0) return 30;
    return 20;
}

const char* fadeCurveName(FadeCurve curve)
{
    switch (curve)
    {
        case FadeCurve::equalPower:  return "equal_power";
        case FadeCurve::linear:      return "linear";
        case FadeCurve::logarithmic: return "logarithmic";
        case FadeCurve::exponential: return "exponential";
        case FadeCurve::sCurve:      return "s_curve";
    }
    return "unknown";
}

bool fadeCurveFromName(const std::string& name, FadeCurve& out)
{
    static const FadeCurve kCurves[] = {
        FadeCurve::equalPower, FadeCurve::linear, FadeCurve::logarithmic,
        FadeCurve::exponential, FadeCurve::sCurve
    };
    for (FadeCurve c : kCurves)
    {
        if (name == fadeCurveName(c))
        {
            out = c;
            return true;
        }
    }
    return false;
}

} // namespace segue
