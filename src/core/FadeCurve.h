#pragma once

#include <string>

namespace segue {

enum class FadeCurve { equalPower, linear, logarithmic, exponential, sCurve };

// Gain for a fade-in at progress p (clamped to [0, 1]).
//   equalPower   sin(pi/2 * p)
//   linear       p
//   logarithmic  log10(9p + 1)
//   exponential  p^2
//   sCurve       3p^2 - 2p^3
float fadeInGain(FadeCurve curve, float progress);

// Gain for a fade-out: fadeInGain(1 - p).
float fadeOutGain(FadeCurve curve, float progress);

// Gain ramp from -> to at progress p, shaped by the curve.
float rampGain(FadeCurve curve, float from, float to, float progress);

// Update rate for a gain ramp of the given length. Short fades need finer
// steps to stay click-free, long ones are coarser to save wakeups.
int fadeStepsPerSecond(double durationSeconds);

const char* fadeCurveName(FadeCurve curve);
bool fadeCurveFromName(const std::string& name, FadeCurve& out);

} // namespace segue
