#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/FadeCurve.h"

#include <cmath>

using namespace segue;
using Catch::Matchers::WithinAbs;

TEST_CASE("fadeInGain starts at 0 and ends at 1 for every curve")
{
    for (FadeCurve c : {FadeCurve::equalPower, FadeCurve::linear, FadeCurve::logarithmic,
                        FadeCurve::exponential, FadeCurve::sCurve})
    {
        CHECK_THAT(fadeInGain(c, 0.0f), WithinAbs(0.0, 1e-6));
        CHECK_THAT(fadeInGain(c, 1.0f), WithinAbs(1.0, 1e-6));
    }
}

TEST_CASE("fadeInGain midpoint values")
{
    CHECK_THAT(fadeInGain(FadeCurve::equalPower, 0.5f), WithinAbs(std::sqrt(0.5), 1e-5));
    CHECK_THAT(fadeInGain(FadeCurve::linear, 0.5f), WithinAbs(0.5, 1e-6));
    CHECK_THAT(fadeInGain(FadeCurve::logarithmic, 0.5f), WithinAbs(std::log10(5.5), 1e-5));
    CHECK_THAT(fadeInGain(FadeCurve::exponential, 0.5f), WithinAbs(0.25, 1e-6));
    CHECK_THAT(fadeInGain(FadeCurve::sCurve, 0.5f), WithinAbs(0.5, 1e-6));
}

TEST_CASE("fadeInGain clamps progress outside [0, 1]")
{
    CHECK_THAT(fadeInGain(FadeCurve::linear, -0.5f), WithinAbs(0.0, 1e-6));
    CHECK_THAT(fadeInGain(FadeCurve::linear, 1.5f), WithinAbs(1.0, 1e-6));
}

TEST_CASE("equal power crossfade keeps constant power")
{
    for (float p : {0.1f, 0.3f, 0.5f, 0.8f})
    {
        float in = fadeInGain(FadeCurve::equalPower, p);
        float out = fadeOutGain(FadeCurve::equalPower, p);
        CHECK_THAT(in * in + out * out, WithinAbs(1.0, 1e-5));
    }
}

TEST_CASE("rampGain moves between arbitrary endpoints")
{
    CHECK_THAT(rampGain(FadeCurve::linear, 0.2f, 0.8f, 0.5f), WithinAbs(0.5, 1e-6));
    CHECK_THAT(rampGain(FadeCurve::linear, 0.8f, 0.2f, 0.5f), WithinAbs(0.5, 1e-6));
    CHECK_THAT(rampGain(FadeCurve::equalPower, 1.0f, 0.0f, 1.0f), WithinAbs(0.0, 1e-6));
    CHECK_THAT(rampGain(FadeCurve::sCurve, 0.4f, 1.0f, 0.0f), WithinAbs(0.4, 1e-6));
    CHECK_THAT(rampGain(FadeCurve::exponential, 1.0f, 1.0f, 0.3f), WithinAbs(1.0, 1e-6));
}

TEST_CASE("fadeStepsPerSecond adapts to duration")
{
    CHECK(fadeStepsPerSecond(0.3) == 100);
    CHECK(fadeStepsPerSecond(1.0) == 50);
    CHECK(fadeStepsPerSecond(4.9) == 50);
    CHECK(fadeStepsPerSecond(10.0) == 30);
    CHECK(fadeStepsPerSecond(15.0) == 20);
    CHECK(fadeStepsPerSecond(30.0) == 20);
}

TEST_CASE("fade curve names parse back")
{
    FadeCurve c = FadeCurve::linear;
    REQUIRE(fadeCurveFromName("s_curve", c));
    CHECK(c == FadeCurve::sCurve);
    REQUIRE(fadeCurveFromName(fadeCurveName(FadeCurve::equalPower), c));
    CHECK(c == FadeCurve::equalPower);

    CHECK_FALSE(fadeCurveFromName("cosine", c));
    CHECK(c == FadeCurve::equalPower);
}
