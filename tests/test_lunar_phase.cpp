/// @file test_lunar_phase.cpp
/// @brief Unit tests for lunar phase names, geometry and illumination.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/error.hpp"
#include "sky/lunar_phase.hpp"

using namespace zenith;
using namespace zenith::sky;

TEST_CASE("Descriptions round-trip for every phase")
{
    for (LunarPhase phase : kPresetPhases) {
        CHECK(LunarPhases::from_description(LunarPhases::describe(phase)) == phase);
    }
    CHECK(LunarPhases::from_description("custom") == LunarPhase::Custom);
    CHECK_FALSE(LunarPhases::from_description("new").has_value());
    CHECK(LunarPhases::describe(LunarPhase::WaxingGibbous) == "waxing-gibbous");
}

TEST_CASE("Preset longitude differences")
{
    constexpr f32 kPi = sky_constants::kPi;
    CHECK(LunarPhases::longitude_difference(LunarPhase::Full) == doctest::Approx(kPi));
    CHECK(LunarPhases::longitude_difference(LunarPhase::WaningCrescent) == doctest::Approx(1.75f * kPi));
    CHECK(LunarPhases::longitude_difference(LunarPhase::WaningGibbous) == doctest::Approx(1.25f * kPi));
    CHECK(LunarPhases::longitude_difference(LunarPhase::WaxingCrescent) == doctest::Approx(0.25f * kPi));
    CHECK(LunarPhases::longitude_difference(LunarPhase::WaxingGibbous) == doctest::Approx(0.75f * kPi));
}

TEST_CASE("Custom phase has no preset geometry, image or slot")
{
    CHECK_THROWS_AS((void)LunarPhases::longitude_difference(LunarPhase::Custom), core::InvalidArgument);
    CHECK_THROWS_AS((void)LunarPhases::image_path(LunarPhase::Custom), core::InvalidArgument);
    CHECK_THROWS_AS((void)LunarPhases::preset_index(LunarPhase::Custom), core::InvalidArgument);
}

TEST_CASE("Image paths and preset indices")
{
    CHECK(LunarPhases::image_path(LunarPhase::Full) == "Textures/skies/moon/full.png");
    CHECK(LunarPhases::image_path(LunarPhase::WaningCrescent) == "Textures/skies/moon/waning-crescent.png");
    CHECK(LunarPhases::preset_index(LunarPhase::Full) == 0);
    CHECK(LunarPhases::preset_index(LunarPhase::WaxingGibbous) == 4);
}

TEST_CASE("Illumination: full moon is fully lit, new moon dark, gibbous beats crescent")
{
    constexpr f32 kPi = sky_constants::kPi;
    CHECK(LunarPhases::illumination(kPi, 0.0f) == doctest::Approx(1.0f));
    CHECK(LunarPhases::illumination(0.0f, 0.0f) == doctest::Approx(0.0f));

    const f32 gibbous = LunarPhases::illumination(0.75f * kPi, 0.0f);
    const f32 crescent = LunarPhases::illumination(0.25f * kPi, 0.0f);
    CHECK(gibbous == doctest::Approx(1.0f - 0.6f * 0.25f * kPi));
    CHECK(crescent == doctest::Approx(0.0f));
    CHECK(gibbous > crescent);
}

TEST_CASE("Lunar latitude moves the moon away from full")
{
    constexpr f32 kPi = sky_constants::kPi;
    const f32 on_ecliptic = LunarPhases::illumination(kPi, 0.0f);
    const f32 off_ecliptic = LunarPhases::illumination(kPi, 0.3f);
    CHECK(off_ecliptic == doctest::Approx(1.0f - 0.6f * 0.3f));
    CHECK(off_ecliptic < on_ecliptic);

    for (f32 diff = 0.0f; diff <= 2.0f * kPi; diff += 0.25f) {
        const f32 value = LunarPhases::illumination(diff, -0.2f);
        CHECK(value >= 0.0f);
        CHECK(value <= 1.0f);
    }
}
