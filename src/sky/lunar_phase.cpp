/// @file lunar_phase.cpp
/// @brief Lunar phase names, geometry and illumination.

#include "sky/lunar_phase.hpp"

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace zenith::sky
{

namespace
{

void require_preset(LunarPhase phase)
{
    if (phase == LunarPhase::Custom) {
        throw core::InvalidArgument("custom lunar phase has no preset geometry");
    }
}

} // namespace

std::string_view LunarPhases::describe(LunarPhase phase)
{
    switch (phase) {
        case LunarPhase::Full:           return "full";
        case LunarPhase::WaningCrescent: return "waning-crescent";
        case LunarPhase::WaningGibbous:  return "waning-gibbous";
        case LunarPhase::WaxingCrescent: return "waxing-crescent";
        case LunarPhase::WaxingGibbous:  return "waxing-gibbous";
        case LunarPhase::Custom:         return "custom";
    }
    return "unknown";
}

std::optional<LunarPhase> LunarPhases::from_description(std::string_view text)
{
    for (LunarPhase phase : kPresetPhases) {
        if (describe(phase) == text) {
            return phase;
        }
    }
    if (describe(LunarPhase::Custom) == text) {
        return LunarPhase::Custom;
    }
    return std::nullopt;
}

f32 LunarPhases::longitude_difference(LunarPhase phase)
{
    require_preset(phase);

    constexpr f32 kPi = sky_constants::kPi;
    switch (phase) {
        case LunarPhase::Full:           return kPi;
        case LunarPhase::WaningCrescent: return 1.75f * kPi;
        case LunarPhase::WaningGibbous:  return 1.25f * kPi;
        case LunarPhase::WaxingCrescent: return 0.25f * kPi;
        case LunarPhase::WaxingGibbous:  return 0.75f * kPi;
        case LunarPhase::Custom:         break;
    }
    return kPi;
}

std::string LunarPhases::image_path(LunarPhase phase)
{
    require_preset(phase);
    return fmt::format("Textures/skies/moon/{}.png", describe(phase));
}

u32 LunarPhases::preset_index(LunarPhase phase)
{
    require_preset(phase);
    const auto it = std::find(kPresetPhases.begin(), kPresetPhases.end(), phase);
    return static_cast<u32>(it - kPresetPhases.begin());
}

// -----------------------------------------------------------------
// Illumination
//
// The angle between the moon's position and the point opposite the
// sun (full moon) is |Δλ - π| on the ecliptic; off the ecliptic it
// combines with the latitude as a spherical right triangle. The lit
// fraction falls off linearly, reaching zero about 95° from full.
// -----------------------------------------------------------------

f32 LunarPhases::illumination(f32 longitude_difference, f32 lunar_latitude)
{
    f32 full_angle = std::abs(longitude_difference - sky_constants::kPi);
    if (lunar_latitude != 0.0f) {
        const f32 cos_angle = std::cos(full_angle) * std::cos(lunar_latitude);
        full_angle = std::acos(std::clamp(cos_angle, -1.0f, 1.0f));
    }
    return 1.0f - std::clamp(0.6f * full_angle, 0.0f, 1.0f);
}

} // namespace zenith::sky
