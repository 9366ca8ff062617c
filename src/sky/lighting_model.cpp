/// @file lighting_model.cpp
/// @brief Lighting formulas.

#include "sky/lighting_model.hpp"

#include "core/color.hpp"

#include <algorithm>
#include <cmath>

namespace zenith::sky
{

Vec3f LightingModel::starlight_direction()
{
    return glm::normalize(Vec3f{1.0f, 9.0f, 1.0f});
}

f32 LightingModel::day_fraction(f32 sine_solar_altitude)
{
    return color::clamp01(1.0f + sine_solar_altitude / kLimitOfTwilight);
}

// -----------------------------------------------------------------
// Base color
//
// Sun up:   twilight → sunlight by s / 0.25
// Sun down: starlight → moonlight by moon weight, then
//           twilight → that blend by -s / 0.04
// -----------------------------------------------------------------

Vec4f LightingModel::base_color(f32 sine_solar_altitude, f32 moon_weight)
{
    if (sine_solar_altitude >= 0.0f) {
        const f32 day_weight = color::clamp01(sine_solar_altitude / 0.25f);
        return color::lerp(day_weight, kTwilight, kSunLight);
    }

    Vec4f blend = kStarLight;
    if (moon_weight > 0.0f) {
        blend = color::lerp(moon_weight, kStarLight, kMoonLight);
    }
    const f32 night_weight = color::clamp01(-sine_solar_altitude / 0.04f);
    return color::lerp(night_weight, kTwilight, blend);
}

Vec4f LightingModel::clouds_color(const Vec4f& base, bool sun_up, bool moon_up)
{
    Vec4f result = color::saturate(base);
    if (!sun_up && !moon_up) {
        result = Vec4f(Vec3f(result) * 0.25f, result.a);
    }
    return result;
}

Vec3f LightingModel::main_direction(const Vec3f& sun_direction,
                                    const std::optional<Vec3f>& moon_direction,
                                    f32 moon_illumination)
{
    if (sun_direction.y >= 0.0f) {
        return sun_direction;
    }
    if (moon_direction && moon_direction->y >= 0.0f && moon_illumination > 0.0f) {
        return *moon_direction;
    }
    return starlight_direction();
}

Vec4f LightingModel::main_color(f32 sine_solar_altitude, const Vec4f& base,
                                bool moon_up, f32 moon_illumination, f32 transmission)
{
    if (sine_solar_altitude >= 0.0f) {
        const f32 sun_factor = transmission * std::cbrt(sine_solar_altitude);
        return Vec4f(Vec3f(base) * sun_factor, base.a);
    }
    if (moon_up) {
        const f32 moon_factor = transmission * moon_illumination;
        return color::lerp(moon_factor, kStarLight, kMoonLight);
    }
    return kStarLight;
}

Vec4f LightingModel::ambient_color(const Vec4f& clouds, const Vec4f& main)
{
    const f32 slack = std::max(0.0f, 1.0f - color::max_channel(main));
    return Vec4f(Vec3f(clouds) * slack, clouds.a);
}

f32 LightingModel::shadow_intensity(const Vec4f& main, const Vec4f& ambient)
{
    const f32 main_amount = color::rgb_sum(main);
    const f32 total = main_amount + color::rgb_sum(ambient);
    if (total <= 0.0f) {
        return 0.0f;
    }
    return color::clamp01(main_amount / total);
}

f32 LightingModel::bloom_intensity(f32 sine_solar_altitude)
{
    return std::clamp(6.0f * sine_solar_altitude, 0.0f, kMaxBloom);
}

Vec4f LightingModel::sun_color(f32 sine_solar_altitude)
{
    const f32 green = color::clamp01(3.0f * sine_solar_altitude);
    const f32 blue = color::clamp01(sine_solar_altitude - 0.1f);
    return Vec4f{1.0f, green, blue, 1.0f};
}

Vec4f LightingModel::moon_color(f32 sine_lunar_altitude)
{
    const f32 green = color::clamp01(2.0f * sine_lunar_altitude + 0.6f);
    const f32 blue = color::clamp01(5.0f * sine_lunar_altitude + 0.1f);
    return Vec4f{1.0f, green, blue, 1.0f};
}

// -----------------------------------------------------------------
// Cloud-dome intersection
//
// In the vertical plane of the ray, with w the horizontal distance
// from the axis and t = tan(altitude), the ray is y = t·w and the
// dome is w² + ((y - Δy)/b)² = 1. Substituting:
//   (t² + b²)·w² - 2·Δy·t·w + Δy² - b² = 0
// The positive root gives the crossing. The result is the point's
// direction on the unflattened dome mesh.
// -----------------------------------------------------------------

Vec3f LightingModel::intersect_cloud_dome(const Vec3f& direction, f32 delta_y, f32 semi_minor_axis)
{
    const f64 cos_squared = static_cast<f64>(direction.x) * direction.x
                          + static_cast<f64>(direction.z) * direction.z;
    if (cos_squared == 0.0) {
        return Vec3f{0.0f, 1.0f, 0.0f};
    }

    const f64 cos_altitude = std::sqrt(cos_squared);
    const f64 tan_altitude = direction.y / cos_altitude;
    const f64 sma_squared = static_cast<f64>(semi_minor_axis) * semi_minor_axis;
    const f64 dy = delta_y;

    const f64 a = tan_altitude * tan_altitude + sma_squared;
    const f64 b = -2.0 * dy * tan_altitude;
    const f64 c = dy * dy - sma_squared;
    const f64 discriminant = std::max(0.0, b * b - 4.0 * a * c);
    const f64 w = std::clamp((-b + std::sqrt(discriminant)) / (2.0 * a), 0.0, 1.0);
    const f64 distance = w / cos_altitude;

    return Vec3f{
        static_cast<f32>(direction.x * distance),
        static_cast<f32>(std::sqrt(1.0 - w * w)),
        static_cast<f32>(direction.z * distance),
    };
}

} // namespace zenith::sky
