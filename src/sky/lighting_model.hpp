#pragma once

/// @file lighting_model.hpp
/// @brief Day/night color blending and light-source selection.

#include "core/types.hpp"

#include <optional>

namespace zenith::sky
{
    /// @brief Static utility class for the sky's lighting formulas.
    ///
    /// Inputs are sines of altitude (the "up" component of a unit world
    /// direction). A body is "up" when its sine of altitude is >= 0.
    class LightingModel
    {
    public:
        LightingModel() = delete;

        // Palette
        inline static const Vec4f kSunLight{0.8f, 0.8f, 0.75f, 1.0f};
        inline static const Vec4f kMoonLight{0.4f, 0.4f, 0.6f, 1.0f};
        inline static const Vec4f kStarLight{0.03f, 0.03f, 0.03f, 1.0f};
        inline static const Vec4f kTwilight{0.6f, 0.3f, 0.15f, 1.0f};

        /// Sine of solar altitude below which the clear sky has fully faded.
        static constexpr f32 kLimitOfTwilight = 0.1f;
        static constexpr f32 kMaxBloom = 1.7f;

        /// @brief Main light direction when neither sun nor moon qualifies.
        /// Slightly off vertical to avoid shadow-map aliasing.
        [[nodiscard]] static Vec3f starlight_direction();

        /// @brief Opacity of the daytime clear-sky color, in [0, 1].
        [[nodiscard]] static f32 day_fraction(f32 sine_solar_altitude);

        /// @brief Sky base color: twilight blended toward sunlight by day,
        /// toward star/moonlight by night.
        /// @param moon_weight Moon's illuminated fraction, 0 when it is down.
        [[nodiscard]] static Vec4f base_color(f32 sine_solar_altitude, f32 moon_weight);

        /// @brief Base color saturated, darkened to a quarter when no body is up.
        [[nodiscard]] static Vec4f clouds_color(const Vec4f& base, bool sun_up, bool moon_up);

        /// @brief Sun if up; else the moon if up and lit; else starlight.
        [[nodiscard]] static Vec3f main_direction(const Vec3f& sun_direction,
                                                  const std::optional<Vec3f>& moon_direction,
                                                  f32 moon_illumination);

        /// @brief Color of the main (directional) light.
        /// @param transmission Fraction of the source's light passing the clouds.
        [[nodiscard]] static Vec4f main_color(f32 sine_solar_altitude, const Vec4f& base,
                                              bool moon_up, f32 moon_illumination,
                                              f32 transmission);

        /// @brief Clouds color scaled by the slack the main light leaves.
        [[nodiscard]] static Vec4f ambient_color(const Vec4f& clouds, const Vec4f& main);

        /// @brief Directional energy over total energy; 0 when both are black.
        [[nodiscard]] static f32 shadow_intensity(const Vec4f& main, const Vec4f& ambient);

        [[nodiscard]] static f32 bloom_intensity(f32 sine_solar_altitude);

        /// @brief Color (and glow) of the sun disc.
        [[nodiscard]] static Vec4f sun_color(f32 sine_solar_altitude);

        /// @brief Color of the moon disc.
        [[nodiscard]] static Vec4f moon_color(f32 sine_lunar_altitude);

        /// @brief Where a light ray from @p direction crosses the cloud dome.
        ///
        /// The dome is the unit hemisphere scaled vertically by @p semi_minor_axis
        /// and moved by @p delta_y (<= 0) along the vertical axis.
        /// @param direction Unit vector at or above the horizon.
        /// @return Unit vector in the dome mesh's own space.
        [[nodiscard]] static Vec3f intersect_cloud_dome(const Vec3f& direction, f32 delta_y,
                                                        f32 semi_minor_axis);
    };

} // namespace zenith::sky
