#pragma once

/// @file sky_control.hpp
/// @brief Per-frame sky orchestration: sun, moon, stars, clouds and scene lighting.

#include "astro/time_and_place.hpp"
#include "core/types.hpp"
#include "sky/cloud_layer.hpp"
#include "sky/dome_mesh.hpp"
#include "sky/lighting.hpp"
#include "sky/lunar_phase.hpp"
#include "sky/scene_attachment.hpp"
#include "sky/sky_material.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zenith::sky
{
    /// @brief Construction-time features of a sky.
    struct SkyControlConfig
    {
        f32 cloud_flattening = 0.0f;    ///< In [0, 1); > 0 puts clouds on their own flattened dome
        bool star_motion = false;       ///< Stars on two rotating domes instead of the top dome
        bool bottom_dome = false;       ///< Cover the region below the horizon
        u32 rim_samples = 60;
        u32 quadrant_samples = 16;
        u32 cloud_layers = 6;           ///< At most 6
        std::shared_ptr<TextureSource> textures;    ///< Required
        std::shared_ptr<spdlog::logger> logger;     ///< Optional
    };

    /// @brief Asset paths of the default textures.
    namespace asset_paths
    {
        inline constexpr std::string_view kClouds = "Textures/skies/t0neg0d/Clouds_L.png";
        inline constexpr std::string_view kHaze = "Textures/skies/ramps/haze.png";
        inline constexpr std::string_view kStars = "Textures/skies/star-maps/wiltshire.png";
        inline constexpr std::string_view kNorthStars = "Textures/skies/star-maps/northern.png";
        inline constexpr std::string_view kSouthStars = "Textures/skies/star-maps/southern.png";
        inline constexpr std::string_view kSun = "Textures/skies/t0neg0d/Sun_L.png";
    }

    /// @brief Simulated sky for a real-time scene.
    ///
    /// Starts disabled. Once enabled (which needs a scene attachment), every
    /// update() moves the sun and moon, drifts the clouds, recolors the sky
    /// and hands a LightingSnapshot to the lighting sink, if any.
    ///
    /// Object slots of the top material: 0 is the sun, 1..5 are the preset
    /// lunar phases in kPresetPhases order. A custom phase borrows the
    /// full-moon slot.
    class SkyControl
    {
    public:
        static constexpr u32 kSunIndex = 0;
        static constexpr u32 kMoonBaseIndex = 1;
        static constexpr u32 kMaxCloudLayers = 6;
        static constexpr f32 kDefaultMoonScale = 0.02f;
        static constexpr f32 kDefaultSunScale = 0.08f;

        explicit SkyControl(const SkyControlConfig& config);

        SkyControl(const SkyControl&) = delete;
        SkyControl& operator=(const SkyControl&) = delete;
        SkyControl(SkyControl&&) = delete;
        SkyControl& operator=(SkyControl&&) = delete;

        // -----------------------------------------------------------------
        // Lifecycle
        // -----------------------------------------------------------------

        /// @brief Host scene used by set_enabled(); must outlive this control.
        void set_scene(SceneAttachment* scene);

        /// @brief Lighting consumer, or nullptr; must outlive this control.
        void set_lighting_sink(LightingSink* sink);

        /// @brief Enabling attaches the sky to the scene; disabling detaches it.
        /// @throws core::IllegalState when enabling without a scene.
        void set_enabled(bool enabled);

        [[nodiscard]] bool is_enabled() const { return m_enabled; }

        /// @brief Advance the sky by @p elapsed seconds (>= 0). No-op while disabled.
        void update(f32 elapsed);

        // -----------------------------------------------------------------
        // Settings
        // -----------------------------------------------------------------

        /// @brief Time and place; set hour, latitude and solar longitude here.
        [[nodiscard]] astro::TimeAndPlace& time_and_place() { return m_time; }
        [[nodiscard]] const astro::TimeAndPlace& time_and_place() const { return m_time; }

        /// @brief Preset phase, or std::nullopt for no moon.
        /// @throws core::InvalidArgument for LunarPhase::Custom.
        void set_phase(std::optional<LunarPhase> phase);

        /// @brief Custom phase with its own color map.
        /// @param longitude_difference Moon minus sun longitude, in [0, 2π].
        /// @param lunar_latitude In [-π/2, π/2].
        void set_phase(f32 longitude_difference, f32 lunar_latitude, std::string_view texture_path);

        [[nodiscard]] std::optional<LunarPhase> phase() const { return m_phase; }
        [[nodiscard]] f32 longitude_difference() const { return m_longitude_difference; }
        [[nodiscard]] f32 lunar_latitude() const { return m_lunar_latitude; }

        /// @brief Illuminated fraction of the moon, 0 when there is none.
        [[nodiscard]] f32 moon_illumination() const;

        /// @brief Opacity of every cloud layer, in [0, 1].
        void set_cloudiness(f32 alpha);

        /// @brief Cloud drift speed relative to normal; negative reverses.
        void set_clouds_rate(f32 rate);

        /// @brief Lower the flattened cloud dome, in [0, 1). Must be 0 when not flattened.
        void set_clouds_y_offset(f32 offset);

        void set_cloud_modulation(bool enabled) { m_cloud_modulation = enabled; }

        /// @brief Angular diameters, each in (0, π).
        void set_lunar_diameter(f32 diameter);
        void set_solar_diameter(f32 diameter);
        [[nodiscard]] f32 lunar_diameter() const;
        [[nodiscard]] f32 solar_diameter() const;

        /// @brief Angle from the zenith to the top dome's rim, in (0, 1.785).
        void set_top_vertical_angle(f32 angle);
        [[nodiscard]] f32 top_vertical_angle() const { return m_top_mesh.config().vertical_angle; }

        [[nodiscard]] CloudLayer& cloud_layer(u32 index);
        [[nodiscard]] u32 cloud_layer_count() const { return static_cast<u32>(m_cloud_layers.size()); }
        [[nodiscard]] f32 clouds_rate() const { return m_clouds_rate; }
        [[nodiscard]] f32 clouds_y_offset() const { return m_clouds_y_offset; }
        [[nodiscard]] f32 clouds_animation_time() const { return m_clouds_animation_time; }
        [[nodiscard]] bool cloud_modulation() const { return m_cloud_modulation; }

        // -----------------------------------------------------------------
        // State for renderers
        // -----------------------------------------------------------------

        [[nodiscard]] const SkyMaterial& top_material() const { return *m_top_material; }
        [[nodiscard]] const SkyMaterial& clouds_material() const;
        [[nodiscard]] const DomeMesh& top_mesh() const { return m_top_mesh; }
        [[nodiscard]] const DomeMesh& clouds_mesh() const;
        [[nodiscard]] Vec4f bottom_color() const { return m_bottom_color; }

        /// @brief Geometry handed to the scene when enabling.
        [[nodiscard]] SkySubtree subtree() const;

        /// @brief Star-dome orientations from the last update (star motion only).
        [[nodiscard]] const std::optional<astro::StarDomeOrientation>& star_orientation() const
        {
            return m_star_orientation;
        }

        [[nodiscard]] const std::optional<LightingSnapshot>& last_snapshot() const { return m_last_snapshot; }

        /// @brief Top-material slot of the moon for @p phase.
        [[nodiscard]] static u32 moon_index(LunarPhase phase);

    private:
        [[nodiscard]] Vec3f update_sun();
        [[nodiscard]] std::optional<Vec3f> update_moon();
        [[nodiscard]] std::optional<Vec2f> lunar_rotation(f64 longitude, const Vec2f& uv_center) const;
        void update_object_colors(f32 sine_solar_altitude, f32 sine_lunar_altitude);
        void update_lighting(const Vec3f& sun_direction, const std::optional<Vec3f>& moon_direction);
        [[nodiscard]] f32 cloud_transmission(const Vec3f& main_direction) const;

        [[nodiscard]] SkyMaterial& clouds_material_mut();

        SkyControlConfig m_config;
        std::shared_ptr<spdlog::logger> m_logger;

        astro::TimeAndPlace m_time;

        DomeMesh m_top_mesh;
        std::optional<DomeMesh> m_clouds_mesh;
        std::optional<DomeMesh> m_bottom_mesh;
        std::optional<DomeMesh> m_star_mesh;

        std::unique_ptr<SkyMaterial> m_top_material;
        std::unique_ptr<SkyMaterial> m_clouds_only_material;
        std::vector<CloudLayer> m_cloud_layers;
        TextureHandle m_north_stars;
        TextureHandle m_south_stars;

        SceneAttachment* m_scene = nullptr;
        LightingSink* m_lighting_sink = nullptr;
        bool m_enabled = false;

        std::optional<LunarPhase> m_phase = LunarPhase::Full;
        f32 m_longitude_difference = sky_constants::kPi;
        f32 m_lunar_latitude = 0.0f;
        f32 m_moon_scale = kDefaultMoonScale;
        f32 m_sun_scale = kDefaultSunScale;

        f32 m_clouds_animation_time = 0.0f;
        f32 m_clouds_rate = 1.0f;
        f32 m_clouds_y_offset = 0.0f;
        bool m_cloud_modulation = true;

        Vec4f m_bottom_color{0.0f, 0.0f, 0.0f, 1.0f};
        std::optional<astro::StarDomeOrientation> m_star_orientation;
        std::optional<LightingSnapshot> m_last_snapshot;
    };

} // namespace zenith::sky
