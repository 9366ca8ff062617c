/// @file sky_control.cpp
/// @brief Sky orchestration: sun, moon, clouds and lighting each frame.

#include "sky/sky_control.hpp"

#include "core/color.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/validate.hpp"
#include "sky/lighting_model.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace zenith::sky
{

using core::Validate;

namespace
{

// Daytime clear-sky color; its alpha fades with the day fraction.
const Vec4f kColorDay{0.4f, 0.6f, 1.0f, 1.0f};

// Latitude step used to find the moon's orbital north in texture space.
constexpr f64 kLatitudeStep = 0.01;

// float(π/2) lies just above the double π/2; keep the moon's latitude in range.
f64 ecliptic_latitude(f32 latitude)
{
    return std::clamp(static_cast<f64>(latitude), -astro_constants::kHalfPi, astro_constants::kHalfPi);
}

f64 modulo(f64 value, f64 modulus)
{
    f64 result = std::fmod(value, modulus);
    if (result < 0.0) {
        result += modulus;
    }
    if (result >= modulus) {
        result = 0.0;
    }
    return result;
}

TextureHandle load_required(TextureSource& textures, std::string_view path)
{
    TextureHandle texture = textures.load(path);
    if (!texture) {
        throw core::ResourceError(path);
    }
    return texture;
}

std::unique_ptr<SkyMaterial> make_material(const SkyControlConfig& config, u32 objects, u32 layers,
                                           const std::shared_ptr<spdlog::logger>& logger)
{
    return std::make_unique<SkyMaterial>(SkyMaterialConfig{
        .max_objects = objects,
        .max_cloud_layers = layers,
        .textures = config.textures,
        .logger = logger,
    });
}

DomeMeshConfig dome_config(const SkyControlConfig& config)
{
    return DomeMeshConfig{
        .rim_samples = config.rim_samples,
        .quadrant_samples = config.quadrant_samples,
    };
}

const SkyControlConfig& validated(const SkyControlConfig& config)
{
    Validate::in_half_open_range(config.cloud_flattening, "cloud flattening", 0.0, 1.0);
    if (config.cloud_layers > SkyControl::kMaxCloudLayers) {
        throw core::ConfigurationOverflow(static_cast<u32>(kPresetPhases.size()) + 1, config.cloud_layers);
    }
    if (!config.textures) {
        throw core::InvalidArgument("sky control needs a texture source");
    }
    return config;
}

} // namespace

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

SkyControl::SkyControl(const SkyControlConfig& config)
    : m_config(validated(config))
    , m_logger(core::Logger::or_null(config.logger))
    , m_top_mesh(dome_config(config))
{
    const u32 num_objects = kMoonBaseIndex + static_cast<u32>(kPresetPhases.size());
    const bool clouds_only_dome = config.cloud_flattening > 0.0f;

    if (clouds_only_dome) {
        m_clouds_mesh.emplace(dome_config(config));
        m_top_material = make_material(config, num_objects, 0, m_logger);
        m_clouds_only_material = make_material(config, 0, config.cloud_layers, m_logger);
    } else {
        m_top_material = make_material(config, num_objects, config.cloud_layers, m_logger);
    }

    if (config.bottom_dome) {
        m_bottom_mesh.emplace(DomeMeshConfig{
            .rim_samples = config.rim_samples,
            .quadrant_samples = 2,
            .vertical_angle = sky_constants::kPi - m_top_mesh.config().vertical_angle,
        });
    }

    if (config.star_motion) {
        m_star_mesh.emplace(dome_config(config));
        m_north_stars = load_required(*config.textures, asset_paths::kNorthStars);
        m_south_stars = load_required(*config.textures, asset_paths::kSouthStars);
    } else {
        m_top_material->add_stars(asset_paths::kStars);
    }
    m_top_material->add_haze(asset_paths::kHaze);

    m_top_material->add_object(kSunIndex, asset_paths::kSun);
    m_top_material->hide_object(kSunIndex);
    for (LunarPhase preset : kPresetPhases) {
        const u32 index = moon_index(preset);
        m_top_material->add_object(index, LunarPhases::image_path(preset));
        m_top_material->hide_object(index);
    }

    SkyMaterial& clouds = clouds_material_mut();
    m_cloud_layers.reserve(config.cloud_layers);
    for (u32 layer = 0; layer < config.cloud_layers; ++layer) {
        CloudLayer& cloud_layer = m_cloud_layers.emplace_back(clouds, layer);
        if (layer < 2) {
            cloud_layer.set_texture(asset_paths::kClouds, CloudLayer::kDefaultScale);
        } else {
            cloud_layer.clear_texture();
        }
        cloud_layer.set_color(Vec3f{1.0f});
    }

    ZEN_DEBUG(m_logger, "sky control built: {} cloud layers, flattening {}, star motion {}, bottom dome {}",
              config.cloud_layers, config.cloud_flattening, config.star_motion, config.bottom_dome);
}

// -----------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------

void SkyControl::set_scene(SceneAttachment* scene)
{
    if (m_enabled) {
        throw core::IllegalState("cannot change the scene of an enabled sky");
    }
    m_scene = scene;
}

void SkyControl::set_lighting_sink(LightingSink* sink)
{
    m_lighting_sink = sink;
}

void SkyControl::set_enabled(bool enabled)
{
    if (enabled == m_enabled) {
        return;
    }

    if (enabled) {
        if (m_scene == nullptr) {
            ZEN_ERROR(m_logger, "sky enabled without a scene attachment");
            throw core::IllegalState("cannot enable a sky without a scene attachment");
        }
        m_scene->attach(subtree());
        m_scene->fit_to_frustum();
        m_enabled = true;
        ZEN_INFO(m_logger, "sky enabled ({})", m_time.describe());
    } else {
        m_scene->detach();
        m_enabled = false;
        ZEN_INFO(m_logger, "sky disabled");
    }
}

// -----------------------------------------------------------------
// Per-frame update
// -----------------------------------------------------------------

void SkyControl::update(f32 elapsed)
{
    Validate::non_negative(elapsed, "elapsed");
    if (!m_enabled) {
        return;
    }

    m_clouds_animation_time += elapsed * m_clouds_rate;
    for (CloudLayer& layer : m_cloud_layers) {
        layer.update_offset(m_clouds_animation_time);
    }

    const Vec3f sun_direction = update_sun();
    const std::optional<Vec3f> moon_direction = update_moon();

    if (m_config.star_motion) {
        m_star_orientation = m_time.orient_star_domes();
    }

    update_lighting(sun_direction, moon_direction);
}

Vec3f SkyControl::update_sun()
{
    const Vec3f direction = glm::normalize(Vec3f(m_time.sun_direction()));

    const std::optional<Vec2f> uv = m_top_mesh.direction_uv(direction);
    if (uv) {
        m_top_material->set_object_transform(kSunIndex, *uv, m_sun_scale);
    } else {
        m_top_material->hide_object(kSunIndex);
    }

    const f32 day = LightingModel::day_fraction(direction.y);
    m_top_material->set_clear_color(color::with_alpha(kColorDay, day));

    return direction;
}

std::optional<Vec3f> SkyControl::update_moon()
{
    const std::optional<u32> active = m_phase ? std::optional<u32>(moon_index(*m_phase)) : std::nullopt;
    for (LunarPhase preset : kPresetPhases) {
        const u32 index = moon_index(preset);
        if (index != active) {
            m_top_material->hide_object(index);
        }
    }
    if (!active) {
        return std::nullopt;
    }

    const f64 longitude = modulo(m_time.solar_longitude() + m_longitude_difference,
                                 astro_constants::kTwoPi);
    const Vec3f direction =
        glm::normalize(Vec3f(m_time.convert_to_world(ecliptic_latitude(m_lunar_latitude), longitude)));

    const std::optional<Vec2f> uv_center = m_top_mesh.direction_uv(direction);
    if (uv_center) {
        m_top_material->set_object_transform(*active, *uv_center, m_moon_scale,
                                             lunar_rotation(longitude, *uv_center));
    } else {
        m_top_material->hide_object(*active);
    }

    return direction;
}

// -----------------------------------------------------------------
// The moon's texture "up" follows its orbital north: compare its UV
// with that of a point slightly north (or, near the rim, south).
// -----------------------------------------------------------------

std::optional<Vec2f> SkyControl::lunar_rotation(f64 longitude, const Vec2f& uv_center) const
{
    const f64 latitude = ecliptic_latitude(m_lunar_latitude);
    const f64 north_latitude = latitude + kLatitudeStep;
    if (north_latitude <= astro_constants::kHalfPi) {
        const Vec3f north = glm::normalize(Vec3f(m_time.convert_to_world(north_latitude, longitude)));
        const std::optional<Vec2f> uv_north = m_top_mesh.direction_uv(north);
        if (uv_north) {
            const Vec2f offset = *uv_north - uv_center;
            if (glm::length(offset) > 0.0f) {
                return glm::normalize(offset);
            }
        }
    }

    const f64 south_latitude = latitude - kLatitudeStep;
    if (south_latitude >= -astro_constants::kHalfPi) {
        const Vec3f south = glm::normalize(Vec3f(m_time.convert_to_world(south_latitude, longitude)));
        const std::optional<Vec2f> uv_south = m_top_mesh.direction_uv(south);
        if (uv_south) {
            const Vec2f offset = uv_center - *uv_south;
            if (glm::length(offset) > 0.0f) {
                return glm::normalize(offset);
            }
        }
    }

    return std::nullopt;
}

void SkyControl::update_object_colors(f32 sine_solar_altitude, f32 sine_lunar_altitude)
{
    const Vec4f sun_color = LightingModel::sun_color(sine_solar_altitude);
    m_top_material->set_object_color(kSunIndex, sun_color);
    m_top_material->set_object_glow(kSunIndex, sun_color);

    if (m_phase) {
        m_top_material->set_object_color(moon_index(*m_phase), LightingModel::moon_color(sine_lunar_altitude));
    }
}

// -----------------------------------------------------------------
// Lighting
// -----------------------------------------------------------------

void SkyControl::update_lighting(const Vec3f& sun_direction, const std::optional<Vec3f>& moon_direction)
{
    const f32 sine_solar_altitude = sun_direction.y;
    const f32 sine_lunar_altitude = moon_direction ? moon_direction->y : -1.0f;
    update_object_colors(sine_solar_altitude, sine_lunar_altitude);

    const bool sun_up = sine_solar_altitude >= 0.0f;
    const bool moon_up = sine_lunar_altitude >= 0.0f;
    const f32 moon_weight = moon_illumination();

    const Vec3f main_direction = LightingModel::main_direction(sun_direction, moon_direction, moon_weight);

    const Vec4f base = LightingModel::base_color(sine_solar_altitude, moon_up ? moon_weight : 0.0f);
    m_top_material->set_haze_color(base);
    m_bottom_color = base;

    const Vec4f clouds = LightingModel::clouds_color(base, sun_up, moon_up);
    for (CloudLayer& layer : m_cloud_layers) {
        layer.set_color(Vec3f(clouds));
    }

    f32 transmission = 1.0f;
    if (m_cloud_modulation && (sun_up || (moon_up && moon_weight > 0.0f))) {
        transmission = cloud_transmission(main_direction);
    }

    const Vec4f main = LightingModel::main_color(sine_solar_altitude, base, moon_up, moon_weight, transmission);
    const Vec4f ambient = LightingModel::ambient_color(clouds, main);

    const LightingSnapshot snapshot{
        .ambient_color = ambient,
        .background_color = base,
        .main_color = main,
        .main_direction = main_direction,
        .shadow_intensity = LightingModel::shadow_intensity(main, ambient),
        .bloom_intensity = LightingModel::bloom_intensity(sine_solar_altitude),
    };

    m_last_snapshot = snapshot;
    if (m_lighting_sink != nullptr) {
        m_lighting_sink->update(snapshot);
    }
}

f32 SkyControl::cloud_transmission(const Vec3f& main_direction) const
{
    f32 delta_y = 0.0f;
    f32 semi_minor_axis = 1.0f;
    if (m_clouds_mesh) {
        semi_minor_axis = 1.0f - m_config.cloud_flattening;
        delta_y = -m_clouds_y_offset * semi_minor_axis;
    }

    const Vec3f intersection = LightingModel::intersect_cloud_dome(main_direction, delta_y, semi_minor_axis);
    const std::optional<Vec2f> uv = clouds_mesh().direction_uv(intersection);
    if (!uv) {
        return 1.0f;
    }
    return clouds_material().transmission(*uv);
}

// -----------------------------------------------------------------
// Settings
// -----------------------------------------------------------------

void SkyControl::set_phase(std::optional<LunarPhase> phase)
{
    if (phase == LunarPhase::Custom) {
        throw core::InvalidArgument("a custom phase needs an angle and a texture");
    }

    if (m_phase == LunarPhase::Custom) {
        // The full-moon slot was lent to the custom texture.
        m_top_material->add_object(moon_index(LunarPhase::Full), LunarPhases::image_path(LunarPhase::Full));
    }

    m_phase = phase;
    if (phase) {
        m_longitude_difference = LunarPhases::longitude_difference(*phase);
        ZEN_DEBUG(m_logger, "lunar phase {}", LunarPhases::describe(*phase));
    } else {
        ZEN_DEBUG(m_logger, "moon removed");
    }
}

void SkyControl::set_phase(f32 longitude_difference, f32 lunar_latitude, std::string_view texture_path)
{
    Validate::in_range(longitude_difference, "longitude difference", 0.0, sky_constants::kTwoPi);
    Validate::in_range(lunar_latitude, "lunar latitude", -sky_constants::kHalfPi, sky_constants::kHalfPi);

    m_top_material->add_object(moon_index(LunarPhase::Custom), texture_path);

    m_phase = LunarPhase::Custom;
    m_longitude_difference = longitude_difference;
    m_lunar_latitude = lunar_latitude;
    ZEN_DEBUG(m_logger, "custom lunar phase: longitude difference {:.3f}, latitude {:.3f}",
              longitude_difference, lunar_latitude);
}

f32 SkyControl::moon_illumination() const
{
    if (!m_phase) {
        return 0.0f;
    }
    return LunarPhases::illumination(m_longitude_difference, m_lunar_latitude);
}

void SkyControl::set_cloudiness(f32 alpha)
{
    Validate::fraction(alpha, "cloudiness");
    for (CloudLayer& layer : m_cloud_layers) {
        layer.set_opacity(alpha);
    }
}

void SkyControl::set_clouds_rate(f32 rate)
{
    m_clouds_rate = rate;
}

void SkyControl::set_clouds_y_offset(f32 offset)
{
    if (!m_clouds_mesh) {
        if (offset != 0.0f) {
            throw core::InvalidArgument("clouds y offset", "should be 0 without a flattened cloud dome", offset);
        }
        return;
    }
    Validate::in_half_open_range(offset, "clouds y offset", 0.0, 1.0);
    m_clouds_y_offset = offset;
}

void SkyControl::set_lunar_diameter(f32 diameter)
{
    Validate::in_open_range(diameter, "diameter", 0.0, astro_constants::kPi);
    m_moon_scale = diameter * sky_constants::kUvScale / sky_constants::kHalfPi;
}

void SkyControl::set_solar_diameter(f32 diameter)
{
    Validate::in_open_range(diameter, "diameter", 0.0, astro_constants::kPi);
    m_sun_scale = diameter * sky_constants::kUvScale / (sky_constants::kDiscDiameter * sky_constants::kHalfPi);
}

f32 SkyControl::lunar_diameter() const
{
    return m_moon_scale * sky_constants::kHalfPi / sky_constants::kUvScale;
}

f32 SkyControl::solar_diameter() const
{
    return m_sun_scale * sky_constants::kDiscDiameter * sky_constants::kHalfPi / sky_constants::kUvScale;
}

void SkyControl::set_top_vertical_angle(f32 angle)
{
    Validate::in_open_range(angle, "vertical angle", 0.0, sky_constants::kMaxVerticalAngle);

    DomeMesh top = m_top_mesh.with_vertical_angle(angle);
    std::optional<DomeMesh> bottom;
    if (m_bottom_mesh) {
        bottom = m_bottom_mesh->with_vertical_angle(sky_constants::kPi - angle);
    }

    m_top_mesh = std::move(top);
    if (bottom) {
        m_bottom_mesh = std::move(bottom);
    }
    ZEN_DEBUG(m_logger, "top dome rebuilt: vertical angle {:.3f}, {} vertices", angle, m_top_mesh.vertex_count());
}

CloudLayer& SkyControl::cloud_layer(u32 index)
{
    if (index >= m_cloud_layers.size()) {
        throw core::InvalidArgument(fmt::format("cloud layer index should be less than {}, got {}",
                                                m_cloud_layers.size(), index));
    }
    return m_cloud_layers[index];
}

// -----------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------

const SkyMaterial& SkyControl::clouds_material() const
{
    return m_clouds_only_material ? *m_clouds_only_material : *m_top_material;
}

SkyMaterial& SkyControl::clouds_material_mut()
{
    return m_clouds_only_material ? *m_clouds_only_material : *m_top_material;
}

const DomeMesh& SkyControl::clouds_mesh() const
{
    return m_clouds_mesh ? *m_clouds_mesh : m_top_mesh;
}

u32 SkyControl::moon_index(LunarPhase phase)
{
    const LunarPhase slot_phase = (phase == LunarPhase::Custom) ? LunarPhase::Full : phase;
    return kMoonBaseIndex + LunarPhases::preset_index(slot_phase);
}

SkySubtree SkyControl::subtree() const
{
    SkySubtree result;

    if (m_star_mesh) {
        result.geometries.push_back(SkyGeometry{
            .name = "north-stars",
            .mesh = &*m_star_mesh,
            .color_map = m_north_stars,
        });
        result.geometries.push_back(SkyGeometry{
            .name = "south-stars",
            .mesh = &*m_star_mesh,
            .color_map = m_south_stars,
        });
    }

    result.geometries.push_back(SkyGeometry{
        .name = "top-dome",
        .mesh = &m_top_mesh,
        .material = m_top_material.get(),
    });

    if (m_clouds_mesh) {
        const f32 y_scale = 1.0f - m_config.cloud_flattening;
        result.geometries.push_back(SkyGeometry{
            .name = "clouds-only-dome",
            .mesh = &*m_clouds_mesh,
            .material = m_clouds_only_material.get(),
            .local_scale = Vec3f{1.0f, y_scale, 1.0f},
            .local_translation = Vec3f{0.0f, -m_clouds_y_offset * y_scale, 0.0f},
        });
    }

    if (m_bottom_mesh) {
        result.geometries.push_back(SkyGeometry{
            .name = "bottom-dome",
            .mesh = &*m_bottom_mesh,
            .local_rotation = glm::angleAxis(sky_constants::kPi, Vec3f{1.0f, 0.0f, 0.0f}),
        });
    }

    return result;
}

} // namespace zenith::sky
