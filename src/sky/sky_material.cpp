/// @file sky_material.cpp
/// @brief Shading state, texture-space object transforms and cloud transmission.

#include "sky/sky_material.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "core/validate.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace zenith::sky
{

using core::Validate;

namespace
{

struct ShapeEntry
{
    MaterialShape shape;
    ShapeCapacity capacity;
    std::string_view name;
};

// Ordered smallest first, as select_shape() picks the first fit.
constexpr std::array<ShapeEntry, 6> kShapes = {{
    {MaterialShape::Dome02, {0, 2}, "dome02"},
    {MaterialShape::Dome20, {2, 0}, "dome20"},
    {MaterialShape::Dome22, {2, 2}, "dome22"},
    {MaterialShape::Dome06, {0, 6}, "dome06"},
    {MaterialShape::Dome60, {6, 0}, "dome60"},
    {MaterialShape::Dome66, {6, 6}, "dome66"},
}};

const ShapeEntry& entry(MaterialShape shape)
{
    for (const ShapeEntry& e : kShapes) {
        if (e.shape == shape) {
            return e;
        }
    }
    throw core::InvalidArgument("unknown material shape");
}

// Hidden objects are sampled here; it is never a visible object's center.
const Vec2f kHiddenUv{0.0f, 0.0f};

f32 wrap01(f32 value)
{
    f32 result = value - std::floor(value);
    if (result >= 1.0f) {
        result = 0.0f;
    }
    return result;
}

// -----------------------------------------------------------------
// Texture-space basis for an object centered at @p center.
//
// The dome projection compresses textures radially toward the rim.
// With d = |center - top|, the radial row is divided by 1 + k·d²
// and (when rotated) the basis is first aligned with the radial
// direction, then turned by the caller's (cos, sin) pair. Finally
// both rows are divided by the object scale.
// -----------------------------------------------------------------

void compute_basis(ObjectTransform& t)
{
    const Vec2f top{sky_constants::kTopU, sky_constants::kTopV};
    const Vec2f offset = t.center - top;
    const f32 top_distance = glm::length(offset);
    const bool rotated = t.rotation.has_value();

    Vec2f transform_u{1.0f, 0.0f};
    Vec2f transform_v{0.0f, 1.0f};

    if (top_distance > 0.0f) {
        const f32 a = offset.x / top_distance;
        const f32 b = offset.y / top_distance;
        Vec2f tu{b, -a};
        const Vec2f tv{a, b};
        const f32 stretch = 1.0f + sky_constants::kStretchCoefficient * top_distance * top_distance;
        tu /= stretch;

        if (rotated) {
            transform_u = Vec2f{tu.x * b + tv.x * a, tu.y * b + tv.y * a};
            transform_v = Vec2f{tv.x * b - tu.x * a, tv.y * b - tu.y * a};
        } else {
            transform_u = tu;
            transform_v = tv;
        }
    }

    if (rotated) {
        const Vec2f tu = transform_v;
        const Vec2f tv = -transform_u;
        const Vec2f n = *t.rotation;
        transform_u = Vec2f{tu.x * n.x + tv.x * n.y, tu.y * n.x + tv.y * n.y};
        transform_v = Vec2f{tv.x * n.x - tu.x * n.y, tv.y * n.x - tu.y * n.y};
    }

    t.transform_u = transform_u / t.scale;
    t.transform_v = transform_v / t.scale;
}

} // namespace

// -----------------------------------------------------------------
// Shapes
// -----------------------------------------------------------------

MaterialShape select_shape(u32 objects, u32 cloud_layers)
{
    for (const ShapeEntry& e : kShapes) {
        if (objects <= e.capacity.objects && cloud_layers <= e.capacity.cloud_layers) {
            return e.shape;
        }
    }
    throw core::ConfigurationOverflow(objects, cloud_layers);
}

ShapeCapacity shape_capacity(MaterialShape shape)
{
    return entry(shape).capacity;
}

std::string_view shape_name(MaterialShape shape)
{
    return entry(shape).name;
}

std::string_view parameter_name(ParameterKind kind)
{
    switch (kind) {
        case ParameterKind::ObjectColorMap:   return "ColorMap";
        case ParameterKind::ObjectCenter:     return "Center";
        case ParameterKind::ObjectTransformU: return "TransformU";
        case ParameterKind::ObjectTransformV: return "TransformV";
        case ParameterKind::ObjectColor:      return "Color";
        case ParameterKind::ObjectGlow:       return "Glow";
        case ParameterKind::ObjectVisible:    return "Visible";
        case ParameterKind::CloudsAlphaMap:   return "AlphaMap";
        case ParameterKind::CloudsColor:      return "Color";
        case ParameterKind::CloudsGlow:       return "Glow";
        case ParameterKind::CloudsOffset:     return "Offset";
        case ParameterKind::CloudsScale:      return "Scale";
        case ParameterKind::ClearColor:       return "ClearColor";
        case ParameterKind::ClearGlow:        return "ClearGlow";
        case ParameterKind::HazeColor:        return "HazeColor";
        case ParameterKind::HazeAlphaMap:     return "HazeAlphaMap";
        case ParameterKind::StarsColorMap:    return "StarsColorMap";
        case ParameterKind::TopCoord:         return "TopCoord";
    }
    return "Unknown";
}

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

SkyMaterial::SkyMaterial(const SkyMaterialConfig& config)
    : m_shape(select_shape(config.max_objects, config.max_cloud_layers))
    , m_textures(config.textures)
    , m_logger(core::Logger::or_null(config.logger))
    , m_objects(config.max_objects)
    , m_clouds(config.max_cloud_layers)
{
    ZEN_DEBUG(m_logger, "sky material: {} objects, {} cloud layers, shape {}",
              config.max_objects, config.max_cloud_layers, shape_name(m_shape));
}

// -----------------------------------------------------------------
// Objects
// -----------------------------------------------------------------

void SkyMaterial::add_object(u32 index, TextureHandle color_map)
{
    validate_object_index(index);
    if (!color_map) {
        throw core::InvalidArgument("object color map should not be null");
    }

    ObjectSlot& slot = m_objects[index];
    slot.color_map = std::move(color_map);

    if (std::holds_alternative<slot_state::Unconfigured>(slot.state)) {
        slot.color = Vec4f{1.0f};
        slot.glow = Vec4f{0.0f, 0.0f, 0.0f, 1.0f};

        ObjectTransform transform{
            .center = Vec2f{sky_constants::kTopU, sky_constants::kTopV},
            .scale = 1.0f,
        };
        compute_basis(transform);
        slot.state = slot_state::Visible{transform};
    }
}

void SkyMaterial::add_object(u32 index, std::string_view path)
{
    validate_object_index(index);
    add_object(index, load(path));
}

void SkyMaterial::set_object_transform(u32 index, const Vec2f& center, f32 scale,
                                       const std::optional<Vec2f>& rotation)
{
    validate_object_index(index);
    Validate::uv(center, "center");
    Validate::positive(scale, "scale");
    if (rotation) {
        Validate::non_zero(*rotation, "rotation");
    }
    ObjectSlot& slot = bound_object(index);

    ObjectTransform transform{
        .center = center,
        .scale = scale,
        .rotation = rotation ? std::optional<Vec2f>(glm::normalize(*rotation)) : std::nullopt,
    };
    compute_basis(transform);
    slot.state = slot_state::Visible{transform};
}

void SkyMaterial::hide_object(u32 index)
{
    validate_object_index(index);
    bound_object(index).state = slot_state::Hidden{};
}

void SkyMaterial::set_object_color(u32 index, const Vec4f& color)
{
    validate_object_index(index);
    bound_object(index).color = color;
}

void SkyMaterial::set_object_glow(u32 index, const Vec4f& color)
{
    validate_object_index(index);
    bound_object(index).glow = color;
}

bool SkyMaterial::is_object_added(u32 index) const
{
    validate_object_index(index);
    return !std::holds_alternative<slot_state::Unconfigured>(m_objects[index].state);
}

bool SkyMaterial::is_object_visible(u32 index) const
{
    validate_object_index(index);
    return std::holds_alternative<slot_state::Visible>(m_objects[index].state);
}

Vec4f SkyMaterial::object_color(u32 index) const
{
    validate_object_index(index);
    return bound_object(index).color;
}

Vec4f SkyMaterial::object_glow(u32 index) const
{
    validate_object_index(index);
    return bound_object(index).glow;
}

std::optional<Vec2f> SkyMaterial::object_center(u32 index) const
{
    const std::optional<ObjectTransform> transform = object_transform(index);
    if (!transform) {
        return std::nullopt;
    }
    return transform->center;
}

std::optional<ObjectTransform> SkyMaterial::object_transform(u32 index) const
{
    validate_object_index(index);
    const ObjectSlot& slot = bound_object(index);
    if (const auto* visible = std::get_if<slot_state::Visible>(&slot.state)) {
        return visible->transform;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Cloud layers
// -----------------------------------------------------------------

void SkyMaterial::add_clouds(u32 layer, TextureHandle alpha_map)
{
    validate_layer_index(layer);
    if (!alpha_map) {
        throw core::InvalidArgument("cloud alpha map should not be null");
    }

    std::optional<CloudSlot>& slot = m_clouds[layer];
    if (slot) {
        slot->alpha_map = std::move(alpha_map);
    } else {
        slot = CloudSlot{
            .alpha_map = std::move(alpha_map),
            .color = Vec4f{1.0f},
            .offset = Vec2f{0.0f},
            .scale = 1.0f,
        };
    }
}

void SkyMaterial::add_clouds(u32 layer, std::string_view path)
{
    validate_layer_index(layer);
    add_clouds(layer, load(path));
}

void SkyMaterial::set_clouds_color(u32 layer, const Vec4f& color)
{
    validate_layer_index(layer);
    Validate::fraction(color.a, "cloud opacity");
    bound_clouds(layer).color = color;
}

void SkyMaterial::set_clouds_glow(u32 layer, const Vec4f& color)
{
    validate_layer_index(layer);
    bound_clouds(layer).glow = color;
}

void SkyMaterial::set_clouds_offset(u32 layer, f32 u, f32 v)
{
    validate_layer_index(layer);
    bound_clouds(layer).offset = Vec2f{wrap01(u), wrap01(v)};
}

void SkyMaterial::set_clouds_scale(u32 layer, f32 scale)
{
    validate_layer_index(layer);
    Validate::positive(scale, "scale");
    bound_clouds(layer).scale = scale;
}

bool SkyMaterial::is_clouds_added(u32 layer) const
{
    validate_layer_index(layer);
    return m_clouds[layer].has_value();
}

Vec4f SkyMaterial::clouds_color(u32 layer) const
{
    validate_layer_index(layer);
    return bound_clouds(layer).color;
}

Vec4f SkyMaterial::clouds_glow(u32 layer) const
{
    validate_layer_index(layer);
    return bound_clouds(layer).glow;
}

Vec2f SkyMaterial::clouds_offset(u32 layer) const
{
    validate_layer_index(layer);
    return bound_clouds(layer).offset;
}

f32 SkyMaterial::clouds_scale(u32 layer) const
{
    validate_layer_index(layer);
    return bound_clouds(layer).scale;
}

// -----------------------------------------------------------------
// Whole-dome parameters
// -----------------------------------------------------------------

void SkyMaterial::set_clear_color(const Vec4f& color)
{
    m_clear_color = color;
}

void SkyMaterial::set_clear_glow(const Vec4f& color)
{
    m_clear_glow = color;
}

void SkyMaterial::set_haze_color(const Vec4f& color)
{
    m_haze_color = color;
}

void SkyMaterial::add_haze(std::string_view path)
{
    m_haze_map = load(path);
    m_haze_color = Vec4f{1.0f};
}

void SkyMaterial::add_stars(std::string_view path)
{
    m_stars_map = load(path);
}

void SkyMaterial::remove_stars()
{
    m_stars_map.reset();
}

// -----------------------------------------------------------------
// Transmission
//
// Each bound layer absorbs (red sample × layer alpha) of the light
// that reaches it, sampled at uv·scale + offset (wrapped).
// -----------------------------------------------------------------

f32 SkyMaterial::transmission(const Vec2f& uv) const
{
    f32 result = 1.0f;
    for (const std::optional<CloudSlot>& layer : m_clouds) {
        if (!layer) {
            continue;
        }
        const Vec2f coord = uv * layer->scale + layer->offset;
        const f32 opacity = std::clamp(sample_red(*layer->alpha_map, coord), 0.0f, 1.0f) * layer->color.a;
        result *= 1.0f - opacity;
    }
    return std::clamp(result, 0.0f, 1.0f);
}

f32 SkyMaterial::transmission(u32 object_index) const
{
    validate_object_index(object_index);
    const ObjectSlot& slot = bound_object(object_index);
    if (const auto* visible = std::get_if<slot_state::Visible>(&slot.state)) {
        return transmission(visible->transform.center);
    }
    return transmission(kHiddenUv);
}

// -----------------------------------------------------------------
// Renderer hand-off
// -----------------------------------------------------------------

ParameterMap SkyMaterial::collect_parameters() const
{
    ParameterMap result;

    result[{kSharedSlot, ParameterKind::TopCoord}] = Vec2f{sky_constants::kTopU, sky_constants::kTopV};
    result[{kSharedSlot, ParameterKind::ClearColor}] = m_clear_color;
    result[{kSharedSlot, ParameterKind::ClearGlow}] = m_clear_glow;
    result[{kSharedSlot, ParameterKind::HazeColor}] = m_haze_color;
    if (m_haze_map) {
        result[{kSharedSlot, ParameterKind::HazeAlphaMap}] = m_haze_map;
    }
    if (m_stars_map) {
        result[{kSharedSlot, ParameterKind::StarsColorMap}] = m_stars_map;
    }

    for (std::size_t i = 0; i < m_objects.size(); ++i) {
        const ObjectSlot& slot = m_objects[i];
        if (std::holds_alternative<slot_state::Unconfigured>(slot.state)) {
            continue;
        }
        const auto index = static_cast<i32>(i);
        result[{index, ParameterKind::ObjectColorMap}] = slot.color_map;
        result[{index, ParameterKind::ObjectColor}] = slot.color;
        result[{index, ParameterKind::ObjectGlow}] = slot.glow;

        const auto* visible = std::get_if<slot_state::Visible>(&slot.state);
        result[{index, ParameterKind::ObjectVisible}] = visible != nullptr;
        if (visible) {
            result[{index, ParameterKind::ObjectCenter}] = visible->transform.center;
            result[{index, ParameterKind::ObjectTransformU}] = visible->transform.transform_u;
            result[{index, ParameterKind::ObjectTransformV}] = visible->transform.transform_v;
        }
    }

    for (std::size_t i = 0; i < m_clouds.size(); ++i) {
        if (!m_clouds[i]) {
            continue;
        }
        const CloudSlot& layer = *m_clouds[i];
        const auto index = static_cast<i32>(i);
        result[{index, ParameterKind::CloudsAlphaMap}] = layer.alpha_map;
        result[{index, ParameterKind::CloudsColor}] = layer.color;
        result[{index, ParameterKind::CloudsGlow}] = layer.glow;
        result[{index, ParameterKind::CloudsOffset}] = layer.offset;
        result[{index, ParameterKind::CloudsScale}] = layer.scale;
    }

    return result;
}

void SkyMaterial::apply_to(MaterialSink& sink) const
{
    const ParameterMap parameters = collect_parameters();
    for (const auto& [key, value] : parameters) {
        validate_parameter(m_shape, key, value);
    }
    for (const auto& [key, value] : parameters) {
        sink.apply(key, value);
    }
}

void SkyMaterial::validate_parameter(MaterialShape shape, const ParameterKey& key,
                                     const ParameterValue& value)
{
    const ShapeCapacity capacity = shape_capacity(shape);

    auto require_slot = [&](i32 limit) {
        if (key.slot < 0 || key.slot >= limit) {
            throw core::InvalidArgument(fmt::format("{} slot {} outside {}",
                                                    parameter_name(key.kind), key.slot,
                                                    shape_name(shape)));
        }
    };
    auto require_shared = [&]() {
        if (key.slot != kSharedSlot) {
            throw core::InvalidArgument(fmt::format("{} is a whole-dome parameter, got slot {}",
                                                    parameter_name(key.kind), key.slot));
        }
    };
    auto require_type = [&](bool matches) {
        if (!matches) {
            throw core::InvalidArgument(fmt::format("wrong value type for {}",
                                                    parameter_name(key.kind)));
        }
    };
    auto is_texture = [&]() {
        const auto* texture = std::get_if<TextureHandle>(&value);
        return texture != nullptr && *texture != nullptr;
    };

    switch (key.kind) {
        case ParameterKind::ObjectColorMap:
            require_slot(static_cast<i32>(capacity.objects));
            require_type(is_texture());
            break;
        case ParameterKind::ObjectCenter:
        case ParameterKind::ObjectTransformU:
        case ParameterKind::ObjectTransformV:
            require_slot(static_cast<i32>(capacity.objects));
            require_type(std::holds_alternative<Vec2f>(value));
            break;
        case ParameterKind::ObjectColor:
        case ParameterKind::ObjectGlow:
            require_slot(static_cast<i32>(capacity.objects));
            require_type(std::holds_alternative<Vec4f>(value));
            break;
        case ParameterKind::ObjectVisible:
            require_slot(static_cast<i32>(capacity.objects));
            require_type(std::holds_alternative<bool>(value));
            break;
        case ParameterKind::CloudsAlphaMap:
            require_slot(static_cast<i32>(capacity.cloud_layers));
            require_type(is_texture());
            break;
        case ParameterKind::CloudsColor:
        case ParameterKind::CloudsGlow:
            require_slot(static_cast<i32>(capacity.cloud_layers));
            require_type(std::holds_alternative<Vec4f>(value));
            break;
        case ParameterKind::CloudsOffset:
            require_slot(static_cast<i32>(capacity.cloud_layers));
            require_type(std::holds_alternative<Vec2f>(value));
            break;
        case ParameterKind::CloudsScale:
            require_slot(static_cast<i32>(capacity.cloud_layers));
            require_type(std::holds_alternative<f32>(value) && std::get<f32>(value) > 0.0f);
            break;
        case ParameterKind::ClearColor:
        case ParameterKind::ClearGlow:
        case ParameterKind::HazeColor:
            require_shared();
            require_type(std::holds_alternative<Vec4f>(value));
            break;
        case ParameterKind::HazeAlphaMap:
        case ParameterKind::StarsColorMap:
            require_shared();
            require_type(is_texture());
            break;
        case ParameterKind::TopCoord:
            require_shared();
            require_type(std::holds_alternative<Vec2f>(value));
            break;
    }
}

// -----------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------

void SkyMaterial::validate_object_index(u32 index) const
{
    if (index >= m_objects.size()) {
        throw core::InvalidArgument(fmt::format("object index should be less than {}, got {}",
                                                m_objects.size(), index));
    }
}

void SkyMaterial::validate_layer_index(u32 layer) const
{
    if (layer >= m_clouds.size()) {
        throw core::InvalidArgument(fmt::format("cloud layer index should be less than {}, got {}",
                                                m_clouds.size(), layer));
    }
}

ObjectSlot& SkyMaterial::bound_object(u32 index)
{
    ObjectSlot& slot = m_objects[index];
    if (std::holds_alternative<slot_state::Unconfigured>(slot.state)) {
        throw core::IllegalState(fmt::format("object {} not yet added", index));
    }
    return slot;
}

const ObjectSlot& SkyMaterial::bound_object(u32 index) const
{
    const ObjectSlot& slot = m_objects[index];
    if (std::holds_alternative<slot_state::Unconfigured>(slot.state)) {
        throw core::IllegalState(fmt::format("object {} not yet added", index));
    }
    return slot;
}

CloudSlot& SkyMaterial::bound_clouds(u32 layer)
{
    std::optional<CloudSlot>& slot = m_clouds[layer];
    if (!slot) {
        throw core::IllegalState(fmt::format("cloud layer {} not yet added", layer));
    }
    return *slot;
}

const CloudSlot& SkyMaterial::bound_clouds(u32 layer) const
{
    const std::optional<CloudSlot>& slot = m_clouds[layer];
    if (!slot) {
        throw core::IllegalState(fmt::format("cloud layer {} not yet added", layer));
    }
    return *slot;
}

TextureHandle SkyMaterial::load(std::string_view path) const
{
    if (path.empty()) {
        throw core::InvalidArgument("texture path should not be empty");
    }
    if (!m_textures) {
        throw core::IllegalState("no texture source configured");
    }
    TextureHandle texture = m_textures->load(path);
    if (!texture) {
        ZEN_ERROR(m_logger, "texture \"{}\" could not be loaded", path);
        throw core::ResourceError(path);
    }
    return texture;
}

} // namespace zenith::sky
