#pragma once

/// @file sky_material.hpp
/// @brief Procedural shading state for a sky dome: objects, cloud layers, transmission.

#include "core/types.hpp"
#include "sky/image_raster.hpp"

#include <spdlog/spdlog.h>

#include <compare>
#include <map>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace zenith::sky
{
    // -----------------------------------------------------------------
    // Parameter-set shapes
    // -----------------------------------------------------------------

    /// @brief Renderer parameter layouts, named by (objects, cloud layers).
    enum class MaterialShape
    {
        Dome02,
        Dome20,
        Dome22,
        Dome06,
        Dome60,
        Dome66,
    };

    struct ShapeCapacity
    {
        u32 objects;
        u32 cloud_layers;
    };

    /// @brief Smallest shape that holds the requested counts.
    /// @throws core::ConfigurationOverflow if none does.
    [[nodiscard]] MaterialShape select_shape(u32 objects, u32 cloud_layers);

    [[nodiscard]] ShapeCapacity shape_capacity(MaterialShape shape);

    /// @brief "dome02", "dome66", ...
    [[nodiscard]] std::string_view shape_name(MaterialShape shape);

    // -----------------------------------------------------------------
    // Slot state
    // -----------------------------------------------------------------

    /// @brief Texture-space placement of a celestial object.
    struct ObjectTransform
    {
        Vec2f center;                   ///< UV of the object's center
        f32 scale = 1.0f;               ///< Angular size relative to the texture
        std::optional<Vec2f> rotation;  ///< Unit (cos, sin) of the texture's "up", if rotated
        Vec2f transform_u{1.0f, 0.0f};  ///< First row of the texture-space basis
        Vec2f transform_v{0.0f, 1.0f};  ///< Second row of the texture-space basis
    };

    namespace slot_state
    {
        struct Unconfigured {};
        struct Hidden {};
        struct Visible
        {
            ObjectTransform transform;
        };
    }

    using ObjectState = std::variant<slot_state::Unconfigured, slot_state::Hidden, slot_state::Visible>;

    struct ObjectSlot
    {
        ObjectState state;
        TextureHandle color_map;
        Vec4f color{1.0f};
        Vec4f glow{0.0f, 0.0f, 0.0f, 1.0f};
    };

    struct CloudSlot
    {
        TextureHandle alpha_map;
        Vec4f color{1.0f};              ///< Alpha is the layer's opacity
        Vec4f glow{0.0f, 0.0f, 0.0f, 1.0f};
        Vec2f offset{0.0f};             ///< Each component in [0, 1)
        f32 scale = 1.0f;
    };

    // -----------------------------------------------------------------
    // Parameters handed to the renderer
    // -----------------------------------------------------------------

    enum class ParameterKind
    {
        ObjectColorMap,
        ObjectCenter,
        ObjectTransformU,
        ObjectTransformV,
        ObjectColor,
        ObjectGlow,
        ObjectVisible,
        CloudsAlphaMap,
        CloudsColor,
        CloudsGlow,
        CloudsOffset,
        CloudsScale,
        ClearColor,
        ClearGlow,
        HazeColor,
        HazeAlphaMap,
        StarsColorMap,
        TopCoord,
    };

    [[nodiscard]] std::string_view parameter_name(ParameterKind kind);

    /// @brief Slot index used by parameters that belong to the whole dome.
    inline constexpr i32 kSharedSlot = -1;

    struct ParameterKey
    {
        i32 slot;
        ParameterKind kind;

        auto operator<=>(const ParameterKey&) const = default;
    };

    using ParameterValue = std::variant<bool, f32, Vec2f, Vec4f, TextureHandle>;
    using ParameterMap = std::map<ParameterKey, ParameterValue>;

    /// @brief Rendering collaborator receiving validated shading parameters.
    class MaterialSink
    {
    public:
        virtual ~MaterialSink() = default;
        virtual void apply(const ParameterKey& key, const ParameterValue& value) = 0;
    };

    // -----------------------------------------------------------------
    // SkyMaterial
    // -----------------------------------------------------------------

    struct SkyMaterialConfig
    {
        u32 max_objects = 2;
        u32 max_cloud_layers = 2;
        std::shared_ptr<TextureSource> textures;    ///< Required for path-based binds
        std::shared_ptr<spdlog::logger> logger;     ///< Optional
    };

    /// @brief Shading state of one sky dome.
    ///
    /// Objects (sun, moon phases) and cloud layers live in fixed slots.
    /// A slot must be bound with a texture before anything else is done to it.
    /// Every mutator validates all arguments before changing state.
    class SkyMaterial
    {
    public:
        explicit SkyMaterial(const SkyMaterialConfig& config);

        SkyMaterial(const SkyMaterial&) = delete;
        SkyMaterial& operator=(const SkyMaterial&) = delete;
        SkyMaterial(SkyMaterial&&) = delete;
        SkyMaterial& operator=(SkyMaterial&&) = delete;

        [[nodiscard]] MaterialShape shape() const { return m_shape; }
        [[nodiscard]] u32 max_objects() const { return static_cast<u32>(m_objects.size()); }
        [[nodiscard]] u32 max_cloud_layers() const { return static_cast<u32>(m_clouds.size()); }

        // ---- Objects ----

        /// @brief Bind a color map; the first bind sets white color, black glow,
        /// and an unrotated transform at the top UV.
        void add_object(u32 index, TextureHandle color_map);
        void add_object(u32 index, std::string_view path);

        /// @brief Place the object and compute its texture-space basis.
        /// @param rotation Direction of the texture's "up" (normalized here), or none.
        void set_object_transform(u32 index, const Vec2f& center, f32 scale,
                                  const std::optional<Vec2f>& rotation = std::nullopt);

        /// @brief Make a bound object invisible. set_object_transform shows it again.
        void hide_object(u32 index);

        void set_object_color(u32 index, const Vec4f& color);
        void set_object_glow(u32 index, const Vec4f& color);

        [[nodiscard]] bool is_object_added(u32 index) const;
        [[nodiscard]] bool is_object_visible(u32 index) const;
        [[nodiscard]] Vec4f object_color(u32 index) const;
        [[nodiscard]] Vec4f object_glow(u32 index) const;

        /// @return Center UV, or std::nullopt while hidden.
        [[nodiscard]] std::optional<Vec2f> object_center(u32 index) const;

        /// @return Transform of a visible object, or std::nullopt while hidden.
        [[nodiscard]] std::optional<ObjectTransform> object_transform(u32 index) const;

        // ---- Cloud layers ----

        /// @brief Bind an alpha map; the first bind sets white color, zero offset and unit scale.
        void add_clouds(u32 layer, TextureHandle alpha_map);
        void add_clouds(u32 layer, std::string_view path);

        /// @brief Set RGB and opacity (alpha) of a layer.
        void set_clouds_color(u32 layer, const Vec4f& color);
        void set_clouds_glow(u32 layer, const Vec4f& color);

        /// @brief Offsets are wrapped into [0, 1).
        void set_clouds_offset(u32 layer, f32 u, f32 v);
        void set_clouds_scale(u32 layer, f32 scale);

        [[nodiscard]] bool is_clouds_added(u32 layer) const;
        [[nodiscard]] Vec4f clouds_color(u32 layer) const;
        [[nodiscard]] Vec4f clouds_glow(u32 layer) const;
        [[nodiscard]] Vec2f clouds_offset(u32 layer) const;
        [[nodiscard]] f32 clouds_scale(u32 layer) const;

        // ---- Whole-dome parameters ----

        void set_clear_color(const Vec4f& color);
        void set_clear_glow(const Vec4f& color);
        void set_haze_color(const Vec4f& color);

        /// @brief Bind a horizon haze alpha map and reset the haze color to white.
        void add_haze(std::string_view path);
        void add_stars(std::string_view path);
        void remove_stars();

        [[nodiscard]] Vec4f clear_color() const { return m_clear_color; }
        [[nodiscard]] Vec4f clear_glow() const { return m_clear_glow; }
        [[nodiscard]] Vec4f haze_color() const { return m_haze_color; }
        [[nodiscard]] bool has_stars() const { return m_stars_map != nullptr; }

        // ---- Transmission ----

        /// @brief Fraction of light passing through every bound cloud layer, in [0, 1].
        [[nodiscard]] f32 transmission(const Vec2f& uv) const;

        /// @brief Transmission at an object's center (hidden objects use UV (0, 0)).
        [[nodiscard]] f32 transmission(u32 object_index) const;

        // ---- Renderer hand-off ----

        [[nodiscard]] ParameterMap collect_parameters() const;

        /// @brief Validate every parameter against this shape, then pass all to @p sink.
        void apply_to(MaterialSink& sink) const;

        /// @brief Check kind/value pairing and slot range.
        /// @throws core::InvalidArgument on mismatch.
        static void validate_parameter(MaterialShape shape, const ParameterKey& key,
                                       const ParameterValue& value);

    private:
        void validate_object_index(u32 index) const;
        void validate_layer_index(u32 layer) const;
        ObjectSlot& bound_object(u32 index);
        [[nodiscard]] const ObjectSlot& bound_object(u32 index) const;
        CloudSlot& bound_clouds(u32 layer);
        [[nodiscard]] const CloudSlot& bound_clouds(u32 layer) const;
        [[nodiscard]] TextureHandle load(std::string_view path) const;

        MaterialShape m_shape;
        std::shared_ptr<TextureSource> m_textures;
        std::shared_ptr<spdlog::logger> m_logger;

        std::vector<ObjectSlot> m_objects;
        std::vector<std::optional<CloudSlot>> m_clouds;

        Vec4f m_clear_color{0.4f, 0.6f, 1.0f, 1.0f};
        Vec4f m_clear_glow{0.0f, 0.0f, 0.0f, 1.0f};
        Vec4f m_haze_color{1.0f};
        TextureHandle m_haze_map;
        TextureHandle m_stars_map;
    };

} // namespace zenith::sky
