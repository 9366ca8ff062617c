#pragma once

/// @file cloud_layer.hpp
/// @brief Animation state of one cloud layer on a sky material.

#include "core/types.hpp"

#include <string_view>

namespace zenith::sky
{
    class SkyMaterial;

    /// @brief UV drift, opacity and texture of one cloud layer.
    ///
    /// Odd and even layers drift in different directions by default so that
    /// stacked layers do not move in lockstep. Rates are in texture cycles
    /// per second of animation time.
    class CloudLayer
    {
    public:
        static constexpr f32 kDefaultScale = 1.5f;

        /// @param material Material holding the layer's slot; must outlive this object.
        CloudLayer(SkyMaterial& material, u32 layer_index);

        /// @brief Move the texture to its position at @p time (seconds).
        void update_offset(f32 time);

        /// @brief Opacity in [0, 1]; applied by the next set_color().
        void set_opacity(f32 alpha);

        /// @brief Set RGB; the layer's opacity becomes the alpha channel.
        void set_color(const Vec3f& rgb);
        void set_glow(const Vec3f& rgb);

        void set_motion(f32 u0, f32 u_rate, f32 v0, f32 v_rate);

        /// @brief Bind an alpha map by path, with UV scale > 0.
        void set_texture(std::string_view path, f32 scale = kDefaultScale);

        /// @brief Bind a fully transparent texture.
        void clear_texture();

        [[nodiscard]] u32 index() const { return m_index; }
        [[nodiscard]] f32 opacity() const { return m_opacity; }
        [[nodiscard]] f32 u0() const { return m_u0; }
        [[nodiscard]] f32 v0() const { return m_v0; }
        [[nodiscard]] f32 u_rate() const { return m_u_rate; }
        [[nodiscard]] f32 v_rate() const { return m_v_rate; }

    private:
        SkyMaterial* m_material;
        u32 m_index;
        f32 m_opacity = 0.0f;
        f32 m_u0;
        f32 m_u_rate;
        f32 m_v0;
        f32 m_v_rate;
    };

} // namespace zenith::sky
