/// @file cloud_layer.cpp
/// @brief Cloud layer animation.

#include "sky/cloud_layer.hpp"

#include "core/error.hpp"
#include "core/validate.hpp"
#include "sky/image_raster.hpp"
#include "sky/sky_material.hpp"

namespace zenith::sky
{

using core::Validate;

CloudLayer::CloudLayer(SkyMaterial& material, u32 layer_index)
    : m_material(&material)
    , m_index(layer_index)
{
    if (layer_index >= material.max_cloud_layers()) {
        throw core::InvalidArgument("layer_index", "should be below the material's layer count",
                                    layer_index);
    }

    if (layer_index % 2 == 1) {
        m_u0 = 0.0f;
        m_u_rate = 0.0003f;
        m_v0 = 0.0f;
        m_v_rate = 0.001f;
    } else {
        m_u0 = 0.4f;
        m_u_rate = -0.0005f;
        m_v0 = 0.3f;
        m_v_rate = 0.003f;
    }
}

void CloudLayer::update_offset(f32 time)
{
    const f32 u = m_u0 + time * m_u_rate;
    const f32 v = m_v0 + time * m_v_rate;
    m_material->set_clouds_offset(m_index, u, v);
}

void CloudLayer::set_opacity(f32 alpha)
{
    Validate::fraction(alpha, "alpha");
    m_opacity = alpha;
}

void CloudLayer::set_color(const Vec3f& rgb)
{
    m_material->set_clouds_color(m_index, Vec4f(rgb, m_opacity));
}

void CloudLayer::set_glow(const Vec3f& rgb)
{
    m_material->set_clouds_glow(m_index, Vec4f(rgb, 1.0f));
}

void CloudLayer::set_motion(f32 u0, f32 u_rate, f32 v0, f32 v_rate)
{
    m_u0 = u0;
    m_u_rate = u_rate;
    m_v0 = v0;
    m_v_rate = v_rate;
}

void CloudLayer::set_texture(std::string_view path, f32 scale)
{
    Validate::positive(scale, "scale");
    m_material->add_clouds(m_index, path);
    m_material->set_clouds_scale(m_index, scale);
}

void CloudLayer::clear_texture()
{
    m_material->add_clouds(m_index, PixelRaster::clear());
}

} // namespace zenith::sky
