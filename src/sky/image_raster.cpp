/// @file image_raster.cpp
/// @brief In-memory rasters and bilinear sampling.

#include "sky/image_raster.hpp"

#include "core/error.hpp"

#include <cmath>
#include <utility>

namespace zenith::sky
{

PixelRaster::PixelRaster(u32 width, u32 height, std::vector<Vec4f> pixels)
    : m_width(width)
    , m_height(height)
    , m_pixels(std::move(pixels))
{
    if (width == 0 || height == 0) {
        throw core::InvalidArgument("raster size should be positive");
    }
    if (m_pixels.size() != static_cast<std::size_t>(width) * height) {
        throw core::InvalidArgument(fmt::format("raster of {}x{} needs {} pixels, got {}",
                                                width, height,
                                                static_cast<std::size_t>(width) * height,
                                                m_pixels.size()));
    }
}

TextureHandle PixelRaster::filled(u32 width, u32 height, const Vec4f& color)
{
    std::vector<Vec4f> pixels(static_cast<std::size_t>(width) * height, color);
    return std::make_shared<const PixelRaster>(width, height, std::move(pixels));
}

TextureHandle PixelRaster::clear()
{
    return filled(1, 1, Vec4f{0.0f});
}

Vec4f PixelRaster::pixel(u32 x, u32 y) const
{
    if (x >= m_width || y >= m_height) {
        throw core::InvalidArgument(fmt::format("pixel ({}, {}) outside {}x{} raster",
                                                x, y, m_width, m_height));
    }
    return m_pixels[static_cast<std::size_t>(y) * m_width + x];
}

// -----------------------------------------------------------------
// Bilinear sampling
//
// Texel centers sit at half-integer positions. The four texels around
// (u·w - 0.5, v·h - 0.5) are blended by their fractional distances;
// indices wrap so the texture tiles seamlessly.
// -----------------------------------------------------------------

f32 sample_red(const ImageRaster& raster, const Vec2f& uv)
{
    const u32 width = raster.width();
    const u32 height = raster.height();

    const f32 u = uv.x - std::floor(uv.x);
    const f32 v = uv.y - std::floor(uv.y);

    const f32 x = u * static_cast<f32>(width) - 0.5f;
    const f32 y = v * static_cast<f32>(height) - 0.5f;
    const f32 x_floor = std::floor(x);
    const f32 y_floor = std::floor(y);
    const f32 fx = x - x_floor;
    const f32 fy = y - y_floor;

    auto wrap = [](f32 index, u32 size) {
        const auto n = static_cast<i32>(size);
        i32 i = static_cast<i32>(index) % n;
        if (i < 0) {
            i += n;
        }
        return static_cast<u32>(i);
    };

    const u32 x0 = wrap(x_floor, width);
    const u32 x1 = wrap(x_floor + 1.0f, width);
    const u32 y0 = wrap(y_floor, height);
    const u32 y1 = wrap(y_floor + 1.0f, height);

    const f32 r00 = raster.pixel(x0, y0).r;
    const f32 r10 = raster.pixel(x1, y0).r;
    const f32 r01 = raster.pixel(x0, y1).r;
    const f32 r11 = raster.pixel(x1, y1).r;

    const f32 bottom = r00 + fx * (r10 - r00);
    const f32 top = r01 + fx * (r11 - r01);
    return bottom + fy * (top - bottom);
}

} // namespace zenith::sky
