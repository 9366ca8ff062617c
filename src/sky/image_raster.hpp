#pragma once

/// @file image_raster.hpp
/// @brief Sampleable image rasters and the image service that supplies them.

#include "core/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace zenith::sky
{
    /// @brief Read-only RGBA raster addressed by integer pixel coordinates.
    class ImageRaster
    {
    public:
        virtual ~ImageRaster() = default;

        [[nodiscard]] virtual u32 width() const = 0;
        [[nodiscard]] virtual u32 height() const = 0;

        /// @brief Pixel color, each channel in [0, 1]. Row 0 is the v = 0 edge.
        [[nodiscard]] virtual Vec4f pixel(u32 x, u32 y) const = 0;
    };

    /// @brief Shared handle to an immutable raster (texture).
    using TextureHandle = std::shared_ptr<const ImageRaster>;

    /// @brief In-memory raster.
    class PixelRaster final : public ImageRaster
    {
    public:
        /// @param pixels Row-major, width × height entries.
        /// @throws core::InvalidArgument if the size does not match or is zero.
        PixelRaster(u32 width, u32 height, std::vector<Vec4f> pixels);

        /// @brief Raster of one uniform color.
        [[nodiscard]] static TextureHandle filled(u32 width, u32 height, const Vec4f& color);

        /// @brief 1×1 fully transparent raster: an "invisible" texture.
        [[nodiscard]] static TextureHandle clear();

        [[nodiscard]] u32 width() const override { return m_width; }
        [[nodiscard]] u32 height() const override { return m_height; }
        [[nodiscard]] Vec4f pixel(u32 x, u32 y) const override;

    private:
        u32 m_width;
        u32 m_height;
        std::vector<Vec4f> m_pixels;
    };

    /// @brief Bilinear sample of the red channel with wrap-around at the edges.
    /// @param uv Texture coordinates; each component is wrapped into [0, 1).
    [[nodiscard]] f32 sample_red(const ImageRaster& raster, const Vec2f& uv);

    /// @brief Image service: loads textures by asset path.
    class TextureSource
    {
    public:
        virtual ~TextureSource() = default;

        /// @return The raster, or nullptr if the path is unknown.
        [[nodiscard]] virtual TextureHandle load(std::string_view path) = 0;
    };

} // namespace zenith::sky
