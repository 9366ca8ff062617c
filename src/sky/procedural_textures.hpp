#pragma once

/// @file procedural_textures.hpp
/// @brief Texture source that synthesizes the default sky textures.

#include "core/types.hpp"
#include "sky/image_raster.hpp"

#include <map>
#include <string>
#include <string_view>

namespace zenith::sky
{
    /// @brief Image service generating rasters from their asset paths.
    ///
    /// Recognized paths (by keyword): cloud alpha maps ("clouds"), the sun
    /// ("sun"), lunar phases ("moon/<phase>"), star maps ("star-maps") and
    /// the horizon haze ramp ("haze"). Output is deterministic for a seed
    /// and cached per path. Unknown paths yield nullptr.
    class ProceduralTextureSource final : public TextureSource
    {
    public:
        explicit ProceduralTextureSource(u64 seed = 1, u32 size = 64);

        [[nodiscard]] TextureHandle load(std::string_view path) override;

        /// @brief Tileable value noise in [0, 1], written to every channel.
        [[nodiscard]] TextureHandle make_clouds(u64 seed) const;

        /// @brief White disc of kDiscDiameter with a soft glow.
        [[nodiscard]] TextureHandle make_sun() const;

        /// @brief Moon disc filling the texture, lit for a longitude difference.
        [[nodiscard]] TextureHandle make_moon(f32 longitude_difference) const;

        [[nodiscard]] TextureHandle make_stars(u64 seed) const;
        [[nodiscard]] TextureHandle make_haze() const;

    private:
        u64 m_seed;
        u32 m_size;
        std::map<std::string, TextureHandle, std::less<>> m_cache;
    };

} // namespace zenith::sky
