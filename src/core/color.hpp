#pragma once

/// @file color.hpp
/// @brief RGBA color helpers on Vec4f.

#include "core/types.hpp"

#include <algorithm>

namespace zenith::color
{
    inline const Vec4f kBlack{0.0f, 0.0f, 0.0f, 1.0f};
    inline const Vec4f kWhite{1.0f, 1.0f, 1.0f, 1.0f};
    inline const Vec4f kTransparent{0.0f, 0.0f, 0.0f, 0.0f};

    /// @brief Clamp a scalar to [0, 1].
    [[nodiscard]] inline f32 clamp01(f32 value)
    {
        return std::clamp(value, 0.0f, 1.0f);
    }

    /// @brief Largest of the red, green and blue channels.
    [[nodiscard]] inline f32 max_channel(const Vec4f& color)
    {
        return std::max({color.r, color.g, color.b});
    }

    /// @brief Sum of the red, green and blue channels.
    [[nodiscard]] inline f32 rgb_sum(const Vec4f& color)
    {
        return color.r + color.g + color.b;
    }

    /// @brief Scale RGB so the brightest channel is 1. Black stays black.
    [[nodiscard]] inline Vec4f saturate(const Vec4f& color)
    {
        const f32 max = max_channel(color);
        if (max <= 0.0f) {
            return color;
        }
        return Vec4f(Vec3f(color) / max, color.a);
    }

    /// @brief Linear blend: t = 0 gives @p from, t = 1 gives @p to.
    [[nodiscard]] inline Vec4f lerp(f32 t, const Vec4f& from, const Vec4f& to)
    {
        return glm::mix(from, to, t);
    }

    /// @brief Replace the alpha channel.
    [[nodiscard]] inline Vec4f with_alpha(const Vec4f& color, f32 alpha)
    {
        return Vec4f(color.r, color.g, color.b, alpha);
    }

} // namespace zenith::color
