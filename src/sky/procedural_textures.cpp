/// @file procedural_textures.cpp
/// @brief Procedural cloud, sun, moon, star and haze rasters.

#include "sky/procedural_textures.hpp"

#include "core/color.hpp"
#include "core/pcg_rng.hpp"
#include "sky/lunar_phase.hpp"

#include <algorithm>
#include <cmath>
#include <utility>
#include <vector>

namespace zenith::sky
{

namespace
{

constexpr u32 kLattice = 8;     // Noise cells per texture side at the first octave
constexpr u32 kOctaves = 3;

bool contains(std::string_view text, std::string_view keyword)
{
    return text.find(keyword) != std::string_view::npos;
}

f32 smooth(f32 t)
{
    return t * t * (3.0f - 2.0f * t);
}

/// Path component between the last '/' and the extension.
std::string_view stem(std::string_view path)
{
    const std::size_t slash = path.find_last_of('/');
    if (slash != std::string_view::npos) {
        path.remove_prefix(slash + 1);
    }
    const std::size_t dot = path.find_last_of('.');
    if (dot != std::string_view::npos) {
        path = path.substr(0, dot);
    }
    return path;
}

u64 hash_path(std::string_view path)
{
    // FNV-1a
    u64 h = 1469598103934665603ULL;
    for (const char c : path) {
        h ^= static_cast<u8>(c);
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace

ProceduralTextureSource::ProceduralTextureSource(u64 seed, u32 size)
    : m_seed(seed)
    , m_size(std::max<u32>(size, 8))
{
}

TextureHandle ProceduralTextureSource::load(std::string_view path)
{
    if (const auto it = m_cache.find(path); it != m_cache.end()) {
        return it->second;
    }

    TextureHandle texture;
    if (contains(path, "moon/")) {
        if (const auto phase = LunarPhases::from_description(stem(path));
            phase && *phase != LunarPhase::Custom) {
            texture = make_moon(LunarPhases::longitude_difference(*phase));
        }
    } else if (contains(path, "Clouds") || contains(path, "clouds")) {
        texture = make_clouds(m_seed ^ hash_path(path));
    } else if (contains(path, "Sun") || contains(path, "sun")) {
        texture = make_sun();
    } else if (contains(path, "star-maps")) {
        texture = make_stars(m_seed ^ hash_path(path));
    } else if (contains(path, "haze")) {
        texture = make_haze();
    }

    if (texture) {
        m_cache.emplace(std::string(path), texture);
    }
    return texture;
}

// -----------------------------------------------------------------
// Clouds: sum of wrapped value-noise octaves, contrast-stretched
// -----------------------------------------------------------------

TextureHandle ProceduralTextureSource::make_clouds(u64 seed) const
{
    core::PcgRng rng(seed);

    std::vector<f32> density(static_cast<std::size_t>(m_size) * m_size, 0.0f);
    f32 amplitude = 0.5f;
    u32 cells = kLattice;

    for (u32 octave = 0; octave < kOctaves; ++octave) {
        std::vector<f32> lattice(static_cast<std::size_t>(cells) * cells);
        for (f32& value : lattice) {
            value = rng.next_unit();
        }
        auto at = [&](u32 i, u32 j) { return lattice[(j % cells) * cells + (i % cells)]; };

        for (u32 y = 0; y < m_size; ++y) {
            for (u32 x = 0; x < m_size; ++x) {
                const f32 gx = static_cast<f32>(x) * static_cast<f32>(cells) / static_cast<f32>(m_size);
                const f32 gy = static_cast<f32>(y) * static_cast<f32>(cells) / static_cast<f32>(m_size);
                const auto i = static_cast<u32>(gx);
                const auto j = static_cast<u32>(gy);
                const f32 fx = smooth(gx - static_cast<f32>(i));
                const f32 fy = smooth(gy - static_cast<f32>(j));

                const f32 bottom = glm::mix(at(i, j), at(i + 1, j), fx);
                const f32 top = glm::mix(at(i, j + 1), at(i + 1, j + 1), fx);
                density[static_cast<std::size_t>(y) * m_size + x] += amplitude * glm::mix(bottom, top, fy);
            }
        }
        amplitude *= 0.5f;
        cells *= 2;
    }

    std::vector<Vec4f> pixels;
    pixels.reserve(density.size());
    for (const f32 d : density) {
        // Thin out the low end so clear patches appear between clouds.
        const f32 alpha = color::clamp01((d - 0.35f) * 2.5f);
        pixels.emplace_back(alpha, alpha, alpha, alpha);
    }
    return std::make_shared<const PixelRaster>(m_size, m_size, std::move(pixels));
}

TextureHandle ProceduralTextureSource::make_sun() const
{
    const f32 radius = 0.5f * sky_constants::kDiscDiameter;
    std::vector<Vec4f> pixels;
    pixels.reserve(static_cast<std::size_t>(m_size) * m_size);

    for (u32 y = 0; y < m_size; ++y) {
        for (u32 x = 0; x < m_size; ++x) {
            const Vec2f p{(static_cast<f32>(x) + 0.5f) / static_cast<f32>(m_size) - 0.5f,
                          (static_cast<f32>(y) + 0.5f) / static_cast<f32>(m_size) - 0.5f};
            const f32 r = glm::length(p);
            f32 alpha = 1.0f;
            if (r > radius) {
                alpha = color::clamp01(1.0f - (r - radius) / radius) * 0.5f;
            }
            pixels.emplace_back(1.0f, 1.0f, 1.0f, alpha);
        }
    }
    return std::make_shared<const PixelRaster>(m_size, m_size, std::move(pixels));
}

// -----------------------------------------------------------------
// Moon: a sphere seen from earth, lit from L = (sin Δ, 0, -cos Δ)
// in disc space (+x right, +z toward the viewer)
// -----------------------------------------------------------------

TextureHandle ProceduralTextureSource::make_moon(f32 longitude_difference) const
{
    const Vec3f light{std::sin(longitude_difference), 0.0f, -std::cos(longitude_difference)};
    std::vector<Vec4f> pixels;
    pixels.reserve(static_cast<std::size_t>(m_size) * m_size);

    for (u32 y = 0; y < m_size; ++y) {
        for (u32 x = 0; x < m_size; ++x) {
            const f32 px = 2.0f * (static_cast<f32>(x) + 0.5f) / static_cast<f32>(m_size) - 1.0f;
            const f32 py = 2.0f * (static_cast<f32>(y) + 0.5f) / static_cast<f32>(m_size) - 1.0f;
            const f32 r2 = px * px + py * py;
            if (r2 > 1.0f) {
                pixels.push_back(color::kTransparent);
                continue;
            }
            const Vec3f normal{px, py, std::sqrt(1.0f - r2)};
            const f32 lit = glm::dot(normal, light) > 0.0f ? 1.0f : 0.0f;
            pixels.emplace_back(lit, lit, lit, lit);
        }
    }
    return std::make_shared<const PixelRaster>(m_size, m_size, std::move(pixels));
}

TextureHandle ProceduralTextureSource::make_stars(u64 seed) const
{
    core::PcgRng rng(seed);
    std::vector<Vec4f> pixels(static_cast<std::size_t>(m_size) * m_size, color::kBlack);

    const std::size_t count = pixels.size() / 50;
    for (std::size_t i = 0; i < count; ++i) {
        const auto index = static_cast<std::size_t>(rng.next() % pixels.size());
        const f32 brightness = rng.next_in_range(0.3f, 1.0f);
        pixels[index] = Vec4f{brightness, brightness, brightness, 1.0f};
    }
    return std::make_shared<const PixelRaster>(m_size, m_size, std::move(pixels));
}

TextureHandle ProceduralTextureSource::make_haze() const
{
    std::vector<Vec4f> pixels;
    pixels.reserve(static_cast<std::size_t>(m_size) * m_size);

    for (u32 y = 0; y < m_size; ++y) {
        // Opaque at the horizon (v = 0), clear toward the zenith.
        const f32 alpha = 1.0f - static_cast<f32>(y) / static_cast<f32>(m_size - 1);
        for (u32 x = 0; x < m_size; ++x) {
            pixels.emplace_back(alpha, alpha, alpha, alpha);
        }
    }
    return std::make_shared<const PixelRaster>(m_size, m_size, std::move(pixels));
}

} // namespace zenith::sky
