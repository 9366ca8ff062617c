/// @file dome_mesh.cpp
/// @brief Dome mesh generation and UV projection.

#include "sky/dome_mesh.hpp"

#include "core/error.hpp"
#include "core/validate.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace zenith::sky
{

using core::Validate;

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

DomeMesh::DomeMesh(const DomeMeshConfig& config)
    : m_config(config)
{
    if (config.rim_samples < 3) {
        throw core::InvalidArgument("rim_samples", "should be at least 3", config.rim_samples);
    }
    if (config.quadrant_samples < 2) {
        throw core::InvalidArgument("quadrant_samples", "should be at least 2", config.quadrant_samples);
    }
    Validate::uv(config.top_uv, "top_uv");
    Validate::in_open_range(config.uv_scale, "uv_scale", 0.0, 0.5);
    Validate::in_open_range(config.vertical_angle, "vertical_angle", 0.0, sky_constants::kPi);

    const u64 vertices = static_cast<u64>(config.quadrant_samples - 1) * config.rim_samples + 1;
    if (vertices > std::numeric_limits<u16>::max()) {
        throw core::InvalidArgument("vertex count", "should fit 16-bit indices",
                                    static_cast<f64>(vertices));
    }

    build_coordinates();
    build_indices();
    build_normals();
}

DomeMesh DomeMesh::with_vertical_angle(f32 vertical_angle) const
{
    DomeMeshConfig config = m_config;
    config.vertical_angle = vertical_angle;
    return DomeMesh(config);
}

u32 DomeMesh::vertex_count(u32 rim_samples, u32 quadrant_samples)
{
    return (quadrant_samples - 1) * rim_samples + 1;
}

u32 DomeMesh::triangle_count(u32 rim_samples, u32 quadrant_samples)
{
    const u32 quads_per_gore = quadrant_samples - 2;
    return (2 * quads_per_gore + 1) * rim_samples;
}

// -----------------------------------------------------------------
// Projection
//
//   angle from top = acos(y)
//   uv distance    = uv_scale · angle / (π/2)
//   u = top_u + distance · x / |xz|
//   v = top_v - distance · z / |xz|
// -----------------------------------------------------------------

std::optional<Vec2f> DomeMesh::direction_uv(const Vec3f& direction) const
{
    Validate::unit_vector(direction, "direction");

    const f32 xz_distance = std::hypot(direction.x, direction.z);
    if (xz_distance == 0.0f) {
        // Straight up or straight down
        if (direction.y < 0.0f) {
            return std::nullopt;
        }
        return m_config.top_uv;
    }

    const Vec2f uv = project(direction);
    if (uv.x < 0.0f || uv.x > 1.0f || uv.y < 0.0f || uv.y > 1.0f) {
        return std::nullopt;
    }
    return uv;
}

f32 DomeMesh::elevation_angle(const Vec2f& uv) const
{
    Validate::uv(uv, "uv");

    const f32 uv_distance = glm::length(uv - m_config.top_uv);
    const f32 angle_from_top = uv_distance / m_config.uv_scale * sky_constants::kHalfPi;
    return sky_constants::kHalfPi - angle_from_top;
}

Vec2f DomeMesh::project(const Vec3f& direction) const
{
    const f32 y = std::clamp(direction.y, -1.0f, 1.0f);
    const f32 angle_from_top = std::acos(y);
    const f32 uv_distance = m_config.uv_scale * angle_from_top / sky_constants::kHalfPi;

    const f32 xz_distance = std::hypot(direction.x, direction.z);
    if (xz_distance == 0.0f) {
        return m_config.top_uv;
    }
    const f32 cos_longitude = direction.x / xz_distance;
    const f32 sin_longitude = direction.z / xz_distance;

    return Vec2f{
        m_config.top_uv.x + uv_distance * cos_longitude,
        m_config.top_uv.y - uv_distance * sin_longitude,
    };
}

// -----------------------------------------------------------------
// Buffers
// -----------------------------------------------------------------

void DomeMesh::build_coordinates()
{
    const u32 rim = m_config.rim_samples;
    const u32 rings = m_config.quadrant_samples - 1;
    const u32 count = vertex_count(rim, m_config.quadrant_samples);

    m_positions.reserve(count);
    m_tex_coords.reserve(count);

    const f32 quad_height = m_config.vertical_angle / static_cast<f32>(rings);
    const f32 quad_width = sky_constants::kTwoPi / static_cast<f32>(rim);
    const f32 rim_latitude = sky_constants::kHalfPi - m_config.vertical_angle;

    for (u32 parallel = 0; parallel < rings; ++parallel) {
        const f32 latitude = rim_latitude + quad_height * static_cast<f32>(parallel);
        const f32 y = std::sin(latitude);
        const f32 xz_distance = std::cos(latitude);

        for (u32 meridian = 0; meridian < rim; ++meridian) {
            const f32 longitude = quad_width * static_cast<f32>(meridian);
            const Vec3f position{
                xz_distance * std::cos(longitude),
                y,
                xz_distance * std::sin(longitude),
            };
            m_positions.push_back(position);

            // Rim points of a wide dome can land a hair outside the unit square.
            m_tex_coords.push_back(glm::clamp(project(position), 0.0f, 1.0f));
        }
    }

    m_positions.emplace_back(0.0f, 1.0f, 0.0f);
    m_tex_coords.push_back(m_config.top_uv);
}

void DomeMesh::build_indices()
{
    const u32 rim = m_config.rim_samples;
    const u32 quads_per_gore = m_config.quadrant_samples - 2;
    const bool inward = m_config.inward_facing;

    m_indices.reserve(3 * static_cast<std::size_t>(triangle_count(rim, m_config.quadrant_samples)));

    auto add_triangle = [this](u32 a, u32 b, u32 c) {
        m_indices.push_back(static_cast<u16>(a));
        m_indices.push_back(static_cast<u16>(b));
        m_indices.push_back(static_cast<u16>(c));
    };

    // Two triangles per quad between adjacent rings
    for (u32 parallel = 0; parallel < quads_per_gore; ++parallel) {
        const u32 next_parallel = parallel + 1;
        for (u32 meridian = 0; meridian < rim; ++meridian) {
            const u32 next_meridian = (meridian + 1) % rim;
            const u32 v0 = parallel * rim + meridian;
            const u32 v1 = parallel * rim + next_meridian;
            const u32 v2 = next_parallel * rim + meridian;
            const u32 v3 = next_parallel * rim + next_meridian;

            if (inward) {
                add_triangle(v0, v1, v3);
                add_triangle(v0, v3, v2);
            } else {
                add_triangle(v0, v3, v1);
                add_triangle(v0, v2, v3);
            }
        }
    }

    // Fan around the top vertex
    const u32 top = vertex_count(rim, m_config.quadrant_samples) - 1;
    const u32 last_ring = quads_per_gore;
    for (u32 meridian = 0; meridian < rim; ++meridian) {
        const u32 v0 = last_ring * rim + meridian;
        const u32 v1 = last_ring * rim + (meridian + 1) % rim;
        if (inward) {
            add_triangle(v0, v1, top);
        } else {
            add_triangle(v0, top, v1);
        }
    }
}

void DomeMesh::build_normals()
{
    m_normals.reserve(m_positions.size());
    for (const Vec3f& position : m_positions) {
        m_normals.push_back(m_config.inward_facing ? -position : position);
    }
}

} // namespace zenith::sky
