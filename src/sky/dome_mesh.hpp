#pragma once

/// @file dome_mesh.hpp
/// @brief Hemispherical dome mesh and its azimuthal-equidistant UV projection.

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace zenith::sky
{
    /// @brief Parameters that fully define a dome mesh.
    struct DomeMeshConfig
    {
        u32 rim_samples = 60;           ///< Samples around the rim (>= 3)
        u32 quadrant_samples = 16;      ///< Samples from rim to top, inclusive (>= 2)
        Vec2f top_uv{sky_constants::kTopU, sky_constants::kTopV};   ///< UV of the top, in [0,1]^2
        f32 uv_scale = sky_constants::kUvScale;   ///< UV distance per quarter turn, in (0, 0.5)
        bool inward_facing = true;      ///< Normals point toward the center
        f32 vertical_angle = sky_constants::kHalfPi;   ///< Angle from top to rim, in (0, π)
    };

    /// @brief Immutable dome mesh.
    ///
    /// A texture point at UV distance d from the top UV maps to the direction
    /// whose angle from the zenith is (π/2)·d/uv_scale, with the azimuth giving
    /// the direction of the UV offset: +X (north) → +U, +Z (east) → -V.
    ///
    /// Vertex layout: (quadrant_samples - 1) rings of rim_samples vertices,
    /// starting at the rim, followed by the single top vertex.
    class DomeMesh
    {
    public:
        /// @brief Build vertex, texture-coordinate, normal and index buffers.
        /// @throws core::InvalidArgument for any parameter out of range.
        explicit DomeMesh(const DomeMeshConfig& config = {});

        /// @brief Same mesh with a different vertical angle, built from scratch.
        [[nodiscard]] DomeMesh with_vertical_angle(f32 vertical_angle) const;

        /// @brief Texture coordinates of a direction.
        /// @param direction Unit vector in mesh space.
        /// @return std::nullopt if the direction falls outside the texture.
        [[nodiscard]] std::optional<Vec2f> direction_uv(const Vec3f& direction) const;

        /// @brief Elevation angle of a texture point (inverse of direction_uv).
        /// @param uv Texture coordinates, each in [0, 1].
        /// @return Radians above the horizon, at most π/2.
        [[nodiscard]] f32 elevation_angle(const Vec2f& uv) const;

        [[nodiscard]] const DomeMeshConfig& config() const { return m_config; }
        [[nodiscard]] const std::vector<Vec3f>& positions() const { return m_positions; }
        [[nodiscard]] const std::vector<Vec2f>& tex_coords() const { return m_tex_coords; }
        [[nodiscard]] const std::vector<Vec3f>& normals() const { return m_normals; }
        [[nodiscard]] const std::vector<u16>& indices() const { return m_indices; }

        [[nodiscard]] u32 vertex_count() const { return static_cast<u32>(m_positions.size()); }
        [[nodiscard]] u32 triangle_count() const { return static_cast<u32>(m_indices.size() / 3); }

        /// @brief Counts implied by the sample densities.
        [[nodiscard]] static u32 vertex_count(u32 rim_samples, u32 quadrant_samples);
        [[nodiscard]] static u32 triangle_count(u32 rim_samples, u32 quadrant_samples);

    private:
        /// Unchecked forward projection (no bounds check on the result).
        [[nodiscard]] Vec2f project(const Vec3f& direction) const;

        void build_coordinates();
        void build_indices();
        void build_normals();

        DomeMeshConfig m_config;
        std::vector<Vec3f> m_positions;
        std::vector<Vec2f> m_tex_coords;
        std::vector<Vec3f> m_normals;
        std::vector<u16> m_indices;
    };

} // namespace zenith::sky
