#pragma once

/// @file scene_attachment.hpp
/// @brief Description of the generated sky geometry and the host-scene hook.

#include "core/types.hpp"
#include "sky/image_raster.hpp"

#include <string>
#include <vector>

namespace zenith::sky
{
    class DomeMesh;
    class SkyMaterial;

    /// @brief One dome of the sky sub-tree.
    struct SkyGeometry
    {
        std::string name;
        const DomeMesh* mesh = nullptr;
        const SkyMaterial* material = nullptr;  ///< Null for plain-color or star domes
        TextureHandle color_map;                ///< Star domes only
        Vec3f local_scale{1.0f};
        Vec3f local_translation{0.0f};
        glm::quat local_rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    /// @brief Geometry the sky adds to a scene, back to front.
    struct SkySubtree
    {
        std::vector<SkyGeometry> geometries;
    };

    /// @brief Host scene capability used when the sky is enabled or disabled.
    class SceneAttachment
    {
    public:
        virtual ~SceneAttachment() = default;

        /// @brief Add the sky geometry under the host's sky node.
        virtual void attach(const SkySubtree& subtree) = 0;

        /// @brief Remove whatever attach() added.
        virtual void detach() = 0;

        /// @brief Scale the attached geometry to lie within the view frustum.
        virtual void fit_to_frustum() = 0;
    };

} // namespace zenith::sky
