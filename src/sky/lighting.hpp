#pragma once

/// @file lighting.hpp
/// @brief Lighting snapshot produced each frame and the sinks that consume it.

#include "core/types.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace zenith::sky
{
    /// @brief Recommended scene lighting for one frame.
    struct LightingSnapshot
    {
        Vec4f ambient_color;
        Vec4f background_color;
        Vec4f main_color;
        Vec3f main_direction;       ///< Unit vector toward the main light source
        f32 shadow_intensity = 0.0f;    ///< In [0, 1]
        f32 bloom_intensity = 0.0f;     ///< In [0, 1.7]
    };

    /// @brief Receives one snapshot per sky update.
    class LightingSink
    {
    public:
        virtual ~LightingSink() = default;
        virtual void update(const LightingSnapshot& snapshot) = 0;
    };

    /// @brief Sink that validates and keeps the latest snapshot and forwards
    /// it to registered listeners (lights, shadow renderers, viewports).
    class LightingUpdater final : public LightingSink
    {
    public:
        static constexpr f32 kMaxBloom = 1.7f;

        using Listener = std::function<void(const LightingSnapshot&)>;

        void add_listener(Listener listener);

        /// @throws core::InvalidArgument if the direction is not a unit vector
        /// or an intensity is out of range. Listeners are not called then.
        void update(const LightingSnapshot& snapshot) override;

        [[nodiscard]] const std::optional<LightingSnapshot>& latest() const { return m_latest; }
        [[nodiscard]] u32 update_count() const { return m_update_count; }

    private:
        std::vector<Listener> m_listeners;
        std::optional<LightingSnapshot> m_latest;
        u32 m_update_count = 0;
    };

} // namespace zenith::sky
