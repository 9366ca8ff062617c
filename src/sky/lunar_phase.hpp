#pragma once

/// @file lunar_phase.hpp
/// @brief Named phases of the moon and the moon's illuminated fraction.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace zenith::sky
{
    /// @brief Preset phases, plus Custom for a caller-supplied phase angle.
    enum class LunarPhase
    {
        Full,
        WaningCrescent,
        WaningGibbous,
        WaxingCrescent,
        WaxingGibbous,
        Custom,
    };

    /// @brief The five phases with fixed geometry, in slot order.
    inline constexpr std::array<LunarPhase, 5> kPresetPhases = {
        LunarPhase::Full,
        LunarPhase::WaningCrescent,
        LunarPhase::WaningGibbous,
        LunarPhase::WaxingCrescent,
        LunarPhase::WaxingGibbous,
    };

    /// @brief Static helpers for LunarPhase.
    class LunarPhases
    {
    public:
        LunarPhases() = delete;

        /// @brief "full", "waning-crescent", ... , "custom".
        [[nodiscard]] static std::string_view describe(LunarPhase phase);

        /// @brief Inverse of describe(); std::nullopt for unknown text.
        [[nodiscard]] static std::optional<LunarPhase> from_description(std::string_view text);

        /// @brief Celestial longitude of the moon minus that of the sun (radians).
        /// @throws core::InvalidArgument for LunarPhase::Custom.
        [[nodiscard]] static f32 longitude_difference(LunarPhase phase);

        /// @brief Asset path of the phase's color map.
        /// @throws core::InvalidArgument for LunarPhase::Custom.
        [[nodiscard]] static std::string image_path(LunarPhase phase);

        /// @brief Position of a preset in kPresetPhases.
        /// @throws core::InvalidArgument for LunarPhase::Custom.
        [[nodiscard]] static u32 preset_index(LunarPhase phase);

        /// @brief Illuminated fraction seen from earth, in [0, 1].
        /// @param longitude_difference Moon minus sun longitude, radians.
        /// @param lunar_latitude Moon's ecliptic latitude, radians.
        [[nodiscard]] static f32 illumination(f32 longitude_difference, f32 lunar_latitude);
    };

} // namespace zenith::sky
