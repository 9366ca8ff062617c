#pragma once

/// @file validate.hpp
/// @brief Fail-fast argument checks that throw core::InvalidArgument.

#include "core/types.hpp"

#include <string_view>

namespace zenith::core
{
    /// @brief Static utility class for argument validation.
    ///
    /// Every check throws InvalidArgument naming the parameter; none clamp.
    class Validate
    {
    public:
        Validate() = delete;

        /// @brief Require min <= value <= max (NaN is rejected).
        static void in_range(f64 value, std::string_view name, f64 min, f64 max);

        /// @brief Require min < value < max (NaN is rejected).
        static void in_open_range(f64 value, std::string_view name, f64 min, f64 max);

        /// @brief Require min <= value < max (NaN is rejected).
        static void in_half_open_range(f64 value, std::string_view name, f64 min, f64 max);

        static void positive(f64 value, std::string_view name);
        static void non_negative(f64 value, std::string_view name);

        /// @brief Require value in [0, 1].
        static void fraction(f64 value, std::string_view name);

        /// @brief Require min <= value <= max for counts and indices.
        static void index_in_range(i32 value, std::string_view name, i32 min, i32 max);

        /// @brief Require a finite vector of length 1 (within a float tolerance).
        static void unit_vector(const Vec3f& value, std::string_view name);
        static void unit_vector(const Vec3d& value, std::string_view name);

        /// @brief Require a vector that is not (0, 0).
        static void non_zero(const Vec2f& value, std::string_view name);

        /// @brief Require both components of a texture coordinate in [0, 1].
        static void uv(const Vec2f& value, std::string_view name);
    };

} // namespace zenith::core
