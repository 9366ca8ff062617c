#pragma once

/// @file types.hpp
/// @brief Precision aliases, glm vector types and shared sky constants.

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>

namespace zenith
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;

    // Vector types (double precision for astronomy)
    using Vec3d = glm::dvec3;
    using Quatd = glm::dquat;

    // Vector types (float for shading state and meshes)
    using Vec2f = glm::vec2;
    using Vec3f = glm::vec3;
    using Vec4f = glm::vec4;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi        = glm::pi<f64>();
        constexpr f64 kTwoPi     = 2.0 * kPi;
        constexpr f64 kHalfPi    = kPi / 2.0;
        constexpr f64 kDegToRad  = kPi / 180.0;
        constexpr f64 kRadToDeg  = 180.0 / kPi;
        constexpr f64 kHoursPerDay = 24.0;
        constexpr f64 kRadiansPerHour = kTwoPi / kHoursPerDay;
        constexpr f64 kObliquity = 23.44 * kDegToRad;   // Tilt of the ecliptic
        constexpr f64 kDefaultLatitude = 51.1788 * kDegToRad;  // Stonehenge
    }

    // Dome texture-space conventions shared by meshes and materials
    namespace sky_constants
    {
        constexpr f32 kPi      = glm::pi<f32>();
        constexpr f32 kHalfPi  = kPi / 2.0f;
        constexpr f32 kTwoPi   = 2.0f * kPi;

        constexpr f32 kTopU    = 0.5f;
        constexpr f32 kTopV    = 0.5f;
        constexpr f32 kUvScale = 0.44f;          // UV distance from top to horizon
        constexpr f32 kDiscDiameter = 0.25f;     // Disc diameter in object textures

        /// Radial stretch applied to object textures: factor = 1 + k * d^2.
        constexpr f32 kStretchCoefficient = (kHalfPi - 1.0f) / (kUvScale * kUvScale);

        /// Largest vertical angle a dome may cover (radians from the top).
        constexpr f32 kMaxVerticalAngle = 1.785f;
    }
}
