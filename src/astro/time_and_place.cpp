/// @file time_and_place.cpp
/// @brief Implementation of the simplified earth-sun model.

#include "astro/time_and_place.hpp"

#include "core/validate.hpp"

#include <spdlog/fmt/fmt.h>

#include <array>
#include <cmath>

namespace zenith::astro
{

using core::Validate;

namespace
{

const Vec3d kXAxis{1.0, 0.0, 0.0};
const Vec3d kYAxis{0.0, 1.0, 0.0};
const Vec3d kZAxis{0.0, 0.0, 1.0};

constexpr std::array<i32, 12> kDaysInMonth = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

// Day of year of the March equinox, and the length of the leap year.
constexpr f64 kEquinoxDay = 80.0;
constexpr f64 kDaysPerYear = 366.0;

/// Floored modulo: result in [0, modulus).
f64 modulo(f64 value, f64 modulus)
{
    f64 result = std::fmod(value, modulus);
    if (result < 0.0) {
        result += modulus;
    }
    if (result >= modulus) {
        result = 0.0;
    }
    return result;
}

} // namespace

// -----------------------------------------------------------------
// State
// -----------------------------------------------------------------

void TimeAndPlace::set_hour(f64 hour)
{
    Validate::in_range(hour, "hour", 0.0, astro_constants::kHoursPerDay);
    m_hour = hour;
}

void TimeAndPlace::set_observer_latitude(f64 latitude)
{
    Validate::in_range(latitude, "latitude", -astro_constants::kHalfPi, astro_constants::kHalfPi);
    m_observer_latitude = latitude;
}

// -----------------------------------------------------------------
// The sun's right ascension follows from its equatorial direction:
//   eq = R_x(ε) · (cos λ, sin λ, 0)
//   ra = -atan2(eq.y, eq.x), converted to hours in [0, 24)
// -----------------------------------------------------------------

void TimeAndPlace::set_solar_longitude(f64 longitude)
{
    Validate::in_range(longitude, "longitude", 0.0, astro_constants::kTwoPi);

    const Vec3d equatorial = convert_to_equatorial(0.0, longitude);
    const f64 ra = -std::atan2(equatorial.y, equatorial.x);

    m_solar_longitude = longitude;
    m_solar_ra_hours = modulo(ra / astro_constants::kRadiansPerHour, astro_constants::kHoursPerDay);
}

void TimeAndPlace::set_solar_longitude(i32 month, i32 day)
{
    const i32 day_number = day_of_year(month, day);
    const f64 longitude = modulo(
        astro_constants::kTwoPi * (static_cast<f64>(day_number) - kEquinoxDay) / kDaysPerYear,
        astro_constants::kTwoPi);

    set_solar_longitude(longitude);
}

i32 TimeAndPlace::day_of_year(i32 month, i32 day)
{
    Validate::index_in_range(month, "month", 1, 12);
    const auto month_index = static_cast<std::size_t>(month - 1);
    Validate::index_in_range(day, "day", 1, kDaysInMonth[month_index]);

    i32 result = day;
    for (std::size_t i = 0; i < month_index; ++i) {
        result += kDaysInMonth[i];
    }
    return result;
}

// -----------------------------------------------------------------
// Sidereal time
//
// The sun culminates at local solar noon, so
//   sidereal hour = (hour - 12 - solar RA hours) mod 24
// -----------------------------------------------------------------

f64 TimeAndPlace::sidereal_hour() const
{
    return modulo(m_hour - 12.0 - m_solar_ra_hours, astro_constants::kHoursPerDay);
}

f64 TimeAndPlace::sidereal_angle() const
{
    return modulo(sidereal_hour() * astro_constants::kRadiansPerHour, astro_constants::kTwoPi);
}

// -----------------------------------------------------------------
// Coordinate transforms
// -----------------------------------------------------------------

Vec3d TimeAndPlace::convert_to_equatorial(f64 latitude, f64 longitude)
{
    Validate::in_range(latitude, "latitude", -astro_constants::kHalfPi, astro_constants::kHalfPi);
    Validate::in_range(longitude, "longitude", 0.0, astro_constants::kTwoPi);

    const f64 cos_lat = std::cos(latitude);
    const Vec3d ecliptic{
        cos_lat * std::cos(longitude),
        cos_lat * std::sin(longitude),
        std::sin(latitude),
    };
    return convert_to_equatorial(ecliptic);
}

Vec3d TimeAndPlace::convert_to_equatorial(const Vec3d& ecliptic)
{
    const Quatd rotation = glm::angleAxis(astro_constants::kObliquity, kXAxis);
    return rotation * ecliptic;
}

Vec3d TimeAndPlace::convert_to_world(f64 latitude, f64 longitude) const
{
    const Vec3d equatorial = convert_to_equatorial(latitude, longitude);
    return convert_to_world(equatorial);
}

// -----------------------------------------------------------------
// Equatorial → world
//
//   1. rotate by -(sidereal angle) about the polar (+Z) axis
//   2. rotate by (latitude - π/2) about the east (+Y) axis
//   3. permute: world = (-x, z, y)  → (north, up, east)
// -----------------------------------------------------------------

Vec3d TimeAndPlace::convert_to_world(const Vec3d& equatorial) const
{
    const Quatd z_rotation = glm::angleAxis(-sidereal_angle(), kZAxis);
    const f64 co_latitude = astro_constants::kHalfPi - m_observer_latitude;
    const Quatd y_rotation = glm::angleAxis(-co_latitude, kYAxis);

    const Vec3d rotated = y_rotation * (z_rotation * equatorial);
    return Vec3d{-rotated.x, rotated.z, rotated.y};
}

Vec3d TimeAndPlace::sun_direction() const
{
    return convert_to_world(0.0, m_solar_longitude);
}

// -----------------------------------------------------------------
// Star orientation
// -----------------------------------------------------------------

StarDomeOrientation TimeAndPlace::orient_star_domes() const
{
    const f64 sidereal = sidereal_angle();
    const f64 co_latitude = astro_constants::kHalfPi - m_observer_latitude;

    const Quatd north = glm::angleAxis(-co_latitude, kZAxis) * glm::angleAxis(-sidereal, kYAxis);
    const Quatd south = glm::angleAxis(astro_constants::kHalfPi + m_observer_latitude, kZAxis)
                      * glm::angleAxis(sidereal, kYAxis);

    return StarDomeOrientation{
        .north = north,
        .south = south,
    };
}

std::string TimeAndPlace::describe() const
{
    return fmt::format("hour={:.3f} latitude={:.2f}deg solar_longitude={:.2f}deg sidereal_hour={:.3f}",
                       m_hour,
                       m_observer_latitude * astro_constants::kRadToDeg,
                       m_solar_longitude * astro_constants::kRadToDeg,
                       sidereal_hour());
}

} // namespace zenith::astro
