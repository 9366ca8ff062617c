#pragma once

/// @file time_and_place.hpp
/// @brief Observer time/location state and ecliptic → equatorial → world transforms.

#include "core/types.hpp"

#include <string>

namespace zenith::astro
{
    /// @brief Orientations of the two star domes (see TimeAndPlace::orient_star_domes).
    struct StarDomeOrientation
    {
        Quatd north;
        Quatd south;
    };

    /// @brief Simplified earth-sun model for a believable sky.
    ///
    /// World axes: +X north, +Y up (zenith), +Z east.
    /// Equatorial axes: +X March equinox, +Z north celestial pole.
    /// Ecliptic axes: +X March equinox, +Z north ecliptic pole.
    ///
    /// The sun moves along the ecliptic at a fixed longitude for the day, and
    /// the hour is local solar time, so the sun always culminates at 12:00.
    /// All angles are in radians; setters reject out-of-range values.
    class TimeAndPlace
    {
    public:
        TimeAndPlace() = default;

        // -----------------------------------------------------------------
        // State
        // -----------------------------------------------------------------

        /// @brief Local solar time in hours since midnight, in [0, 24].
        void set_hour(f64 hour);

        /// @brief Observer latitude, radians north of the equator, in [-π/2, π/2].
        void set_observer_latitude(f64 latitude);

        /// @brief Solar celestial longitude, radians east of the March equinox, in [0, 2π].
        void set_solar_longitude(f64 longitude);

        /// @brief Approximate the solar longitude from a calendar date.
        /// @param month 1-based month, in [1, 12].
        /// @param day Day of the month, in [1, length of month in a leap year].
        void set_solar_longitude(i32 month, i32 day);

        [[nodiscard]] f64 hour() const { return m_hour; }
        [[nodiscard]] f64 observer_latitude() const { return m_observer_latitude; }
        [[nodiscard]] f64 solar_longitude() const { return m_solar_longitude; }

        /// @brief Cached right ascension of the sun, in hours [0, 24).
        ///
        /// Measured westward from the March equinox, which is the sense in
        /// which it enters the sidereal hour below.
        [[nodiscard]] f64 solar_ra_hours() const { return m_solar_ra_hours; }

        /// @brief Sidereal time in hours, in [0, 24).
        [[nodiscard]] f64 sidereal_hour() const;

        /// @brief Sidereal angle in radians, in [0, 2π).
        [[nodiscard]] f64 sidereal_angle() const;

        // -----------------------------------------------------------------
        // Coordinate transforms
        // -----------------------------------------------------------------

        /// @brief Ecliptic latitude/longitude → unit equatorial vector.
        [[nodiscard]] static Vec3d convert_to_equatorial(f64 latitude, f64 longitude);

        /// @brief Ecliptic vector → equatorial vector (rotation by the obliquity about +X).
        [[nodiscard]] static Vec3d convert_to_equatorial(const Vec3d& ecliptic);

        /// @brief Ecliptic latitude/longitude → unit world direction.
        [[nodiscard]] Vec3d convert_to_world(f64 latitude, f64 longitude) const;

        /// @brief Equatorial vector → world vector for the current time and place.
        [[nodiscard]] Vec3d convert_to_world(const Vec3d& equatorial) const;

        /// @brief World direction of the sun.
        [[nodiscard]] Vec3d sun_direction() const;

        // -----------------------------------------------------------------
        // Star orientation
        // -----------------------------------------------------------------

        /// @brief Orientations of the north and south star domes, whose local
        /// +Y axes point to the celestial poles.
        [[nodiscard]] StarDomeOrientation orient_star_domes() const;

        /// @brief One-line summary for logging.
        [[nodiscard]] std::string describe() const;

        /// @brief Day of year (1-based) of a date in a leap year.
        [[nodiscard]] static i32 day_of_year(i32 month, i32 day);

    private:
        f64 m_hour = 0.0;
        f64 m_observer_latitude = astro_constants::kDefaultLatitude;
        f64 m_solar_longitude = 0.0;
        f64 m_solar_ra_hours = 0.0;
    };

} // namespace zenith::astro
