#pragma once

/// @file time_system.hpp
/// @brief Observation epochs: Unix time, Julian Date, sidereal time.

#include "core/types.hpp"

namespace orbis::astro
{
    /// @brief Civil date/time representation (UTC).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Observation sets are keyed by Unix time (seconds since
    /// 1970-01-01 00:00 UTC); sidereal time is needed to turn catalog
    /// RA/Dec into a sighting at a given longitude.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Date (Meeus, Ch. 7).
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Unix time (seconds) to Julian Date.
        [[nodiscard]] static f64 unix_to_julian_date(f64 unix_time);

        /// @brief Julian centuries elapsed since J2000.0.
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Greenwich Mean Sidereal Time (IAU 1982), radians in [0, 2π).
        [[nodiscard]] static f64 gmst(f64 jd);

        /// @brief Local Mean Sidereal Time, radians in [0, 2π).
        /// @param longitude_rad Observer longitude in radians (east positive).
        [[nodiscard]] static f64 lmst(f64 jd, f64 longitude_rad);
    };

} // namespace orbis::astro
