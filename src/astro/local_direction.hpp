#pragma once

/// @file local_direction.hpp
/// @brief Conversion between local horizon directions and azimuth/elevation.

#include "core/types.hpp"

namespace orbis::astro
{
    /// @brief Static utility class mapping unit vectors in a square's local
    /// frame (north = -Z, up = +Y, east = +X) to and from compass angles.
    ///
    /// All angles are in degrees. Azimuth runs clockwise from north when
    /// viewed from above, in [0, 360); elevation is in [-90, 90].
    class LocalDirection
    {
    public:
        LocalDirection() = delete;

        /// @brief Unit vector toward (azimuth, elevation).
        [[nodiscard]] static Vec3d to_direction(f64 azimuth_deg, f64 elevation_deg);

        /// @brief Elevation of a unit direction; inputs slightly longer than
        /// unit length are clamped rather than producing NaN.
        [[nodiscard]] static f64 elevation_of(const Vec3d& dir);

        /// @brief Azimuth of a direction in [0, 360). Undefined at the poles,
        /// where any value may be returned.
        [[nodiscard]] static f64 azimuth_of(const Vec3d& dir);

        /// @brief Horizontal unit vector for a travel heading (degrees east of north).
        [[nodiscard]] static Vec3d heading_to_vector(f64 heading_deg);

        /// @brief Normalize an angle to the range [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle_deg);
    };

} // namespace orbis::astro
