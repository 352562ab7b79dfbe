#pragma once

/// @file great_circle.hpp
/// @brief Heading and distance between latitude/longitude pairs on a sphere.

#include "core/types.hpp"
#include "observation/star_observation.hpp"

namespace orbis::astro
{
    /// @brief Static utility class for great-circle travel on a sphere.
    ///
    /// Used when a caller only knows geographic coordinates of two
    /// places and needs the heading/distance inputs of the curvature
    /// calculation. All angles are in degrees.
    class GreatCircle
    {
    public:
        GreatCircle() = delete;

        /// @brief Central angle between two places (spherical law of cosines).
        [[nodiscard]] static f64 separation_angle_deg(
            f64 start_latitude, f64 start_longitude,
            f64 end_latitude, f64 end_longitude);

        /// @brief Initial heading (degrees east of north, [0, 360)) of the
        /// shortest route from start to end. Coincident points give 0.
        [[nodiscard]] static f64 heading_deg(
            f64 start_latitude, f64 start_longitude,
            f64 end_latitude, f64 end_longitude);

        /// @brief Full travel observation on a sphere of the given radius.
        [[nodiscard]] static TravelObservation travel_between(
            f64 start_latitude, f64 start_longitude,
            f64 end_latitude, f64 end_longitude,
            f64 radius_km = astro_constants::kEarthRadiusKm);

        /// @brief Clamp latitude into [-90, 90].
        [[nodiscard]] static f64 clamp_latitude(f64 latitude);

        /// @brief Wrap longitude into (-180, 180].
        [[nodiscard]] static f64 normalize_longitude(f64 longitude);
    };

} // namespace orbis::astro
