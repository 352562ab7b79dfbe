#pragma once

/// @file star_observation.hpp
/// @brief Single star sightings and travel measurements between two places.

#include "core/types.hpp"

#include <string>
#include <vector>

namespace orbis
{
    /// @brief One sighting of a named star from one place on the surface.
    ///
    /// All sightings in a set are assumed to be taken at the same instant.
    struct StarObservation
    {
        f64 latitude = 0.0;       ///< Observer latitude (degrees north, [-90, 90])
        f64 longitude = 0.0;      ///< Observer longitude (degrees east, [-180, 180])
        std::string name;         ///< Star name
        f64 azimuth = 0.0;        ///< Degrees east of north, [0, 360)
        f64 elevation = 0.0;      ///< Degrees above the horizon, [-90, 90]
    };

    using StarObservations = std::vector<StarObservation>;

    /// @brief Headings and distance between two labelled places, when
    /// travelling along the shortest route from start to end.
    struct TravelObservation
    {
        f64 start_latitude = 0.0;
        f64 start_longitude = 0.0;
        f64 end_latitude = 0.0;
        f64 end_longitude = 0.0;

        f64 distance_km = 0.0;           ///< Distance along the surface
        f64 start_to_end_heading = 0.0;  ///< Departure heading at the start, [0, 360)
        f64 end_to_start_heading = 0.0;  ///< Heading back to the start, measured at the end
    };

} // namespace orbis
