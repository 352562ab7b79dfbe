#pragma once

/// @file reference_observations.hpp
/// @brief Hand-gathered sightings used as the real-world data set.

#include "core/types.hpp"
#include "observation/star_observation.hpp"

namespace orbis::observation
{
    /// 2017-03-06 04:00 UTC (2017-03-05 20:00 -08:00).
    constexpr f64 kManualDataUnixTime = 1488772800.0;

    /// Place whose sightings define star positions in the model worlds.
    constexpr f64 kReferenceLatitude = 38.0;
    constexpr f64 kReferenceLongitude = -122.0;

    /// @brief 40 sightings of eight bright stars from 38N at 122W, 113W,
    /// 104W, 95W and 86W, all at kManualDataUnixTime. Read from a
    /// planetarium to about 0.2 degrees.
    [[nodiscard]] const StarObservations& manual_observations();

    /// @brief Manual sightings taken at exactly (latitude, longitude).
    [[nodiscard]] StarObservations manual_observations_at(f64 latitude, f64 longitude);

} // namespace orbis::observation
