#pragma once

/// @file settings.hpp
/// @brief Tunable thresholds for frame construction and curvature inference.

#include "core/types.hpp"

namespace orbis
{
    // -----------------------------------------------------------------------
    // CurvatureSettings - reliability thresholds for CurvatureCalculator
    // -----------------------------------------------------------------------
    struct CurvatureSettings {
        f64 low_elevation_limit_deg{20.0};  ///< Sightings below this suffer refraction
        f64 deviation_warning_deg{1.0};     ///< Max B-star mismatch after alignment
        f64 substitute_distance_km{1.0};    ///< Used when the given distance is <= 0
    };

    // -----------------------------------------------------------------------
    // FrameSettings - finite differencing for FrameBuilder
    // -----------------------------------------------------------------------
    struct FrameSettings {
        f64 finite_difference_deg{0.1};     ///< Lat/long step used to find north and east
        f64 square_size_km{1.0};            ///< Size stamped on built squares
    };

} // namespace orbis
