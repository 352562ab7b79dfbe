/// @file great_circle.cpp
/// @brief Implementation of great-circle heading and distance.

#include "astro/great_circle.hpp"

#include "astro/local_direction.hpp"

#include <algorithm>
#include <cmath>

namespace orbis::astro
{

// -----------------------------------------------------------------
// Central angle: spherical law of cosines
//
//   cos(d) = sin(φ1) sin(φ2) + cos(φ1) cos(φ2) cos(Δλ)
// -----------------------------------------------------------------

f64 GreatCircle::separation_angle_deg(
    f64 start_latitude, f64 start_longitude,
    f64 end_latitude, f64 end_longitude)
{
    const f64 phi1 = start_latitude * astro_constants::kDegToRad;
    const f64 phi2 = end_latitude * astro_constants::kDegToRad;
    const f64 delta_lambda = (end_longitude - start_longitude) * astro_constants::kDegToRad;

    const f64 cos_d = std::sin(phi1) * std::sin(phi2)
                    + std::cos(phi1) * std::cos(phi2) * std::cos(delta_lambda);

    return std::acos(std::clamp(cos_d, -1.0, 1.0)) * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Initial heading: law of cosines on the triangle (pole, start, end)
//
//   cos(H) = (sin(φ2) − sin(φ1) cos(d)) / (cos(φ1) sin(d))
//
// acos only yields [0°, 180°]; the route heads west when the end lies
// west of the start, which mirrors H to 360° − H.
// -----------------------------------------------------------------

f64 GreatCircle::heading_deg(
    f64 start_latitude, f64 start_longitude,
    f64 end_latitude, f64 end_longitude)
{
    const f64 d = separation_angle_deg(start_latitude, start_longitude,
                                       end_latitude, end_longitude)
                * astro_constants::kDegToRad;
    if (d == 0.0)
    {
        return 0.0;
    }

    const f64 phi1 = start_latitude * astro_constants::kDegToRad;
    const f64 phi2 = end_latitude * astro_constants::kDegToRad;

    // From a pole every route leaves along a single meridian.
    const f64 cos_phi1 = std::cos(phi1);
    if (std::abs(cos_phi1) < 1e-12)
    {
        return (start_latitude > 0.0) ? 180.0 : 0.0;
    }

    const f64 cos_h = (std::sin(phi2) - std::sin(phi1) * std::cos(d))
                    / (cos_phi1 * std::sin(d));
    const f64 heading = std::acos(std::clamp(cos_h, -1.0, 1.0)) * astro_constants::kRadToDeg;

    const f64 delta_longitude = normalize_longitude(end_longitude - start_longitude);
    if (delta_longitude < 0.0)
    {
        return LocalDirection::normalize_degrees(360.0 - heading);
    }
    return heading;
}

TravelObservation GreatCircle::travel_between(
    f64 start_latitude, f64 start_longitude,
    f64 end_latitude, f64 end_longitude,
    f64 radius_km)
{
    start_latitude = clamp_latitude(start_latitude);
    start_longitude = normalize_longitude(start_longitude);
    end_latitude = clamp_latitude(end_latitude);
    end_longitude = normalize_longitude(end_longitude);

    const f64 arc_deg = separation_angle_deg(start_latitude, start_longitude,
                                             end_latitude, end_longitude);

    return TravelObservation{
        .start_latitude       = start_latitude,
        .start_longitude      = start_longitude,
        .end_latitude         = end_latitude,
        .end_longitude        = end_longitude,
        .distance_km          = arc_deg * astro_constants::kDegToRad * radius_km,
        .start_to_end_heading = heading_deg(start_latitude, start_longitude,
                                            end_latitude, end_longitude),
        .end_to_start_heading = heading_deg(end_latitude, end_longitude,
                                            start_latitude, start_longitude),
    };
}

f64 GreatCircle::clamp_latitude(f64 latitude)
{
    return std::clamp(latitude, -90.0, 90.0);
}

f64 GreatCircle::normalize_longitude(f64 longitude)
{
    longitude = LocalDirection::normalize_degrees(longitude);
    return (longitude > 180.0) ? longitude - 360.0 : longitude;
}

} // namespace orbis::astro
