/// @file local_direction.cpp
/// @brief Implementation of local direction ⇄ azimuth/elevation conversion.

#include "astro/local_direction.hpp"

#include "geometry/rotation.hpp"

#include <algorithm>
#include <cmath>

namespace orbis::astro
{

// -----------------------------------------------------------------
// (azimuth, elevation) → unit vector
//
//   x =  sin(az) × cos(el)      (east)
//   y =  sin(el)                (up)
//   z = −cos(az) × cos(el)      (north is −Z)
// -----------------------------------------------------------------

Vec3d LocalDirection::to_direction(f64 azimuth_deg, f64 elevation_deg)
{
    const f64 az = azimuth_deg * astro_constants::kDegToRad;
    const f64 el = elevation_deg * astro_constants::kDegToRad;
    const f64 horizontal = std::cos(el);

    return Vec3d{
        std::sin(az) * horizontal,
        std::sin(el),
        -std::cos(az) * horizontal,
    };
}

f64 LocalDirection::elevation_of(const Vec3d& dir)
{
    return std::asin(std::clamp(dir.y, -1.0, 1.0)) * astro_constants::kRadToDeg;
}

// -----------------------------------------------------------------
// Azimuth: x grows as azimuth grows clockwise from north, and −z
// shrinks from 1, so they play the roles of atan2's y and x.
// -----------------------------------------------------------------

f64 LocalDirection::azimuth_of(const Vec3d& dir)
{
    return normalize_degrees(std::atan2(dir.x, -dir.z) * astro_constants::kRadToDeg);
}

Vec3d LocalDirection::heading_to_vector(f64 heading_deg)
{
    return geometry::Rotation::rotate(
        nominal::kNorth,
        geometry::Rotation::about_axis(nominal::kUp, -heading_deg));
}

f64 LocalDirection::normalize_degrees(f64 angle_deg)
{
    angle_deg = std::fmod(angle_deg, 360.0);
    if (angle_deg < 0.0)
    {
        angle_deg += 360.0;
    }
    // fmod of a tiny negative number can round up to exactly 360
    if (angle_deg >= 360.0)
    {
        angle_deg -= 360.0;
    }
    return angle_deg;
}

} // namespace orbis::astro
