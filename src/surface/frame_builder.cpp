/// @file frame_builder.cpp
/// @brief Implementation of finite-difference local frames.

#include "surface/frame_builder.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace orbis::surface
{

using geometry::AxisAngle;
using geometry::Rotation;

namespace
{
    // East differences shorter than this fraction of the north difference
    // are treated as collapsed.
    constexpr f64 kCollapsedRatio = 1e-9;
}

FrameBuilder::FrameBuilder(PointFunction point_function, FrameSettings settings)
    : m_point_function(std::move(point_function))
    , m_settings(settings)
{
    if (!m_point_function)
    {
        throw std::invalid_argument("FrameBuilder: point function is empty");
    }
}

Vec3d FrameBuilder::point(f64 latitude, f64 longitude) const
{
    return m_point_function(latitude, longitude);
}

// -----------------------------------------------------------------
// Square at (latitude, longitude)
//
// For latitude >= 0 the step is taken toward the equator (south
// neighbour), otherwise toward the equator from the south (north
// neighbour), so the difference never crosses a pole. Longitude steps
// likewise stay on the near side of the antimeridian.
// -----------------------------------------------------------------

SurfaceSquare FrameBuilder::build_square(f64 latitude, f64 longitude) const
{
    const f64 step = m_settings.finite_difference_deg;
    const Vec3d center = point(latitude, longitude);

    Vec3d north;
    if (latitude >= 0.0)
    {
        north = center - point(latitude - step, longitude);
    }
    else
    {
        north = point(latitude + step, longitude) - center;
    }

    auto east_difference = [&](f64 lat)
    {
        if (longitude >= 0.0)
        {
            return point(lat, longitude) - point(lat, longitude - step);
        }
        return point(lat, longitude + step) - point(lat, longitude);
    };

    Vec3d east_raw = east_difference(latitude);

    // At a pole every longitude maps to the same point, so the east
    // difference collapses; read east one step along the meridian instead.
    if (glm::length(east_raw) <= kCollapsedRatio * glm::length(north))
    {
        east_raw = east_difference(latitude >= 0.0 ? latitude - step : latitude + step);
    }

    north = Rotation::safe_normalize(north);
    Vec3d east = Rotation::safe_normalize(east_raw);

    // Re-orthogonalize: up from the raw east, then east from north and up
    const Vec3d up = Rotation::safe_normalize(glm::cross(east, north));
    east = glm::cross(north, up);

    const AxisAngle rotation = rotation_from_nominal(north, east);

    SurfaceSquare square;
    square.center                = center;
    square.north                 = north;
    square.up                    = up;
    square.size_km               = m_settings.square_size_km;
    square.latitude              = latitude;
    square.longitude             = longitude;
    square.rotation_from_base    = rotation;
    square.rotation_from_nominal = rotation;
    return square;
}

// -----------------------------------------------------------------
// Nominal frame → (north, east)
//
//   rot1: nominal north (0,0,-1) → north
//   rot2: rot1(nominal east) → east, about north (both are ⊥ north)
//   result = rot1 then rot2
// -----------------------------------------------------------------

AxisAngle FrameBuilder::rotation_from_nominal(const Vec3d& north, const Vec3d& east)
{
    const AxisAngle rot1 = Rotation::rotation_to_become(nominal::kNorth, north);
    const Vec3d rot1_east = Rotation::rotate(nominal::kEast, rot1);

    // Signed angle about north; handles the 180° case where the
    // cross product alone cannot give an axis.
    const f64 angle2 = std::atan2(glm::dot(glm::cross(rot1_east, east), north),
                                  glm::dot(rot1_east, east))
                     * astro_constants::kRadToDeg;
    const AxisAngle rot2 = Rotation::about_axis(north, angle2);

    return Rotation::compose(rot1, rot2);
}

} // namespace orbis::surface
