/// @file star_generator.cpp
/// @brief Implementation of star placement and sighting synthesis.

#include "astro/star_generator.hpp"

#include "astro/local_direction.hpp"
#include "core/logger.hpp"
#include "geometry/rotation.hpp"

#include <algorithm>

namespace orbis::astro
{

using geometry::Rotation;

// -----------------------------------------------------------------
// Placement
//
//   local  = toDirection(az, el) [* distance]
//   global = rotate(local, reference.rotation_from_nominal) [+ center]
// -----------------------------------------------------------------

StarGenerator::StarGenerator(const surface::SurfaceSquare& reference,
                             const DistanceTable& distances)
{
    for (const auto& [name, obs] : reference.star_observations)
    {
        const Vec3d local = LocalDirection::to_direction(obs.azimuth, obs.elevation);

        const auto it = distances.find(name);
        if (it == distances.end())
        {
            const Vec3d global = Rotation::rotate(local, reference.rotation_from_nominal);
            m_positions[name] = Vec4d(global, 0.0);
            continue;
        }

        const Vec3d global = Rotation::rotate(local * it->second, reference.rotation_from_nominal)
                           + reference.center;
        m_positions[name] = Vec4d(global, 1.0);
    }

    const std::size_t finite = finite_count();
    ORB_CORE_INFO("StarGenerator: placed {} stars ({} finite, {} at infinity) from {:.1f}, {:.1f}",
                  m_positions.size(), finite, m_positions.size() - finite,
                  reference.latitude, reference.longitude);
}

StarObservations StarGenerator::synthesize(const surface::SurfaceSquare& square) const
{
    return synthesize(square, m_positions);
}

// -----------------------------------------------------------------
// Synthesis: global vector to the star, undo the square's
// orientation, read off azimuth and elevation.
// -----------------------------------------------------------------

StarObservations StarGenerator::synthesize(const surface::SurfaceSquare& square,
                                           const StarPositions& positions)
{
    const geometry::AxisAngle to_local = Rotation::inverse(square.rotation_from_nominal);

    StarObservations result;
    result.reserve(positions.size());

    for (const auto& [name, pos] : positions)
    {
        Vec3d to_star(pos);
        if (pos.w != 0.0)
        {
            to_star -= square.center;
        }

        const Vec3d dir = Rotation::safe_normalize(Rotation::rotate(to_star, to_local));

        result.push_back(StarObservation{
            .latitude  = square.latitude,
            .longitude = square.longitude,
            .name      = name,
            .azimuth   = LocalDirection::azimuth_of(dir),
            .elevation = LocalDirection::elevation_of(dir),
        });
    }

    return result;
}

std::optional<Vec4d> StarGenerator::position(const std::string& name) const
{
    const auto it = m_positions.find(name);
    if (it == m_positions.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::size_t StarGenerator::finite_count() const
{
    return static_cast<std::size_t>(std::count_if(
        m_positions.begin(), m_positions.end(),
        [](const auto& entry) { return entry.second.w != 0.0; }));
}

} // namespace orbis::astro
