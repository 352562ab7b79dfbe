#pragma once

/// @file star_generator.hpp
/// @brief Absolute star positions from one square's sightings, and
/// synthesized sightings for any other square.

#include "core/types.hpp"
#include "observation/star_observation.hpp"
#include "surface/surface_square.hpp"

#include <map>
#include <optional>
#include <string>

namespace orbis::astro
{
    /// @brief Per-star distance from the reference square, in the same
    /// units as square centers. Stars absent from the table are at infinity.
    using DistanceTable = std::map<std::string, f64>;

    /// @brief Homogeneous star positions keyed by name.
    ///
    /// w = 1: finite position (x, y, z).
    /// w = 0: direction at infinity (x, y, z) in the shared global frame.
    using StarPositions = std::map<std::string, Vec4d>;

    /// @brief Places stars in 3-D so that they reproduce the sightings of
    /// a reference square, then predicts how they look from elsewhere.
    ///
    /// Positions are built once at construction and never change.
    class StarGenerator
    {
    public:
        /// @param reference Square whose observations define the stars.
        /// @param distances Assumed distance for some stars; the rest are
        ///        treated as infinitely distant.
        StarGenerator(const surface::SurfaceSquare& reference, const DistanceTable& distances);

        /// @brief Sightings of every known star from @p square.
        [[nodiscard]] StarObservations synthesize(const surface::SurfaceSquare& square) const;

        /// @brief Sightings from @p square of an arbitrary position map.
        ///
        /// One observation per entry, tagged with the square's latitude
        /// and longitude, in name order.
        [[nodiscard]] static StarObservations synthesize(
            const surface::SurfaceSquare& square, const StarPositions& positions);

        /// @brief Position of one star, if it was observed at the reference.
        [[nodiscard]] std::optional<Vec4d> position(const std::string& name) const;

        [[nodiscard]] const StarPositions& positions() const { return m_positions; }

        /// @brief Number of stars placed at a finite distance.
        [[nodiscard]] std::size_t finite_count() const;

    private:
        StarPositions m_positions;
    };

} // namespace orbis::astro
