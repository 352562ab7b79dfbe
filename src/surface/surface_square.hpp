#pragma once

/// @file surface_square.hpp
/// @brief Oriented surface squares and the flat collection that owns them.

#include "core/types.hpp"
#include "geometry/rotation.hpp"
#include "observation/star_observation.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace orbis::surface
{
    using SquareId = u64;

    // -----------------------------------------------------------------------
    // SurfaceSquare - a labelled point on the surface with a local frame
    // -----------------------------------------------------------------------
    struct SurfaceSquare {
        Vec3d center{0.0};        ///< Location of the center point
        Vec3d north{nominal::kNorth};  ///< Unit local north
        Vec3d up{nominal::kUp};   ///< Unit local up (opposite the pull of gravity), ⊥ north
        f64 size_km{1.0};         ///< Side length of the square

        // Latitude and longitude are labels tying the square to the real
        // world; the geometry does not depend on them.
        f64 latitude{0.0};
        f64 longitude{0.0};

        /// Square this one was derived from. Not owning: removing the
        /// parent clears this field instead of removing the child.
        std::optional<SquareId> parent;

        /// Point the traveller passed through between the parent and
        /// this square, if known. Cleared with 'parent'.
        std::optional<Vec3d> base_midpoint;

        /// Rotation applied relative to the parent's orientation.
        geometry::AxisAngle rotation_from_base;

        /// Absolute rotation from the nominal frame (north -Z, up +Y, east +X).
        geometry::AxisAngle rotation_from_nominal;

        /// Sightings taken here, keyed by star name.
        std::map<std::string, StarObservation> star_observations;

        /// Unit local east, north × up.
        Vec3d east() const { return glm::cross(north, up); }

        /// Direction of the celestial pole implied by the latitude label:
        /// north tilted upward by the latitude.
        Vec3d celestial_north() const;

        /// Record a sighting, replacing any earlier one of the same star.
        void add_observation(const StarObservation& obs);

        /// Sightings in name order.
        StarObservations observations() const;
    };

    // -----------------------------------------------------------------------
    // SurfaceSquareSet - flat collection addressed by SquareId
    // -----------------------------------------------------------------------
    class SurfaceSquareSet {
    public:
        /// Add a square. Its rotation_from_nominal is recomputed from
        /// rotation_from_base and the parent, if any. A root square drops
        /// its base_midpoint.
        /// @throws std::out_of_range if the square names an unknown parent.
        SquareId add(SurfaceSquare square);

        /// Add a square reached from @p parent. Its orientation is the
        /// parent's followed by @p rotation_from_base, and its north/up
        /// are the nominal frame carried through that orientation.
        /// @throws std::out_of_range if @p parent is unknown.
        SquareId add_derived(SquareId parent,
                            const Vec3d& center,
                            const geometry::AxisAngle& rotation_from_base,
                            f64 latitude,
                            f64 longitude,
                            std::optional<Vec3d> base_midpoint = std::nullopt);

        /// Remove a square and clear the parent link of its children.
        /// @return false if @p id was not present.
        bool remove(SquareId id);

        /// Remove every square.
        void clear() { m_squares.clear(); }

        /// @throws std::out_of_range if @p id is unknown.
        const SurfaceSquare& get(SquareId id) const;
        SurfaceSquare& get(SquareId id);

        bool contains(SquareId id) const { return m_squares.count(id) != 0; }
        std::size_t size() const { return m_squares.size(); }

        /// Squares whose parent is @p id, in id order.
        std::vector<SquareId> children_of(SquareId id) const;

        /// All ids in insertion order.
        std::vector<SquareId> ids() const;

    private:
        std::map<SquareId, SurfaceSquare> m_squares;
        SquareId m_next_id = 1;
    };

} // namespace orbis::surface
