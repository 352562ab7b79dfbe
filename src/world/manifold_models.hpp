#pragma once
// world/manifold_models.hpp - Surfaces and star layouts for hypothetical worlds
//
// Sightings and travel on these worlds are synthesized from geometry:
// a point model gives each place a local frame, and a star layout gives
// the positions the sky is computed from.

#include "astro/star_generator.hpp"
#include "observation/reference_observations.hpp"
#include "world/world_model.hpp"

#include <memory>
#include <utility>

namespace orbis::world {

// -----------------------------------------------------------------------
// Point models (units of 1000 km)
// -----------------------------------------------------------------------

/// Flat disc: the azimuthal equidistant projection centered on the
/// north pole, made physical. The disc lies in the XZ plane.
class AzimuthalEquidistantModel : public PointModel {
public:
    Vec3d point(f64 latitude, f64 longitude) const override;
};

/// Disc whose rim rises: height 5 * (1 - cos(d / 2)) at polar distance d.
class BowlModel : public PointModel {
public:
    Vec3d point(f64 latitude, f64 longitude) const override;
};

/// Disc bent into a hyperbolic paraboloid: height (x^2 - z^2) / (5 R).
class SaddleModel : public PointModel {
public:
    Vec3d point(f64 latitude, f64 longitude) const override;
};

// -----------------------------------------------------------------------
// Star layouts
// -----------------------------------------------------------------------

/// A fixed, explicitly listed set of positions.
class FixedStarPositions : public StarPositionSource {
public:
    explicit FixedStarPositions(astro::StarPositions positions)
        : m_positions(std::move(positions)) {}

    const astro::StarPositions& positions() const override { return m_positions; }

private:
    astro::StarPositions m_positions;
};

/// Where a sighting set was taken.
struct ReferenceSite {
    f64 unix_time{observation::kManualDataUnixTime};
    f64 latitude{observation::kReferenceLatitude};
    f64 longitude{observation::kReferenceLongitude};
};

/// Positions placed by a StarGenerator so that they reproduce the
/// sightings of one reference site on a given surface.
class GeneratedStarPositions : public StarPositionSource {
public:
    /// @param model Surface that supplies the reference square.
    /// @param sightings Source of the reference square's observations.
    /// @param distances Per-star distance in units of 1000 km; others at infinity.
    GeneratedStarPositions(const PointModel& model,
                           const ObservationSource& sightings,
                           const astro::DistanceTable& distances,
                           ReferenceSite site = {});

    const astro::StarPositions& positions() const override { return m_generator.positions(); }

    const surface::SurfaceSquare& reference_square() const { return m_reference; }
    const astro::StarGenerator& generator() const { return m_generator; }

private:
    surface::SurfaceSquare m_reference;
    astro::StarGenerator m_generator;
};

// -----------------------------------------------------------------------
// Synthesized sightings and travel
// -----------------------------------------------------------------------

/// Sky of a surface point computed from a star layout. Time is ignored:
/// the stars of these worlds do not move.
class ManifoldObservationSource : public ObservationSource {
public:
    /// @param sun Optional source answering sun_observation().
    ManifoldObservationSource(std::shared_ptr<const PointModel> points,
                              std::shared_ptr<const StarPositionSource> stars,
                              std::shared_ptr<const ObservationSource> sun = nullptr);

    StarObservations star_observations(f64 unix_time, f64 latitude, f64 longitude) const override;
    std::optional<StarObservation> sun_observation(f64 unix_time, f64 latitude, f64 longitude) const override;
    std::vector<std::string> all_stars() const override;

private:
    std::shared_ptr<const PointModel> m_points;
    std::shared_ptr<const StarPositionSource> m_stars;
    std::shared_ptr<const ObservationSource> m_sun;
};

/// Travel along the straight chord between two square centers. Each
/// heading is the chord projected onto that square's horizontal plane.
class ManifoldTravelSource : public TravelSource {
public:
    explicit ManifoldTravelSource(std::shared_ptr<const PointModel> points)
        : m_points(std::move(points)) {}

    TravelObservation travel(f64 start_latitude, f64 start_longitude,
                             f64 end_latitude, f64 end_longitude) const override;

private:
    std::shared_ptr<const PointModel> m_points;
};

// -----------------------------------------------------------------------
// Data
// -----------------------------------------------------------------------

/// Distances (1000 km) giving four stars about one Earth radius away and
/// four about the Earth-Moon distance away.
astro::DistanceTable close_star_distances();

/// Stars A-F at finite positions and G, H at infinity, for bowl and saddle.
astro::StarPositions test_star_map();

} // namespace orbis::world
