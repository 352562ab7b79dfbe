#pragma once
// world/world_model.hpp - A hypothetical (or real) world as a set of capabilities
//
// A world answers four questions: where a (latitude, longitude) lies in
// space, where the stars are, what the sky looks like from a place, and
// how far and in which direction one place is from another. Each answer
// comes from an independent strategy object chosen when the world is
// assembled, so a surface shape can be paired with any star layout.

#include "astro/star_generator.hpp"
#include "core/settings.hpp"
#include "core/types.hpp"
#include "observation/star_observation.hpp"
#include "surface/surface_square.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace orbis::world {

// -----------------------------------------------------------------------
// Capabilities
// -----------------------------------------------------------------------

/// Maps latitude/longitude to a 3-D point, in units of 1000 km.
/// Expected to be continuous for latitude in [-90, 90] and longitude in
/// [-180, 180].
class PointModel {
public:
    virtual ~PointModel() = default;

    virtual Vec3d point(f64 latitude, f64 longitude) const = 0;

    /// Square at (latitude, longitude) with its frame from finite differences.
    surface::SurfaceSquare square(f64 latitude, f64 longitude,
                                  FrameSettings settings = {}) const;
};

/// Homogeneous star positions (w = 0 for directions at infinity).
class StarPositionSource {
public:
    virtual ~StarPositionSource() = default;

    virtual const astro::StarPositions& positions() const = 0;
};

/// Sightings from a place at a time.
class ObservationSource {
public:
    virtual ~ObservationSource() = default;

    virtual StarObservations star_observations(f64 unix_time,
                                               f64 latitude,
                                               f64 longitude) const = 0;

    /// Sun sighting if this source knows one; used to reject sightings
    /// lost in daylight.
    virtual std::optional<StarObservation> sun_observation(f64 unix_time,
                                                           f64 latitude,
                                                           f64 longitude) const;

    /// Every star this source can report (never the Sun).
    virtual std::vector<std::string> all_stars() const = 0;
};

/// Heading and distance between two places.
class TravelSource {
public:
    virtual ~TravelSource() = default;

    virtual TravelObservation travel(f64 start_latitude, f64 start_longitude,
                                     f64 end_latitude, f64 end_longitude) const = 0;
};

// -----------------------------------------------------------------------
// WorldModel - one strategy per capability
// -----------------------------------------------------------------------
struct WorldModel {
    std::string description;
    std::shared_ptr<const PointModel> points;
    std::shared_ptr<const StarPositionSource> stars;
    std::shared_ptr<const ObservationSource> observations;
    std::shared_ptr<const TravelSource> travel;

    Vec3d model_point(f64 latitude, f64 longitude) const {
        return points->point(latitude, longitude);
    }

    surface::SurfaceSquare model_square(f64 latitude, f64 longitude) const {
        return points->square(latitude, longitude);
    }

    const astro::StarPositions& model_star_map() const { return stars->positions(); }
};

// -----------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------

/// Spherical Earth, manual sightings plus catalog synthesis, stars at infinity.
WorldModel make_real_world();

/// Spherical Earth with some stars at about one Earth radius and the
/// rest at about the Earth-Moon distance.
WorldModel make_close_stars_world();

/// Flat disc (azimuthal equidistant projection) with the close stars.
WorldModel make_azimuthal_equidistant_world();

/// Bowl-shaped surface with eight arbitrary stars A-H.
WorldModel make_bowl_world();

/// Saddle-shaped surface with the same eight stars.
WorldModel make_saddle_world();

/// Every world above, in that order.
std::vector<WorldModel> make_all_worlds();

} // namespace orbis::world
