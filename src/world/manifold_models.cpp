// world/manifold_models.cpp
#include "manifold_models.hpp"

#include "astro/local_direction.hpp"
#include "geometry/rotation.hpp"

#include <cmath>

namespace orbis::world {

using astro::LocalDirection;
using geometry::Rotation;
using namespace astro_constants;

namespace {

constexpr f64 kModelRadius = kEarthRadiusKm / 1000.0;

/// Polar-distance disc shared by the flat, bowl and saddle worlds:
/// distance from the north pole in degrees maps to radius in the XZ plane.
struct DiscPoint {
    f64 polar_distance_deg;
    f64 x;
    f64 z;
};

DiscPoint discPoint(f64 latitude, f64 longitude) {
    const f64 dd = 90.0 - latitude;
    const f64 r = dd * kDegToRad * kModelRadius;
    const f64 lon = longitude * kDegToRad;
    return {dd, r * std::sin(lon), r * std::cos(lon)};
}

} // namespace

// -----------------------------------------------------------------------
// Point models
// -----------------------------------------------------------------------
Vec3d AzimuthalEquidistantModel::point(f64 latitude, f64 longitude) const {
    const DiscPoint p = discPoint(latitude, longitude);
    return {p.x, 0.0, p.z};
}

Vec3d BowlModel::point(f64 latitude, f64 longitude) const {
    const DiscPoint p = discPoint(latitude, longitude);
    const f64 y = 5.0 * (1.0 - std::cos(p.polar_distance_deg / 2.0 * kDegToRad));
    return {p.x, y, p.z};
}

Vec3d SaddleModel::point(f64 latitude, f64 longitude) const {
    const DiscPoint p = discPoint(latitude, longitude);
    const f64 y = (p.x * p.x - p.z * p.z) / (kModelRadius * 5.0);
    return {p.x, y, p.z};
}

// -----------------------------------------------------------------------
// GeneratedStarPositions
// -----------------------------------------------------------------------
namespace {

surface::SurfaceSquare buildReference(const PointModel& model,
                                      const ObservationSource& sightings,
                                      const ReferenceSite& site) {
    surface::SurfaceSquare square = model.square(site.latitude, site.longitude);
    for (const auto& obs : sightings.star_observations(site.unix_time, site.latitude, site.longitude)) {
        square.add_observation(obs);
    }
    return square;
}

} // namespace

GeneratedStarPositions::GeneratedStarPositions(const PointModel& model,
                                               const ObservationSource& sightings,
                                               const astro::DistanceTable& distances,
                                               ReferenceSite site)
    : m_reference(buildReference(model, sightings, site))
    , m_generator(m_reference, distances) {}

// -----------------------------------------------------------------------
// ManifoldObservationSource
// -----------------------------------------------------------------------
ManifoldObservationSource::ManifoldObservationSource(std::shared_ptr<const PointModel> points,
                                                     std::shared_ptr<const StarPositionSource> stars,
                                                     std::shared_ptr<const ObservationSource> sun)
    : m_points(std::move(points))
    , m_stars(std::move(stars))
    , m_sun(std::move(sun)) {}

StarObservations ManifoldObservationSource::star_observations(f64 /*unix_time*/,
                                                              f64 latitude,
                                                              f64 longitude) const {
    return astro::StarGenerator::synthesize(m_points->square(latitude, longitude),
                                            m_stars->positions());
}

std::optional<StarObservation> ManifoldObservationSource::sun_observation(f64 unix_time,
                                                                          f64 latitude,
                                                                          f64 longitude) const {
    if (!m_sun) return std::nullopt;
    return m_sun->sun_observation(unix_time, latitude, longitude);
}

std::vector<std::string> ManifoldObservationSource::all_stars() const {
    std::vector<std::string> names;
    for (const auto& [name, pos] : m_stars->positions()) names.push_back(name);
    return names;
}

// -----------------------------------------------------------------------
// ManifoldTravelSource
// -----------------------------------------------------------------------
namespace {

/// Compass heading of a global direction as seen from @p square.
f64 localHeading(const Vec3d& global, const surface::SurfaceSquare& square) {
    const Vec3d local = Rotation::rotate(global, Rotation::inverse(square.rotation_from_nominal));
    const Vec3d horizontal = Rotation::orthogonal_component(local, nominal::kUp);
    if (glm::length(horizontal) < 1e-12) return 0.0;
    return LocalDirection::azimuth_of(glm::normalize(horizontal));
}

} // namespace

TravelObservation ManifoldTravelSource::travel(f64 start_latitude, f64 start_longitude,
                                               f64 end_latitude, f64 end_longitude) const {
    const surface::SurfaceSquare start = m_points->square(start_latitude, start_longitude);
    const surface::SurfaceSquare end = m_points->square(end_latitude, end_longitude);

    const Vec3d start_to_end = end.center - start.center;

    return TravelObservation{
        .start_latitude       = start_latitude,
        .start_longitude      = start_longitude,
        .end_latitude         = end_latitude,
        .end_longitude        = end_longitude,
        .distance_km          = glm::length(start_to_end) * 1000.0,
        .start_to_end_heading = localHeading(start_to_end, start),
        .end_to_start_heading = localHeading(-start_to_end, end),
    };
}

// -----------------------------------------------------------------------
// Data
// -----------------------------------------------------------------------
astro::DistanceTable close_star_distances() {
    return {
        // About one Earth radius
        {"Procyon",    6.0},
        {"Betelgeuse", 7.0},
        {"Rigel",      8.0},
        {"Aldebaran",  9.0},
        // About the Earth-Moon distance
        {"Sirius",     380.0},
        {"Capella",    390.0},
        {"Polaris",    400.0},
        {"Dubhe",      410.0},
    };
}

astro::StarPositions test_star_map() {
    return {
        {"A", Vec4d(1, 6, 2, 1)},
        {"B", Vec4d(-3, 7, 4, 1)},
        {"C", Vec4d(5, 18, -6, 1)},
        {"D", Vec4d(-17, 19, -8, 1)},
        {"E", Vec4d(200, 380, 300, 1)},
        {"F", Vec4d(-300, 390, 150, 1)},
        {"G", Vec4d(15, 28, -6, 0)},
        {"H", Vec4d(-7, 29, -18, 0)},
    };
}

} // namespace orbis::world
