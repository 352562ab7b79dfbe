#pragma once
// world/real_world.hpp - The spherical Earth and its measured sky
//
// The sphere has its center at the origin and its spin axis along Z with
// celestial north at -Z; the prime meridian crosses +Y. The square at
// latitude 0, longitude 0 is therefore oriented like the nominal frame.

#include "catalog/sky_catalog.hpp"
#include "world/world_model.hpp"

namespace orbis::world {

// -----------------------------------------------------------------------
// SphereModel - Earth radius, units of 1000 km
// -----------------------------------------------------------------------
class SphereModel : public PointModel {
public:
    explicit SphereModel(f64 radius_km = astro_constants::kEarthRadiusKm)
        : m_radius(radius_km / 1000.0) {}

    Vec3d point(f64 latitude, f64 longitude) const override;

private:
    f64 m_radius;
};

// -----------------------------------------------------------------------
// RealWorldObservationSource
//
// At the manual epoch, places with hand-measured sightings report those;
// every other star and place is synthesized from the catalog.
// -----------------------------------------------------------------------
class RealWorldObservationSource : public ObservationSource {
public:
    RealWorldObservationSource();
    RealWorldObservationSource(catalog::SkyCatalog catalog, StarObservations manual);

    StarObservations star_observations(f64 unix_time, f64 latitude, f64 longitude) const override;

    /// Only known at the manual epoch.
    std::optional<StarObservation> sun_observation(f64 unix_time, f64 latitude, f64 longitude) const override;

    std::vector<std::string> all_stars() const override { return m_catalog.names(); }

    const catalog::SkyCatalog& catalog() const { return m_catalog; }

private:
    catalog::SkyCatalog m_catalog;
    StarObservations m_manual;
};

// -----------------------------------------------------------------------
// GreatCircleTravelSource - shortest route on a sphere
// -----------------------------------------------------------------------
class GreatCircleTravelSource : public TravelSource {
public:
    explicit GreatCircleTravelSource(f64 radius_km = astro_constants::kEarthRadiusKm)
        : m_radius_km(radius_km) {}

    TravelObservation travel(f64 start_latitude, f64 start_longitude,
                             f64 end_latitude, f64 end_longitude) const override;

private:
    f64 m_radius_km;
};

} // namespace orbis::world
