// world/real_world.cpp
#include "real_world.hpp"

#include "astro/great_circle.hpp"
#include "geometry/rotation.hpp"
#include "observation/reference_observations.hpp"

#include <set>
#include <utility>

namespace orbis::world {

using geometry::Rotation;

// -----------------------------------------------------------------------
// SphereModel - tilt by latitude about X, then spin by longitude about Z
// -----------------------------------------------------------------------
Vec3d SphereModel::point(f64 latitude, f64 longitude) const {
    Vec3d pt{0.0, m_radius, 0.0};
    pt = Rotation::rotate(pt, Rotation::about_axis({1.0, 0.0, 0.0}, -latitude));
    pt = Rotation::rotate(pt, Rotation::about_axis({0.0, 0.0, 1.0}, -longitude));
    return pt;
}

// -----------------------------------------------------------------------
// RealWorldObservationSource
// -----------------------------------------------------------------------
RealWorldObservationSource::RealWorldObservationSource()
    : RealWorldObservationSource(catalog::SkyCatalog::builtin(),
                                 observation::manual_observations()) {}

RealWorldObservationSource::RealWorldObservationSource(catalog::SkyCatalog catalog,
                                                       StarObservations manual)
    : m_catalog(std::move(catalog))
    , m_manual(std::move(manual)) {}

StarObservations RealWorldObservationSource::star_observations(f64 unix_time,
                                                               f64 latitude,
                                                               f64 longitude) const {
    StarObservations result;
    std::set<std::string> measured;

    if (unix_time == observation::kManualDataUnixTime) {
        for (const auto& obs : m_manual) {
            if (obs.latitude == latitude && obs.longitude == longitude) {
                measured.insert(obs.name);
                result.push_back(obs);
            }
        }
    }

    for (const auto& star : m_catalog.stars()) {
        if (measured.count(star.name) == 0) {
            result.push_back(catalog::SkyCatalog::observe_star(star, unix_time, latitude, longitude));
        }
    }
    return result;
}

std::optional<StarObservation> RealWorldObservationSource::sun_observation(f64 unix_time,
                                                                           f64 latitude,
                                                                           f64 longitude) const {
    if (unix_time != observation::kManualDataUnixTime) return std::nullopt;
    return catalog::SkyCatalog::observe_sun(unix_time, latitude, longitude);
}

// -----------------------------------------------------------------------
// GreatCircleTravelSource
// -----------------------------------------------------------------------
TravelObservation GreatCircleTravelSource::travel(f64 start_latitude, f64 start_longitude,
                                                  f64 end_latitude, f64 end_longitude) const {
    return astro::GreatCircle::travel_between(start_latitude, start_longitude,
                                              end_latitude, end_longitude, m_radius_km);
}

} // namespace orbis::world
