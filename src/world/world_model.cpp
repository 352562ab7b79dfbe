// world/world_model.cpp
#include "world_model.hpp"

#include "core/logger.hpp"
#include "surface/frame_builder.hpp"
#include "world/manifold_models.hpp"
#include "world/real_world.hpp"

namespace orbis::world {

// -----------------------------------------------------------------------
// Capability defaults
// -----------------------------------------------------------------------
surface::SurfaceSquare PointModel::square(f64 latitude, f64 longitude,
                                          FrameSettings settings) const {
    const surface::FrameBuilder builder(
        [this](f64 lat, f64 lon) { return point(lat, lon); }, settings);
    return builder.build_square(latitude, longitude);
}

std::optional<StarObservation> ObservationSource::sun_observation(f64 /*unix_time*/,
                                                                  f64 /*latitude*/,
                                                                  f64 /*longitude*/) const {
    return std::nullopt;
}

// -----------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------
WorldModel make_real_world() {
    auto sphere = std::make_shared<const SphereModel>();
    auto sightings = std::make_shared<const RealWorldObservationSource>();

    // Star directions inferred at the reference site; used for display
    // and comparison only, never by the reconstruction itself.
    auto stars = std::make_shared<const GeneratedStarPositions>(
        *sphere, *sightings, astro::DistanceTable{});

    ORB_CORE_INFO("World: real world star data ({} stars)", stars->positions().size());
    return WorldModel{
        .description  = "real world star data",
        .points       = sphere,
        .stars        = stars,
        .observations = sightings,
        .travel       = std::make_shared<const GreatCircleTravelSource>(),
    };
}

WorldModel make_close_stars_world() {
    auto sphere = std::make_shared<const SphereModel>();
    auto real = std::make_shared<const RealWorldObservationSource>();
    auto stars = std::make_shared<const GeneratedStarPositions>(
        *sphere, *real, close_star_distances());

    ORB_CORE_INFO("World: spherical Earth with close stars ({} stars)", stars->positions().size());
    return WorldModel{
        .description  = "spherical Earth with close stars",
        .points       = sphere,
        .stars        = stars,
        .observations = std::make_shared<const ManifoldObservationSource>(sphere, stars, real),
        .travel       = std::make_shared<const GreatCircleTravelSource>(),
    };
}

WorldModel make_azimuthal_equidistant_world() {
    auto disc = std::make_shared<const AzimuthalEquidistantModel>();
    const RealWorldObservationSource real;
    auto stars = std::make_shared<const GeneratedStarPositions>(
        *disc, real, close_star_distances());

    ORB_CORE_INFO("World: azimuthal equidistant flat Earth ({} stars)", stars->positions().size());
    return WorldModel{
        .description  = "azimuthal equidistant projection flat Earth",
        .points       = disc,
        .stars        = stars,
        .observations = std::make_shared<const ManifoldObservationSource>(disc, stars),
        .travel       = std::make_shared<const ManifoldTravelSource>(disc),
    };
}

namespace {

WorldModel makeTestStarWorld(std::string description, std::shared_ptr<const PointModel> points) {
    auto stars = std::make_shared<const FixedStarPositions>(test_star_map());
    ORB_CORE_INFO("World: {} ({} stars)", description, stars->positions().size());
    return WorldModel{
        .description  = std::move(description),
        .points       = points,
        .stars        = stars,
        .observations = std::make_shared<const ManifoldObservationSource>(points, stars),
        .travel       = std::make_shared<const ManifoldTravelSource>(points),
    };
}

} // namespace

WorldModel make_bowl_world() {
    return makeTestStarWorld("bowl", std::make_shared<const BowlModel>());
}

WorldModel make_saddle_world() {
    return makeTestStarWorld("saddle", std::make_shared<const SaddleModel>());
}

std::vector<WorldModel> make_all_worlds() {
    std::vector<WorldModel> worlds;
    worlds.push_back(make_real_world());
    worlds.push_back(make_close_stars_world());
    worlds.push_back(make_azimuthal_equidistant_world());
    worlds.push_back(make_bowl_world());
    worlds.push_back(make_saddle_world());
    return worlds;
}

} // namespace orbis::world
