/// @file test_world_model.cpp
/// @brief Integration tests for orbis::world models.
///
/// Each world is checked for a consistent surface frame, and the real
/// and hypothetical worlds for sightings that agree with the data the
/// stars were placed from.

#include <doctest/doctest.h>

#include "world/world_model.hpp"
#include "world/manifold_models.hpp"
#include "world/real_world.hpp"
#include "astro/star_generator.hpp"
#include "catalog/sky_catalog.hpp"
#include "core/types.hpp"
#include "geometry/rotation.hpp"
#include "observation/reference_observations.hpp"

#include <algorithm>
#include <cmath>
#include <map>

using namespace orbis;
using namespace orbis::world;
using geometry::Rotation;

// =================================================================
// Helpers
// =================================================================

static f64 azimuth_difference(f64 a, f64 b)
{
    const f64 d = std::abs(a - b);
    return (d > 180.0) ? 360.0 - d : d;
}

static std::map<std::string, StarObservation> by_name(const StarObservations& list)
{
    std::map<std::string, StarObservation> result;
    for (const auto& obs : list)
    {
        result[obs.name] = obs;
    }
    return result;
}

static void check_vec(const Vec3d& actual, const Vec3d& expected, f64 tol)
{
    CHECK(actual.x == doctest::Approx(expected.x).epsilon(tol));
    CHECK(actual.y == doctest::Approx(expected.y).epsilon(tol));
    CHECK(actual.z == doctest::Approx(expected.z).epsilon(tol));
}

// =================================================================
// Assembly
// =================================================================

TEST_CASE("All five worlds are assembled in order")
{
    const std::vector<WorldModel> worlds = make_all_worlds();
    REQUIRE(worlds.size() == 5);

    CHECK(worlds[0].description == "real world star data");
    CHECK(worlds[1].description == "spherical Earth with close stars");
    CHECK(worlds[2].description == "azimuthal equidistant projection flat Earth");
    CHECK(worlds[3].description == "bowl");
    CHECK(worlds[4].description == "saddle");

    for (const auto& world : worlds)
    {
        CAPTURE(world.description);
        CHECK(world.points != nullptr);
        CHECK(world.stars != nullptr);
        CHECK(world.observations != nullptr);
        CHECK(world.travel != nullptr);
        CHECK_FALSE(world.model_star_map().empty());
    }
}

TEST_CASE("Every world's squares satisfy the frame contract")
{
    const f64 places[][2] = {
        {38.0, -122.0}, {38.0, -86.0}, {10.0, 45.0}, {-20.0, 100.0}, {90.0, 0.0}, {-90.0, 30.0},
    };

    for (const auto& world : make_all_worlds())
    {
        for (const auto& place : places)
        {
            CAPTURE(world.description);
            CAPTURE(place[0]);
            CAPTURE(place[1]);

            const surface::SurfaceSquare square = world.model_square(place[0], place[1]);
            const geometry::AxisAngle& r = square.rotation_from_nominal;

            check_vec(square.center, world.model_point(place[0], place[1]), 1e-12);
            check_vec(Rotation::rotate(nominal::kNorth, r), square.north, 1e-9);
            check_vec(Rotation::rotate(nominal::kUp, r), square.up, 1e-9);
            check_vec(Rotation::rotate(nominal::kEast, r), square.east(), 1e-9);
            CHECK(glm::length(square.up) == doctest::Approx(1.0).epsilon(1e-12));
        }
    }
}

// =================================================================
// Point models
// =================================================================

TEST_CASE("Sphere puts the prime meridian on +Y and the north pole on -Z")
{
    const SphereModel sphere;
    check_vec(sphere.point(0.0, 0.0), {0.0, 6.371, 0.0}, 1e-12);
    check_vec(sphere.point(90.0, 77.0), {0.0, 0.0, -6.371}, 1e-12);
    check_vec(sphere.point(38.0, -122.0), {-4.257554664259553, -2.6604154237744004, -3.922379259299769},
              1e-12);

    // The square at 0N 0E is oriented like the nominal frame
    const surface::SurfaceSquare square = sphere.square(0.0, 0.0);
    check_vec(square.up, nominal::kUp, 1e-3);
    check_vec(square.north, nominal::kNorth, 1e-3);
}

TEST_CASE("Sphere radius is configurable")
{
    const SphereModel small(1000.0);
    CHECK(glm::length(small.point(12.0, 34.0)) == doctest::Approx(1.0).epsilon(1e-12));
}

TEST_CASE("Flat disc is level everywhere")
{
    const AzimuthalEquidistantModel disc;
    check_vec(disc.point(90.0, 10.0), Vec3d{0.0}, 1e-12);
    CHECK(disc.point(0.0, 0.0).z == doctest::Approx(astro_constants::kHalfPi * 6.371).epsilon(1e-12));

    const surface::SurfaceSquare square = disc.square(38.0, -122.0);
    check_vec(square.up, nominal::kUp, 1e-12);
}

TEST_CASE("Bowl rises toward the rim and the saddle bends both ways")
{
    const BowlModel bowl;
    CHECK(bowl.point(90.0, 0.0).y == doctest::Approx(0.0).epsilon(1e-12));
    CHECK(bowl.point(0.0, 0.0).y > bowl.point(45.0, 0.0).y);
    CHECK(bowl.point(45.0, 0.0).y > 0.0);

    const SaddleModel saddle;
    CHECK(saddle.point(0.0, 90.0).y > 0.0);   // along X
    CHECK(saddle.point(0.0, 0.0).y < 0.0);    // along Z
}

TEST_CASE("Squares carry the requested size")
{
    const BowlModel bowl;
    const surface::SurfaceSquare square =
        bowl.square(20.0, 30.0, FrameSettings{.finite_difference_deg = 0.1, .square_size_km = 4.0});
    CHECK(square.size_km == 4.0);
}

// =================================================================
// Real world
// =================================================================

TEST_CASE("Real sightings at a measured place and time are the manual ones")
{
    const RealWorldObservationSource source;
    const auto sky = by_name(source.star_observations(observation::kManualDataUnixTime, 38.0, -122.0));

    REQUIRE(sky.size() == 8);
    CHECK(sky.at("Dubhe").azimuth == 36.9);
    CHECK(sky.at("Dubhe").elevation == 44.8);
    CHECK(sky.at("Sirius").azimuth == 181.1);
    CHECK(source.all_stars().size() == 8);
    CHECK(source.catalog().size() == 8);
}

TEST_CASE("Real sightings elsewhere come from the catalog")
{
    const RealWorldObservationSource source;
    const catalog::SkyCatalog& cat = source.catalog();

    const auto sky = by_name(source.star_observations(observation::kManualDataUnixTime, 40.0, -100.0));
    REQUIRE(sky.size() == 8);

    const StarObservation expected = catalog::SkyCatalog::observe_star(
        *cat.find_by_name("Capella"), observation::kManualDataUnixTime, 40.0, -100.0);
    CHECK(sky.at("Capella").azimuth == doctest::Approx(expected.azimuth).epsilon(1e-12));
    CHECK(sky.at("Capella").latitude == 40.0);

    // A different time at a measured place is synthesized too
    const auto later = by_name(source.star_observations(observation::kManualDataUnixTime + 3600.0,
                                                       38.0, -122.0));
    REQUIRE(later.size() == 8);
    CHECK(later.at("Dubhe").azimuth != 36.9);
}

TEST_CASE("The real Sun is known only at the manual epoch")
{
    const RealWorldObservationSource source;
    const auto sun = source.sun_observation(observation::kManualDataUnixTime, 38.0, -122.0);
    REQUIRE(sun.has_value());
    CHECK(sun->name == "Sun");
    CHECK_FALSE(source.sun_observation(0.0, 38.0, -122.0).has_value());
}

TEST_CASE("Great-circle travel on the real world")
{
    const WorldModel world = make_real_world();
    const TravelObservation t = world.travel->travel(38.0, -122.0, 38.0, -113.0);
    CHECK(t.distance_km == doctest::Approx(788.297).epsilon(1e-6));
    CHECK(t.start_to_end_heading == doctest::Approx(87.22598).epsilon(1e-7));
}

TEST_CASE("Stars at infinity on a sphere predict the other longitudes")
{
    const WorldModel world = make_real_world();
    const catalog::SkyCatalog cat = catalog::SkyCatalog::builtin();

    // Every star of the real world is at infinity
    for (const auto& [name, pos] : world.model_star_map())
    {
        CHECK(pos.w == 0.0);
    }

    const f64 longitudes[] = {-113.0, -104.0, -95.0, -86.0};
    for (const f64 longitude : longitudes)
    {
        const surface::SurfaceSquare square = world.model_square(38.0, longitude);
        for (const auto& obs : astro::StarGenerator::synthesize(square, world.model_star_map()))
        {
            CAPTURE(obs.name);
            CAPTURE(longitude);
            const StarObservation expected = catalog::SkyCatalog::observe_star(
                *cat.find_by_name(obs.name), observation::kManualDataUnixTime, 38.0, longitude);

            // Manual readings and finite differencing each add a few tenths
            CHECK(azimuth_difference(obs.azimuth, expected.azimuth) < 1.0);
            CHECK(std::abs(obs.elevation - expected.elevation) < 1.0);
        }
    }
}

// =================================================================
// Hypothetical worlds
// =================================================================

TEST_CASE("Close stars are placed at their table distances")
{
    const WorldModel world = make_close_stars_world();
    const auto& stars = world.model_star_map();
    REQUIRE(stars.size() == 8);

    const surface::SurfaceSquare reference =
        world.model_square(observation::kReferenceLatitude, observation::kReferenceLongitude);
    for (const auto& [name, distance] : close_star_distances())
    {
        CAPTURE(name);
        const Vec4d pos = stars.at(name);
        CHECK(pos.w == 1.0);
        CHECK(glm::length(Vec3d(pos) - reference.center) == doctest::Approx(distance).epsilon(1e-9));
    }
}

TEST_CASE("Hypothetical worlds reproduce the reference sky at the reference place")
{
    const WorldModel worlds[] = {make_close_stars_world(), make_azimuthal_equidistant_world()};
    const auto manual = by_name(observation::manual_observations_at(
        observation::kReferenceLatitude, observation::kReferenceLongitude));

    for (const auto& world : worlds)
    {
        CAPTURE(world.description);
        const auto sky = by_name(world.observations->star_observations(
            observation::kManualDataUnixTime,
            observation::kReferenceLatitude, observation::kReferenceLongitude));
        REQUIRE(sky.size() == manual.size());

        for (const auto& [name, obs] : manual)
        {
            CAPTURE(name);
            CHECK(azimuth_difference(sky.at(name).azimuth, obs.azimuth) < 1e-3);
            CHECK(sky.at(name).elevation == doctest::Approx(obs.elevation).epsilon(1e-3));
        }
    }
}

TEST_CASE("Close stars drift away from the real sky with distance")
{
    const WorldModel close = make_close_stars_world();
    const auto sky = by_name(close.observations->star_observations(
        observation::kManualDataUnixTime, 38.0, -86.0));
    const auto real = by_name(observation::manual_observations_at(38.0, -86.0));

    // Procyon is only 6000 km away: large parallax over 36 degrees of longitude
    f64 diff = azimuth_difference(sky.at("Procyon").azimuth, real.at("Procyon").azimuth);
    diff = std::max(diff, std::abs(sky.at("Procyon").elevation - real.at("Procyon").elevation));
    CHECK(diff > 5.0);
}

TEST_CASE("Only the close-stars world borrows the real Sun")
{
    const WorldModel close = make_close_stars_world();
    CHECK(close.observations->sun_observation(observation::kManualDataUnixTime, 38.0, -122.0)
              .has_value());

    const WorldModel flat = make_azimuthal_equidistant_world();
    CHECK_FALSE(flat.observations->sun_observation(observation::kManualDataUnixTime, 38.0, -122.0)
                    .has_value());
}

TEST_CASE("Chord travel on the flat disc")
{
    const WorldModel flat = make_azimuthal_equidistant_world();
    const TravelObservation t = flat.travel->travel(38.0, -122.0, 38.0, -113.0);

    // Both ends lie 52 degrees of arc from the pole; 9 degrees apart
    CHECK(t.distance_km == doctest::Approx(907.3223529818376).epsilon(1e-9));
    CHECK(t.start_to_end_heading == doctest::Approx(85.5).epsilon(1e-9));
    CHECK(t.end_to_start_heading == doctest::Approx(274.5).epsilon(1e-9));
    CHECK(t.start_latitude == 38.0);
    CHECK(t.end_longitude == -113.0);
}

TEST_CASE("Travel between coincident places has zero length and heading")
{
    const WorldModel bowl = make_bowl_world();
    const TravelObservation t = bowl.travel->travel(10.0, 20.0, 10.0, 20.0);
    CHECK(t.distance_km == 0.0);
    CHECK(t.start_to_end_heading == 0.0);
}

TEST_CASE("Bowl and saddle show the eight test stars")
{
    for (const WorldModel& world : {make_bowl_world(), make_saddle_world()})
    {
        CAPTURE(world.description);
        const std::vector<std::string> names = world.observations->all_stars();
        CHECK(names == std::vector<std::string>{"A", "B", "C", "D", "E", "F", "G", "H"});

        const StarObservations sky = world.observations->star_observations(0.0, 30.0, 40.0);
        REQUIRE(sky.size() == 8);
        for (const auto& obs : sky)
        {
            CHECK(obs.latitude == 30.0);
            CHECK(obs.longitude == 40.0);
            CHECK(obs.azimuth >= 0.0);
            CHECK(obs.azimuth < 360.0);
        }
        CHECK_FALSE(world.observations->sun_observation(0.0, 30.0, 40.0).has_value());
    }
}

TEST_CASE("Stars at infinity look the same from anywhere on the flat disc")
{
    const AzimuthalEquidistantModel disc;
    const astro::StarPositions far{{"Far", Vec4d(0.3, 0.8, -0.5, 0.0)}};

    // Squares on one meridian of the disc share their orientation
    const auto a = astro::StarGenerator::synthesize(disc.square(38.0, 0.0), far);
    const auto b = astro::StarGenerator::synthesize(disc.square(60.0, 0.0), far);
    CHECK(a[0].elevation == doctest::Approx(b[0].elevation).epsilon(1e-12));
    CHECK(a[0].azimuth == doctest::Approx(b[0].azimuth).epsilon(1e-9));
}
