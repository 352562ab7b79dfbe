/// @file test_frame_builder.cpp
/// @brief Unit tests for orbis::surface::FrameBuilder.
///
/// The frame contract: applying a square's rotation_from_nominal to the
/// nominal triad must reproduce the square's own north, up and east.

#include <doctest/doctest.h>

#include "surface/frame_builder.hpp"
#include "core/types.hpp"

#include <cmath>
#include <stdexcept>

using namespace orbis;
using namespace orbis::surface;
using geometry::AxisAngle;
using geometry::Rotation;

// =================================================================
// Test surfaces
// =================================================================

static Vec3d flat_plane(f64 latitude, f64 longitude)
{
    return Vec3d{longitude, 0.0, -latitude};
}

static Vec3d unit_sphere(f64 latitude, f64 longitude)
{
    const f64 lat = latitude * astro_constants::kDegToRad;
    const f64 lon = longitude * astro_constants::kDegToRad;
    return Vec3d{std::cos(lat) * std::sin(lon),
                 std::cos(lat) * std::cos(lon),
                 -std::sin(lat)};
}

static void check_vec(const Vec3d& actual, const Vec3d& expected, f64 tol)
{
    CHECK(actual.x == doctest::Approx(expected.x).epsilon(tol));
    CHECK(actual.y == doctest::Approx(expected.y).epsilon(tol));
    CHECK(actual.z == doctest::Approx(expected.z).epsilon(tol));
}

static void check_frame_contract(const SurfaceSquare& square)
{
    const AxisAngle& r = square.rotation_from_nominal;
    check_vec(Rotation::rotate(nominal::kNorth, r), square.north, 1e-9);
    check_vec(Rotation::rotate(nominal::kUp, r), square.up, 1e-9);
    check_vec(Rotation::rotate(nominal::kEast, r), square.east(), 1e-9);
}

// =================================================================
// Construction
// =================================================================

TEST_CASE("An empty point function is rejected")
{
    CHECK_THROWS_AS(FrameBuilder{PointFunction{}}, std::invalid_argument);
}

TEST_CASE("point() forwards to the point function")
{
    const FrameBuilder builder(unit_sphere);
    check_vec(builder.point(0.0, 0.0), {0.0, 1.0, 0.0}, 1e-12);
    check_vec(builder.point(90.0, 0.0), {0.0, 0.0, -1.0}, 1e-12);
}

// =================================================================
// Squares
// =================================================================

TEST_CASE("A flat plane laid out like the nominal frame needs no rotation")
{
    const FrameBuilder builder(flat_plane);
    const SurfaceSquare square = builder.build_square(10.0, 20.0);

    check_vec(square.center, {20.0, 0.0, -10.0}, 1e-12);
    check_vec(square.north, nominal::kNorth, 1e-12);
    check_vec(square.up, nominal::kUp, 1e-12);
    CHECK(square.rotation_from_nominal.is_identity());
    CHECK(square.latitude == 10.0);
    CHECK(square.longitude == 20.0);
}

TEST_CASE("Sphere squares satisfy the frame contract in every quadrant")
{
    const FrameBuilder builder(unit_sphere);
    const f64 places[][2] = {
        {38.0, -122.0},
        {38.0, -86.0},
        {-45.0, -100.0},
        {60.0, 170.0},
        {-10.0, 179.9},
        {0.0, 0.0},
        {-89.0, 45.0},
        {90.0, 0.0},
        {-90.0, 30.0},
    };

    for (const auto& place : places)
    {
        const SurfaceSquare square = builder.build_square(place[0], place[1]);
        CAPTURE(place[0]);
        CAPTURE(place[1]);

        CHECK(glm::length(square.north) == doctest::Approx(1.0).epsilon(1e-12));
        CHECK(glm::length(square.up) == doctest::Approx(1.0).epsilon(1e-12));
        CHECK(glm::dot(square.north, square.up) == doctest::Approx(0.0).epsilon(1e-12));
        check_frame_contract(square);

        // On a sphere up is the outward radius, up to the finite step
        check_vec(square.up, glm::normalize(square.center), 2e-3);
    }
}

TEST_CASE("Sphere north points toward the north pole")
{
    const FrameBuilder builder(unit_sphere);
    const SurfaceSquare square = builder.build_square(38.0, -122.0);

    const Vec3d to_pole = glm::normalize(Vec3d{0.0, 0.0, -1.0} - square.center);
    CHECK(glm::dot(square.north, to_pole) > 0.9);
    CHECK(glm::dot(square.east(), glm::cross(Vec3d{0.0, 0.0, -1.0}, square.center)) > 0.0);
}

TEST_CASE("Pole squares take east from the neighbouring meridian point")
{
    const FrameBuilder builder(unit_sphere);

    for (const f64 longitude : {0.0, 30.0, -120.0})
    {
        CAPTURE(longitude);
        const SurfaceSquare square = builder.build_square(90.0, longitude);
        const SurfaceSquare near_pole = builder.build_square(89.9, longitude);

        CHECK(glm::length(square.up) == doctest::Approx(1.0).epsilon(1e-12));
        CHECK(glm::length(square.east()) == doctest::Approx(1.0).epsilon(1e-12));
        CHECK(glm::dot(square.east(), near_pole.east()) > 0.999);
        check_vec(square.up, Vec3d{0.0, 0.0, -1.0}, 2e-3);
    }

    const SurfaceSquare south = builder.build_square(-90.0, 30.0);
    CHECK(glm::length(south.up) == doctest::Approx(1.0).epsilon(1e-12));
    check_vec(south.up, Vec3d{0.0, 0.0, 1.0}, 2e-3);
}

TEST_CASE("Squares carry the configured size and matching rotations")
{
    const FrameBuilder builder(unit_sphere, FrameSettings{.finite_difference_deg = 0.01,
                                                          .square_size_km = 3.0});
    const SurfaceSquare square = builder.build_square(20.0, 30.0);

    CHECK(square.size_km == 3.0);
    CHECK(builder.settings().finite_difference_deg == 0.01);
    CHECK(square.rotation_from_base.angle_deg == square.rotation_from_nominal.angle_deg);
    check_vec(square.up, glm::normalize(square.center), 2e-4);
}

// =================================================================
// rotation_from_nominal
// =================================================================

TEST_CASE("rotation_from_nominal of the nominal pair is the identity")
{
    CHECK(FrameBuilder::rotation_from_nominal(nominal::kNorth, nominal::kEast).is_identity());
}

TEST_CASE("rotation_from_nominal handles an upside-down frame")
{
    // Same north, reversed east: a half turn about north
    const AxisAngle r = FrameBuilder::rotation_from_nominal(nominal::kNorth, {-1.0, 0.0, 0.0});
    CHECK(r.angle_deg == doctest::Approx(180.0).epsilon(1e-9));
    check_vec(Rotation::rotate(nominal::kUp, r), {0.0, -1.0, 0.0}, 1e-12);
    check_vec(Rotation::rotate(nominal::kNorth, r), nominal::kNorth, 1e-12);
}

TEST_CASE("rotation_from_nominal reproduces an arbitrary orthonormal pair")
{
    const AxisAngle target = Rotation::about_axis({0.4, -1.0, 2.2}, 137.0);
    const Vec3d north = Rotation::rotate(nominal::kNorth, target);
    const Vec3d east = Rotation::rotate(nominal::kEast, target);

    const AxisAngle r = FrameBuilder::rotation_from_nominal(north, east);
    check_vec(Rotation::rotate(nominal::kNorth, r), north, 1e-12);
    check_vec(Rotation::rotate(nominal::kEast, r), east, 1e-12);
    check_vec(Rotation::rotate(nominal::kUp, r), Rotation::rotate(nominal::kUp, target), 1e-12);
}
