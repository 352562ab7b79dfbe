/// @file test_rotation.cpp
/// @brief Unit tests for orbis::geometry::Rotation.
///
/// Verifies composition, inversion, vector rotation and alignment,
/// including alignment beyond 90 degrees and of opposite directions.

#include <doctest/doctest.h>

#include "geometry/rotation.hpp"
#include "core/types.hpp"

#include <cmath>

using namespace orbis;
using namespace orbis::geometry;

// =================================================================
// Tolerance constants
// =================================================================

static constexpr f64 kVecTol = 1e-12;
static constexpr f64 kDegTol = 1e-9;

static void check_vec(const Vec3d& actual, const Vec3d& expected, f64 tol = kVecTol)
{
    CHECK(actual.x == doctest::Approx(expected.x).epsilon(tol));
    CHECK(actual.y == doctest::Approx(expected.y).epsilon(tol));
    CHECK(actual.z == doctest::Approx(expected.z).epsilon(tol));
}

// =================================================================
// Packed form
// =================================================================

TEST_CASE("Zero packed vector is the identity")
{
    const AxisAngle r = AxisAngle::from_packed(Vec3d{0.0});
    CHECK(r.is_identity());
    check_vec(r.to_packed(), Vec3d{0.0});
}

TEST_CASE("Packed vector splits into unit axis and angle")
{
    const AxisAngle r = AxisAngle::from_packed({0.0, 0.0, -30.0});
    check_vec(r.axis, {0.0, 0.0, -1.0});
    CHECK(r.angle_deg == doctest::Approx(30.0).epsilon(kDegTol));
    check_vec(r.to_packed(), {0.0, 0.0, -30.0});
}

TEST_CASE("about_axis normalizes the axis and treats a zero axis as identity")
{
    const AxisAngle r = Rotation::about_axis({0.0, 5.0, 0.0}, 45.0);
    check_vec(r.axis, {0.0, 1.0, 0.0});
    CHECK(r.angle_deg == doctest::Approx(45.0).epsilon(kDegTol));

    CHECK(Rotation::about_axis(Vec3d{0.0}, 45.0).is_identity());
    CHECK(Rotation::about_axis({1.0, 0.0, 0.0}, 0.0).is_identity());
}

// =================================================================
// Application
// =================================================================

TEST_CASE("Rotating by 90 degrees about +Y turns north into west")
{
    // Right-hand rule about up: -Z (north) -> -X (west)
    const Vec3d v = Rotation::rotate(nominal::kNorth, Rotation::about_axis(nominal::kUp, 90.0));
    check_vec(v, {-1.0, 0.0, 0.0});
}

TEST_CASE("Identity rotation leaves vectors untouched")
{
    const Vec3d v{0.3, -2.0, 7.5};
    check_vec(Rotation::rotate(v, AxisAngle::identity()), v);
}

TEST_CASE("Rotation matrix is orthonormal with determinant 1")
{
    const Mat3d m = Rotation::to_matrix(Rotation::about_axis({1.0, 2.0, -3.0}, 73.0));
    const Mat3d should_be_identity = glm::transpose(m) * m;

    for (int col = 0; col < 3; ++col)
    {
        for (int row = 0; row < 3; ++row)
        {
            const f64 expected = (col == row) ? 1.0 : 0.0;
            CHECK(should_be_identity[col][row] == doctest::Approx(expected).epsilon(kVecTol));
        }
    }
    CHECK(glm::determinant(m) == doctest::Approx(1.0).epsilon(kVecTol));
}

TEST_CASE("Rotation preserves length")
{
    const Vec3d v{3.0, -4.0, 12.0};
    const Vec3d rotated = Rotation::rotate(v, Rotation::about_axis({0.2, 0.9, -0.4}, 211.0));
    CHECK(glm::length(rotated) == doctest::Approx(13.0).epsilon(kVecTol));
}

// =================================================================
// Composition
// =================================================================

TEST_CASE("compose(r, inverse(r)) is the identity")
{
    const AxisAngle rotations[] = {
        Rotation::about_axis({1.0, 0.0, 0.0}, 10.0),
        Rotation::about_axis({0.3, -0.5, 0.8}, 123.0),
        Rotation::about_axis({-2.0, 1.0, 1.0}, 179.0),
    };

    for (const auto& r : rotations)
    {
        const AxisAngle c = Rotation::compose(r, Rotation::inverse(r));
        CHECK(c.angle_deg == doctest::Approx(0.0).epsilon(1e-5));
        check_vec(Rotation::rotate({0.3, -0.7, 2.0}, c), {0.3, -0.7, 2.0}, 1e-9);
    }
}

TEST_CASE("Two quarter turns about one axis compose to a half turn")
{
    const AxisAngle quarter = Rotation::about_axis({0.0, 0.0, 1.0}, 90.0);
    const AxisAngle half = Rotation::compose(quarter, quarter);
    CHECK(half.angle_deg == doctest::Approx(180.0).epsilon(kDegTol));
    check_vec(Rotation::rotate({1.0, 0.0, 0.0}, half), {-1.0, 0.0, 0.0});
}

TEST_CASE("Composed rotation equals applying first, then second")
{
    const AxisAngle first = Rotation::about_axis({1.0, 0.0, 0.0}, 90.0);
    const AxisAngle second = Rotation::about_axis({0.0, 1.0, 0.0}, 90.0);
    const AxisAngle both = Rotation::compose(first, second);

    const Vec3d samples[] = {{1.0, 0.0, 0.0}, {0.0, 1.0, 0.0}, {0.3, -0.7, 2.0}};
    for (const auto& v : samples)
    {
        const Vec3d sequential = Rotation::rotate(Rotation::rotate(v, first), second);
        check_vec(Rotation::rotate(v, both), sequential);
    }
}

TEST_CASE("A zero axis with a nonzero angle acts as the identity")
{
    const AxisAngle r{.axis = {0.0, 0.0, 0.0}, .angle_deg = 30.0};
    CHECK(r.is_identity());

    const Vec3d v{0.3, -2.0, 7.5};
    check_vec(Rotation::rotate(v, r), v);

    const Mat3d m = Rotation::to_matrix(r);
    check_vec(m * Vec3d{1.0, 0.0, 0.0}, {1.0, 0.0, 0.0});

    const AxisAngle q = Rotation::about_axis({1.0, 0.0, 0.0}, 40.0);
    const AxisAngle c = Rotation::compose(r, q);
    check_vec(c.axis, q.axis);
    CHECK(c.angle_deg == doctest::Approx(40.0).epsilon(kDegTol));
}

TEST_CASE("Composing with the identity returns the other rotation")
{
    const AxisAngle r = Rotation::about_axis({0.0, 1.0, 1.0}, 33.0);
    const AxisAngle c = Rotation::compose(AxisAngle::identity(), r);
    check_vec(c.axis, r.axis);
    CHECK(c.angle_deg == doctest::Approx(33.0).epsilon(kDegTol));
}

// =================================================================
// Alignment
// =================================================================

TEST_CASE("rotation_to_become: north onto east is 90 degrees about down")
{
    // Axis is north x east; turning clockwise seen from above is a
    // right-handed turn about -Y.
    const AxisAngle r = Rotation::rotation_to_become({0.0, 0.0, -1.0}, {1.0, 0.0, 0.0});
    check_vec(r.axis, {0.0, -1.0, 0.0});
    CHECK(r.angle_deg == doctest::Approx(90.0).epsilon(kDegTol));
    check_vec(Rotation::rotate({0.0, 0.0, -1.0}, r), {1.0, 0.0, 0.0});
}

TEST_CASE("rotation_to_become ignores vector lengths")
{
    const AxisAngle r = Rotation::rotation_to_become({0.0, 0.0, -7.0}, {0.0, 0.5, 0.0});
    CHECK(r.angle_deg == doctest::Approx(90.0).epsilon(kDegTol));
    check_vec(Rotation::rotate({0.0, 0.0, -1.0}, r), {0.0, 1.0, 0.0});
}

TEST_CASE("rotation_to_become resolves angles beyond 90 degrees")
{
    const Vec3d from{1.0, 0.0, 0.0};
    const Vec3d to{std::cos(150.0 * astro_constants::kDegToRad),
                   std::sin(150.0 * astro_constants::kDegToRad), 0.0};

    const AxisAngle r = Rotation::rotation_to_become(from, to);
    CHECK(r.angle_deg == doctest::Approx(150.0).epsilon(kDegTol));
    check_vec(Rotation::rotate(from, r), to);
}

TEST_CASE("rotation_to_become of parallel vectors is the identity")
{
    CHECK(Rotation::rotation_to_become({1.0, 2.0, 3.0}, {2.0, 4.0, 6.0}).is_identity());
}

TEST_CASE("rotation_to_become of opposite vectors is a half turn")
{
    const Vec3d from{0.0, 1.0, 0.0};
    const AxisAngle r = Rotation::rotation_to_become(from, -from);
    CHECK(r.angle_deg == doctest::Approx(180.0).epsilon(kDegTol));
    CHECK(glm::dot(r.axis, from) == doctest::Approx(0.0).epsilon(kVecTol));
    check_vec(Rotation::rotate(from, r), -from);
}

// =================================================================
// Helpers
// =================================================================

TEST_CASE("angle_between_deg covers the full range")
{
    CHECK(Rotation::angle_between_deg({1.0, 0.0, 0.0}, {1.0, 0.0, 0.0}) ==
          doctest::Approx(0.0).epsilon(1e-6));
    CHECK(Rotation::angle_between_deg({1.0, 0.0, 0.0}, {0.0, 3.0, 0.0}) ==
          doctest::Approx(90.0).epsilon(kDegTol));
    CHECK(Rotation::angle_between_deg({1.0, 0.0, 0.0}, {-2.0, 0.0, 0.0}) ==
          doctest::Approx(180.0).epsilon(kDegTol));
}

TEST_CASE("orthogonal_component removes the part along the unit vector")
{
    const Vec3d v{3.0, 4.0, 5.0};
    check_vec(Rotation::orthogonal_component(v, {0.0, 1.0, 0.0}), {3.0, 0.0, 5.0});
}

TEST_CASE("safe_normalize leaves the zero vector alone")
{
    check_vec(Rotation::safe_normalize(Vec3d{0.0}), Vec3d{0.0});
    check_vec(Rotation::safe_normalize({0.0, 0.0, 4.0}), {0.0, 0.0, 1.0});
}
