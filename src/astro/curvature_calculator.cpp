/// @file curvature_calculator.cpp
/// @brief Implementation of curvature/torsion inference.

#include "astro/curvature_calculator.hpp"

#include "astro/great_circle.hpp"
#include "astro/local_direction.hpp"
#include "core/logger.hpp"
#include "geometry/rotation.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace orbis::astro
{

using geometry::AxisAngle;
using geometry::Rotation;

namespace
{
    std::string format_vec(const Vec3d& v)
    {
        return fmt::format("({:.6f}, {:.6f}, {:.6f})", v.x, v.y, v.z);
    }

    void add_step(CurvatureResult& result, std::string text)
    {
        ORB_CORE_TRACE("curvature: {}", text);
        result.steps.push_back(std::move(text));
    }

    void add_warning(CurvatureResult& result, std::string text)
    {
        ORB_CORE_WARN("curvature: {}", text);
        result.warnings.push_back(std::move(text));
    }
}

// -----------------------------------------------------------------
// CurvatureInput
// -----------------------------------------------------------------

CurvatureInput CurvatureInput::with_travel_between(
    f64 start_latitude, f64 start_longitude,
    f64 end_latitude, f64 end_longitude) const
{
    const TravelObservation travel = GreatCircle::travel_between(
        start_latitude, start_longitude, end_latitude, end_longitude);

    CurvatureInput input = *this;
    input.start_travel_heading = travel.start_to_end_heading;
    // Heading back to the start, reversed, is the onward heading at the end
    input.end_travel_heading = LocalDirection::normalize_degrees(travel.end_to_start_heading + 180.0);
    input.distance_km = travel.distance_km;
    return input;
}

CurvatureInput CurvatureInput::dubhe_sirius()
{
    CurvatureInput input{
        .start_a = {.azimuth = 36.9,  .elevation = 44.8},
        .start_b = {.azimuth = 181.1, .elevation = 35.2},
        .end_a   = {.azimuth = 36.4,  .elevation = 49.1},
        .end_b   = {.azimuth = 191.5, .elevation = 34.4},
    };
    return input.with_travel_between(38.0, -122.0, 38.0, -113.0);
}

// -----------------------------------------------------------------
// CurvatureCalculator
// -----------------------------------------------------------------

CurvatureCalculator::CurvatureCalculator(CurvatureSettings settings)
    : m_settings(settings)
{
}

f64 CurvatureCalculator::checked_distance(f64 distance_km, CurvatureResult& result) const
{
    if (distance_km <= 0.0)
    {
        add_warning(result, fmt::format(
            "Distance should be positive, got {} km. Substituting {} km.",
            distance_km, m_settings.substitute_distance_km));
        return m_settings.substitute_distance_km;
    }
    return distance_km;
}

// -----------------------------------------------------------------
// Full calculation
//
//   rot1: end A -> start A
//   rot2: about start A, rot1(end B) projected -> start B projected
//   rotated up = rot2(rot1(up)) is the end normal seen from the start
// -----------------------------------------------------------------

CurvatureResult CurvatureCalculator::calculate(const CurvatureInput& input) const
{
    CurvatureResult result;

    const f64 limit = m_settings.low_elevation_limit_deg;
    if (input.start_a.elevation < limit || input.start_b.elevation < limit ||
        input.end_a.elevation < limit || input.end_b.elevation < limit)
    {
        add_warning(result, fmt::format(
            "At least one elevation is below {} degrees, which makes the "
            "measurement unreliable due to atmospheric refraction.", limit));
    }

    const f64 distance_km = checked_distance(input.distance_km, result);

    const Vec3d start_a = LocalDirection::to_direction(input.start_a.azimuth, input.start_a.elevation);
    const Vec3d start_b = LocalDirection::to_direction(input.start_b.azimuth, input.start_b.elevation);
    const Vec3d end_a   = LocalDirection::to_direction(input.end_a.azimuth, input.end_a.elevation);
    const Vec3d end_b   = LocalDirection::to_direction(input.end_b.azimuth, input.end_b.elevation);
    add_step(result, "start_A: " + format_vec(start_a));
    add_step(result, "start_B: " + format_vec(start_b));
    add_step(result, "end_A: " + format_vec(end_a));
    add_step(result, "end_B: " + format_vec(end_b));

    // Align A
    const AxisAngle rot1 = Rotation::rotation_to_become(end_a, start_a);
    add_step(result, fmt::format("rot1: axis {} angle {:.6f} deg",
                                 format_vec(rot1.axis), rot1.angle_deg));

    const Vec3d up = nominal::kUp;
    const Vec3d end_b_rot1 = Rotation::rotate(end_b, rot1);
    const Vec3d up_rot1 = Rotation::rotate(up, rot1);
    add_step(result, "end_B_rot1: " + format_vec(end_b_rot1));
    add_step(result, "up_rot1: " + format_vec(up_rot1));

    // Align B about A, working in the plane perpendicular to A
    const Vec3d start_b_proj = Rotation::safe_normalize(
        Rotation::orthogonal_component(start_b, start_a));
    const Vec3d end_b_rot1_proj = Rotation::safe_normalize(
        Rotation::orthogonal_component(end_b_rot1, start_a));
    add_step(result, "start_B_proj: " + format_vec(start_b_proj));
    add_step(result, "end_B_rot1_proj: " + format_vec(end_b_rot1_proj));

    const f64 angle2 = std::atan2(glm::dot(glm::cross(end_b_rot1_proj, start_b_proj), start_a),
                                  glm::dot(end_b_rot1_proj, start_b_proj))
                     * astro_constants::kRadToDeg;
    const AxisAngle rot2 = Rotation::about_axis(start_a, angle2);
    add_step(result, fmt::format("rot2: axis {} angle {:.6f} deg",
                                 format_vec(rot2.axis), rot2.angle_deg));

    const Vec3d end_b_rot12 = Rotation::rotate(end_b_rot1, rot2);
    const Vec3d up_rot12 = Rotation::rotate(up_rot1, rot2);
    add_step(result, "end_B_rot12: " + format_vec(end_b_rot12));
    add_step(result, "up_rot12: " + format_vec(up_rot12));

    result.deviation_b_deg = Rotation::angle_between_deg(end_b_rot12, start_b);
    add_step(result, fmt::format("deviation B: {:.6f} deg", result.deviation_b_deg));
    if (result.deviation_b_deg > m_settings.deviation_warning_deg)
    {
        add_warning(result, fmt::format(
            "Deviation of {:.3f} degrees exceeds {} degrees; the star separation "
            "angles are not the same at both places.",
            result.deviation_b_deg, m_settings.deviation_warning_deg));
    }

    const Vec3d start_forward = LocalDirection::heading_to_vector(input.start_travel_heading);
    add_step(result, "start_forward: " + format_vec(start_forward));

    std::optional<Vec3d> end_forward;
    if (input.end_travel_heading)
    {
        end_forward = Rotation::rotate(
            Rotation::rotate(LocalDirection::heading_to_vector(*input.end_travel_heading), rot1),
            rot2);
        add_step(result, "end_forward: " + format_vec(*end_forward));
    }

    compute_from_normals(up, up_rot12, start_forward, end_forward, distance_km, result);
    return result;
}

CurvatureResult CurvatureCalculator::from_normals(
    const Vec3d& up,
    const Vec3d& rotated_up,
    const Vec3d& start_forward,
    const std::optional<Vec3d>& end_forward,
    f64 distance_km) const
{
    CurvatureResult result;
    const f64 distance = checked_distance(distance_km, result);
    compute_from_normals(up, rotated_up, start_forward, end_forward, distance, result);
    return result;
}

// -----------------------------------------------------------------
// Normal rotation -> curvature and torsion
//
// The rotation taking up onto rotated_up, as a packed axis*angle
// vector n, is decomposed along
//   left    = up x forward   (bending in the direction of travel)
//   forward                  (twist about the direction of travel)
//
//   normal curvature = 2π (n·left) / (360 d)    [1/km]
//   geodesic torsion = (n·forward) / d          [deg/km]
// -----------------------------------------------------------------

void CurvatureCalculator::compute_from_normals(
    const Vec3d& up,
    const Vec3d& rotated_up,
    const Vec3d& start_forward,
    const std::optional<Vec3d>& end_forward,
    f64 distance_km,
    CurvatureResult& result)
{
    const Vec3d travel_left = glm::cross(up, start_forward);
    add_step(result, "travel_left: " + format_vec(travel_left));

    const Vec3d normal_rotation = Rotation::rotation_to_become(up, rotated_up).to_packed();
    add_step(result, "normal rotation (axis*deg): " + format_vec(normal_rotation));

    const f64 bend_deg = glm::dot(normal_rotation, travel_left);
    const f64 twist_deg = glm::dot(normal_rotation, start_forward);

    result.normal_curvature = astro_constants::kTwoPi * bend_deg / (360.0 * distance_km);
    result.geodesic_torsion = twist_deg / distance_km;
    add_step(result, fmt::format("normal curvature: {:.9g} 1/km", result.normal_curvature));
    add_step(result, fmt::format("geodesic torsion: {:.9g} deg/km", result.geodesic_torsion));

    if (end_forward)
    {
        const f64 turn = std::clamp(glm::dot(glm::cross(start_forward, *end_forward), up), -1.0, 1.0);
        result.geodesic_curvature = std::asin(turn) * astro_constants::kRadToDeg / distance_km;
        add_step(result, fmt::format("geodesic curvature: {:.9g} deg/km", *result.geodesic_curvature));
    }
}

} // namespace orbis::astro
