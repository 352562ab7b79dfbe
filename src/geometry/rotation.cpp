/// @file rotation.cpp
/// @brief Implementation of axis-angle rotation algebra.

#include "geometry/rotation.hpp"

#include <algorithm>
#include <cmath>

namespace orbis::geometry
{

namespace
{
    // Below this many radians a composed rotation is treated as the identity.
    constexpr f64 kIdentityAngleRad = 1e-12;

    // Cross products shorter than this are treated as parallel vectors.
    constexpr f64 kParallelEpsilon = 1e-15;
}

// -----------------------------------------------------------------
// Packed vector → axis + angle
// -----------------------------------------------------------------

AxisAngle AxisAngle::from_packed(const Vec3d& packed)
{
    const f64 length = glm::length(packed);
    if (length == 0.0)
    {
        return AxisAngle::identity();
    }
    return AxisAngle{
        .axis      = packed / length,
        .angle_deg = length,
    };
}

// -----------------------------------------------------------------
// Construction helpers
// -----------------------------------------------------------------

AxisAngle Rotation::about_axis(const Vec3d& axis, f64 angle_deg)
{
    const f64 length = glm::length(axis);
    if (length == 0.0 || angle_deg == 0.0)
    {
        return AxisAngle::identity();
    }
    return AxisAngle{
        .axis      = axis / length,
        .angle_deg = angle_deg,
    };
}

AxisAngle Rotation::inverse(const AxisAngle& r)
{
    return AxisAngle{
        .axis      = r.axis,
        .angle_deg = -r.angle_deg,
    };
}

// -----------------------------------------------------------------
// Composition: apply 'first', then 'second'
//
//   β, m = angle and unit axis of first
//   α, l = angle and unit axis of second
//
//   cos(γ/2) = cos(α/2)cos(β/2) − sin(α/2)sin(β/2)(l·m)
//   n = [l sin(α/2)cos(β/2) + m cos(α/2)sin(β/2) + (l×m) sin(α/2)sin(β/2)] / sin(γ/2)
// -----------------------------------------------------------------

AxisAngle Rotation::compose(const AxisAngle& first, const AxisAngle& second)
{
    if (first.is_identity())
    {
        return second.is_identity() ? AxisAngle::identity() : second;
    }
    if (second.is_identity())
    {
        return first;
    }

    const f64 half_beta  = 0.5 * first.angle_deg * astro_constants::kDegToRad;
    const f64 half_alpha = 0.5 * second.angle_deg * astro_constants::kDegToRad;
    const Vec3d& m = first.axis;
    const Vec3d& l = second.axis;

    const f64 sin_a = std::sin(half_alpha);
    const f64 cos_a = std::cos(half_alpha);
    const f64 sin_b = std::sin(half_beta);
    const f64 cos_b = std::cos(half_beta);

    const f64 cos_half_gamma = cos_a * cos_b - sin_a * sin_b * glm::dot(l, m);
    const f64 gamma = 2.0 * std::acos(std::clamp(cos_half_gamma, -1.0, 1.0));

    if (gamma < kIdentityAngleRad)
    {
        return AxisAngle::identity();
    }

    const Vec3d scaled_axis = l * (sin_a * cos_b)
                            + m * (cos_a * sin_b)
                            + glm::cross(l, m) * (sin_a * sin_b);

    const f64 axis_length = glm::length(scaled_axis);
    if (axis_length < kParallelEpsilon)
    {
        return AxisAngle::identity();
    }

    return AxisAngle{
        .axis      = scaled_axis / axis_length,
        .angle_deg = gamma * astro_constants::kRadToDeg,
    };
}

// -----------------------------------------------------------------
// Rodrigues rotation matrix
//
//   R = cos θ I + sin θ [k]× + (1 − cos θ) k kᵀ
//
// glm matrices are column-major: m[col][row].
// -----------------------------------------------------------------

Mat3d Rotation::to_matrix(const AxisAngle& r)
{
    if (r.is_identity())
    {
        return Mat3d(1.0);
    }

    const f64 theta = r.angle_deg * astro_constants::kDegToRad;
    const f64 c = std::cos(theta);
    const f64 s = std::sin(theta);
    const f64 t = 1.0 - c;
    const f64 x = r.axis.x;
    const f64 y = r.axis.y;
    const f64 z = r.axis.z;

    Mat3d m(1.0);
    m[0][0] = x * x * t + c;
    m[0][1] = y * x * t + z * s;
    m[0][2] = z * x * t - y * s;

    m[1][0] = x * y * t - z * s;
    m[1][1] = y * y * t + c;
    m[1][2] = z * y * t + x * s;

    m[2][0] = x * z * t + y * s;
    m[2][1] = y * z * t - x * s;
    m[2][2] = z * z * t + c;
    return m;
}

Vec3d Rotation::rotate(const Vec3d& v, const AxisAngle& r)
{
    if (r.is_identity())
    {
        return v;
    }
    return to_matrix(r) * v;
}

// -----------------------------------------------------------------
// Alignment: rotation taking direction 'from' onto direction 'to'
// -----------------------------------------------------------------

AxisAngle Rotation::rotation_to_become(const Vec3d& from, const Vec3d& to)
{
    const Vec3d a = safe_normalize(from);
    const Vec3d b = safe_normalize(to);

    const Vec3d cp = glm::cross(a, b);
    const f64 sin_angle = glm::length(cp);
    const f64 cos_angle = glm::dot(a, b);

    if (sin_angle < kParallelEpsilon)
    {
        if (cos_angle >= 0.0)
        {
            return AxisAngle::identity();
        }

        // Antiparallel: any axis perpendicular to 'a' works. Cross with
        // the basis vector least aligned with 'a' to get a stable one.
        const Vec3d abs_a = glm::abs(a);
        Vec3d basis{1.0, 0.0, 0.0};
        if (abs_a.y <= abs_a.x && abs_a.y <= abs_a.z)
        {
            basis = Vec3d{0.0, 1.0, 0.0};
        }
        else if (abs_a.z <= abs_a.x && abs_a.z <= abs_a.y)
        {
            basis = Vec3d{0.0, 0.0, 1.0};
        }
        return about_axis(glm::cross(a, basis), 180.0);
    }

    return AxisAngle{
        .axis      = cp / sin_angle,
        .angle_deg = std::atan2(sin_angle, cos_angle) * astro_constants::kRadToDeg,
    };
}

f64 Rotation::angle_between_deg(const Vec3d& a, const Vec3d& b)
{
    const Vec3d na = safe_normalize(a);
    const Vec3d nb = safe_normalize(b);
    return std::atan2(glm::length(glm::cross(na, nb)), glm::dot(na, nb))
         * astro_constants::kRadToDeg;
}

Vec3d Rotation::orthogonal_component(const Vec3d& v, const Vec3d& unit)
{
    return v - unit * glm::dot(v, unit);
}

Vec3d Rotation::safe_normalize(const Vec3d& v)
{
    const f64 length = glm::length(v);
    return (length > 0.0) ? (v / length) : Vec3d{0.0, 0.0, 0.0};
}

} // namespace orbis::geometry
