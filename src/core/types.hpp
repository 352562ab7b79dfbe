#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace orbis
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision throughout; normalization of
    // star directions is sensitive to rounding)
    using Vec3d = glm::dvec3;
    using Vec4d = glm::dvec4;
    using Mat3d = glm::dmat3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi           = glm::pi<f64>();
        constexpr f64 kTwoPi        = 2.0 * kPi;
        constexpr f64 kHalfPi       = kPi / 2.0;
        constexpr f64 kDegToRad     = kPi / 180.0;
        constexpr f64 kRadToDeg     = 180.0 / kPi;
        constexpr f64 kJ2000        = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kUnixEpochJd  = 2440587.5;  // 1970-01-01 00:00 UTC
        constexpr f64 kEarthRadiusKm = 6371.0;    // Mean radius
    }

    // Local nominal frame: north = -Z, up = +Y, east = +X
    namespace nominal
    {
        inline const Vec3d kNorth{0.0, 0.0, -1.0};
        inline const Vec3d kUp{0.0, 1.0, 0.0};
        inline const Vec3d kEast{1.0, 0.0, 0.0};
    }
}
