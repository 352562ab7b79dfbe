#pragma once

/// @file frame_builder.hpp
/// @brief Builds oriented surface squares from a parametric surface.

#include "core/settings.hpp"
#include "core/types.hpp"
#include "geometry/rotation.hpp"
#include "surface/surface_square.hpp"

#include <functional>

namespace orbis::surface
{
    /// @brief Maps (latitude, longitude) in degrees to a point on a surface.
    ///
    /// Expected to be continuous within latitude [-90, 90] and
    /// longitude [-180, 180].
    using PointFunction = std::function<Vec3d(f64 latitude, f64 longitude)>;

    /// @brief Derives a square's local frame from an injected point function
    /// by finite differencing.
    ///
    /// North comes from a small latitude step and east from a small
    /// longitude step, both taken on the side away from the nearest pole
    /// or antimeridian. The triad is then re-orthogonalized so it stays
    /// orthonormal even when the surface is not smooth.
    class FrameBuilder
    {
    public:
        explicit FrameBuilder(PointFunction point_function, FrameSettings settings = {});

        /// @brief Build the square at (latitude, longitude).
        [[nodiscard]] SurfaceSquare build_square(f64 latitude, f64 longitude) const;

        /// @brief Evaluate the point function directly.
        [[nodiscard]] Vec3d point(f64 latitude, f64 longitude) const;

        /// @brief Rotation from the nominal frame onto an orthonormal
        /// (north, east) pair.
        ///
        /// First nominal north is turned onto @p north; the turned nominal
        /// east is then spun about @p north onto @p east.
        [[nodiscard]] static geometry::AxisAngle rotation_from_nominal(
            const Vec3d& north, const Vec3d& east);

        [[nodiscard]] const FrameSettings& settings() const { return m_settings; }

    private:
        PointFunction m_point_function;
        FrameSettings m_settings;
    };

} // namespace orbis::surface
