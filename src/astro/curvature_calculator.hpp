#pragma once

/// @file curvature_calculator.hpp
/// @brief Local surface curvature and torsion from paired star sightings.

#include "core/settings.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orbis::astro
{
    /// @brief Azimuth/elevation pair in degrees.
    struct Sighting
    {
        f64 azimuth = 0.0;
        f64 elevation = 0.0;
    };

    /// @brief Two stars sighted at a start and at an end location, plus
    /// how the traveller got from one to the other.
    struct CurvatureInput
    {
        Sighting start_a;
        Sighting start_b;
        Sighting end_a;
        Sighting end_b;

        f64 start_travel_heading = 0.0;           ///< Start -> end heading at the start
        std::optional<f64> end_travel_heading;    ///< Start -> end heading at the end
        f64 distance_km = 0.0;                    ///< Length of the route

        /// @brief Copy with heading(s) and distance taken from the great
        /// circle between two places on the spherical Earth.
        [[nodiscard]] CurvatureInput with_travel_between(
            f64 start_latitude, f64 start_longitude,
            f64 end_latitude, f64 end_longitude) const;

        /// @brief Dubhe (A) and Sirius (B) from 38N 122W and 38N 113W at
        /// 2017-03-06 04:00 UTC. Sightings are good to about 0.2 degrees.
        [[nodiscard]] static CurvatureInput dubhe_sirius();
    };

    /// @brief Output of one calculation.
    struct CurvatureResult
    {
        f64 deviation_b_deg = 0.0;    ///< B mismatch after aligning A, degrees
        f64 normal_curvature = 0.0;   ///< Bending along the route, 1/km (positive: normal turns left)
        f64 geodesic_torsion = 0.0;   ///< Twist about the route, deg/km (right-hand about forward)

        /// Turn of the travel direction within the tangent plane, deg/km.
        /// Present only when an end heading was supplied.
        std::optional<f64> geodesic_curvature;

        std::vector<std::string> warnings;  ///< Reliability conditions, one line each
        std::vector<std::string> steps;     ///< Trace of intermediate values
    };

    /// @brief Infers how the surface normal turns between two places.
    ///
    /// Star A's two sightings are aligned first, then star B's about A.
    /// The same alignment carried onto the local up vector gives the
    /// surface normal at the end in start coordinates, and the rotation
    /// between the two normals is split into a part about the sideways
    /// axis (curvature) and a part about the forward axis (torsion).
    ///
    /// Stateless apart from its settings; one instance may serve any
    /// number of calculations.
    class CurvatureCalculator
    {
    public:
        explicit CurvatureCalculator(CurvatureSettings settings = {});

        [[nodiscard]] CurvatureResult calculate(const CurvatureInput& input) const;

        /// @brief Start from known normals and travel directions, all in
        /// the start location's local frame.
        /// @param end_forward Travel direction at the end; when given,
        ///        geodesic curvature is computed as well.
        [[nodiscard]] CurvatureResult from_normals(
            const Vec3d& up,
            const Vec3d& rotated_up,
            const Vec3d& start_forward,
            const std::optional<Vec3d>& end_forward,
            f64 distance_km) const;

        [[nodiscard]] const CurvatureSettings& settings() const { return m_settings; }

    private:
        /// Returns the distance to use, warning when it had to be replaced.
        f64 checked_distance(f64 distance_km, CurvatureResult& result) const;

        static void compute_from_normals(
            const Vec3d& up,
            const Vec3d& rotated_up,
            const Vec3d& start_forward,
            const std::optional<Vec3d>& end_forward,
            f64 distance_km,
            CurvatureResult& result);

        CurvatureSettings m_settings;
    };

} // namespace orbis::astro
