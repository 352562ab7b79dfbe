#pragma once

/// @file rotation.hpp
/// @brief Axis-angle rotation algebra (composition, application, alignment).

#include "core/types.hpp"

namespace orbis::geometry
{
    /// @brief A rotation by angle_deg about a unit axis (right-hand rule).
    ///
    /// The identity is represented by a zero axis and zero angle; no axis
    /// is meaningful for it. A zero axis with a nonzero angle is also read
    /// as the identity. The packed form used at serialization
    /// boundaries is a single vector whose direction is the axis and
    /// whose length is the angle in degrees.
    struct AxisAngle
    {
        Vec3d axis{0.0, 0.0, 0.0};  ///< Unit rotation axis (zero for identity)
        f64 angle_deg = 0.0;        ///< Rotation angle in degrees

        [[nodiscard]] static AxisAngle identity() { return {}; }

        /// @brief Unpack an axis*angle vector (zero vector -> identity).
        [[nodiscard]] static AxisAngle from_packed(const Vec3d& packed);

        /// @brief Pack into a single vector of length angle_deg.
        [[nodiscard]] Vec3d to_packed() const { return axis * angle_deg; }

        [[nodiscard]] bool is_identity() const
        {
            return angle_deg == 0.0 || (axis.x == 0.0 && axis.y == 0.0 && axis.z == 0.0);
        }
    };

    /// @brief Static utility class for axis-angle rotations.
    ///
    /// All angles are in degrees. Degenerate geometry (zero-length axes,
    /// already-aligned vectors) yields the identity rather than an error.
    class Rotation
    {
    public:
        Rotation() = delete;

        /// @brief Rotation about an arbitrary (not necessarily unit) axis.
        /// A zero axis or zero angle gives the identity.
        [[nodiscard]] static AxisAngle about_axis(const Vec3d& axis, f64 angle_deg);

        /// @brief Rotation equivalent to applying @p first, then @p second.
        ///
        /// Half-angle (quaternion-style) composition:
        ///   cos(γ/2) = cos(α/2)cos(β/2) − sin(α/2)sin(β/2)(l·m)
        ///   n sin(γ/2) = l sin(α/2)cos(β/2) + m cos(α/2)sin(β/2) + (l×m) sin(α/2)sin(β/2)
        /// where α,l belong to @p second and β,m to @p first.
        [[nodiscard]] static AxisAngle compose(const AxisAngle& first, const AxisAngle& second);

        /// @brief Rotation undoing @p r (same axis, negated angle).
        [[nodiscard]] static AxisAngle inverse(const AxisAngle& r);

        /// @brief Apply @p r to @p v.
        [[nodiscard]] static Vec3d rotate(const Vec3d& v, const AxisAngle& r);

        /// @brief 3x3 matrix of @p r (Rodrigues formula).
        [[nodiscard]] static Mat3d to_matrix(const AxisAngle& r);

        /// @brief Smallest rotation turning the direction of @p from into that of @p to.
        ///
        /// Lengths are ignored. The angle is atan2(|a×b|, a·b), so it is
        /// correct over the whole [0°,180°] range; antiparallel inputs
        /// rotate 180° about an arbitrary axis perpendicular to @p from.
        [[nodiscard]] static AxisAngle rotation_to_become(const Vec3d& from, const Vec3d& to);

        /// @brief Unsigned angle between two directions, in [0°,180°].
        [[nodiscard]] static f64 angle_between_deg(const Vec3d& a, const Vec3d& b);

        /// @brief Component of @p v orthogonal to the unit vector @p unit.
        [[nodiscard]] static Vec3d orthogonal_component(const Vec3d& v, const Vec3d& unit);

        /// @brief Normalize @p v, returning the zero vector unchanged.
        [[nodiscard]] static Vec3d safe_normalize(const Vec3d& v);
    };

} // namespace orbis::geometry
