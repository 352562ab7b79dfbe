// surface/surface_square.cpp
#include "surface_square.hpp"

#include <stdexcept>

namespace orbis::surface {

using geometry::AxisAngle;
using geometry::Rotation;

// -----------------------------------------------------------------------
// SurfaceSquare
// -----------------------------------------------------------------------
Vec3d SurfaceSquare::celestial_north() const {
    return Rotation::rotate(north, Rotation::about_axis(east(), latitude));
}

void SurfaceSquare::add_observation(const StarObservation& obs) {
    star_observations[obs.name] = obs;
}

StarObservations SurfaceSquare::observations() const {
    StarObservations result;
    result.reserve(star_observations.size());
    for (const auto& [name, obs] : star_observations) {
        result.push_back(obs);
    }
    return result;
}

// -----------------------------------------------------------------------
// add
// -----------------------------------------------------------------------
SquareId SurfaceSquareSet::add(SurfaceSquare square) {
    if (square.parent) {
        square.rotation_from_nominal = Rotation::compose(
            get(*square.parent).rotation_from_nominal, square.rotation_from_base);
    } else {
        square.base_midpoint.reset();
        square.rotation_from_nominal = square.rotation_from_base;
    }

    SquareId id = m_next_id++;
    m_squares.emplace(id, std::move(square));
    return id;
}

// -----------------------------------------------------------------------
// add_derived
// -----------------------------------------------------------------------
SquareId SurfaceSquareSet::add_derived(SquareId parent,
                                      const Vec3d& center,
                                      const AxisAngle& rotation_from_base,
                                      f64 latitude,
                                      f64 longitude,
                                      std::optional<Vec3d> base_midpoint) {
    const SurfaceSquare& base = get(parent);

    SurfaceSquare square;
    square.center             = center;
    square.size_km            = base.size_km;
    square.latitude           = latitude;
    square.longitude          = longitude;
    square.parent             = parent;
    square.base_midpoint      = base_midpoint;
    square.rotation_from_base = rotation_from_base;

    AxisAngle absolute = Rotation::compose(base.rotation_from_nominal, rotation_from_base);
    square.north = Rotation::rotate(nominal::kNorth, absolute);
    square.up    = Rotation::rotate(nominal::kUp, absolute);

    return add(std::move(square));
}

// -----------------------------------------------------------------------
// remove - children keep existing but lose their parent link
// -----------------------------------------------------------------------
bool SurfaceSquareSet::remove(SquareId id) {
    if (m_squares.erase(id) == 0) return false;

    for (auto& [other_id, square] : m_squares) {
        if (square.parent == id) {
            square.parent.reset();
            square.base_midpoint.reset();
        }
    }
    return true;
}

// -----------------------------------------------------------------------
// lookup
// -----------------------------------------------------------------------
const SurfaceSquare& SurfaceSquareSet::get(SquareId id) const {
    auto it = m_squares.find(id);
    if (it == m_squares.end()) {
        throw std::out_of_range("SurfaceSquareSet: unknown square id " + std::to_string(id));
    }
    return it->second;
}

SurfaceSquare& SurfaceSquareSet::get(SquareId id) {
    auto it = m_squares.find(id);
    if (it == m_squares.end()) {
        throw std::out_of_range("SurfaceSquareSet: unknown square id " + std::to_string(id));
    }
    return it->second;
}

std::vector<SquareId> SurfaceSquareSet::children_of(SquareId id) const {
    std::vector<SquareId> result;
    for (const auto& [other_id, square] : m_squares) {
        if (square.parent == id) result.push_back(other_id);
    }
    return result;
}

std::vector<SquareId> SurfaceSquareSet::ids() const {
    std::vector<SquareId> result;
    result.reserve(m_squares.size());
    for (const auto& [id, square] : m_squares) result.push_back(id);
    return result;
}

} // namespace orbis::surface
