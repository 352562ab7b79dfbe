#pragma once

/// @file sky_catalog.hpp
/// @brief Small fixed catalog of bright stars and sighting synthesis from it.

#include "core/types.hpp"
#include "observation/star_observation.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace orbis::catalog
{
    /// @brief One catalog entry: a point on the celestial sphere.
    struct CatalogStar
    {
        std::string name;
        f64 right_ascension_deg = 0.0;  ///< [0, 360)
        f64 declination_deg = 0.0;      ///< [-90, 90]
    };

    /// @brief Named RA/Dec entries used to synthesize sightings at times
    /// and places that were not measured by hand.
    class SkyCatalog
    {
    public:
        SkyCatalog() = default;
        explicit SkyCatalog(std::vector<CatalogStar> stars);

        /// @brief The eight reference stars (Capella, Betelgeuse, Rigel,
        /// Aldebaran, Sirius, Procyon, Polaris, Dubhe).
        [[nodiscard]] static SkyCatalog builtin();

        /// @brief Approximate Sun position at the manual observation epoch.
        [[nodiscard]] static CatalogStar sun();

        /// @brief Build an entry from catalog-format strings.
        /// @throws ParseError if either string is malformed.
        [[nodiscard]] static CatalogStar parse(std::string name,
                                               std::string_view right_ascension,
                                               std::string_view declination);

        /// @brief "HHhMMmSSs" -> degrees (15 degrees per hour).
        /// @throws ParseError if @p text does not match.
        [[nodiscard]] static f64 parse_right_ascension(std::string_view text);

        /// @brief "+DD°MM'SS\"" -> degrees; the sign applies to the whole value.
        /// @throws ParseError if @p text does not match.
        [[nodiscard]] static f64 parse_declination(std::string_view text);

        void add(CatalogStar star);

        /// @brief Case-insensitive lookup; nullptr if absent.
        [[nodiscard]] const CatalogStar* find_by_name(std::string_view name) const;

        /// @brief Sightings of every entry at a Unix time and place.
        [[nodiscard]] StarObservations observe(f64 unix_time, f64 latitude, f64 longitude) const;

        /// @brief Sighting of a single entry.
        [[nodiscard]] static StarObservation observe_star(const CatalogStar& star,
                                                          f64 unix_time,
                                                          f64 latitude,
                                                          f64 longitude);

        /// @brief Sighting of sun(). Accurate only near the manual epoch.
        [[nodiscard]] static StarObservation observe_sun(f64 unix_time, f64 latitude, f64 longitude);

        [[nodiscard]] const std::vector<CatalogStar>& stars() const { return m_stars; }
        [[nodiscard]] std::vector<std::string> names() const;
        [[nodiscard]] std::size_t size() const { return m_stars.size(); }

    private:
        std::vector<CatalogStar> m_stars;
    };

} // namespace orbis::catalog
