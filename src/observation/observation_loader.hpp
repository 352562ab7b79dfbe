#pragma once

/// @file observation_loader.hpp
/// @brief Loads star sightings and star distance tables from CSV files.

#include "core/types.hpp"
#include "observation/star_observation.hpp"

#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace orbis::observation
{
    /// @brief Star name -> assumed distance, as read from a file.
    using DistanceTable = std::map<std::string, f64>;

    /// @brief Static utility class for loading observation files.
    ///
    /// Files that cannot be opened are reported as std::nullopt. Rows
    /// that cannot be parsed throw ParseError naming the line, since a
    /// silently dropped sighting changes every derived result.
    class ObservationLoader
    {
    public:
        ObservationLoader() = delete;

        /// @brief Load sightings from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Latitude, Longitude, Name, Azimuth, Elevation
        ///
        /// Angles are in degrees. Blank lines and lines starting with '#'
        /// are ignored.
        ///
        /// @return Sightings on success, std::nullopt if the file cannot be read.
        /// @throws ParseError on a malformed row.
        [[nodiscard]] static std::optional<StarObservations>
            load_observations_csv(const std::filesystem::path& path);

        /// @brief Load a star distance table from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Name, DistanceKm
        ///
        /// @return Table on success, std::nullopt if the file cannot be read.
        /// @throws ParseError on a malformed row or a non-positive distance.
        [[nodiscard]] static std::optional<DistanceTable>
            load_distance_table_csv(const std::filesystem::path& path);

        /// @brief Parse sightings from an already-open stream (header first).
        [[nodiscard]] static StarObservations parse_observations(std::istream& input);

        /// @brief Parse a distance table from an already-open stream (header first).
        [[nodiscard]] static DistanceTable parse_distance_table(std::istream& input);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        /// @return The parsed value, or std::nullopt on failure.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a field or throw ParseError naming the column and line.
        [[nodiscard]] static f64 require_f64(std::string_view sv, std::string_view column, u32 line);
    };

} // namespace orbis::observation
