/// @file observation_loader.cpp
/// @brief Implementation of CSV observation loaders.

#include "observation/observation_loader.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <charconv>
#include <fstream>
#include <istream>
#include <sstream>
#include <vector>

namespace orbis::observation
{

namespace
{
    /// Split one CSV row on commas (no quoting).
    std::vector<std::string> split_row(const std::string& line)
    {
        std::vector<std::string> fields;
        std::istringstream stream(line);
        std::string field;
        while (std::getline(stream, field, ','))
        {
            fields.push_back(field);
        }
        if (!line.empty() && line.back() == ',')
        {
            fields.emplace_back();
        }
        return fields;
    }

    bool is_ignored(std::string_view line)
    {
        const auto first = line.find_first_not_of(" \t\r");
        return first == std::string_view::npos || line[first] == '#';
    }
}

// -----------------------------------------------------------------
// Load observation CSV: Latitude,Longitude,Name,Azimuth,Elevation
// -----------------------------------------------------------------

std::optional<StarObservations>
ObservationLoader::load_observations_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ORB_CORE_ERROR("ObservationLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    StarObservations observations = parse_observations(file);
    ORB_CORE_INFO("ObservationLoader: Loaded {} observations from {}",
                  observations.size(), path.string());
    return observations;
}

StarObservations ObservationLoader::parse_observations(std::istream& input)
{
    std::string line;

    // Skip header line
    if (!std::getline(input, line))
    {
        throw ParseError("observation file is empty, header row expected", 1);
    }

    StarObservations observations;
    u32 line_number = 1;

    while (std::getline(input, line))
    {
        ++line_number;

        if (is_ignored(line))
        {
            continue;
        }

        const std::vector<std::string> fields = split_row(line);
        if (fields.size() != 5)
        {
            throw ParseError("expected 5 columns, found " + std::to_string(fields.size()) +
                             ": '" + line + "'", line_number);
        }

        const std::string_view name = trim(fields[2]);
        if (name.empty())
        {
            throw ParseError("empty star name", line_number);
        }

        observations.push_back(StarObservation{
            .latitude  = require_f64(fields[0], "Latitude", line_number),
            .longitude = require_f64(fields[1], "Longitude", line_number),
            .name      = std::string(name),
            .azimuth   = require_f64(fields[3], "Azimuth", line_number),
            .elevation = require_f64(fields[4], "Elevation", line_number),
        });
    }

    return observations;
}

// -----------------------------------------------------------------
// Load distance CSV: Name,DistanceKm
// -----------------------------------------------------------------

std::optional<DistanceTable>
ObservationLoader::load_distance_table_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ORB_CORE_ERROR("ObservationLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    DistanceTable table = parse_distance_table(file);
    ORB_CORE_INFO("ObservationLoader: Loaded {} star distances from {}",
                  table.size(), path.string());
    return table;
}

DistanceTable ObservationLoader::parse_distance_table(std::istream& input)
{
    std::string line;

    if (!std::getline(input, line))
    {
        throw ParseError("distance file is empty, header row expected", 1);
    }

    DistanceTable table;
    u32 line_number = 1;

    while (std::getline(input, line))
    {
        ++line_number;

        if (is_ignored(line))
        {
            continue;
        }

        const std::vector<std::string> fields = split_row(line);
        if (fields.size() != 2)
        {
            throw ParseError("expected 2 columns, found " + std::to_string(fields.size()) +
                             ": '" + line + "'", line_number);
        }

        const std::string_view name = trim(fields[0]);
        if (name.empty())
        {
            throw ParseError("empty star name", line_number);
        }

        const f64 distance = require_f64(fields[1], "DistanceKm", line_number);
        if (distance <= 0.0)
        {
            throw ParseError("distance must be positive: '" + fields[1] + "'", line_number);
        }

        table[std::string(name)] = distance;
    }

    return table;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view ObservationLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> ObservationLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

f64 ObservationLoader::require_f64(std::string_view sv, std::string_view column, u32 line)
{
    const std::string_view trimmed = trim(sv);
    const auto value = parse_f64(trimmed);
    if (!value)
    {
        throw ParseError("could not parse " + std::string(column) + ": '" +
                         std::string(trimmed) + "'", line);
    }
    return *value;
}

} // namespace orbis::observation
